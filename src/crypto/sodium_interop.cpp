#include "tessera/crypto/sodium_interop.hpp"
#include "tessera/crypto/sodium_secure_memory_handle.hpp"
#include "tessera/core/format.hpp"

#include <string>

namespace tessera::protocol::crypto {

// ============================================================================
// Initialization
// ============================================================================

Result<Unit, SodiumFailure> SodiumInterop::Initialize() {
    std::call_once(init_flag_, []() {
        initialized_.store(sodium_init() >= 0, std::memory_order_release);
    });

    if (!initialized_.load(std::memory_order_acquire)) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::InitializationFailed(
                std::string(ErrorMessages::SODIUM_INIT_FAILED)));
    }

    return Result<Unit, SodiumFailure>::Ok(unit);
}

bool SodiumInterop::IsInitialized() noexcept {
    return initialized_.load(std::memory_order_acquire);
}

// ============================================================================
// Secure Memory Operations
// ============================================================================

Result<Unit, SodiumFailure> SodiumInterop::SecureWipe(std::span<uint8_t> buffer) {
    if (!IsInitialized()) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::InitializationFailed(
                std::string(ErrorMessages::NOT_INITIALIZED)));
    }

    if (buffer.empty()) {
        return Result<Unit, SodiumFailure>::Ok(unit);
    }

    if (buffer.size() > MAX_BUFFER_SIZE) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::BufferTooLarge(
                compat::format("Buffer size {} exceeds maximum {}", buffer.size(), MAX_BUFFER_SIZE)));
    }

    if (buffer.size() <= Constants::SMALL_BUFFER_THRESHOLD) {
        return WipeSmallBuffer(buffer);
    }
    return WipeLargeBuffer(buffer);
}

Result<Unit, SodiumFailure> SodiumInterop::WipeSmallBuffer(std::span<uint8_t> buffer) {
    volatile uint8_t* vbuf = buffer.data();
    for (size_t i = 0; i < buffer.size(); ++i) {
        vbuf[i] = 0;
    }
    return Result<Unit, SodiumFailure>::Ok(unit);
}

Result<Unit, SodiumFailure> SodiumInterop::WipeLargeBuffer(std::span<uint8_t> buffer) {
    sodium_memzero(buffer.data(), buffer.size());
    return Result<Unit, SodiumFailure>::Ok(unit);
}

Result<bool, SodiumFailure> SodiumInterop::ConstantTimeEquals(
    std::span<const uint8_t> a,
    std::span<const uint8_t> b) {
    if (a.size() != b.size()) {
        return Result<bool, SodiumFailure>::Ok(false);
    }
    if (a.empty()) {
        return Result<bool, SodiumFailure>::Ok(true);
    }
    return Result<bool, SodiumFailure>::Ok(
        sodium_memcmp(a.data(), b.data(), a.size()) == SodiumConstants::SUCCESS);
}

// ============================================================================
// Key Generation
// ============================================================================

Result<std::pair<SecureMemoryHandle, std::vector<uint8_t>>, ProtocolFailure>
SodiumInterop::GenerateX25519KeyPair(std::string_view key_purpose) {
    using KeyPairResult = Result<std::pair<SecureMemoryHandle, std::vector<uint8_t>>, ProtocolFailure>;

    auto sk_handle_result = SecureMemoryHandle::Allocate(Constants::X_25519_PRIVATE_KEY_SIZE);
    if (sk_handle_result.IsErr()) {
        return KeyPairResult::Err(
            ProtocolFailure::FromSodiumFailure(sk_handle_result.UnwrapErr()));
    }
    SecureMemoryHandle sk_handle = std::move(sk_handle_result).Unwrap();

    std::vector<uint8_t> sk_bytes = GetRandomBytes(Constants::X_25519_PRIVATE_KEY_SIZE);
    std::vector<uint8_t> pk_bytes(Constants::X_25519_PUBLIC_KEY_SIZE);
    const int derive_rc = crypto_scalarmult_base(pk_bytes.data(), sk_bytes.data());
    auto write_result = sk_handle.Write(std::span<const uint8_t>(sk_bytes));
    auto _wipe = SecureWipe(std::span<uint8_t>(sk_bytes));
    (void) _wipe;

    if (derive_rc != SodiumConstants::SUCCESS) {
        return KeyPairResult::Err(
            ProtocolFailure::KeyGeneration(
                compat::format("Failed to derive {} public key", key_purpose)));
    }
    if (write_result.IsErr()) {
        return KeyPairResult::Err(
            ProtocolFailure::FromSodiumFailure(write_result.UnwrapErr()));
    }

    return KeyPairResult::Ok(std::make_pair(std::move(sk_handle), std::move(pk_bytes)));
}

Result<std::pair<SecureMemoryHandle, std::vector<uint8_t>>, ProtocolFailure>
SodiumInterop::GenerateEd25519KeyPair() {
    using KeyPairResult = Result<std::pair<SecureMemoryHandle, std::vector<uint8_t>>, ProtocolFailure>;

    if (!IsInitialized()) {
        return KeyPairResult::Err(
            ProtocolFailure::KeyGeneration(std::string(ErrorMessages::NOT_INITIALIZED)));
    }

    auto sk_handle_result = SecureMemoryHandle::Allocate(Constants::ED_25519_SECRET_KEY_SIZE);
    if (sk_handle_result.IsErr()) {
        return KeyPairResult::Err(
            ProtocolFailure::KeyGeneration(sk_handle_result.UnwrapErr().message));
    }
    SecureMemoryHandle sk_handle = std::move(sk_handle_result).Unwrap();

    std::vector<uint8_t> pk(Constants::ED_25519_PUBLIC_KEY_SIZE);
    auto keygen_result = sk_handle.WithWriteAccess([&pk](std::span<uint8_t> sk) {
        return crypto_sign_keypair(pk.data(), sk.data());
    });
    if (keygen_result.IsErr()) {
        return KeyPairResult::Err(
            ProtocolFailure::KeyGeneration(keygen_result.UnwrapErr().message));
    }
    if (keygen_result.Unwrap() != SodiumConstants::SUCCESS) {
        return KeyPairResult::Err(
            ProtocolFailure::KeyGeneration("Failed to generate Ed25519 key pair"));
    }

    return KeyPairResult::Ok(std::make_pair(std::move(sk_handle), std::move(pk)));
}

// ============================================================================
// Curve Conversion and Agreement
// ============================================================================

Result<std::vector<uint8_t>, ProtocolFailure> SodiumInterop::ConvertEd25519PublicToX25519(
    std::span<const uint8_t> ed25519_public) {
    if (ed25519_public.size() != Constants::ED_25519_PUBLIC_KEY_SIZE) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::InvalidInput(
                compat::format("Ed25519 public key must be {} bytes, got {}",
                    Constants::ED_25519_PUBLIC_KEY_SIZE, ed25519_public.size())));
    }
    std::vector<uint8_t> x25519_public(Constants::X_25519_PUBLIC_KEY_SIZE);
    if (crypto_sign_ed25519_pk_to_curve25519(x25519_public.data(), ed25519_public.data())
        != SodiumConstants::SUCCESS) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::InvalidInput("Ed25519 public key is not a valid curve point"));
    }
    return Result<std::vector<uint8_t>, ProtocolFailure>::Ok(std::move(x25519_public));
}

Result<SecureMemoryHandle, ProtocolFailure> SodiumInterop::ConvertEd25519SecretToX25519(
    const SecureMemoryHandle& ed25519_secret) {
    if (ed25519_secret.IsInvalid() || ed25519_secret.Size() != Constants::ED_25519_SECRET_KEY_SIZE) {
        return Result<SecureMemoryHandle, ProtocolFailure>::Err(
            ProtocolFailure::InvalidState("Ed25519 secret key handle is not usable"));
    }
    auto handle_result = SecureMemoryHandle::Allocate(Constants::X_25519_PRIVATE_KEY_SIZE);
    if (handle_result.IsErr()) {
        return Result<SecureMemoryHandle, ProtocolFailure>::Err(
            ProtocolFailure::FromSodiumFailure(handle_result.UnwrapErr()));
    }
    SecureMemoryHandle x25519_secret = std::move(handle_result).Unwrap();

    auto convert_result = ed25519_secret.WithReadAccess([&x25519_secret](std::span<const uint8_t> ed_sk) {
        auto inner = x25519_secret.WithWriteAccess([ed_sk](std::span<uint8_t> x_sk) {
            return crypto_sign_ed25519_sk_to_curve25519(x_sk.data(), ed_sk.data());
        });
        return inner.IsOk() ? inner.Unwrap() : SodiumConstants::FAILURE;
    });
    if (convert_result.IsErr() || convert_result.Unwrap() != SodiumConstants::SUCCESS) {
        return Result<SecureMemoryHandle, ProtocolFailure>::Err(
            ProtocolFailure::DeriveKey("Failed to convert Ed25519 secret key to X25519"));
    }
    return Result<SecureMemoryHandle, ProtocolFailure>::Ok(std::move(x25519_secret));
}

Result<std::vector<uint8_t>, ProtocolFailure> SodiumInterop::ComputeSharedSecret(
    const SecureMemoryHandle& private_key,
    std::span<const uint8_t> public_key,
    std::string_view label) {
    if (private_key.IsInvalid() || private_key.Size() != Constants::X_25519_PRIVATE_KEY_SIZE ||
        public_key.size() != Constants::X_25519_PUBLIC_KEY_SIZE) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::InvalidInput(
                compat::format("Invalid X25519 key sizes for {}", label)));
    }
    std::vector<uint8_t> shared(Constants::X_25519_PUBLIC_KEY_SIZE);
    auto dh_result = private_key.WithReadAccess([&shared, public_key](std::span<const uint8_t> sk) {
        return crypto_scalarmult(shared.data(), sk.data(), public_key.data());
    });
    if (dh_result.IsErr() || dh_result.Unwrap() != SodiumConstants::SUCCESS) {
        auto _wipe = SecureWipe(std::span<uint8_t>(shared));
        (void) _wipe;
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::Handshake(compat::format("X25519 DH failed for {}", label)));
    }
    return Result<std::vector<uint8_t>, ProtocolFailure>::Ok(std::move(shared));
}

Result<std::vector<uint8_t>, ProtocolFailure> SodiumInterop::HmacSha256(
    std::span<const uint8_t> key,
    std::span<const uint8_t> data) {
    if (key.size() != crypto_auth_hmacsha256_KEYBYTES) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::InvalidInput(
                compat::format("HMAC key must be {} bytes", crypto_auth_hmacsha256_KEYBYTES)));
    }
    std::vector<uint8_t> mac(crypto_auth_hmacsha256_BYTES);
    crypto_auth_hmacsha256(mac.data(), data.data(), data.size(), key.data());
    return Result<std::vector<uint8_t>, ProtocolFailure>::Ok(std::move(mac));
}

// ============================================================================
// Random Number Generation
// ============================================================================

std::vector<uint8_t> SodiumInterop::GetRandomBytes(size_t size) {
    std::vector<uint8_t> buffer(size);
    randombytes_buf(buffer.data(), size);
    return buffer;
}

// ============================================================================
// Memory Allocation
// ============================================================================

void* SodiumInterop::AllocateSecure(size_t size) noexcept {
    if (!IsInitialized()) {
        return nullptr;
    }
    return sodium_malloc(size);
}

void SodiumInterop::FreeSecure(void* ptr) noexcept {
    if (ptr != nullptr) {
        sodium_free(ptr);
    }
}

} // namespace tessera::protocol::crypto
