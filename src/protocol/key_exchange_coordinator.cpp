#include "tessera/protocol/key_exchange_coordinator.hpp"
#include "tessera/protocol/constants.hpp"
#include "tessera/crypto/sodium_interop.hpp"
#include "tessera/crypto/hkdf.hpp"
#include "tessera/security/dh_validator.hpp"
#include "tessera/identity/did.hpp"
#include "tessera/core/constants.hpp"
#include "tessera/core/format.hpp"
#include "tessera/debug/log.hpp"
#include "tessera/debug/key_logger.hpp"
#include <sodium.h>
#include <algorithm>
#include <array>
#include <initializer_list>
#include <chrono>
#include <tuple>

namespace tessera::protocol {

using crypto::Hkdf;
using crypto::SodiumInterop;
using debug::Log;
using identity::Did;
using security::DhValidator;

namespace {
    constexpr std::string_view kLogTag = "X3DH";

    std::span<const uint8_t> AsBytes(const std::string& text) {
        return {reinterpret_cast<const uint8_t*>(text.data()), text.size()};
    }

    std::vector<uint8_t> ToVector(const std::string& text) {
        return {text.begin(), text.end()};
    }

    void WipeBytes(std::vector<uint8_t>& bytes) {
        if (!bytes.empty()) {
            auto _wipe = SodiumInterop::SecureWipe(std::span<uint8_t>(bytes));
            (void) _wipe;
        }
    }

    int64_t NowMillis() {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
    }

    std::vector<uint8_t> Concat(std::span<const uint8_t> first, std::span<const uint8_t> second) {
        std::vector<uint8_t> out;
        out.reserve(first.size() + second.size());
        out.insert(out.end(), first.begin(), first.end());
        out.insert(out.end(), second.begin(), second.end());
        return out;
    }

    Result<Unit, ProtocolFailure> RequireSize(
        const std::string& field, const size_t expected, std::string_view name) {
        if (field.size() != expected) {
            return Result<Unit, ProtocolFailure>::Err(
                ProtocolFailure::InvalidInput(
                    compat::format("{} must be {} bytes, got {}", name, expected, field.size())));
        }
        return Result<Unit, ProtocolFailure>::Ok(unit);
    }

    Result<std::vector<uint8_t>, ProtocolFailure> RemoteIdentityToX25519(std::span<const uint8_t> ed25519_public) {
        auto converted = SodiumInterop::ConvertEd25519PublicToX25519(ed25519_public);
        if (converted.IsErr()) {
            return converted;
        }
        auto validation = DhValidator::ValidateX25519PublicKey(converted.Unwrap());
        if (validation.IsErr()) {
            return Result<std::vector<uint8_t>, ProtocolFailure>::Err(validation.UnwrapErr());
        }
        return converted;
    }
}

namespace detail {

void WipeAgreements(std::initializer_list<Agreement*> agreements) {
    for (auto* agreement : agreements) {
        if (agreement->IsOk()) {
            WipeBytes(agreement->Unwrap());
        }
    }
}

std::optional<ProtocolFailure> FirstAgreementFailure(std::initializer_list<Agreement*> agreements) {
    for (auto* agreement : agreements) {
        if (agreement->IsErr()) {
            ProtocolFailure failure = agreement->UnwrapErr();
            WipeAgreements(agreements);
            return failure;
        }
    }
    return std::nullopt;
}

}

KeyExchangeCoordinator::KeyExchangeCoordinator(
    identity::IdentityStore& identity,
    const size_t max_one_time_pre_keys,
    const size_t max_consumed_remote_pre_keys)
    : identity_(identity)
    , max_one_time_pre_keys_(std::max<size_t>(max_one_time_pre_keys, 1))
    , max_consumed_remote_pre_keys_(std::max<size_t>(max_consumed_remote_pre_keys, 1)) {}

// ============================================================================
// Responder: prekeys and bundles
// ============================================================================

Result<Unit, ProtocolFailure> KeyExchangeCoordinator::RotateSignedPreKey() {
    std::lock_guard<std::mutex> guard(lock_);
    return RotateSignedPreKeyLocked();
}

Result<Unit, ProtocolFailure> KeyExchangeCoordinator::RotateSignedPreKeyLocked() {
    auto keypair_result = SodiumInterop::GenerateX25519KeyPair("signed pre-key");
    if (keypair_result.IsErr()) {
        return Result<Unit, ProtocolFailure>::Err(keypair_result.UnwrapErr());
    }
    auto [private_key, public_key] = std::move(keypair_result).Unwrap();

    auto signature_result = identity_.SignDetached(public_key);
    if (signature_result.IsErr()) {
        return Result<Unit, ProtocolFailure>::Err(signature_result.UnwrapErr());
    }

    signed_pre_key_ = SignedPreKey{
        std::move(private_key),
        std::move(public_key),
        std::move(signature_result).Unwrap()
    };
    Log::Debug(kLogTag, "Rotated signed pre-key");
    return Result<Unit, ProtocolFailure>::Ok(unit);
}

Result<proto::protocol::KeyExchangeBundle, ProtocolFailure> KeyExchangeCoordinator::PublishBundle() {
    using BundleResult = Result<proto::protocol::KeyExchangeBundle, ProtocolFailure>;
    auto local = identity_.CurrentIdentity();
    if (!local.has_value()) {
        return BundleResult::Err(ProtocolFailure::InvalidState(std::string(ErrorMessages::NO_IDENTITY)));
    }

    std::lock_guard<std::mutex> guard(lock_);
    if (!signed_pre_key_.has_value()) {
        auto rotate_result = RotateSignedPreKeyLocked();
        if (rotate_result.IsErr()) {
            return BundleResult::Err(rotate_result.UnwrapErr());
        }
    }

    auto opk_result = SodiumInterop::GenerateX25519KeyPair("one-time pre-key");
    if (opk_result.IsErr()) {
        return BundleResult::Err(opk_result.UnwrapErr());
    }
    auto [opk_private, opk_public] = std::move(opk_result).Unwrap();

    proto::protocol::KeyExchangeBundle bundle;
    bundle.set_identity_key(local->signing_public_key.data(), local->signing_public_key.size());
    bundle.set_signed_pre_key(signed_pre_key_->public_key.data(), signed_pre_key_->public_key.size());
    bundle.set_signed_pre_key_signature(signed_pre_key_->signature.data(), signed_pre_key_->signature.size());
    bundle.set_one_time_pre_key(opk_public.data(), opk_public.size());
    bundle.set_timestamp_ms(NowMillis());

    while (one_time_pre_keys_.size() >= max_one_time_pre_keys_) {
        auto oldest = one_time_pre_key_order_.begin();
        one_time_pre_keys_.erase(oldest->second);
        one_time_pre_key_order_.erase(oldest);
        Log::Debug(kLogTag, "Evicted oldest one-time pre-key");
    }
    const uint64_t sequence = next_sequence_++;
    one_time_pre_key_order_.emplace(sequence, opk_public);
    one_time_pre_keys_.emplace(std::move(opk_public), OneTimePreKey{sequence, std::move(opk_private)});
    return BundleResult::Ok(std::move(bundle));
}

size_t KeyExchangeCoordinator::AvailableOneTimePreKeys() const {
    std::lock_guard<std::mutex> guard(lock_);
    return one_time_pre_keys_.size();
}

size_t KeyExchangeCoordinator::ConsumedRemotePreKeys() const {
    std::lock_guard<std::mutex> guard(lock_);
    return consumed_remote_one_time_keys_.size();
}

void KeyExchangeCoordinator::RememberConsumedRemoteKeyLocked(std::vector<uint8_t> public_key) {
    while (consumed_remote_one_time_keys_.size() >= max_consumed_remote_pre_keys_) {
        auto oldest = consumed_remote_order_.begin();
        consumed_remote_one_time_keys_.erase(oldest->second);
        consumed_remote_order_.erase(oldest);
    }
    const uint64_t sequence = next_sequence_++;
    consumed_remote_order_.emplace(sequence, public_key);
    consumed_remote_one_time_keys_.emplace(std::move(public_key), sequence);
}

void KeyExchangeCoordinator::Wipe() {
    std::lock_guard<std::mutex> guard(lock_);
    signed_pre_key_.reset();
    one_time_pre_keys_.clear();
    one_time_pre_key_order_.clear();
    consumed_remote_one_time_keys_.clear();
    consumed_remote_order_.clear();
}

// ============================================================================
// Shared secret
// ============================================================================

Result<SecureMemoryHandle, ProtocolFailure> KeyExchangeCoordinator::DeriveSharedSecret(
    std::span<const uint8_t> dh1,
    std::span<const uint8_t> dh2,
    std::span<const uint8_t> dh3,
    std::span<const uint8_t> dh4) {
    std::vector<uint8_t> ikm(kX25519SharedSecretBytes, kX3dhPaddingByte);
    ikm.reserve(kX25519SharedSecretBytes * 5);
    for (const auto dh : {dh1, dh2, dh3, dh4}) {
        ikm.insert(ikm.end(), dh.begin(), dh.end());
    }
    const std::array<uint8_t, Hkdf::HASH_LEN> salt{};

    auto derived_result = Hkdf::DeriveKeyBytes(ikm, kSharedSecretBytes, salt, kX3dhInfo);
    WipeBytes(ikm);
    if (derived_result.IsErr()) {
        return Result<SecureMemoryHandle, ProtocolFailure>::Err(derived_result.UnwrapErr());
    }
    auto derived = std::move(derived_result).Unwrap();
    auto handle_result = SecureMemoryHandle::FromBytes(derived);
    WipeBytes(derived);
    if (handle_result.IsErr()) {
        return Result<SecureMemoryHandle, ProtocolFailure>::Err(
            ProtocolFailure::FromSodiumFailure(handle_result.UnwrapErr()));
    }
    return Result<SecureMemoryHandle, ProtocolFailure>::Ok(std::move(handle_result).Unwrap());
}

// ============================================================================
// Initiator
// ============================================================================

Result<bool, ProtocolFailure> KeyExchangeCoordinator::VerifyBundleSignature(
    const proto::protocol::KeyExchangeBundle& bundle) {
    if (bundle.identity_key().size() != kEd25519PublicKeyBytes ||
        bundle.signed_pre_key().size() != kX25519PublicKeyBytes ||
        bundle.signed_pre_key_signature().size() != kEd25519SignatureBytes) {
        return Result<bool, ProtocolFailure>::Err(
            ProtocolFailure::InvalidInput("Invalid key or signature length for signed pre-key verification"));
    }
    const int rc = crypto_sign_verify_detached(
        reinterpret_cast<const unsigned char*>(bundle.signed_pre_key_signature().data()),
        reinterpret_cast<const unsigned char*>(bundle.signed_pre_key().data()),
        bundle.signed_pre_key().size(),
        reinterpret_cast<const unsigned char*>(bundle.identity_key().data()));
    return Result<bool, ProtocolFailure>::Ok(rc == SodiumConstants::SUCCESS);
}

Result<InitiatorHandshake, ProtocolFailure> KeyExchangeCoordinator::ConsumeBundle(
    const proto::protocol::KeyExchangeBundle& bundle) {
    using HandshakeResult = Result<InitiatorHandshake, ProtocolFailure>;

    auto signature_result = VerifyBundleSignature(bundle);
    if (signature_result.IsErr()) {
        return HandshakeResult::Err(signature_result.UnwrapErr());
    }
    if (!signature_result.Unwrap()) {
        Log::Warn(kLogTag, "Rejected bundle: signed pre-key signature does not verify");
        return HandshakeResult::Err(
            ProtocolFailure::InvalidBundleSignature(std::string(ErrorMessages::SIGNED_PRE_KEY_FAILED)));
    }
    auto size_check = RequireSize(bundle.one_time_pre_key(), kX25519PublicKeyBytes, "One-time pre-key");
    if (size_check.IsErr()) {
        return HandshakeResult::Err(size_check.UnwrapErr());
    }

    const auto remote_identity = AsBytes(bundle.identity_key());
    const auto remote_spk = AsBytes(bundle.signed_pre_key());
    const auto remote_opk = AsBytes(bundle.one_time_pre_key());
    for (const auto key : {remote_spk, remote_opk}) {
        auto validation = DhValidator::ValidateX25519PublicKey(key);
        if (validation.IsErr()) {
            return HandshakeResult::Err(validation.UnwrapErr());
        }
    }
    auto remote_identity_x_result = RemoteIdentityToX25519(remote_identity);
    if (remote_identity_x_result.IsErr()) {
        return HandshakeResult::Err(remote_identity_x_result.UnwrapErr());
    }
    const auto remote_identity_x = std::move(remote_identity_x_result).Unwrap();

    auto remote_did_result = Did::Derive(remote_identity);
    if (remote_did_result.IsErr()) {
        return HandshakeResult::Err(remote_did_result.UnwrapErr());
    }

    auto local = identity_.CurrentIdentity();
    if (!local.has_value()) {
        return HandshakeResult::Err(ProtocolFailure::InvalidState(std::string(ErrorMessages::NO_IDENTITY)));
    }

    std::lock_guard<std::mutex> guard(lock_);
    auto opk_key = ToVector(bundle.one_time_pre_key());
    if (consumed_remote_one_time_keys_.contains(opk_key)) {
        Log::Warn(kLogTag, "Rejected bundle from {}: one-time pre-key already used", remote_did_result.Unwrap());
        return HandshakeResult::Err(
            ProtocolFailure::Handshake(std::string(ErrorMessages::ONE_TIME_PRE_KEY_USED)));
    }

    auto ephemeral_result = SodiumInterop::GenerateX25519KeyPair("ephemeral");
    if (ephemeral_result.IsErr()) {
        return HandshakeResult::Err(ephemeral_result.UnwrapErr());
    }
    auto [ephemeral_private, ephemeral_public] = std::move(ephemeral_result).Unwrap();

    auto dh1_result = identity_.IdentityAgreement(remote_spk);
    auto dh2_result = SodiumInterop::ComputeSharedSecret(ephemeral_private, remote_identity_x, "DH2");
    auto dh3_result = SodiumInterop::ComputeSharedSecret(ephemeral_private, remote_spk, "DH3");
    auto dh4_result = SodiumInterop::ComputeSharedSecret(ephemeral_private, remote_opk, "DH4");
    ephemeral_private.Reset();
    auto dh_failure = detail::FirstAgreementFailure({&dh1_result, &dh2_result, &dh3_result, &dh4_result});
    if (dh_failure.has_value()) {
        return HandshakeResult::Err(std::move(*dh_failure));
    }
    auto secret_result = DeriveSharedSecret(
        dh1_result.Unwrap(), dh2_result.Unwrap(), dh3_result.Unwrap(), dh4_result.Unwrap());
    detail::WipeAgreements({&dh1_result, &dh2_result, &dh3_result, &dh4_result});
    if (secret_result.IsErr()) {
        return HandshakeResult::Err(secret_result.UnwrapErr());
    }

    InitiatorHandshake handshake;
    handshake.seed.shared_secret = std::move(secret_result).Unwrap();
    handshake.seed.remote_ratchet_public_key = ToVector(bundle.signed_pre_key());
    handshake.seed.associated_data = Concat(local->signing_public_key, remote_identity);
    handshake.seed.remote_did = remote_did_result.Unwrap();

    auto& message = handshake.initial_message;
    message.set_identity_key(local->signing_public_key.data(), local->signing_public_key.size());
    message.set_ephemeral_key(ephemeral_public.data(), ephemeral_public.size());
    message.set_signed_pre_key(bundle.signed_pre_key());
    message.set_one_time_pre_key(bundle.one_time_pre_key());
    message.set_timestamp_ms(NowMillis());

    (void) handshake.seed.shared_secret.WithReadAccess([](std::span<const uint8_t> sk) {
        debug::LogX3dhSharedSecret(debug::Role::Initiator, sk);
        return 0;
    });

    RememberConsumedRemoteKeyLocked(std::move(opk_key));
    Log::Debug(kLogTag, "Derived initiator shared secret with {}", handshake.seed.remote_did);
    return HandshakeResult::Ok(std::move(handshake));
}

// ============================================================================
// Responder
// ============================================================================

Result<SessionSeed, ProtocolFailure> KeyExchangeCoordinator::AcceptInitialMessage(
    const proto::protocol::InitialMessage& message) {
    using SeedResult = Result<SessionSeed, ProtocolFailure>;

    for (const auto& [field, expected, name] : {
             std::tuple{&message.identity_key(), kEd25519PublicKeyBytes, "Identity key"},
             std::tuple{&message.ephemeral_key(), kX25519PublicKeyBytes, "Ephemeral key"},
             std::tuple{&message.signed_pre_key(), kX25519PublicKeyBytes, "Signed pre-key"},
             std::tuple{&message.one_time_pre_key(), kX25519PublicKeyBytes, "One-time pre-key"}}) {
        auto size_check = RequireSize(*field, expected, name);
        if (size_check.IsErr()) {
            return SeedResult::Err(size_check.UnwrapErr());
        }
    }

    const auto remote_identity = AsBytes(message.identity_key());
    const auto remote_ephemeral = AsBytes(message.ephemeral_key());
    auto ephemeral_validation = DhValidator::ValidateX25519PublicKey(remote_ephemeral);
    if (ephemeral_validation.IsErr()) {
        return SeedResult::Err(ephemeral_validation.UnwrapErr());
    }
    auto remote_identity_x_result = RemoteIdentityToX25519(remote_identity);
    if (remote_identity_x_result.IsErr()) {
        return SeedResult::Err(remote_identity_x_result.UnwrapErr());
    }
    const auto remote_identity_x = std::move(remote_identity_x_result).Unwrap();

    auto remote_did_result = Did::Derive(remote_identity);
    if (remote_did_result.IsErr()) {
        return SeedResult::Err(remote_did_result.UnwrapErr());
    }

    auto local = identity_.CurrentIdentity();
    if (!local.has_value()) {
        return SeedResult::Err(ProtocolFailure::InvalidState(std::string(ErrorMessages::NO_IDENTITY)));
    }

    std::lock_guard<std::mutex> guard(lock_);
    if (!signed_pre_key_.has_value() ||
        ToVector(message.signed_pre_key()) != signed_pre_key_->public_key) {
        Log::Warn(kLogTag, "Rejected initial message from {}: unknown signed pre-key", remote_did_result.Unwrap());
        return SeedResult::Err(ProtocolFailure::Handshake("Initial message references an unknown signed pre-key"));
    }
    const auto opk_it = one_time_pre_keys_.find(ToVector(message.one_time_pre_key()));
    if (opk_it == one_time_pre_keys_.end()) {
        Log::Warn(kLogTag, "Rejected initial message from {}: one-time pre-key unknown or used",
            remote_did_result.Unwrap());
        return SeedResult::Err(ProtocolFailure::Handshake(std::string(ErrorMessages::ONE_TIME_PRE_KEY_USED)));
    }

    auto dh1_result = SodiumInterop::ComputeSharedSecret(signed_pre_key_->private_key, remote_identity_x, "DH1");
    auto dh2_result = identity_.IdentityAgreement(remote_ephemeral);
    auto dh3_result = SodiumInterop::ComputeSharedSecret(signed_pre_key_->private_key, remote_ephemeral, "DH3");
    auto dh4_result = SodiumInterop::ComputeSharedSecret(opk_it->second.private_key, remote_ephemeral, "DH4");
    auto dh_failure = detail::FirstAgreementFailure({&dh1_result, &dh2_result, &dh3_result, &dh4_result});
    if (dh_failure.has_value()) {
        return SeedResult::Err(std::move(*dh_failure));
    }
    auto secret_result = DeriveSharedSecret(
        dh1_result.Unwrap(), dh2_result.Unwrap(), dh3_result.Unwrap(), dh4_result.Unwrap());
    detail::WipeAgreements({&dh1_result, &dh2_result, &dh3_result, &dh4_result});
    if (secret_result.IsErr()) {
        return SeedResult::Err(secret_result.UnwrapErr());
    }

    auto spk_bytes_result = signed_pre_key_->private_key.ReadBytes(kX25519PrivateKeyBytes);
    if (spk_bytes_result.IsErr()) {
        return SeedResult::Err(ProtocolFailure::FromSodiumFailure(spk_bytes_result.UnwrapErr()));
    }
    auto spk_bytes = std::move(spk_bytes_result).Unwrap();
    auto ratchet_private_result = SecureMemoryHandle::FromBytes(spk_bytes);
    WipeBytes(spk_bytes);
    if (ratchet_private_result.IsErr()) {
        return SeedResult::Err(ProtocolFailure::FromSodiumFailure(ratchet_private_result.UnwrapErr()));
    }

    SessionSeed seed;
    seed.shared_secret = std::move(secret_result).Unwrap();
    seed.local_ratchet_private_key = std::move(ratchet_private_result).Unwrap();
    seed.local_ratchet_public_key = signed_pre_key_->public_key;
    seed.associated_data = Concat(remote_identity, local->signing_public_key);
    seed.remote_did = remote_did_result.Unwrap();

    (void) seed.shared_secret.WithReadAccess([](std::span<const uint8_t> sk) {
        debug::LogX3dhSharedSecret(debug::Role::Responder, sk);
        return 0;
    });

    one_time_pre_key_order_.erase(opk_it->second.sequence);
    one_time_pre_keys_.erase(opk_it);
    Log::Debug(kLogTag, "Accepted initial message from {}", seed.remote_did);
    return SeedResult::Ok(std::move(seed));
}

}
