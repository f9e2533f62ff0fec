#include "tessera/crypto/hkdf.hpp"
#include "tessera/core/constants.hpp"
#include "tessera/core/format.hpp"

#include <openssl/core_names.h>
#include <openssl/evp.h>
#include <openssl/kdf.h>
#include <openssl/params.h>

#include <memory>

namespace tessera::protocol::crypto {

namespace {
    struct EVP_KDF_CTX_Deleter {
        void operator()(EVP_KDF_CTX* ctx) const {
            if (ctx) {
                EVP_KDF_CTX_free(ctx);
            }
        }
    };
    using EVP_KDF_CTX_ptr = std::unique_ptr<EVP_KDF_CTX, EVP_KDF_CTX_Deleter>;

    enum class HkdfMode { ExtractAndExpand, ExtractOnly, ExpandOnly };

    Result<Unit, ProtocolFailure> RunHkdf(
        const HkdfMode mode,
        std::span<const uint8_t> key,
        std::span<uint8_t> output,
        std::span<const uint8_t> salt,
        std::span<const uint8_t> info) {
        EVP_KDF* kdf = EVP_KDF_fetch(nullptr, "HKDF", nullptr);
        if (!kdf) {
            return Result<Unit, ProtocolFailure>::Err(
                ProtocolFailure::DeriveKey("Failed to fetch HKDF algorithm"));
        }
        EVP_KDF_CTX_ptr kctx(EVP_KDF_CTX_new(kdf));
        EVP_KDF_free(kdf);
        if (!kctx) {
            return Result<Unit, ProtocolFailure>::Err(
                ProtocolFailure::DeriveKey("Failed to create HKDF context"));
        }

        int openssl_mode = EVP_KDF_HKDF_MODE_EXTRACT_AND_EXPAND;
        if (mode == HkdfMode::ExtractOnly) {
            openssl_mode = EVP_KDF_HKDF_MODE_EXTRACT_ONLY;
        } else if (mode == HkdfMode::ExpandOnly) {
            openssl_mode = EVP_KDF_HKDF_MODE_EXPAND_ONLY;
        }

        OSSL_PARAM params[6];
        int param_idx = 0;
        params[param_idx++] = OSSL_PARAM_construct_utf8_string(
            OSSL_KDF_PARAM_DIGEST, const_cast<char*>("SHA256"), 0);
        params[param_idx++] = OSSL_PARAM_construct_int(OSSL_KDF_PARAM_MODE, &openssl_mode);
        params[param_idx++] = OSSL_PARAM_construct_octet_string(
            OSSL_KDF_PARAM_KEY, const_cast<uint8_t*>(key.data()), key.size());
        if (!salt.empty()) {
            params[param_idx++] = OSSL_PARAM_construct_octet_string(
                OSSL_KDF_PARAM_SALT, const_cast<uint8_t*>(salt.data()), salt.size());
        }
        if (!info.empty()) {
            params[param_idx++] = OSSL_PARAM_construct_octet_string(
                OSSL_KDF_PARAM_INFO, const_cast<uint8_t*>(info.data()), info.size());
        }
        params[param_idx] = OSSL_PARAM_construct_end();

        if (EVP_KDF_derive(kctx.get(), output.data(), output.size(), params) != OpenSSLConstants::SUCCESS) {
            return Result<Unit, ProtocolFailure>::Err(
                ProtocolFailure::DeriveKey("HKDF key derivation failed"));
        }
        return Result<Unit, ProtocolFailure>::Ok(unit);
    }
}

Result<Unit, ProtocolFailure> Hkdf::DeriveKey(
    std::span<const uint8_t> ikm,
    std::span<uint8_t> output,
    std::span<const uint8_t> salt,
    std::span<const uint8_t> info) {
    if (output.empty() || output.size() > MAX_OUTPUT_LEN) {
        return Result<Unit, ProtocolFailure>::Err(
            ProtocolFailure::InvalidInput(
                compat::format("HKDF output size must be in 1..{}, got {}",
                    MAX_OUTPUT_LEN, output.size())));
    }
    if (ikm.empty()) {
        return Result<Unit, ProtocolFailure>::Err(
            ProtocolFailure::InvalidInput("HKDF input key material cannot be empty"));
    }
    return RunHkdf(HkdfMode::ExtractAndExpand, ikm, output, salt, info);
}

Result<std::vector<uint8_t>, ProtocolFailure> Hkdf::DeriveKeyBytes(
    std::span<const uint8_t> ikm,
    size_t output_size,
    std::span<const uint8_t> salt,
    std::span<const uint8_t> info) {
    std::vector<uint8_t> output(output_size);
    auto result = DeriveKey(ikm, output, salt, info);
    if (result.IsErr()) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(std::move(result).UnwrapErr());
    }
    return Result<std::vector<uint8_t>, ProtocolFailure>::Ok(std::move(output));
}

Result<std::vector<uint8_t>, ProtocolFailure> Hkdf::DeriveKeyBytes(
    std::span<const uint8_t> ikm,
    size_t output_size,
    std::span<const uint8_t> salt,
    std::string_view info) {
    const std::span<const uint8_t> info_bytes(
        reinterpret_cast<const uint8_t*>(info.data()), info.size());
    return DeriveKeyBytes(ikm, output_size, salt, info_bytes);
}

Result<std::vector<uint8_t>, ProtocolFailure> Hkdf::Extract(
    std::span<const uint8_t> ikm,
    std::span<const uint8_t> salt) {
    if (ikm.empty()) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::InvalidInput("HKDF input key material cannot be empty"));
    }
    std::vector<uint8_t> prk(HASH_LEN);
    auto result = RunHkdf(HkdfMode::ExtractOnly, ikm, prk, salt, {});
    if (result.IsErr()) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(std::move(result).UnwrapErr());
    }
    return Result<std::vector<uint8_t>, ProtocolFailure>::Ok(std::move(prk));
}

Result<Unit, ProtocolFailure> Hkdf::Expand(
    std::span<const uint8_t> prk,
    std::span<uint8_t> output,
    std::span<const uint8_t> info) {
    if (prk.size() != HASH_LEN) {
        return Result<Unit, ProtocolFailure>::Err(
            ProtocolFailure::InvalidInput(
                compat::format("PRK must be exactly {} bytes", HASH_LEN)));
    }
    if (output.empty() || output.size() > MAX_OUTPUT_LEN) {
        return Result<Unit, ProtocolFailure>::Err(
            ProtocolFailure::InvalidInput(
                compat::format("HKDF output size must be in 1..{}, got {}",
                    MAX_OUTPUT_LEN, output.size())));
    }
    return RunHkdf(HkdfMode::ExpandOnly, prk, output, {}, info);
}

} // namespace tessera::protocol::crypto
