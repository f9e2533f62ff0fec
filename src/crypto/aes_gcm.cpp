#include "tessera/crypto/aes_gcm.hpp"
#include "tessera/crypto/sodium_interop.hpp"
#include "tessera/core/constants.hpp"
#include "tessera/core/format.hpp"
#include <openssl/evp.h>
#include <openssl/err.h>
#include <memory>
#include <string>
namespace tessera::protocol::crypto {
using OpenSSL = OpenSSLConstants;
namespace {
    struct EVP_CIPHER_CTX_Deleter {
        void operator()(EVP_CIPHER_CTX* ctx) const {
            if (ctx) {
                EVP_CIPHER_CTX_free(ctx);
            }
        }
    };
    using EVP_CIPHER_CTX_ptr = std::unique_ptr<EVP_CIPHER_CTX, EVP_CIPHER_CTX_Deleter>;
    std::string GetOpenSSLError() {
        const unsigned long err = ERR_get_error();
        if (err == OpenSSL::NO_ERROR) {
            return std::string(OpenSSL::UNKNOWN_ERROR_MESSAGE);
        }
        char buffer[Constants::OPENSSL_ERROR_BUFFER_SIZE];
        ERR_error_string_n(err, buffer, sizeof(buffer));
        return std::string(buffer);
    }
    Result<std::vector<uint8_t>, ProtocolFailure> Fail(std::string_view step) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::Generic(compat::format("{}: {}", step, GetOpenSSLError())));
    }
    void Wipe(std::vector<uint8_t>& buffer) {
        auto _wipe = SodiumInterop::SecureWipe(std::span<uint8_t>(buffer));
        (void) _wipe;
    }
    Result<Unit, ProtocolFailure> ValidateKeyAndNonce(
        std::span<const uint8_t> key,
        std::span<const uint8_t> nonce) {
        if (key.size() != Constants::AES_KEY_SIZE) {
            return Result<Unit, ProtocolFailure>::Err(
                ProtocolFailure::InvalidInput(
                    compat::format("AES-256-GCM key must be {} bytes, got {}",
                        Constants::AES_KEY_SIZE, key.size())));
        }
        if (nonce.size() != Constants::AES_GCM_NONCE_SIZE) {
            return Result<Unit, ProtocolFailure>::Err(
                ProtocolFailure::InvalidInput(
                    compat::format("AES-GCM nonce must be {} bytes, got {}",
                        Constants::AES_GCM_NONCE_SIZE, nonce.size())));
        }
        return Result<Unit, ProtocolFailure>::Ok(unit);
    }
}
Result<std::vector<uint8_t>, ProtocolFailure>
AesGcm::Encrypt(
    std::span<const uint8_t> key,
    std::span<const uint8_t> nonce,
    std::span<const uint8_t> plaintext,
    std::span<const uint8_t> associated_data) {
    if (auto check = ValidateKeyAndNonce(key, nonce); check.IsErr()) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(std::move(check).UnwrapErr());
    }
    EVP_CIPHER_CTX_ptr ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        return Fail("Failed to create cipher context");
    }
    if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != OpenSSL::SUCCESS) {
        return Fail("Failed to initialize AES-256-GCM");
    }
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN,
                           static_cast<int>(nonce.size()), nullptr) != OpenSSL::SUCCESS) {
        return Fail("Failed to set nonce length");
    }
    if (EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), nonce.data()) != OpenSSL::SUCCESS) {
        return Fail("Failed to set key and nonce");
    }
    if (!associated_data.empty()) {
        int outlen = 0;
        if (EVP_EncryptUpdate(ctx.get(), nullptr, &outlen,
                             associated_data.data(),
                             static_cast<int>(associated_data.size())) != OpenSSL::SUCCESS) {
            return Fail("Failed to add associated data");
        }
    }
    std::vector<uint8_t> output(plaintext.size() + Constants::AES_GCM_TAG_SIZE);
    int ciphertext_len = 0;
    if (!plaintext.empty() &&
        EVP_EncryptUpdate(ctx.get(), output.data(), &ciphertext_len,
                         plaintext.data(),
                         static_cast<int>(plaintext.size())) != OpenSSL::SUCCESS) {
        Wipe(output);
        return Fail("Encryption failed");
    }
    int final_len = 0;
    if (EVP_EncryptFinal_ex(ctx.get(), output.data() + ciphertext_len, &final_len) != OpenSSL::SUCCESS) {
        Wipe(output);
        return Fail("Encryption finalization failed");
    }
    ciphertext_len += final_len;
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG,
                           static_cast<int>(Constants::AES_GCM_TAG_SIZE),
                           output.data() + ciphertext_len) != OpenSSL::SUCCESS) {
        Wipe(output);
        return Fail("Failed to get authentication tag");
    }
    output.resize(static_cast<size_t>(ciphertext_len) + Constants::AES_GCM_TAG_SIZE);
    return Result<std::vector<uint8_t>, ProtocolFailure>::Ok(std::move(output));
}
Result<std::vector<uint8_t>, ProtocolFailure>
AesGcm::Decrypt(
    std::span<const uint8_t> key,
    std::span<const uint8_t> nonce,
    std::span<const uint8_t> ciphertext_with_tag,
    std::span<const uint8_t> associated_data) {
    if (auto check = ValidateKeyAndNonce(key, nonce); check.IsErr()) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(std::move(check).UnwrapErr());
    }
    if (ciphertext_with_tag.size() < Constants::AES_GCM_TAG_SIZE) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::InvalidInput(
                compat::format("Ciphertext too small: {} bytes (minimum {} for tag)",
                    ciphertext_with_tag.size(), Constants::AES_GCM_TAG_SIZE)));
    }
    const size_t ciphertext_len = ciphertext_with_tag.size() - Constants::AES_GCM_TAG_SIZE;
    std::span<const uint8_t> ciphertext = ciphertext_with_tag.subspan(0, ciphertext_len);
    std::span<const uint8_t> tag = ciphertext_with_tag.subspan(ciphertext_len);
    EVP_CIPHER_CTX_ptr ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        return Fail("Failed to create cipher context");
    }
    if (EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != OpenSSL::SUCCESS) {
        return Fail("Failed to initialize AES-256-GCM");
    }
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN,
                           static_cast<int>(nonce.size()), nullptr) != OpenSSL::SUCCESS) {
        return Fail("Failed to set nonce length");
    }
    if (EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), nonce.data()) != OpenSSL::SUCCESS) {
        return Fail("Failed to set key and nonce");
    }
    if (!associated_data.empty()) {
        int outlen = 0;
        if (EVP_DecryptUpdate(ctx.get(), nullptr, &outlen,
                             associated_data.data(),
                             static_cast<int>(associated_data.size())) != OpenSSL::SUCCESS) {
            return Fail("Failed to add associated data");
        }
    }
    std::vector<uint8_t> output(ciphertext_len + Constants::AES_GCM_TAG_SIZE);
    int plaintext_len = 0;
    if (!ciphertext.empty() &&
        EVP_DecryptUpdate(ctx.get(), output.data(), &plaintext_len,
                         ciphertext.data(),
                         static_cast<int>(ciphertext.size())) != OpenSSL::SUCCESS) {
        Wipe(output);
        return Fail("Decryption failed");
    }
    std::vector<uint8_t> tag_copy(tag.begin(), tag.end());
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG,
                           static_cast<int>(Constants::AES_GCM_TAG_SIZE),
                           tag_copy.data()) != OpenSSL::SUCCESS) {
        Wipe(output);
        return Fail("Failed to set authentication tag");
    }
    int final_len = 0;
    const int ret = EVP_DecryptFinal_ex(ctx.get(), output.data() + plaintext_len, &final_len);
    if (ret != OpenSSL::SUCCESS) {
        Wipe(output);
        ERR_clear_error();
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::AuthenticationFailed(std::string(ErrorMessages::AUTH_TAG_MISMATCH)));
    }
    plaintext_len += final_len;
    output.resize(static_cast<size_t>(plaintext_len));
    return Result<std::vector<uint8_t>, ProtocolFailure>::Ok(std::move(output));
}
}
