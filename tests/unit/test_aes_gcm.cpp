#include <catch2/catch_test_macros.hpp>
#include "tessera/crypto/aes_gcm.hpp"
#include "tessera/crypto/sodium_interop.hpp"
#include "tessera/protocol/constants.hpp"
#include <vector>

using namespace tessera::protocol;
using namespace tessera::protocol::crypto;

TEST_CASE("AES-GCM - Encrypt and decrypt", "[aes_gcm][crypto]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    std::vector<uint8_t> key(kAesKeyBytes, 0xAA);
    std::vector<uint8_t> nonce(kAesGcmNonceBytes, 0xBB);

    SECTION("Ciphertext carries a trailing tag") {
        std::vector<uint8_t> plaintext = {'H', 'e', 'l', 'l', 'o'};
        std::vector<uint8_t> ad = {'a', 'd'};
        auto encrypted = AesGcm::Encrypt(key, nonce, plaintext, ad);
        REQUIRE(encrypted.IsOk());
        REQUIRE(encrypted.Unwrap().size() == plaintext.size() + kAesGcmTagBytes);

        auto decrypted = AesGcm::Decrypt(key, nonce, encrypted.Unwrap(), ad);
        REQUIRE(decrypted.IsOk());
        REQUIRE(decrypted.Unwrap() == plaintext);
    }

    SECTION("Empty plaintext") {
        auto encrypted = AesGcm::Encrypt(key, nonce, std::vector<uint8_t>{});
        REQUIRE(encrypted.IsOk());
        REQUIRE(encrypted.Unwrap().size() == kAesGcmTagBytes);
        auto decrypted = AesGcm::Decrypt(key, nonce, encrypted.Unwrap());
        REQUIRE(decrypted.IsOk());
        REQUIRE(decrypted.Unwrap().empty());
    }
}

TEST_CASE("AES-GCM - Tampering is an authentication failure", "[aes_gcm][crypto]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    std::vector<uint8_t> key(kAesKeyBytes, 0x66);
    std::vector<uint8_t> nonce(kAesGcmNonceBytes, 0x77);
    std::vector<uint8_t> plaintext = {'s', 'e', 'c', 'r', 'e', 't'};
    std::vector<uint8_t> ad = {'c', 't', 'x'};
    auto encrypted = AesGcm::Encrypt(key, nonce, plaintext, ad);
    REQUIRE(encrypted.IsOk());
    const auto ciphertext = encrypted.Unwrap();

    SECTION("Wrong key") {
        std::vector<uint8_t> wrong_key(kAesKeyBytes, 0x99);
        auto result = AesGcm::Decrypt(wrong_key, nonce, ciphertext, ad);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == ProtocolFailureType::AuthenticationFailed);
    }

    SECTION("Wrong associated data") {
        std::vector<uint8_t> wrong_ad = {'x', 't', 'c'};
        auto result = AesGcm::Decrypt(key, nonce, ciphertext, wrong_ad);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == ProtocolFailureType::AuthenticationFailed);
    }

    SECTION("Flipped ciphertext bit") {
        auto tampered = ciphertext;
        tampered[0] ^= 0x01;
        auto result = AesGcm::Decrypt(key, nonce, tampered, ad);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == ProtocolFailureType::AuthenticationFailed);
    }

    SECTION("Flipped tag bit") {
        auto tampered = ciphertext;
        tampered.back() ^= 0x80;
        auto result = AesGcm::Decrypt(key, nonce, tampered, ad);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == ProtocolFailureType::AuthenticationFailed);
    }
}

TEST_CASE("AES-GCM - Malformed parameters", "[aes_gcm][crypto]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    std::vector<uint8_t> plaintext = {1, 2, 3};

    SECTION("Short key") {
        std::vector<uint8_t> key(16, 0x01);
        std::vector<uint8_t> nonce(kAesGcmNonceBytes, 0x02);
        auto result = AesGcm::Encrypt(key, nonce, plaintext);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == ProtocolFailureType::InvalidInput);
    }

    SECTION("Wrong nonce size") {
        std::vector<uint8_t> key(kAesKeyBytes, 0x01);
        std::vector<uint8_t> nonce(8, 0x02);
        auto result = AesGcm::Encrypt(key, nonce, plaintext);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == ProtocolFailureType::InvalidInput);
    }

    SECTION("Ciphertext shorter than the tag") {
        std::vector<uint8_t> key(kAesKeyBytes, 0x01);
        std::vector<uint8_t> nonce(kAesGcmNonceBytes, 0x02);
        std::vector<uint8_t> truncated(kAesGcmTagBytes - 1, 0x00);
        auto result = AesGcm::Decrypt(key, nonce, truncated);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == ProtocolFailureType::InvalidInput);
    }
}
