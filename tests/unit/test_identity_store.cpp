#include <catch2/catch_test_macros.hpp>
#include "tessera/identity/identity_store.hpp"
#include "tessera/identity/in_memory_identity_storage.hpp"
#include "tessera/identity/did.hpp"
#include "tessera/identity/canonical_payload.hpp"
#include "tessera/crypto/sodium_interop.hpp"
#include <sodium.h>
#include <functional>
#include <string>
#include <memory>

using namespace tessera::protocol;
using namespace tessera::protocol::identity;
using tessera::protocol::crypto::SodiumInterop;

namespace {
    /// Backend that returns the first bytes of a saved record, as after an
    /// interrupted write.
    class TruncatingIdentityStorage final : public IIdentityStorage {
    public:
        explicit TruncatingIdentityStorage(size_t keep) : keep_(keep) {}

        Result<std::optional<proto::protocol::IdentityRecord>, ProtocolFailure> Load() override {
            using LoadResult = Result<std::optional<proto::protocol::IdentityRecord>, ProtocolFailure>;
            if (blob_.empty()) {
                return LoadResult::Ok(std::nullopt);
            }
            proto::protocol::IdentityRecord record;
            if (!record.ParseFromString(blob_.substr(0, keep_))) {
                return LoadResult::Err(ProtocolFailure::Decode("Truncated identity record"));
            }
            return LoadResult::Ok(std::move(record));
        }

        Result<Unit, ProtocolFailure> Save(const proto::protocol::IdentityRecord& record) override {
            blob_ = record.SerializeAsString();
            return Result<Unit, ProtocolFailure>::Ok(unit);
        }

        Result<Unit, ProtocolFailure> Erase() override {
            blob_.clear();
            return Result<Unit, ProtocolFailure>::Ok(unit);
        }

    private:
        size_t keep_;
        std::string blob_;
    };

    std::unique_ptr<IdentityStore> OpenStore(const std::shared_ptr<InMemoryIdentityStorage>& storage) {
        auto result = IdentityStore::Open(storage);
        REQUIRE(result.IsOk());
        return std::move(result).Unwrap();
    }

    void Rewrite(InMemoryIdentityStorage& storage, const std::function<void(proto::protocol::IdentityRecord&)>& edit) {
        auto loaded = storage.Load();
        REQUIRE(loaded.IsOk());
        REQUIRE(loaded.Unwrap().has_value());
        auto record = *loaded.Unwrap();
        edit(record);
        REQUIRE(storage.Save(record).IsOk());
    }
}

TEST_CASE("IdentityStore - Generate and load", "[identity]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    auto storage = std::make_shared<InMemoryIdentityStorage>();

    SECTION("Empty storage loads nothing") {
        auto store = OpenStore(storage);
        auto loaded = store->Load();
        REQUIRE(loaded.IsOk());
        REQUIRE_FALSE(loaded.Unwrap().has_value());
        REQUIRE_FALSE(store->HasIdentity());
    }

    SECTION("A second store over the same storage loads the same identity") {
        auto first = OpenStore(storage);
        auto generated = first->Generate();
        REQUIRE(generated.IsOk());
        REQUIRE(Did::Matches(generated.Unwrap().did, generated.Unwrap().signing_public_key));
        REQUIRE_FALSE(storage->IsEmpty());

        auto second = OpenStore(storage);
        auto loaded = second->Load();
        REQUIRE(loaded.IsOk());
        REQUIRE(loaded.Unwrap().has_value());
        REQUIRE(loaded.Unwrap()->did == generated.Unwrap().did);
        REQUIRE(loaded.Unwrap()->signing_public_key == generated.Unwrap().signing_public_key);

        auto payload = CanonicalPayload::ParseJson(R"({"name":"Alice"})").Unwrap();
        auto signature = second->Sign(payload);
        REQUIRE(signature.IsOk());
        REQUIRE(signature.Unwrap().did() == generated.Unwrap().did);
        REQUIRE(first->Verify(payload, signature.Unwrap()).Unwrap());
    }

    SECTION("Generate replaces the current identity") {
        auto store = OpenStore(storage);
        auto first = store->Generate().Unwrap();
        auto second = store->Generate().Unwrap();
        REQUIRE(first.did != second.did);
        REQUIRE(store->CurrentIdentity()->did == second.did);
    }
}

TEST_CASE("IdentityStore - Corrupted records are refused", "[identity]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    auto storage = std::make_shared<InMemoryIdentityStorage>();
    REQUIRE(OpenStore(storage)->Generate().IsOk());

    SECTION("One public key byte changed") {
        Rewrite(*storage, [](auto& record) { (*record.mutable_signing_public_key())[0] ^= 0x01; });
    }

    SECTION("DID replaced with another identity's DID") {
        auto other_storage = std::make_shared<InMemoryIdentityStorage>();
        const auto other_did = OpenStore(other_storage)->Generate().Unwrap().did;
        Rewrite(*storage, [&](auto& record) { record.set_did(other_did); });
    }

    SECTION("Secret key from another identity") {
        auto other_storage = std::make_shared<InMemoryIdentityStorage>();
        REQUIRE(OpenStore(other_storage)->Generate().IsOk());
        const auto other_secret = other_storage->Load().Unwrap()->signing_secret_key();
        Rewrite(*storage, [&](auto& record) { record.set_signing_secret_key(other_secret); });
    }

    SECTION("Truncated secret key") {
        Rewrite(*storage, [](auto& record) { record.mutable_signing_secret_key()->resize(10); });
    }

    auto store = OpenStore(storage);
    auto loaded = store->Load();
    REQUIRE(loaded.IsErr());
    REQUIRE(loaded.UnwrapErr().type == ProtocolFailureType::IdentityCorrupted);
    REQUIRE_FALSE(store->HasIdentity());
    REQUIRE(store->Sign(google::protobuf::Struct()).IsErr());
}

TEST_CASE("IdentityStore - Payload signatures", "[identity]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    auto alice = OpenStore(std::make_shared<InMemoryIdentityStorage>());
    auto bob = OpenStore(std::make_shared<InMemoryIdentityStorage>());
    const auto alice_did = alice->Generate().Unwrap().did;
    const auto bob_did = bob->Generate().Unwrap().did;

    auto signature = alice->SignJson(R"({"name":"Alice","rating":5})");
    REQUIRE(signature.IsOk());
    const auto& sig = signature.Unwrap();
    REQUIRE(sig.did() == alice_did);
    REQUIRE(sig.signature().size() == kEd25519SignatureBytes);

    SECTION("Any store verifies it") {
        REQUIRE(bob->VerifyJson(R"({"name":"Alice","rating":5})", sig).Unwrap());
    }

    SECTION("Member order and an embedded signature do not matter") {
        REQUIRE(bob->VerifyJson(R"({"rating":5,"signature":{"did":"x"},"name":"Alice"})", sig).Unwrap());
    }

    SECTION("A changed payload fails") {
        auto verified = bob->VerifyJson(R"({"name":"Bob","rating":5})", sig);
        REQUIRE(verified.IsOk());
        REQUIRE_FALSE(verified.Unwrap());
    }

    SECTION("A claimed DID that does not own the key fails") {
        auto forged = sig;
        forged.set_did(bob_did);
        auto verified = bob->VerifyJson(R"({"name":"Alice","rating":5})", forged);
        REQUIRE(verified.IsOk());
        REQUIRE_FALSE(verified.Unwrap());
    }

    SECTION("A malformed signature is an error") {
        auto truncated = sig;
        truncated.mutable_signature()->resize(10);
        auto verified = bob->VerifyJson(R"({"name":"Alice","rating":5})", truncated);
        REQUIRE(verified.IsErr());
        REQUIRE(verified.UnwrapErr().type == ProtocolFailureType::InvalidInput);
    }
}

TEST_CASE("IdentityStore - Wipe", "[identity]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    auto storage = std::make_shared<InMemoryIdentityStorage>();
    auto store = OpenStore(storage);
    REQUIRE(store->Generate().IsOk());

    REQUIRE(store->Wipe().IsOk());
    REQUIRE_FALSE(store->HasIdentity());
    REQUIRE(storage->IsEmpty());
    REQUIRE_FALSE(store->Load().Unwrap().has_value());

    auto signed_after_wipe = store->SignJson(R"({"a":1})");
    REQUIRE(signed_after_wipe.IsErr());
    REQUIRE(signed_after_wipe.UnwrapErr().type == ProtocolFailureType::InvalidState);
}

TEST_CASE("IdentityStore - Open rejects bad arguments", "[identity]") {
    REQUIRE(IdentityStore::Open(nullptr).IsErr());
    auto storage = std::make_shared<InMemoryIdentityStorage>();
    REQUIRE(IdentityStore::Open(storage, {}, std::chrono::milliseconds(0)).IsErr());
    REQUIRE(IdentityStore::Open(storage, {}, kMaxChallengeFreshness + std::chrono::milliseconds(1)).IsErr());
    REQUIRE(IdentityStore::Open(storage, {}, kMaxChallengeFreshness).IsOk());
}

TEST_CASE("IdentityStore - Raw key operations", "[identity]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    auto alice = OpenStore(std::make_shared<InMemoryIdentityStorage>());
    auto bob = OpenStore(std::make_shared<InMemoryIdentityStorage>());
    const auto alice_identity = alice->Generate().Unwrap();
    const auto bob_identity = bob->Generate().Unwrap();

    SECTION("Detached signatures verify under the identity key") {
        const std::vector<uint8_t> message = {0x01, 0x02, 0x03};
        auto signature = alice->SignDetached(message);
        REQUIRE(signature.IsOk());
        REQUIRE(signature.Unwrap().size() == kEd25519SignatureBytes);
        REQUIRE(crypto_sign_verify_detached(
            signature.Unwrap().data(), message.data(), message.size(),
            alice_identity.signing_public_key.data()) == 0);
    }

    SECTION("Identity agreement is symmetric") {
        auto bob_x25519 = SodiumInterop::ConvertEd25519PublicToX25519(bob_identity.signing_public_key);
        auto alice_x25519 = SodiumInterop::ConvertEd25519PublicToX25519(alice_identity.signing_public_key);
        REQUIRE(bob_x25519.IsOk());
        REQUIRE(alice_x25519.IsOk());

        auto alice_side = alice->IdentityAgreement(bob_x25519.Unwrap());
        auto bob_side = bob->IdentityAgreement(alice_x25519.Unwrap());
        REQUIRE(alice_side.IsOk());
        REQUIRE(bob_side.IsOk());
        REQUIRE(alice_side.Unwrap() == bob_side.Unwrap());
    }

    SECTION("Identity agreement refuses a low-order key") {
        REQUIRE(alice->IdentityAgreement(std::vector<uint8_t>(kX25519PublicKeyBytes, 0x00)).IsErr());
    }
}

TEST_CASE("IdentityStore - Partially written record is corrupted", "[identity]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    // Cuts into the length-delimited DID field.
    auto storage = std::make_shared<TruncatingIdentityStorage>(5);
    auto writer = IdentityStore::Open(storage).Unwrap();
    REQUIRE(writer->Generate().IsOk());

    auto reader = IdentityStore::Open(storage).Unwrap();
    auto loaded = reader->Load();
    REQUIRE(loaded.IsErr());
    REQUIRE(loaded.UnwrapErr().type == ProtocolFailureType::IdentityCorrupted);
    REQUIRE_FALSE(reader->CurrentIdentity().has_value());
}
