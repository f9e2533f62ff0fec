#include <catch2/catch_test_macros.hpp>
#include "tessera/identity/identity_store.hpp"
#include "tessera/identity/in_memory_identity_storage.hpp"
#include "tessera/identity/canonical_payload.hpp"
#include "tessera/crypto/sodium_interop.hpp"
#include "helpers/manual_clock.hpp"
#include <google/protobuf/util/json_util.h>
#include <chrono>
#include <cstdint>
#include <limits>
#include <memory>

using namespace tessera::protocol;
using namespace tessera::protocol::identity;
using tessera::protocol::test_helpers::ManualClock;
using namespace std::chrono_literals;

namespace {
    std::unique_ptr<IdentityStore> OpenWithClock(const ManualClock& clock) {
        auto result = IdentityStore::Open(std::make_shared<InMemoryIdentityStorage>(), clock.AsClock());
        REQUIRE(result.IsOk());
        return std::move(result).Unwrap();
    }
}

TEST_CASE("Challenge proof - Freshness window", "[identity][challenge]") {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
    ManualClock clock;
    auto prover = OpenWithClock(clock);
    auto verifier = OpenWithClock(clock);
    const auto did = prover->Generate().Unwrap().did;

    auto proof_result = prover->CreateChallengeProof();
    REQUIRE(proof_result.IsOk());
    const auto proof = proof_result.Unwrap();
    REQUIRE(proof.did() == did);
    REQUIRE(proof.timestamp_ms() == clock.NowMillis());
    REQUIRE(proof.challenge().size() == kChallengeBytes);

    SECTION("Fresh proof verifies") {
        REQUIRE(verifier->VerifyChallengeProof(proof, did).Unwrap());
    }

    SECTION("Four minutes old verifies") {
        clock.Advance(4min);
        REQUIRE(verifier->VerifyChallengeProof(proof, did).Unwrap());
    }

    SECTION("Exactly at the window verifies") {
        clock.Advance(5min);
        REQUIRE(verifier->VerifyChallengeProof(proof, did).Unwrap());
    }

    SECTION("Six minutes old is stale") {
        clock.Advance(6min);
        auto verified = verifier->VerifyChallengeProof(proof, did);
        REQUIRE(verified.IsOk());
        REQUIRE_FALSE(verified.Unwrap());
    }

    SECTION("Dated six minutes ahead is refused") {
        clock.Advance(-6min);
        auto verified = verifier->VerifyChallengeProof(proof, did);
        REQUIRE(verified.IsOk());
        REQUIRE_FALSE(verified.Unwrap());
    }
}

TEST_CASE("Challenge proof - Binding to DID and content", "[identity][challenge]") {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
    ManualClock clock;
    auto prover = OpenWithClock(clock);
    auto other = OpenWithClock(clock);
    const auto did = prover->Generate().Unwrap().did;
    const auto other_did = other->Generate().Unwrap().did;
    const auto proof = prover->CreateChallengeProof().Unwrap();

    SECTION("Expected DID differs") {
        REQUIRE_FALSE(other->VerifyChallengeProof(proof, other_did).Unwrap());
    }

    SECTION("Claimed DID swapped") {
        auto forged = proof;
        forged.set_did(other_did);
        REQUIRE_FALSE(other->VerifyChallengeProof(forged, other_did).Unwrap());
    }

    SECTION("Challenge byte changed") {
        auto forged = proof;
        (*forged.mutable_challenge())[3] ^= 0x10;
        REQUIRE_FALSE(other->VerifyChallengeProof(forged, did).Unwrap());
    }

    SECTION("Timestamp changed") {
        auto forged = proof;
        forged.set_timestamp_ms(proof.timestamp_ms() - 1);
        REQUIRE_FALSE(other->VerifyChallengeProof(forged, did).Unwrap());
    }

    SECTION("Wrong challenge length is malformed") {
        auto forged = proof;
        forged.mutable_challenge()->resize(16);
        auto verified = other->VerifyChallengeProof(forged, did);
        REQUIRE(verified.IsErr());
        REQUIRE(verified.UnwrapErr().type == ProtocolFailureType::InvalidInput);
    }

    SECTION("Without an identity no proof is created") {
        auto empty = OpenWithClock(clock);
        auto created = empty->CreateChallengeProof();
        REQUIRE(created.IsErr());
        REQUIRE(created.UnwrapErr().type == ProtocolFailureType::InvalidState);
    }
}

TEST_CASE("Challenge proof - JSON transport", "[identity][challenge]") {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
    ManualClock clock;
    auto prover = OpenWithClock(clock);
    auto verifier = OpenWithClock(clock);
    const auto did = prover->Generate().Unwrap().did;
    const auto proof = prover->CreateChallengeProof().Unwrap();

    auto json = IdentityStore::ExportChallengeProof(proof);
    REQUIRE(json.IsOk());
    REQUIRE(json.Unwrap().find(did) != std::string::npos);

    auto imported = IdentityStore::ImportChallengeProof(json.Unwrap());
    REQUIRE(imported.IsOk());
    REQUIRE(imported.Unwrap().did() == proof.did());
    REQUIRE(imported.Unwrap().timestamp_ms() == proof.timestamp_ms());
    REQUIRE(imported.Unwrap().challenge() == proof.challenge());
    REQUIRE(imported.Unwrap().signature() == proof.signature());
    REQUIRE(verifier->VerifyChallengeProof(imported.Unwrap(), did).Unwrap());

    SECTION("Missing field") {
        REQUIRE(IdentityStore::ImportChallengeProof(R"({"did":"did:key:z6Mk","timestamp":1})").IsErr());
    }

    SECTION("Challenge entry out of byte range") {
        auto document = CanonicalPayload::ParseJson(json.Unwrap()).Unwrap();
        auto* challenge = (*document.mutable_fields())["challenge"].mutable_list_value();
        challenge->mutable_values(0)->set_number_value(300);
        std::string broken;
        REQUIRE(google::protobuf::util::MessageToJsonString(document, &broken).ok());
        REQUIRE(IdentityStore::ImportChallengeProof(broken).IsErr());
    }
}

TEST_CASE("Challenge proof - Extreme timestamps are refused", "[identity][challenge]") {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
    ManualClock clock;
    auto prover = OpenWithClock(clock);
    auto verifier = OpenWithClock(clock);
    const auto did = prover->Generate().Unwrap().did;
    auto proof = prover->CreateChallengeProof().Unwrap();

    SECTION("Earliest representable timestamp") {
        proof.set_timestamp_ms(std::numeric_limits<int64_t>::min());
        auto verified = verifier->VerifyChallengeProof(proof, did);
        REQUIRE(verified.IsOk());
        REQUIRE_FALSE(verified.Unwrap());
    }

    SECTION("Latest representable timestamp") {
        proof.set_timestamp_ms(std::numeric_limits<int64_t>::max());
        auto verified = verifier->VerifyChallengeProof(proof, did);
        REQUIRE(verified.IsOk());
        REQUIRE_FALSE(verified.Unwrap());
    }
}
