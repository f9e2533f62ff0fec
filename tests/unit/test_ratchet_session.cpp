#include <catch2/catch_test_macros.hpp>
#include "tessera/protocol/ratchet_session.hpp"
#include "helpers/session_fixture.hpp"
#include <chrono>
#include <memory>
#include <string>
#include <vector>

using namespace tessera::protocol;
using namespace tessera::protocol::test_helpers;
using Envelope = tessera::proto::protocol::MessageEnvelope;

namespace {
    class RecordingEventHandler final : public ISessionEventHandler {
    public:
        void OnRatchetStep(const std::string& peer_id) override {
            ratchet_steps++;
            last_peer = peer_id;
        }
        void OnSkippedKeysEvicted(const std::string& peer_id, size_t evicted_count) override {
            evicted += evicted_count;
            last_peer = peer_id;
        }
        void OnDecryptFailed(const std::string& peer_id, const ProtocolFailure& failure) override {
            failures.push_back(failure.type);
            last_peer = peer_id;
        }

        int ratchet_steps = 0;
        size_t evicted = 0;
        std::vector<ProtocolFailureType> failures;
        std::string last_peer;
    };

    std::vector<Envelope> SendMany(RatchetSession& session, int count, const std::string& prefix) {
        std::vector<Envelope> envelopes;
        for (int i = 0; i < count; ++i) {
            envelopes.push_back(EncryptText(session, prefix + std::to_string(i)));
        }
        return envelopes;
    }
}

TEST_CASE("RatchetSession - Messages in order", "[ratchet]") {
    auto pair = CreateSessionPair();
    REQUIRE(pair.alice_session->IsInitiator());
    REQUIRE_FALSE(pair.bob_session->IsInitiator());
    REQUIRE(pair.alice_session->PeerId() == pair.bob.did);
    REQUIRE(pair.bob_session->PeerId() == pair.alice.did);

    const auto envelopes = SendMany(*pair.alice_session, 5, "msg-");
    for (int i = 0; i < 5; ++i) {
        REQUIRE(envelopes[i].header().message_number() == static_cast<uint64_t>(i));
        REQUIRE(DecryptText(*pair.bob_session, envelopes[i]) == "msg-" + std::to_string(i));
    }
    REQUIRE(pair.alice_session->SendMessageNumber() == 5);
    REQUIRE(pair.bob_session->ReceiveMessageNumber() == 5);
    REQUIRE(pair.bob_session->SkippedKeyCount() == 0);
}

TEST_CASE("RatchetSession - Ping-pong conversation ratchets both ways", "[ratchet]") {
    auto pair = CreateSessionPair();
    auto alice_key = pair.alice_session->LocalRatchetPublicKey();

    for (int round = 0; round < 4; ++round) {
        auto from_alice = EncryptText(*pair.alice_session, "ping " + std::to_string(round));
        REQUIRE(DecryptText(*pair.bob_session, from_alice) == "ping " + std::to_string(round));
        auto from_bob = EncryptText(*pair.bob_session, "pong " + std::to_string(round));
        REQUIRE(DecryptText(*pair.alice_session, from_bob) == "pong " + std::to_string(round));

        const auto next_alice_key = pair.alice_session->LocalRatchetPublicKey();
        REQUIRE(next_alice_key != alice_key);
        alice_key = next_alice_key;
        REQUIRE(from_alice.header().message_number() == 0);
        REQUIRE(from_bob.header().message_number() == 0);
    }
}

TEST_CASE("RatchetSession - Responder cannot send first", "[ratchet]") {
    auto pair = CreateSessionPair();
    REQUIRE_FALSE(pair.bob_session->CanSend());

    auto premature = pair.bob_session->Encrypt(Bytes("too early"));
    REQUIRE(premature.IsErr());
    REQUIRE(premature.UnwrapErr().type == ProtocolFailureType::InvalidState);
    REQUIRE(premature.UnwrapErr().peer_id == pair.alice.did);

    REQUIRE(DecryptText(*pair.bob_session, EncryptText(*pair.alice_session, "hello")) == "hello");
    REQUIRE(pair.bob_session->CanSend());
}

TEST_CASE("RatchetSession - Out of order delivery", "[ratchet]") {
    auto pair = CreateSessionPair();
    const auto envelopes = SendMany(*pair.alice_session, 3, "m");

    REQUIRE(DecryptText(*pair.bob_session, envelopes[0]) == "m0");
    REQUIRE(DecryptText(*pair.bob_session, envelopes[2]) == "m2");
    REQUIRE(pair.bob_session->SkippedKeyCount() == 1);
    REQUIRE(DecryptText(*pair.bob_session, envelopes[1]) == "m1");
    REQUIRE(pair.bob_session->SkippedKeyCount() == 0);

    SECTION("Skipped messages from a previous chain stay readable after a ratchet step") {
        auto late_candidates = SendMany(*pair.alice_session, 2, "late");
        REQUIRE(DecryptText(*pair.bob_session, late_candidates[1]) == "late1");
        REQUIRE(DecryptText(*pair.alice_session, EncryptText(*pair.bob_session, "reply")) == "reply");
        REQUIRE(DecryptText(*pair.bob_session, EncryptText(*pair.alice_session, "new chain")) == "new chain");
        REQUIRE(DecryptText(*pair.bob_session, late_candidates[0]) == "late0");
    }
}

TEST_CASE("RatchetSession - Replayed envelope is rejected", "[ratchet]") {
    auto pair = CreateSessionPair();
    const auto envelopes = SendMany(*pair.alice_session, 3, "r");
    REQUIRE(DecryptText(*pair.bob_session, envelopes[0]) == "r0");
    REQUIRE(DecryptText(*pair.bob_session, envelopes[2]) == "r2");
    REQUIRE(DecryptText(*pair.bob_session, envelopes[1]) == "r1");

    for (const auto& envelope : envelopes) {
        auto replay = pair.bob_session->Decrypt(envelope);
        REQUIRE(replay.IsErr());
        REQUIRE(replay.UnwrapErr().type == ProtocolFailureType::MessageKeyUnavailable);
    }
}

TEST_CASE("RatchetSession - Evicted skipped keys make messages undecryptable", "[ratchet]") {
    const SessionConfig small(2, 100, 16, std::chrono::minutes(5));
    auto pair = CreateSessionPair(small);
    auto handler = std::make_shared<RecordingEventHandler>();
    pair.bob_session->SetEventHandler(handler);

    const auto envelopes = SendMany(*pair.alice_session, 5, "e");
    REQUIRE(DecryptText(*pair.bob_session, envelopes[4]) == "e4");
    REQUIRE(pair.bob_session->SkippedKeyCount() == 2);
    REQUIRE(handler->evicted == 2);

    auto lost = pair.bob_session->Decrypt(envelopes[0]);
    REQUIRE(lost.IsErr());
    REQUIRE(lost.UnwrapErr().type == ProtocolFailureType::MessageKeyUnavailable);
    REQUIRE(lost.UnwrapErr().message_number == 0u);

    REQUIRE(DecryptText(*pair.bob_session, envelopes[2]) == "e2");
    REQUIRE(DecryptText(*pair.bob_session, envelopes[3]) == "e3");
}

TEST_CASE("RatchetSession - Tampered envelope leaves the session unchanged", "[ratchet]") {
    auto pair = CreateSessionPair();
    auto handler = std::make_shared<RecordingEventHandler>();
    pair.bob_session->SetEventHandler(handler);
    const auto envelope = EncryptText(*pair.alice_session, "intact");

    SECTION("Ciphertext bit flip") {
        Envelope tampered = envelope;
        (*tampered.mutable_ciphertext())[0] ^= 0x01;
        auto result = pair.bob_session->Decrypt(tampered);
        REQUIRE(result.IsErr());
        const auto& failure = result.UnwrapErr();
        REQUIRE(failure.type == ProtocolFailureType::AuthenticationFailed);
        REQUIRE(failure.peer_id == pair.alice.did);
        REQUIRE(failure.message_number == 0u);
    }

    SECTION("Header message number changed") {
        Envelope tampered = envelope;
        tampered.mutable_header()->set_message_number(1);
        auto result = pair.bob_session->Decrypt(tampered);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == ProtocolFailureType::AuthenticationFailed);
    }

    SECTION("Truncated ciphertext") {
        Envelope tampered = envelope;
        tampered.set_ciphertext(tampered.ciphertext().substr(0, 8));
        auto result = pair.bob_session->Decrypt(tampered);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == ProtocolFailureType::InvalidInput);
    }

    SECTION("All-zero ratchet key") {
        Envelope tampered = envelope;
        tampered.mutable_header()->set_ratchet_public_key(std::string(kX25519PublicKeyBytes, '\0'));
        auto result = pair.bob_session->Decrypt(tampered);
        REQUIRE(result.IsErr());
    }

    REQUIRE(handler->failures.size() == 1);
    REQUIRE(handler->last_peer == pair.alice.did);
    REQUIRE(pair.bob_session->ReceiveMessageNumber() == 0);
    REQUIRE(pair.bob_session->SkippedKeyCount() == 0);
    REQUIRE_FALSE(pair.bob_session->CanSend());
    REQUIRE(DecryptText(*pair.bob_session, envelope) == "intact");
}

TEST_CASE("RatchetSession - Forward skip limit", "[ratchet]") {
    const SessionConfig narrow(1000, 10, 16, std::chrono::minutes(5));
    auto pair = CreateSessionPair(narrow);
    const auto envelopes = SendMany(*pair.alice_session, 12, "s");

    auto too_far = pair.bob_session->Decrypt(envelopes[11]);
    REQUIRE(too_far.IsErr());
    REQUIRE(too_far.UnwrapErr().type == ProtocolFailureType::InvalidInput);
    REQUIRE(pair.bob_session->SkippedKeyCount() == 0);

    REQUIRE(DecryptText(*pair.bob_session, envelopes[10]) == "s10");
    REQUIRE(pair.bob_session->SkippedKeyCount() == 10);
    REQUIRE(DecryptText(*pair.bob_session, envelopes[11]) == "s11");
}

TEST_CASE("RatchetSession - Late message on a retired chain", "[ratchet]") {
    const SessionConfig tiny(1, 100, 16, std::chrono::minutes(5));
    auto pair = CreateSessionPair(tiny);
    const auto first_chain = SendMany(*pair.alice_session, 3, "old");
    REQUIRE(DecryptText(*pair.bob_session, first_chain[0]) == "old0");

    REQUIRE(DecryptText(*pair.alice_session, EncryptText(*pair.bob_session, "reply")) == "reply");
    REQUIRE(DecryptText(*pair.bob_session, EncryptText(*pair.alice_session, "fresh")) == "fresh");

    auto evicted = pair.bob_session->Decrypt(first_chain[1]);
    REQUIRE(evicted.IsErr());
    REQUIRE(evicted.UnwrapErr().type == ProtocolFailureType::MessageKeyUnavailable);
    REQUIRE(DecryptText(*pair.bob_session, first_chain[2]) == "old2");
}

TEST_CASE("RatchetSession - Chain older than the retired-key window", "[ratchet]") {
    // One skipped key and one remembered retired ratchet key.
    const SessionConfig narrow(1, 100, 1, std::chrono::minutes(5));
    auto pair = CreateSessionPair(narrow);
    const auto first_chain = SendMany(*pair.alice_session, 3, "old");
    REQUIRE(DecryptText(*pair.bob_session, first_chain[0]) == "old0");

    REQUIRE(DecryptText(*pair.alice_session, EncryptText(*pair.bob_session, "reply")) == "reply");
    REQUIRE(DecryptText(*pair.bob_session, EncryptText(*pair.alice_session, "second chain")) == "second chain");
    REQUIRE(DecryptText(*pair.alice_session, EncryptText(*pair.bob_session, "reply 2")) == "reply 2");
    REQUIRE(DecryptText(*pair.bob_session, EncryptText(*pair.alice_session, "third chain")) == "third chain");
    REQUIRE(pair.bob_session->SkippedKeyCount() == 1);
    const auto receive_number = pair.bob_session->ReceiveMessageNumber();

    // Its key was evicted from the cache and its ratchet key is no longer
    // remembered, so it is taken for a new ratchet step that cannot authenticate.
    auto aged_out = pair.bob_session->Decrypt(first_chain[1]);
    REQUIRE(aged_out.IsErr());
    REQUIRE(aged_out.UnwrapErr().type == ProtocolFailureType::AuthenticationFailed);

    REQUIRE(pair.bob_session->SkippedKeyCount() == 1);
    REQUIRE(pair.bob_session->ReceiveMessageNumber() == receive_number);
    REQUIRE(DecryptText(*pair.bob_session, first_chain[2]) == "old2");
    REQUIRE(DecryptText(*pair.bob_session, EncryptText(*pair.alice_session, "still going")) == "still going");
}

TEST_CASE("RatchetSession - Used receive keys are not retained", "[ratchet]") {
    auto pair = CreateSessionPair();
    const auto envelopes = SendMany(*pair.alice_session, 2, "fs");
    REQUIRE(DecryptText(*pair.bob_session, envelopes[0]) == "fs0");

    auto before = pair.bob_session->ExportState();
    REQUIRE(before.IsOk());
    const std::string chain_key_before = before.Unwrap().chain_key_receive();
    REQUIRE(chain_key_before.size() == kChainKeyBytes);

    REQUIRE(DecryptText(*pair.bob_session, envelopes[1]) == "fs1");
    auto after = pair.bob_session->ExportState();
    REQUIRE(after.IsOk());
    const auto& state = after.Unwrap();

    REQUIRE(state.chain_key_receive().size() == kChainKeyBytes);
    REQUIRE(state.chain_key_receive() != chain_key_before);
    REQUIRE(state.message_number_receive() == 2);
    for (int i = 0; i < state.skipped_message_keys_size(); ++i) {
        const auto& entry = state.skipped_message_keys(i);
        REQUIRE_FALSE((entry.ratchet_public_key() == envelopes[1].header().ratchet_public_key() &&
                       entry.message_number() == envelopes[1].header().message_number()));
    }
    REQUIRE(state.skipped_message_keys_size() == 0);
}

TEST_CASE("RatchetSession - Event handler reports ratchet steps", "[ratchet]") {
    auto pair = CreateSessionPair();
    auto handler = std::make_shared<RecordingEventHandler>();
    pair.alice_session->SetEventHandler(handler);

    REQUIRE(DecryptText(*pair.bob_session, EncryptText(*pair.alice_session, "one")) == "one");
    REQUIRE(DecryptText(*pair.alice_session, EncryptText(*pair.bob_session, "two")) == "two");
    REQUIRE(DecryptText(*pair.alice_session, EncryptText(*pair.bob_session, "three")) == "three");

    REQUIRE(handler->ratchet_steps == 1);
    REQUIRE(handler->last_peer == pair.bob.did);
    REQUIRE(handler->failures.empty());

    pair.alice_session->SetEventHandler(nullptr);
    REQUIRE(DecryptText(*pair.alice_session, EncryptText(*pair.bob_session, "four")) == "four");
    REQUIRE(handler->ratchet_steps == 1);
}

TEST_CASE("RatchetSession - Initialization rejects bad input", "[ratchet]") {
    auto bob = CreateParty();
    auto alice = CreateParty();
    auto bundle = bob.coordinator->PublishBundle();
    REQUIRE(bundle.IsOk());

    SECTION("Empty peer id") {
        auto handshake = alice.coordinator->ConsumeBundle(bundle.Unwrap());
        REQUIRE(handshake.IsOk());
        auto session = RatchetSession::InitializeAsInitiator("", std::move(handshake).Unwrap().seed);
        REQUIRE(session.IsErr());
        REQUIRE(session.UnwrapErr().type == ProtocolFailureType::InvalidInput);
    }

    SECTION("Zero bound in config") {
        auto handshake = alice.coordinator->ConsumeBundle(bundle.Unwrap());
        REQUIRE(handshake.IsOk());
        const SessionConfig broken(0, 10, 16, std::chrono::minutes(5));
        auto session = RatchetSession::InitializeAsInitiator(
            bob.did, std::move(handshake).Unwrap().seed, broken);
        REQUIRE(session.IsErr());
        REQUIRE(session.UnwrapErr().type == ProtocolFailureType::InvalidInput);
    }
}
