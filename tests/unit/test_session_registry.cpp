#include <catch2/catch_test_macros.hpp>
#include "tessera/protocol/session_registry.hpp"
#include "helpers/session_fixture.hpp"
#include <algorithm>
#include <atomic>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

using namespace tessera::protocol;
using namespace tessera::protocol::test_helpers;

TEST_CASE("SessionRegistry - Add, find and remove", "[registry]") {
    auto pair = CreateSessionPair();
    SessionRegistry registry;
    REQUIRE(registry.Size() == 0);

    REQUIRE(registry.Add(std::move(pair.alice_session)).IsOk());
    REQUIRE(registry.Contains(pair.bob.did));
    REQUIRE(registry.Size() == 1);
    REQUIRE(registry.PeerIds() == std::vector<std::string>{pair.bob.did});

    auto found = registry.Find(pair.bob.did);
    REQUIRE(found != nullptr);
    REQUIRE(found->PeerId() == pair.bob.did);
    REQUIRE(registry.Find(pair.alice.did) == nullptr);

    REQUIRE(registry.Remove(pair.bob.did));
    REQUIRE_FALSE(registry.Remove(pair.bob.did));
    REQUIRE_FALSE(registry.Contains(pair.bob.did));

    // A handle taken before removal stays usable.
    REQUIRE(DecryptText(*pair.bob_session, EncryptText(*found, "still mine")) == "still mine");
}

TEST_CASE("SessionRegistry - Rejects duplicates and null sessions", "[registry]") {
    auto first = CreateSessionPair();
    SessionRegistry registry;
    REQUIRE(registry.Add(std::move(first.alice_session)).IsOk());

    auto duplicate = RatchetSession::FromState(registry.Find(first.bob.did)->ExportState().Unwrap());
    REQUIRE(duplicate.IsOk());
    auto added = registry.Add(std::move(duplicate).Unwrap());
    REQUIRE(added.IsErr());
    REQUIRE(added.UnwrapErr().type == ProtocolFailureType::InvalidState);
    REQUIRE(added.UnwrapErr().peer_id == first.bob.did);

    auto null_add = registry.Add(nullptr);
    REQUIRE(null_add.IsErr());
    REQUIRE(null_add.UnwrapErr().type == ProtocolFailureType::InvalidInput);
    REQUIRE(registry.Size() == 1);

    registry.Clear();
    REQUIRE(registry.Size() == 0);
}

TEST_CASE("SessionRegistry - Routes traffic by peer id", "[registry]") {
    auto pair = CreateSessionPair();
    SessionRegistry alice_registry;
    SessionRegistry bob_registry;
    REQUIRE(alice_registry.Add(std::move(pair.alice_session)).IsOk());
    REQUIRE(bob_registry.Add(std::move(pair.bob_session)).IsOk());

    auto envelope = alice_registry.Encrypt(pair.bob.did, Bytes("routed"));
    REQUIRE(envelope.IsOk());
    auto plaintext = bob_registry.Decrypt(pair.alice.did, envelope.Unwrap());
    REQUIRE(plaintext.IsOk());
    REQUIRE(Text(plaintext.Unwrap()) == "routed");

    auto unknown = alice_registry.Encrypt("did:key:z6MkNobody", Bytes("lost"));
    REQUIRE(unknown.IsErr());
    REQUIRE(unknown.UnwrapErr().type == ProtocolFailureType::InvalidState);
    REQUIRE(unknown.UnwrapErr().peer_id == "did:key:z6MkNobody");

    auto wrong_peer = bob_registry.Decrypt(pair.bob.did, envelope.Unwrap());
    REQUIRE(wrong_peer.IsErr());
}

TEST_CASE("SessionRegistry - Parallel traffic to different peers", "[registry][concurrency]") {
    constexpr int kPeers = 4;
    constexpr int kMessagesPerPeer = 50;

    std::vector<SessionPair> pairs;
    SessionRegistry registry;
    for (int i = 0; i < kPeers; ++i) {
        pairs.push_back(CreateSessionPair());
        REQUIRE(registry.Add(std::move(pairs.back().alice_session)).IsOk());
    }

    std::atomic<int> delivered{0};
    std::atomic<int> failures{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < kPeers; ++i) {
        threads.emplace_back([&, i] {
            auto& pair = pairs[i];
            for (int n = 0; n < kMessagesPerPeer; ++n) {
                const std::string text = "peer " + std::to_string(i) + " message " + std::to_string(n);
                auto envelope = registry.Encrypt(pair.bob.did, Bytes(text));
                if (envelope.IsErr()) {
                    failures++;
                    continue;
                }
                auto plaintext = pair.bob_session->Decrypt(envelope.Unwrap());
                if (plaintext.IsOk() && Text(plaintext.Unwrap()) == text) {
                    delivered++;
                } else {
                    failures++;
                }
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    REQUIRE(failures.load() == 0);
    REQUIRE(delivered.load() == kPeers * kMessagesPerPeer);
    for (const auto& pair : pairs) {
        REQUIRE(registry.Find(pair.bob.did)->SendMessageNumber() == kMessagesPerPeer);
    }
}

TEST_CASE("SessionRegistry - Concurrent encrypts on one session stay ordered", "[registry][concurrency]") {
    constexpr int kThreads = 4;
    constexpr int kMessagesPerThread = 25;
    auto pair = CreateSessionPair();
    SessionRegistry registry;
    REQUIRE(registry.Add(std::move(pair.alice_session)).IsOk());

    std::mutex collected_lock;
    std::vector<uint64_t> numbers;
    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&] {
            for (int n = 0; n < kMessagesPerThread; ++n) {
                auto envelope = registry.Encrypt(pair.bob.did, Bytes("x"));
                if (envelope.IsOk()) {
                    std::lock_guard<std::mutex> guard(collected_lock);
                    numbers.push_back(envelope.Unwrap().header().message_number());
                }
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    REQUIRE(numbers.size() == static_cast<size_t>(kThreads * kMessagesPerThread));
    std::sort(numbers.begin(), numbers.end());
    for (size_t i = 0; i < numbers.size(); ++i) {
        REQUIRE(numbers[i] == i);
    }
}
