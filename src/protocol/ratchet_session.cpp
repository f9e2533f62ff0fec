#include "tessera/protocol/ratchet_session.hpp"
#include "tessera/protocol/constants.hpp"
#include "tessera/crypto/aes_gcm.hpp"
#include "tessera/crypto/hkdf.hpp"
#include "tessera/crypto/sodium_interop.hpp"
#include "tessera/security/dh_validator.hpp"
#include "tessera/core/constants.hpp"
#include "tessera/core/format.hpp"
#include "tessera/debug/key_logger.hpp"
#include "tessera/debug/log.hpp"
#include <google/protobuf/io/coded_stream.h>
#include <google/protobuf/io/zero_copy_stream_impl_lite.h>
#include <sodium.h>
#include <array>
#include <chrono>
#include <limits>
#include <tuple>

namespace tessera::protocol {

using crypto::AesGcm;
using crypto::Hkdf;
using crypto::SodiumInterop;
using debug::Log;
using security::DhValidator;

namespace {
    constexpr std::string_view kLogTag = "RATCHET";
    constexpr size_t kAssociatedDataBytes = kEd25519PublicKeyBytes * 2;
    constexpr size_t kMessageCipherKeyMaterialBytes = kAesKeyBytes + kAesGcmNonceBytes;

    std::span<const uint8_t> AsBytes(const std::string& text) {
        return {reinterpret_cast<const uint8_t*>(text.data()), text.size()};
    }

    void WipeBytes(std::vector<uint8_t>& bytes) {
        if (!bytes.empty()) {
            auto _wipe = SodiumInterop::SecureWipe(std::span<uint8_t>(bytes));
            (void) _wipe;
        }
    }

    void WipeString(std::string* text) {
        if (text != nullptr && !text->empty()) {
            auto _wipe = SodiumInterop::SecureWipe(
                std::span<uint8_t>(reinterpret_cast<uint8_t*>(text->data()), text->size()));
            (void) _wipe;
        }
    }

    void WipeStateSecrets(proto::protocol::RatchetState& state) {
        WipeString(state.mutable_dh_send()->mutable_private_key());
        WipeString(state.mutable_root_key());
        WipeString(state.mutable_chain_key_send());
        WipeString(state.mutable_chain_key_receive());
        for (auto& skipped : *state.mutable_skipped_message_keys()) {
            WipeString(skipped.mutable_message_key());
        }
    }

    debug::Role RoleOf(const proto::protocol::RatchetState& state) {
        return state.is_initiator() ? debug::Role::Initiator : debug::Role::Responder;
    }

    Result<std::vector<uint8_t>, ProtocolFailure> SerializeDeterministic(
        const google::protobuf::Message& message) {
        std::string output;
        google::protobuf::io::StringOutputStream stream(&output);
        google::protobuf::io::CodedOutputStream coded_out(&stream);
        coded_out.SetSerializationDeterministic(true);
        if (!message.SerializeToCodedStream(&coded_out) || coded_out.HadError()) {
            return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
                ProtocolFailure::Encode("Failed to serialize protobuf deterministically"));
        }
        coded_out.Trim();
        return Result<std::vector<uint8_t>, ProtocolFailure>::Ok(
            std::vector<uint8_t>(output.begin(), output.end()));
    }

    struct ChainStep {
        std::vector<uint8_t> message_key;
        std::vector<uint8_t> next_chain_key;
    };

    /// mk = HMAC(ck, 0x01), ck' = HMAC(ck, 0x02)
    Result<ChainStep, ProtocolFailure> KdfChain(std::span<const uint8_t> chain_key) {
        if (chain_key.size() != kChainKeyBytes) {
            return Result<ChainStep, ProtocolFailure>::Err(
                ProtocolFailure::InvalidState("Chain key not initialized"));
        }
        constexpr std::array<uint8_t, 1> message_tag{kMessageKeyConstant};
        constexpr std::array<uint8_t, 1> chain_tag{kChainKeyConstant};
        auto message_key_result = SodiumInterop::HmacSha256(chain_key, message_tag);
        if (message_key_result.IsErr()) {
            return Result<ChainStep, ProtocolFailure>::Err(message_key_result.UnwrapErr());
        }
        auto next_chain_key_result = SodiumInterop::HmacSha256(chain_key, chain_tag);
        if (next_chain_key_result.IsErr()) {
            WipeBytes(message_key_result.Unwrap());
            return Result<ChainStep, ProtocolFailure>::Err(next_chain_key_result.UnwrapErr());
        }
        return Result<ChainStep, ProtocolFailure>::Ok(ChainStep{
            std::move(message_key_result).Unwrap(),
            std::move(next_chain_key_result).Unwrap()});
    }

    struct RootStep {
        std::vector<uint8_t> root_key;
        std::vector<uint8_t> chain_key;
    };

    /// (rk', ck) = HKDF(ikm = dh, salt = rk, info = "Tessera-DH-Ratchet")
    Result<RootStep, ProtocolFailure> KdfRoot(
        std::span<const uint8_t> root_key,
        std::span<const uint8_t> dh_output) {
        if (root_key.size() != kRootKeyBytes) {
            return Result<RootStep, ProtocolFailure>::Err(
                ProtocolFailure::InvalidState("Root key not initialized"));
        }
        auto derived_result = Hkdf::DeriveKeyBytes(
            dh_output, kRootKeyBytes + kChainKeyBytes, root_key, kDhRatchetInfo);
        if (derived_result.IsErr()) {
            return Result<RootStep, ProtocolFailure>::Err(derived_result.UnwrapErr());
        }
        auto derived = std::move(derived_result).Unwrap();
        RootStep step{
            std::vector<uint8_t>(derived.begin(), derived.begin() + kRootKeyBytes),
            std::vector<uint8_t>(derived.begin() + kRootKeyBytes, derived.end())};
        WipeBytes(derived);
        return Result<RootStep, ProtocolFailure>::Ok(std::move(step));
    }

    Result<std::vector<uint8_t>, ProtocolFailure> ComputeDh(
        std::span<const uint8_t> private_key,
        std::span<const uint8_t> public_key,
        std::string_view label) {
        if (private_key.size() != kX25519PrivateKeyBytes ||
            public_key.size() != kX25519PublicKeyBytes) {
            return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
                ProtocolFailure::InvalidInput("Invalid X25519 key sizes"));
        }
        std::vector<uint8_t> shared(kX25519SharedSecretBytes);
        if (crypto_scalarmult(shared.data(), private_key.data(), public_key.data()) != 0) {
            return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
                ProtocolFailure::Handshake(compat::format("X25519 DH failed for {}", label)));
        }
        return Result<std::vector<uint8_t>, ProtocolFailure>::Ok(std::move(shared));
    }

    struct RatchetKeyPair {
        std::vector<uint8_t> private_key;
        std::vector<uint8_t> public_key;
    };

    Result<RatchetKeyPair, ProtocolFailure> GenerateRatchetKeyPair() {
        auto keypair_result = SodiumInterop::GenerateX25519KeyPair("ratchet");
        if (keypair_result.IsErr()) {
            return Result<RatchetKeyPair, ProtocolFailure>::Err(keypair_result.UnwrapErr());
        }
        auto [private_handle, public_key] = std::move(keypair_result).Unwrap();
        auto private_result = private_handle.ReadBytes(kX25519PrivateKeyBytes);
        if (private_result.IsErr()) {
            return Result<RatchetKeyPair, ProtocolFailure>::Err(
                ProtocolFailure::FromSodiumFailure(private_result.UnwrapErr()));
        }
        return Result<RatchetKeyPair, ProtocolFailure>::Ok(RatchetKeyPair{
            std::move(private_result).Unwrap(),
            std::move(public_key)});
    }

    /// AEAD associated data: AD || deterministic header bytes
    Result<std::vector<uint8_t>, ProtocolFailure> BuildAssociatedData(
        const std::string& associated_data,
        const proto::protocol::MessageHeader& header) {
        auto header_result = SerializeDeterministic(header);
        if (header_result.IsErr()) {
            return header_result;
        }
        const auto& header_bytes = header_result.Unwrap();
        std::vector<uint8_t> aad;
        aad.reserve(associated_data.size() + header_bytes.size());
        aad.insert(aad.end(), associated_data.begin(), associated_data.end());
        aad.insert(aad.end(), header_bytes.begin(), header_bytes.end());
        return Result<std::vector<uint8_t>, ProtocolFailure>::Ok(std::move(aad));
    }

    /// AES key and GCM nonce, both derived from the single-use message key
    Result<std::vector<uint8_t>, ProtocolFailure> DeriveMessageCipherKeys(
        std::span<const uint8_t> message_key) {
        return Hkdf::DeriveKeyBytes(message_key, kMessageCipherKeyMaterialBytes, {}, kMessageKeysInfo);
    }

    Result<std::vector<uint8_t>, ProtocolFailure> ComputeStateHmac(
        const proto::protocol::RatchetState& state) {
        auto mac_key_result = Hkdf::DeriveKeyBytes(AsBytes(state.root_key()), kHmacBytes, {}, kStateHmacInfo);
        if (mac_key_result.IsErr()) {
            return mac_key_result;
        }
        auto mac_key = std::move(mac_key_result).Unwrap();

        auto mac_state = state;
        mac_state.clear_state_hmac();
        auto serialized_result = SerializeDeterministic(mac_state);
        WipeStateSecrets(mac_state);
        if (serialized_result.IsErr()) {
            WipeBytes(mac_key);
            return serialized_result;
        }
        auto serialized = std::move(serialized_result).Unwrap();
        auto mac_result = SodiumInterop::HmacSha256(mac_key, serialized);
        WipeBytes(serialized);
        WipeBytes(mac_key);
        return mac_result;
    }

    std::string ToString(std::span<const uint8_t> bytes) {
        return {reinterpret_cast<const char*>(bytes.data()), bytes.size()};
    }

    Result<Unit, ProtocolFailure> ValidateOptionalKey(
        const std::string& key, size_t expected, std::string_view name) {
        if (!key.empty() && key.size() != expected) {
            return Result<Unit, ProtocolFailure>::Err(
                ProtocolFailure::InvalidInput(
                    compat::format("{} must be empty or {} bytes, got {}", name, expected, key.size())));
        }
        return Result<Unit, ProtocolFailure>::Ok(unit);
    }
}

RatchetSession::RatchetSession(
    std::string peer_id,
    SessionConfig config,
    proto::protocol::RatchetState state,
    SkippedMessageKeyCache skipped)
    : peer_id_(std::move(peer_id))
    , config_(config)
    , state_(std::move(state))
    , skipped_(std::move(skipped)) {}

RatchetSession::~RatchetSession() {
    WipeStateSecrets(state_);
}

// ============================================================================
// Construction
// ============================================================================

Result<std::unique_ptr<RatchetSession>, ProtocolFailure> RatchetSession::InitializeAsInitiator(
    std::string peer_id,
    SessionSeed seed,
    const SessionConfig& config) {
    using SessionResult = Result<std::unique_ptr<RatchetSession>, ProtocolFailure>;
    if (!config.IsValid()) {
        return SessionResult::Err(ProtocolFailure::InvalidInput("Session config has a zero bound"));
    }
    if (peer_id.empty()) {
        return SessionResult::Err(ProtocolFailure::InvalidInput("Peer id must not be empty"));
    }
    if (seed.associated_data.size() != kAssociatedDataBytes) {
        return SessionResult::Err(ProtocolFailure::InvalidInput("Associated data must be two identity keys"));
    }
    if (auto dh_check = DhValidator::ValidateX25519PublicKey(seed.remote_ratchet_public_key); dh_check.IsErr()) {
        return SessionResult::Err(dh_check.UnwrapErr());
    }
    auto shared_secret_result = seed.shared_secret.ReadBytes(kSharedSecretBytes);
    if (shared_secret_result.IsErr()) {
        return SessionResult::Err(ProtocolFailure::FromSodiumFailure(shared_secret_result.UnwrapErr()));
    }
    auto shared_secret = std::move(shared_secret_result).Unwrap();

    auto keypair_result = GenerateRatchetKeyPair();
    if (keypair_result.IsErr()) {
        WipeBytes(shared_secret);
        return SessionResult::Err(keypair_result.UnwrapErr());
    }
    auto keypair = std::move(keypair_result).Unwrap();

    auto dh_result = ComputeDh(keypair.private_key, seed.remote_ratchet_public_key, "initial sending ratchet");
    if (dh_result.IsErr()) {
        WipeBytes(shared_secret);
        WipeBytes(keypair.private_key);
        return SessionResult::Err(dh_result.UnwrapErr());
    }
    auto dh_output = std::move(dh_result).Unwrap();
    auto root_step_result = KdfRoot(shared_secret, dh_output);
    WipeBytes(dh_output);
    WipeBytes(shared_secret);
    if (root_step_result.IsErr()) {
        WipeBytes(keypair.private_key);
        return SessionResult::Err(root_step_result.UnwrapErr());
    }
    auto root_step = std::move(root_step_result).Unwrap();

    proto::protocol::RatchetState state;
    state.set_version(kProtocolVersion);
    state.set_peer_id(peer_id);
    state.set_is_initiator(true);
    state.mutable_dh_send()->set_private_key(ToString(keypair.private_key));
    state.mutable_dh_send()->set_public_key(ToString(keypair.public_key));
    state.set_dh_receive(ToString(seed.remote_ratchet_public_key));
    state.set_root_key(ToString(root_step.root_key));
    state.set_chain_key_send(ToString(root_step.chain_key));
    state.set_associated_data(ToString(seed.associated_data));

    debug::LogDhRatchet(debug::Role::Initiator, root_step.root_key, keypair.public_key, seed.remote_ratchet_public_key);
    WipeBytes(keypair.private_key);
    WipeBytes(root_step.root_key);
    WipeBytes(root_step.chain_key);

    Log::Debug(kLogTag, "Initialized initiator session with {}", peer_id);
    return SessionResult::Ok(std::unique_ptr<RatchetSession>(new RatchetSession(
        std::move(peer_id), config, std::move(state), SkippedMessageKeyCache(config.GetMaxSkippedKeys()))));
}

Result<std::unique_ptr<RatchetSession>, ProtocolFailure> RatchetSession::InitializeAsResponder(
    std::string peer_id,
    SessionSeed seed,
    const SessionConfig& config) {
    using SessionResult = Result<std::unique_ptr<RatchetSession>, ProtocolFailure>;
    if (!config.IsValid()) {
        return SessionResult::Err(ProtocolFailure::InvalidInput("Session config has a zero bound"));
    }
    if (peer_id.empty()) {
        return SessionResult::Err(ProtocolFailure::InvalidInput("Peer id must not be empty"));
    }
    if (seed.associated_data.size() != kAssociatedDataBytes) {
        return SessionResult::Err(ProtocolFailure::InvalidInput("Associated data must be two identity keys"));
    }
    if (seed.local_ratchet_public_key.size() != kX25519PublicKeyBytes) {
        return SessionResult::Err(ProtocolFailure::InvalidInput("Responder seed has no local ratchet key pair"));
    }
    auto shared_secret_result = seed.shared_secret.ReadBytes(kSharedSecretBytes);
    if (shared_secret_result.IsErr()) {
        return SessionResult::Err(ProtocolFailure::FromSodiumFailure(shared_secret_result.UnwrapErr()));
    }
    auto shared_secret = std::move(shared_secret_result).Unwrap();
    auto ratchet_private_result = seed.local_ratchet_private_key.ReadBytes(kX25519PrivateKeyBytes);
    if (ratchet_private_result.IsErr()) {
        WipeBytes(shared_secret);
        return SessionResult::Err(ProtocolFailure::FromSodiumFailure(ratchet_private_result.UnwrapErr()));
    }
    auto ratchet_private = std::move(ratchet_private_result).Unwrap();

    proto::protocol::RatchetState state;
    state.set_version(kProtocolVersion);
    state.set_peer_id(peer_id);
    state.set_is_initiator(false);
    state.mutable_dh_send()->set_private_key(ToString(ratchet_private));
    state.mutable_dh_send()->set_public_key(ToString(seed.local_ratchet_public_key));
    state.set_root_key(ToString(shared_secret));
    state.set_associated_data(ToString(seed.associated_data));
    WipeBytes(ratchet_private);
    WipeBytes(shared_secret);

    Log::Debug(kLogTag, "Initialized responder session with {}", peer_id);
    return SessionResult::Ok(std::unique_ptr<RatchetSession>(new RatchetSession(
        std::move(peer_id), config, std::move(state), SkippedMessageKeyCache(config.GetMaxSkippedKeys()))));
}

// ============================================================================
// Persistence
// ============================================================================

Result<proto::protocol::RatchetState, ProtocolFailure> RatchetSession::ExportState() const {
    using StateResult = Result<proto::protocol::RatchetState, ProtocolFailure>;
    std::lock_guard<std::mutex> guard(lock_);
    proto::protocol::RatchetState exported = state_;
    skipped_.ExportTo(exported);
    exported.clear_state_hmac();
    auto mac_result = ComputeStateHmac(exported);
    if (mac_result.IsErr()) {
        WipeStateSecrets(exported);
        return StateResult::Err(mac_result.UnwrapErr());
    }
    exported.set_state_hmac(ToString(mac_result.Unwrap()));
    return StateResult::Ok(std::move(exported));
}

Result<std::unique_ptr<RatchetSession>, ProtocolFailure> RatchetSession::FromState(
    const proto::protocol::RatchetState& state,
    const SessionConfig& config) {
    using SessionResult = Result<std::unique_ptr<RatchetSession>, ProtocolFailure>;
    if (!config.IsValid()) {
        return SessionResult::Err(ProtocolFailure::InvalidInput("Session config has a zero bound"));
    }
    if (state.version() != kProtocolVersion) {
        return SessionResult::Err(ProtocolFailure::InvalidInput(
            compat::format("Unsupported ratchet state version {}", state.version())));
    }
    if (state.peer_id().empty()) {
        return SessionResult::Err(ProtocolFailure::InvalidInput("Ratchet state has no peer id"));
    }
    if (state.root_key().size() != kRootKeyBytes) {
        return SessionResult::Err(ProtocolFailure::InvalidInput("Invalid root key size"));
    }
    if (state.dh_send().private_key().size() != kX25519PrivateKeyBytes ||
        state.dh_send().public_key().size() != kX25519PublicKeyBytes) {
        return SessionResult::Err(ProtocolFailure::InvalidInput("Invalid sending ratchet key pair"));
    }
    for (const auto& [key, expected, name] : {
             std::tuple{&state.dh_receive(), kX25519PublicKeyBytes, "Receiving ratchet key"},
             std::tuple{&state.chain_key_send(), kChainKeyBytes, "Sending chain key"},
             std::tuple{&state.chain_key_receive(), kChainKeyBytes, "Receiving chain key"}}) {
        if (auto size_check = ValidateOptionalKey(*key, expected, name); size_check.IsErr()) {
            return SessionResult::Err(size_check.UnwrapErr());
        }
    }
    if (!state.dh_receive().empty()) {
        if (auto dh_check = DhValidator::ValidateX25519PublicKey(AsBytes(state.dh_receive())); dh_check.IsErr()) {
            return SessionResult::Err(dh_check.UnwrapErr());
        }
    }
    std::vector<uint8_t> derived_public(kX25519PublicKeyBytes);
    if (crypto_scalarmult_base(derived_public.data(),
            reinterpret_cast<const uint8_t*>(state.dh_send().private_key().data())) != 0 ||
        ToString(derived_public) != state.dh_send().public_key()) {
        return SessionResult::Err(ProtocolFailure::InvalidInput("Sending ratchet key pair does not match"));
    }
    if (state.chain_key_receive().size() == kChainKeyBytes && state.dh_receive().empty()) {
        return SessionResult::Err(ProtocolFailure::InvalidInput("Receiving chain without a remote ratchet key"));
    }
    if (state.chain_key_send().empty() && state.message_number_send() != 0) {
        return SessionResult::Err(ProtocolFailure::InvalidInput("Send counter set without a sending chain"));
    }
    if (state.chain_key_receive().empty() && state.message_number_receive() != 0) {
        return SessionResult::Err(ProtocolFailure::InvalidInput("Receive counter set without a receiving chain"));
    }
    if (state.associated_data().size() != kAssociatedDataBytes) {
        return SessionResult::Err(ProtocolFailure::InvalidInput("Invalid associated data size"));
    }
    for (const auto& previous : state.previous_remote_ratchet_keys()) {
        if (previous.size() != kX25519PublicKeyBytes) {
            return SessionResult::Err(ProtocolFailure::InvalidInput("Invalid retired ratchet key size"));
        }
    }
    if (state.state_hmac().size() != kHmacBytes) {
        return SessionResult::Err(ProtocolFailure::InvalidInput("Missing or invalid state HMAC"));
    }

    auto expected_result = ComputeStateHmac(state);
    if (expected_result.IsErr()) {
        return SessionResult::Err(expected_result.UnwrapErr());
    }
    auto expected_mac = std::move(expected_result).Unwrap();
    const bool mac_ok = sodium_memcmp(expected_mac.data(), state.state_hmac().data(), kHmacBytes) == 0;
    WipeBytes(expected_mac);
    if (!mac_ok) {
        Log::Warn(kLogTag, "Rejected stored state for {}: HMAC mismatch", state.peer_id());
        return SessionResult::Err(ProtocolFailure::InvalidInput(std::string(ErrorMessages::STATE_HMAC_FAILED)));
    }

    auto skipped_result = SkippedMessageKeyCache::ImportFrom(state, config.GetMaxSkippedKeys());
    if (skipped_result.IsErr()) {
        return SessionResult::Err(skipped_result.UnwrapErr());
    }

    proto::protocol::RatchetState restored = state;
    restored.clear_skipped_message_keys();
    restored.clear_state_hmac();
    auto* previous = restored.mutable_previous_remote_ratchet_keys();
    if (static_cast<size_t>(previous->size()) > config.GetMaxPreviousRatchetKeys()) {
        previous->DeleteSubrange(0, previous->size() - static_cast<int>(config.GetMaxPreviousRatchetKeys()));
    }

    std::string peer_id = restored.peer_id();
    return SessionResult::Ok(std::unique_ptr<RatchetSession>(new RatchetSession(
        std::move(peer_id), config, std::move(restored), std::move(skipped_result).Unwrap())));
}

// ============================================================================
// Sending
// ============================================================================

Result<proto::protocol::MessageEnvelope, ProtocolFailure> RatchetSession::Encrypt(
    std::span<const uint8_t> plaintext) {
    using EnvelopeResult = Result<proto::protocol::MessageEnvelope, ProtocolFailure>;
    std::lock_guard<std::mutex> guard(lock_);
    const uint64_t message_number = state_.message_number_send();
    if (state_.chain_key_send().size() != kChainKeyBytes) {
        return EnvelopeResult::Err(Contextualize(
            ProtocolFailure::InvalidState(std::string(ErrorMessages::SEND_CHAIN_NOT_READY)), message_number));
    }
    if (message_number == std::numeric_limits<uint64_t>::max()) {
        return EnvelopeResult::Err(Contextualize(
            ProtocolFailure::InvalidState("Sending chain exhausted"), message_number));
    }

    auto step_result = KdfChain(AsBytes(state_.chain_key_send()));
    if (step_result.IsErr()) {
        return EnvelopeResult::Err(Contextualize(step_result.UnwrapErr(), message_number));
    }
    auto step = std::move(step_result).Unwrap();

    proto::protocol::MessageEnvelope envelope;
    auto* header = envelope.mutable_header();
    header->set_ratchet_public_key(state_.dh_send().public_key());
    header->set_previous_chain_length(state_.previous_chain_length());
    header->set_message_number(message_number);

    auto aad_result = BuildAssociatedData(state_.associated_data(), *header);
    auto cipher_keys_result = DeriveMessageCipherKeys(step.message_key);
    debug::LogMessageKey(RoleOf(state_), "send", message_number, step.message_key);
    WipeBytes(step.message_key);
    if (aad_result.IsErr() || cipher_keys_result.IsErr()) {
        WipeBytes(step.next_chain_key);
        if (cipher_keys_result.IsOk()) {
            WipeBytes(cipher_keys_result.Unwrap());
        }
        return EnvelopeResult::Err(Contextualize(
            aad_result.IsErr() ? aad_result.UnwrapErr() : cipher_keys_result.UnwrapErr(), message_number));
    }
    auto cipher_keys = std::move(cipher_keys_result).Unwrap();
    const std::span<const uint8_t> key_material(cipher_keys);

    auto ciphertext_result = AesGcm::Encrypt(
        key_material.first(kAesKeyBytes),
        key_material.subspan(kAesKeyBytes, kAesGcmNonceBytes),
        plaintext,
        aad_result.Unwrap());
    WipeBytes(cipher_keys);
    if (ciphertext_result.IsErr()) {
        WipeBytes(step.next_chain_key);
        return EnvelopeResult::Err(Contextualize(ciphertext_result.UnwrapErr(), message_number));
    }
    envelope.set_ciphertext(ToString(ciphertext_result.Unwrap()));
    envelope.set_timestamp_ms(std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count());

    WipeString(state_.mutable_chain_key_send());
    state_.set_chain_key_send(ToString(step.next_chain_key));
    state_.set_message_number_send(message_number + 1);
    state_.set_state_counter(state_.state_counter() + 1);
    WipeBytes(step.next_chain_key);
    return EnvelopeResult::Ok(std::move(envelope));
}

// ============================================================================
// Receiving
// ============================================================================

Result<std::vector<uint8_t>, ProtocolFailure> RatchetSession::Decrypt(
    const proto::protocol::MessageEnvelope& envelope) {
    std::shared_ptr<ISessionEventHandler> handler;
    ReceiveOutcome outcome;
    auto result = [&] {
        std::lock_guard<std::mutex> guard(lock_);
        handler = event_handler_;
        return DecryptLocked(envelope, outcome);
    }();

    if (result.IsErr()) {
        Log::Warn(kLogTag, "Decrypt failed: {}", result.UnwrapErr().ToString());
        if (handler) {
            handler->OnDecryptFailed(peer_id_, result.UnwrapErr());
        }
        return result;
    }
    if (outcome.evicted > 0) {
        Log::Info(kLogTag, "Evicted {} skipped message keys for {}", outcome.evicted, peer_id_);
    }
    if (handler) {
        if (outcome.ratchet_stepped) {
            handler->OnRatchetStep(peer_id_);
        }
        if (outcome.evicted > 0) {
            handler->OnSkippedKeysEvicted(peer_id_, outcome.evicted);
        }
    }
    return result;
}

Result<std::vector<uint8_t>, ProtocolFailure> RatchetSession::DecryptLocked(
    const proto::protocol::MessageEnvelope& envelope,
    ReceiveOutcome& outcome) {
    using PlaintextResult = Result<std::vector<uint8_t>, ProtocolFailure>;
    const auto& header = envelope.header();
    const uint64_t message_number = header.message_number();
    if (!envelope.has_header()) {
        return PlaintextResult::Err(Contextualize(
            ProtocolFailure::InvalidInput("Envelope has no header"), message_number));
    }
    const auto remote_public = AsBytes(header.ratchet_public_key());
    if (auto dh_check = DhValidator::ValidateX25519PublicKey(remote_public); dh_check.IsErr()) {
        return PlaintextResult::Err(Contextualize(dh_check.UnwrapErr(), message_number));
    }
    if (envelope.ciphertext().size() < kAesGcmTagBytes) {
        return PlaintextResult::Err(Contextualize(
            ProtocolFailure::InvalidInput("Ciphertext shorter than authentication tag"), message_number));
    }
    if (message_number == std::numeric_limits<uint64_t>::max()) {
        return PlaintextResult::Err(Contextualize(
            ProtocolFailure::InvalidInput("Message number out of range"), message_number));
    }

    auto aad_result = BuildAssociatedData(state_.associated_data(), header);
    if (aad_result.IsErr()) {
        return PlaintextResult::Err(Contextualize(aad_result.UnwrapErr(), message_number));
    }
    const auto aad = std::move(aad_result).Unwrap();

    if (auto cached = skipped_.Peek(remote_public, message_number)) {
        auto plaintext_result = DecryptWithKey(*cached, envelope, aad);
        auto _wipe = SodiumInterop::SecureWipe(std::span<uint8_t>(*cached));
        (void) _wipe;
        if (plaintext_result.IsErr()) {
            return PlaintextResult::Err(Contextualize(plaintext_result.UnwrapErr(), message_number));
        }
        if (auto taken = skipped_.Take(remote_public, message_number)) {
            auto _wipe_taken = SodiumInterop::SecureWipe(std::span<uint8_t>(*taken));
            (void) _wipe_taken;
        }
        state_.set_state_counter(state_.state_counter() + 1);
        return plaintext_result;
    }

    const bool same_chain = header.ratchet_public_key() == state_.dh_receive();
    if (same_chain) {
        if (message_number < state_.message_number_receive()) {
            return PlaintextResult::Err(Contextualize(
                ProtocolFailure::MessageKeyUnavailable(std::string(ErrorMessages::MESSAGE_KEY_UNAVAILABLE)),
                message_number));
        }
        if (state_.chain_key_receive().size() != kChainKeyBytes) {
            return PlaintextResult::Err(Contextualize(
                ProtocolFailure::MessageKeyUnavailable("No receiving chain for this ratchet key"),
                message_number));
        }
    } else {
        for (const auto& retired : state_.previous_remote_ratchet_keys()) {
            if (retired == header.ratchet_public_key()) {
                return PlaintextResult::Err(Contextualize(
                    ProtocolFailure::MessageKeyUnavailable(
                        compat::format("{} (retired ratchet key)", ErrorMessages::MESSAGE_KEY_UNAVAILABLE)),
                    message_number));
            }
        }
    }

    proto::protocol::RatchetState staged = state_;
    SkippedMessageKeyCache staged_skipped = skipped_;
    size_t evicted = 0;
    auto discard = [&](ProtocolFailure failure) {
        WipeStateSecrets(staged);
        return PlaintextResult::Err(Contextualize(std::move(failure), message_number));
    };

    if (!same_chain) {
        if (!staged.dh_receive().empty()) {
            auto skip_result = SkipMessageKeys(staged, staged_skipped, header.previous_chain_length());
            if (skip_result.IsErr()) {
                return discard(skip_result.UnwrapErr());
            }
            evicted += skip_result.Unwrap();
        }
        if (auto step_result = DhRatchetStep(staged, remote_public); step_result.IsErr()) {
            return discard(step_result.UnwrapErr());
        }
    }

    auto skip_result = SkipMessageKeys(staged, staged_skipped, message_number);
    if (skip_result.IsErr()) {
        return discard(skip_result.UnwrapErr());
    }
    evicted += skip_result.Unwrap();

    auto chain_step_result = KdfChain(AsBytes(staged.chain_key_receive()));
    if (chain_step_result.IsErr()) {
        return discard(chain_step_result.UnwrapErr());
    }
    auto chain_step = std::move(chain_step_result).Unwrap();
    WipeString(staged.mutable_chain_key_receive());
    staged.set_chain_key_receive(ToString(chain_step.next_chain_key));
    staged.set_message_number_receive(message_number + 1);
    WipeBytes(chain_step.next_chain_key);

    debug::LogMessageKey(RoleOf(staged), "recv", message_number, chain_step.message_key);
    auto plaintext_result = DecryptWithKey(chain_step.message_key, envelope, aad);
    WipeBytes(chain_step.message_key);
    if (plaintext_result.IsErr()) {
        return discard(plaintext_result.UnwrapErr());
    }

    staged.set_state_counter(staged.state_counter() + 1);
    WipeStateSecrets(state_);
    state_ = std::move(staged);
    skipped_ = std::move(staged_skipped);
    outcome.ratchet_stepped = !same_chain;
    outcome.evicted = evicted;
    return plaintext_result;
}

Result<std::vector<uint8_t>, ProtocolFailure> RatchetSession::DecryptWithKey(
    std::span<const uint8_t> message_key,
    const proto::protocol::MessageEnvelope& envelope,
    std::span<const uint8_t> associated_data) const {
    auto cipher_keys_result = DeriveMessageCipherKeys(message_key);
    if (cipher_keys_result.IsErr()) {
        return cipher_keys_result;
    }
    auto cipher_keys = std::move(cipher_keys_result).Unwrap();
    const std::span<const uint8_t> key_material(cipher_keys);
    auto plaintext_result = AesGcm::Decrypt(
        key_material.first(kAesKeyBytes),
        key_material.subspan(kAesKeyBytes, kAesGcmNonceBytes),
        AsBytes(envelope.ciphertext()),
        associated_data);
    WipeBytes(cipher_keys);
    return plaintext_result;
}

Result<size_t, ProtocolFailure> RatchetSession::SkipMessageKeys(
    proto::protocol::RatchetState& state,
    SkippedMessageKeyCache& skipped,
    const uint64_t until) const {
    const uint64_t next = state.message_number_receive();
    if (until <= next) {
        return Result<size_t, ProtocolFailure>::Ok(size_t{0});
    }
    if (until - next > config_.GetMaxForwardSkip()) {
        return Result<size_t, ProtocolFailure>::Err(
            ProtocolFailure::InvalidInput(
                compat::format("Message gap {} exceeds the forward skip limit {}",
                    until - next, config_.GetMaxForwardSkip())));
    }
    if (state.chain_key_receive().size() != kChainKeyBytes) {
        return Result<size_t, ProtocolFailure>::Err(
            ProtocolFailure::InvalidState("Header skips messages on a chain that was never established"));
    }

    std::vector<uint8_t> chain_key(state.chain_key_receive().begin(), state.chain_key_receive().end());
    const auto ratchet_public = AsBytes(state.dh_receive());
    size_t evicted = 0;
    for (uint64_t message_number = next; message_number < until; ++message_number) {
        auto step_result = KdfChain(chain_key);
        if (step_result.IsErr()) {
            WipeBytes(chain_key);
            return Result<size_t, ProtocolFailure>::Err(step_result.UnwrapErr());
        }
        auto step = std::move(step_result).Unwrap();
        auto insert_result = skipped.Insert(ratchet_public, message_number, step.message_key);
        WipeBytes(step.message_key);
        WipeBytes(chain_key);
        chain_key = std::move(step.next_chain_key);
        if (insert_result.IsErr()) {
            WipeBytes(chain_key);
            return Result<size_t, ProtocolFailure>::Err(insert_result.UnwrapErr());
        }
        evicted += insert_result.Unwrap();
    }

    WipeString(state.mutable_chain_key_receive());
    state.set_chain_key_receive(ToString(chain_key));
    state.set_message_number_receive(until);
    WipeBytes(chain_key);
    return Result<size_t, ProtocolFailure>::Ok(evicted);
}

Result<Unit, ProtocolFailure> RatchetSession::DhRatchetStep(
    proto::protocol::RatchetState& state,
    std::span<const uint8_t> remote_public_key) const {
    auto receive_dh_result = ComputeDh(AsBytes(state.dh_send().private_key()), remote_public_key, "receiving ratchet");
    if (receive_dh_result.IsErr()) {
        return Result<Unit, ProtocolFailure>::Err(receive_dh_result.UnwrapErr());
    }
    auto receive_dh = std::move(receive_dh_result).Unwrap();
    auto receive_step_result = KdfRoot(AsBytes(state.root_key()), receive_dh);
    WipeBytes(receive_dh);
    if (receive_step_result.IsErr()) {
        return Result<Unit, ProtocolFailure>::Err(receive_step_result.UnwrapErr());
    }
    auto receive_step = std::move(receive_step_result).Unwrap();

    auto keypair_result = GenerateRatchetKeyPair();
    if (keypair_result.IsErr()) {
        WipeBytes(receive_step.root_key);
        WipeBytes(receive_step.chain_key);
        return Result<Unit, ProtocolFailure>::Err(keypair_result.UnwrapErr());
    }
    auto keypair = std::move(keypair_result).Unwrap();

    auto send_dh_result = ComputeDh(keypair.private_key, remote_public_key, "sending ratchet");
    if (send_dh_result.IsErr()) {
        WipeBytes(receive_step.root_key);
        WipeBytes(receive_step.chain_key);
        WipeBytes(keypair.private_key);
        return Result<Unit, ProtocolFailure>::Err(send_dh_result.UnwrapErr());
    }
    auto send_dh = std::move(send_dh_result).Unwrap();
    auto send_step_result = KdfRoot(receive_step.root_key, send_dh);
    WipeBytes(send_dh);
    WipeBytes(receive_step.root_key);
    if (send_step_result.IsErr()) {
        WipeBytes(receive_step.chain_key);
        WipeBytes(keypair.private_key);
        return Result<Unit, ProtocolFailure>::Err(send_step_result.UnwrapErr());
    }
    auto send_step = std::move(send_step_result).Unwrap();

    state.set_previous_chain_length(state.message_number_send());
    state.set_message_number_send(0);
    state.set_message_number_receive(0);
    if (!state.dh_receive().empty()) {
        state.add_previous_remote_ratchet_keys(state.dh_receive());
        auto* previous = state.mutable_previous_remote_ratchet_keys();
        const int limit = static_cast<int>(config_.GetMaxPreviousRatchetKeys());
        if (previous->size() > limit) {
            previous->DeleteSubrange(0, previous->size() - limit);
        }
    }
    state.set_dh_receive(ToString(remote_public_key));

    WipeStateSecrets(state);
    state.mutable_dh_send()->set_private_key(ToString(keypair.private_key));
    state.mutable_dh_send()->set_public_key(ToString(keypair.public_key));
    state.set_root_key(ToString(send_step.root_key));
    state.set_chain_key_receive(ToString(receive_step.chain_key));
    state.set_chain_key_send(ToString(send_step.chain_key));

    debug::LogDhRatchet(RoleOf(state), send_step.root_key, keypair.public_key, remote_public_key);
    WipeBytes(keypair.private_key);
    WipeBytes(send_step.root_key);
    WipeBytes(send_step.chain_key);
    WipeBytes(receive_step.chain_key);
    Log::Debug(kLogTag, "DH ratchet step with {}", peer_id_);
    return Result<Unit, ProtocolFailure>::Ok(unit);
}

ProtocolFailure RatchetSession::Contextualize(ProtocolFailure failure, const uint64_t message_number) const {
    return std::move(failure).WithPeer(peer_id_).WithMessageNumber(message_number);
}

// ============================================================================
// Accessors
// ============================================================================

void RatchetSession::SetEventHandler(std::shared_ptr<ISessionEventHandler> handler) {
    std::lock_guard<std::mutex> guard(lock_);
    event_handler_ = std::move(handler);
}

bool RatchetSession::IsInitiator() const {
    std::lock_guard<std::mutex> guard(lock_);
    return state_.is_initiator();
}

bool RatchetSession::CanSend() const {
    std::lock_guard<std::mutex> guard(lock_);
    return state_.chain_key_send().size() == kChainKeyBytes;
}

uint64_t RatchetSession::SendMessageNumber() const {
    std::lock_guard<std::mutex> guard(lock_);
    return state_.message_number_send();
}

uint64_t RatchetSession::ReceiveMessageNumber() const {
    std::lock_guard<std::mutex> guard(lock_);
    return state_.message_number_receive();
}

size_t RatchetSession::SkippedKeyCount() const {
    std::lock_guard<std::mutex> guard(lock_);
    return skipped_.Size();
}

std::vector<uint8_t> RatchetSession::LocalRatchetPublicKey() const {
    std::lock_guard<std::mutex> guard(lock_);
    return {state_.dh_send().public_key().begin(), state_.dh_send().public_key().end()};
}

}
