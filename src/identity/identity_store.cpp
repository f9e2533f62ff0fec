#include "tessera/identity/identity_store.hpp"
#include "tessera/identity/canonical_payload.hpp"
#include "tessera/identity/did.hpp"
#include "tessera/crypto/sodium_interop.hpp"
#include "tessera/security/dh_validator.hpp"
#include "tessera/core/constants.hpp"
#include "tessera/core/format.hpp"
#include "tessera/debug/log.hpp"
#include <google/protobuf/util/json_util.h>
#include <sodium.h>
#include <cmath>
#include <limits>

namespace tessera::protocol::identity {

using crypto::SodiumInterop;
using debug::Log;
using security::DhValidator;

namespace {
    constexpr std::string_view kLogTag = "IDENTITY";
    constexpr std::string_view kProofDidField = "did";
    constexpr std::string_view kProofTimestampField = "timestamp";
    constexpr std::string_view kProofChallengeField = "challenge";

    std::span<const uint8_t> AsBytes(const std::string& text) {
        return {reinterpret_cast<const uint8_t*>(text.data()), text.size()};
    }

    void WipeString(std::string* text) {
        if (text != nullptr && !text->empty()) {
            auto _wipe = SodiumInterop::SecureWipe(
                std::span<uint8_t>(reinterpret_cast<uint8_t*>(text->data()), text->size()));
            (void) _wipe;
        }
    }

    Result<bool, ProtocolFailure> VerifyEd25519(
        std::span<const uint8_t> public_key,
        std::span<const uint8_t> message,
        std::span<const uint8_t> signature) {
        if (public_key.size() != kEd25519PublicKeyBytes || signature.size() != kEd25519SignatureBytes) {
            return Result<bool, ProtocolFailure>::Err(
                ProtocolFailure::InvalidInput(
                    compat::format("Invalid key or signature length ({} / {})",
                        public_key.size(), signature.size())));
        }
        const int rc = crypto_sign_verify_detached(
            signature.data(), message.data(), message.size(), public_key.data());
        return Result<bool, ProtocolFailure>::Ok(rc == SodiumConstants::SUCCESS);
    }

    Result<int64_t, ProtocolFailure> ReadIntegral(const google::protobuf::Value& value, std::string_view field) {
        if (value.kind_case() != google::protobuf::Value::kNumberValue) {
            return Result<int64_t, ProtocolFailure>::Err(
                ProtocolFailure::InvalidInput(compat::format("Proof field '{}' must be a number", field)));
        }
        const double number = value.number_value();
        if (!std::isfinite(number) || std::floor(number) != number ||
            std::fabs(number) > static_cast<double>(std::numeric_limits<int64_t>::max() / 2)) {
            return Result<int64_t, ProtocolFailure>::Err(
                ProtocolFailure::InvalidInput(compat::format("Proof field '{}' must be an integer", field)));
        }
        return Result<int64_t, ProtocolFailure>::Ok(static_cast<int64_t>(number));
    }
}

IdentityStore::IdentityStore(
    std::shared_ptr<IIdentityStorage> storage,
    Clock clock,
    std::chrono::milliseconds challenge_freshness)
    : storage_(std::move(storage))
    , clock_(std::move(clock))
    , challenge_freshness_(challenge_freshness) {
    if (!clock_) {
        clock_ = [] { return std::chrono::system_clock::now(); };
    }
}

Result<std::unique_ptr<IdentityStore>, ProtocolFailure> IdentityStore::Open(
    std::shared_ptr<IIdentityStorage> storage,
    Clock clock,
    std::chrono::milliseconds challenge_freshness) {
    using OpenResult = Result<std::unique_ptr<IdentityStore>, ProtocolFailure>;
    if (!storage) {
        return OpenResult::Err(ProtocolFailure::InvalidInput("Identity storage must not be null"));
    }
    if (challenge_freshness.count() <= 0 || challenge_freshness > kMaxChallengeFreshness) {
        return OpenResult::Err(ProtocolFailure::InvalidInput(
            compat::format("Challenge freshness window must be in (0, {}] ms", kMaxChallengeFreshness.count())));
    }
    auto init_result = SodiumInterop::Initialize();
    if (init_result.IsErr()) {
        return OpenResult::Err(ProtocolFailure::FromSodiumFailure(init_result.UnwrapErr()));
    }
    return OpenResult::Ok(std::unique_ptr<IdentityStore>(
        new IdentityStore(std::move(storage), std::move(clock), challenge_freshness)));
}

int64_t IdentityStore::NowMillis() const {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        clock_().time_since_epoch()).count();
}

// ============================================================================
// Lifecycle
// ============================================================================

Result<Identity, ProtocolFailure> IdentityStore::Generate() {
    std::lock_guard<std::mutex> guard(lock_);

    auto keypair_result = SodiumInterop::GenerateEd25519KeyPair();
    if (keypair_result.IsErr()) {
        Log::Error(kLogTag, "Identity key generation failed: {}", keypair_result.UnwrapErr().message);
        return Result<Identity, ProtocolFailure>::Err(keypair_result.UnwrapErr());
    }
    auto [secret_handle, public_key] = std::move(keypair_result).Unwrap();

    auto did_result = Did::Derive(public_key);
    if (did_result.IsErr()) {
        return Result<Identity, ProtocolFailure>::Err(did_result.UnwrapErr());
    }
    std::string did = did_result.Unwrap();

    auto secret_bytes_result = secret_handle.ReadBytes(kEd25519SecretKeyBytes);
    if (secret_bytes_result.IsErr()) {
        return Result<Identity, ProtocolFailure>::Err(
            ProtocolFailure::FromSodiumFailure(secret_bytes_result.UnwrapErr()));
    }
    auto secret_bytes = std::move(secret_bytes_result).Unwrap();

    proto::protocol::IdentityRecord record;
    record.set_version(kProtocolVersion);
    record.set_did(did);
    record.set_signing_public_key(public_key.data(), public_key.size());
    record.set_signing_secret_key(secret_bytes.data(), secret_bytes.size());
    record.set_created_at_ms(NowMillis());
    auto _wipe = SodiumInterop::SecureWipe(std::span<uint8_t>(secret_bytes));
    (void) _wipe;

    auto save_result = storage_->Save(record);
    WipeString(record.mutable_signing_secret_key());
    if (save_result.IsErr()) {
        return Result<Identity, ProtocolFailure>::Err(save_result.UnwrapErr());
    }

    identity_ = Identity{did, public_key};
    secret_key_ = std::move(secret_handle);
    Log::Info(kLogTag, "Generated identity {}", did);
    return Result<Identity, ProtocolFailure>::Ok(*identity_);
}

Result<std::optional<Identity>, ProtocolFailure> IdentityStore::Load() {
    using LoadResult = Result<std::optional<Identity>, ProtocolFailure>;
    std::lock_guard<std::mutex> guard(lock_);

    identity_.reset();
    secret_key_.Reset();

    auto stored_result = storage_->Load();
    if (stored_result.IsErr()) {
        const auto& failure = stored_result.UnwrapErr();
        if (failure.type == ProtocolFailureType::Decode) {
            Log::Warn(kLogTag, "Rejected stored identity: record does not parse ({})", failure.message);
            return LoadResult::Err(ProtocolFailure::IdentityCorrupted(
                compat::format("Stored identity record is unreadable: {}", failure.message)));
        }
        return LoadResult::Err(failure);
    }
    auto stored = std::move(stored_result).Unwrap();
    if (!stored.has_value()) {
        return LoadResult::Ok(std::nullopt);
    }
    auto& record = *stored;

    if (record.version() != kProtocolVersion) {
        WipeString(record.mutable_signing_secret_key());
        return LoadResult::Err(ProtocolFailure::IdentityCorrupted(
            compat::format("Unsupported identity record version {}", record.version())));
    }
    const auto public_key = AsBytes(record.signing_public_key());
    const auto secret_key = AsBytes(record.signing_secret_key());
    if (public_key.size() != kEd25519PublicKeyBytes || secret_key.size() != kEd25519SecretKeyBytes) {
        WipeString(record.mutable_signing_secret_key());
        return LoadResult::Err(ProtocolFailure::IdentityCorrupted("Stored identity keys have invalid length"));
    }
    if (!Did::Matches(record.did(), public_key)) {
        Log::Warn(kLogTag, "Rejected stored identity {}: DID does not match public key", record.did());
        WipeString(record.mutable_signing_secret_key());
        return LoadResult::Err(ProtocolFailure::IdentityCorrupted(std::string(ErrorMessages::DID_MISMATCH)));
    }

    std::vector<uint8_t> embedded_public(kEd25519PublicKeyBytes);
    crypto_sign_ed25519_sk_to_pk(embedded_public.data(), secret_key.data());
    auto compare_result = SodiumInterop::ConstantTimeEquals(embedded_public, public_key);
    if (compare_result.IsErr() || !compare_result.Unwrap()) {
        Log::Warn(kLogTag, "Rejected stored identity {}: secret key does not match", record.did());
        WipeString(record.mutable_signing_secret_key());
        return LoadResult::Err(ProtocolFailure::IdentityCorrupted(
            std::string(ErrorMessages::SECRET_KEY_MISMATCH)));
    }

    auto handle_result = SecureMemoryHandle::FromBytes(secret_key);
    WipeString(record.mutable_signing_secret_key());
    if (handle_result.IsErr()) {
        return LoadResult::Err(ProtocolFailure::FromSodiumFailure(handle_result.UnwrapErr()));
    }

    secret_key_ = std::move(handle_result).Unwrap();
    identity_ = Identity{record.did(), std::vector<uint8_t>(public_key.begin(), public_key.end())};
    Log::Debug(kLogTag, "Loaded identity {}", identity_->did);
    return LoadResult::Ok(identity_);
}

bool IdentityStore::HasIdentity() const {
    std::lock_guard<std::mutex> guard(lock_);
    return identity_.has_value();
}

std::optional<Identity> IdentityStore::CurrentIdentity() const {
    std::lock_guard<std::mutex> guard(lock_);
    return identity_;
}

Result<Unit, ProtocolFailure> IdentityStore::Wipe() {
    std::lock_guard<std::mutex> guard(lock_);
    identity_.reset();
    secret_key_.Reset();
    return storage_->Erase();
}

// ============================================================================
// Signing
// ============================================================================

Result<std::vector<uint8_t>, ProtocolFailure> IdentityStore::SignLocked(
    std::span<const uint8_t> message) const {
    if (!identity_.has_value() || secret_key_.IsInvalid()) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::InvalidState(std::string(ErrorMessages::NO_IDENTITY)));
    }
    std::vector<uint8_t> signature(crypto_sign_BYTES);
    auto sign_result = secret_key_.WithReadAccess([&](std::span<const uint8_t> sk) {
        unsigned long long sig_len = 0;
        const int rc = crypto_sign_detached(
            signature.data(), &sig_len, message.data(), message.size(), sk.data());
        return rc == SodiumConstants::SUCCESS && sig_len == kEd25519SignatureBytes;
    });
    if (sign_result.IsErr()) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::FromSodiumFailure(sign_result.UnwrapErr()));
    }
    if (!sign_result.Unwrap()) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::Generic("Ed25519 signing failed"));
    }
    return Result<std::vector<uint8_t>, ProtocolFailure>::Ok(std::move(signature));
}

Result<std::vector<uint8_t>, ProtocolFailure> IdentityStore::SignDetached(
    std::span<const uint8_t> message) const {
    std::lock_guard<std::mutex> guard(lock_);
    return SignLocked(message);
}

Result<proto::protocol::PayloadSignature, ProtocolFailure> IdentityStore::Sign(
    const google::protobuf::Struct& payload) const {
    using SignResult = Result<proto::protocol::PayloadSignature, ProtocolFailure>;
    auto canonical_result = CanonicalPayload::ToBytes(payload);
    if (canonical_result.IsErr()) {
        return SignResult::Err(canonical_result.UnwrapErr());
    }
    const auto canonical = std::move(canonical_result).Unwrap();

    std::lock_guard<std::mutex> guard(lock_);
    auto signature_result = SignLocked(canonical);
    if (signature_result.IsErr()) {
        return SignResult::Err(signature_result.UnwrapErr());
    }
    const auto& signature = signature_result.Unwrap();

    proto::protocol::PayloadSignature result;
    result.set_signature(signature.data(), signature.size());
    result.set_public_key(identity_->signing_public_key.data(), identity_->signing_public_key.size());
    result.set_did(identity_->did);
    result.set_timestamp_ms(NowMillis());
    return SignResult::Ok(std::move(result));
}

Result<proto::protocol::PayloadSignature, ProtocolFailure> IdentityStore::SignJson(
    std::string_view payload_json) const {
    auto payload_result = CanonicalPayload::ParseJson(payload_json);
    if (payload_result.IsErr()) {
        return Result<proto::protocol::PayloadSignature, ProtocolFailure>::Err(payload_result.UnwrapErr());
    }
    return Sign(payload_result.Unwrap());
}

Result<bool, ProtocolFailure> IdentityStore::Verify(
    const google::protobuf::Struct& payload,
    const proto::protocol::PayloadSignature& signature) const {
    const auto public_key = AsBytes(signature.public_key());
    const auto signature_bytes = AsBytes(signature.signature());
    if (public_key.size() != kEd25519PublicKeyBytes || signature_bytes.size() != kEd25519SignatureBytes) {
        return Result<bool, ProtocolFailure>::Err(
            ProtocolFailure::InvalidInput("Payload signature has invalid key or signature length"));
    }
    auto canonical_result = CanonicalPayload::ToBytes(payload);
    if (canonical_result.IsErr()) {
        return Result<bool, ProtocolFailure>::Err(canonical_result.UnwrapErr());
    }
    if (!Did::Matches(signature.did(), public_key)) {
        Log::Warn(kLogTag, "Rejected signature: DID {} does not belong to the embedded key", signature.did());
        return Result<bool, ProtocolFailure>::Ok(false);
    }
    auto verify_result = VerifyEd25519(public_key, canonical_result.Unwrap(), signature_bytes);
    if (verify_result.IsOk() && !verify_result.Unwrap()) {
        Log::Warn(kLogTag, "Rejected signature from {}: verification failed", signature.did());
    }
    return verify_result;
}

Result<bool, ProtocolFailure> IdentityStore::VerifyJson(
    std::string_view payload_json,
    const proto::protocol::PayloadSignature& signature) const {
    auto payload_result = CanonicalPayload::ParseJson(payload_json);
    if (payload_result.IsErr()) {
        return Result<bool, ProtocolFailure>::Err(payload_result.UnwrapErr());
    }
    return Verify(payload_result.Unwrap(), signature);
}

// ============================================================================
// Challenge Proofs
// ============================================================================

Result<std::vector<uint8_t>, ProtocolFailure> IdentityStore::ChallengeSigningBytes(
    std::string_view did,
    const int64_t timestamp_ms,
    std::span<const uint8_t> challenge) {
    google::protobuf::Struct tuple;
    auto& fields = *tuple.mutable_fields();
    fields[std::string(kProofDidField)].set_string_value(std::string(did));
    fields[std::string(kProofTimestampField)].set_number_value(static_cast<double>(timestamp_ms));
    auto* challenge_list = fields[std::string(kProofChallengeField)].mutable_list_value();
    for (const uint8_t byte : challenge) {
        challenge_list->add_values()->set_number_value(byte);
    }
    return CanonicalPayload::ToBytes(tuple);
}

Result<proto::protocol::ChallengeProof, ProtocolFailure> IdentityStore::CreateChallengeProof() const {
    using ProofResult = Result<proto::protocol::ChallengeProof, ProtocolFailure>;
    std::lock_guard<std::mutex> guard(lock_);
    if (!identity_.has_value()) {
        return ProofResult::Err(ProtocolFailure::InvalidState(std::string(ErrorMessages::NO_IDENTITY)));
    }
    const auto challenge = SodiumInterop::GetRandomBytes(kChallengeBytes);
    const int64_t timestamp_ms = NowMillis();

    auto message_result = ChallengeSigningBytes(identity_->did, timestamp_ms, challenge);
    if (message_result.IsErr()) {
        return ProofResult::Err(message_result.UnwrapErr());
    }
    auto signature_result = SignLocked(message_result.Unwrap());
    if (signature_result.IsErr()) {
        return ProofResult::Err(signature_result.UnwrapErr());
    }
    const auto& signature = signature_result.Unwrap();

    proto::protocol::ChallengeProof proof;
    proof.set_did(identity_->did);
    proof.set_timestamp_ms(timestamp_ms);
    proof.set_challenge(challenge.data(), challenge.size());
    proof.set_signature(signature.data(), signature.size());
    return ProofResult::Ok(std::move(proof));
}

Result<bool, ProtocolFailure> IdentityStore::VerifyChallengeProof(
    const proto::protocol::ChallengeProof& proof,
    std::string_view expected_did) const {
    if (proof.did() != expected_did) {
        Log::Warn(kLogTag, "Rejected challenge proof: DID {} is not the expected {}", proof.did(), expected_did);
        return Result<bool, ProtocolFailure>::Ok(false);
    }
    auto public_key_result = Did::ExtractPublicKey(proof.did());
    if (public_key_result.IsErr()) {
        return Result<bool, ProtocolFailure>::Err(public_key_result.UnwrapErr());
    }
    if (proof.challenge().size() != kChallengeBytes) {
        return Result<bool, ProtocolFailure>::Err(
            ProtocolFailure::InvalidInput(
                compat::format("Challenge must be {} bytes, got {}", kChallengeBytes, proof.challenge().size())));
    }
    if (proof.signature().size() != kEd25519SignatureBytes) {
        return Result<bool, ProtocolFailure>::Err(
            ProtocolFailure::InvalidInput("Challenge proof signature has invalid length"));
    }

    // The remote timestamp is only compared, never subtracted.
    const int64_t now_ms = NowMillis();
    const int64_t window_ms = challenge_freshness_.count();
    if (proof.timestamp_ms() < now_ms - window_ms) {
        Log::Warn(kLogTag, "Rejected stale challenge proof from {} (timestamp {} ms, now {} ms)",
            proof.did(), proof.timestamp_ms(), now_ms);
        return Result<bool, ProtocolFailure>::Ok(false);
    }
    if (proof.timestamp_ms() > now_ms + window_ms) {
        Log::Warn(kLogTag, "Rejected future-dated challenge proof from {} (timestamp {} ms, now {} ms)",
            proof.did(), proof.timestamp_ms(), now_ms);
        return Result<bool, ProtocolFailure>::Ok(false);
    }

    auto message_result = ChallengeSigningBytes(proof.did(), proof.timestamp_ms(), AsBytes(proof.challenge()));
    if (message_result.IsErr()) {
        return Result<bool, ProtocolFailure>::Err(message_result.UnwrapErr());
    }
    auto verify_result = VerifyEd25519(public_key_result.Unwrap(), message_result.Unwrap(), AsBytes(proof.signature()));
    if (verify_result.IsOk() && !verify_result.Unwrap()) {
        Log::Warn(kLogTag, "Rejected challenge proof from {}: bad signature", proof.did());
    }
    return verify_result;
}

Result<std::string, ProtocolFailure> IdentityStore::ExportChallengeProof(
    const proto::protocol::ChallengeProof& proof) {
    std::string signature_hex(proof.signature().size() * 2 + 1, '\0');
    sodium_bin2hex(signature_hex.data(), signature_hex.size(),
        reinterpret_cast<const unsigned char*>(proof.signature().data()), proof.signature().size());
    signature_hex.resize(proof.signature().size() * 2);

    google::protobuf::Struct document;
    auto& fields = *document.mutable_fields();
    fields[std::string(kProofDidField)].set_string_value(proof.did());
    fields[std::string(kProofTimestampField)].set_number_value(static_cast<double>(proof.timestamp_ms()));
    auto* challenge_list = fields[std::string(kProofChallengeField)].mutable_list_value();
    for (const uint8_t byte : AsBytes(proof.challenge())) {
        challenge_list->add_values()->set_number_value(byte);
    }
    fields[std::string(kSignatureField)].set_string_value(signature_hex);

    std::string json;
    const auto status = google::protobuf::util::MessageToJsonString(document, &json);
    if (!status.ok()) {
        return Result<std::string, ProtocolFailure>::Err(
            ProtocolFailure::Encode(compat::format("Failed to encode challenge proof: {}", status.ToString())));
    }
    return Result<std::string, ProtocolFailure>::Ok(std::move(json));
}

Result<proto::protocol::ChallengeProof, ProtocolFailure> IdentityStore::ImportChallengeProof(
    std::string_view json) {
    using ProofResult = Result<proto::protocol::ChallengeProof, ProtocolFailure>;
    auto document_result = CanonicalPayload::ParseJson(json);
    if (document_result.IsErr()) {
        return ProofResult::Err(document_result.UnwrapErr());
    }
    const auto& fields = document_result.Unwrap().fields();
    const auto did_it = fields.find(std::string(kProofDidField));
    const auto timestamp_it = fields.find(std::string(kProofTimestampField));
    const auto challenge_it = fields.find(std::string(kProofChallengeField));
    const auto signature_it = fields.find(std::string(kSignatureField));
    if (did_it == fields.end() || timestamp_it == fields.end() ||
        challenge_it == fields.end() || signature_it == fields.end()) {
        return ProofResult::Err(ProtocolFailure::InvalidInput("Challenge proof is missing a field"));
    }
    if (did_it->second.kind_case() != google::protobuf::Value::kStringValue ||
        signature_it->second.kind_case() != google::protobuf::Value::kStringValue ||
        challenge_it->second.kind_case() != google::protobuf::Value::kListValue) {
        return ProofResult::Err(ProtocolFailure::InvalidInput("Challenge proof field has the wrong type"));
    }

    auto timestamp_result = ReadIntegral(timestamp_it->second, kProofTimestampField);
    if (timestamp_result.IsErr()) {
        return ProofResult::Err(timestamp_result.UnwrapErr());
    }

    std::string challenge;
    for (const auto& value : challenge_it->second.list_value().values()) {
        auto byte_result = ReadIntegral(value, kProofChallengeField);
        if (byte_result.IsErr()) {
            return ProofResult::Err(byte_result.UnwrapErr());
        }
        const int64_t byte = byte_result.Unwrap();
        if (byte < 0 || byte > 0xFF) {
            return ProofResult::Err(ProtocolFailure::InvalidInput("Challenge byte out of range"));
        }
        challenge.push_back(static_cast<char>(byte));
    }

    const std::string& signature_hex = signature_it->second.string_value();
    std::string signature(signature_hex.size() / 2, '\0');
    size_t signature_len = 0;
    const char* hex_end = nullptr;
    const int rc = sodium_hex2bin(
        reinterpret_cast<unsigned char*>(signature.data()), signature.size(),
        signature_hex.data(), signature_hex.size(),
        nullptr, &signature_len, &hex_end);
    if (rc != SodiumConstants::SUCCESS || hex_end != signature_hex.data() + signature_hex.size()) {
        return ProofResult::Err(ProtocolFailure::InvalidInput("Challenge proof signature is not valid hex"));
    }
    signature.resize(signature_len);

    proto::protocol::ChallengeProof proof;
    proof.set_did(did_it->second.string_value());
    proof.set_timestamp_ms(timestamp_result.Unwrap());
    proof.set_challenge(std::move(challenge));
    proof.set_signature(std::move(signature));
    return ProofResult::Ok(std::move(proof));
}

// ============================================================================
// Key Agreement
// ============================================================================

Result<std::vector<uint8_t>, ProtocolFailure> IdentityStore::IdentityAgreement(
    std::span<const uint8_t> remote_x25519_public) const {
    auto validation = DhValidator::ValidateX25519PublicKey(remote_x25519_public);
    if (validation.IsErr()) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(validation.UnwrapErr());
    }
    std::lock_guard<std::mutex> guard(lock_);
    if (!identity_.has_value() || secret_key_.IsInvalid()) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::InvalidState(std::string(ErrorMessages::NO_IDENTITY)));
    }
    auto x25519_secret_result = SodiumInterop::ConvertEd25519SecretToX25519(secret_key_);
    if (x25519_secret_result.IsErr()) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(x25519_secret_result.UnwrapErr());
    }
    return SodiumInterop::ComputeSharedSecret(
        x25519_secret_result.Unwrap(), remote_x25519_public, "identity agreement");
}

}
