#pragma once
#include "tessera/core/result.hpp"
#include "tessera/core/failures.hpp"
#include "tessera/crypto/sodium_secure_memory_handle.hpp"
#include "tessera/interfaces/i_identity_storage.hpp"
#include "tessera/protocol/constants.hpp"
#include "protocol/identity.pb.h"
#include <google/protobuf/struct.pb.h>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>
namespace tessera::protocol::identity {
using crypto::SecureMemoryHandle;

/// Public view of the local identity. The signing secret stays inside
/// IdentityStore.
struct Identity {
    std::string did;
    std::vector<uint8_t> signing_public_key;
};

/**
 * @brief Owner of the local Ed25519 signing identity
 *
 * An explicitly constructed context object: open it over a storage backend,
 * then `Generate()` or `Load()`. The secret key lives in guarded memory and
 * is used only through Sign, SignDetached and IdentityAgreement.
 *
 * Thread Safety: all public methods are thread-safe.
 */
class IdentityStore {
public:
    using Clock = std::function<std::chrono::system_clock::time_point()>;

    /**
     * @brief Create a store over `storage`
     *
     * @param clock Time source for signatures and proof freshness; the
     *              system clock when empty
     * @param challenge_freshness Maximum proof age and future skew
     */
    [[nodiscard]] static Result<std::unique_ptr<IdentityStore>, ProtocolFailure> Open(
        std::shared_ptr<IIdentityStorage> storage,
        Clock clock = {},
        std::chrono::milliseconds challenge_freshness = kDefaultChallengeFreshness);

    /**
     * @brief Create a fresh signing keypair, derive its DID and persist both
     *
     * Replaces any identity currently held. Fails with KeyGeneration when the
     * primitive is unavailable.
     */
    [[nodiscard]] Result<Identity, ProtocolFailure> Generate();

    /**
     * @brief Reconstruct the identity from storage
     *
     * @return Ok(nullopt) when storage is empty; Err(IdentityCorrupted) when
     *         the stored DID or secret key does not belong to the stored
     *         public key. A corrupted record is never loaded.
     */
    [[nodiscard]] Result<std::optional<Identity>, ProtocolFailure> Load();

    /**
     * @brief Sign the canonical form of `payload`
     *
     * Embedded `signature` / `signatures` members and key order do not
     * affect the result.
     */
    [[nodiscard]] Result<proto::protocol::PayloadSignature, ProtocolFailure> Sign(
        const google::protobuf::Struct& payload) const;

    [[nodiscard]] Result<proto::protocol::PayloadSignature, ProtocolFailure> SignJson(
        std::string_view payload_json) const;

    /**
     * @brief Verify a payload signature produced by any identity
     *
     * @return Ok(false) when the claimed DID does not belong to the embedded
     *         key or the signature does not verify; Err(InvalidInput) for a
     *         malformed payload or signature.
     */
    [[nodiscard]] Result<bool, ProtocolFailure> Verify(
        const google::protobuf::Struct& payload,
        const proto::protocol::PayloadSignature& signature) const;

    [[nodiscard]] Result<bool, ProtocolFailure> VerifyJson(
        std::string_view payload_json,
        const proto::protocol::PayloadSignature& signature) const;

    [[nodiscard]] Result<proto::protocol::ChallengeProof, ProtocolFailure> CreateChallengeProof() const;

    /**
     * @brief Check a proof against `expected_did`
     *
     * Rejects (Ok(false)) a proof for another DID, a bad signature, and a
     * timestamp outside the freshness window in either direction.
     */
    [[nodiscard]] Result<bool, ProtocolFailure> VerifyChallengeProof(
        const proto::protocol::ChallengeProof& proof,
        std::string_view expected_did) const;

    /// Raw Ed25519 signature over `message`. Used for prekey signing.
    [[nodiscard]] Result<std::vector<uint8_t>, ProtocolFailure> SignDetached(
        std::span<const uint8_t> message) const;

    /// X25519 between the identity key (as Curve25519) and a remote key.
    [[nodiscard]] Result<std::vector<uint8_t>, ProtocolFailure> IdentityAgreement(
        std::span<const uint8_t> remote_x25519_public) const;

    [[nodiscard]] bool HasIdentity() const;
    [[nodiscard]] std::optional<Identity> CurrentIdentity() const;

    /// Drop key material from memory and erase it from storage.
    [[nodiscard]] Result<Unit, ProtocolFailure> Wipe();

    /// `{did, timestamp, challenge: [bytes], signature: hex}`
    [[nodiscard]] static Result<std::string, ProtocolFailure> ExportChallengeProof(
        const proto::protocol::ChallengeProof& proof);

    [[nodiscard]] static Result<proto::protocol::ChallengeProof, ProtocolFailure> ImportChallengeProof(
        std::string_view json);

    [[nodiscard]] static Result<std::vector<uint8_t>, ProtocolFailure> ChallengeSigningBytes(
        std::string_view did,
        int64_t timestamp_ms,
        std::span<const uint8_t> challenge);

    IdentityStore(const IdentityStore&) = delete;
    IdentityStore& operator=(const IdentityStore&) = delete;
    IdentityStore(IdentityStore&&) = delete;
    IdentityStore& operator=(IdentityStore&&) = delete;
    ~IdentityStore() = default;

private:
    IdentityStore(
        std::shared_ptr<IIdentityStorage> storage,
        Clock clock,
        std::chrono::milliseconds challenge_freshness);

    [[nodiscard]] int64_t NowMillis() const;

    [[nodiscard]] Result<std::vector<uint8_t>, ProtocolFailure> SignLocked(
        std::span<const uint8_t> message) const;

    std::shared_ptr<IIdentityStorage> storage_;
    Clock clock_;
    std::chrono::milliseconds challenge_freshness_;
    std::optional<Identity> identity_;
    SecureMemoryHandle secret_key_;
    mutable std::mutex lock_;
};

}
