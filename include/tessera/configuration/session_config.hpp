#pragma once

#include "tessera/protocol/constants.hpp"
#include <chrono>
#include <cstddef>
#include <cstdint>

namespace tessera::protocol::configuration {

/**
 * @brief Bounds applied to a ratchet session and to challenge proofs
 *
 * **Fields**:
 * - `max_skipped_keys`: capacity of the skipped message key cache. When a
 *   gap would overflow it, the oldest cached keys are evicted first and the
 *   messages they belonged to become undecryptable.
 * - `max_forward_skip`: largest gap a single header may demand. A larger gap
 *   is rejected before any key is derived, which bounds the work one
 *   envelope can cause.
 * - `max_previous_ratchet_keys`: how many retired remote ratchet keys are
 *   remembered. A late message on such a chain fails with
 *   MessageKeyUnavailable instead of forcing a ratchet step. A message on
 *   a chain retired longer ago than this, and whose key is not cached, is
 *   taken for a new ratchet key; the staged step cannot authenticate it,
 *   so it fails with AuthenticationFailed and the session is left as it was.
 * - `challenge_freshness`: age (and clock skew) a challenge proof may have.
 *
 * **Usage Example**:
 * ```cpp
 * auto config = SessionConfig::Default();
 * auto strict = SessionConfig::HighSecurity();
 * auto custom = SessionConfig(2, 10, 4, std::chrono::minutes(1));
 * ```
 */
class SessionConfig {
public:
    SessionConfig(
        size_t max_skipped_keys,
        uint64_t max_forward_skip,
        size_t max_previous_ratchet_keys,
        std::chrono::milliseconds challenge_freshness) noexcept
        : max_skipped_keys_(max_skipped_keys)
        , max_forward_skip_(max_forward_skip)
        , max_previous_ratchet_keys_(max_previous_ratchet_keys)
        , challenge_freshness_(challenge_freshness) {}

    /**
     * @brief 1000 skipped keys, 10000 forward skip, 16 retired keys, 5 minutes
     */
    [[nodiscard]] static SessionConfig Default() noexcept {
        return SessionConfig(
            kDefaultMaxSkippedMessageKeys,
            kDefaultMaxForwardSkip,
            kDefaultMaxPreviousRatchetKeys,
            kDefaultChallengeFreshness);
    }

    /**
     * @brief Small cache and short forward window
     *
     * Keeps fewer secrets in memory at the cost of tolerating less
     * reordering.
     */
    [[nodiscard]] static SessionConfig HighSecurity() noexcept {
        return SessionConfig(100, 1000, kDefaultMaxPreviousRatchetKeys, kDefaultChallengeFreshness);
    }

    /**
     * @brief Large cache for lossy or heavily reordering transports
     */
    [[nodiscard]] static SessionConfig Tolerant() noexcept {
        return SessionConfig(5000, 50000, kDefaultMaxPreviousRatchetKeys, kDefaultChallengeFreshness);
    }

    [[nodiscard]] bool IsValid() const noexcept {
        return max_skipped_keys_ > 0 &&
               max_forward_skip_ > 0 &&
               max_previous_ratchet_keys_ > 0 &&
               challenge_freshness_.count() > 0;
    }

    [[nodiscard]] size_t GetMaxSkippedKeys() const noexcept {
        return max_skipped_keys_;
    }

    [[nodiscard]] uint64_t GetMaxForwardSkip() const noexcept {
        return max_forward_skip_;
    }

    [[nodiscard]] size_t GetMaxPreviousRatchetKeys() const noexcept {
        return max_previous_ratchet_keys_;
    }

    [[nodiscard]] std::chrono::milliseconds GetChallengeFreshness() const noexcept {
        return challenge_freshness_;
    }

    [[nodiscard]] bool operator==(const SessionConfig& other) const noexcept {
        return max_skipped_keys_ == other.max_skipped_keys_ &&
               max_forward_skip_ == other.max_forward_skip_ &&
               max_previous_ratchet_keys_ == other.max_previous_ratchet_keys_ &&
               challenge_freshness_ == other.challenge_freshness_;
    }

    [[nodiscard]] bool operator!=(const SessionConfig& other) const noexcept {
        return !(*this == other);
    }

private:
    size_t max_skipped_keys_;
    uint64_t max_forward_skip_;
    size_t max_previous_ratchet_keys_;
    std::chrono::milliseconds challenge_freshness_;
};

} // namespace tessera::protocol::configuration
