#pragma once
#include "tessera/core/result.hpp"
#include "tessera/core/failures.hpp"
#include "tessera/protocol/constants.hpp"
#include "protocol/state.pb.h"
#include <array>
#include <cstdint>
#include <map>
#include <optional>
#include <span>
#include <utility>
#include <vector>
namespace tessera::protocol {

/// Capped store of message keys derived for messages that have not arrived yet.
///
/// Keyed by (ratchet public key, message number). When an insert would exceed
/// the capacity, the entries inserted earliest are evicted first. Every key
/// that leaves the cache (evicted, taken or cleared) is wiped.
class SkippedMessageKeyCache {
public:
    using MessageKey = std::array<uint8_t, kMessageKeyBytes>;

    explicit SkippedMessageKeyCache(size_t capacity);
    ~SkippedMessageKeyCache();

    SkippedMessageKeyCache(const SkippedMessageKeyCache&) = default;
    SkippedMessageKeyCache(SkippedMessageKeyCache&&) noexcept = default;
    SkippedMessageKeyCache& operator=(const SkippedMessageKeyCache& other);
    SkippedMessageKeyCache& operator=(SkippedMessageKeyCache&& other) noexcept;

    /// @return number of entries evicted to make room
    [[nodiscard]] Result<size_t, ProtocolFailure> Insert(
        std::span<const uint8_t> ratchet_public_key,
        uint64_t message_number,
        std::span<const uint8_t> message_key);

    /// Copy of the key without removing it.
    [[nodiscard]] std::optional<MessageKey> Peek(
        std::span<const uint8_t> ratchet_public_key,
        uint64_t message_number) const;

    /// Remove and return the key.
    [[nodiscard]] std::optional<MessageKey> Take(
        std::span<const uint8_t> ratchet_public_key,
        uint64_t message_number);

    [[nodiscard]] bool Contains(
        std::span<const uint8_t> ratchet_public_key,
        uint64_t message_number) const;

    [[nodiscard]] size_t Size() const noexcept { return by_sequence_.size(); }
    [[nodiscard]] size_t Capacity() const noexcept { return capacity_; }

    void Clear() noexcept;

    /// Append all entries to `state`, oldest first.
    void ExportTo(proto::protocol::RatchetState& state) const;

    /// Rebuild from `state`. Entries beyond `capacity` are dropped oldest first.
    [[nodiscard]] static Result<SkippedMessageKeyCache, ProtocolFailure> ImportFrom(
        const proto::protocol::RatchetState& state,
        size_t capacity);

private:
    using EntryKey = std::pair<std::vector<uint8_t>, uint64_t>;

    struct Entry {
        EntryKey key;
        MessageKey message_key{};
    };

    [[nodiscard]] static EntryKey MakeKey(std::span<const uint8_t> ratchet_public_key, uint64_t message_number);
    void EvictOldest() noexcept;
    static void WipeKey(MessageKey& key) noexcept;

    size_t capacity_;
    uint64_t next_sequence_ = 0;
    std::map<uint64_t, Entry> by_sequence_;
    std::map<EntryKey, uint64_t> index_;
};

}
