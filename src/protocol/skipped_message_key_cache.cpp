#include "tessera/protocol/skipped_message_key_cache.hpp"
#include "tessera/crypto/sodium_interop.hpp"
#include "tessera/core/format.hpp"
#include <algorithm>

namespace tessera::protocol {

using crypto::SodiumInterop;

SkippedMessageKeyCache::SkippedMessageKeyCache(const size_t capacity)
    : capacity_(capacity) {}

SkippedMessageKeyCache::~SkippedMessageKeyCache() {
    Clear();
}

SkippedMessageKeyCache& SkippedMessageKeyCache::operator=(const SkippedMessageKeyCache& other) {
    if (this != &other) {
        Clear();
        capacity_ = other.capacity_;
        next_sequence_ = other.next_sequence_;
        by_sequence_ = other.by_sequence_;
        index_ = other.index_;
    }
    return *this;
}

SkippedMessageKeyCache& SkippedMessageKeyCache::operator=(SkippedMessageKeyCache&& other) noexcept {
    if (this != &other) {
        Clear();
        capacity_ = other.capacity_;
        next_sequence_ = other.next_sequence_;
        by_sequence_ = std::move(other.by_sequence_);
        index_ = std::move(other.index_);
        other.by_sequence_.clear();
        other.index_.clear();
    }
    return *this;
}

SkippedMessageKeyCache::EntryKey SkippedMessageKeyCache::MakeKey(
    std::span<const uint8_t> ratchet_public_key,
    const uint64_t message_number) {
    return {std::vector<uint8_t>(ratchet_public_key.begin(), ratchet_public_key.end()), message_number};
}

void SkippedMessageKeyCache::WipeKey(MessageKey& key) noexcept {
    auto _wipe = SodiumInterop::SecureWipe(std::span<uint8_t>(key));
    (void) _wipe;
}

void SkippedMessageKeyCache::EvictOldest() noexcept {
    auto oldest = by_sequence_.begin();
    if (oldest == by_sequence_.end()) {
        return;
    }
    index_.erase(oldest->second.key);
    WipeKey(oldest->second.message_key);
    by_sequence_.erase(oldest);
}

Result<size_t, ProtocolFailure> SkippedMessageKeyCache::Insert(
    std::span<const uint8_t> ratchet_public_key,
    const uint64_t message_number,
    std::span<const uint8_t> message_key) {
    if (ratchet_public_key.size() != kX25519PublicKeyBytes || message_key.size() != kMessageKeyBytes) {
        return Result<size_t, ProtocolFailure>::Err(
            ProtocolFailure::InvalidInput("Skipped message key entry has invalid length"));
    }
    if (capacity_ == 0) {
        return Result<size_t, ProtocolFailure>::Err(
            ProtocolFailure::InvalidState("Skipped message key cache has zero capacity"));
    }
    auto key = MakeKey(ratchet_public_key, message_number);
    if (const auto existing = index_.find(key); existing != index_.end()) {
        auto& entry = by_sequence_.at(existing->second);
        std::copy(message_key.begin(), message_key.end(), entry.message_key.begin());
        return Result<size_t, ProtocolFailure>::Ok(0);
    }

    size_t evicted = 0;
    while (by_sequence_.size() >= capacity_) {
        EvictOldest();
        ++evicted;
    }

    const uint64_t sequence = next_sequence_++;
    Entry entry{key, {}};
    std::copy(message_key.begin(), message_key.end(), entry.message_key.begin());
    by_sequence_.emplace(sequence, std::move(entry));
    index_.emplace(std::move(key), sequence);
    return Result<size_t, ProtocolFailure>::Ok(evicted);
}

std::optional<SkippedMessageKeyCache::MessageKey> SkippedMessageKeyCache::Peek(
    std::span<const uint8_t> ratchet_public_key,
    const uint64_t message_number) const {
    const auto it = index_.find(MakeKey(ratchet_public_key, message_number));
    if (it == index_.end()) {
        return std::nullopt;
    }
    return by_sequence_.at(it->second).message_key;
}

std::optional<SkippedMessageKeyCache::MessageKey> SkippedMessageKeyCache::Take(
    std::span<const uint8_t> ratchet_public_key,
    const uint64_t message_number) {
    const auto it = index_.find(MakeKey(ratchet_public_key, message_number));
    if (it == index_.end()) {
        return std::nullopt;
    }
    auto entry_it = by_sequence_.find(it->second);
    MessageKey key = entry_it->second.message_key;
    WipeKey(entry_it->second.message_key);
    by_sequence_.erase(entry_it);
    index_.erase(it);
    return key;
}

bool SkippedMessageKeyCache::Contains(
    std::span<const uint8_t> ratchet_public_key,
    const uint64_t message_number) const {
    return index_.contains(MakeKey(ratchet_public_key, message_number));
}

void SkippedMessageKeyCache::Clear() noexcept {
    for (auto& [_, entry] : by_sequence_) {
        WipeKey(entry.message_key);
    }
    by_sequence_.clear();
    index_.clear();
}

void SkippedMessageKeyCache::ExportTo(proto::protocol::RatchetState& state) const {
    for (const auto& [_, entry] : by_sequence_) {
        auto* skipped = state.add_skipped_message_keys();
        skipped->set_ratchet_public_key(entry.key.first.data(), entry.key.first.size());
        skipped->set_message_number(entry.key.second);
        skipped->set_message_key(entry.message_key.data(), entry.message_key.size());
    }
}

Result<SkippedMessageKeyCache, ProtocolFailure> SkippedMessageKeyCache::ImportFrom(
    const proto::protocol::RatchetState& state,
    const size_t capacity) {
    SkippedMessageKeyCache cache(capacity);
    for (const auto& skipped : state.skipped_message_keys()) {
        const std::span<const uint8_t> ratchet_public_key(
            reinterpret_cast<const uint8_t*>(skipped.ratchet_public_key().data()),
            skipped.ratchet_public_key().size());
        if (cache.Contains(ratchet_public_key, skipped.message_number())) {
            return Result<SkippedMessageKeyCache, ProtocolFailure>::Err(
                ProtocolFailure::InvalidInput(
                    compat::format("Duplicate skipped message key for message {}", skipped.message_number())));
        }
        auto insert_result = cache.Insert(
            ratchet_public_key,
            skipped.message_number(),
            std::span<const uint8_t>(
                reinterpret_cast<const uint8_t*>(skipped.message_key().data()),
                skipped.message_key().size()));
        if (insert_result.IsErr()) {
            return Result<SkippedMessageKeyCache, ProtocolFailure>::Err(insert_result.UnwrapErr());
        }
    }
    return Result<SkippedMessageKeyCache, ProtocolFailure>::Ok(std::move(cache));
}

}
