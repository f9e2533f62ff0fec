#include "tessera/identity/in_memory_identity_storage.hpp"
#include "tessera/crypto/sodium_interop.hpp"

namespace tessera::protocol::identity {

using crypto::SodiumInterop;

InMemoryIdentityStorage::~InMemoryIdentityStorage() {
    WipeBlob();
}

Result<std::optional<proto::protocol::IdentityRecord>, ProtocolFailure> InMemoryIdentityStorage::Load() {
    using LoadResult = Result<std::optional<proto::protocol::IdentityRecord>, ProtocolFailure>;
    std::lock_guard<std::mutex> guard(lock_);
    if (!blob_.has_value()) {
        return LoadResult::Ok(std::nullopt);
    }
    proto::protocol::IdentityRecord record;
    if (!record.ParseFromString(*blob_)) {
        return LoadResult::Err(ProtocolFailure::Decode("Stored identity record is not parseable"));
    }
    return LoadResult::Ok(std::move(record));
}

Result<Unit, ProtocolFailure> InMemoryIdentityStorage::Save(const proto::protocol::IdentityRecord& record) {
    std::string serialized;
    if (!record.SerializeToString(&serialized)) {
        return Result<Unit, ProtocolFailure>::Err(
            ProtocolFailure::Encode("Failed to serialize identity record"));
    }
    std::lock_guard<std::mutex> guard(lock_);
    WipeBlob();
    blob_ = std::move(serialized);
    return Result<Unit, ProtocolFailure>::Ok(unit);
}

Result<Unit, ProtocolFailure> InMemoryIdentityStorage::Erase() {
    std::lock_guard<std::mutex> guard(lock_);
    WipeBlob();
    blob_.reset();
    return Result<Unit, ProtocolFailure>::Ok(unit);
}

bool InMemoryIdentityStorage::IsEmpty() const {
    std::lock_guard<std::mutex> guard(lock_);
    return !blob_.has_value();
}

void InMemoryIdentityStorage::WipeBlob() noexcept {
    if (blob_.has_value() && !blob_->empty()) {
        auto _wipe = SodiumInterop::SecureWipe(
            std::span<uint8_t>(reinterpret_cast<uint8_t*>(blob_->data()), blob_->size()));
        (void) _wipe;
    }
}

}
