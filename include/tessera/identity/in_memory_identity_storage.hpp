#pragma once
#include "tessera/interfaces/i_identity_storage.hpp"
#include <mutex>
#include <optional>
#include <string>
namespace tessera::protocol::identity {

/// Process-local IIdentityStorage.
///
/// Keeps the record in its serialized form, so a load goes through the same
/// parse path a durable backend would.
class InMemoryIdentityStorage final : public IIdentityStorage {
public:
    InMemoryIdentityStorage() = default;
    ~InMemoryIdentityStorage() override;

    InMemoryIdentityStorage(const InMemoryIdentityStorage&) = delete;
    InMemoryIdentityStorage& operator=(const InMemoryIdentityStorage&) = delete;

    Result<std::optional<proto::protocol::IdentityRecord>, ProtocolFailure> Load() override;
    Result<Unit, ProtocolFailure> Save(const proto::protocol::IdentityRecord& record) override;
    Result<Unit, ProtocolFailure> Erase() override;

    [[nodiscard]] bool IsEmpty() const;

private:
    void WipeBlob() noexcept;

    mutable std::mutex lock_;
    std::optional<std::string> blob_;
};

}
