#pragma once
#include "tessera/core/result.hpp"
#include "tessera/core/failures.hpp"
#include "protocol/identity.pb.h"
#include <optional>
namespace tessera::protocol {

/// Durable home of the local identity record.
///
/// IdentityStore never touches disk itself; the embedding application
/// supplies an implementation backed by whatever store it has.
class IIdentityStorage {
public:
    virtual ~IIdentityStorage() = default;

    /// Ok(nullopt) when nothing has been saved yet.
    virtual Result<std::optional<proto::protocol::IdentityRecord>, ProtocolFailure> Load() = 0;
    virtual Result<Unit, ProtocolFailure> Save(const proto::protocol::IdentityRecord& record) = 0;
    virtual Result<Unit, ProtocolFailure> Erase() = 0;
};
}
