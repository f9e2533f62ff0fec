#pragma once
#include "tessera/core/failures.hpp"
#include <cstddef>
#include <string>
namespace tessera::protocol {
class ISessionEventHandler {
public:
    virtual ~ISessionEventHandler() = default;
    virtual void OnRatchetStep(const std::string& peer_id) = 0;
    virtual void OnSkippedKeysEvicted(const std::string& peer_id, size_t evicted_count) = 0;
    virtual void OnDecryptFailed(const std::string& peer_id, const ProtocolFailure& failure) = 0;
};
}
