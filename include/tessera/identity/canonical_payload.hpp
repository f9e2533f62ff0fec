#pragma once

#include "tessera/core/result.hpp"
#include "tessera/core/failures.hpp"

#include <google/protobuf/struct.pb.h>

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace tessera::protocol::identity {

/// Canonical byte form of application payloads (profiles, feedback records,
/// proofs) for signing.
///
/// Payloads are JSON-like objects held in google::protobuf::Struct. The
/// canonical form drops every `signature` / `signatures` member, orders
/// object members by key at every depth and prints compact JSON. Two payloads
/// that differ only in member order or embedded signatures canonicalize to
/// the same bytes.
class CanonicalPayload {
public:
    static Result<google::protobuf::Struct, ProtocolFailure> ParseJson(std::string_view json);

    static Result<std::string, ProtocolFailure> Canonicalize(const google::protobuf::Struct& payload);

    static Result<std::string, ProtocolFailure> CanonicalizeJson(std::string_view json);

    static Result<std::vector<uint8_t>, ProtocolFailure> ToBytes(const google::protobuf::Struct& payload);

    static constexpr size_t MAX_DEPTH = 64;

private:
    CanonicalPayload() = delete;
};

}
