#include <catch2/catch_test_macros.hpp>
#include "tessera/identity/canonical_payload.hpp"
#include <string>

using namespace tessera::protocol;
using namespace tessera::protocol::identity;

TEST_CASE("CanonicalPayload - Member order does not matter", "[canonical][identity]") {
    auto first = CanonicalPayload::CanonicalizeJson(R"({"b":"two","a":{"d":true,"c":null}})");
    auto second = CanonicalPayload::CanonicalizeJson(R"({ "a": { "c": null, "d": true }, "b": "two" })");
    REQUIRE(first.IsOk());
    REQUIRE(second.IsOk());
    REQUIRE(first.Unwrap() == R"({"a":{"c":null,"d":true},"b":"two"})");
    REQUIRE(first.Unwrap() == second.Unwrap());
}

TEST_CASE("CanonicalPayload - Signature members are dropped at every depth", "[canonical][identity]") {
    auto plain = CanonicalPayload::CanonicalizeJson(R"({"name":"Alice","profile":{"bio":"hi"}})");
    auto signed_payload = CanonicalPayload::CanonicalizeJson(
        R"({"signature":{"did":"x"},"name":"Alice","profile":{"bio":"hi","signatures":[1,2]}})");
    REQUIRE(plain.IsOk());
    REQUIRE(signed_payload.IsOk());
    REQUIRE(plain.Unwrap() == signed_payload.Unwrap());
}

TEST_CASE("CanonicalPayload - Arrays keep their order", "[canonical][identity]") {
    auto forward = CanonicalPayload::CanonicalizeJson(R"({"tags":["x","y"]})");
    auto reversed = CanonicalPayload::CanonicalizeJson(R"({"tags":["y","x"]})");
    REQUIRE(forward.Unwrap() == R"({"tags":["x","y"]})");
    REQUIRE(forward.Unwrap() != reversed.Unwrap());
}

TEST_CASE("CanonicalPayload - Numbers are stable across spellings", "[canonical][identity]") {
    auto integer = CanonicalPayload::CanonicalizeJson(R"({"rating":5})");
    auto decimal = CanonicalPayload::CanonicalizeJson(R"({"rating":5.0})");
    auto exponent = CanonicalPayload::CanonicalizeJson(R"({"rating":0.5e1})");
    REQUIRE(integer.IsOk());
    REQUIRE(integer.Unwrap() == decimal.Unwrap());
    REQUIRE(integer.Unwrap() == exponent.Unwrap());
}

TEST_CASE("CanonicalPayload - Strings are escaped", "[canonical][identity]") {
    google::protobuf::Struct payload;
    (*payload.mutable_fields())["text"].set_string_value("a\"b\\c\nd\x01");
    auto canonical = CanonicalPayload::Canonicalize(payload);
    REQUIRE(canonical.IsOk());
    REQUIRE(canonical.Unwrap() == R"({"text":"a\"b\\c\nd\u0001"})");
}

TEST_CASE("CanonicalPayload - Rejects malformed payloads", "[canonical][identity]") {
    SECTION("Not JSON") {
        auto result = CanonicalPayload::ParseJson("{name:");
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == ProtocolFailureType::InvalidInput);
    }

    SECTION("Value without a kind") {
        google::protobuf::Struct payload;
        (*payload.mutable_fields())["empty"];
        auto result = CanonicalPayload::Canonicalize(payload);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == ProtocolFailureType::InvalidInput);
    }

    SECTION("Nesting beyond the depth limit") {
        std::string deep;
        for (size_t i = 0; i <= CanonicalPayload::MAX_DEPTH + 1; ++i) {
            deep += R"({"n":)";
        }
        deep += "1";
        for (size_t i = 0; i <= CanonicalPayload::MAX_DEPTH + 1; ++i) {
            deep += "}";
        }
        auto result = CanonicalPayload::CanonicalizeJson(deep);
        REQUIRE(result.IsErr());
    }
}
