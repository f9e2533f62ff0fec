#include <catch2/catch_test_macros.hpp>
#include "tessera/core/result.hpp"
#include "tessera/core/failures.hpp"
#include <string>

using namespace tessera::protocol;

namespace {
    Result<Unit, ProtocolFailure> FailWhen(const bool fail) {
        if (fail) {
            return Result<Unit, ProtocolFailure>::Err(ProtocolFailure::InvalidInput("requested failure"));
        }
        return Result<Unit, ProtocolFailure>::Ok(unit);
    }

    Result<Unit, ProtocolFailure> TwoSteps(const bool fail_first, const bool fail_second, int& steps) {
        TESSERA_TRY(FailWhen(fail_first));
        ++steps;
        TESSERA_TRY(FailWhen(fail_second));
        ++steps;
        return Result<Unit, ProtocolFailure>::Ok(unit);
    }

    Result<int, ProtocolFailure> ParsedLength(const bool fail) {
        TESSERA_TRY(FailWhen(fail));
        return Result<int, ProtocolFailure>::Ok(3);
    }
}

TEST_CASE("Result<T, E> - Basic operations", "[result][core]") {
    SECTION("Ok") {
        auto result = Result<int, std::string>::Ok(42);
        REQUIRE(result.IsOk());
        REQUIRE_FALSE(result.IsErr());
        REQUIRE(result.Unwrap() == 42);
    }

    SECTION("Err") {
        auto result = Result<int, std::string>::Err("error");
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr() == "error");
        REQUIRE_THROWS(result.Unwrap());
    }
}

TEST_CASE("Result<T, E> - Map and MapErr", "[result][core]") {
    auto mapped = Result<int, std::string>::Ok(21).Map([](int x) { return x * 2; });
    REQUIRE(mapped.Unwrap() == 42);
    auto err = Result<int, std::string>::Err("e").MapErr([](std::string s) { return s + "!"; });
    REQUIRE(err.UnwrapErr() == "e!");
    auto untouched = Result<int, std::string>::Err("e").Map([](int x) { return x + 1; });
    REQUIRE(untouched.UnwrapErr() == "e");
}

TEST_CASE("TESSERA_TRY - Early return", "[result][core]") {
    int steps = 0;
    REQUIRE(TwoSteps(false, false, steps).IsOk());
    REQUIRE(steps == 2);

    steps = 0;
    auto failed = TwoSteps(false, true, steps);
    REQUIRE(failed.IsErr());
    REQUIRE(failed.UnwrapErr().type == ProtocolFailureType::InvalidInput);
    REQUIRE(steps == 1);

    SECTION("Propagates into a different value type") {
        REQUIRE(ParsedLength(false).Unwrap() == 3);
        auto propagated = ParsedLength(true);
        REQUIRE(propagated.IsErr());
        REQUIRE(propagated.UnwrapErr().message == "requested failure");
    }
}

TEST_CASE("Result<T, E> - Wrong-side access", "[result][core]") {
    auto failed = Result<int, ProtocolFailure>::Err(ProtocolFailure::Handshake("stale pre-key"));
    try {
        (void) failed.Unwrap();
        FAIL("Unwrap() on an error result must throw");
    } catch (const BadResultAccess& e) {
        REQUIRE(std::string(e.what()).find("stale pre-key") != std::string::npos);
    }
    REQUIRE_THROWS_AS(Result<int, ProtocolFailure>::Ok(1).UnwrapErr(), BadResultAccess);
}

TEST_CASE("ProtocolFailure - Session context", "[result][core]") {
    auto failure = ProtocolFailure::AuthenticationFailed("bad tag")
        .WithPeer("did:key:z6MkPeer")
        .WithMessageNumber(7);
    REQUIRE(failure.type == ProtocolFailureType::AuthenticationFailed);
    REQUIRE(failure.peer_id == "did:key:z6MkPeer");
    REQUIRE(failure.message_number == 7u);
    const auto text = failure.ToString();
    REQUIRE(text.find("AuthenticationFailed") != std::string::npos);
    REQUIRE(text.find("peer=did:key:z6MkPeer") != std::string::npos);
    REQUIRE(text.find("message=7") != std::string::npos);
}
