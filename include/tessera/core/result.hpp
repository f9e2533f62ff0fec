#pragma once
#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
namespace tessera::protocol {

struct Unit {
    constexpr bool operator==(const Unit&) const noexcept { return true; }
};
inline constexpr Unit unit{};

template<typename T, typename E>
class Result;

/// Thrown by Unwrap()/UnwrapErr() on the wrong alternative. Library code
/// checks IsOk()/IsErr() first; only tests unwrap blindly.
class BadResultAccess : public std::logic_error {
public:
    using std::logic_error::logic_error;
};

namespace detail {
    template<typename E, typename = void>
    struct HasMessage : std::false_type {};

    template<typename E>
    struct HasMessage<E, std::void_t<decltype(std::string_view(std::declval<const E&>().message))>>
        : std::true_type {};

    template<typename E>
    std::string DescribeUnwrapOfErr(const E& error) {
        std::string text = "tessera: Unwrap() on an error result";
        if constexpr (HasMessage<E>::value) {
            text += ": ";
            text += std::string_view(error.message);
        }
        return text;
    }
}

/// Error half of a Result on its way out of a function. Converts into any
/// Result with the same error type, whatever its value type.
template<typename E>
struct PendingErr {
    E error;

    template<typename T>
    operator Result<T, E>() && {
        return Result<T, E>::Err(std::move(error));
    }
};

/**
 * @brief Value-or-failure return used across the library
 *
 * Holds exactly one of T (Ok) or E (Err). Nothing in the library throws
 * on the failure path; errors travel back through this type.
 */
template<typename T, typename E>
class Result {
public:
    using value_type = T;
    using error_type = E;

    static Result Ok(T value) {
        return Result(std::in_place_index<kOk>, std::move(value));
    }
    static Result Err(E error) {
        return Result(std::in_place_index<kErr>, std::move(error));
    }

    [[nodiscard]] bool IsOk() const noexcept { return value_.index() == kOk; }
    [[nodiscard]] bool IsErr() const noexcept { return value_.index() == kErr; }

    [[nodiscard]] T& Unwrap() & {
        RequireOk();
        return std::get<kOk>(value_);
    }
    [[nodiscard]] const T& Unwrap() const& {
        RequireOk();
        return std::get<kOk>(value_);
    }
    [[nodiscard]] T&& Unwrap() && {
        RequireOk();
        return std::get<kOk>(std::move(value_));
    }

    [[nodiscard]] E& UnwrapErr() & {
        RequireErr();
        return std::get<kErr>(value_);
    }
    [[nodiscard]] const E& UnwrapErr() const& {
        RequireErr();
        return std::get<kErr>(value_);
    }
    [[nodiscard]] E&& UnwrapErr() && {
        RequireErr();
        return std::get<kErr>(std::move(value_));
    }

    /// Moves the error out for TESSERA_TRY. Only valid on Err.
    [[nodiscard]] PendingErr<E> Propagate() && {
        RequireErr();
        return PendingErr<E>{std::get<kErr>(std::move(value_))};
    }

    template<typename F>
    [[nodiscard]] auto Map(F&& func) && -> Result<std::invoke_result_t<F, T>, E> {
        using U = std::invoke_result_t<F, T>;
        if (IsErr()) {
            return Result<U, E>::Err(std::get<kErr>(std::move(value_)));
        }
        return Result<U, E>::Ok(std::forward<F>(func)(std::get<kOk>(std::move(value_))));
    }

    template<typename F>
    [[nodiscard]] auto MapErr(F&& func) && -> Result<T, std::invoke_result_t<F, E>> {
        using U = std::invoke_result_t<F, E>;
        if (IsOk()) {
            return Result<T, U>::Ok(std::get<kOk>(std::move(value_)));
        }
        return Result<T, U>::Err(std::forward<F>(func)(std::get<kErr>(std::move(value_))));
    }

private:
    static constexpr std::size_t kOk = 0;
    static constexpr std::size_t kErr = 1;

    template<std::size_t I, typename Arg>
    Result(std::in_place_index_t<I> index, Arg&& arg)
        : value_(index, std::forward<Arg>(arg)) {}

    void RequireOk() const {
        if (IsErr()) {
            throw BadResultAccess(detail::DescribeUnwrapOfErr(std::get<kErr>(value_)));
        }
    }
    void RequireErr() const {
        if (IsOk()) {
            throw BadResultAccess("tessera: UnwrapErr() on an ok result");
        }
    }

    std::variant<T, E> value_;
};

// Early-returns the error of any Result<T, E> from a function returning
// Result<U, E>.
#define TESSERA_TRY(result_expr) \
    do { \
        auto&& tessera_try_result_ = (result_expr); \
        if (tessera_try_result_.IsErr()) { \
            return std::move(tessera_try_result_).Propagate(); \
        } \
    } while (0)
}
