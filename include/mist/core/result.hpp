#pragma once
#include <cstddef>
#include <optional>
#include <stdexcept>
#include <type_traits>
#include <utility>
#include <variant>

namespace mist::protocol {

/// Value type of results that carry no payload.
struct Unit {
    constexpr bool operator==(const Unit&) const noexcept { return true; }
    constexpr bool operator!=(const Unit&) const noexcept { return false; }
};
inline constexpr Unit unit{};

/// Thrown when the wrong side of a Result is unwrapped.
class BadResultAccess final : public std::logic_error {
public:
    using std::logic_error::logic_error;
};

/**
 * @brief Either a value or an error, never both
 *
 * Every fallible operation in the library returns one of these instead of
 * throwing. Unwrapping the wrong side is a programming error and throws
 * BadResultAccess.
 *
 * @code
 * auto decoded = EnvelopeCodec::Decode(json);
 * if (decoded.IsErr()) {
 *     return Result<Unit, ProtocolFailure>::Err(decoded.UnwrapErr());
 * }
 * Dispatch(std::move(decoded).Unwrap());
 * @endcode
 */
template<typename T, typename E>
class Result {
    static constexpr std::size_t kValueIndex = 0;
    static constexpr std::size_t kErrorIndex = 1;

public:
    using value_type = T;
    using error_type = E;

    [[nodiscard]] static Result Ok(T value) {
        return Result(std::in_place_index<kValueIndex>, std::move(value));
    }

    [[nodiscard]] static Result Err(E error) {
        return Result(std::in_place_index<kErrorIndex>, std::move(error));
    }

    [[nodiscard]] static Result FromOptional(std::optional<T> value, E error_if_absent) {
        return value.has_value() ? Ok(std::move(*value)) : Err(std::move(error_if_absent));
    }

    [[nodiscard]] bool IsOk() const noexcept { return storage_.index() == kValueIndex; }
    [[nodiscard]] bool IsErr() const noexcept { return storage_.index() == kErrorIndex; }

    /// True when this is an error the predicate accepts.
    template<typename Pred>
    [[nodiscard]] bool IsErrAnd(Pred&& pred) const {
        return IsErr() && std::forward<Pred>(pred)(std::get<kErrorIndex>(storage_));
    }

    [[nodiscard]] T& Unwrap() & {
        RequireOk();
        return std::get<kValueIndex>(storage_);
    }
    [[nodiscard]] const T& Unwrap() const& {
        RequireOk();
        return std::get<kValueIndex>(storage_);
    }
    [[nodiscard]] T&& Unwrap() && {
        RequireOk();
        return std::get<kValueIndex>(std::move(storage_));
    }

    [[nodiscard]] E& UnwrapErr() & {
        RequireErr();
        return std::get<kErrorIndex>(storage_);
    }
    [[nodiscard]] const E& UnwrapErr() const& {
        RequireErr();
        return std::get<kErrorIndex>(storage_);
    }
    [[nodiscard]] E&& UnwrapErr() && {
        RequireErr();
        return std::get<kErrorIndex>(std::move(storage_));
    }

    [[nodiscard]] T UnwrapOr(T fallback) && {
        return IsOk() ? std::get<kValueIndex>(std::move(storage_)) : std::move(fallback);
    }

    template<typename F>
    [[nodiscard]] auto Map(F&& func) && -> Result<std::invoke_result_t<F, T>, E> {
        using Mapped = Result<std::invoke_result_t<F, T>, E>;
        if (IsErr()) {
            return Mapped::Err(std::get<kErrorIndex>(std::move(storage_)));
        }
        return Mapped::Ok(std::forward<F>(func)(std::get<kValueIndex>(std::move(storage_))));
    }

    template<typename F>
    [[nodiscard]] auto MapErr(F&& func) && -> Result<T, std::invoke_result_t<F, E>> {
        using Mapped = Result<T, std::invoke_result_t<F, E>>;
        if (IsOk()) {
            return Mapped::Ok(std::get<kValueIndex>(std::move(storage_)));
        }
        return Mapped::Err(std::forward<F>(func)(std::get<kErrorIndex>(std::move(storage_))));
    }

    /// Chains a step that can itself fail with the same error type.
    template<typename F>
    [[nodiscard]] auto Bind(F&& func) && -> std::invoke_result_t<F, T> {
        using Next = std::invoke_result_t<F, T>;
        static_assert(std::is_same_v<typename Next::error_type, E>,
                      "Bind requires a step with the same error type");
        if (IsErr()) {
            return Next::Err(std::get<kErrorIndex>(std::move(storage_)));
        }
        return std::forward<F>(func)(std::get<kValueIndex>(std::move(storage_)));
    }

private:
    template<std::size_t I, typename Arg>
    Result(std::in_place_index_t<I> index, Arg&& arg)
        : storage_(index, std::forward<Arg>(arg)) {}

    void RequireOk() const {
        if (!IsOk()) {
            throw BadResultAccess("Unwrap() called on an error result");
        }
    }

    void RequireErr() const {
        if (!IsErr()) {
            throw BadResultAccess("UnwrapErr() called on a successful result");
        }
    }

    std::variant<T, E> storage_;
};

}
