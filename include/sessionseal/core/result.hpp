#pragma once
#include <variant>
#include <utility>
#include <functional>
#include <type_traits>
#include <stdexcept>
namespace sessionseal {
template<typename T, typename E>
class Result;
struct Unit {
    constexpr bool operator==(const Unit&) const noexcept { return true; }
    constexpr bool operator!=(const Unit&) const noexcept { return false; }
};
inline constexpr Unit unit{};
template<typename T, typename E>
class Result {
private:
    std::variant<T, E> value_;
    bool is_ok_;
public:
    Result(const Result&) = default;
    Result(Result&&) noexcept = default;
    Result& operator=(const Result&) = default;
    Result& operator=(Result&&) noexcept = default;
    ~Result() = default;
    static Result Ok(T value) {
        return Result(std::in_place_index<0>, std::move(value));
    }
    static Result Err(E error) {
        return Result(std::in_place_index<1>, std::move(error));
    }
    [[nodiscard]] bool IsOk() const noexcept { return is_ok_; }
    [[nodiscard]] bool IsErr() const noexcept { return !is_ok_; }
    [[nodiscard]] T& Unwrap() & {
        if (IsErr()) {
            throw std::runtime_error("Called Unwrap() on an Err Result");
        }
        return std::get<0>(value_);
    }
    [[nodiscard]] const T& Unwrap() const& {
        if (IsErr()) {
            throw std::runtime_error("Called Unwrap() on an Err Result");
        }
        return std::get<0>(value_);
    }
    [[nodiscard]] T&& Unwrap() && {
        if (IsErr()) {
            throw std::runtime_error("Called Unwrap() on an Err Result");
        }
        return std::get<0>(std::move(value_));
    }
    [[nodiscard]] E& UnwrapErr() & {
        if (IsOk()) {
            throw std::runtime_error("Called UnwrapErr() on an Ok Result");
        }
        return std::get<1>(value_);
    }
    [[nodiscard]] const E& UnwrapErr() const& {
        if (IsOk()) {
            throw std::runtime_error("Called UnwrapErr() on an Ok Result");
        }
        return std::get<1>(value_);
    }
    [[nodiscard]] E&& UnwrapErr() && {
        if (IsOk()) {
            throw std::runtime_error("Called UnwrapErr() on an Ok Result");
        }
        return std::get<1>(std::move(value_));
    }
    template<typename F>
    [[nodiscard]] auto Map(F&& func) && -> Result<std::invoke_result_t<F, T>, E> {
        using U = std::invoke_result_t<F, T>;
        if (IsOk()) {
            return Result<U, E>::Ok(std::forward<F>(func)(std::get<0>(std::move(value_))));
        }
        return Result<U, E>::Err(std::get<1>(std::move(value_)));
    }
    template<typename F>
    [[nodiscard]] auto Bind(F&& func) && -> std::invoke_result_t<F, T> {
        using ResultType = std::invoke_result_t<F, T>;
        static_assert(std::is_same_v<typename ResultType::error_type, E>,
                      "Bind function must return Result with same error type");
        if (IsOk()) {
            return std::forward<F>(func)(std::get<0>(std::move(value_)));
        }
        return ResultType::Err(std::get<1>(std::move(value_)));
    }
    using value_type = T;
    using error_type = E;
private:
    template<std::size_t I, typename... Args>
    explicit Result(std::in_place_index_t<I> idx, Args&&... args)
        : value_(idx, std::forward<Args>(args)...)
        , is_ok_(I == 0) {}
};
}
