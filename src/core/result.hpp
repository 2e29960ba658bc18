/**
 * @file result.hpp
 * @brief Error handling vocabulary for SessionPlanner.
 *
 * Result<T, E> carries recoverable failures (configuration, scenario
 * parsing, preference validation). Broken caller contracts, such as a
 * request with a non-positive duration reaching the engine, are not
 * recoverable and throw ContractViolation instead.
 */

#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

namespace session_planner {

/**
 * @brief Error type carrying a descriptive message.
 */
struct Error {
    std::string message;

    explicit Error(std::string msg) : message(std::move(msg)) {}

    [[nodiscard]] const std::string& what() const noexcept { return message; }

    /// Prefix the message with the location it refers to, e.g. "requests[2]".
    [[nodiscard]] Error in(std::string_view context) const {
        return Error{std::string{context} + ": " + message};
    }
};

/**
 * @brief Thrown when an engine input breaks an invariant that upstream
 *        validation should have enforced.
 */
class ContractViolation : public std::logic_error {
public:
    explicit ContractViolation(const std::string& what) : std::logic_error(what) {}
};

/// Throws ContractViolation with @p what unless @p condition holds.
inline void expects(bool condition, const std::string& what) {
    if (!condition) throw ContractViolation(what);
}

/**
 * @brief Result<T, E>: holds either a success value or an error.
 */
template <typename T, typename E = Error>
class Result {
public:
    Result(T value) : storage_(std::move(value)) {}  // NOLINT(implicit)
    Result(E error) : storage_(std::move(error)) {}  // NOLINT(implicit)

    [[nodiscard]] bool has_value() const noexcept {
        return std::holds_alternative<T>(storage_);
    }

    [[nodiscard]] explicit operator bool() const noexcept {
        return has_value();
    }

    [[nodiscard]] T& value() & {
        if (!has_value()) throw std::runtime_error("Result has no value: " + describe());
        return std::get<T>(storage_);
    }

    [[nodiscard]] const T& value() const& {
        if (!has_value()) throw std::runtime_error("Result has no value: " + describe());
        return std::get<T>(storage_);
    }

    [[nodiscard]] T&& value() && {
        if (!has_value()) throw std::runtime_error("Result has no value: " + describe());
        return std::get<T>(std::move(storage_));
    }

    [[nodiscard]] T& operator*() & { return value(); }
    [[nodiscard]] const T& operator*() const& { return value(); }
    [[nodiscard]] T* operator->() { return &value(); }
    [[nodiscard]] const T* operator->() const { return &value(); }

    [[nodiscard]] E& error() & {
        if (has_value()) throw std::runtime_error("Result has no error");
        return std::get<E>(storage_);
    }

    [[nodiscard]] const E& error() const& {
        if (has_value()) throw std::runtime_error("Result has no error");
        return std::get<E>(storage_);
    }

    /// Chain with a function that returns a Result.
    template <typename F>
    auto and_then(F&& func) const -> std::invoke_result_t<F, const T&> {
        if (has_value()) {
            return func(value());
        }
        return error();
    }

    [[nodiscard]] T value_or(T default_value) const& {
        if (has_value()) return value();
        return default_value;
    }

private:
    [[nodiscard]] std::string describe() const {
        if constexpr (std::is_same_v<E, Error>) {
            return std::get<E>(storage_).message;
        } else {
            return "error";
        }
    }

    std::variant<T, E> storage_;
};

/**
 * @brief Result for operations with no success value (validation).
 */
template <typename E>
class Result<void, E> {
public:
    Result() : has_value_(true) {}
    Result(E error) : error_(std::move(error)), has_value_(false) {}  // NOLINT(implicit)

    [[nodiscard]] bool has_value() const noexcept { return has_value_; }
    [[nodiscard]] explicit operator bool() const noexcept { return has_value_; }

    [[nodiscard]] const E& error() const& {
        if (has_value_) throw std::runtime_error("Result has no error");
        return *error_;
    }

private:
    std::optional<E> error_;
    bool has_value_;
};

template <typename T, typename E = Error>
Result<T, E> make_error(std::string message) {
    return Result<T, E>(E{std::move(message)});
}

}  // namespace session_planner
