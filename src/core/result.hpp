/**
 * @file result.hpp
 * @brief Monadic error handling type for FleetMirror.
 * @author Dimitris Kafetzis
 *
 * Provides Result<T, E> as the error-handling mechanism across component
 * boundaries. The default error type carries the classification that the
 * retry policy and the setup path act on, so an error's kind, HTTP status and
 * retry-after hint survive every layer unchanged.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

namespace fleet_mirror {

/**
 * @brief Classification of a failed operation.
 */
enum class ErrorKind : uint8_t {
    Connection,       ///< Transport failure, retryable
    Timeout,          ///< Call exceeded its deadline, retryable
    RateLimited,      ///< HTTP 429, retryable, may carry retry-after
    Authentication,   ///< HTTP 401, terminal
    Authorization,    ///< HTTP 403, terminal
    Server,           ///< HTTP 5xx, retryable
    Client,           ///< Other HTTP 4xx, not retried
    Configuration,    ///< Invalid local configuration
    Unknown           ///< Unexpected failure
};

[[nodiscard]] constexpr std::string_view to_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::Connection:     return "connection";
        case ErrorKind::Timeout:        return "timeout";
        case ErrorKind::RateLimited:    return "rate_limited";
        case ErrorKind::Authentication: return "authentication";
        case ErrorKind::Authorization:  return "authorization";
        case ErrorKind::Server:         return "server";
        case ErrorKind::Client:         return "client";
        case ErrorKind::Configuration:  return "configuration";
        case ErrorKind::Unknown:        return "unknown";
    }
    return "unknown";
}

/**
 * @brief Error type carrying a descriptive message and its classification.
 */
struct Error {
    std::string message;
    ErrorKind kind{ErrorKind::Unknown};
    std::optional<int> status_code;
    std::optional<std::chrono::seconds> retry_after;

    explicit Error(std::string msg) : message(std::move(msg)) {}

    Error(ErrorKind k, std::string msg, std::optional<int> status = std::nullopt)
        : message(std::move(msg)), kind(k), status_code(status) {}

    [[nodiscard]] const std::string& what() const noexcept { return message; }

    [[nodiscard]] bool is_auth_failure() const noexcept {
        return kind == ErrorKind::Authentication || kind == ErrorKind::Authorization;
    }
};

/**
 * @brief Result<T, E>: a monadic error type.
 *
 * Holds either a success value of type T or an error of type E.
 */
template <typename T, typename E = Error>
class Result {
public:
    // ── Constructors ──────────────────────────

    /// Construct a success result.
    Result(T value) : storage_(std::move(value)) {}  // NOLINT(implicit)

    /// Construct an error result.
    Result(E error) : storage_(std::move(error)) {}  // NOLINT(implicit)

    // ── Observers ─────────────────────────────

    [[nodiscard]] bool has_value() const noexcept {
        return std::holds_alternative<T>(storage_);
    }

    [[nodiscard]] explicit operator bool() const noexcept {
        return has_value();
    }

    [[nodiscard]] T& value() & {
        if (!has_value()) throw std::runtime_error("Result has no value");
        return std::get<T>(storage_);
    }

    [[nodiscard]] const T& value() const& {
        if (!has_value()) throw std::runtime_error("Result has no value");
        return std::get<T>(storage_);
    }

    [[nodiscard]] T&& value() && {
        if (!has_value()) throw std::runtime_error("Result has no value");
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

    // ── Monadic operations ────────────────────

    /// Transform the success value.
    template <typename F>
    auto map(F&& func) const -> Result<std::invoke_result_t<F, const T&>, E> {
        if (has_value()) {
            return func(value());
        }
        return error();
    }

    /// Chain with a function that returns a Result.
    template <typename F>
    auto and_then(F&& func) const -> std::invoke_result_t<F, const T&> {
        if (has_value()) {
            return func(value());
        }
        return error();
    }

    /// Provide a fallback value.
    [[nodiscard]] T value_or(T default_value) const& {
        if (has_value()) return value();
        return default_value;
    }

private:
    std::variant<T, E> storage_;
};

/**
 * @brief Specialization of Result for void success type.
 */
template <typename E>
class Result<void, E> {
public:
    Result() : has_value_(true) {}
    Result(E error) : error_(std::move(error)), has_value_(false) {}  // NOLINT(implicit)

    [[nodiscard]] bool has_value() const noexcept { return has_value_; }
    [[nodiscard]] explicit operator bool() const noexcept { return has_value_; }

    [[nodiscard]] E& error() & {
        if (has_value_) throw std::runtime_error("Result has no error");
        return *error_;
    }

    [[nodiscard]] const E& error() const& {
        if (has_value_) throw std::runtime_error("Result has no error");
        return *error_;
    }

private:
    std::optional<E> error_;
    bool has_value_;
};

/// Convenience factory for error results.
template <typename T, typename E = Error>
Result<T, E> make_error(ErrorKind kind, std::string message) {
    return Result<T, E>(E{kind, std::move(message)});
}

}  // namespace fleet_mirror
