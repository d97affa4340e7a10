/**
 * @file error.hpp
 * @brief Error classification and sanitization helpers.
 * @author Dimitris Kafetzis
 *
 * Maps provider responses onto ErrorKind, decides retryability, and strips
 * credentials from anything that ends up in a log line.
 */

#pragma once

#include "core/result.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace fleet_mirror {

/// Map an HTTP status code onto an ErrorKind. Status 0 means no response.
[[nodiscard]] ErrorKind classify_status(int status_code) noexcept;

/// Build an Error from an HTTP status, classifying it.
[[nodiscard]] Error error_from_status(int status_code,
                                      std::string message,
                                      std::optional<std::chrono::seconds> retry_after = std::nullopt);

/// Kinds the retry policy may retry: connection, timeout, rate-limited, server.
[[nodiscard]] constexpr bool is_retryable(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::Connection:
        case ErrorKind::Timeout:
        case ErrorKind::RateLimited:
        case ErrorKind::Server:
            return true;
        default:
            return false;
    }
}

/// Replace every occurrence of @p secret in @p text with a redaction marker.
[[nodiscard]] std::string redact(std::string text, std::string_view secret);

/// "kind: message [status N]" for logs.
[[nodiscard]] std::string describe(const Error& error);

}  // namespace fleet_mirror
