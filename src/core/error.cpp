/**
 * @file error.cpp
 * @brief Error classification and sanitization helpers.
 * @author Dimitris Kafetzis
 */

#include "core/error.hpp"

namespace fleet_mirror {

namespace {

constexpr std::string_view REDACTED = "***REDACTED***";

}  // anonymous namespace

ErrorKind classify_status(int status_code) noexcept {
    if (status_code == 0) return ErrorKind::Connection;
    if (status_code == 401) return ErrorKind::Authentication;
    if (status_code == 403) return ErrorKind::Authorization;
    if (status_code == 408) return ErrorKind::Timeout;
    if (status_code == 429) return ErrorKind::RateLimited;
    if (status_code >= 500 && status_code < 600) return ErrorKind::Server;
    if (status_code >= 400 && status_code < 500) return ErrorKind::Client;
    return ErrorKind::Unknown;
}

Error error_from_status(int status_code,
                        std::string message,
                        std::optional<std::chrono::seconds> retry_after) {
    Error err{classify_status(status_code), std::move(message)};
    if (status_code != 0) err.status_code = status_code;
    err.retry_after = retry_after;
    return err;
}

std::string redact(std::string text, std::string_view secret) {
    if (secret.empty()) return text;
    size_t pos = 0;
    while ((pos = text.find(secret, pos)) != std::string::npos) {
        text.replace(pos, secret.size(), REDACTED);
        pos += REDACTED.size();
    }
    return text;
}

std::string describe(const Error& error) {
    std::string out{to_string(error.kind)};
    out += ": ";
    out += error.message;
    if (error.status_code) {
        out += " [status " + std::to_string(*error.status_code) + "]";
    }
    if (error.retry_after) {
        out += " [retry after " + std::to_string(error.retry_after->count()) + "s]";
    }
    return out;
}

}  // namespace fleet_mirror
