#pragma once

#include <stdexcept>
#include <string>

namespace chronicle {

// Caller error. Never retried by the engines.
class InvalidArgumentError : public std::invalid_argument {
public:
    explicit InvalidArgumentError(const std::string& message)
        : std::invalid_argument(message) {}
};

// Malformed or unparseable change-log token / page token.
class InvalidTokenError : public InvalidArgumentError {
public:
    explicit InvalidTokenError(const std::string& detail)
        : InvalidArgumentError(detail.empty() ? "Invalid token" : "Invalid token: " + detail) {}
};

} // namespace chronicle
