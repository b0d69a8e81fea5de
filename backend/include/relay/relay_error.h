#pragma once

#include <stdexcept>
#include <string>

enum class RelayErrc {
    parse_error,
    validation_error,
    not_found,
};

/**
 * Failure raised while handling a single inbound frame.
 *
 * Never fatal to the session: the dispatcher answers with an `error` frame
 * and keeps the connection open.
 */
class RelayError : public std::runtime_error {
public:
    RelayError(RelayErrc code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    [[nodiscard]] RelayErrc code() const noexcept { return code_; }

private:
    RelayErrc code_;
};

/// Inbound frame is not a decodable JSON object.
class ParseError : public RelayError {
public:
    explicit ParseError(const std::string& message)
        : RelayError(RelayErrc::parse_error, message) {}
};

/// A required field is missing or has the wrong shape.
class ValidationError : public RelayError {
public:
    explicit ValidationError(const std::string& message)
        : RelayError(RelayErrc::validation_error, message) {}
};

class NotFoundError : public RelayError {
public:
    explicit NotFoundError(const std::string& message)
        : RelayError(RelayErrc::not_found, message) {}
};
