#ifndef ARBOR_ERRORS_HPP
#define ARBOR_ERRORS_HPP

#include "common.hpp"

// Outcome classes the router maps onto HTTP status codes
enum class ErrorKind
{
    NOT_FOUND, // 404, logged at info level
    MALFORMED, // 500, bad template or pattern directory
    IO         // 500, filesystem failure other than not-exist
};

class ArborError : public std::runtime_error
{
public:
    ArborError(ErrorKind kind, const std::string &message)
        : std::runtime_error(message), errorKind(kind) {}

    [[nodiscard]] ErrorKind kind() const noexcept { return errorKind; }

private:
    ErrorKind errorKind;
};

class NotFoundError : public ArborError
{
public:
    explicit NotFoundError(const std::string &message)
        : ArborError(ErrorKind::NOT_FOUND, message) {}
};

class MalformedError : public ArborError
{
public:
    explicit MalformedError(const std::string &message)
        : ArborError(ErrorKind::MALFORMED, message) {}
};

class IoError : public ArborError
{
public:
    explicit IoError(const std::string &message)
        : ArborError(ErrorKind::IO, message) {}

    // builds "<what>: <strerror(err)>"
    IoError(const std::string &what, int err)
        : ArborError(ErrorKind::IO, what + ": " + std::string(strerror(err))) {}
};

#endif // ARBOR_ERRORS_HPP
