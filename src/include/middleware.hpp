#ifndef ARBOR_MIDDLEWARE_HPP
#define ARBOR_MIDDLEWARE_HPP

#include "common.hpp"

// abstract base class for response body transformations
class Middleware
{
public:
    // virtual destructor for proper cleanup in derived classes
    virtual ~Middleware() = default;

    // transform a response body; throws std::runtime_error on failure
    [[nodiscard]] virtual std::string process(const std::string &data) = 0;

    // value for the Content-Encoding header of processed bodies
    [[nodiscard]] virtual std::string_view encoding() const noexcept = 0;

    // disable copy operations
    Middleware(const Middleware &) = delete;
    Middleware &operator=(const Middleware &) = delete;

protected:
    // protected constructor to prevent direct instantiation
    Middleware() = default;
};

#endif // ARBOR_MIDDLEWARE_HPP