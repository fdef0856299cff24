#ifndef CACHEERRORS_HPP
#define CACHEERRORS_HPP

#include <stdexcept>
#include <string>

// Invalid construction parameters. Raised before the cache accepts any call.
class ConfigurationError : public std::invalid_argument {
public:
    explicit ConfigurationError(const std::string& message)
        : std::invalid_argument("FlightCache configuration error: " + message) {}
};

// A registry invariant was broken. Never raised in correct operation.
class InternalError : public std::logic_error {
public:
    explicit InternalError(const std::string& message)
        : std::logic_error("FlightCache internal error: " + message) {}
};

#endif // CACHEERRORS_HPP
