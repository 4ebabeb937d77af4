#pragma once

#include <stdexcept>
#include <string>

namespace marketlens {

// Upstream contract violation: malformed candle, non-monotonic timestamps.
// Never raised for short or degenerate (but well-formed) input.
class InvalidInputError : public std::runtime_error {
public:
    explicit InvalidInputError(const std::string& message)
        : std::runtime_error("invalid input: " + message) {}
};

} // namespace marketlens
