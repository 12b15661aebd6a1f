#pragma once

#include <stdexcept>
#include <string>

// Invalid viewport, resolution, budget, lane width or output buffer.
// Raised before any computation starts.
class ConfigurationError : public std::invalid_argument
{
public:
    explicit ConfigurationError(const std::string &message)
        : std::invalid_argument(message)
    {
    }
};

// Iteration budget does not fit the count type of the requested grid
class NumericOverflowError : public std::overflow_error
{
public:
    explicit NumericOverflowError(const std::string &message)
        : std::overflow_error(message)
    {
    }
};
