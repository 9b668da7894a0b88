#pragma once

#include <QString>
#include <stdexcept>

namespace roomboard {
namespace core {

// Raised for malformed engine input: bad window bounds, non-positive
// durations or granularity, unparsable times.
class ConfigurationError : public std::runtime_error
{
public:
    explicit ConfigurationError(const QString &message)
        : std::runtime_error(message.toStdString())
    {
    }
};

class InvalidIntervalError : public ConfigurationError
{
public:
    using ConfigurationError::ConfigurationError;
};

} // namespace core
} // namespace roomboard
