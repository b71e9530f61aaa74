#pragma once

#include <stdexcept>
#include <string>
#include <vector>

#include "common/models.hpp"

namespace drvkeep {

// The device database could not be queried. Fatal to a backup run.
class EnumerationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Enumerates the installed signed drivers as one completed batch.
class DriverSource
{
public:
    virtual ~DriverSource() = default;

    // Throws EnumerationError when the source is unavailable.
    virtual std::vector<RawDriverRecord> enumerate() = 0;

    // Human-readable origin for logs and error messages.
    virtual std::string describe() const = 0;
};

} // namespace drvkeep
