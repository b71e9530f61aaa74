#pragma once

#include <filesystem>

#include "core/driver_source.hpp"

namespace drvkeep {

// Passes another source's records through unchanged and saves a copy as
// JSON, so a run can be replayed later with --input.
class RecordingDriverSource : public DriverSource
{
public:
    RecordingDriverSource(DriverSource &inner, std::filesystem::path path);

    // Throws EnumerationError when the copy cannot be written.
    std::vector<RawDriverRecord> enumerate() override;
    std::string describe() const override;

private:
    DriverSource &m_inner;
    std::filesystem::path m_path;
};

} // namespace drvkeep
