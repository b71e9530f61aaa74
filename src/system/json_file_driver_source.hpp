#pragma once

#include <filesystem>

#include "core/driver_source.hpp"

namespace drvkeep {

// Replays a driver list captured earlier (--save-records) or produced by
// another host's Get-CimInstance export.
class JsonFileDriverSource : public DriverSource
{
public:
    explicit JsonFileDriverSource(std::filesystem::path path);

    std::vector<RawDriverRecord> enumerate() override;
    std::string describe() const override;

private:
    std::filesystem::path m_path;
};

} // namespace drvkeep
