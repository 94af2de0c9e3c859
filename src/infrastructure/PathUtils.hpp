// PathUtils Header
#pragma once
#include <string>
#include <filesystem>

namespace discarchiver::infrastructure {

class PathUtils {
public:
    static std::filesystem::path GetConfigHome();

    /** @brief Returns true if name ends with suffix, ignoring ASCII case. */
    static bool EndsWithIgnoreCase(const std::string& name, const std::string& suffix);
};

} // namespace discarchiver::infrastructure
