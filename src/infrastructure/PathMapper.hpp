// PathMapper Header
#pragma once
#include <filesystem>
#include <optional>
#include <string>

namespace discarchiver::infrastructure {

/**
 * @class PathMapper
 * @brief Rewrites paths from the asset source's namespace (e.g. a container mount)
 *        into the local filesystem.
 */
class PathMapper {
public:
    PathMapper(const std::string& foreignPrefix, const std::string& localPrefix);

    /**
     * @brief Replaces the leading foreign prefix with the local prefix.
     * @return The local path, or nullopt if sourcePath does not start with the foreign prefix.
     */
    std::optional<std::filesystem::path> map(const std::string& sourcePath) const;

    const std::string& foreignPrefix() const { return m_foreignPrefix; }
    const std::string& localPrefix() const { return m_localPrefix; }

private:
    std::string m_foreignPrefix;
    std::string m_localPrefix;
};

} // namespace discarchiver::infrastructure
