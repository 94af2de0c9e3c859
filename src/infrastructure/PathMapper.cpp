#include "infrastructure/PathMapper.hpp"

namespace discarchiver::infrastructure {

namespace fs = std::filesystem;

PathMapper::PathMapper(const std::string& foreignPrefix, const std::string& localPrefix)
    : m_foreignPrefix(foreignPrefix), m_localPrefix(localPrefix) {}

std::optional<fs::path> PathMapper::map(const std::string& sourcePath) const {
    if (m_foreignPrefix.empty() || sourcePath.rfind(m_foreignPrefix, 0) != 0) {
        return std::nullopt;
    }
    return fs::path(m_localPrefix + sourcePath.substr(m_foreignPrefix.size()));
}

} // namespace discarchiver::infrastructure
