#include "infrastructure/PathUtils.hpp"
#include <cctype>
#include <cstdlib>
#include <filesystem>

namespace discarchiver::infrastructure {

namespace fs = std::filesystem;

fs::path PathUtils::GetConfigHome() {
    const char* xdgConfigHome = std::getenv("XDG_CONFIG_HOME");
    if (xdgConfigHome && *xdgConfigHome) {
        return fs::path(xdgConfigHome);
    }
    const char* home = std::getenv("HOME");
    if (home && *home) {
        return fs::path(home) / ".config";
    }
    return fs::current_path();
}

bool PathUtils::EndsWithIgnoreCase(const std::string& name, const std::string& suffix) {
    if (suffix.size() > name.size()) {
        return false;
    }
    size_t offset = name.size() - suffix.size();
    for (size_t i = 0; i < suffix.size(); ++i) {
        unsigned char a = static_cast<unsigned char>(name[offset + i]);
        unsigned char b = static_cast<unsigned char>(suffix[i]);
        if (std::tolower(a) != std::tolower(b)) {
            return false;
        }
    }
    return true;
}

} // namespace discarchiver::infrastructure
