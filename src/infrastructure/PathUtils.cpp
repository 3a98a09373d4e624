#include "infrastructure/PathUtils.hpp"
#include <cstdlib>
#include <filesystem>
#include <system_error>

namespace forker::infrastructure {

namespace fs = std::filesystem;

fs::path PathUtils::GetDataHome() {
    const char* xdgDataHome = std::getenv("XDG_DATA_HOME");
    if (xdgDataHome && *xdgDataHome) {
        return fs::path(xdgDataHome);
    }
    const char* home = std::getenv("HOME");
    if (home && *home) {
        return fs::path(home) / ".local" / "share";
    }
    return fs::current_path(); // Fallback
}

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

fs::path PathUtils::GetDefaultStateDir() {
    // Created by the state store on first use.
    return GetDataHome() / "Forker" / "state";
}

fs::path PathUtils::GetDefaultConfigPath() {
    return GetConfigHome() / "Forker" / "settings.json";
}

bool PathUtils::IsWithinRoot(const fs::path& path, const fs::path& root) {
    fs::path p = fs::absolute(path).lexically_normal();
    fs::path r = fs::absolute(root).lexically_normal();
    if (r.filename().empty()) r = r.parent_path();

    fs::path rel = p.lexically_relative(r);
    if (rel.empty() || rel == ".") return false;
    return *rel.begin() != "..";
}

bool PathUtils::IsSymlink(const fs::path& path) {
    std::error_code ec;
    return fs::is_symlink(fs::symlink_status(path, ec));
}

} // namespace forker::infrastructure
