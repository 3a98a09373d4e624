// PathUtils Header
#pragma once
#include <string>
#include <filesystem>

namespace forker::infrastructure {

class PathUtils {
public:
    static std::filesystem::path GetDataHome();
    static std::filesystem::path GetConfigHome();

    /** @brief $XDG_DATA_HOME/Forker/state, the default state directory. */
    static std::filesystem::path GetDefaultStateDir();

    /** @brief $XDG_CONFIG_HOME/Forker/settings.json. */
    static std::filesystem::path GetDefaultConfigPath();

    /** @brief True if @p path, after lexical normalization, lies strictly inside @p root. */
    static bool IsWithinRoot(const std::filesystem::path& path, const std::filesystem::path& root);

    /** @brief True if @p path itself is a symbolic link (the link is not followed). */
    static bool IsSymlink(const std::filesystem::path& path);
};

} // namespace forker::infrastructure
