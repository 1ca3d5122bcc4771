// PathUtils Header
#pragma once
#include <string>
#include <filesystem>

namespace bidlens::infrastructure {

class PathUtils {
public:
    static std::filesystem::path GetDataHome();
    static std::filesystem::path GetConfigHome();
    static std::filesystem::path GetCacheHome();

    /// $XDG_DATA_HOME/BidLens/models (whisper ggml files).
    static std::filesystem::path GetModelsDir();
    /// $XDG_DATA_HOME/BidLens/sessions
    static std::filesystem::path GetSessionsDir();
    /// $XDG_CACHE_HOME/BidLens
    static std::filesystem::path GetAppCacheDir();
    /// $XDG_CONFIG_HOME/BidLens/settings.json
    static std::filesystem::path GetDefaultSettingsPath();
};

} // namespace bidlens::infrastructure
