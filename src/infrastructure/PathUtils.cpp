#include "infrastructure/PathUtils.hpp"
#include <cstdlib>
#include <filesystem>
#include <iostream>

namespace bidlens::infrastructure {

namespace fs = std::filesystem;

namespace {

fs::path XdgDir(const char* variable, const fs::path& homeRelative) {
    const char* xdg = std::getenv(variable);
    if (xdg && *xdg) {
        return fs::path(xdg);
    }
    const char* home = std::getenv("HOME");
    if (home && *home) {
        return fs::path(home) / homeRelative;
    }
    return fs::current_path(); // Fallback
}

fs::path EnsureDir(const fs::path& dir) {
    std::error_code ec;
    if (!fs::exists(dir, ec)) {
        fs::create_directories(dir, ec);
        if (ec) {
            std::cerr << "[PathUtils] Cannot create " << dir << ": " << ec.message() << std::endl;
        }
    }
    return dir;
}

} // namespace

fs::path PathUtils::GetDataHome() {
    return XdgDir("XDG_DATA_HOME", fs::path(".local") / "share");
}

fs::path PathUtils::GetConfigHome() {
    return XdgDir("XDG_CONFIG_HOME", ".config");
}

fs::path PathUtils::GetCacheHome() {
    return XdgDir("XDG_CACHE_HOME", ".cache");
}

fs::path PathUtils::GetModelsDir() {
    return EnsureDir(GetDataHome() / "BidLens" / "models");
}

fs::path PathUtils::GetSessionsDir() {
    return EnsureDir(GetDataHome() / "BidLens" / "sessions");
}

fs::path PathUtils::GetAppCacheDir() {
    return EnsureDir(GetCacheHome() / "BidLens");
}

fs::path PathUtils::GetDefaultSettingsPath() {
    return GetConfigHome() / "BidLens" / "settings.json";
}

} // namespace bidlens::infrastructure
