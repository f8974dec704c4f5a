#include "RunSettings.h"

#include <cstdlib>
#include <filesystem>

namespace YtMerge {

namespace fs = std::filesystem;

Resolution resolutionFromName(const std::string& name) {
    if (name == "480p")  return {854, 480};
    if (name == "720p")  return {1280, 720};
    if (name == "1080p") return {1920, 1080};
    if (name == "1440p") return {2560, 1440};
    return {1920, 1080};
}

const std::vector<std::string>& resolutionNames() {
    static const std::vector<std::string> names = {"480p", "720p", "1080p", "1440p"};
    return names;
}

bool RunSettings::validate(std::string& error) const {
    if (outputPath.empty()) {
        error = "No output path set";
        return false;
    }
    if (outputFormat != "mp4" && outputFormat != "mkv") {
        error = "Unsupported output format: " + outputFormat + " (expected mp4 or mkv)";
        return false;
    }
    if (enableTransitions && !(fadeDuration > 0.0)) {
        error = "Fade duration must be greater than zero";
        return false;
    }
    if (musicVolume < 0.0 || musicVolume > 4.0) {
        error = "Music volume must be between 0.0 and 4.0";
        return false;
    }
    if (maxConcurrentDownloads < 1) {
        error = "At least one concurrent download is required";
        return false;
    }
    error.clear();
    return true;
}

std::string defaultCacheDir() {
    const char* env = std::getenv("YTMERGE_CACHE_DIR");
    if (env && env[0] != '\0') {
        return env;
    }

    const char* xdg = std::getenv("XDG_CACHE_HOME");
    if (xdg && xdg[0] != '\0') {
        return (fs::path(xdg) / "ytmerge").string();
    }

    const char* home = std::getenv("HOME");
    if (home && home[0] != '\0') {
        return (fs::path(home) / ".cache" / "ytmerge").string();
    }

    std::error_code ec;
    fs::path tmp = fs::temp_directory_path(ec);
    if (ec) {
        return "ytmerge-cache";
    }
    return (tmp / "ytmerge").string();
}

} // namespace YtMerge
