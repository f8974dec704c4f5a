#include "BinaryLocator.h"
#include "DebugLogger.h"

#include <cstdlib>
#include <filesystem>
#include <sstream>

#include <unistd.h>

namespace YtMerge {

namespace fs = std::filesystem;

namespace {

bool isExecutableFile(const fs::path& p) {
    std::error_code ec;
    return fs::is_regular_file(p, ec) && access(p.c_str(), X_OK) == 0;
}

std::string resolveTool(const char* envVar, const std::string& name) {
    const char* envPath = std::getenv(envVar);
    if (envPath != nullptr && envPath[0] != '\0') {
        if (isExecutableFile(envPath)) {
            return envPath;
        }
        DebugLogger::getInstance().log(std::string("[Toolchain] ") + envVar + "=" + envPath +
                                       " is not an executable file, searching PATH");
    }
    return findExecutable(name);
}

} // namespace

std::string findExecutable(const std::string& name) {
    if (name.find('/') != std::string::npos) {
        return isExecutableFile(name) ? name : "";
    }

    const char* pathEnv = std::getenv("PATH");
    if (!pathEnv) return "";

    std::stringstream ss(pathEnv);
    std::string dir;
    while (std::getline(ss, dir, ':')) {
        if (dir.empty()) dir = ".";
        fs::path candidate = fs::path(dir) / name;
        if (isExecutableFile(candidate)) {
            return candidate.string();
        }
    }
    return "";
}

bool resolveToolchain(Toolchain& toolchain, std::string& error) {
    toolchain.ffmpegPath = resolveTool("YTMERGE_FFMPEG_PATH", "ffmpeg");
    if (toolchain.ffmpegPath.empty()) {
        error = "ffmpeg was not found on your system PATH.\n"
                "Install it from https://ffmpeg.org/download.html or set YTMERGE_FFMPEG_PATH.";
        return false;
    }

    toolchain.ytDlpPath = resolveTool("YTMERGE_YTDLP_PATH", "yt-dlp");
    if (toolchain.ytDlpPath.empty()) {
        error = "yt-dlp was not found on your system PATH.\n"
                "Install it with 'pip install yt-dlp' or set YTMERGE_YTDLP_PATH.";
        return false;
    }

    DebugLogger::getInstance().write("[Toolchain] ffmpeg: " + toolchain.ffmpegPath);
    DebugLogger::getInstance().write("[Toolchain] yt-dlp: " + toolchain.ytDlpPath);
    error.clear();
    return true;
}

} // namespace YtMerge
