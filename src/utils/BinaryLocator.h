#pragma once

#include <string>

namespace YtMerge {

// First executable named 'name' on PATH, or empty
std::string findExecutable(const std::string& name);

/**
 * @brief Resolved external tool paths
 */
struct Toolchain {
    std::string ffmpegPath;
    std::string ytDlpPath;
};

/**
 * @brief Locate ffmpeg and yt-dlp
 *
 * YTMERGE_FFMPEG_PATH / YTMERGE_YTDLP_PATH win over PATH lookup.
 * @param error Explains which tool is missing and how to install it
 * @return true if both tools were found
 */
bool resolveToolchain(Toolchain& toolchain, std::string& error);

} // namespace YtMerge
