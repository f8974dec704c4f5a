#pragma once

#include <string>
#include <vector>

namespace YtMerge {

// Canonical output format every clip is normalized to
constexpr int TARGET_FPS = 30;
constexpr const char* AUDIO_CODEC = "aac";
constexpr const char* AUDIO_BITRATE = "192k";
constexpr int AUDIO_SAMPLE_RATE = 44100;
constexpr int AUDIO_CHANNELS = 2;

constexpr double DEFAULT_FADE_DURATION = 0.5;
constexpr double DEFAULT_MUSIC_VOLUME = 0.15;
constexpr int DEFAULT_MAX_CONCURRENT_DOWNLOADS = 3;

constexpr int MAX_FETCH_ATTEMPTS = 3;
constexpr int CONCURRENT_FRAGMENTS = 8;
constexpr int NORMALIZE_TIMEOUT_SECONDS = 600;

// Used in crossfade timelines when a clip's duration is unknown
constexpr double FALLBACK_CLIP_DURATION = 5.0;

struct Resolution {
    int width = 1920;
    int height = 1080;
};

// "480p", "720p", "1080p", "1440p"; anything else maps to 1920x1080
Resolution resolutionFromName(const std::string& name);

// Names accepted by resolutionFromName, smallest first
const std::vector<std::string>& resolutionNames();

/**
 * @brief User-facing options for one pipeline run
 */
struct RunSettings {
    std::string resolution = "1080p";
    std::string outputPath;
    std::string outputFormat = "mp4";   // mp4 or mkv

    bool enableTransitions = false;
    double fadeDuration = DEFAULT_FADE_DURATION;

    std::string backgroundMusic;        // empty = no overlay
    double musicVolume = DEFAULT_MUSIC_VOLUME;

    int maxConcurrentDownloads = DEFAULT_MAX_CONCURRENT_DOWNLOADS;

    std::string cacheDir;               // empty = defaultCacheDir()
    bool skipCachedDownloads = true;

    int width() const { return resolutionFromName(resolution).width; }
    int height() const { return resolutionFromName(resolution).height; }

    /**
     * @brief Check option ranges
     * @param error Receives a description of the first problem found
     * @return true if the settings can be used for a run
     */
    bool validate(std::string& error) const;
};

/**
 * @brief Where raw and normalized clips are cached
 *
 * Checks YTMERGE_CACHE_DIR, then XDG_CACHE_HOME/ytmerge, then
 * HOME/.cache/ytmerge, and finally the system temp directory.
 */
std::string defaultCacheDir();

} // namespace YtMerge
