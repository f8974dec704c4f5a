#pragma once

#include "core/Entry.h"
#include "core/Reporting.h"
#include "core/Result.h"
#include "core/RunSettings.h"
#include "download/DownloadService.h"
#include "video/MediaProbe.h"

#include <atomic>
#include <functional>
#include <string>

namespace YtMerge {

/**
 * @brief Acquires the source media for one entry
 *
 * Retries failed transfers with exponential backoff (2s, 4s, ...) and can
 * skip the transfer entirely when the cache already holds the file.
 * Safe to call concurrently for different entries.
 */
class FetchManager {
public:
    // Waits the given number of seconds between attempts
    using SleepFunction = std::function<void(int)>;

    FetchManager(const RunSettings& settings,
                 const std::string& cacheDir,
                 DownloadService& service,
                 MediaProbe& probe,
                 LogSink& log,
                 const std::atomic<bool>& cancelFlag,
                 SleepFunction sleeper = SleepFunction());

    OpResult fetch(Entry& entry, size_t indexInBatch, size_t batchTotal);

    // Existing <cache>/<id>_<height>.{mp4,mkv,webm,m4a}, or empty
    std::string findCachedDownload(const std::string& videoId) const;

    /**
     * @brief Locate the file a download actually produced
     *
     * The declared name may carry the pre-merge extension, so the same stem
     * is also tried with .mp4, .mkv, .webm and .m4a.
     */
    static std::string resolveDownloadedFile(const std::string& declaredPath);

private:
    void sleepInterruptibly(int seconds);
    std::string cacheKeyFor(const Entry& entry) const;

    RunSettings m_settings;
    std::string m_cacheDir;
    DownloadService& m_service;
    MediaProbe& m_probe;
    LogSink& m_log;
    const std::atomic<bool>& m_cancelled;
    SleepFunction m_sleeper;
};

} // namespace YtMerge
