#pragma once

#include "core/Entry.h"
#include "core/Reporting.h"
#include "core/Result.h"
#include "core/RunSettings.h"
#include "download/DownloadService.h"
#include "download/FetchManager.h"
#include "utils/ProcessUtils.h"
#include "video/EncoderProfile.h"
#include "video/MediaProbe.h"

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace YtMerge {

/**
 * @brief External collaborators of a MergeEngine
 *
 * Pointers are non-owning and must outlive the engine.
 */
struct EngineServices {
    std::string ffmpegPath;
    ProcessRunner* runner = nullptr;
    DownloadService* downloader = nullptr;
    MediaProbe* probe = nullptr;
    // Backoff between fetch attempts; empty = real, cancellable sleep
    FetchManager::SleepFunction sleeper;
};

/**
 * @brief Runs a batch through fetch, normalize, merge and finalize
 *
 * Fetches run in parallel up to RunSettings::maxConcurrentDownloads;
 * normalizing, merging and the music overlay run one at a time.
 * run() blocks, so callers with a UI start it on a worker thread and
 * poll Entry snapshots for display.
 */
class MergeEngine {
public:
    MergeEngine(const RunSettings& settings,
                const EncoderProfile& encoder,
                EngineServices services,
                LogSink& log,
                StageProgressSink& progress);
    ~MergeEngine();

    MergeEngine(const MergeEngine&) = delete;
    MergeEngine& operator=(const MergeEngine&) = delete;

    void addEntry(std::shared_ptr<Entry> entry);
    std::vector<EntrySnapshot> snapshots() const;

    /**
     * @brief Execute the whole pipeline
     * @return true if the output file was written
     */
    bool run();

    // Request a stop at the next check point. Async-signal-safe.
    void cancel() noexcept { m_cancelled.store(true); }
    bool isCancelled() const noexcept { return m_cancelled.load(); }

    const OpError& getLastError() const { return m_lastError; }
    const std::string& getCacheDir() const { return m_cacheDir; }
    const EncoderProfile& getEncoder() const { return m_encoder; }

private:
    OpResult stageFetch();
    OpResult stageNormalize();
    OpResult stageMerge();
    void stageFinalize();

    void logBanner(const std::string& title);
    void reportProgress(const char* stage, size_t completed, size_t total);
    bool fail(const OpResult& result);

    RunSettings m_settings;
    EncoderProfile m_encoder;
    EngineServices m_services;
    LogSink& m_log;
    StageProgressSink& m_progress;
    std::string m_cacheDir;

    std::vector<std::shared_ptr<Entry>> m_entries;
    std::atomic<bool> m_cancelled{false};
    std::mutex m_progressMutex;
    OpError m_lastError;
};

} // namespace YtMerge
