#include "MergeEngine.h"
#include "tracing/Tracing.h"
#include "utils/DebugLogger.h"
#include "utils/WorkerPool.h"
#include "video/Normalizer.h"
#include "video/VideoWriter.h"

#include <algorithm>
#include <filesystem>
#include <stdexcept>

namespace YtMerge {

namespace fs = std::filesystem;

MergeEngine::MergeEngine(const RunSettings& settings,
                         const EncoderProfile& encoder,
                         EngineServices services,
                         LogSink& log,
                         StageProgressSink& progress)
    : m_settings(settings)
    , m_encoder(encoder)
    , m_services(std::move(services))
    , m_log(log)
    , m_progress(progress)
{
    if (!m_services.runner || !m_services.downloader || !m_services.probe) {
        throw std::invalid_argument("MergeEngine requires a process runner, download service and media probe");
    }
    m_cacheDir = m_settings.cacheDir.empty() ? defaultCacheDir() : m_settings.cacheDir;
}

MergeEngine::~MergeEngine() = default;

void MergeEngine::addEntry(std::shared_ptr<Entry> entry) {
    if (entry) {
        m_entries.push_back(std::move(entry));
    }
}

std::vector<EntrySnapshot> MergeEngine::snapshots() const {
    std::vector<EntrySnapshot> out;
    out.reserve(m_entries.size());
    for (const auto& e : m_entries) {
        out.push_back(e->snapshot());
    }
    return out;
}

void MergeEngine::logBanner(const std::string& title) {
    const std::string rule(50, '=');
    m_log.log(rule);
    m_log.log(title);
    m_log.log(rule);
}

void MergeEngine::reportProgress(const char* stage, size_t completed, size_t total) {
    std::lock_guard<std::mutex> lock(m_progressMutex);
    m_progress.onStageProgress(stage, completed, total);
}

bool MergeEngine::fail(const OpResult& result) {
    m_lastError = result.error;
    DebugLogger::getInstance().write(std::string("[Engine] run failed (") + errorKindName(result.error.kind) +
                                     "): " + result.error.message);
    return false;
}

bool MergeEngine::run() {
    TRACE_SCOPE("pipeline");
    m_cancelled.store(false);
    m_lastError = OpError();

    const size_t total = m_entries.size();
    if (total == 0) {
        m_log.log("! No videos in queue.");
        return fail(OpResult::fail(ErrorKind::EmptyBatch, "No videos in queue"));
    }

    std::string configError;
    if (!m_settings.validate(configError)) {
        m_log.log("x " + configError);
        return fail(OpResult::fail(ErrorKind::InvalidConfig, configError));
    }

    std::error_code ec;
    fs::create_directories(m_cacheDir, ec);
    if (ec) {
        std::string msg = "Could not create cache directory " + m_cacheDir + ": " + ec.message();
        m_log.log("x " + msg);
        return fail(OpResult::fail(ErrorKind::IoError, msg));
    }

    m_log.log("Engine: " + m_encoder.label() + " | " + std::to_string(total) + " video(s)");
    m_log.log("   Resolution: " + m_settings.resolution);
    m_log.log("   Cache: " + m_cacheDir);

    try {
        OpResult r = stageFetch();
        if (!r) return fail(r);

        r = stageNormalize();
        if (!r) return fail(r);

        r = stageMerge();
        if (!r) return fail(r);

        stageFinalize();

        m_log.log("SUCCESS -> " + r.artifact);
        return true;
    } catch (const std::exception& e) {
        m_log.log(std::string("Pipeline error: ") + e.what());
        return fail(OpResult::fail(ErrorKind::IoError, std::string("Pipeline error: ") + e.what()));
    }
}

OpResult MergeEngine::stageFetch() {
    TRACE_SCOPE("stage-fetch");
    logBanner("STAGE 1 / 3 - Downloading");

    FetchManager fetcher(m_settings, m_cacheDir, *m_services.downloader, *m_services.probe,
                         m_log, m_cancelled, m_services.sleeper);

    const size_t total = m_entries.size();
    size_t completed = 0;
    {
        WorkerPool pool(static_cast<size_t>(std::max(1, m_settings.maxConcurrentDownloads)));
        for (size_t i = 0; i < total; ++i) {
            std::shared_ptr<Entry> entry = m_entries[i];
            if (m_cancelled.load()) {
                entry->setStatus(EntryStatus::Cancelled);
                continue;
            }
            pool.submit([this, &fetcher, &completed, entry, i, total]() {
                try {
                    fetcher.fetch(*entry, i, total);
                } catch (const std::exception& e) {
                    entry->setStatus(EntryStatus::Error, e.what());
                    m_log.log("  x Download error: " + std::string(e.what()));
                }
                std::lock_guard<std::mutex> lock(m_progressMutex);
                ++completed;
                m_progress.onStageProgress(Stage::FETCH, completed, total);
            });
        }
        pool.waitIdle();
    }

    if (m_cancelled.load()) {
        m_log.log("! Cancelled.");
        return OpResult::fail(ErrorKind::Cancelled, "Cancelled");
    }

    size_t ok = std::count_if(m_entries.begin(), m_entries.end(), [](const std::shared_ptr<Entry>& e) {
        return e->getStatus() == EntryStatus::Fetched;
    });
    if (ok == 0) {
        m_log.log("x All downloads failed.");
        return OpResult::fail(ErrorKind::NothingSucceeded, "All downloads failed");
    }
    if (ok < total) {
        m_log.log("! " + std::to_string(total - ok) + " download(s) failed - continuing with " +
                  std::to_string(ok) + ".");
    }
    return OpResult::ok();
}

OpResult MergeEngine::stageNormalize() {
    TRACE_SCOPE("stage-normalize");
    m_log.log("");
    logBanner("STAGE 2 / 3 - Processing & Normalizing");

    Normalizer normalizer(m_settings, m_encoder, m_services.ffmpegPath, m_cacheDir,
                          *m_services.runner, *m_services.probe, m_log, m_cancelled);

    const size_t total = m_entries.size();
    for (size_t i = 0; i < total; ++i) {
        if (m_cancelled.load()) {
            m_log.log("! Cancelled.");
            return OpResult::fail(ErrorKind::Cancelled, "Cancelled");
        }
        Entry& entry = *m_entries[i];
        if (entry.getStatus() == EntryStatus::Fetched) {
            try {
                normalizer.normalize(entry, i, total);
            } catch (const std::exception& e) {
                entry.setStatus(EntryStatus::Error, e.what());
                m_log.log("  x Process error: " + std::string(e.what()));
            }
        }
        reportProgress(Stage::NORMALIZE, i + 1, total);
    }

    size_t ok = std::count_if(m_entries.begin(), m_entries.end(), [](const std::shared_ptr<Entry>& e) {
        return e->getStatus() == EntryStatus::Normalized;
    });
    if (ok == 0) {
        m_log.log("x No videos were processed successfully.");
        return OpResult::fail(ErrorKind::NothingSucceeded, "No videos were processed successfully");
    }
    return OpResult::ok();
}

OpResult MergeEngine::stageMerge() {
    TRACE_SCOPE("stage-merge");
    m_log.log("");
    logBanner("STAGE 3 / 3 - Merging");

    if (m_cancelled.load()) {
        m_log.log("! Cancelled.");
        return OpResult::fail(ErrorKind::Cancelled, "Cancelled");
    }

    std::vector<std::string> ready;
    for (const auto& e : m_entries) {
        if (e->getStatus() != EntryStatus::Normalized) continue;
        std::string path = e->getProcessedPath();
        std::error_code ec;
        if (!path.empty() && fs::is_regular_file(path, ec)) {
            ready.push_back(path);
        }
    }
    if (ready.empty()) {
        m_log.log("x No processed files available to merge.");
        return OpResult::fail(ErrorKind::NothingSucceeded, "No processed files available to merge");
    }

    fs::path output = fs::absolute(m_settings.outputPath);
    if (output.extension().empty()) {
        output += "." + m_settings.outputFormat;
    }
    std::error_code ec;
    if (output.has_parent_path()) {
        fs::create_directories(output.parent_path(), ec);
        if (ec) {
            std::string msg = "Could not create output directory: " + ec.message();
            m_log.log("x " + msg);
            return OpResult::fail(ErrorKind::IoError, msg);
        }
    }

    VideoWriter writer(m_services.ffmpegPath, m_encoder, m_cacheDir,
                       *m_services.runner, *m_services.probe, m_log);
    OpResult r = writer.mergeVideos(ready, output.string(), m_settings.enableTransitions, m_settings.fadeDuration);
    reportProgress(Stage::MERGE, 1, 1);
    if (!r) {
        m_log.log("x Merge failed: " + r.error.message);
    }
    return r;
}

void MergeEngine::stageFinalize() {
    TRACE_SCOPE("stage-finalize");
    const std::string& music = m_settings.backgroundMusic;

    if (!music.empty() && !m_cancelled.load()) {
        std::error_code ec;
        if (!fs::is_regular_file(music, ec)) {
            m_log.log("! Background music not found, skipping: " + music);
        } else {
            fs::path output = fs::absolute(m_settings.outputPath);
            if (output.extension().empty()) {
                output += "." + m_settings.outputFormat;
            }
            m_log.log("");
            VideoWriter writer(m_services.ffmpegPath, m_encoder, m_cacheDir,
                               *m_services.runner, *m_services.probe, m_log);
            OpResult r = writer.overlayMusic(output.string(), music, m_settings.musicVolume);
            if (r) {
                m_log.log("  + Music overlay applied.");
            } else {
                m_log.log("  ! " + r.error.message);
            }
        }
    }

    reportProgress(Stage::FINALIZE, 1, 1);
}

} // namespace YtMerge
