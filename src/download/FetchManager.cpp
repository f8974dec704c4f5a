#include "FetchManager.h"
#include "core/BatchParser.h"
#include "tracing/Tracing.h"
#include "utils/StringUtils.h"

#include <chrono>
#include <filesystem>
#include <functional>
#include <sstream>
#include <thread>

namespace YtMerge {

namespace fs = std::filesystem;

namespace {

const char* const KNOWN_EXTENSIONS[] = {".mp4", ".mkv", ".webm", ".m4a"};

std::string position(size_t index, size_t total) {
    return "[" + std::to_string(index + 1) + "/" + std::to_string(total) + "]";
}

bool fileExists(const std::string& path) {
    std::error_code ec;
    return !path.empty() && fs::is_regular_file(path, ec);
}

// Stable stand-in id for URLs that are not recognisable YouTube links
std::string urlKey(const std::string& url) {
    std::ostringstream oss;
    oss << "url_" << std::hex << std::hash<std::string>{}(url);
    return oss.str();
}

} // namespace

FetchManager::FetchManager(const RunSettings& settings,
                           const std::string& cacheDir,
                           DownloadService& service,
                           MediaProbe& probe,
                           LogSink& log,
                           const std::atomic<bool>& cancelFlag,
                           SleepFunction sleeper)
    : m_settings(settings)
    , m_cacheDir(cacheDir)
    , m_service(service)
    , m_probe(probe)
    , m_log(log)
    , m_cancelled(cancelFlag)
    , m_sleeper(std::move(sleeper))
{
}

std::string FetchManager::resolveDownloadedFile(const std::string& declaredPath) {
    if (declaredPath.empty()) return "";
    if (fileExists(declaredPath)) return declaredPath;

    fs::path stem = fs::path(declaredPath);
    for (const char* ext : KNOWN_EXTENSIONS) {
        fs::path candidate = stem;
        candidate.replace_extension(ext);
        if (fileExists(candidate.string())) {
            return candidate.string();
        }
    }
    return "";
}

std::string FetchManager::findCachedDownload(const std::string& videoId) const {
    if (videoId.empty()) return "";
    const std::string base = videoId + "_" + std::to_string(m_settings.height());
    for (const char* ext : KNOWN_EXTENSIONS) {
        fs::path candidate = fs::path(m_cacheDir) / (base + ext);
        if (fileExists(candidate.string())) {
            return candidate.string();
        }
    }
    return "";
}

std::string FetchManager::cacheKeyFor(const Entry& entry) const {
    std::string id = entry.getVideoId();
    if (id.empty()) id = extractVideoId(entry.getUrl());
    return id;
}

void FetchManager::sleepInterruptibly(int seconds) {
    if (m_sleeper) {
        m_sleeper(seconds);
        return;
    }
    auto until = std::chrono::steady_clock::now() + std::chrono::seconds(seconds);
    while (!m_cancelled.load() && std::chrono::steady_clock::now() < until) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
}

OpResult FetchManager::fetch(Entry& entry, size_t indexInBatch, size_t batchTotal) {
    tracing::Span span("fetch");
    span.SetAttribute("url", entry.getUrl());

    if (m_cancelled.load()) {
        entry.setStatus(EntryStatus::Cancelled);
        return OpResult::fail(ErrorKind::Cancelled, "Cancelled");
    }

    const int height = m_settings.height();

    if (m_settings.skipCachedDownloads) {
        const std::string id = cacheKeyFor(entry);
        const std::string cached = findCachedDownload(id);
        if (!cached.empty()) {
            std::string title = entry.getTitle();
            if (title.empty()) title = id;
            double duration = entry.getDuration();
            if (duration <= 0.0) duration = m_probe.probeDuration(cached);

            entry.setMetadata(title, id, duration, entry.snapshot().thumbnail);
            entry.setDownloadedPath(cached);
            entry.setStatus(EntryStatus::Fetched);
            m_log.log("  " + position(indexInBatch, batchTotal) + " Cache hit: " + title);
            span.SetAttribute("id", id);
            span.SetAttribute("cache", "hit");
            return OpResult::ok(cached);
        }
    }

    std::string lastError;
    ErrorKind lastKind = ErrorKind::FetchFailed;

    for (int attempt = 1; attempt <= MAX_FETCH_ATTEMPTS; ++attempt) {
        if (m_cancelled.load()) {
            entry.setStatus(EntryStatus::Cancelled);
            return OpResult::fail(ErrorKind::Cancelled, "Cancelled");
        }

        entry.setStatus(EntryStatus::Fetching);
        entry.setProgress(0.0);
        m_log.log("  " + position(indexInBatch, batchTotal) + " Downloading: " + entry.getUrl() +
                  (attempt > 1 ? " (attempt " + std::to_string(attempt) + ")" : ""));

        DownloadRequest request;
        request.url = entry.getUrl();
        request.maxHeight = height;
        request.outputTemplate = (fs::path(m_cacheDir) / ("%(id)s_" + std::to_string(height) + ".%(ext)s")).string();
        request.retries = 3;
        request.concurrentFragments = CONCURRENT_FRAGMENTS;
        request.onProgress = [&entry](const DownloadProgress& p) {
            if (p.phase == DownloadProgress::Phase::Downloading && p.totalBytes > 0) {
                entry.setProgress(static_cast<double>(p.downloadedBytes) / static_cast<double>(p.totalBytes));
            } else if (p.phase == DownloadProgress::Phase::Finished) {
                entry.setProgress(1.0);
            }
        };

        DownloadOutcome outcome = m_service.download(request);

        std::string path;
        if (outcome.success) {
            path = resolveDownloadedFile(outcome.metadata.filepath);
            if (path.empty()) {
                outcome.success = false;
                outcome.error = "Downloaded file could not be located on disk";
                lastKind = ErrorKind::MissingOutput;
            }
        } else {
            lastKind = ErrorKind::FetchFailed;
        }

        if (outcome.success) {
            const DownloadMetadata& meta = outcome.metadata;
            std::string id = meta.id;
            if (id.empty()) id = extractVideoId(entry.getUrl());
            if (id.empty()) id = urlKey(entry.getUrl());

            std::string title = sanitizeFilename(meta.title.empty()
                                                 ? "video_" + std::to_string(indexInBatch)
                                                 : meta.title);
            double duration = meta.duration > 0.0 ? meta.duration : m_probe.probeDuration(path);

            entry.setMetadata(title, id, duration, meta.thumbnail);
            entry.setDownloadedPath(path);
            entry.setStatus(EntryStatus::Fetched);
            m_log.log("  + " + title);
            span.SetAttribute("id", id);
            span.SetAttribute("attempts", std::to_string(attempt));
            return OpResult::ok(path);
        }

        lastError = outcome.error.empty() ? std::string("Download failed") : outcome.error;
        m_log.log("  x Attempt " + std::to_string(attempt) + " failed: " + truncateMessage(lastError, 80));

        if (attempt < MAX_FETCH_ATTEMPTS) {
            int wait = 1 << attempt;
            m_log.log("  Retrying in " + std::to_string(wait) + "s...");
            sleepInterruptibly(wait);
        }
    }

    entry.setStatus(EntryStatus::Error, lastError);
    span.SetAttribute("status", "error");
    m_log.log("  x Download failed permanently: " + entry.getUrl());
    return OpResult::fail(lastKind, truncateMessage(lastError, Entry::MAX_ERROR_LENGTH));
}

} // namespace YtMerge
