#pragma once

#include <string>
#include <mutex>

namespace YtMerge {

enum class EntryStatus {
    Pending,
    Fetching,
    Fetched,
    Normalizing,
    Normalized,
    Done,
    Error,
    Cancelled
};

// Human-readable label shown in progress tables
const char* statusLabel(EntryStatus status);

// Done, Error and Cancelled end an entry's run
bool isTerminalStatus(EntryStatus status);

/**
 * @brief Immutable copy of an entry's display-relevant fields
 */
struct EntrySnapshot {
    std::string url;
    std::string title;        // falls back to url when unresolved
    std::string startTime;    // "-" when absent
    std::string endTime;      // "-" when absent
    EntryStatus status = EntryStatus::Pending;
    std::string statusLabel;
    double progress = 0.0;
    std::string errorMsg;
    std::string videoId;
    double duration = 0.0;
    std::string thumbnail;
    std::string downloadedPath;
    std::string processedPath;
};

/**
 * @brief One item of a batch and its lifecycle
 *
 * Every mutable field is guarded by a single per-entry mutex so the fetch
 * workers and a reporting thread can touch the same entry concurrently.
 */
class Entry {
public:
    static constexpr size_t MAX_ERROR_LENGTH = 240;

    explicit Entry(std::string url, std::string startTime = "", std::string endTime = "");

    Entry(const Entry&) = delete;
    Entry& operator=(const Entry&) = delete;

    // Url and trim bounds never change after construction
    const std::string& getUrl() const { return m_url; }
    const std::string& getStartTime() const { return m_startTime; }
    const std::string& getEndTime() const { return m_endTime; }

    /**
     * @brief Transition to a new state
     *
     * Fetched, Normalized and Done force progress to 1.0. The error message
     * is kept only for the Error state; other states clear it.
     */
    void setStatus(EntryStatus status, const std::string& error = "");

    // Clamped to [0, 1]
    void setProgress(double fraction);

    void setMetadata(const std::string& title,
                     const std::string& videoId,
                     double duration,
                     const std::string& thumbnail = "");
    void setDownloadedPath(const std::string& path);

    // Records the normalized file and moves to Normalized under one lock
    void markNormalized(const std::string& processedPath);

    // Back to Pending for a new run; resolved metadata survives so caches still hit
    void reset();

    EntrySnapshot snapshot() const;

    EntryStatus getStatus() const;
    double getProgress() const;
    std::string getErrorMessage() const;
    std::string getTitle() const;
    std::string getVideoId() const;
    double getDuration() const;
    std::string getDownloadedPath() const;
    std::string getProcessedPath() const;

private:
    const std::string m_url;
    const std::string m_startTime;
    const std::string m_endTime;

    mutable std::mutex m_mutex;
    std::string m_title;
    std::string m_videoId;
    double m_duration = 0.0;
    std::string m_thumbnail;
    std::string m_downloadedPath;
    std::string m_processedPath;
    EntryStatus m_status = EntryStatus::Pending;
    double m_progress = 0.0;
    std::string m_errorMsg;
};

} // namespace YtMerge
