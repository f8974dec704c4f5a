#include "Entry.h"
#include "utils/StringUtils.h"

#include <algorithm>
#include <cmath>
#include <utility>

namespace YtMerge {

const char* statusLabel(EntryStatus status) {
    switch (status) {
        case EntryStatus::Pending:     return "Pending";
        case EntryStatus::Fetching:    return "Downloading...";
        case EntryStatus::Fetched:     return "Downloaded";
        case EntryStatus::Normalizing: return "Processing...";
        case EntryStatus::Normalized:  return "Processed";
        case EntryStatus::Done:        return "Done";
        case EntryStatus::Error:       return "ERROR";
        case EntryStatus::Cancelled:   return "Cancelled";
    }
    return "Unknown";
}

bool isTerminalStatus(EntryStatus status) {
    return status == EntryStatus::Done ||
           status == EntryStatus::Error ||
           status == EntryStatus::Cancelled;
}

Entry::Entry(std::string url, std::string startTime, std::string endTime)
    : m_url(std::move(url))
    , m_startTime(std::move(startTime))
    , m_endTime(std::move(endTime))
{
}

void Entry::setStatus(EntryStatus status, const std::string& error) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_status = status;

    if (status == EntryStatus::Error) {
        m_errorMsg = truncateMessage(error.empty() ? std::string("Unknown error") : error,
                                     MAX_ERROR_LENGTH);
    } else {
        m_errorMsg.clear();
    }

    if (status == EntryStatus::Fetched ||
        status == EntryStatus::Normalized ||
        status == EntryStatus::Done) {
        m_progress = 1.0;
    }
}

void Entry::setProgress(double fraction) {
    if (std::isnan(fraction)) fraction = 0.0;
    std::lock_guard<std::mutex> lock(m_mutex);
    m_progress = std::max(0.0, std::min(1.0, fraction));
}

void Entry::setMetadata(const std::string& title,
                        const std::string& videoId,
                        double duration,
                        const std::string& thumbnail) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_title = title;
    m_videoId = videoId;
    m_duration = duration;
    m_thumbnail = thumbnail;
}

void Entry::setDownloadedPath(const std::string& path) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_downloadedPath = path;
}

void Entry::markNormalized(const std::string& processedPath) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_processedPath = processedPath;
    m_status = EntryStatus::Normalized;
    m_progress = 1.0;
    m_errorMsg.clear();
}

void Entry::reset() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_status = EntryStatus::Pending;
    m_progress = 0.0;
    m_errorMsg.clear();
    m_downloadedPath.clear();
    m_processedPath.clear();
}

EntrySnapshot Entry::snapshot() const {
    EntrySnapshot snap;
    snap.url = m_url;
    snap.startTime = m_startTime.empty() ? "-" : m_startTime;
    snap.endTime = m_endTime.empty() ? "-" : m_endTime;

    std::lock_guard<std::mutex> lock(m_mutex);
    snap.title = m_title.empty() ? m_url : m_title;
    snap.status = m_status;
    snap.statusLabel = statusLabel(m_status);
    snap.progress = m_progress;
    snap.errorMsg = m_errorMsg;
    snap.videoId = m_videoId;
    snap.duration = m_duration;
    snap.thumbnail = m_thumbnail;
    snap.downloadedPath = m_downloadedPath;
    snap.processedPath = m_processedPath;
    return snap;
}

EntryStatus Entry::getStatus() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_status;
}

double Entry::getProgress() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_progress;
}

std::string Entry::getErrorMessage() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_errorMsg;
}

std::string Entry::getTitle() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_title;
}

std::string Entry::getVideoId() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_videoId;
}

double Entry::getDuration() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_duration;
}

std::string Entry::getDownloadedPath() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_downloadedPath;
}

std::string Entry::getProcessedPath() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_processedPath;
}

} // namespace YtMerge
