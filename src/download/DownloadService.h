#pragma once

#include <cstdint>
#include <functional>
#include <string>

namespace YtMerge {

struct DownloadProgress {
    enum class Phase { Downloading, Finished, Other };

    Phase phase = Phase::Other;
    int64_t downloadedBytes = 0;
    int64_t totalBytes = 0;        // exact size, or the service's estimate; 0 if unknown
    double speedBytesPerSec = 0.0;
};

struct DownloadRequest {
    std::string url;
    int maxHeight = 1080;
    // Output template; "%(id)s" and "%(ext)s" are filled in by the service
    std::string outputTemplate;
    int retries = 3;
    int concurrentFragments = 8;
    std::function<void(const DownloadProgress&)> onProgress;
};

struct DownloadMetadata {
    std::string id;
    std::string title;
    double duration = 0.0;
    std::string thumbnail;
    std::string filepath;          // where the service says it wrote the file
};

struct DownloadOutcome {
    bool success = false;
    DownloadMetadata metadata;
    std::string error;
};

/**
 * @brief Fetches one remote video into the local cache
 *
 * Implementations block until the transfer ends and may call onProgress
 * from the calling thread any number of times.
 */
class DownloadService {
public:
    virtual ~DownloadService() = default;
    virtual DownloadOutcome download(const DownloadRequest& request) = 0;
};

} // namespace YtMerge
