#pragma once

#include "download/DownloadService.h"
#include "utils/ProcessUtils.h"

#include <string>
#include <vector>

namespace YtMerge {

/**
 * @brief DownloadService backed by the yt-dlp command-line tool
 *
 * Progress and final metadata are requested through --progress-template
 * and --print so the output can be parsed line by line.
 */
class YtDlpDownloadService : public DownloadService {
public:
    YtDlpDownloadService(ProcessRunner& runner, std::string ytDlpPath);

    DownloadOutcome download(const DownloadRequest& request) override;

    std::vector<std::string> buildCommand(const DownloadRequest& request) const;

    // Best mp4+m4a up to maxHeight, then progressively looser fallbacks
    static std::string formatSelector(int maxHeight);

    // Parse a "ytmerge-progress ..." line; false for any other line
    static bool parseProgressLine(const std::string& line, DownloadProgress& progress);

    // Parse a "ytmerge-meta\t..." line; false for any other line
    static bool parseMetadataLine(const std::string& line, DownloadMetadata& metadata);

private:
    ProcessRunner& m_runner;
    std::string m_ytDlpPath;
};

} // namespace YtMerge
