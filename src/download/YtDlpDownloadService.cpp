#include "YtDlpDownloadService.h"
#include "utils/DebugLogger.h"
#include "utils/StringUtils.h"

#include <sstream>
#include <utility>

namespace YtMerge {

namespace {

const std::string PROGRESS_TAG = "ytmerge-progress";
const std::string META_TAG = "ytmerge-meta";

// yt-dlp prints NA (or None) for fields it does not know
double parseField(const std::string& text) {
    if (text.empty() || text == "NA" || text == "None") return 0.0;
    try {
        return std::stod(text);
    } catch (const std::exception&) {
        return 0.0;
    }
}

std::string lastErrorLine(const std::string& output) {
    std::istringstream in(output);
    std::string line;
    std::string found;
    while (std::getline(in, line)) {
        if (line.compare(0, 6, "ERROR:") == 0) found = trim(line);
    }
    return found;
}

} // namespace

YtDlpDownloadService::YtDlpDownloadService(ProcessRunner& runner, std::string ytDlpPath)
    : m_runner(runner)
    , m_ytDlpPath(std::move(ytDlpPath))
{
}

std::string YtDlpDownloadService::formatSelector(int maxHeight) {
    const std::string h = std::to_string(maxHeight);
    return "bestvideo[height<=" + h + "][ext=mp4]+bestaudio[ext=m4a]"
           "/bestvideo[height<=" + h + "]+bestaudio"
           "/best[height<=" + h + "]/best";
}

std::vector<std::string> YtDlpDownloadService::buildCommand(const DownloadRequest& request) const {
    return {
        m_ytDlpPath,
        "--no-playlist",
        "--no-warnings",
        "-f", formatSelector(request.maxHeight),
        "--merge-output-format", "mp4",
        "-o", request.outputTemplate,
        "--continue",
        "--retries", std::to_string(request.retries),
        "--concurrent-fragments", std::to_string(request.concurrentFragments),
        "--newline",
        "--progress",
        "--progress-template",
        "download:" + PROGRESS_TAG + " %(progress.status)s %(progress.downloaded_bytes)s "
        "%(progress.total_bytes)s %(progress.total_bytes_estimate)s %(progress.speed)s",
        "--no-simulate",
        "--print",
        "after_move:" + META_TAG + "\t%(id)s\t%(duration)s\t%(thumbnail)s\t%(filepath)s\t%(title)s",
        request.url
    };
}

bool YtDlpDownloadService::parseProgressLine(const std::string& line, DownloadProgress& progress) {
    std::istringstream in(line);
    std::string tag, status, downloaded, total, estimate, speed;
    if (!(in >> tag >> status) || tag != PROGRESS_TAG) {
        return false;
    }
    in >> downloaded >> total >> estimate >> speed;

    if (status == "downloading") {
        progress.phase = DownloadProgress::Phase::Downloading;
    } else if (status == "finished") {
        progress.phase = DownloadProgress::Phase::Finished;
    } else {
        progress.phase = DownloadProgress::Phase::Other;
    }

    progress.downloadedBytes = static_cast<int64_t>(parseField(downloaded));
    double totalBytes = parseField(total);
    if (totalBytes <= 0.0) totalBytes = parseField(estimate);
    progress.totalBytes = static_cast<int64_t>(totalBytes);
    progress.speedBytesPerSec = parseField(speed);
    return true;
}

bool YtDlpDownloadService::parseMetadataLine(const std::string& line, DownloadMetadata& metadata) {
    if (line.compare(0, META_TAG.size() + 1, META_TAG + "\t") != 0) {
        return false;
    }

    // id, duration, thumbnail, filepath, then the title (which may contain tabs)
    std::vector<std::string> fields;
    size_t pos = META_TAG.size() + 1;
    while (fields.size() < 4) {
        size_t tab = line.find('\t', pos);
        if (tab == std::string::npos) return false;
        fields.push_back(line.substr(pos, tab - pos));
        pos = tab + 1;
    }

    auto clean = [](const std::string& v) { return (v == "NA" || v == "None") ? std::string() : v; };
    metadata.id = clean(fields[0]);
    metadata.duration = parseField(fields[1]);
    metadata.thumbnail = clean(fields[2]);
    metadata.filepath = clean(fields[3]);
    metadata.title = clean(line.substr(pos));
    return true;
}

DownloadOutcome YtDlpDownloadService::download(const DownloadRequest& request) {
    DownloadOutcome outcome;
    bool sawMetadata = false;

    ProcessRequest req;
    req.argv = buildCommand(request);
    req.onLine = [&](const std::string& line) {
        DownloadProgress progress;
        if (parseProgressLine(line, progress)) {
            if (request.onProgress) request.onProgress(progress);
            return;
        }
        if (parseMetadataLine(line, outcome.metadata)) {
            sawMetadata = true;
        }
    };

    ProcessResult res = m_runner.run(req);
    if (res.launchFailed) {
        outcome.error = res.output;
        return outcome;
    }
    if (res.exitCode != 0) {
        std::string err = lastErrorLine(res.output);
        if (err.empty()) err = trim(tailOf(res.output, 200));
        outcome.error = "yt-dlp exit code " + std::to_string(res.exitCode) + ": " + err;
        DebugLogger::getInstance().write("[Download] " + formatCommandLine(req.argv) + "\n" + tailOf(res.output, 2000));
        return outcome;
    }
    if (!sawMetadata) {
        outcome.error = "yt-dlp finished without reporting the downloaded file";
        return outcome;
    }

    outcome.success = true;
    return outcome;
}

} // namespace YtMerge
