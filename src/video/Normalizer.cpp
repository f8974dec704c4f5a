#include "Normalizer.h"
#include "tracing/Tracing.h"
#include "utils/StringUtils.h"
#include "video/FilterGraph.h"

#include <filesystem>
#include <sstream>

namespace YtMerge {

namespace fs = std::filesystem;

namespace {

const char* INTERMEDIATE_EXTENSION = ".mp4";
const size_t STDERR_TAIL = 200;

std::string position(size_t index, size_t total) {
    return "[" + std::to_string(index + 1) + "/" + std::to_string(total) + "]";
}

// "-progress pipe:1" reports out_time_us (and out_time_ms, also in microseconds)
bool parseOutTime(const std::string& line, double& seconds) {
    static const std::string keys[] = {"out_time_us=", "out_time_ms="};
    for (const auto& key : keys) {
        if (line.compare(0, key.size(), key) == 0) {
            try {
                long long us = std::stoll(line.substr(key.size()));
                seconds = static_cast<double>(us) / 1000000.0;
                return us >= 0;
            } catch (const std::exception&) {
                return false;  // "N/A" before the first frame
            }
        }
    }
    return false;
}

} // namespace

Normalizer::Normalizer(const RunSettings& settings,
                       const EncoderProfile& encoder,
                       const std::string& ffmpegPath,
                       const std::string& cacheDir,
                       ProcessRunner& runner,
                       MediaProbe& probe,
                       LogSink& log,
                       const std::atomic<bool>& cancelFlag)
    : m_settings(settings)
    , m_encoder(encoder)
    , m_ffmpegPath(ffmpegPath)
    , m_cacheDir(cacheDir)
    , m_runner(runner)
    , m_probe(probe)
    , m_log(log)
    , m_cancelled(cancelFlag)
{
}

std::string Normalizer::getProcessLogPath() const {
    return (fs::path(m_cacheDir) / "ytmerge_ffmpeg.log").string();
}

std::string Normalizer::cachePathFor(const Entry& entry) const {
    std::string id = entry.getVideoId();
    if (id.empty()) id = "unknown";

    std::string name = "proc_" + id + "_" + std::to_string(m_settings.height());

    double start = timestampToSeconds(entry.getStartTime());
    double end = timestampToSeconds(entry.getEndTime());
    if (start > 0.0 || end > start) {
        std::ostringstream trim;
        trim << "_" << static_cast<long long>(start * 1000.0);
        if (end > start) trim << "-" << static_cast<long long>(end * 1000.0);
        name += trim.str();
    }
    return (fs::path(m_cacheDir) / (name + INTERMEDIATE_EXTENSION)).string();
}

std::vector<std::string> Normalizer::buildCommand(const Entry& entry,
                                                  const std::string& sourcePath,
                                                  bool sourceHasAudio,
                                                  const std::string& outputPath) const {
    std::vector<std::string> cmd = {m_ffmpegPath, "-y"};
    cmd.insert(cmd.end(), m_encoder.hwaccelArgs.begin(), m_encoder.hwaccelArgs.end());
    cmd.insert(cmd.end(), {"-hide_banner", "-loglevel", "warning", "-nostats", "-progress", "pipe:1"});

    // Seek before -i for fast input seeking
    double startSec = timestampToSeconds(entry.getStartTime());
    if (startSec > 0.0) {
        cmd.push_back("-ss");
        cmd.push_back(formatDecimal(startSec, 3));
    }
    cmd.push_back("-i");
    cmd.push_back(sourcePath);

    if (!sourceHasAudio) {
        cmd.insert(cmd.end(), {"-f", "lavfi", "-i", buildSilentAudioSource(AUDIO_SAMPLE_RATE)});
    }

    if (!entry.getEndTime().empty()) {
        double dur = timestampToSeconds(entry.getEndTime()) - startSec;
        if (dur > 0.0) {
            cmd.push_back("-t");
            cmd.push_back(formatDecimal(dur, 3));
        }
    }

    cmd.push_back("-vf");
    cmd.push_back(buildNormalizeFilter(m_settings.width(), m_settings.height(), TARGET_FPS));

    m_encoder.appendEncodeArgs(cmd);

    cmd.insert(cmd.end(), {
        "-c:a", AUDIO_CODEC,
        "-b:a", AUDIO_BITRATE,
        "-ar", std::to_string(AUDIO_SAMPLE_RATE),
        "-ac", std::to_string(AUDIO_CHANNELS)
    });

    // Video from the clip, audio from the silent source
    if (!sourceHasAudio) {
        cmd.insert(cmd.end(), {"-map", "0:v:0", "-map", "1:a:0", "-shortest"});
    }

    cmd.insert(cmd.end(), {"-movflags", "+faststart", outputPath});
    return cmd;
}

double Normalizer::expectedOutputDuration(const Entry& entry, const std::string& sourcePath) const {
    double start = timestampToSeconds(entry.getStartTime());
    if (!entry.getEndTime().empty()) {
        double dur = timestampToSeconds(entry.getEndTime()) - start;
        if (dur > 0.0) return dur;
    }
    double total = entry.getDuration();
    if (total <= 0.0) total = m_probe.probeDuration(sourcePath);
    return total > start ? total - start : 0.0;
}

OpResult Normalizer::normalize(Entry& entry, size_t indexInBatch, size_t batchTotal) {
    TRACE_SCOPE("normalize");

    if (m_cancelled.load()) {
        entry.setStatus(EntryStatus::Cancelled);
        return OpResult::fail(ErrorKind::Cancelled, "Cancelled");
    }

    const std::string source = entry.getDownloadedPath();
    std::error_code ec;
    if (source.empty() || !fs::is_regular_file(source, ec)) {
        entry.setStatus(EntryStatus::Error, "Source file missing");
        m_log.log("  x " + position(indexInBatch, batchTotal) + " Source file missing: " + entry.getUrl());
        return OpResult::fail(ErrorKind::SourceMissing, "Source file missing");
    }

    const std::string title = entry.snapshot().title;
    const std::string outPath = cachePathFor(entry);
    if (fs::is_regular_file(outPath, ec)) {
        entry.markNormalized(outPath);
        m_log.log("  " + position(indexInBatch, batchTotal) + " Cache hit: " + title);
        return OpResult::ok(outPath);
    }

    entry.setStatus(EntryStatus::Normalizing);
    entry.setProgress(0.0);
    m_log.log("  " + position(indexInBatch, batchTotal) + " Processing: " + title);

    // Encode next to the cache file and rename on success so a failed or
    // killed encode never leaves a truncated file under the cache name
    fs::path finalPath(outPath);
    fs::path partPath = finalPath;
    partPath.replace_extension(std::string(".part") + INTERMEDIATE_EXTENSION);

    const bool hasAudio = m_probe.hasAudioStream(source);
    const double expected = expectedOutputDuration(entry, source);

    ProcessRequest req;
    req.argv = buildCommand(entry, source, hasAudio, partPath.string());
    req.timeoutSeconds = NORMALIZE_TIMEOUT_SECONDS;
    req.onLine = [&entry, expected](const std::string& line) {
        double seconds = 0.0;
        if (expected > 0.0 && parseOutTime(line, seconds)) {
            entry.setProgress(seconds / expected);
        }
    };

    ProcessResult res = m_runner.run(req);
    appendProcessLog(getProcessLogPath(), "normalize " + title, req.argv, res,
                     hasAudio ? "" : "source has no audio; silent track added");

    if (res.timedOut) {
        fs::remove(partPath, ec);
        entry.setStatus(EntryStatus::Error, "Processing timed out (10 min)");
        m_log.log("  x Timeout: " + title);
        return OpResult::fail(ErrorKind::Timeout, "Processing timed out (10 min)");
    }

    if (res.launchFailed || res.exitCode != 0) {
        fs::remove(partPath, ec);
        std::string msg = res.launchFailed
            ? res.output
            : "FFmpeg exit code " + std::to_string(res.exitCode) + ": " +
              trim(tailOf(res.output.empty() ? std::string("unknown") : res.output, STDERR_TAIL));
        entry.setStatus(EntryStatus::Error, msg);
        m_log.log("  x Process failed: " + truncateMessage(msg, Entry::MAX_ERROR_LENGTH));
        return OpResult::fail(ErrorKind::ProcessFailed, msg);
    }

    std::error_code renameEc;
    fs::rename(partPath, finalPath, renameEc);
    if (renameEc || !fs::is_regular_file(finalPath, ec)) {
        std::string msg = "FFmpeg finished but produced no output file";
        if (renameEc) msg += ": " + renameEc.message();
        fs::remove(partPath, ec);
        entry.setStatus(EntryStatus::Error, msg);
        m_log.log("  x " + msg + ": " + title);
        return OpResult::fail(ErrorKind::MissingOutput, msg);
    }

    entry.markNormalized(finalPath.string());
    m_log.log("  + Processed: " + title);
    return OpResult::ok(finalPath.string());
}

} // namespace YtMerge
