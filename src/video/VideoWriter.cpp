#include "VideoWriter.h"
#include "core/RunSettings.h"
#include "tracing/Tracing.h"
#include "utils/DebugLogger.h"
#include "utils/StringUtils.h"
#include "video/FilterGraph.h"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <filesystem>

namespace YtMerge {

namespace fs = std::filesystem;

VideoWriter::VideoWriter(const std::string& ffmpegPath,
                         const EncoderProfile& encoder,
                         const std::string& workDir,
                         ProcessRunner& runner,
                         MediaProbe& probe,
                         LogSink& log)
    : m_ffmpegPath(ffmpegPath)
    , m_encoder(encoder)
    , m_workDir(workDir)
    , m_runner(runner)
    , m_probe(probe)
    , m_log(log)
{
}

std::string VideoWriter::getConcatListPath() const {
    return (fs::path(m_workDir) / "concat_list.txt").string();
}

std::string VideoWriter::getProcessLogPath() const {
    return (fs::path(m_workDir) / "ytmerge_ffmpeg.log").string();
}

bool VideoWriter::isMp4(const std::string& path) const {
    std::string ext = fs::path(path).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext == ".mp4" || ext == ".m4v" || ext == ".mov";
}

OpResult VideoWriter::replaceFile(const std::string& from, const std::string& to) const {
    std::error_code ec;
    fs::rename(from, to, ec);
    if (!ec) {
        return OpResult::ok(to);
    }

    // rename() cannot cross filesystems; fall back to copy + remove
    std::error_code copyEc;
    fs::copy_file(from, to, fs::copy_options::overwrite_existing, copyEc);
    if (copyEc) {
        return OpResult::fail(ErrorKind::IoError,
                              "Could not move " + from + " to " + to + ": " + copyEc.message());
    }
    fs::remove(from, ec);
    return OpResult::ok(to);
}

OpResult VideoWriter::mergeVideos(const std::vector<std::string>& inputVideos,
                                  const std::string& outputVideo,
                                  bool enableTransitions,
                                  double fadeDuration) {
    TRACE_SCOPE("merge");

    if (inputVideos.empty()) {
        return OpResult::fail(ErrorKind::NothingSucceeded, "No processed files available to merge");
    }

    if (inputVideos.size() == 1) {
        OpResult r = copySingle(inputVideos.front(), outputVideo);
        if (r) m_log.log("  Single file copied to output.");
        return r;
    }

    if (enableTransitions) {
        OpResult r = crossfadeVideos(inputVideos, outputVideo, fadeDuration);
        if (r) return r;
        m_log.log("  ! Crossfade failed, falling back to fast concat.");
        m_log.log("    " + r.error.message);
    }

    return concatenateVideos(inputVideos, outputVideo);
}

OpResult VideoWriter::copySingle(const std::string& inputVideo, const std::string& outputVideo) {
    std::error_code ec;
    if (fs::equivalent(inputVideo, outputVideo, ec)) {
        return OpResult::ok(outputVideo);
    }
    fs::copy_file(inputVideo, outputVideo, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        return OpResult::fail(ErrorKind::IoError,
                              "Could not copy " + inputVideo + " to " + outputVideo + ": " + ec.message());
    }
    return OpResult::ok(outputVideo);
}

OpResult VideoWriter::concatenateVideos(const std::vector<std::string>& inputVideos,
                                        const std::string& outputVideo) {
    if (inputVideos.empty()) {
        return OpResult::fail(ErrorKind::NothingSucceeded, "No input videos to concatenate");
    }

    m_log.log("  Fast concat (no re-encode) of " + std::to_string(inputVideos.size()) + " files...");

    const std::string listFile = getConcatListPath();
    FILE* f = fopen(listFile.c_str(), "w");
    if (!f) {
        return OpResult::fail(ErrorKind::IoError, "Could not create concat list file: " + listFile);
    }
    const std::string list = buildConcatList(inputVideos);
    size_t written = fwrite(list.data(), 1, list.size(), f);
    bool closed = fclose(f) == 0;
    if (written != list.size() || !closed) {
        return OpResult::fail(ErrorKind::IoError, "Could not write concat list file: " + listFile);
    }

    ProcessRequest req;
    req.argv = {m_ffmpegPath, "-y", "-hide_banner", "-loglevel", "warning",
                "-f", "concat", "-safe", "0", "-i", listFile,
                "-c", "copy"};
    if (isMp4(outputVideo)) {
        req.argv.push_back("-movflags");
        req.argv.push_back("+faststart");
    }
    req.argv.push_back(outputVideo);

    ProcessResult res = m_runner.run(req);
    appendProcessLog(getProcessLogPath(), "concat", req.argv, res,
                     std::to_string(inputVideos.size()) + " inputs");

    if (!res.succeeded()) {
        std::string msg = "Concat failed: " + trim(tailOf(res.output, 200));
        m_log.log("  x " + msg);
        return OpResult::fail(res.timedOut ? ErrorKind::Timeout : ErrorKind::ProcessFailed, msg);
    }
    return OpResult::ok(outputVideo);
}

OpResult VideoWriter::crossfadeVideos(const std::vector<std::string>& inputVideos,
                                      const std::string& outputVideo,
                                      double fadeDuration) {
    const size_t n = inputVideos.size();
    if (n < 2) {
        return OpResult::fail(ErrorKind::CrossfadeFailed, "Crossfade needs at least two inputs");
    }

    m_log.log("  Crossfade merge (" + std::to_string(n) + " files, re-encoding)...");

    std::vector<double> durations;
    durations.reserve(n);
    for (const auto& file : inputVideos) {
        durations.push_back(m_probe.probeDuration(file));
    }

    CrossfadeGraph graph = buildCrossfadeGraph(durations, fadeDuration, FALLBACK_CLIP_DURATION);
    if (graph.filter.empty()) {
        return OpResult::fail(ErrorKind::CrossfadeFailed, "Could not build crossfade filter graph");
    }

    ProcessRequest req;
    req.argv = {m_ffmpegPath, "-y"};
    req.argv.insert(req.argv.end(), m_encoder.hwaccelArgs.begin(), m_encoder.hwaccelArgs.end());
    req.argv.insert(req.argv.end(), {"-hide_banner", "-loglevel", "warning"});
    for (const auto& file : inputVideos) {
        req.argv.push_back("-i");
        req.argv.push_back(file);
    }
    req.argv.insert(req.argv.end(), {"-filter_complex", graph.filter,
                                     "-map", graph.videoLabel, "-map", graph.audioLabel});
    m_encoder.appendEncodeArgs(req.argv);
    req.argv.insert(req.argv.end(), {"-c:a", AUDIO_CODEC, "-b:a", AUDIO_BITRATE});
    if (isMp4(outputVideo)) {
        req.argv.push_back("-movflags");
        req.argv.push_back("+faststart");
    }
    req.argv.push_back(outputVideo);

    DebugLogger::getInstance().write("[Merge] filter_complex: " + graph.filter);

    ProcessResult res = m_runner.run(req);
    appendProcessLog(getProcessLogPath(), "crossfade", req.argv, res,
                     "timeline end " + formatDecimal(graph.timeline.back(), 3) + "s");

    if (!res.succeeded()) {
        std::string detail = res.launchFailed ? res.output : trim(tailOf(res.output, 200));
        return OpResult::fail(ErrorKind::CrossfadeFailed,
                              "FFmpeg exit code " + std::to_string(res.exitCode) + ": " + detail);
    }
    return OpResult::ok(outputVideo);
}

OpResult VideoWriter::overlayMusic(const std::string& outputVideo,
                                   const std::string& musicFile,
                                   double volume) {
    TRACE_SCOPE("overlay-music");

    std::error_code ec;
    if (!fs::is_regular_file(outputVideo, ec)) {
        return OpResult::fail(ErrorKind::OverlayFailed, "Merged output missing: " + outputVideo);
    }
    if (!fs::is_regular_file(musicFile, ec)) {
        return OpResult::fail(ErrorKind::OverlayFailed, "Music file missing: " + musicFile);
    }

    m_log.log("  Overlaying background music...");

    const std::string tmp = (fs::path(m_workDir) /
                             ("with_music" + fs::path(outputVideo).extension().string())).string();

    ProcessRequest req;
    req.argv = {m_ffmpegPath, "-y", "-hide_banner", "-loglevel", "warning",
                "-i", outputVideo, "-i", musicFile,
                "-filter_complex", buildMusicMixFilter(volume),
                "-map", "0:v", "-map", "[aout]",
                "-c:v", "copy", "-c:a", AUDIO_CODEC, "-b:a", AUDIO_BITRATE,
                "-shortest"};
    if (isMp4(tmp)) {
        req.argv.push_back("-movflags");
        req.argv.push_back("+faststart");
    }
    req.argv.push_back(tmp);

    ProcessResult res = m_runner.run(req);
    appendProcessLog(getProcessLogPath(), "music overlay", req.argv, res);

    if (!res.succeeded() || !fs::is_regular_file(tmp, ec)) {
        fs::remove(tmp, ec);
        std::string detail = res.launchFailed ? res.output : trim(tailOf(res.output, 150));
        return OpResult::fail(ErrorKind::OverlayFailed, "Music overlay failed: " + detail);
    }

    OpResult moved = replaceFile(tmp, outputVideo);
    if (!moved) {
        fs::remove(tmp, ec);
        return OpResult::fail(ErrorKind::OverlayFailed, moved.error.message);
    }
    return OpResult::ok(outputVideo);
}

} // namespace YtMerge
