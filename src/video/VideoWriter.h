#pragma once

#include "core/Reporting.h"
#include "core/Result.h"
#include "utils/ProcessUtils.h"
#include "video/EncoderProfile.h"
#include "video/MediaProbe.h"

#include <string>
#include <vector>

namespace YtMerge {

/**
 * @brief Joins normalized clips into the final output and overlays music
 *
 * All inputs are expected to share resolution, frame rate and audio
 * format, so plain concatenation can stream-copy.
 */
class VideoWriter {
public:
    VideoWriter(const std::string& ffmpegPath,
                const EncoderProfile& encoder,
                const std::string& workDir,
                ProcessRunner& runner,
                MediaProbe& probe,
                LogSink& log);

    /**
     * @brief Merge clips in order into outputVideo
     *
     * One input is copied as is. With transitions the clips are crossfaded
     * and re-encoded; if that fails the plain concat path is used instead.
     */
    OpResult mergeVideos(const std::vector<std::string>& inputVideos,
                         const std::string& outputVideo,
                         bool enableTransitions,
                         double fadeDuration);

    // Byte copy, no re-encode
    OpResult copySingle(const std::string& inputVideo, const std::string& outputVideo);

    // Concat demuxer with stream copy
    OpResult concatenateVideos(const std::vector<std::string>& inputVideos,
                               const std::string& outputVideo);

    /**
     * @brief Crossfade consecutive clips and re-encode
     * @param fadeDuration Transition length in seconds
     * @return CrossfadeFailed on any error; the caller decides on fallback
     */
    OpResult crossfadeVideos(const std::vector<std::string>& inputVideos,
                             const std::string& outputVideo,
                             double fadeDuration);

    /**
     * @brief Mix looped background music under the video's audio
     *
     * The video stream is copied. The result replaces outputVideo in place;
     * on failure outputVideo is left untouched.
     */
    OpResult overlayMusic(const std::string& outputVideo,
                          const std::string& musicFile,
                          double volume);

    std::string getConcatListPath() const;
    std::string getProcessLogPath() const;

private:
    bool isMp4(const std::string& path) const;
    OpResult replaceFile(const std::string& from, const std::string& to) const;

    std::string m_ffmpegPath;
    EncoderProfile m_encoder;
    std::string m_workDir;
    ProcessRunner& m_runner;
    MediaProbe& m_probe;
    LogSink& m_log;
};

} // namespace YtMerge
