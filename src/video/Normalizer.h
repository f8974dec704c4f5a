#pragma once

#include "core/Entry.h"
#include "core/Reporting.h"
#include "core/Result.h"
#include "core/RunSettings.h"
#include "utils/ProcessUtils.h"
#include "video/EncoderProfile.h"
#include "video/MediaProbe.h"

#include <atomic>
#include <string>
#include <vector>

namespace YtMerge {

/**
 * @brief Re-encodes one fetched clip into the run's canonical format
 *
 * Output is cached as proc_<id>_<height>.mp4 in the cache directory.
 * Only one normalize should run at a time; a hardware encoder has a
 * limited number of sessions.
 */
class Normalizer {
public:
    Normalizer(const RunSettings& settings,
               const EncoderProfile& encoder,
               const std::string& ffmpegPath,
               const std::string& cacheDir,
               ProcessRunner& runner,
               MediaProbe& probe,
               LogSink& log,
               const std::atomic<bool>& cancelFlag);

    /**
     * @brief Normalize entry.downloadedPath
     *
     * On success the entry is Normalized with its processed path set.
     * On failure it is left in Error (or Cancelled) with a message.
     */
    OpResult normalize(Entry& entry, size_t indexInBatch, size_t batchTotal);

    // Cache file for an entry; trimmed entries get the trim range appended
    std::string cachePathFor(const Entry& entry) const;

    std::vector<std::string> buildCommand(const Entry& entry,
                                          const std::string& sourcePath,
                                          bool sourceHasAudio,
                                          const std::string& outputPath) const;

    // ffmpeg log shared with the merge stage
    std::string getProcessLogPath() const;

private:
    double expectedOutputDuration(const Entry& entry, const std::string& sourcePath) const;

    RunSettings m_settings;
    EncoderProfile m_encoder;
    std::string m_ffmpegPath;
    std::string m_cacheDir;
    ProcessRunner& m_runner;
    MediaProbe& m_probe;
    LogSink& m_log;
    const std::atomic<bool>& m_cancelled;
};

} // namespace YtMerge
