#pragma once

#include "utils/ProcessUtils.h"

#include <set>
#include <string>
#include <vector>

namespace YtMerge {

/**
 * @brief Video encoder settings shared by every re-encode of a run
 */
struct EncoderProfile {
    std::string codec = "libx264";
    std::vector<std::string> hwaccelArgs;                  // placed before -i
    std::vector<std::string> qualityArgs = {"-crf", "23"};
    std::string preset = "ultrafast";
    bool isHardware = false;

    // e.g. "h264_nvenc (GPU)" or "libx264 (CPU)"
    std::string label() const;

    // Appends "-c:v <codec> -preset <preset> <quality args>"
    void appendEncodeArgs(std::vector<std::string>& args) const;

    bool operator==(const EncoderProfile& other) const noexcept {
        return codec == other.codec &&
               hwaccelArgs == other.hwaccelArgs &&
               qualityArgs == other.qualityArgs &&
               preset == other.preset &&
               isHardware == other.isHardware;
    }

    bool operator!=(const EncoderProfile& other) const noexcept {
        return !(*this == other);
    }

    static EncoderProfile software();
    static EncoderProfile nvenc();
    static EncoderProfile quickSync();
};

/**
 * @brief Parse the output of "ffmpeg -hide_banner -encoders"
 * @return Names of the video encoders listed
 */
std::set<std::string> parseEncoderList(const std::string& output);

/**
 * @brief Picks the encoder profile for a run
 *
 * NVENC needs a working nvidia-smi; Quick Sync needs a DRI render node.
 * Anything else falls back to libx264.
 */
class EncoderDetector {
public:
    // Empty nvidiaSmiPath = look it up on PATH
    EncoderDetector(ProcessRunner& runner,
                    std::string ffmpegPath,
                    std::string nvidiaSmiPath = "",
                    std::string renderNode = "/dev/dri/renderD128");

    EncoderProfile detect();

    // Encoders reported by ffmpeg during the last detect()
    const std::set<std::string>& getAvailableEncoders() const { return m_encoders; }

private:
    bool nvidiaGpuPresent();

    ProcessRunner& m_runner;
    std::string m_ffmpegPath;
    std::string m_nvidiaSmiPath;
    std::string m_renderNode;
    std::set<std::string> m_encoders;
};

} // namespace YtMerge
