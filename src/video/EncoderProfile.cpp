#include "EncoderProfile.h"
#include "utils/BinaryLocator.h"
#include "utils/DebugLogger.h"

#include <filesystem>
#include <sstream>
#include <utility>

namespace YtMerge {

std::string EncoderProfile::label() const {
    return codec + (isHardware ? " (GPU)" : " (CPU)");
}

void EncoderProfile::appendEncodeArgs(std::vector<std::string>& args) const {
    args.push_back("-c:v");
    args.push_back(codec);
    if (!preset.empty()) {
        args.push_back("-preset");
        args.push_back(preset);
    }
    args.insert(args.end(), qualityArgs.begin(), qualityArgs.end());
}

EncoderProfile EncoderProfile::software() {
    EncoderProfile p;
    p.codec = "libx264";
    p.qualityArgs = {"-crf", "23"};
    p.preset = "ultrafast";
    p.isHardware = false;
    return p;
}

EncoderProfile EncoderProfile::nvenc() {
    EncoderProfile p;
    p.codec = "h264_nvenc";
    p.hwaccelArgs = {"-hwaccel", "cuda"};
    p.qualityArgs = {"-cq", "23", "-spatial_aq", "1"};
    p.preset = "p4";
    p.isHardware = true;
    return p;
}

EncoderProfile EncoderProfile::quickSync() {
    EncoderProfile p;
    p.codec = "h264_qsv";
    p.hwaccelArgs = {"-hwaccel", "qsv"};
    p.qualityArgs = {"-global_quality", "23"};
    p.preset = "veryfast";
    p.isHardware = true;
    return p;
}

std::set<std::string> parseEncoderList(const std::string& output) {
    // Format: " V..... h264_nvenc           NVIDIA NVENC H.264 encoder"
    std::set<std::string> encoders;
    std::istringstream stream(output);
    std::string line;
    while (std::getline(stream, line)) {
        if (line.size() < 8 || line[0] != ' ' || line[1] != 'V') continue;

        size_t flagsEnd = line.find(' ', 1);
        if (flagsEnd == std::string::npos) continue;

        size_t nameStart = line.find_first_not_of(' ', flagsEnd);
        if (nameStart == std::string::npos) continue;
        size_t nameEnd = line.find(' ', nameStart);
        if (nameEnd == std::string::npos) nameEnd = line.size();

        std::string encoderName = line.substr(nameStart, nameEnd - nameStart);
        // The legend line reads " V..... = Video"
        if (!encoderName.empty() && encoderName != "=") {
            encoders.insert(encoderName);
        }
    }
    return encoders;
}

EncoderDetector::EncoderDetector(ProcessRunner& runner,
                                 std::string ffmpegPath,
                                 std::string nvidiaSmiPath,
                                 std::string renderNode)
    : m_runner(runner)
    , m_ffmpegPath(std::move(ffmpegPath))
    , m_nvidiaSmiPath(std::move(nvidiaSmiPath))
    , m_renderNode(std::move(renderNode))
{
    if (m_nvidiaSmiPath.empty()) {
        m_nvidiaSmiPath = findExecutable("nvidia-smi");
    }
}

bool EncoderDetector::nvidiaGpuPresent() {
    if (m_nvidiaSmiPath.empty()) {
        DebugLogger::getInstance().write("[GPU] nvidia-smi not found");
        return false;
    }
    ProcessRequest req;
    req.argv = {m_nvidiaSmiPath};
    req.timeoutSeconds = 10;
    ProcessResult res = m_runner.run(req);
    if (!res.succeeded()) {
        DebugLogger::getInstance().write("[GPU] nvidia-smi failed (exit " + std::to_string(res.exitCode) + ")");
        return false;
    }
    return true;
}

EncoderProfile EncoderDetector::detect() {
    m_encoders.clear();

    ProcessRequest req;
    req.argv = {m_ffmpegPath, "-hide_banner", "-encoders"};
    req.timeoutSeconds = 30;
    ProcessResult res = m_runner.run(req);
    if (res.succeeded()) {
        m_encoders = parseEncoderList(res.output);
    } else {
        DebugLogger::getInstance().log("[GPU] Could not list ffmpeg encoders (exit " +
                                       std::to_string(res.exitCode) + ")");
    }

    // An empty list means ffmpeg could not tell us; trust the driver check alone
    bool listKnown = !m_encoders.empty();
    auto listed = [&](const char* name) {
        return !listKnown || m_encoders.count(name) > 0;
    };

    if (listed("h264_nvenc") && nvidiaGpuPresent()) {
        DebugLogger::getInstance().write("[GPU] Detected NVIDIA NVENC encoder");
        return EncoderProfile::nvenc();
    }

    std::error_code ec;
    if (listKnown && m_encoders.count("h264_qsv") > 0 &&
        !m_renderNode.empty() && std::filesystem::exists(m_renderNode, ec)) {
        DebugLogger::getInstance().write("[GPU] Detected Intel Quick Sync encoder");
        return EncoderProfile::quickSync();
    }

    DebugLogger::getInstance().write("[GPU] No hardware encoder found, using software libx264");
    return EncoderProfile::software();
}

} // namespace YtMerge
