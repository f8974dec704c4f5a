#include "MediaProbe.h"
#include "utils/DebugLogger.h"

extern "C" {
#include <libavformat/avformat.h>
#include <libavutil/avutil.h>
#include <libavutil/error.h>
}

namespace YtMerge {

namespace {

// Owns an opened AVFormatContext with stream info loaded
class FormatHandle {
public:
    explicit FormatHandle(const std::string& path) {
        int rc = avformat_open_input(&m_ctx, path.c_str(), nullptr, nullptr);
        if (rc < 0) {
            m_error = "Could not open media file: " + path + " (" + errorString(rc) + ")";
            m_ctx = nullptr;
            return;
        }
        rc = avformat_find_stream_info(m_ctx, nullptr);
        if (rc < 0) {
            m_error = "Could not find stream information: " + path + " (" + errorString(rc) + ")";
            avformat_close_input(&m_ctx);
        }
    }

    ~FormatHandle() {
        if (m_ctx) avformat_close_input(&m_ctx);
    }

    FormatHandle(const FormatHandle&) = delete;
    FormatHandle& operator=(const FormatHandle&) = delete;

    AVFormatContext* get() const { return m_ctx; }
    const std::string& error() const { return m_error; }

private:
    static std::string errorString(int code) {
        char buf[AV_ERROR_MAX_STRING_SIZE] = {0};
        av_strerror(code, buf, sizeof(buf));
        return buf;
    }

    AVFormatContext* m_ctx = nullptr;
    std::string m_error;
};

} // namespace

double LibavMediaProbe::probeDuration(const std::string& path) {
    FormatHandle handle(path);
    if (!handle.get()) {
        DebugLogger::getInstance().write("[Probe] " + handle.error());
        return 0.0;
    }

    AVFormatContext* ctx = handle.get();
    if (ctx->duration != AV_NOPTS_VALUE && ctx->duration > 0) {
        return static_cast<double>(ctx->duration) / AV_TIME_BASE;
    }

    // Some containers only carry per-stream durations
    double best = 0.0;
    for (unsigned int i = 0; i < ctx->nb_streams; ++i) {
        AVStream* st = ctx->streams[i];
        if (st->duration != AV_NOPTS_VALUE && st->duration > 0) {
            double d = st->duration * av_q2d(st->time_base);
            if (d > best) best = d;
        }
    }
    if (best <= 0.0) {
        DebugLogger::getInstance().write("[Probe] No duration for " + path);
    }
    return best;
}

bool LibavMediaProbe::hasAudioStream(const std::string& path) {
    FormatHandle handle(path);
    if (!handle.get()) {
        DebugLogger::getInstance().write("[Probe] " + handle.error());
        return false;
    }

    AVFormatContext* ctx = handle.get();
    for (unsigned int i = 0; i < ctx->nb_streams; ++i) {
        if (ctx->streams[i]->codecpar->codec_type == AVMEDIA_TYPE_AUDIO) {
            return true;
        }
    }
    return false;
}

} // namespace YtMerge
