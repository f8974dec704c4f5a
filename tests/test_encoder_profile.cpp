#include <catch2/catch_test_macros.hpp>
#include "video/EncoderProfile.h"
#include "support/TestDoubles.h"

using namespace YtMerge;
using namespace YtMerge::testing;

static const char* ENCODER_LIST =
    "Encoders:\n"
    " V..... = Video\n"
    " A..... = Audio\n"
    " ------\n"
    " V....D libx264              libx264 H.264 / AVC / MPEG-4 AVC (codec h264)\n"
    " V....D h264_nvenc           NVIDIA NVENC H.264 encoder (codec h264)\n"
    " V..... h264_qsv             H.264 / AVC (Intel Quick Sync Video acceleration)\n"
    " A....D aac                  AAC (Advanced Audio Coding)\n";

TEST_CASE("Encoder list keeps only video encoders", "[encoder]") {
    std::set<std::string> encoders = parseEncoderList(ENCODER_LIST);
    CHECK(encoders.count("libx264") == 1);
    CHECK(encoders.count("h264_nvenc") == 1);
    CHECK(encoders.count("h264_qsv") == 1);
    CHECK(encoders.count("aac") == 0);
    CHECK(encoders.count("=") == 0);
    CHECK(encoders.size() == 3);
}

TEST_CASE("Encode arguments follow the profile", "[encoder]") {
    std::vector<std::string> args;
    EncoderProfile::software().appendEncodeArgs(args);
    CHECK(args == std::vector<std::string>{"-c:v", "libx264", "-preset", "ultrafast", "-crf", "23"});

    EncoderProfile nv = EncoderProfile::nvenc();
    CHECK(nv.label() == "h264_nvenc (GPU)");
    CHECK(nv.hwaccelArgs == std::vector<std::string>{"-hwaccel", "cuda"});
    CHECK(EncoderProfile::software().label() == "libx264 (CPU)");
    CHECK(EncoderProfile::quickSync() != EncoderProfile::software());
}

TEST_CASE("NVENC is chosen when listed and nvidia-smi works", "[encoder]") {
    FakeProcessRunner runner;
    runner.setHandler([](const ProcessRequest& req) {
        ProcessResult r;
        r.exitCode = 0;
        if (contains(req.argv, "-encoders")) r.output = ENCODER_LIST;
        return r;
    });

    EncoderDetector detector(runner, "ffmpeg", "/usr/bin/nvidia-smi", "");
    CHECK(detector.detect() == EncoderProfile::nvenc());
    CHECK(runner.countMatching("nvidia-smi") == 1);
    CHECK(detector.getAvailableEncoders().count("h264_nvenc") == 1);
}

TEST_CASE("Failing GPU probe falls back to software", "[encoder]") {
    FakeProcessRunner runner;
    runner.setHandler([](const ProcessRequest& req) {
        if (contains(req.argv, "-encoders")) {
            ProcessResult r;
            r.exitCode = 0;
            r.output = ENCODER_LIST;
            return r;
        }
        return FakeProcessRunner::failWith(9, "NVIDIA-SMI has failed");
    });

    // No render node either, so Quick Sync is out
    EncoderDetector detector(runner, "ffmpeg", "/usr/bin/nvidia-smi", "/nonexistent/renderD128");
    CHECK(detector.detect() == EncoderProfile::software());
}

TEST_CASE("Quick Sync needs a render node", "[encoder]") {
    TempDir dir;
    const std::string node = dir.file("renderD128");
    writeFile(node);

    FakeProcessRunner runner;
    runner.setHandler([](const ProcessRequest& req) {
        ProcessResult r;
        r.exitCode = 0;
        if (contains(req.argv, "-encoders")) {
            r.output = " V....D libx264 x\n V..... h264_qsv q\n";
        }
        return r;
    });

    EncoderDetector detector(runner, "ffmpeg", "/usr/bin/nvidia-smi", node);
    CHECK(detector.detect() == EncoderProfile::quickSync());
    // h264_nvenc was not listed, so nvidia-smi is never asked
    CHECK(runner.countMatching("nvidia-smi") == 0);
}
