#include <catch2/catch_test_macros.hpp>
#include "video/Normalizer.h"
#include "support/TestDoubles.h"

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <filesystem>

using namespace YtMerge;
using namespace YtMerge::testing;

namespace {

struct NormalizeFixture {
    TempDir cache{"ytmerge_norm"};
    RunSettings settings;
    FakeProcessRunner runner;
    FakeMediaProbe probe;
    RecordingLogSink log;
    std::atomic<bool> cancelled{false};
    EncoderProfile encoder = EncoderProfile::software();

    NormalizeFixture() {
        settings.outputPath = "out.mp4";
    }

    Normalizer normalizer() {
        return Normalizer(settings, encoder, "ffmpeg", cache.str(), runner, probe, log, cancelled);
    }

    // Entry that has been fetched into the cache
    std::shared_ptr<Entry> fetched(const std::string& id, const std::string& start = "",
                                   const std::string& end = "") {
        auto entry = std::make_shared<Entry>("https://youtu.be/" + id, start, end);
        std::string raw = cache.file(id + "_1080.mp4");
        writeFile(raw, "raw");
        entry->setMetadata("Clip " + id, id, 10.0);
        entry->setDownloadedPath(raw);
        entry->setStatus(EntryStatus::Fetched);
        return entry;
    }
};

ptrdiff_t indexOf(const std::vector<std::string>& argv, const std::string& value) {
    auto it = std::find(argv.begin(), argv.end(), value);
    return it == argv.end() ? -1 : it - argv.begin();
}

} // namespace

TEST_CASE("Existing normalized file is reused", "[normalize]") {
    NormalizeFixture f;
    auto entry = f.fetched("abc");
    writeFile(f.cache.file("proc_abc_1080.mp4"));

    OpResult r = f.normalizer().normalize(*entry, 0, 1);

    REQUIRE(r.success);
    CHECK(f.runner.callCount() == 0);
    CHECK(entry->getStatus() == EntryStatus::Normalized);
    CHECK(entry->getProcessedPath() == f.cache.file("proc_abc_1080.mp4"));
    CHECK(f.log.containsText("Cache hit: Clip abc"));
}

TEST_CASE("Trimmed entries do not reuse the untrimmed normalized file", "[normalize]") {
    NormalizeFixture f;
    writeFile(f.cache.file("proc_abc_1080.mp4"), "full clip");
    auto entry = f.fetched("abc", "0:10", "0:25");

    OpResult r = f.normalizer().normalize(*entry, 0, 1);

    REQUIRE(r.success);
    CHECK(f.runner.callCount() == 1);
    CHECK(entry->getProcessedPath() == f.cache.file("proc_abc_1080_10000-25000.mp4"));
    CHECK(readFile(f.cache.file("proc_abc_1080.mp4")) == "full clip");

    auto startOnly = f.fetched("abc", "1:30");
    CHECK(f.normalizer().cachePathFor(*startOnly) == f.cache.file("proc_abc_1080_90000.mp4"));
}

TEST_CASE("Missing source file fails the entry", "[normalize]") {
    NormalizeFixture f;
    auto entry = f.fetched("abc");
    std::filesystem::remove(entry->getDownloadedPath());

    OpResult r = f.normalizer().normalize(*entry, 0, 1);

    CHECK(r.error.kind == ErrorKind::SourceMissing);
    CHECK(entry->getStatus() == EntryStatus::Error);
    CHECK(entry->getErrorMessage() == "Source file missing");
    CHECK(f.runner.callCount() == 0);
}

TEST_CASE("Trimmed clips without audio get a silent track", "[normalize]") {
    NormalizeFixture f;
    auto entry = f.fetched("abc", "0:10", "0:25");

    auto cmd = f.normalizer().buildCommand(*entry, "/src.mp4", false, "/out.part.mp4");

    REQUIRE(indexOf(cmd, "-ss") >= 0);
    CHECK(cmd[indexOf(cmd, "-ss") + 1] == "10.000");
    CHECK(indexOf(cmd, "-ss") < indexOf(cmd, "/src.mp4"));
    CHECK(cmd[indexOf(cmd, "-t") + 1] == "15.000");
    CHECK(contains(cmd, "anullsrc=channel_layout=stereo:sample_rate=44100"));
    CHECK(contains(cmd, "1:a:0"));
    CHECK(contains(cmd, "-shortest"));
    CHECK(contains(cmd, "scale=1920:1080:force_original_aspect_ratio=decrease,"
                        "pad=1920:1080:(ow-iw)/2:(oh-ih)/2:black,setsar=1,fps=30"));
    CHECK(contains(cmd, "libx264"));
    CHECK(cmd.back() == "/out.part.mp4");

    CHECK(f.normalizer().cachePathFor(*entry) == f.cache.file("proc_abc_1080_10000-25000.mp4"));
}

TEST_CASE("Clips with audio keep their own track", "[normalize]") {
    NormalizeFixture f;
    f.encoder = EncoderProfile::nvenc();
    auto entry = f.fetched("abc");

    auto cmd = f.normalizer().buildCommand(*entry, "/src.mp4", true, "/out.part.mp4");

    CHECK_FALSE(contains(cmd, "-ss"));
    CHECK_FALSE(contains(cmd, "-t"));
    CHECK_FALSE(contains(cmd, "lavfi"));
    CHECK_FALSE(contains(cmd, "-map"));
    CHECK(indexOf(cmd, "-hwaccel") < indexOf(cmd, "-i"));
    CHECK(contains(cmd, "h264_nvenc"));
    CHECK(cmd[indexOf(cmd, "-b:a") + 1] == "192k");
}

TEST_CASE("Successful encode lands under the cache name", "[normalize]") {
    NormalizeFixture f;
    auto entry = f.fetched("abc");
    double midProgress = -1.0;
    f.runner.setHandler([&](const ProcessRequest& req) {
        req.onLine("out_time_us=5000000");
        midProgress = entry->getProgress();
        return FakeProcessRunner::writeOutput(req);
    });

    OpResult r = f.normalizer().normalize(*entry, 0, 1);

    REQUIRE(r.success);
    CHECK(midProgress == 0.5);
    CHECK(entry->getStatus() == EntryStatus::Normalized);
    CHECK(entry->getProcessedPath() == f.cache.file("proc_abc_1080.mp4"));
    CHECK(std::filesystem::exists(f.cache.file("proc_abc_1080.mp4")));
    CHECK_FALSE(std::filesystem::exists(f.cache.file("proc_abc_1080.part.mp4")));

    auto requests = f.runner.requests();
    REQUIRE(requests.size() == 1);
    CHECK(requests[0].timeoutSeconds == NORMALIZE_TIMEOUT_SECONDS);
    CHECK(requests[0].argv.back() == f.cache.file("proc_abc_1080.part.mp4"));
    CHECK(std::filesystem::exists(f.normalizer().getProcessLogPath()));
}

TEST_CASE("Timeouts are reported", "[normalize]") {
    NormalizeFixture f;
    auto entry = f.fetched("abc");
    f.runner.setHandler([](const ProcessRequest&) {
        ProcessResult r;
        r.timedOut = true;
        r.exitCode = 137;
        return r;
    });

    OpResult r = f.normalizer().normalize(*entry, 0, 1);

    CHECK(r.error.kind == ErrorKind::Timeout);
    CHECK(entry->getErrorMessage() == "Processing timed out (10 min)");
    CHECK_FALSE(std::filesystem::exists(f.cache.file("proc_abc_1080.mp4")));
}

TEST_CASE("Non-zero exit carries the diagnostics tail", "[normalize]") {
    NormalizeFixture f;
    auto entry = f.fetched("abc");
    f.runner.setHandler([](const ProcessRequest&) {
        return FakeProcessRunner::failWith(1, std::string(500, '.') + "Invalid data found when processing input\n");
    });

    OpResult r = f.normalizer().normalize(*entry, 0, 1);

    CHECK(r.error.kind == ErrorKind::ProcessFailed);
    CHECK(entry->getStatus() == EntryStatus::Error);
    std::string msg = entry->getErrorMessage();
    CHECK(msg.rfind("FFmpeg exit code 1: ", 0) == 0);
    CHECK(msg.find("Invalid data found when processing input") != std::string::npos);
    CHECK(msg.size() <= Entry::MAX_ERROR_LENGTH);
}

TEST_CASE("Cancelled normalize leaves the cache alone", "[normalize]") {
    NormalizeFixture f;
    auto entry = f.fetched("abc");
    f.cancelled.store(true);

    OpResult r = f.normalizer().normalize(*entry, 0, 1);

    CHECK(r.error.kind == ErrorKind::Cancelled);
    CHECK(entry->getStatus() == EntryStatus::Cancelled);
    CHECK(f.runner.callCount() == 0);
}
