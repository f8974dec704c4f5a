#include <catch2/catch_test_macros.hpp>
#include "video/MediaProbe.h"

using namespace YtMerge;

TEST_CASE("Unreadable media probes as zero length without audio", "[probe]") {
    LibavMediaProbe probe;
    CHECK(probe.probeDuration("/nonexistent/ytmerge/clip.mp4") == 0.0);
    CHECK_FALSE(probe.hasAudioStream("/nonexistent/ytmerge/clip.mp4"));
}
