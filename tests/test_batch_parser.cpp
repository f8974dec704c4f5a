#include <catch2/catch_test_macros.hpp>
#include "core/BatchParser.h"
#include "support/TestDoubles.h"

using namespace YtMerge;
using namespace YtMerge::testing;

TEST_CASE("URL lines carry optional start and end", "[batch]") {
    auto line = parseUrlLine("https://x.com/v 0:10 0:20");
    REQUIRE(line);
    CHECK(line->url == "https://x.com/v");
    CHECK(line->startTime == "0:10");
    CHECK(line->endTime == "0:20");

    auto bare = parseUrlLine("  https://youtu.be/abc  ");
    REQUIRE(bare);
    CHECK(bare->url == "https://youtu.be/abc");
    CHECK(bare->startTime.empty());
    CHECK(bare->endTime.empty());
}

TEST_CASE("Commas and tabs separate fields; extras are ignored", "[batch]") {
    auto line = parseUrlLine("https://x.com/v,\t1:00 , 2:00 trailing words");
    REQUIRE(line);
    CHECK(line->startTime == "1:00");
    CHECK(line->endTime == "2:00");
}

TEST_CASE("Blank, comment and non-http lines are skipped", "[batch]") {
    CHECK_FALSE(parseUrlLine(""));
    CHECK_FALSE(parseUrlLine("   "));
    CHECK_FALSE(parseUrlLine("# https://youtu.be/abc"));
    CHECK_FALSE(parseUrlLine("ftp://x.com/v"));
    CHECK_FALSE(parseUrlLine("youtu.be/abc"));
}

TEST_CASE("YouTube ids are extracted from common link shapes", "[batch]") {
    CHECK(extractVideoId("https://www.youtube.com/watch?v=dQw4w9WgXcQ") == "dQw4w9WgXcQ");
    CHECK(extractVideoId("https://m.youtube.com/watch?feature=share&v=abc-DEF_123") == "abc-DEF_123");
    CHECK(extractVideoId("https://youtu.be/xyz987") == "xyz987");
    CHECK(extractVideoId("https://youtube.com/shorts/short1") == "short1");
    CHECK(extractVideoId("https://www.youtube.com/embed/emb42?start=3") == "emb42");
    CHECK(extractVideoId("https://vimeo.com/12345").empty());

    CHECK(isYoutubeUrl("https://youtu.be/xyz987"));
    CHECK_FALSE(isYoutubeUrl("https://example.com/watch?v=1"));
}

TEST_CASE("Batch files are read line by line", "[batch]") {
    TempDir dir;
    const std::string path = dir.file("batch.txt");
    writeFile(path,
              "# party mix\n"
              "https://youtu.be/one\n"
              "\n"
              "https://youtu.be/two 0:05 0:15\r\n"
              "not a url\n"
              "https://youtu.be/three, 30\n");

    std::vector<BatchLine> lines;
    std::string error;
    REQUIRE(loadBatchFile(path, lines, error));
    REQUIRE(lines.size() == 3);
    CHECK(lines[0].url == "https://youtu.be/one");
    CHECK(lines[1].startTime == "0:05");
    CHECK(lines[1].endTime == "0:15");
    CHECK(lines[2].startTime == "30");

    auto entry = makeEntry(lines[1]);
    CHECK(entry->getUrl() == "https://youtu.be/two");
    CHECK(entry->getEndTime() == "0:15");
}

TEST_CASE("Missing batch file reports an error", "[batch]") {
    std::vector<BatchLine> lines;
    std::string error;
    CHECK_FALSE(loadBatchFile("/nonexistent/ytmerge/batch.txt", lines, error));
    CHECK(error.find("Could not open batch file") != std::string::npos);
    CHECK(lines.empty());
}
