#include <catch2/catch_test_macros.hpp>
#include "utils/DebugLogger.h"
#include "support/TestDoubles.h"

using namespace YtMerge;
using namespace YtMerge::testing;

TEST_CASE("Debug log can be redirected to another file", "[logging]") {
    TempDir dir;
    DebugLogger& logger = DebugLogger::getInstance();
    const std::string previous = logger.getLogFile();
    const std::string path = dir.file("debug.log");

    REQUIRE(logger.setLogFile(path));
    CHECK(logger.getLogFile() == path);
    logger.write("[Test] redirected line");

    // Switch back before TempDir removes the file
    if (!previous.empty()) {
        logger.setLogFile(previous);
    }

    std::string content = readFile(path);
    CHECK(content.find("Debug log started") != std::string::npos);
    CHECK(content.find("[Test] redirected line") != std::string::npos);
}

TEST_CASE("Unwritable debug log path keeps the current file", "[logging]") {
    TempDir dir;
    DebugLogger& logger = DebugLogger::getInstance();
    const std::string previous = logger.getLogFile();

    CHECK_FALSE(logger.setLogFile(dir.file("missing/dir/debug.log")));
    CHECK(logger.getLogFile() == previous);
}
