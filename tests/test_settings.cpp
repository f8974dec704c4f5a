#include <catch2/catch_test_macros.hpp>
#include "core/RunSettings.h"
#include "core/SettingsManager.h"
#include "support/TestDoubles.h"

using namespace YtMerge;
using namespace YtMerge::testing;

TEST_CASE("Resolution presets", "[settings]") {
    CHECK(resolutionFromName("480p").width == 854);
    CHECK(resolutionFromName("720p").height == 720);
    CHECK(resolutionFromName("1440p").width == 2560);
    CHECK(resolutionFromName("4k").width == 1920);
    CHECK(resolutionFromName("4k").height == 1080);
    CHECK(resolutionNames().size() == 4);

    RunSettings s;
    s.resolution = "720p";
    CHECK(s.width() == 1280);
    CHECK(s.height() == 720);
}

TEST_CASE("Settings validation rejects bad values", "[settings]") {
    RunSettings s;
    s.outputPath = "out.mp4";
    std::string error;
    REQUIRE(s.validate(error));
    CHECK(error.empty());

    SECTION("empty output") {
        s.outputPath.clear();
        CHECK_FALSE(s.validate(error));
    }
    SECTION("unknown container") {
        s.outputFormat = "avi";
        CHECK_FALSE(s.validate(error));
        CHECK(error.find("avi") != std::string::npos);
    }
    SECTION("non-positive fade with transitions") {
        s.enableTransitions = true;
        s.fadeDuration = 0.0;
        CHECK_FALSE(s.validate(error));
        s.enableTransitions = false;
        CHECK(s.validate(error));
    }
    SECTION("volume out of range") {
        s.musicVolume = 4.5;
        CHECK_FALSE(s.validate(error));
        s.musicVolume = -0.1;
        CHECK_FALSE(s.validate(error));
    }
    SECTION("no download workers") {
        s.maxConcurrentDownloads = 0;
        CHECK_FALSE(s.validate(error));
    }
}

TEST_CASE("Settings file round-trips run settings", "[settings]") {
    TempDir dir;
    const std::string path = dir.file("conf/settings.ini");

    RunSettings original;
    original.resolution = "720p";
    original.outputPath = "/videos/out.mkv";
    original.outputFormat = "mkv";
    original.enableTransitions = true;
    original.fadeDuration = 1.25;
    original.backgroundMusic = "/music/song.mp3";
    original.musicVolume = 0.3;
    original.maxConcurrentDownloads = 5;
    original.cacheDir = "/var/cache/ytm";
    original.skipCachedDownloads = false;

    {
        SettingsManager manager(path);
        storeSettings(original, manager);
        REQUIRE(manager.Save());
    }

    SettingsManager loaded(path);
    REQUIRE(loaded.Load());
    RunSettings copy;
    applySettings(loaded, copy);

    CHECK(copy.resolution == "720p");
    CHECK(copy.outputPath == "/videos/out.mkv");
    CHECK(copy.outputFormat == "mkv");
    CHECK(copy.enableTransitions);
    CHECK(copy.fadeDuration == 1.25);
    CHECK(copy.backgroundMusic == "/music/song.mp3");
    CHECK(copy.musicVolume == 0.3);
    CHECK(copy.maxConcurrentDownloads == 5);
    CHECK(copy.cacheDir == "/var/cache/ytm");
    CHECK_FALSE(copy.skipCachedDownloads);
}

TEST_CASE("Settings file tolerates comments, groups and bad values", "[settings]") {
    TempDir dir;
    const std::string path = dir.file("settings.ini");
    writeFile(path,
              "# comment\n"
              "; another\n"
              "resolution = 480p\n"
              "max_downloads = lots\n"
              "transitions = 1\n"
              "[other]\n"
              "format = mkv\n");

    SettingsManager manager(path);
    REQUIRE(manager.Load());
    CHECK(manager.Has("resolution"));
    CHECK_FALSE(manager.Has("format"));

    RunSettings s;
    applySettings(manager, s);
    CHECK(s.resolution == "480p");
    CHECK(s.outputFormat == "mp4");
    CHECK(s.maxConcurrentDownloads == DEFAULT_MAX_CONCURRENT_DOWNLOADS);
    CHECK(s.enableTransitions);
    CHECK(manager.GetDouble("missing", 2.5) == 2.5);
}

TEST_CASE("Load picks up edits made outside the program", "[settings]") {
    TempDir dir;
    const std::string path = dir.file("settings.ini");
    writeFile(path, "resolution = 720p\n");

    SettingsManager manager(path);
    CHECK(manager.GetString("resolution") == "720p");

    writeFile(path, "resolution = 1440p\n");
    REQUIRE(manager.Load());
    CHECK(manager.GetString("resolution") == "1440p");
}

TEST_CASE("Values with spaces and dollar signs are stored literally", "[settings]") {
    TempDir dir;
    const std::string path = dir.file("settings.ini");
    {
        SettingsManager manager(path);
        manager.SetString("music", "/home/me/My Music/$HOME song.mp3");
        REQUIRE(manager.Save());
    }
    SettingsManager loaded(path);
    CHECK(loaded.GetString("music") == "/home/me/My Music/$HOME song.mp3");
}

TEST_CASE("Missing settings file loads as empty", "[settings]") {
    TempDir dir;
    SettingsManager manager(dir.file("absent.ini"));
    CHECK(manager.Load());
    CHECK(manager.getLastError().empty());
    CHECK_FALSE(manager.Has("resolution"));
}
