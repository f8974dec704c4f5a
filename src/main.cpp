#include "core/BatchParser.h"
#include "core/Reporting.h"
#include "core/RunSettings.h"
#include "core/SettingsManager.h"
#include "download/YtDlpDownloadService.h"
#include "engine/MergeEngine.h"
#include "tracing/Tracing.h"
#include "utils/BinaryLocator.h"
#include "utils/DebugLogger.h"
#include "utils/ProcessUtils.h"
#include "utils/StringUtils.h"
#include "video/EncoderProfile.h"
#include "video/MediaProbe.h"
#include <wx/init.h>

#include <atomic>
#include <csignal>
#include <cstring>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using namespace YtMerge;

namespace {

std::atomic<MergeEngine*> g_engine{nullptr};

extern "C" void handleInterrupt(int) {
    MergeEngine* engine = g_engine.load();
    if (engine) {
        engine->cancel();
    }
}

} // namespace

void printUsage(const char* programName) {
    std::cout << "ytmerge - Download, normalize and merge video batches\n";
    std::cout << "Version 1.0.0\n\n";
    std::cout << "Usage:\n";
    std::cout << "  " << programName << " [options] <batch-file | URL...>\n\n";
    std::cout << "A batch file holds one entry per line: URL [start] [end]\n";
    std::cout << "Timestamps accept 90, 1:30, 0:01:30 or 01:30.500. Lines starting with # are ignored.\n\n";
    std::cout << "Options:\n";
    std::cout << "  -o, --output <file>         Output file path (default: merged.<format>)\n";
    std::cout << "  -r, --resolution <name>     480p, 720p, 1080p or 1440p (default: 1080p)\n";
    std::cout << "      --format <mp4|mkv>      Output container (default: mp4)\n";
    std::cout << "      --transitions           Crossfade between clips\n";
    std::cout << "      --fade <seconds>        Crossfade duration (default: 0.5)\n";
    std::cout << "      --music <file>          Background music to mix under the result\n";
    std::cout << "      --music-volume <value>  Music volume 0.0-4.0 (default: 0.15)\n";
    std::cout << "  -j, --jobs <n>              Parallel downloads (default: 3)\n";
    std::cout << "      --cache-dir <dir>       Cache directory for downloads and processed clips\n";
    std::cout << "      --no-cache-skip         Always download, even if the cache has the file\n";
    std::cout << "      --config <file>         Settings file (default: " << SettingsManager::defaultSettingsPath() << ")\n";
    std::cout << "      --save-settings         Write the effective settings back to the settings file\n";
    std::cout << "      --trace <file>          Write trace spans to file\n";
    std::cout << "      --debug-log <file>      Write the debug log to file instead of the temp dir\n";
    std::cout << "  -h, --help                  Show this help message\n\n";
    std::cout << "Examples:\n";
    std::cout << "  " << programName << " videos.txt -o party.mp4\n";
    std::cout << "  " << programName << " --transitions --fade 1 -r 720p videos.txt\n";
    std::cout << "  " << programName << " https://youtu.be/abc https://youtu.be/def --music song.mp3\n";
}

static void printSummary(const std::vector<EntrySnapshot>& entries) {
    std::cout << "\n";
    std::cout << std::left << std::setw(4) << "#" << std::setw(16) << "Status"
              << std::setw(12) << "Start" << std::setw(12) << "End" << "Title\n";
    for (size_t i = 0; i < entries.size(); ++i) {
        const EntrySnapshot& e = entries[i];
        std::cout << std::left << std::setw(4) << (i + 1) << std::setw(16) << e.statusLabel
                  << std::setw(12) << e.startTime << std::setw(12) << e.endTime << e.title << "\n";
        if (e.status == EntryStatus::Error && !e.errorMsg.empty()) {
            std::cout << "    " << e.errorMsg << "\n";
        }
    }
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        printUsage(argv[0]);
        return 1;
    }

    wxInitializer initializer;
    if (!initializer.IsOk()) {
        std::cerr << "Error: Failed to initialise wxWidgets\n";
        return 1;
    }

    // First pass: settings file location, so that flags override its values
    std::string configPath;
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            printUsage(argv[0]);
            return 0;
        }
        if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            configPath = argv[i + 1];
        }
    }

    SettingsManager settingsFile(configPath);
    if (!settingsFile.Load()) {
        std::cerr << "Error: " << settingsFile.getLastError() << "\n";
        return 1;
    }

    RunSettings settings;
    applySettings(settingsFile, settings);

    std::vector<std::string> inputs;
    std::string traceFile;
    std::string debugLogFile;
    bool saveSettings = false;

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];
        bool hasValue = i + 1 < argc;
        double number = 0.0;

        if ((std::strcmp(arg, "-o") == 0 || std::strcmp(arg, "--output") == 0) && hasValue) {
            settings.outputPath = argv[++i];
        } else if ((std::strcmp(arg, "-r") == 0 || std::strcmp(arg, "--resolution") == 0) && hasValue) {
            settings.resolution = argv[++i];
        } else if (std::strcmp(arg, "--format") == 0 && hasValue) {
            settings.outputFormat = argv[++i];
        } else if (std::strcmp(arg, "--transitions") == 0) {
            settings.enableTransitions = true;
        } else if (std::strcmp(arg, "--fade") == 0 && hasValue) {
            if (!parseDouble(argv[++i], number)) {
                std::cerr << "Error: Invalid fade duration: " << argv[i] << "\n";
                return 1;
            }
            settings.fadeDuration = number;
        } else if (std::strcmp(arg, "--music") == 0 && hasValue) {
            settings.backgroundMusic = argv[++i];
        } else if (std::strcmp(arg, "--music-volume") == 0 && hasValue) {
            if (!parseDouble(argv[++i], number)) {
                std::cerr << "Error: Invalid music volume: " << argv[i] << "\n";
                return 1;
            }
            settings.musicVolume = number;
        } else if ((std::strcmp(arg, "-j") == 0 || std::strcmp(arg, "--jobs") == 0) && hasValue) {
            int jobs = 0;
            if (!parseInt(argv[++i], jobs)) {
                std::cerr << "Error: Invalid job count: " << argv[i] << "\n";
                return 1;
            }
            settings.maxConcurrentDownloads = jobs;
        } else if (std::strcmp(arg, "--cache-dir") == 0 && hasValue) {
            settings.cacheDir = argv[++i];
        } else if (std::strcmp(arg, "--no-cache-skip") == 0) {
            settings.skipCachedDownloads = false;
        } else if (std::strcmp(arg, "--config") == 0 && hasValue) {
            ++i;
        } else if (std::strcmp(arg, "--trace") == 0 && hasValue) {
            traceFile = argv[++i];
        } else if (std::strcmp(arg, "--debug-log") == 0 && hasValue) {
            debugLogFile = argv[++i];
        } else if (std::strcmp(arg, "--save-settings") == 0) {
            saveSettings = true;
        } else if (arg[0] == '-' && arg[1] != '\0') {
            std::cerr << "Error: Unknown or incomplete option: " << arg << "\n\n";
            printUsage(argv[0]);
            return 1;
        } else {
            inputs.push_back(arg);
        }
    }

    if (settings.outputPath.empty()) {
        settings.outputPath = "merged." + settings.outputFormat;
    } else if (fs::path(settings.outputPath).extension().empty()) {
        settings.outputPath += "." + settings.outputFormat;
    }

    std::string error;
    if (!settings.validate(error)) {
        std::cerr << "Error: " << error << "\n";
        return 1;
    }

    if (saveSettings) {
        storeSettings(settings, settingsFile);
        if (!settingsFile.Save()) {
            std::cerr << "Warning: " << settingsFile.getLastError() << "\n";
        } else {
            std::cout << "Settings saved to " << settingsFile.getPath() << "\n";
        }
    }

    if (inputs.empty()) {
        std::cerr << "Error: No batch file or URLs given\n\n";
        printUsage(argv[0]);
        return 1;
    }

    std::vector<BatchLine> lines;
    for (const auto& input : inputs) {
        std::error_code ec;
        if (fs::is_regular_file(input, ec)) {
            if (!loadBatchFile(input, lines, error)) {
                std::cerr << "Error: " << error << "\n";
                return 1;
            }
        } else if (auto line = parseUrlLine(input)) {
            lines.push_back(*line);
        } else {
            std::cerr << "Error: Not a URL or readable batch file: " << input << "\n";
            return 1;
        }
    }

    if (!debugLogFile.empty() && !DebugLogger::getInstance().setLogFile(debugLogFile)) {
        std::cerr << "Error: Could not open debug log: " << debugLogFile << "\n";
        return 1;
    }

    if (!traceFile.empty()) {
        tracing::InitTracing(traceFile);
    }

    Toolchain tools;
    if (!resolveToolchain(tools, error)) {
        std::cerr << "Error: " << error << "\n";
        return 1;
    }

    SystemProcessRunner runner;
    EncoderDetector detector(runner, tools.ffmpegPath);
    EncoderProfile encoder = detector.detect();

    LibavMediaProbe probe;
    YtDlpDownloadService downloader(runner, tools.ytDlpPath);
    ConsoleLogSink log;
    ConsoleProgressSink progress;

    EngineServices services;
    services.ffmpegPath = tools.ffmpegPath;
    services.runner = &runner;
    services.downloader = &downloader;
    services.probe = &probe;

    MergeEngine engine(settings, encoder, services, log, progress);
    for (const auto& line : lines) {
        engine.addEntry(makeEntry(line));
    }

    g_engine.store(&engine);
    std::signal(SIGINT, handleInterrupt);

    bool ok = engine.run();

    std::signal(SIGINT, SIG_DFL);
    g_engine.store(nullptr);

    printSummary(engine.snapshots());

    if (!traceFile.empty()) {
        tracing::ShutdownTracing();
    }

    if (!ok) {
        const OpError& err = engine.getLastError();
        std::cerr << "\nFailed (" << errorKindName(err.kind) << "): " << err.message << "\n";
        std::cerr << "Details: " << DebugLogger::getInstance().getLogFile() << "\n";
        return 1;
    }

    std::cout << "\nDone: " << fs::absolute(settings.outputPath).string() << "\n";
    return 0;
}
