#pragma once

#include <functional>
#include <string>
#include <vector>

namespace YtMerge {

struct ProcessRequest {
    std::vector<std::string> argv;       // argv[0] is the executable
    int timeoutSeconds = 0;              // 0 = wait forever
    // Called for every non-empty line of combined stdout/stderr
    std::function<void(const std::string&)> onLine;
};

struct ProcessResult {
    int exitCode = -1;        // 128 + signal number when killed by a signal
    bool timedOut = false;
    bool launchFailed = false;
    std::string output;       // combined stdout/stderr, tail only for chatty tools

    bool succeeded() const { return !launchFailed && !timedOut && exitCode == 0; }
};

/**
 * @brief Runs external tools (ffmpeg, yt-dlp) and supervises them
 *
 * Abstract so components that build command lines can be exercised
 * without the real binaries.
 */
class ProcessRunner {
public:
    virtual ~ProcessRunner() = default;
    virtual ProcessResult run(const ProcessRequest& request) = 0;
};

// fork/exec runner: no shell, stdout and stderr merged, killed on timeout
class SystemProcessRunner : public ProcessRunner {
public:
    static constexpr size_t MAX_CAPTURED_OUTPUT = 64 * 1024;

    ProcessResult run(const ProcessRequest& request) override;
};

// Shell-style rendering of argv for logs and error messages
std::string formatCommandLine(const std::vector<std::string>& argv);

// Append command, exit code and the last 4000 chars of output to a log file
void appendProcessLog(const std::string& logFile,
                      const std::string& label,
                      const std::vector<std::string>& argv,
                      const ProcessResult& result,
                      const std::string& extra = "");

} // namespace YtMerge
