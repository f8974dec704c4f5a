#pragma once

#include <fstream>
#include <memory>
#include <mutex>
#include <string>

namespace YtMerge {

// Thread-safe diagnostic log shared by the whole process.
// Writes to <temp>/ytmerge_debug.log unless redirected with setLogFile().
class DebugLogger {
public:
    static DebugLogger& getInstance();

    // Log a message to stderr and the log file
    void log(const std::string& msg);

    // Log file only, for lines already shown elsewhere
    void write(const std::string& msg);

    // Switch to another log file; returns false if it cannot be opened
    bool setLogFile(const std::string& path);

    std::string getLogFile() const;

private:
    DebugLogger();
    ~DebugLogger();

    DebugLogger(const DebugLogger&) = delete;
    DebugLogger& operator=(const DebugLogger&) = delete;

    void writeLocked(const std::string& msg);

    mutable std::mutex mutex_;
    std::unique_ptr<std::ofstream> logFile_;
    std::string logPath_;
};

} // namespace YtMerge
