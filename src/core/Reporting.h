#pragma once

#include <cstddef>
#include <mutex>
#include <string>

namespace YtMerge {

// Stage names passed to StageProgressSink
namespace Stage {
constexpr const char* FETCH = "fetch";
constexpr const char* NORMALIZE = "normalize";
constexpr const char* MERGE = "merge";
constexpr const char* FINALIZE = "finalize";
}

// Receives human-readable pipeline narration, one line per call
class LogSink {
public:
    virtual ~LogSink() = default;
    virtual void log(const std::string& line) = 0;
};

/**
 * @brief Receives per-stage completion counts
 *
 * Called from fetch worker threads during the fetch stage, so
 * implementations must be thread-safe.
 */
class StageProgressSink {
public:
    virtual ~StageProgressSink() = default;
    virtual void onStageProgress(const std::string& stage, size_t completed, size_t total) = 0;
};

class NullLogSink : public LogSink {
public:
    void log(const std::string&) override {}
};

class NullProgressSink : public StageProgressSink {
public:
    void onStageProgress(const std::string&, size_t, size_t) override {}
};

// Prints to stdout and mirrors every line into the DebugLogger file
class ConsoleLogSink : public LogSink {
public:
    void log(const std::string& line) override;

private:
    std::mutex m_mutex;
};

/**
 * @brief Single progress bar across all four stages
 *
 * Stages are weighted fetch 0-40%, normalize 40-80%, merge 80-95% and
 * finalize 95-100%.
 */
class ConsoleProgressSink : public StageProgressSink {
public:
    void onStageProgress(const std::string& stage, size_t completed, size_t total) override;

    // Overall fraction in [0, 1] for a stage position
    static double overallFraction(const std::string& stage, size_t completed, size_t total);

private:
    std::mutex m_mutex;
    int m_lastPercent = -1;
};

} // namespace YtMerge
