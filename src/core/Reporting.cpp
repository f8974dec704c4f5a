#include "Reporting.h"
#include "utils/DebugLogger.h"

#include <algorithm>
#include <cmath>
#include <iostream>

namespace YtMerge {

void ConsoleLogSink::log(const std::string& line) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        std::cout << line << std::endl;
    }
    DebugLogger::getInstance().write(line);
}

double ConsoleProgressSink::overallFraction(const std::string& stage, size_t completed, size_t total) {
    double begin = 0.0;
    double span = 0.0;
    if (stage == Stage::FETCH) {
        begin = 0.0;  span = 0.40;
    } else if (stage == Stage::NORMALIZE) {
        begin = 0.40; span = 0.40;
    } else if (stage == Stage::MERGE) {
        begin = 0.80; span = 0.15;
    } else if (stage == Stage::FINALIZE) {
        begin = 0.95; span = 0.05;
    } else {
        return 0.0;
    }

    double within = total > 0 ? static_cast<double>(completed) / static_cast<double>(total) : 1.0;
    within = std::max(0.0, std::min(1.0, within));
    return begin + span * within;
}

void ConsoleProgressSink::onStageProgress(const std::string& stage, size_t completed, size_t total) {
    int percent = static_cast<int>(std::lround(overallFraction(stage, completed, total) * 100.0));

    std::lock_guard<std::mutex> lock(m_mutex);
    if (percent == m_lastPercent) return;
    m_lastPercent = percent;

    const int width = 30;
    int filled = percent * width / 100;
    std::cout << "[" << std::string(filled, '#') << std::string(width - filled, '-') << "] "
              << percent << "% " << stage << " " << completed << "/" << total << std::endl;
}

} // namespace YtMerge
