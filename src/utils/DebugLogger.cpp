#include "DebugLogger.h"

#include <chrono>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace YtMerge {

namespace {

std::string timestamp() {
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    std::tm tm_buf;
    localtime_r(&t, &tm_buf);
    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
    return oss.str();
}

} // namespace

DebugLogger& DebugLogger::getInstance() {
    static DebugLogger instance;
    return instance;
}

DebugLogger::DebugLogger() {
    std::error_code ec;
    std::filesystem::path dir = std::filesystem::temp_directory_path(ec);
    if (ec) dir = ".";
    std::string path = (dir / "ytmerge_debug.log").string();

    logFile_ = std::make_unique<std::ofstream>(path, std::ios::out | std::ios::app);
    if (logFile_->is_open()) {
        logPath_ = path;
        *logFile_ << "[YtMerge] Debug log started at " << timestamp() << std::endl;
    } else {
        logFile_.reset();
    }
}

DebugLogger::~DebugLogger() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (logFile_) {
        logFile_->close();
        logFile_.reset();
    }
}

void DebugLogger::log(const std::string& msg) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::cerr << msg << std::endl;
    writeLocked(msg);
}

void DebugLogger::write(const std::string& msg) {
    std::lock_guard<std::mutex> lock(mutex_);
    writeLocked(msg);
}

bool DebugLogger::setLogFile(const std::string& path) {
    auto next = std::make_unique<std::ofstream>(path, std::ios::out | std::ios::app);
    if (!next->is_open()) {
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (logFile_) {
        logFile_->flush();
    }
    logFile_ = std::move(next);
    logPath_ = path;
    *logFile_ << "[YtMerge] Debug log started at " << timestamp() << std::endl;
    return true;
}

std::string DebugLogger::getLogFile() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return logPath_;
}

void DebugLogger::writeLocked(const std::string& msg) {
    if (logFile_ && logFile_->is_open()) {
        *logFile_ << msg << std::endl;
    }
}

} // namespace YtMerge
