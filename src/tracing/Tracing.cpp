#include "tracing/Tracing.h"

#include <chrono>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <thread>
#include <utility>
#include <vector>

namespace YtMerge {
namespace tracing {

struct Span::Impl {
    std::string name;
    std::chrono::steady_clock::time_point start;
    std::vector<std::pair<std::string, std::string>> attributes;
    bool ended = false;
};

static std::mutex g_mutex;
static std::unique_ptr<std::ofstream> g_out;
static std::string g_outfile_path;

static std::string timestamp() {
    using namespace std::chrono;
    auto now = system_clock::now();
    auto t = system_clock::to_time_t(now);
    auto ms = duration_cast<milliseconds>(now.time_since_epoch()) % 1000;
    std::tm tm_buf;
    localtime_r(&t, &tm_buf);
    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S") << "." << std::setw(3) << std::setfill('0') << ms.count();
    return oss.str();
}

void InitTracing(const std::string& outfile) {
    std::filesystem::path new_path;
    if (!outfile.empty()) {
        new_path = outfile;
    } else {
        std::error_code ec;
        std::filesystem::path td = std::filesystem::temp_directory_path(ec);
        if (!ec) {
            new_path = td / "ytmerge-trace.log";
        } else {
            std::cerr << "Warning: unable to determine temp directory: " << ec.message() << ". Using current directory for trace file.\n";
            new_path = std::filesystem::path("ytmerge-trace.log");
        }
    }

    std::unique_ptr<std::ofstream> previous;
    {
        std::lock_guard<std::mutex> lk(g_mutex);
        if (g_out && g_outfile_path == new_path.string()) {
            return;
        }
        previous = std::move(g_out);
        g_outfile_path.clear();

        g_out = std::make_unique<std::ofstream>(new_path.string(), std::ios::app);
        if (!g_out->is_open()) {
            std::cerr << "Warning: could not open tracing file: " << new_path.string() << "\n";
            g_out.reset();
        } else {
            g_outfile_path = new_path.string();
        }
    }

    // Close the old file outside the lock
    if (previous) {
        previous->flush();
        previous->close();
    }
}

void ShutdownTracing() {
    std::lock_guard<std::mutex> lk(g_mutex);
    if (g_out) {
        g_out->flush();
        g_out->close();
        g_out.reset();
    }
    g_outfile_path.clear();
}

Span::Span(const char* name) : impl_(std::make_unique<Impl>()) {
    impl_->name = name ? name : "";
    impl_->start = std::chrono::steady_clock::now();
    std::lock_guard<std::mutex> lk(g_mutex);
    if (g_out) {
        (*g_out) << timestamp() << " START " << impl_->name << " thread=" << std::this_thread::get_id() << "\n";
    }
}

Span::Span(const std::string& name) : Span(name.c_str()) {}

Span::~Span() {
    End();
}

void Span::SetAttribute(const std::string& key, const std::string& value) {
    if (impl_ && !impl_->ended) {
        impl_->attributes.emplace_back(key, value);
    }
}

void Span::End() {
    if (!impl_ || impl_->ended) return;
    impl_->ended = true;
    auto end = std::chrono::steady_clock::now();
    auto dur = std::chrono::duration_cast<std::chrono::milliseconds>(end - impl_->start).count();
    std::lock_guard<std::mutex> lk(g_mutex);
    if (g_out) {
        (*g_out) << timestamp() << " END " << impl_->name << " thread=" << std::this_thread::get_id() << " duration=" << dur << "ms";
        for (const auto& attr : impl_->attributes) {
            (*g_out) << " " << attr.first << "=" << attr.second;
        }
        (*g_out) << "\n";
    }
}

} // namespace tracing
} // namespace YtMerge
