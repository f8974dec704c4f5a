#pragma once

#include "core/Reporting.h"
#include "download/DownloadService.h"
#include "utils/ProcessUtils.h"
#include "video/MediaProbe.h"

#include <algorithm>
#include <chrono>
#include <deque>
#include <filesystem>
#include <fstream>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace YtMerge {
namespace testing {

// Fresh directory under the system temp dir, removed on destruction
class TempDir {
public:
    explicit TempDir(const std::string& prefix = "ytmerge_test") {
        auto now = std::chrono::steady_clock::now().time_since_epoch().count();
        m_path = std::filesystem::temp_directory_path() / (prefix + "_" + std::to_string(now));
        std::filesystem::create_directories(m_path);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(m_path, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return m_path; }
    std::string str() const { return m_path.string(); }
    std::string file(const std::string& name) const { return (m_path / name).string(); }

private:
    std::filesystem::path m_path;
};

inline void writeFile(const std::string& path, const std::string& content = "data") {
    std::ofstream out(path, std::ios::binary);
    out << content;
}

inline std::string readFile(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

inline bool contains(const std::vector<std::string>& argv, const std::string& value) {
    return std::find(argv.begin(), argv.end(), value) != argv.end();
}

inline bool anyContains(const std::vector<std::string>& argv, const std::string& fragment) {
    for (const auto& a : argv) {
        if (a.find(fragment) != std::string::npos) return true;
    }
    return false;
}

/**
 * Records every request. Without a handler, each run "succeeds" and writes
 * a small file at the last argument, the way ffmpeg writes its output.
 */
class FakeProcessRunner : public ProcessRunner {
public:
    using Handler = std::function<ProcessResult(const ProcessRequest&)>;

    ProcessResult run(const ProcessRequest& request) override {
        Handler handler;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_requests.push_back(request);
            handler = m_handler;
        }
        if (handler) return handler(request);
        return writeOutput(request);
    }

    static ProcessResult writeOutput(const ProcessRequest& request) {
        if (!request.argv.empty()) {
            writeFile(request.argv.back(), "video");
        }
        ProcessResult r;
        r.exitCode = 0;
        return r;
    }

    static ProcessResult failWith(int exitCode, const std::string& output) {
        ProcessResult r;
        r.exitCode = exitCode;
        r.output = output;
        return r;
    }

    void setHandler(Handler handler) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_handler = std::move(handler);
    }

    std::vector<ProcessRequest> requests() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_requests;
    }

    size_t callCount() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_requests.size();
    }

    // Number of runs whose argv contains the fragment somewhere
    size_t countMatching(const std::string& fragment) const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return static_cast<size_t>(std::count_if(m_requests.begin(), m_requests.end(),
            [&](const ProcessRequest& r) { return anyContains(r.argv, fragment); }));
    }

private:
    mutable std::mutex m_mutex;
    std::vector<ProcessRequest> m_requests;
    Handler m_handler;
};

/**
 * Per-URL queue of outcomes. A successful outcome with createFile set
 * writes metadata.filepath before returning. URLs without a script
 * fail with "no scripted outcome".
 */
class ScriptedDownloadService : public DownloadService {
public:
    struct Step {
        DownloadOutcome outcome;
        bool createFile = true;
    };

    void succeed(const std::string& url, const std::string& id, const std::string& title,
                 const std::string& filepath, double duration = 10.0) {
        Step step;
        step.outcome.success = true;
        step.outcome.metadata.id = id;
        step.outcome.metadata.title = title;
        step.outcome.metadata.filepath = filepath;
        step.outcome.metadata.duration = duration;
        push(url, step);
    }

    void failOnce(const std::string& url, const std::string& error) {
        Step step;
        step.outcome.success = false;
        step.outcome.error = error;
        push(url, step);
    }

    void push(const std::string& url, const Step& step) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_script[url].push_back(step);
    }

    DownloadOutcome download(const DownloadRequest& request) override {
        Step step;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_requests.push_back(request);
            auto it = m_script.find(request.url);
            if (it == m_script.end() || it->second.empty()) {
                DownloadOutcome missing;
                missing.error = "no scripted outcome for " + request.url;
                return missing;
            }
            step = it->second.front();
            // The last step repeats for any further attempts
            if (it->second.size() > 1) it->second.pop_front();
        }

        if (request.onProgress) {
            DownloadProgress p;
            p.phase = DownloadProgress::Phase::Downloading;
            p.downloadedBytes = 50;
            p.totalBytes = 100;
            request.onProgress(p);
        }

        if (step.outcome.success) {
            if (step.createFile && !step.outcome.metadata.filepath.empty()) {
                writeFile(step.outcome.metadata.filepath, "raw");
            }
            if (request.onProgress) {
                DownloadProgress done;
                done.phase = DownloadProgress::Phase::Finished;
                request.onProgress(done);
            }
        }
        return step.outcome;
    }

    size_t callCount() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_requests.size();
    }

    std::vector<DownloadRequest> requests() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_requests;
    }

private:
    mutable std::mutex m_mutex;
    std::map<std::string, std::deque<Step>> m_script;
    std::vector<DownloadRequest> m_requests;
};

// Fixed answers, overridable per path
class FakeMediaProbe : public MediaProbe {
public:
    double defaultDuration = 10.0;
    bool defaultHasAudio = true;
    std::map<std::string, double> durations;
    std::map<std::string, bool> audio;

    double probeDuration(const std::string& path) override {
        auto it = durations.find(path);
        return it != durations.end() ? it->second : defaultDuration;
    }

    bool hasAudioStream(const std::string& path) override {
        auto it = audio.find(path);
        return it != audio.end() ? it->second : defaultHasAudio;
    }
};

class RecordingLogSink : public LogSink {
public:
    void log(const std::string& line) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_lines.push_back(line);
    }

    std::vector<std::string> lines() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_lines;
    }

    bool containsText(const std::string& fragment) const {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (const auto& l : m_lines) {
            if (l.find(fragment) != std::string::npos) return true;
        }
        return false;
    }

private:
    mutable std::mutex m_mutex;
    std::vector<std::string> m_lines;
};

class RecordingProgressSink : public StageProgressSink {
public:
    struct Event {
        std::string stage;
        size_t completed;
        size_t total;
    };

    void onStageProgress(const std::string& stage, size_t completed, size_t total) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_events.push_back({stage, completed, total});
    }

    std::vector<Event> events() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_events;
    }

    std::vector<Event> eventsFor(const std::string& stage) const {
        std::lock_guard<std::mutex> lock(m_mutex);
        std::vector<Event> out;
        for (const auto& e : m_events) {
            if (e.stage == stage) out.push_back(e);
        }
        return out;
    }

private:
    mutable std::mutex m_mutex;
    std::vector<Event> m_events;
};

// Records requested backoff waits without sleeping
class RecordingSleeper {
public:
    std::function<void(int)> function() {
        return [this](int seconds) {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_waits.push_back(seconds);
        };
    }

    std::vector<int> waits() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_waits;
    }

private:
    mutable std::mutex m_mutex;
    std::vector<int> m_waits;
};

} // namespace testing
} // namespace YtMerge
