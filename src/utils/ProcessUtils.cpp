#include "ProcessUtils.h"

#include <cerrno>
#include <chrono>
#include <cstdio>
#include <cstring>
#include <ctime>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace YtMerge {

namespace {

void closeFd(int& fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

// Splits raw pipe data into lines for the caller's callback
class LineSplitter {
public:
    explicit LineSplitter(const std::function<void(const std::string&)>& onLine)
        : m_onLine(onLine) {}

    void feed(const char* data, size_t len) {
        if (!m_onLine) return;
        for (size_t i = 0; i < len; ++i) {
            char c = data[i];
            if (c == '\n' || c == '\r') {
                flush();
            } else {
                m_partial += c;
            }
        }
    }

    void flush() {
        if (!m_partial.empty()) {
            m_onLine(m_partial);
            m_partial.clear();
        }
    }

private:
    const std::function<void(const std::string&)>& m_onLine;
    std::string m_partial;
};

int decodeWaitStatus(int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

} // namespace

ProcessResult SystemProcessRunner::run(const ProcessRequest& request) {
    ProcessResult result;
    if (request.argv.empty()) {
        result.launchFailed = true;
        result.output = "No command given";
        return result;
    }

    int outPipe[2] = {-1, -1};
    int errPipe[2] = {-1, -1};
    // Close-on-exec from creation: runners on other threads fork concurrently
    if (pipe2(outPipe, O_CLOEXEC) != 0) {
        result.launchFailed = true;
        result.output = std::string("pipe2() failed: ") + std::strerror(errno);
        return result;
    }
    if (pipe2(errPipe, O_CLOEXEC) != 0) {
        result.launchFailed = true;
        result.output = std::string("pipe2() failed: ") + std::strerror(errno);
        closeFd(outPipe[0]);
        closeFd(outPipe[1]);
        return result;
    }

    std::vector<char*> args;
    args.reserve(request.argv.size() + 1);
    for (const auto& a : request.argv) {
        args.push_back(const_cast<char*>(a.c_str()));
    }
    args.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0) {
        result.launchFailed = true;
        result.output = std::string("fork() failed: ") + std::strerror(errno);
        closeFd(outPipe[0]);
        closeFd(outPipe[1]);
        closeFd(errPipe[0]);
        closeFd(errPipe[1]);
        return result;
    }

    if (pid == 0) {
        // Own process group so a timeout also takes down helpers the tool spawned
        setpgid(0, 0);
        int devNull = open("/dev/null", O_RDONLY);
        if (devNull >= 0) {
            dup2(devNull, STDIN_FILENO);
            close(devNull);
        }
        dup2(outPipe[1], STDOUT_FILENO);
        dup2(outPipe[1], STDERR_FILENO);
        close(outPipe[1]);

        execvp(args[0], args.data());

        int err = errno;
        ssize_t ignored = write(errPipe[1], &err, sizeof(err));
        (void)ignored;
        _exit(127);
    }

    closeFd(outPipe[1]);
    closeFd(errPipe[1]);

    int execErr = 0;
    ssize_t n;
    do {
        n = read(errPipe[0], &execErr, sizeof(execErr));
    } while (n < 0 && errno == EINTR);
    closeFd(errPipe[0]);

    if (n == static_cast<ssize_t>(sizeof(execErr))) {
        int status = 0;
        while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
        closeFd(outPipe[0]);
        result.launchFailed = true;
        result.output = "Could not start " + request.argv[0] + ": " + std::strerror(execErr);
        return result;
    }

    LineSplitter splitter(request.onLine);
    const auto startTime = std::chrono::steady_clock::now();
    const bool hasTimeout = request.timeoutSeconds > 0;
    const auto deadline = startTime + std::chrono::seconds(request.timeoutSeconds);

    char buffer[4096];
    while (outPipe[0] >= 0) {
        struct pollfd pfd;
        pfd.fd = outPipe[0];
        pfd.events = POLLIN;
        pfd.revents = 0;

        int rc = poll(&pfd, 1, 100);
        if (rc < 0 && errno != EINTR) {
            break;
        }

        if (rc > 0) {
            ssize_t got = read(outPipe[0], buffer, sizeof(buffer));
            if (got > 0) {
                result.output.append(buffer, static_cast<size_t>(got));
                if (result.output.size() > 2 * MAX_CAPTURED_OUTPUT) {
                    result.output.erase(0, result.output.size() - MAX_CAPTURED_OUTPUT);
                }
                splitter.feed(buffer, static_cast<size_t>(got));
            } else if (got == 0 || (errno != EINTR && errno != EAGAIN)) {
                closeFd(outPipe[0]);
            }
        }

        if (hasTimeout && !result.timedOut && std::chrono::steady_clock::now() >= deadline) {
            result.timedOut = true;
            kill(-pid, SIGKILL);
            kill(pid, SIGKILL);
        }
    }
    closeFd(outPipe[0]);
    splitter.flush();

    // The tool may close its output before exiting; keep honouring the deadline
    int status = 0;
    pid_t waited = 0;
    while (true) {
        waited = waitpid(pid, &status, WNOHANG);
        if (waited == pid) break;
        if (waited < 0 && errno != EINTR) break;
        if (hasTimeout && !result.timedOut && std::chrono::steady_clock::now() >= deadline) {
            result.timedOut = true;
            kill(-pid, SIGKILL);
            kill(pid, SIGKILL);
        }
        usleep(20000);
    }
    result.exitCode = waited == pid ? decodeWaitStatus(status) : -1;

    if (result.output.size() > MAX_CAPTURED_OUTPUT) {
        result.output.erase(0, result.output.size() - MAX_CAPTURED_OUTPUT);
    }
    return result;
}

std::string formatCommandLine(const std::vector<std::string>& argv) {
    std::string out;
    for (size_t i = 0; i < argv.size(); ++i) {
        if (i > 0) out += ' ';
        const std::string& a = argv[i];
        bool plain = !a.empty() && a.find_first_of(" \t\"'\\;&|<>()$`*?[]{}") == std::string::npos;
        if (plain) {
            out += a;
        } else {
            out += '"';
            for (char c : a) {
                if (c == '"' || c == '\\' || c == '$' || c == '`') out += '\\';
                out += c;
            }
            out += '"';
        }
    }
    return out;
}

void appendProcessLog(const std::string& logFile,
                      const std::string& label,
                      const std::vector<std::string>& argv,
                      const ProcessResult& result,
                      const std::string& extra) {
    FILE* log = fopen(logFile.c_str(), "a");
    if (!log) {
        return;
    }

    auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm_buf;
    localtime_r(&now, &tm_buf);
    char timeBuf[64] = {0};
    std::strftime(timeBuf, sizeof(timeBuf), "%c", &tm_buf);

    fprintf(log, "\n[%s] %s\n", timeBuf, label.c_str());
    fprintf(log, "cmd: %s\n", formatCommandLine(argv).c_str());
    fprintf(log, "exit: %d%s%s\n", result.exitCode,
            result.timedOut ? " (timed out)" : "",
            result.launchFailed ? " (launch failed)" : "");
    if (!extra.empty()) {
        fprintf(log, "extra: %s\n", extra.c_str());
    }

    // Only the tail of very long output is kept
    const size_t maxTail = 4000;
    if (result.output.size() <= maxTail) {
        fprintf(log, "output:\n%s\n", result.output.c_str());
    } else {
        fprintf(log, "output (last %zu chars):\n%s\n", maxTail,
                result.output.substr(result.output.size() - maxTail).c_str());
    }

    fclose(log);
}

} // namespace YtMerge
