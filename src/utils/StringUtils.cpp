#include "StringUtils.h"

#include <cmath>
#include <cstdio>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace YtMerge {

namespace {

const size_t MAX_FILENAME_LENGTH = 150;

bool parseNumber(const std::string& text, double& value) {
    if (text.empty()) return false;
    try {
        size_t used = 0;
        value = std::stod(text, &used);
        return used == text.size() && std::isfinite(value) && value >= 0.0;
    } catch (const std::exception&) {
        return false;
    }
}

} // namespace

std::string trim(const std::string& text) {
    const char* ws = " \t\r\n";
    size_t start = text.find_first_not_of(ws);
    if (start == std::string::npos) return "";
    size_t end = text.find_last_not_of(ws);
    return text.substr(start, end - start + 1);
}

double timestampToSeconds(const std::string& timestamp) {
    std::string ts = trim(timestamp);
    if (ts.empty()) return 0.0;

    std::vector<std::string> parts;
    std::stringstream ss(ts);
    std::string part;
    while (std::getline(ss, part, ':')) {
        parts.push_back(trim(part));
    }
    if (ts.back() == ':') parts.push_back("");
    if (parts.empty() || parts.size() > 3) return 0.0;

    double total = 0.0;
    for (size_t i = 0; i < parts.size(); ++i) {
        double v = 0.0;
        if (!parseNumber(parts[i], v)) return 0.0;
        // Only the trailing seconds field may carry a fraction
        if (i + 1 < parts.size() && std::floor(v) != v) return 0.0;
        total = total * 60.0 + v;
    }
    return total;
}

std::string secondsToTimestamp(double seconds) {
    if (!std::isfinite(seconds) || seconds < 0.0) seconds = 0.0;
    long long totalMs = static_cast<long long>(std::llround(seconds * 1000.0));
    long long h = totalMs / 3600000;
    long long m = (totalMs / 60000) % 60;
    long long s = (totalMs / 1000) % 60;
    long long ms = totalMs % 1000;

    char buf[48];
    std::snprintf(buf, sizeof(buf), "%02lld:%02lld:%02lld.%03lld", h, m, s, ms);
    return buf;
}

std::string sanitizeFilename(const std::string& name) {
    static const std::string illegal = "<>:\"/\\|?*";
    std::string out;
    out.reserve(name.size());
    for (char c : name) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (uc < 0x20 || uc == 0x7f || illegal.find(c) != std::string::npos) {
            out += '_';
        } else {
            out += c;
        }
    }

    out = trim(out);
    if (out.empty()) return "untitled";

    if (out.size() > MAX_FILENAME_LENGTH) {
        out.resize(MAX_FILENAME_LENGTH);
        // Do not leave half of a UTF-8 sequence behind
        while (!out.empty() && (static_cast<unsigned char>(out.back()) & 0xC0) == 0x80) {
            out.pop_back();
        }
        if (!out.empty() && (static_cast<unsigned char>(out.back()) & 0x80)) {
            out.pop_back();
        }
    }
    return out.empty() ? "untitled" : out;
}

std::string truncateMessage(const std::string& message, size_t maxChars) {
    if (message.size() <= maxChars) return message;
    if (maxChars <= 3) return message.substr(0, maxChars);
    return message.substr(0, maxChars - 3) + "...";
}

std::string tailOf(const std::string& text, size_t maxChars) {
    if (text.size() <= maxChars) return text;
    return text.substr(text.size() - maxChars);
}

std::string formatDecimal(double value, int precision) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(precision) << value;
    return oss.str();
}

bool parseInt(const std::string& text, int& value) {
    try {
        size_t used = 0;
        int parsed = std::stoi(text, &used);
        if (used != text.size()) return false;
        value = parsed;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

bool parseDouble(const std::string& text, double& value) {
    try {
        size_t used = 0;
        double parsed = std::stod(text, &used);
        if (used != text.size()) return false;
        value = parsed;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

} // namespace YtMerge
