#include "BatchParser.h"
#include "utils/StringUtils.h"

#include <fstream>
#include <regex>

namespace YtMerge {

namespace {

const std::regex& youtubePattern() {
    static const std::regex re(
        R"((https?://)?(www\.|m\.)?(youtube\.com/(watch\?(.*&)?v=|shorts/|embed/)|youtu\.be/)([\w-]+))",
        std::regex::ECMAScript | std::regex::icase);
    return re;
}

} // namespace

std::optional<BatchLine> parseUrlLine(const std::string& line) {
    std::string t = trim(line);
    if (t.empty() || t[0] == '#') {
        return std::nullopt;
    }

    static const std::regex sep(R"([\s,]+)");
    std::vector<std::string> parts;
    for (std::sregex_token_iterator it(t.begin(), t.end(), sep, -1), end; it != end; ++it) {
        std::string part = it->str();
        if (!part.empty()) parts.push_back(part);
        if (parts.size() == 3) break;
    }
    if (parts.empty() || parts[0].compare(0, 4, "http") != 0) {
        return std::nullopt;
    }

    BatchLine result;
    result.url = parts[0];
    if (parts.size() > 1) result.startTime = parts[1];
    if (parts.size() > 2) result.endTime = parts[2];
    return result;
}

bool loadBatchFile(const std::string& path, std::vector<BatchLine>& lines, std::string& error) {
    std::ifstream in(path);
    if (!in.is_open()) {
        error = "Could not open batch file: " + path;
        return false;
    }

    std::string line;
    while (std::getline(in, line)) {
        auto parsed = parseUrlLine(line);
        if (parsed) {
            lines.push_back(*parsed);
        }
    }
    error.clear();
    return true;
}

std::shared_ptr<Entry> makeEntry(const BatchLine& line) {
    return std::make_shared<Entry>(line.url, line.startTime, line.endTime);
}

bool isYoutubeUrl(const std::string& url) {
    return std::regex_search(url, youtubePattern());
}

std::string extractVideoId(const std::string& url) {
    std::smatch m;
    if (std::regex_search(url, m, youtubePattern())) {
        return m[6].str();
    }
    return "";
}

} // namespace YtMerge
