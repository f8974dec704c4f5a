#pragma once

#include "Entry.h"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace YtMerge {

struct BatchLine {
    std::string url;
    std::string startTime;
    std::string endTime;
};

/**
 * @brief Parse one line of a batch file
 *
 * Accepts "URL", "URL START" and "URL START END" separated by spaces, tabs
 * or commas. Blank lines, '#' comments and lines whose first field does not
 * start with "http" yield no entry.
 */
std::optional<BatchLine> parseUrlLine(const std::string& line);

/**
 * @brief Read every usable line of a batch file
 * @param error Set when the file cannot be opened
 */
bool loadBatchFile(const std::string& path, std::vector<BatchLine>& lines, std::string& error);

std::shared_ptr<Entry> makeEntry(const BatchLine& line);

// watch?v=, youtu.be/, shorts/ and embed/ links
bool isYoutubeUrl(const std::string& url);

// Video id of a YouTube link, empty when the URL is not recognised
std::string extractVideoId(const std::string& url);

} // namespace YtMerge
