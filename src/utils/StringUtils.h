#pragma once

#include <string>

namespace YtMerge {

/**
 * @brief Parse "SS", "MM:SS" or "HH:MM:SS" (fractional seconds allowed)
 * @return Seconds, or 0.0 for empty or malformed input
 */
double timestampToSeconds(const std::string& timestamp);

// Render seconds as HH:MM:SS.mmm
std::string secondsToTimestamp(double seconds);

/**
 * @brief Make a string safe to use as a file name
 *
 * Replaces <>:"/\|?* and control characters with '_', trims surrounding
 * whitespace, and caps the result at 150 characters.
 * Returns "untitled" when nothing is left.
 */
std::string sanitizeFilename(const std::string& name);

// Keep at most maxChars characters, marking the cut with "..."
std::string truncateMessage(const std::string& message, size_t maxChars);

// Last maxChars characters of text
std::string tailOf(const std::string& text, size_t maxChars);

std::string trim(const std::string& text);

// Fixed notation; ffmpeg rejects scientific notation in filter arguments
std::string formatDecimal(double value, int precision = 3);

// Whole-string numeric parses; false on trailing text, overflow or empty input
bool parseInt(const std::string& text, int& value);
bool parseDouble(const std::string& text, double& value);

} // namespace YtMerge
