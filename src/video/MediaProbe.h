#pragma once

#include <string>

namespace YtMerge {

/**
 * @brief Structured queries about a media file
 *
 * Failures are not errors: an unreadable file reports duration 0.0 and no
 * audio, and callers fall back accordingly.
 */
class MediaProbe {
public:
    virtual ~MediaProbe() = default;

    // Container duration in seconds, 0.0 if unknown
    virtual double probeDuration(const std::string& path) = 0;

    // true if the file has at least one audio stream
    virtual bool hasAudioStream(const std::string& path) = 0;
};

// In-process probe backed by libavformat
class LibavMediaProbe : public MediaProbe {
public:
    double probeDuration(const std::string& path) override;
    bool hasAudioStream(const std::string& path) override;
};

} // namespace YtMerge
