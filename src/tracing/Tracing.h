#pragma once

#include <memory>
#include <string>

namespace YtMerge {
namespace tracing {

// Open (or switch to) the trace file; empty path = <temp>/ytmerge-trace.log
void InitTracing(const std::string& outfile = "");

// Flush and close the trace file
void ShutdownTracing();

/**
 * @brief Scoped span: writes a START record now and an END record with
 * the elapsed time when ended or destroyed
 */
class Span {
public:
    explicit Span(const char* name);
    explicit Span(const std::string& name);
    ~Span();

    Span(const Span&) = delete;
    Span& operator=(const Span&) = delete;

    // Attributes are written on the END record as key=value
    void SetAttribute(const std::string& key, const std::string& value);
    void End();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace tracing
} // namespace YtMerge

#define YTMERGE_TRACE_CONCAT_INNER(a, b) a##b
#define YTMERGE_TRACE_CONCAT(a, b) YTMERGE_TRACE_CONCAT_INNER(a, b)
#define TRACE_SCOPE(name) ::YtMerge::tracing::Span YTMERGE_TRACE_CONCAT(trace_span_, __LINE__)(name)
#define TRACE_FUNC() TRACE_SCOPE(__func__)
