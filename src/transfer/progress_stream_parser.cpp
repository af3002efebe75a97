#include "transfer/progress_stream_parser.hpp"

#include "io/line_reader.hpp"
#include "util/logger.hpp"
#include "util/path_utils.hpp"

#include <charconv>
#include <cmath>
#include <cstring>
#include <utility>

namespace adbpipe {

ProgressStreamParser::ProgressStreamParser(ProgressFn on_progress, std::size_t max_diagnostic_lines)
    : on_progress_(std::move(on_progress)), max_diagnostic_lines_(max_diagnostic_lines) {}

bool ProgressStreamParser::ParsePercent(std::string_view trimmed, double& out_percent) {
    if (trimmed.empty())
        return false;

    double value = 0.0;
    const char* first = trimmed.data();
    const char* last = trimmed.data() + trimmed.size();
    const auto [ptr, ec] = std::from_chars(first, last, value, std::chars_format::fixed);
    if (ec != std::errc() || ptr != last)
        return false;
    if (!std::isfinite(value) || value < 0.0 || value > 100.0)
        return false;

    out_percent = value;
    return true;
}

ProgressStreamParser::LineKind ProgressStreamParser::Feed(std::string_view raw_line) {
    const std::string_view line = TrimWhitespace(raw_line);
    if (line.empty())
        return LineKind::Empty;

    double percent = 0.0;
    if (ParsePercent(line, percent)) {
        ++samples_;
        if (on_progress_)
            on_progress_(percent / 100.0);
        return LineKind::Progress;
    }

    LogDebug("CMD STDERR: %.*s", static_cast<int>(line.size()), line.data());
    if (diagnostics_.size() < max_diagnostic_lines_) {
        diagnostics_.emplace_back(line);
    } else {
        ++dropped_;
    }
    return LineKind::Diagnostic;
}

ProgressStreamParser::StreamEnd ProgressStreamParser::Consume(LineReader& reader,
                                                              const std::atomic_bool& cancel,
                                                              int poll_interval_ms) {
    std::string line;
    while (true) {
        if (cancel.load(std::memory_order_relaxed))
            return StreamEnd::Cancelled;

        switch (reader.Next(line, poll_interval_ms)) {
            case LineReader::Status::Line:
                Feed(line);
                break;
            case LineReader::Status::Timeout:
                break;
            case LineReader::Status::Eof:
                return StreamEnd::Exhausted;
            case LineReader::Status::Error:
                LogError("Reading pipeline output failed: %s", std::strerror(reader.LastError()));
                return StreamEnd::ReadError;
        }
    }
}

std::string ProgressStreamParser::DiagnosticText() const {
    std::string out;
    for (const auto& d : diagnostics_) {
        if (!out.empty())
            out.push_back('\n');
        out += d;
    }
    if (dropped_ > 0) {
        if (!out.empty())
            out.push_back('\n');
        out += "... (" + std::to_string(dropped_) + " more lines)";
    }
    return out;
}

} // namespace adbpipe
