#pragma once

#include <atomic>
#include <cstddef>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace adbpipe {

class LineReader;

// Splits a diagnostic stream into percentage samples (bare numbers in
// [0, 100], as printed by `pv -n`) and free-form text.
class ProgressStreamParser {
  public:
    using ProgressFn = std::function<void(double fraction)>;

    enum class LineKind {
        Empty,
        Progress,
        Diagnostic,
    };

    enum class StreamEnd {
        Exhausted,
        Cancelled,
        ReadError,
    };

    static constexpr std::size_t kUnlimited = static_cast<std::size_t>(-1);

    explicit ProgressStreamParser(ProgressFn on_progress, std::size_t max_diagnostic_lines = kUnlimited);

    LineKind Feed(std::string_view raw_line);

    // Reads until EOF. cancel is checked every poll_interval_ms while idle.
    StreamEnd Consume(LineReader& reader, const std::atomic_bool& cancel, int poll_interval_ms = 100);

    static bool ParsePercent(std::string_view trimmed, double& out_percent);

    const std::vector<std::string>& Diagnostics() const { return diagnostics_; }
    std::size_t DroppedDiagnostics() const { return dropped_; }
    std::size_t ProgressSamples() const { return samples_; }

    // Newline-joined diagnostics, with a marker when lines were dropped.
    std::string DiagnosticText() const;

  private:
    ProgressFn on_progress_;
    std::size_t max_diagnostic_lines_;
    std::vector<std::string> diagnostics_;
    std::size_t dropped_ = 0;
    std::size_t samples_ = 0;
};

} // namespace adbpipe
