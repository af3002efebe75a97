#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace adbpipe {

struct Throughput {
    double bytes_per_sec = 0.0;
    // Total size unknown (0 bytes), so no rate can be derived.
    bool indeterminate = false;

    std::string ToString() const;
};

// "512 B/s", "3.4 KB/s", "12.0 MB/s".
std::string FormatSpeed(double bytes_per_sec);

// Turns cumulative completion fractions into an instantaneous rate. Not
// thread-safe; owned by whichever context receives progress.
class RateEstimator {
  public:
    using Clock = std::chrono::steady_clock;

    explicit RateEstimator(std::chrono::milliseconds sampling_interval = std::chrono::milliseconds(500));

    void Reset(std::uint64_t total_bytes);

    // nullopt means "keep showing the previous value": first sample, sample
    // too close to the baseline, or a sample below the baseline.
    std::optional<Throughput> Update(double fraction, Clock::time_point now);

    bool HasBaseline() const { return has_baseline_; }
    double LastFraction() const { return last_fraction_; }
    Clock::time_point LastTimestamp() const { return last_timestamp_; }
    std::uint64_t TotalBytes() const { return total_bytes_; }

  private:
    std::chrono::milliseconds sampling_interval_;
    std::uint64_t total_bytes_ = 0;
    double last_fraction_ = 0.0;
    Clock::time_point last_timestamp_{};
    bool has_baseline_ = false;
};

} // namespace adbpipe
