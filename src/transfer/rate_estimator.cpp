#include "transfer/rate_estimator.hpp"

#include <cstdio>

namespace adbpipe {

std::string FormatSpeed(double bytes_per_sec) {
    constexpr double kKiB = 1024.0;
    constexpr double kMiB = 1024.0 * 1024.0;

    char buf[64];
    if (bytes_per_sec < kKiB) {
        std::snprintf(buf, sizeof(buf), "%.0f B/s", bytes_per_sec);
    } else if (bytes_per_sec < kMiB) {
        std::snprintf(buf, sizeof(buf), "%.1f KB/s", bytes_per_sec / kKiB);
    } else {
        std::snprintf(buf, sizeof(buf), "%.1f MB/s", bytes_per_sec / kMiB);
    }
    return buf;
}

std::string Throughput::ToString() const {
    if (indeterminate)
        return "--";
    return FormatSpeed(bytes_per_sec);
}

RateEstimator::RateEstimator(std::chrono::milliseconds sampling_interval)
    : sampling_interval_(sampling_interval) {}

void RateEstimator::Reset(std::uint64_t total_bytes) {
    total_bytes_ = total_bytes;
    last_fraction_ = 0.0;
    last_timestamp_ = Clock::time_point{};
    has_baseline_ = false;
}

std::optional<Throughput> RateEstimator::Update(double fraction, Clock::time_point now) {
    if (!has_baseline_) {
        last_fraction_ = fraction;
        last_timestamp_ = now;
        has_baseline_ = true;
        return std::nullopt;
    }

    const auto elapsed = now - last_timestamp_;
    if (elapsed < sampling_interval_)
        return std::nullopt;

    // Also rejects NaN.
    if (!(fraction >= last_fraction_))
        return std::nullopt;

    const double elapsed_sec = std::chrono::duration<double>(elapsed).count();
    const double delta = fraction - last_fraction_;
    last_fraction_ = fraction;
    last_timestamp_ = now;

    if (total_bytes_ == 0)
        return Throughput{.bytes_per_sec = 0.0, .indeterminate = true};

    return Throughput{.bytes_per_sec = delta * static_cast<double>(total_bytes_) / elapsed_sec};
}

} // namespace adbpipe
