#pragma once

#include <array>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <string>

#include <nlohmann/json.hpp>

namespace VS {

enum class FlushOutcome : std::size_t {
    Completed = 0,
    Failed,
    Cancelled,
    Count,
};

class FlushMetrics {
public:
    struct HistogramSnapshot {
        static constexpr std::size_t kBucketCount = 10;
        std::array<std::uint64_t, kBucketCount>   buckets{};
        std::uint64_t                             count{0};
        std::uint64_t                             sum_micros{0};
    };

    struct MetricsSnapshot {
        std::chrono::system_clock::time_point captured_at{};
        std::array<std::uint64_t, static_cast<std::size_t>(FlushOutcome::Count)> flushes{};
        std::uint64_t     skipped_flushes{0};
        std::uint64_t     rejected_writes{0};
        std::uint64_t     values_drained{0};
        std::uint64_t     bytes_flushed{0};
        HistogramSnapshot drain_latency;
    };

    void record_flush(FlushOutcome              outcome,
                      std::size_t               values,
                      std::size_t               bytes,
                      std::chrono::microseconds latency);
    void record_skipped_flush();
    void record_rejected_write();

    auto capture_snapshot() const -> MetricsSnapshot;
    auto render_prometheus() const -> std::string;
    auto render_prometheus(MetricsSnapshot const& snapshot) const -> std::string;
    auto snapshot_json() const -> nlohmann::json;
    auto snapshot_json(MetricsSnapshot const& snapshot) const -> nlohmann::json;

private:
    class Histogram {
    public:
        void observe(std::chrono::microseconds value);
        auto snapshot() const -> HistogramSnapshot;
        static auto bucket_boundaries() -> std::array<double, HistogramSnapshot::kBucketCount> const&;

    private:
        static constexpr std::array<double, HistogramSnapshot::kBucketCount> kLatencyBucketsMs{
            0.1,  0.5,   1.0,   5.0,    20.0,
            50.0, 100.0, 250.0, 1000.0, std::numeric_limits<double>::infinity()};

        std::array<std::atomic<std::uint64_t>, HistogramSnapshot::kBucketCount> buckets_{};
        std::atomic<std::uint64_t>                                               count_{0};
        std::atomic<std::uint64_t>                                               sum_micros_{0};
    };

    std::array<std::atomic<std::uint64_t>, static_cast<std::size_t>(FlushOutcome::Count)> flushes_{};
    std::atomic<std::uint64_t> skipped_flushes_{0};
    std::atomic<std::uint64_t> rejected_writes_{0};
    std::atomic<std::uint64_t> values_drained_{0};
    std::atomic<std::uint64_t> bytes_flushed_{0};
    Histogram                  drain_latency_;
};

} // namespace VS
