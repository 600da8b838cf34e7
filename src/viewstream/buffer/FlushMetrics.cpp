#include <viewstream/buffer/FlushMetrics.hpp>

#include <cmath>
#include <format>
#include <sstream>
#include <utility>

namespace VS {

using json = nlohmann::json;

namespace {

constexpr std::array<std::pair<FlushOutcome, char const*>, static_cast<std::size_t>(FlushOutcome::Count)>
    kOutcomeNames{{
        {FlushOutcome::Completed, "completed"},
        {FlushOutcome::Failed, "failed"},
        {FlushOutcome::Cancelled, "cancelled"},
    }};

auto average_ms(FlushMetrics::HistogramSnapshot const& histogram) -> double {
    if (histogram.count == 0) {
        return 0.0;
    }
    return static_cast<double>(histogram.sum_micros) / 1000.0 / static_cast<double>(histogram.count);
}

// ISO-8601 UTC with milliseconds, e.g. 2024-05-01T12:00:00.250Z
auto utc_timestamp(std::chrono::system_clock::time_point tp) -> std::string {
    return std::format("{:%FT%T}Z", std::chrono::floor<std::chrono::milliseconds>(tp));
}

} // namespace

void FlushMetrics::Histogram::observe(std::chrono::microseconds value) {
    auto const micros = static_cast<std::uint64_t>(value.count() < 0 ? 0 : value.count());
    sum_micros_.fetch_add(micros, std::memory_order_relaxed);
    count_.fetch_add(1, std::memory_order_relaxed);
    double const millis = static_cast<double>(micros) / 1000.0;
    for (std::size_t i = 0; i < kLatencyBucketsMs.size(); ++i) {
        if (millis <= kLatencyBucketsMs[i]) {
            buckets_[i].fetch_add(1, std::memory_order_relaxed);
            return;
        }
    }
    buckets_.back().fetch_add(1, std::memory_order_relaxed);
}

auto FlushMetrics::Histogram::snapshot() const -> HistogramSnapshot {
    HistogramSnapshot snapshot{};
    for (std::size_t i = 0; i < kLatencyBucketsMs.size(); ++i) {
        snapshot.buckets[i] = buckets_[i].load(std::memory_order_relaxed);
    }
    snapshot.count      = count_.load(std::memory_order_relaxed);
    snapshot.sum_micros = sum_micros_.load(std::memory_order_relaxed);
    return snapshot;
}

auto FlushMetrics::Histogram::bucket_boundaries()
    -> std::array<double, HistogramSnapshot::kBucketCount> const& {
    return kLatencyBucketsMs;
}

void FlushMetrics::record_flush(FlushOutcome              outcome,
                                std::size_t               values,
                                std::size_t               bytes,
                                std::chrono::microseconds latency) {
    auto const index = static_cast<std::size_t>(outcome);
    if (index >= flushes_.size()) {
        return;
    }
    flushes_[index].fetch_add(1, std::memory_order_relaxed);
    values_drained_.fetch_add(values, std::memory_order_relaxed);
    bytes_flushed_.fetch_add(bytes, std::memory_order_relaxed);
    drain_latency_.observe(latency);
}

void FlushMetrics::record_skipped_flush() {
    skipped_flushes_.fetch_add(1, std::memory_order_relaxed);
}

void FlushMetrics::record_rejected_write() {
    rejected_writes_.fetch_add(1, std::memory_order_relaxed);
}

auto FlushMetrics::capture_snapshot() const -> MetricsSnapshot {
    MetricsSnapshot snapshot;
    snapshot.captured_at = std::chrono::system_clock::now();
    for (std::size_t i = 0; i < flushes_.size(); ++i) {
        snapshot.flushes[i] = flushes_[i].load(std::memory_order_relaxed);
    }
    snapshot.skipped_flushes = skipped_flushes_.load(std::memory_order_relaxed);
    snapshot.rejected_writes = rejected_writes_.load(std::memory_order_relaxed);
    snapshot.values_drained  = values_drained_.load(std::memory_order_relaxed);
    snapshot.bytes_flushed   = bytes_flushed_.load(std::memory_order_relaxed);
    snapshot.drain_latency   = drain_latency_.snapshot();
    return snapshot;
}

auto FlushMetrics::render_prometheus() const -> std::string {
    auto snapshot = capture_snapshot();
    return render_prometheus(snapshot);
}

auto FlushMetrics::render_prometheus(MetricsSnapshot const& snapshot) const -> std::string {
    std::ostringstream out;

    out << "# HELP viewstream_flushes_total Buffer flushes by outcome\n";
    out << "# TYPE viewstream_flushes_total counter\n";
    for (std::size_t i = 0; i < snapshot.flushes.size(); ++i) {
        out << "viewstream_flushes_total{outcome=\"" << kOutcomeNames[i].second << "\"} "
            << snapshot.flushes[i] << "\n";
    }

    out << "# HELP viewstream_flushes_skipped_total Flushes that had no terminal sink\n";
    out << "# TYPE viewstream_flushes_skipped_total counter\n";
    out << "viewstream_flushes_skipped_total " << snapshot.skipped_flushes << "\n";

    out << "# HELP viewstream_rejected_writes_total Writes rejected while a flush was in flight\n";
    out << "# TYPE viewstream_rejected_writes_total counter\n";
    out << "viewstream_rejected_writes_total " << snapshot.rejected_writes << "\n";

    out << "# HELP viewstream_values_drained_total Buffered values written to sinks\n";
    out << "# TYPE viewstream_values_drained_total counter\n";
    out << "viewstream_values_drained_total " << snapshot.values_drained << "\n";

    out << "# HELP viewstream_bytes_flushed_total Bytes written to sinks by flushes\n";
    out << "# TYPE viewstream_bytes_flushed_total counter\n";
    out << "viewstream_bytes_flushed_total " << snapshot.bytes_flushed << "\n";

    out << "# HELP viewstream_drain_duration_seconds Drain and flush latency\n";
    out << "# TYPE viewstream_drain_duration_seconds histogram\n";
    auto const&   buckets    = Histogram::bucket_boundaries();
    std::uint64_t cumulative = 0;
    for (std::size_t b = 0; b < buckets.size(); ++b) {
        cumulative += snapshot.drain_latency.buckets[b];
        auto boundary = buckets[b];
        out << "viewstream_drain_duration_seconds_bucket{le=\""
            << (std::isinf(boundary) ? std::string{"+Inf"} : std::to_string(boundary / 1000.0))
            << "\"} " << cumulative << "\n";
    }
    out << "viewstream_drain_duration_seconds_sum "
        << (snapshot.drain_latency.sum_micros / 1'000'000.0) << "\n";
    out << "viewstream_drain_duration_seconds_count " << snapshot.drain_latency.count << "\n";

    return out.str();
}

auto FlushMetrics::snapshot_json() const -> json {
    auto snapshot = capture_snapshot();
    return snapshot_json(snapshot);
}

auto FlushMetrics::snapshot_json(MetricsSnapshot const& snapshot) const -> json {
    json payload;
    payload["captured_at"] = utc_timestamp(snapshot.captured_at);

    json flushes;
    for (std::size_t i = 0; i < snapshot.flushes.size(); ++i) {
        flushes[kOutcomeNames[i].second] = snapshot.flushes[i];
    }
    flushes["skipped"] = snapshot.skipped_flushes;
    payload["flushes"] = std::move(flushes);

    payload["rejected_writes"] = snapshot.rejected_writes;
    payload["values_drained"]  = snapshot.values_drained;
    payload["bytes_flushed"]   = snapshot.bytes_flushed;
    payload["drain_latency"]   = json{{"count", snapshot.drain_latency.count},
                                      {"avg_ms", average_ms(snapshot.drain_latency)}};
    return payload;
}

} // namespace VS
