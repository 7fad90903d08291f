#pragma once

/// @file arena_metrics.hpp
/// @brief In-process metric collection with Prometheus text export.
///
/// Counters, gauges and histograms kept in name-ordered maps behind PIMPL.

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace arena::foundation {

/// Names of the metrics the engine publishes.
namespace metric {
inline constexpr std::string_view kQueueJoins = "arena_queue_joins_total";
inline constexpr std::string_view kQueueCancels = "arena_queue_cancels_total";
inline constexpr std::string_view kMatchesCreated = "arena_matches_created_total";
inline constexpr std::string_view kMatchesFinished = "arena_matches_finished_total";
inline constexpr std::string_view kQueueSize = "arena_queue_size";
inline constexpr std::string_view kActiveSpectators = "arena_spectators_active";
inline constexpr std::string_view kMatchDuration = "arena_match_duration_seconds";
} // namespace metric

/// Bucket boundaries for histogram metrics ("le" upper bounds).
struct HistogramBuckets {
    /// Match length buckets in seconds: {30,60,120,300,600,1200,1800,3600}.
    static HistogramBuckets matchDuration();

    std::vector<double> boundaries;
};

/// Central metrics facade.
///
/// Thread-safe: a single mutex guards every series.
///
/// Example:
/// @code
///   auto& metrics = ArenaMetrics::instance();
///   metrics.incrementCounter(metric::kMatchesCreated);
///   metrics.setGauge(metric::kQueueSize, 12.0);
///   std::string prom = metrics.scrape();
/// @endcode
class ArenaMetrics {
public:
    ArenaMetrics();
    ~ArenaMetrics();

    ArenaMetrics(const ArenaMetrics&) = delete;
    ArenaMetrics& operator=(const ArenaMetrics&) = delete;
    ArenaMetrics(ArenaMetrics&&) noexcept;
    ArenaMetrics& operator=(ArenaMetrics&&) noexcept;

    /// Increment a counter, creating it on first use.
    void incrementCounter(std::string_view name, uint64_t value = 1);

    /// Returns 0 if the counter does not exist.
    [[nodiscard]] uint64_t counterValue(std::string_view name) const;

    void setGauge(std::string_view name, double value);
    void incrementGauge(std::string_view name, double delta = 1.0);
    void decrementGauge(std::string_view name, double delta = 1.0);

    /// Returns 0.0 if the gauge does not exist.
    [[nodiscard]] double gaugeValue(std::string_view name) const;

    /// Register a histogram. Re-registration of an existing name is ignored.
    void registerHistogram(std::string_view name, HistogramBuckets buckets);

    /// No-op if the histogram has not been registered.
    void recordHistogram(std::string_view name, double value);

    /// Number of observations recorded in a histogram.
    [[nodiscard]] uint64_t histogramCount(std::string_view name) const;

    /// Serialize all metrics in Prometheus text exposition format.
    [[nodiscard]] std::string scrape() const;

    /// Clear everything. Intended for tests.
    void reset();

    static ArenaMetrics& instance();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace arena::foundation
