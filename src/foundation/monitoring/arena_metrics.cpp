/// @file arena_metrics.cpp
/// @brief In-memory implementation of ArenaMetrics.

#include "arena/foundation/arena_metrics.hpp"

#include <algorithm>
#include <cmath>
#include <functional>
#include <map>
#include <mutex>
#include <sstream>

namespace arena::foundation {

HistogramBuckets HistogramBuckets::matchDuration() {
    return HistogramBuckets{{30, 60, 120, 300, 600, 1200, 1800, 3600}};
}

namespace {

/// Per-bucket (non-cumulative) observation counts. The last slot holds
/// observations above every boundary.
struct Histogram {
    std::vector<double> upperBounds;
    std::vector<uint64_t> hits;
    uint64_t count = 0;
    double sum = 0.0;

    explicit Histogram(std::vector<double> bounds) : upperBounds(std::move(bounds)) {
        std::sort(upperBounds.begin(), upperBounds.end());
        hits.assign(upperBounds.size() + 1, 0);
    }

    void observe(double value) {
        auto slot = std::lower_bound(upperBounds.begin(), upperBounds.end(), value);
        ++hits[static_cast<std::size_t>(slot - upperBounds.begin())];
        ++count;
        sum += value;
    }
};

void writeNumber(std::ostream& out, double value) {
    if (std::isnan(value)) {
        out << "NaN";
    } else if (std::isinf(value)) {
        out << (value < 0 ? "-Inf" : "+Inf");
    } else {
        out << value;
    }
}

} // namespace

struct ArenaMetrics::Impl {
    mutable std::mutex mutex;
    std::map<std::string, uint64_t, std::less<>> counters;
    std::map<std::string, double, std::less<>> gauges;
    std::map<std::string, Histogram, std::less<>> histograms;

    double& gauge(std::string_view name) {
        return gauges.try_emplace(std::string(name), 0.0).first->second;
    }
};

ArenaMetrics::ArenaMetrics() : impl_(std::make_unique<Impl>()) {}

ArenaMetrics::~ArenaMetrics() = default;

ArenaMetrics::ArenaMetrics(ArenaMetrics&&) noexcept = default;

ArenaMetrics& ArenaMetrics::operator=(ArenaMetrics&&) noexcept = default;

// -- Counters -----------------------------------------------------------------

void ArenaMetrics::incrementCounter(std::string_view name, uint64_t value) {
    std::lock_guard lock(impl_->mutex);
    impl_->counters.try_emplace(std::string(name), 0).first->second += value;
}

uint64_t ArenaMetrics::counterValue(std::string_view name) const {
    std::lock_guard lock(impl_->mutex);
    auto it = impl_->counters.find(name);
    return it == impl_->counters.end() ? 0 : it->second;
}

// -- Gauges -------------------------------------------------------------------

void ArenaMetrics::setGauge(std::string_view name, double value) {
    std::lock_guard lock(impl_->mutex);
    impl_->gauge(name) = value;
}

void ArenaMetrics::incrementGauge(std::string_view name, double delta) {
    std::lock_guard lock(impl_->mutex);
    impl_->gauge(name) += delta;
}

void ArenaMetrics::decrementGauge(std::string_view name, double delta) {
    std::lock_guard lock(impl_->mutex);
    impl_->gauge(name) -= delta;
}

double ArenaMetrics::gaugeValue(std::string_view name) const {
    std::lock_guard lock(impl_->mutex);
    auto it = impl_->gauges.find(name);
    return it == impl_->gauges.end() ? 0.0 : it->second;
}

// -- Histograms ---------------------------------------------------------------

void ArenaMetrics::registerHistogram(std::string_view name, HistogramBuckets buckets) {
    std::lock_guard lock(impl_->mutex);
    impl_->histograms.try_emplace(std::string(name), std::move(buckets.boundaries));
}

void ArenaMetrics::recordHistogram(std::string_view name, double value) {
    std::lock_guard lock(impl_->mutex);
    auto it = impl_->histograms.find(name);
    if (it != impl_->histograms.end()) {
        it->second.observe(value);
    }
}

uint64_t ArenaMetrics::histogramCount(std::string_view name) const {
    std::lock_guard lock(impl_->mutex);
    auto it = impl_->histograms.find(name);
    return it == impl_->histograms.end() ? 0 : it->second.count;
}

// -- Exposition ---------------------------------------------------------------

std::string ArenaMetrics::scrape() const {
    std::lock_guard lock(impl_->mutex);
    std::ostringstream out;

    for (const auto& [name, total] : impl_->counters) {
        out << "# TYPE " << name << " counter\n" << name << ' ' << total << '\n';
    }

    for (const auto& [name, level] : impl_->gauges) {
        out << "# TYPE " << name << " gauge\n" << name << ' ';
        writeNumber(out, level);
        out << '\n';
    }

    for (const auto& [name, histogram] : impl_->histograms) {
        out << "# TYPE " << name << " histogram\n";
        uint64_t cumulative = 0;
        for (std::size_t i = 0; i < histogram.upperBounds.size(); ++i) {
            cumulative += histogram.hits[i];
            out << name << "_bucket{le=\"";
            writeNumber(out, histogram.upperBounds[i]);
            out << "\"} " << cumulative << '\n';
        }
        out << name << "_bucket{le=\"+Inf\"} " << histogram.count << '\n';
        out << name << "_sum ";
        writeNumber(out, histogram.sum);
        out << '\n' << name << "_count " << histogram.count << '\n';
    }

    return out.str();
}

void ArenaMetrics::reset() {
    std::lock_guard lock(impl_->mutex);
    impl_->counters.clear();
    impl_->gauges.clear();
    impl_->histograms.clear();
}

ArenaMetrics& ArenaMetrics::instance() {
    static ArenaMetrics metrics;
    return metrics;
}

} // namespace arena::foundation
