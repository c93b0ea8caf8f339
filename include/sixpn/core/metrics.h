#pragma once

#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace sixpn {

// Sorted so exposition order is stable.
using MetricLabels = std::map<std::string, std::string>;

std::string FormatLabels(const MetricLabels& labels);

class Counter {
public:
    // Thread-safe
    void Inc(std::int64_t v = 1) { value_.fetch_add(v, std::memory_order_relaxed); }
    std::int64_t Value() const { return value_.load(std::memory_order_relaxed); }

private:
    std::atomic<std::int64_t> value_{0};
};

class Histogram {
public:
    struct Snapshot {
        std::vector<double> bounds;
        std::vector<std::uint64_t> counts; // per bucket, not cumulative
        double sum = 0.0;
        std::uint64_t count = 0;
    };

    // Thread-safe
    explicit Histogram(std::vector<double> bounds);

    void Observe(double v);
    Snapshot Take() const;

private:
    std::vector<double> bounds_;
    mutable std::mutex mu_;
    std::vector<std::uint64_t> counts_;
    double sum_{0.0};
    std::uint64_t count_{0};
};

class MetricsRegistry {
public:
    // Thread-safe. Returned references stay valid for the registry lifetime.
    Counter& GetCounter(std::string_view name, std::string_view help, const MetricLabels& labels = {});
    Histogram& GetHistogram(std::string_view name, std::string_view help, std::vector<double> bounds,
                            const MetricLabels& labels = {});

    // Thread-safe
    std::string ToPrometheusText() const;

private:
    enum class Kind { counter, histogram };

    struct Family {
        Kind kind = Kind::counter;
        std::string help;
        std::map<MetricLabels, std::unique_ptr<Counter>> counters;
        std::map<MetricLabels, std::unique_ptr<Histogram>> histograms;
    };

    Family& FamilyLocked(std::string_view name, std::string_view help, Kind kind);

    mutable std::mutex mu_;
    std::map<std::string, Family, std::less<>> families_;
};

// Process-wide registry (Thread-safe)
MetricsRegistry& DefaultMetrics();

} // namespace sixpn
