#pragma once

/// @file metrics.h
/// @brief In-process counters, gauges and histograms for engine self-monitoring

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace chartcalc {

/// @brief Monotonic counter
class Counter {
public:
    explicit Counter(std::string name, std::string description = "");

    void Increment();

    /// @brief Add @p delta; negative deltas are ignored
    void Add(int64_t delta);

    int64_t Value() const;

    void Reset();

    const std::string& Name() const { return name_; }
    const std::string& Description() const { return description_; }

private:
    std::string name_;
    std::string description_;
    std::atomic<int64_t> value_{0};
};

/// @brief Value that can move in both directions
class Gauge {
public:
    explicit Gauge(std::string name, std::string description = "");

    void Set(double value);
    void Increment(double delta = 1.0);
    void Decrement(double delta = 1.0);
    double Value() const;

    void Reset() { Set(0.0); }

    const std::string& Name() const { return name_; }
    const std::string& Description() const { return description_; }

private:
    std::string name_;
    std::string description_;
    std::atomic<double> value_{0.0};
};

/// @brief Cumulative-bucket histogram
///
/// The default buckets are sized for formula evaluation latencies, which are
/// measured in microseconds rather than the milliseconds of I/O work.
class Histogram {
public:
    explicit Histogram(std::string name, std::string description = "");
    Histogram(std::string name, std::vector<double> buckets, std::string description = "");

    void Observe(double value);

    int64_t Count() const;
    double Sum() const;

    /// @brief (upper bound, cumulative count) pairs, the last bound is +Inf
    std::vector<std::pair<double, int64_t>> Buckets() const;

    /// @brief Zero the count, the sum and every bucket
    void Reset();

    const std::string& Name() const { return name_; }
    const std::string& Description() const { return description_; }

private:
    std::string name_;
    std::string description_;
    std::vector<double> bucket_bounds_;
    std::unique_ptr<std::atomic<int64_t>[]> bucket_counts_;
    std::atomic<int64_t> count_{0};
    std::atomic<double> sum_{0.0};
};

/// @brief Observes elapsed seconds into a histogram on destruction
class ScopedTimer {
public:
    explicit ScopedTimer(Histogram& histogram);
    ~ScopedTimer();

    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

private:
    Histogram& histogram_;
    std::chrono::steady_clock::time_point start_;
};

/// @brief Process-wide metric registry
///
/// Metrics are never removed, so references returned by the getters stay
/// valid for the life of the process and may be cached by hot paths.
class MetricsRegistry {
public:
    static MetricsRegistry& Instance();

    Counter& GetCounter(const std::string& name, const std::string& description = "");
    Gauge& GetGauge(const std::string& name, const std::string& description = "");
    Histogram& GetHistogram(const std::string& name, const std::string& description = "");

    /// @brief Prometheus-style text rendering of every registered metric
    std::string ExportText() const;

    /// @brief Zero every registered metric in place (tests only)
    void Reset();

private:
    MetricsRegistry() = default;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::unique_ptr<Counter>> counters_;
    std::unordered_map<std::string, std::unique_ptr<Gauge>> gauges_;
    std::unordered_map<std::string, std::unique_ptr<Histogram>> histograms_;
};

#define CHARTCALC_COUNTER(name) \
    ::chartcalc::MetricsRegistry::Instance().GetCounter(name)

#define CHARTCALC_GAUGE(name) \
    ::chartcalc::MetricsRegistry::Instance().GetGauge(name)

#define CHARTCALC_HISTOGRAM(name) \
    ::chartcalc::MetricsRegistry::Instance().GetHistogram(name)

}  // namespace chartcalc
