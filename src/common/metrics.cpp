#include "metrics.h"

#include <algorithm>
#include <iterator>
#include <limits>
#include <map>
#include <sstream>

namespace chartcalc {

namespace {

// Seconds; 1 us .. 100 ms
const std::vector<double> kDefaultBuckets = {
    0.000001, 0.000005, 0.00001, 0.00005, 0.0001, 0.0005, 0.001, 0.01, 0.1
};

void AtomicAdd(std::atomic<double>& target, double delta) {
    double current = target.load(std::memory_order_relaxed);
    while (!target.compare_exchange_weak(current, current + delta,
                                          std::memory_order_relaxed)) {
    }
}

}  // namespace

Counter::Counter(std::string name, std::string description)
    : name_(std::move(name)), description_(std::move(description)) {}

void Counter::Increment() {
    value_.fetch_add(1, std::memory_order_relaxed);
}

void Counter::Add(int64_t delta) {
    if (delta >= 0) {
        value_.fetch_add(delta, std::memory_order_relaxed);
    }
}

int64_t Counter::Value() const {
    return value_.load(std::memory_order_relaxed);
}

void Counter::Reset() {
    value_.store(0, std::memory_order_relaxed);
}

Gauge::Gauge(std::string name, std::string description)
    : name_(std::move(name)), description_(std::move(description)) {}

void Gauge::Set(double value) {
    value_.store(value, std::memory_order_relaxed);
}

void Gauge::Increment(double delta) {
    AtomicAdd(value_, delta);
}

void Gauge::Decrement(double delta) {
    AtomicAdd(value_, -delta);
}

double Gauge::Value() const {
    return value_.load(std::memory_order_relaxed);
}

Histogram::Histogram(std::string name, std::string description)
    : Histogram(std::move(name), kDefaultBuckets, std::move(description)) {}

Histogram::Histogram(std::string name, std::vector<double> buckets, std::string description)
    : name_(std::move(name)),
      description_(std::move(description)),
      bucket_bounds_(std::move(buckets)) {
    std::sort(bucket_bounds_.begin(), bucket_bounds_.end());
    // One extra slot for the +Inf bucket
    bucket_counts_ = std::make_unique<std::atomic<int64_t>[]>(bucket_bounds_.size() + 1);
    for (size_t i = 0; i <= bucket_bounds_.size(); ++i) {
        bucket_counts_[i].store(0, std::memory_order_relaxed);
    }
}

void Histogram::Observe(double value) {
    count_.fetch_add(1, std::memory_order_relaxed);
    AtomicAdd(sum_, value);

    auto it = std::lower_bound(bucket_bounds_.begin(), bucket_bounds_.end(), value);
    const auto index = static_cast<size_t>(std::distance(bucket_bounds_.begin(), it));
    bucket_counts_[index].fetch_add(1, std::memory_order_relaxed);
}

int64_t Histogram::Count() const {
    return count_.load(std::memory_order_relaxed);
}

double Histogram::Sum() const {
    return sum_.load(std::memory_order_relaxed);
}

std::vector<std::pair<double, int64_t>> Histogram::Buckets() const {
    std::vector<std::pair<double, int64_t>> result;
    result.reserve(bucket_bounds_.size() + 1);

    int64_t cumulative = 0;
    for (size_t i = 0; i < bucket_bounds_.size(); ++i) {
        cumulative += bucket_counts_[i].load(std::memory_order_relaxed);
        result.emplace_back(bucket_bounds_[i], cumulative);
    }
    cumulative += bucket_counts_[bucket_bounds_.size()].load(std::memory_order_relaxed);
    result.emplace_back(std::numeric_limits<double>::infinity(), cumulative);
    return result;
}

void Histogram::Reset() {
    count_.store(0, std::memory_order_relaxed);
    sum_.store(0.0, std::memory_order_relaxed);
    for (size_t i = 0; i <= bucket_bounds_.size(); ++i) {
        bucket_counts_[i].store(0, std::memory_order_relaxed);
    }
}

ScopedTimer::ScopedTimer(Histogram& histogram)
    : histogram_(histogram), start_(std::chrono::steady_clock::now()) {}

ScopedTimer::~ScopedTimer() {
    std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - start_;
    histogram_.Observe(elapsed.count());
}

MetricsRegistry& MetricsRegistry::Instance() {
    static MetricsRegistry instance;
    return instance;
}

Counter& MetricsRegistry::GetCounter(const std::string& name, const std::string& description) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& slot = counters_[name];
    if (!slot) {
        slot = std::make_unique<Counter>(name, description);
    }
    return *slot;
}

Gauge& MetricsRegistry::GetGauge(const std::string& name, const std::string& description) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& slot = gauges_[name];
    if (!slot) {
        slot = std::make_unique<Gauge>(name, description);
    }
    return *slot;
}

Histogram& MetricsRegistry::GetHistogram(const std::string& name, const std::string& description) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& slot = histograms_[name];
    if (!slot) {
        slot = std::make_unique<Histogram>(name, description);
    }
    return *slot;
}

std::string MetricsRegistry::ExportText() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::ostringstream oss;

    // Sorted for stable output
    std::map<std::string, const Counter*> counters;
    for (const auto& [name, counter] : counters_) {
        counters.emplace(name, counter.get());
    }
    for (const auto& [name, counter] : counters) {
        oss << "# HELP " << name << " " << counter->Description() << "\n";
        oss << "# TYPE " << name << " counter\n";
        oss << name << " " << counter->Value() << "\n";
    }

    std::map<std::string, const Gauge*> gauges;
    for (const auto& [name, gauge] : gauges_) {
        gauges.emplace(name, gauge.get());
    }
    for (const auto& [name, gauge] : gauges) {
        oss << "# HELP " << name << " " << gauge->Description() << "\n";
        oss << "# TYPE " << name << " gauge\n";
        oss << name << " " << gauge->Value() << "\n";
    }

    std::map<std::string, const Histogram*> histograms;
    for (const auto& [name, histogram] : histograms_) {
        histograms.emplace(name, histogram.get());
    }
    for (const auto& [name, histogram] : histograms) {
        oss << "# HELP " << name << " " << histogram->Description() << "\n";
        oss << "# TYPE " << name << " histogram\n";
        for (const auto& [bound, count] : histogram->Buckets()) {
            oss << name << "_bucket{le=\"" << bound << "\"} " << count << "\n";
        }
        oss << name << "_sum " << histogram->Sum() << "\n";
        oss << name << "_count " << histogram->Count() << "\n";
    }

    return oss.str();
}

void MetricsRegistry::Reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& [_, counter] : counters_) {
        counter->Reset();
    }
    for (auto& [_, gauge] : gauges_) {
        gauge->Reset();
    }
    for (auto& [_, histogram] : histograms_) {
        histogram->Reset();
    }
}

}  // namespace chartcalc
