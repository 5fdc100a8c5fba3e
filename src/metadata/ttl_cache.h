#pragma once

/// @file ttl_cache.h
/// @brief Lazily refreshed, time-bounded snapshot cache

#include <chrono>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include <absl/status/statusor.h>

#include "common/logging.h"
#include "common/metrics.h"

namespace chartcalc::metadata {

/// @brief Holds one immutable snapshot of a remote collection
///
/// Get() serves the snapshot while it is younger than the TTL and otherwise
/// replaces it wholesale with a fresh fetch. A failed fetch yields an empty
/// collection and leaves the previous snapshot in place for GetCached().
///
/// Readers load the snapshot pointer atomically and never wait on a refresh.
/// Refreshes are serialised so that concurrent expiry triggers one fetch.
template <typename T>
class TtlCache {
public:
    using Clock = std::function<std::chrono::steady_clock::time_point()>;
    using Fetcher = std::function<absl::StatusOr<std::vector<T>>()>;
    using Data = std::shared_ptr<const std::vector<T>>;

    static constexpr std::chrono::seconds kDefaultTtl{300};

    TtlCache(std::string name, std::chrono::steady_clock::duration ttl, Fetcher fetcher,
             Clock clock = [] { return std::chrono::steady_clock::now(); })
        : name_(std::move(name)),
          ttl_(ttl),
          fetcher_(std::move(fetcher)),
          clock_(std::move(clock)),
          hits_(CHARTCALC_COUNTER("metadata_cache_hits_total")),
          refreshes_(CHARTCALC_COUNTER("metadata_cache_refreshes_total")),
          refresh_failures_(CHARTCALC_COUNTER("metadata_cache_refresh_failures_total")),
          entries_(CHARTCALC_GAUGE(EntriesGaugeName(name_))) {}

    TtlCache(const TtlCache&) = delete;
    TtlCache& operator=(const TtlCache&) = delete;

    /// @brief Live data, refreshing first if the snapshot is missing or expired
    Data Get() {
        if (auto snapshot = LiveSnapshot()) {
            hits_.Increment();
            return snapshot->data;
        }

        std::lock_guard<std::mutex> lock(refresh_mutex_);
        // Another caller may have refreshed while we waited
        if (auto snapshot = LiveSnapshot()) {
            hits_.Increment();
            return snapshot->data;
        }
        return Refresh();
    }

    /// @brief Fetch now regardless of age; the old snapshot survives a failure
    Data ForceRefresh() {
        std::lock_guard<std::mutex> lock(refresh_mutex_);
        return Refresh();
    }

    /// @brief Get() on a separate thread
    std::future<Data> GetAsync() {
        return std::async(std::launch::async, [this] { return Get(); });
    }

    /// @brief Whatever is currently held, possibly empty or expired
    Data GetCached() const {
        auto snapshot = std::atomic_load(&snapshot_);
        return snapshot ? snapshot->data : Empty();
    }

    /// @brief Drop the snapshot so the next Get() refetches
    void Invalidate() {
        std::atomic_store(&snapshot_, std::shared_ptr<const Snapshot>());
    }

    /// @brief True while a snapshot exists and is younger than the TTL
    bool IsFresh() const { return LiveSnapshot() != nullptr; }

    const std::string& Name() const { return name_; }
    std::chrono::steady_clock::duration Ttl() const { return ttl_; }

private:
    struct Snapshot {
        Data data;
        std::chrono::steady_clock::time_point fetched_at;
    };

    /// "content-assets" -> "metadata_content_assets_entries"
    static std::string EntriesGaugeName(const std::string& name) {
        std::string gauge = "metadata_";
        for (char c : name) {
            gauge.push_back(c == '-' ? '_' : c);
        }
        return gauge + "_entries";
    }

    static Data Empty() {
        static const Data kEmpty = std::make_shared<const std::vector<T>>();
        return kEmpty;
    }

    std::shared_ptr<const Snapshot> LiveSnapshot() const {
        auto snapshot = std::atomic_load(&snapshot_);
        if (snapshot && clock_() - snapshot->fetched_at < ttl_) {
            return snapshot;
        }
        return nullptr;
    }

    Data Refresh() {
        absl::StatusOr<std::vector<T>> fetched = FetchGuarded();
        if (!fetched.ok()) {
            refresh_failures_.Increment();
            CHARTCALC_LOG_WARN("Refreshing {} cache failed: {}", name_, fetched.status().message());
            return Empty();
        }

        auto snapshot = std::make_shared<Snapshot>();
        snapshot->data = std::make_shared<const std::vector<T>>(*std::move(fetched));
        snapshot->fetched_at = clock_();
        std::atomic_store(&snapshot_, std::shared_ptr<const Snapshot>(std::move(snapshot)));

        refreshes_.Increment();
        auto data = GetCached();
        entries_.Set(static_cast<double>(data->size()));
        CHARTCALC_LOG_INFO("Refreshed {} cache: {} entries", name_, data->size());
        return data;
    }

    absl::StatusOr<std::vector<T>> FetchGuarded() {
        if (!fetcher_) {
            return absl::FailedPreconditionError("no fetcher configured");
        }
        try {
            return fetcher_();
        } catch (const std::exception& e) {
            return absl::InternalError(e.what());
        }
    }

    std::string name_;
    std::chrono::steady_clock::duration ttl_;
    Fetcher fetcher_;
    Clock clock_;
    Counter& hits_;
    Counter& refreshes_;
    Counter& refresh_failures_;
    Gauge& entries_;
    std::mutex refresh_mutex_;
    std::shared_ptr<const Snapshot> snapshot_;
};

}  // namespace chartcalc::metadata
