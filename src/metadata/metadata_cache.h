#pragma once

/// @file metadata_cache.h
/// @brief The variable registry and content asset caches as one service

#include <chrono>
#include <memory>

#include "metadata/metadata_source.h"
#include "metadata/ttl_cache.h"
#include "metadata/types.h"

namespace chartcalc::metadata {

/// @brief Two independent TTL caches fed by one MetadataSource
class MetadataCache {
public:
    using VariablesCache = TtlCache<VariableMetadata>;
    using AssetsCache = TtlCache<ContentAsset>;

    MetadataCache(std::shared_ptr<MetadataSource> source,
                  std::chrono::steady_clock::duration ttl = VariablesCache::kDefaultTtl,
                  VariablesCache::Clock clock = [] { return std::chrono::steady_clock::now(); });

    MetadataCache(const MetadataCache&) = delete;
    MetadataCache& operator=(const MetadataCache&) = delete;

    VariablesCache& Variables() { return variables_; }
    AssetsCache& Assets() { return assets_; }

    /// @brief Cached registry, refreshed when expired
    VariablesCache::Data GetVariables() { return variables_.Get(); }

    /// @brief Cached assets, refreshed when expired
    AssetsCache::Data GetContentAssets() { return assets_.Get(); }

    /// @brief Refresh both caches now, ignoring their age
    void Refresh();

    void InvalidateAll();

private:
    std::shared_ptr<MetadataSource> source_;
    VariablesCache variables_;
    AssetsCache assets_;
};

}  // namespace chartcalc::metadata
