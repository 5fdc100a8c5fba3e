#include "metadata/metadata_cache.h"

#include <utility>

namespace chartcalc::metadata {

MetadataCache::MetadataCache(std::shared_ptr<MetadataSource> source,
                             std::chrono::steady_clock::duration ttl,
                             VariablesCache::Clock clock)
    : source_(std::move(source)),
      variables_("variables", ttl,
                 [this]() -> absl::StatusOr<std::vector<VariableMetadata>> {
                     if (!source_) {
                         return absl::FailedPreconditionError("no metadata source");
                     }
                     return source_->FetchVariables();
                 },
                 clock),
      assets_("content-assets", ttl,
              [this]() -> absl::StatusOr<std::vector<ContentAsset>> {
                  if (!source_) {
                      return absl::FailedPreconditionError("no metadata source");
                  }
                  return source_->FetchContentAssets();
              },
              clock) {}

void MetadataCache::Refresh() {
    variables_.ForceRefresh();
    assets_.ForceRefresh();
}

void MetadataCache::InvalidateAll() {
    variables_.Invalidate();
    assets_.Invalidate();
}

}  // namespace chartcalc::metadata
