#pragma once

/// @file metadata_source.h
/// @brief Origin of the variable registry and content assets

#include <vector>

#include <absl/status/statusor.h>

#include "metadata/types.h"

namespace chartcalc::metadata {

/// @brief Fetches complete collections; implementations must be thread-safe
class MetadataSource {
public:
    virtual ~MetadataSource() = default;

    virtual absl::StatusOr<std::vector<VariableMetadata>> FetchVariables() = 0;
    virtual absl::StatusOr<std::vector<ContentAsset>> FetchContentAssets() = 0;
};

}  // namespace chartcalc::metadata
