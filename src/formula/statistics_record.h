#pragma once

/// @file statistics_record.h
/// @brief Flat event statistics that formulas are evaluated against

#include <initializer_list>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include <absl/status/statusor.h>
#include <nlohmann/json.hpp>

namespace chartcalc::formula {

/// @brief A stored metric: numeric count or free text (e.g. an image URL)
using StatValue = std::variant<double, std::string>;

/// @brief Metric name -> value table with on-demand derived fields
///
/// Derived fields are computed from the current base values on every lookup
/// and are never stored:
///   remoteFans   = remoteFans if stored, otherwise indoor + outdoor
///   totalFans    = remoteFans + stadium
///   allImages    = remoteImages + hostessImages + selfies
///   totalUnder40 = genAlpha + genYZ
///   totalOver40  = genX + boomer
/// Absent or non-numeric addends count as 0.
class StatisticsRecord {
public:
    StatisticsRecord() = default;
    StatisticsRecord(std::initializer_list<std::pair<const std::string, double>> values);

    /// @brief Build from a JSON object
    ///
    /// Numbers and strings are kept; null, booleans, arrays and objects are
    /// skipped. A nested "stats" object is flattened into the record.
    static absl::StatusOr<StatisticsRecord> FromJson(const nlohmann::json& json);

    /// @brief Parse JSON text and build a record from it
    static absl::StatusOr<StatisticsRecord> FromJsonString(std::string_view text);

    void Set(const std::string& name, double value);
    void SetText(const std::string& name, std::string value);
    void Erase(const std::string& name);

    /// @brief True if @p name is stored (derived fields are not stored)
    bool Has(std::string_view name) const;

    /// @brief Stored value, nullptr if absent
    const StatValue* Find(std::string_view name) const;

    /// @brief Stored numeric value, nullopt if absent or text
    std::optional<double> GetNumber(std::string_view name) const;

    /// @brief Resolve a field reference, derived names first
    ///
    /// Accepts legacy "stats.name" paths. Returns nullopt when the field is
    /// neither derived nor stored.
    std::optional<StatValue> Lookup(std::string_view path) const;

    size_t Size() const { return values_.size(); }
    bool Empty() const { return values_.empty(); }

    /// @brief Stored names in lexical order
    std::vector<std::string> Names() const;

    nlohmann::json ToJson() const;

    static bool IsDerivedField(std::string_view name);

    /// @brief totalFans, remoteFans, allImages, totalUnder40, totalOver40
    static const std::vector<std::string>& DerivedFieldNames();

    /// @brief The base metrics every event record is expected to carry
    static const std::vector<std::string>& BaseFieldNames();

private:
    double NumberOrZero(std::string_view name) const;
    std::optional<double> ComputeDerived(std::string_view name) const;

    std::map<std::string, StatValue, std::less<>> values_;
};

}  // namespace chartcalc::formula
