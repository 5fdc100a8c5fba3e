#include "formula/statistics_record.h"

#include <algorithm>

#include <absl/strings/match.h>

namespace chartcalc::formula {

namespace {

constexpr std::string_view kLegacyPathPrefix = "stats.";

constexpr std::string_view kRemoteFans = "remoteFans";
constexpr std::string_view kTotalFans = "totalFans";
constexpr std::string_view kAllImages = "allImages";
constexpr std::string_view kTotalUnder40 = "totalUnder40";
constexpr std::string_view kTotalOver40 = "totalOver40";

void AddJsonValue(std::map<std::string, StatValue, std::less<>>& values,
                  const std::string& name, const nlohmann::json& value) {
    if (value.is_number()) {
        values[name] = value.get<double>();
    } else if (value.is_string()) {
        values[name] = value.get<std::string>();
    }
}

}  // namespace

StatisticsRecord::StatisticsRecord(
    std::initializer_list<std::pair<const std::string, double>> values) {
    for (const auto& [name, value] : values) {
        values_[name] = value;
    }
}

absl::StatusOr<StatisticsRecord> StatisticsRecord::FromJson(const nlohmann::json& json) {
    if (!json.is_object()) {
        return absl::InvalidArgumentError("Statistics must be a JSON object");
    }

    StatisticsRecord record;
    for (const auto& [name, value] : json.items()) {
        if (name == "stats" && value.is_object()) {
            for (const auto& [inner_name, inner_value] : value.items()) {
                AddJsonValue(record.values_, inner_name, inner_value);
            }
            continue;
        }
        AddJsonValue(record.values_, name, value);
    }
    return record;
}

absl::StatusOr<StatisticsRecord> StatisticsRecord::FromJsonString(std::string_view text) {
    auto json = nlohmann::json::parse(text.begin(), text.end(), nullptr, false);
    if (json.is_discarded()) {
        return absl::InvalidArgumentError("Statistics are not valid JSON");
    }
    return FromJson(json);
}

void StatisticsRecord::Set(const std::string& name, double value) {
    values_[name] = value;
}

void StatisticsRecord::SetText(const std::string& name, std::string value) {
    values_[name] = std::move(value);
}

void StatisticsRecord::Erase(const std::string& name) {
    values_.erase(name);
}

bool StatisticsRecord::Has(std::string_view name) const {
    return values_.find(name) != values_.end();
}

const StatValue* StatisticsRecord::Find(std::string_view name) const {
    auto it = values_.find(name);
    return it == values_.end() ? nullptr : &it->second;
}

std::optional<double> StatisticsRecord::GetNumber(std::string_view name) const {
    const StatValue* value = Find(name);
    if (value == nullptr || !std::holds_alternative<double>(*value)) {
        return std::nullopt;
    }
    return std::get<double>(*value);
}

double StatisticsRecord::NumberOrZero(std::string_view name) const {
    return GetNumber(name).value_or(0.0);
}

std::optional<double> StatisticsRecord::ComputeDerived(std::string_view name) const {
    auto remote_fans = [this]() {
        if (auto stored = GetNumber(kRemoteFans)) {
            return *stored;
        }
        return NumberOrZero("indoor") + NumberOrZero("outdoor");
    };

    if (name == kRemoteFans) {
        return remote_fans();
    }
    if (name == kTotalFans) {
        return remote_fans() + NumberOrZero("stadium");
    }
    if (name == kAllImages) {
        return NumberOrZero("remoteImages") + NumberOrZero("hostessImages") +
               NumberOrZero("selfies");
    }
    if (name == kTotalUnder40) {
        return NumberOrZero("genAlpha") + NumberOrZero("genYZ");
    }
    if (name == kTotalOver40) {
        return NumberOrZero("genX") + NumberOrZero("boomer");
    }
    return std::nullopt;
}

std::optional<StatValue> StatisticsRecord::Lookup(std::string_view path) const {
    std::string_view name = path;
    if (absl::StartsWith(name, kLegacyPathPrefix)) {
        name.remove_prefix(kLegacyPathPrefix.size());
    }

    if (auto derived = ComputeDerived(name)) {
        return StatValue(*derived);
    }
    if (const StatValue* stored = Find(name)) {
        return *stored;
    }
    return std::nullopt;
}

std::vector<std::string> StatisticsRecord::Names() const {
    std::vector<std::string> names;
    names.reserve(values_.size());
    for (const auto& [name, _] : values_) {
        names.push_back(name);
    }
    return names;
}

nlohmann::json StatisticsRecord::ToJson() const {
    nlohmann::json json = nlohmann::json::object();
    for (const auto& [name, value] : values_) {
        std::visit([&json, &name](const auto& v) { json[name] = v; }, value);
    }
    return json;
}

bool StatisticsRecord::IsDerivedField(std::string_view name) {
    const auto& names = DerivedFieldNames();
    return std::find(names.begin(), names.end(), name) != names.end();
}

const std::vector<std::string>& StatisticsRecord::DerivedFieldNames() {
    static const std::vector<std::string> kNames = {
        std::string(kTotalFans), std::string(kRemoteFans), std::string(kAllImages),
        std::string(kTotalUnder40), std::string(kTotalOver40),
    };
    return kNames;
}

const std::vector<std::string>& StatisticsRecord::BaseFieldNames() {
    static const std::vector<std::string> kNames = {
        "remoteImages", "hostessImages", "selfies",
        "indoor", "outdoor", "stadium",
        "female", "male",
        "genAlpha", "genYZ", "genX", "boomer",
        "merched", "jersey", "scarf", "flags", "baseballCap", "other",
        "approvedImages", "rejectedImages",
        "eventAttendees", "eventTicketPurchases",
        "eventResultHome", "eventResultVisitor",
    };
    return kNames;
}

}  // namespace chartcalc::formula
