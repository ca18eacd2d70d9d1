#pragma once

#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json_fwd.hpp>

namespace dm::types {

// One remote custom-metadata entry. Exactly one value member is expected to be set.
struct CustomMetadataEntry {
    std::string key;
    std::optional<std::string> string_value{};
    std::optional<double> numeric_value{};
    std::optional<std::vector<std::string>> string_list_value{};

    static CustomMetadataEntry string(std::string key, std::string value);
    static CustomMetadataEntry numeric(std::string key, double value);

    // Value rendered for comparison; integral numbers print without a fraction
    [[nodiscard]] std::string valueAsString() const;

    [[nodiscard]] bool operator==(const CustomMetadataEntry& other) const = default;
};

using CustomMetadata = std::vector<CustomMetadataEntry>;

const CustomMetadataEntry* findEntry(const CustomMetadata& metadata, const std::string& key);

void to_json(nlohmann::json& j, const CustomMetadataEntry& e);
void from_json(const nlohmann::json& j, CustomMetadataEntry& e);

}
