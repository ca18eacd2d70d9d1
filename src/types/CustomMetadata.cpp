#include "types/CustomMetadata.hpp"

#include <cmath>
#include <nlohmann/json.hpp>
#include <fmt/format.h>
#include <fmt/ranges.h>

namespace dm::types {

CustomMetadataEntry CustomMetadataEntry::string(std::string key, std::string value) {
    CustomMetadataEntry e;
    e.key = std::move(key);
    e.string_value = std::move(value);
    return e;
}

CustomMetadataEntry CustomMetadataEntry::numeric(std::string key, const double value) {
    CustomMetadataEntry e;
    e.key = std::move(key);
    e.numeric_value = value;
    return e;
}

std::string CustomMetadataEntry::valueAsString() const {
    if (string_value) return *string_value;
    if (numeric_value) {
        const double v = *numeric_value;
        if (std::isfinite(v) && std::floor(v) == v) {
            if (std::fabs(v) < 9.2e18) return fmt::format("{}", static_cast<long long>(v));
            return fmt::format("{:.0f}", v);
        }
        return fmt::format("{}", v);
    }
    if (string_list_value) return fmt::format("{}", fmt::join(*string_list_value, ","));
    return {};
}

const CustomMetadataEntry* findEntry(const CustomMetadata& metadata, const std::string& key) {
    for (const auto& e : metadata)
        if (e.key == key) return &e;
    return nullptr;
}

void to_json(nlohmann::json& j, const CustomMetadataEntry& e) {
    j = {{"key", e.key}};
    if (e.string_value) j["stringValue"] = *e.string_value;
    if (e.numeric_value) j["numericValue"] = *e.numeric_value;
    if (e.string_list_value) j["stringListValue"] = {{"values", *e.string_list_value}};
}

void from_json(const nlohmann::json& j, CustomMetadataEntry& e) {
    e = {};
    e.key = j.at("key").get<std::string>();
    if (j.contains("stringValue")) e.string_value = j.at("stringValue").get<std::string>();
    if (j.contains("numericValue")) {
        const auto& v = j.at("numericValue");
        // the REST surface may send numbers as strings
        e.numeric_value = v.is_string() ? std::stod(v.get<std::string>()) : v.get<double>();
    }
    if (j.contains("stringListValue"))
        e.string_list_value = j.at("stringListValue").value("values", std::vector<std::string>{});
}

}
