#pragma once

#include <cstdint>
#include <ctime>
#include <optional>
#include <string>
#include <nlohmann/json_fwd.hpp>

namespace dm::remote::model {

struct Store {
    std::string name{}, display_name{};
    std::optional<std::time_t> create_time{}, update_time{};
    uint64_t active_documents_count{0}, pending_documents_count{0}, failed_documents_count{0}, size_bytes{0};
};

void to_json(nlohmann::json& j, const Store& s);
void from_json(const nlohmann::json& j, Store& s);

}
