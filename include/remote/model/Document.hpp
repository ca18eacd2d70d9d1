#pragma once

#include "types/CustomMetadata.hpp"

#include <cstdint>
#include <ctime>
#include <optional>
#include <string>
#include <nlohmann/json_fwd.hpp>

namespace dm::remote::model {

// A document as listed by the remote file-search store
struct Document {
    std::string name{}, display_name{};
    std::optional<types::CustomMetadata> custom_metadata{};   // nullopt when the remote sent none
    std::optional<uintmax_t> size_bytes{};
    std::optional<std::string> mime_type{};
    std::string state{"STATE_UNSPECIFIED"};
    std::optional<std::time_t> create_time{}, update_time{};
};

void to_json(nlohmann::json& j, const Document& d);
void from_json(const nlohmann::json& j, Document& d);

}
