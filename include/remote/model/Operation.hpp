#pragma once

#include "types/CustomMetadata.hpp"

#include <optional>
#include <string>
#include <nlohmann/json_fwd.hpp>

namespace dm::remote::model {

// Long-running remote operation. Once done, exactly one of document_name or error is set.
struct Operation {
    std::string name{};
    bool done{false};
    std::optional<std::string> document_name{};
    std::optional<std::string> error{};
};

struct UploadRequest {
    std::string display_name{};
    std::optional<std::string> mime_type{};
    types::CustomMetadata custom_metadata{};
};

void from_json(const nlohmann::json& j, Operation& op);
void to_json(nlohmann::json& j, const UploadRequest& r);

}
