#pragma once

#include <algorithm>
#include <optional>
#include <string>
#include <vector>

namespace dm::types {

constexpr unsigned int DEFAULT_TAKE = 50;
constexpr unsigned int MAX_TAKE = 1000;

struct DocumentQuery {
    std::optional<unsigned int> filestore_id{};
    std::optional<std::string> category{};          // "" selects uncategorized documents
    std::optional<std::string> hash{}, display_name{}, user{}, q{};
    std::vector<unsigned int> ids{};
    std::vector<std::string> display_names{};
    std::vector<std::string> null_columns{}, not_null_columns{};   // API field names
    std::string sort{"-id"};                        // column, -column, failed, uploading or issues
    unsigned int take{DEFAULT_TAKE}, skip{0};

    [[nodiscard]] unsigned int limit() const { return take == 0 ? DEFAULT_TAKE : std::min(take, MAX_TAKE); }
};

struct FilestoreQuery {
    std::optional<std::string> user{}, q{};
    unsigned int take{DEFAULT_TAKE}, skip{0};

    [[nodiscard]] unsigned int limit() const { return take == 0 ? DEFAULT_TAKE : std::min(take, MAX_TAKE); }
};

// Maps an API field name (camelCase) to its document column, nullopt when unknown
std::optional<std::string> documentColumn(const std::string& field);

}
