#pragma once

#include <ctime>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json_fwd.hpp>

namespace pqxx {
class row;
class result;
}

namespace dm::types {

struct FilestoreStats {
    unsigned int active{0}, pending{0}, failed{0};
    uintmax_t size_bytes{0};

    [[nodiscard]] bool operator==(const FilestoreStats& other) const = default;
};

struct Filestore {
    unsigned int id{};
    std::optional<std::string> user{};
    std::string name{}, display_name{};
    std::optional<std::time_t> create_time{}, update_time{};
    FilestoreStats stats{};
    std::string metadata{"{}"};
    std::optional<std::string> error{}, ref{};
    std::time_t created_at{}, updated_at{};

    Filestore() = default;
    explicit Filestore(const pqxx::row& row);
};

struct CategorySummary {
    std::optional<std::string> category{};
    unsigned int count{0};
    uintmax_t size{0};
};

void to_json(nlohmann::json& j, const FilestoreStats& s);
void to_json(nlohmann::json& j, const Filestore& f);
void to_json(nlohmann::json& j, const std::vector<std::shared_ptr<Filestore>>& filestores);
void to_json(nlohmann::json& j, const CategorySummary& c);

std::vector<std::shared_ptr<Filestore>> filestores_from_pq_res(const pqxx::result& res);

}
