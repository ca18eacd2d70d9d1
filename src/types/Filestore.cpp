#include "types/Filestore.hpp"
#include "util/timestamp.hpp"

#include <pqxx/row>
#include <pqxx/result>
#include <nlohmann/json.hpp>

using namespace dm::types;
using namespace dm::util;

Filestore::Filestore(const pqxx::row& row)
    : id(row.at("id").as<unsigned int>()),
      user(row.at("user_id").as<std::optional<std::string>>()),
      name(row.at("name").as<std::string>()),
      display_name(row.at("display_name").as<std::string>()),
      metadata(row.at("metadata").as<std::string>()),
      error(row.at("error").as<std::optional<std::string>>()),
      ref(row.at("ref").as<std::optional<std::string>>()),
      created_at(parsePostgresTimestamp(row.at("created_at").as<std::string>())),
      updated_at(parsePostgresTimestamp(row.at("updated_at").as<std::string>())) {
    if (!row.at("create_time").is_null()) create_time = parsePostgresTimestamp(row.at("create_time").as<std::string>());
    if (!row.at("update_time").is_null()) update_time = parsePostgresTimestamp(row.at("update_time").as<std::string>());
    stats.active = row.at("active_documents_count").as<unsigned int>();
    stats.pending = row.at("pending_documents_count").as<unsigned int>();
    stats.failed = row.at("failed_documents_count").as<unsigned int>();
    stats.size_bytes = row.at("size_bytes").as<uintmax_t>();
}

void dm::types::to_json(nlohmann::json& j, const FilestoreStats& s) {
    j = {
        {"activeDocumentsCount", s.active},
        {"pendingDocumentsCount", s.pending},
        {"failedDocumentsCount", s.failed},
        {"sizeBytes", s.size_bytes}
    };
}

void dm::types::to_json(nlohmann::json& j, const Filestore& f) {
    j = {
        {"id", f.id},
        {"user", f.user ? nlohmann::json(*f.user) : nlohmann::json(nullptr)},
        {"name", f.name},
        {"displayName", f.display_name},
        {"createTime", f.create_time ? nlohmann::json(timestampToString(*f.create_time)) : nlohmann::json(nullptr)},
        {"updateTime", f.update_time ? nlohmann::json(timestampToString(*f.update_time)) : nlohmann::json(nullptr)},
        {"metadata", nlohmann::json::parse(f.metadata, nullptr, false)},
        {"error", f.error ? nlohmann::json(*f.error) : nlohmann::json(nullptr)},
        {"ref", f.ref ? nlohmann::json(*f.ref) : nlohmann::json(nullptr)},
        {"createdAt", timestampToString(f.created_at)},
        {"updatedAt", timestampToString(f.updated_at)}
    };
    j.update(nlohmann::json(f.stats));
}

void dm::types::to_json(nlohmann::json& j, const std::vector<std::shared_ptr<Filestore>>& filestores) {
    j = nlohmann::json::array();
    for (const auto& f : filestores) j.push_back(*f);
}

void dm::types::to_json(nlohmann::json& j, const CategorySummary& c) {
    j = {
        {"category", c.category ? nlohmann::json(*c.category) : nlohmann::json(nullptr)},
        {"count", c.count},
        {"size", c.size}
    };
}

std::vector<std::shared_ptr<Filestore>> dm::types::filestores_from_pq_res(const pqxx::result& res) {
    std::vector<std::shared_ptr<Filestore>> out;
    out.reserve(res.size());
    for (const auto& row : res) out.push_back(std::make_shared<Filestore>(row));
    return out;
}
