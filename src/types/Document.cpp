#include "types/Document.hpp"
#include "util/timestamp.hpp"

#include <pqxx/row>
#include <pqxx/result>
#include <nlohmann/json.hpp>

using namespace dm::types;
using namespace dm::util;

namespace {

std::optional<std::time_t> optTimestamp(const pqxx::row& row, const char* col) {
    if (row.at(col).is_null()) return std::nullopt;
    return parsePostgresTimestamp(row.at(col).as<std::string>());
}

nlohmann::json optTimestampJson(const std::optional<std::time_t>& ts) {
    if (!ts) return nullptr;
    return timestampToString(*ts);
}

}

Document::Document(const pqxx::row& row)
    : id(row.at("id").as<unsigned int>()),
      filestore_id(row.at("filestore_id").as<unsigned int>()),
      user(row.at("user_id").as<std::optional<std::string>>()),
      filename(row.at("filename").as<std::string>()),
      url(row.at("url").as<std::string>()),
      hash(row.at("hash").as<std::string>()),
      display_name(row.at("display_name").as<std::string>()),
      size(row.at("size").as<uintmax_t>()),
      name(row.at("name").as<std::optional<std::string>>()),
      create_time(optTimestamp(row, "create_time")),
      update_time(optTimestamp(row, "update_time")),
      size_bytes(row.at("size_bytes").as<std::optional<uintmax_t>>()),
      mime_type(row.at("mime_type").as<std::optional<std::string>>()),
      category(row.at("category").as<std::optional<std::string>>()),
      tags(row.at("tags").as<std::string>()),
      metadata(row.at("metadata").as<std::string>()),
      started_at(optTimestamp(row, "started_at")),
      uploaded_at(optTimestamp(row, "uploaded_at")),
      error(row.at("error").as<std::optional<std::string>>()),
      ref(row.at("ref").as<std::optional<std::string>>()),
      created_at(parsePostgresTimestamp(row.at("created_at").as<std::string>())),
      updated_at(parsePostgresTimestamp(row.at("updated_at").as<std::string>())) {
    if (const auto cm = row.at("custom_metadata").as<std::optional<std::string>>())
        custom_metadata = nlohmann::json::parse(*cm).get<CustomMetadata>();
    state = DocumentState::fromString(row.at("state").as<std::string>(), markerLifecycle());
}

Lifecycle Document::markerLifecycle() const {
    if (hasError()) return Lifecycle::Failed;
    if (uploaded_at) return Lifecycle::Active;
    return Lifecycle::Pending;
}

std::string Document::sampleLabel() const {
    if (category && !category->empty()) return *category + "/" + display_name;
    return display_name;
}

void dm::types::to_json(nlohmann::json& j, const Document& d) {
    j = {
        {"id", d.id},
        {"filestoreId", d.filestore_id},
        {"user", d.user ? nlohmann::json(*d.user) : nlohmann::json(nullptr)},
        {"filename", d.filename},
        {"url", d.url},
        {"hash", d.hash},
        {"size", d.size},
        {"displayName", d.display_name},
        {"name", d.name ? nlohmann::json(*d.name) : nlohmann::json(nullptr)},
        {"customMetadata", d.custom_metadata ? nlohmann::json(*d.custom_metadata) : nlohmann::json(nullptr)},
        {"createTime", optTimestampJson(d.create_time)},
        {"updateTime", optTimestampJson(d.update_time)},
        {"sizeBytes", d.size_bytes ? nlohmann::json(*d.size_bytes) : nlohmann::json(nullptr)},
        {"mimeType", d.mime_type ? nlohmann::json(*d.mime_type) : nlohmann::json(nullptr)},
        {"state", to_string(d.state)},
        {"category", d.category ? nlohmann::json(*d.category) : nlohmann::json(nullptr)},
        {"tags", nlohmann::json::parse(d.tags, nullptr, false)},
        {"startedAt", optTimestampJson(d.started_at)},
        {"uploadedAt", optTimestampJson(d.uploaded_at)},
        {"metadata", nlohmann::json::parse(d.metadata, nullptr, false)},
        {"error", d.error ? nlohmann::json(*d.error) : nlohmann::json(nullptr)},
        {"ref", d.ref ? nlohmann::json(*d.ref) : nlohmann::json(nullptr)},
        {"createdAt", timestampToString(d.created_at)},
        {"updatedAt", timestampToString(d.updated_at)}
    };
}

void dm::types::to_json(nlohmann::json& j, const std::vector<std::shared_ptr<Document>>& docs) {
    j = nlohmann::json::array();
    for (const auto& doc : docs) j.push_back(*doc);
}

std::vector<std::shared_ptr<Document>> dm::types::documents_from_pq_res(const pqxx::result& res) {
    std::vector<std::shared_ptr<Document>> docs;
    docs.reserve(res.size());
    for (const auto& row : res) docs.push_back(std::make_shared<Document>(row));
    return docs;
}
