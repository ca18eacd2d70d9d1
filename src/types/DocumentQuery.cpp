#include "types/DocumentQuery.hpp"

#include <unordered_map>

namespace dm::types {

std::optional<std::string> documentColumn(const std::string& field) {
    static const std::unordered_map<std::string, std::string> columns = {
        {"id", "id"},
        {"filestoreId", "filestore_id"},
        {"user", "user_id"},
        {"filename", "filename"},
        {"url", "url"},
        {"hash", "hash"},
        {"size", "size"},
        {"displayName", "display_name"},
        {"name", "name"},
        {"customMetadata", "custom_metadata"},
        {"createTime", "create_time"},
        {"updateTime", "update_time"},
        {"sizeBytes", "size_bytes"},
        {"mimeType", "mime_type"},
        {"state", "state"},
        {"category", "category"},
        {"tags", "tags"},
        {"startedAt", "started_at"},
        {"uploadedAt", "uploaded_at"},
        {"metadata", "metadata"},
        {"error", "error"},
        {"ref", "ref"},
        {"createdAt", "created_at"},
        {"updatedAt", "updated_at"},
    };
    const auto it = columns.find(field);
    if (it == columns.end()) return std::nullopt;
    return it->second;
}

}
