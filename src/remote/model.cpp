#include "remote/model/Document.hpp"
#include "remote/model/Operation.hpp"
#include "remote/model/Store.hpp"
#include "util/timestamp.hpp"

#include <nlohmann/json.hpp>

using namespace dm::util;

namespace dm::remote::model {

namespace {

// int64 fields arrive as JSON strings
std::optional<uint64_t> optU64(const nlohmann::json& j, const char* key) {
    if (!j.contains(key) || j.at(key).is_null()) return std::nullopt;
    const auto& v = j.at(key);
    if (v.is_string()) return std::stoull(v.get<std::string>());
    return v.get<uint64_t>();
}

std::optional<std::time_t> optTime(const nlohmann::json& j, const char* key) {
    if (!j.contains(key) || !j.at(key).is_string()) return std::nullopt;
    return parseTimestampFromString(j.at(key).get<std::string>());
}

nlohmann::json timeOrNull(const std::optional<std::time_t>& t) {
    if (!t) return nullptr;
    return timestampToString(*t);
}

}

void to_json(nlohmann::json& j, const Document& d) {
    j = {
        {"name", d.name},
        {"displayName", d.display_name},
        {"customMetadata", d.custom_metadata ? nlohmann::json(*d.custom_metadata) : nlohmann::json(nullptr)},
        {"sizeBytes", d.size_bytes ? nlohmann::json(*d.size_bytes) : nlohmann::json(nullptr)},
        {"mimeType", d.mime_type ? nlohmann::json(*d.mime_type) : nlohmann::json(nullptr)},
        {"state", d.state},
        {"createTime", timeOrNull(d.create_time)},
        {"updateTime", timeOrNull(d.update_time)}
    };
}

void from_json(const nlohmann::json& j, Document& d) {
    d = {};
    d.name = j.value("name", "");
    d.display_name = j.value("displayName", "");
    if (j.contains("customMetadata") && j.at("customMetadata").is_array())
        d.custom_metadata = j.at("customMetadata").get<types::CustomMetadata>();
    d.size_bytes = optU64(j, "sizeBytes");
    if (j.contains("mimeType") && j.at("mimeType").is_string()) d.mime_type = j.at("mimeType").get<std::string>();
    d.state = j.value("state", "STATE_UNSPECIFIED");
    d.create_time = optTime(j, "createTime");
    d.update_time = optTime(j, "updateTime");
}

void to_json(nlohmann::json& j, const Store& s) {
    j = {
        {"name", s.name},
        {"displayName", s.display_name},
        {"createTime", timeOrNull(s.create_time)},
        {"updateTime", timeOrNull(s.update_time)},
        {"activeDocumentsCount", s.active_documents_count},
        {"pendingDocumentsCount", s.pending_documents_count},
        {"failedDocumentsCount", s.failed_documents_count},
        {"sizeBytes", s.size_bytes}
    };
}

void from_json(const nlohmann::json& j, Store& s) {
    s = {};
    s.name = j.at("name").get<std::string>();
    s.display_name = j.value("displayName", "");
    s.create_time = optTime(j, "createTime");
    s.update_time = optTime(j, "updateTime");
    s.active_documents_count = optU64(j, "activeDocumentsCount").value_or(0);
    s.pending_documents_count = optU64(j, "pendingDocumentsCount").value_or(0);
    s.failed_documents_count = optU64(j, "failedDocumentsCount").value_or(0);
    s.size_bytes = optU64(j, "sizeBytes").value_or(0);
}

void from_json(const nlohmann::json& j, Operation& op) {
    op = {};
    op.name = j.value("name", "");
    op.done = j.value("done", false);

    if (j.contains("error") && j.at("error").is_object()) {
        const auto& err = j.at("error");
        op.error = err.value("message", "Remote operation failed");
        if (err.contains("code")) op.error = *op.error + " (code " + err.at("code").dump() + ")";
    }

    if (j.contains("response") && j.at("response").is_object()) {
        const auto& resp = j.at("response");
        if (resp.contains("documentName")) op.document_name = resp.at("documentName").get<std::string>();
        else if (resp.contains("name") && resp.at("name").is_string()) op.document_name = resp.at("name").get<std::string>();
    }
}

void to_json(nlohmann::json& j, const UploadRequest& r) {
    j = {{"displayName", r.display_name}};
    if (r.mime_type) j["mimeType"] = *r.mime_type;
    if (!r.custom_metadata.empty()) j["customMetadata"] = r.custom_metadata;
}

}
