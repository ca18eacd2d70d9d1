#include "util/mime.hpp"
#include "config/Config.hpp"

#include <algorithm>
#include <boost/algorithm/string.hpp>

namespace dm::util {

namespace {

const std::unordered_map<std::string, std::string>& defaultTable() {
    static const std::unordered_map<std::string, std::string> mimeMap = {
        {"pdf", "application/pdf"},
        {"txt", "text/plain"},
        {"md", "text/markdown"},
        {"markdown", "text/markdown"},
        {"html", "text/html"},
        {"htm", "text/html"},
        {"csv", "text/csv"},
        {"tsv", "text/tab-separated-values"},
        {"xml", "application/xml"},
        {"json", "application/json"},
        {"yaml", "application/x-yaml"},
        {"yml", "application/x-yaml"},
        {"rtf", "application/rtf"},
        {"doc", "application/msword"},
        {"docx", "application/vnd.openxmlformats-officedocument.wordprocessingml.document"},
        {"xls", "application/vnd.ms-excel"},
        {"xlsx", "application/vnd.openxmlformats-officedocument.spreadsheetml.sheet"},
        {"ppt", "application/vnd.ms-powerpoint"},
        {"pptx", "application/vnd.openxmlformats-officedocument.presentationml.presentation"},
        {"odt", "application/vnd.oasis.opendocument.text"},
        {"zip", "application/zip"},
        {"js", "text/javascript"},
        {"ts", "text/x-typescript"},
        {"py", "text/x-python"},
        {"java", "text/x-java"},
        {"c", "text/x-c"},
        {"h", "text/x-c"},
        {"cpp", "text/x-c++"},
        {"hpp", "text/x-c++"},
        {"css", "text/css"},
        {"sql", "application/sql"},
        {"png", "image/png"},
        {"jpg", "image/jpeg"},
        {"jpeg", "image/jpeg"},
        {"gif", "image/gif"},
        {"webp", "image/webp"},
    };
    return mimeMap;
}

}

std::string extensionOf(const std::filesystem::path& path) {
    std::string ext = path.extension().string();
    if (!ext.empty() && ext.front() == '.') ext.erase(0, 1);
    boost::algorithm::to_lower(ext);
    return ext;
}

std::unordered_map<std::string, std::string> parseMimeOverrides(const std::string& text) {
    std::unordered_map<std::string, std::string> out;
    std::vector<std::string> entries;
    boost::algorithm::split(entries, text, boost::algorithm::is_any_of(","));

    for (auto& entry : entries) {
        boost::algorithm::trim(entry);
        const auto colon = entry.find(':');
        if (colon == std::string::npos || colon == 0 || colon + 1 == entry.size()) continue;

        auto ext = boost::algorithm::to_lower_copy(boost::algorithm::trim_copy(entry.substr(0, colon)));
        if (!ext.empty() && ext.front() == '.') ext.erase(0, 1);
        auto type = boost::algorithm::trim_copy(entry.substr(colon + 1));
        if (ext.empty() || type.empty()) continue;
        out[ext] = type;
    }
    return out;
}

MimeResolver::MimeResolver() : MimeResolver(config::DEFAULT_UPLOAD_MIME_TYPES, {"json"}) {}

MimeResolver::MimeResolver(const std::string& overrides, const std::vector<std::string>& omitExtensions)
    : overrides_(parseMimeOverrides(overrides)) {
    for (const auto& ext : omitExtensions) omit_.insert(boost::algorithm::to_lower_copy(ext));
}

std::string MimeResolver::inferred(const std::string& ext) const {
    const auto lower = boost::algorithm::to_lower_copy(ext);
    if (const auto it = overrides_.find(lower); it != overrides_.end()) return it->second;
    const auto& table = defaultTable();
    const auto it = table.find(lower);
    return it != table.end() ? it->second : "application/octet-stream";
}

std::optional<std::string> MimeResolver::forUpload(const std::string& ext) const {
    const auto lower = boost::algorithm::to_lower_copy(ext);
    if (const auto it = overrides_.find(lower); it != overrides_.end()) return it->second;
    if (omit_.contains(lower)) return std::nullopt;
    const auto& table = defaultTable();
    if (const auto it = table.find(lower); it != table.end()) return it->second;
    return std::nullopt;
}

}
