#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace dm::util {

// Lowercased extension without the dot, empty when there is none
std::string extensionOf(const std::filesystem::path& path);

// Parses "ext:mime/type,ext:mime/type". Malformed entries are skipped.
std::unordered_map<std::string, std::string> parseMimeOverrides(const std::string& text);

class MimeResolver {
public:
    MimeResolver();
    MimeResolver(const std::string& overrides, const std::vector<std::string>& omitExtensions);

    // Type recorded on the local document. Falls back to application/octet-stream.
    [[nodiscard]] std::string inferred(const std::string& ext) const;

    // Type sent with the upload. nullopt lets the remote infer it.
    [[nodiscard]] std::optional<std::string> forUpload(const std::string& ext) const;

    [[nodiscard]] const std::unordered_map<std::string, std::string>& overrides() const { return overrides_; }

private:
    std::unordered_map<std::string, std::string> overrides_;
    std::unordered_set<std::string> omit_;
};

}
