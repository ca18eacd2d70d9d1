#pragma once

#include "errors/StorageError.hpp"
#include "util/mime.hpp"

#include <cstdint>
#include <filesystem>
#include <istream>
#include <string>
#include <string_view>

namespace dm::storage {

struct StoredFile {
    std::string hash;           // hex sha256
    std::string ext;            // lowercased, "bin" when the name has none
    std::string filename;       // <hash>.<ext>
    std::string rel_path;       // <hash[0..2]>/<hash>.<ext>
    std::string url;            // /~cache/<rel_path>
    std::filesystem::path path; // absolute
    uintmax_t size{0};
    bool created{false};        // false when the bytes were already cached
};

// Content-addressed cache. Writes are idempotent and atomic per file.
class ContentStore {
public:
    static constexpr std::string_view URL_PREFIX = "/~cache/";

    explicit ContentStore(std::filesystem::path root, util::MimeResolver mime = {});

    StoredFile put(std::istream& in, const std::string& originalFilename) const;
    StoredFile put(std::string_view bytes, const std::string& originalFilename) const;

    // Maps a cache URL to its absolute path. Throws std::invalid_argument outside the cache.
    [[nodiscard]] std::filesystem::path resolve(const std::string& url) const;

    [[nodiscard]] bool exists(const std::string& url) const;
    [[nodiscard]] std::string read(const std::string& url) const;

    [[nodiscard]] const std::filesystem::path& root() const { return root_; }

private:
    std::filesystem::path root_;
    util::MimeResolver mime_;

    [[nodiscard]] std::filesystem::path tempPath() const;
    void writeInfo(const StoredFile& file, const std::string& originalFilename) const;
};

}
