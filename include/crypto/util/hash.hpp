#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

typedef struct evp_md_ctx_st EVP_MD_CTX;

namespace dm::crypto::hash {

// Incremental SHA-256. final() may be called once.
class Sha256 {
public:
    Sha256();
    ~Sha256();

    Sha256(const Sha256&) = delete;
    Sha256& operator=(const Sha256&) = delete;

    void update(const void* data, size_t len);
    void update(std::string_view data) { update(data.data(), data.size()); }

    // Lowercase hex digest
    std::string final();

private:
    EVP_MD_CTX* ctx_;
    bool finalized_ = false;
};

std::string sha256Hex(std::string_view data);
std::string sha256File(const std::filesystem::path& filepath);

}
