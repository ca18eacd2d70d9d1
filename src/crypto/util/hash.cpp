#include "crypto/util/hash.hpp"

#include <openssl/evp.h>
#include <fstream>
#include <sstream>
#include <iomanip>
#include <stdexcept>

namespace dm::crypto::hash {

Sha256::Sha256() : ctx_(EVP_MD_CTX_new()) {
    if (!ctx_) throw std::runtime_error("EVP_MD_CTX_new failed");
    if (EVP_DigestInit_ex(ctx_, EVP_sha256(), nullptr) != 1) {
        EVP_MD_CTX_free(ctx_);
        throw std::runtime_error("EVP_DigestInit_ex failed for sha256");
    }
}

Sha256::~Sha256() { EVP_MD_CTX_free(ctx_); }

void Sha256::update(const void* data, const size_t len) {
    if (finalized_) throw std::logic_error("Sha256::update called after final()");
    if (len == 0) return;
    if (EVP_DigestUpdate(ctx_, data, len) != 1) throw std::runtime_error("EVP_DigestUpdate failed");
}

std::string Sha256::final() {
    if (finalized_) throw std::logic_error("Sha256::final called twice");
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(ctx_, digest, &len) != 1) throw std::runtime_error("EVP_DigestFinal_ex failed");
    finalized_ = true;

    std::ostringstream result;
    for (unsigned int i = 0; i < len; ++i)
        result << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(digest[i]);
    return result.str();
}

std::string sha256Hex(const std::string_view data) {
    Sha256 h;
    h.update(data);
    return h.final();
}

std::string sha256File(const std::filesystem::path& filepath) {
    std::ifstream file(filepath, std::ios::binary);
    if (!file) throw std::runtime_error("Failed to open file for hashing: " + filepath.string());

    Sha256 h;
    char buffer[8192];
    while (file.good()) {
        file.read(buffer, sizeof(buffer));
        h.update(buffer, static_cast<size_t>(file.gcount()));
    }
    return h.final();
}

}
