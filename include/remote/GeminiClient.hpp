#pragma once

#include "config/Config.hpp"
#include "remote/Client.hpp"
#include "util/curlWrappers.hpp"

#include <string>

namespace dm::remote {

// Gemini File Search over REST (v1beta)
class GeminiClient final : public Client {
public:
    GeminiClient(config::GeminiConfig cfg, std::string apiKey);

    model::Store createStore(const std::string& displayName) override;
    model::Store getStore(const std::string& name) override;
    void deleteStore(const std::string& name, bool force) override;

    std::vector<model::Document> listDocuments(const std::string& storeName) override;
    model::Document getDocument(const std::string& name) override;

    model::Operation upload(const std::string& storeName,
                            const std::filesystem::path& path,
                            const model::UploadRequest& req) override;
    model::Operation getOperation(const std::string& name) override;

    bool deleteDocument(const std::string& name) override;

private:
    config::GeminiConfig cfg_;
    std::string apiKey_;

    [[nodiscard]] util::HttpResponse request(const std::string& method,
                                             const std::string& url,
                                             const std::string& body = {},
                                             const std::string& contentType = "application/json",
                                             const std::vector<std::string>& extraHeaders = {}) const;

    // Throws remote::Error / remote::NotFound for non-2xx responses
    static void raiseFor(const util::HttpResponse& resp, const std::string& what);
};

}
