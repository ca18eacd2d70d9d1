#include "remote/GeminiClient.hpp"
#include "log/Registry.hpp"

#include <fstream>
#include <sstream>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <nlohmann/json.hpp>
#include <fmt/format.h>

using namespace dm::remote;
using namespace dm::util;

namespace {

inline std::string slurp(const std::istream& in) {
    std::ostringstream oss;
    oss << in.rdbuf();
    return oss.str();
}

std::string errorMessage(const HttpResponse& resp) {
    if (resp.curl != CURLE_OK) return curl_easy_strerror(resp.curl);

    const auto j = nlohmann::json::parse(resp.body, nullptr, false);
    if (!j.is_discarded() && j.contains("error") && j.at("error").is_object()) {
        const auto& err = j.at("error");
        return fmt::format("{} ({})", err.value("message", "remote error"), err.value("status", std::to_string(resp.http)));
    }
    return fmt::format("HTTP {}: {}", resp.http, resp.body.substr(0, 512));
}

}

GeminiClient::GeminiClient(config::GeminiConfig cfg, std::string apiKey)
    : cfg_(std::move(cfg)), apiKey_(std::move(apiKey)) {
    if (apiKey_.empty()) throw std::runtime_error("GeminiClient requires an API key");
    ensureCurlGlobalInit();
}

HttpResponse GeminiClient::request(const std::string& method,
                                   const std::string& url,
                                   const std::string& body,
                                   const std::string& contentType,
                                   const std::vector<std::string>& extraHeaders) const {
    SList hdrs;
    hdrs.add("x-goog-api-key: " + apiKey_);
    if (!body.empty()) hdrs.add("Content-Type: " + contentType);
    for (const auto& h : extraHeaders) hdrs.add(h);

    log::Registry::cloud()->debug("[GeminiClient] {} {}", method, url);

    return performCurl([&](CURL* h) {
        curl_easy_setopt(h, CURLOPT_URL, url.c_str());
        curl_easy_setopt(h, CURLOPT_HTTPHEADER, hdrs.get());
        curl_easy_setopt(h, CURLOPT_TIMEOUT, static_cast<long>(cfg_.request_timeout_seconds));

        if (method == "GET") curl_easy_setopt(h, CURLOPT_HTTPGET, 1L);
        else if (method == "POST") {
            curl_easy_setopt(h, CURLOPT_POST, 1L);
            curl_easy_setopt(h, CURLOPT_POSTFIELDS, body.data());
            curl_easy_setopt(h, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(body.size()));
        } else curl_easy_setopt(h, CURLOPT_CUSTOMREQUEST, method.c_str());
    });
}

void GeminiClient::raiseFor(const HttpResponse& resp, const std::string& what) {
    if (resp.ok()) return;

    const auto msg = fmt::format("{} failed: {}", what, errorMessage(resp));
    if (resp.curl == CURLE_OK && resp.http == 404) throw NotFound(msg);
    log::Registry::cloud()->warn("[GeminiClient] {}", msg);
    throw Error(resp.curl == CURLE_OK ? resp.http : 0, msg);
}

model::Store GeminiClient::createStore(const std::string& displayName) {
    const nlohmann::json body = {{"displayName", displayName}};
    const auto resp = request("POST", cfg_.api_base + "/fileSearchStores", body.dump());
    raiseFor(resp, "createStore " + displayName);
    auto store = nlohmann::json::parse(resp.body).get<model::Store>();
    log::Registry::cloud()->info("[GeminiClient] Created store {} ({})", store.name, displayName);
    return store;
}

model::Store GeminiClient::getStore(const std::string& name) {
    const auto resp = request("GET", cfg_.api_base + "/" + name);
    raiseFor(resp, "getStore " + name);
    return nlohmann::json::parse(resp.body).get<model::Store>();
}

void GeminiClient::deleteStore(const std::string& name, const bool force) {
    const auto resp = request("DELETE", fmt::format("{}/{}{}", cfg_.api_base, name, force ? "?force=true" : ""));
    raiseFor(resp, "deleteStore " + name);
    log::Registry::cloud()->info("[GeminiClient] Deleted store {}", name);
}

std::vector<model::Document> GeminiClient::listDocuments(const std::string& storeName) {
    std::vector<model::Document> docs;
    std::string pageToken;
    CurlEasy escaper;

    do {
        auto url = fmt::format("{}/{}/documents?pageSize={}", cfg_.api_base, storeName, cfg_.page_size);
        if (!pageToken.empty()) url += "&pageToken=" + escaper.escape(pageToken);

        const auto resp = request("GET", url);
        raiseFor(resp, "listDocuments " + storeName);

        const auto j = nlohmann::json::parse(resp.body);
        if (j.contains("documents"))
            for (const auto& d : j.at("documents")) docs.push_back(d.get<model::Document>());
        pageToken = j.value("nextPageToken", "");
    } while (!pageToken.empty());

    log::Registry::cloud()->debug("[GeminiClient] Listed {} documents in {}", docs.size(), storeName);
    return docs;
}

model::Document GeminiClient::getDocument(const std::string& name) {
    const auto resp = request("GET", cfg_.api_base + "/" + name);
    raiseFor(resp, "getDocument " + name);
    return nlohmann::json::parse(resp.body).get<model::Document>();
}

model::Operation GeminiClient::upload(const std::string& storeName,
                                      const std::filesystem::path& path,
                                      const model::UploadRequest& req) {
    std::ifstream fin(path, std::ios::binary);
    if (!fin) throw Error(0, "Failed to open file for upload: " + path.string());
    const auto bytes = slurp(fin);

    thread_local boost::uuids::random_generator gen;
    const auto boundary = "docmirror-" + boost::uuids::to_string(gen());

    const nlohmann::json meta = req;
    std::string body;
    body.reserve(bytes.size() + 1024);
    body += "--" + boundary + "\r\n";
    body += "Content-Type: application/json; charset=UTF-8\r\n\r\n";
    body += meta.dump();
    body += "\r\n--" + boundary + "\r\n";
    body += "Content-Type: " + req.mime_type.value_or("application/octet-stream") + "\r\n\r\n";
    body += bytes;
    body += "\r\n--" + boundary + "--\r\n";

    const auto url = fmt::format("{}/{}:uploadToFileSearchStore", cfg_.upload_base, storeName);
    const auto resp = request("POST", url, body, "multipart/related; boundary=" + boundary,
                                    {"X-Goog-Upload-Protocol: multipart"});
    raiseFor(resp, "upload " + req.display_name);

    auto op = nlohmann::json::parse(resp.body).get<model::Operation>();
    log::Registry::cloud()->debug("[GeminiClient] Upload of {} started operation {}", req.display_name, op.name);
    return op;
}

model::Operation GeminiClient::getOperation(const std::string& name) {
    const auto resp = request("GET", cfg_.api_base + "/" + name);
    raiseFor(resp, "getOperation " + name);
    return nlohmann::json::parse(resp.body).get<model::Operation>();
}

bool GeminiClient::deleteDocument(const std::string& name) {
    const auto resp = request("DELETE", cfg_.api_base + "/" + name + "?force=true");
    if (resp.curl == CURLE_OK && resp.http == 404) {
        log::Registry::cloud()->debug("[GeminiClient] Document {} already deleted", name);
        return false;
    }
    raiseFor(resp, "deleteDocument " + name);
    return true;
}
