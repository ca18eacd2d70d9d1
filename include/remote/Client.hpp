#pragma once

#include "errors/RemoteError.hpp"
#include "remote/model/Document.hpp"
#include "remote/model/Operation.hpp"
#include "remote/model/Store.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace dm::remote {

// Contract around the remote file-search API. Failures raise remote::Error,
// with remote::NotFound for a 404.
class Client {
public:
    virtual ~Client() = default;

    virtual model::Store createStore(const std::string& displayName) = 0;
    virtual model::Store getStore(const std::string& name) = 0;
    virtual void deleteStore(const std::string& name, bool force) = 0;

    // Full listing; paging is handled internally
    virtual std::vector<model::Document> listDocuments(const std::string& storeName) = 0;
    virtual model::Document getDocument(const std::string& name) = 0;

    virtual model::Operation upload(const std::string& storeName,
                                    const std::filesystem::path& path,
                                    const model::UploadRequest& request) = 0;
    virtual model::Operation getOperation(const std::string& name) = 0;

    // false when the document was already gone
    virtual bool deleteDocument(const std::string& name) = 0;
};

}
