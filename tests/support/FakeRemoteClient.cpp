#include "FakeRemoteClient.hpp"
#include "util/timestamp.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <filesystem>

using namespace dm::test;
using namespace dm::remote;

model::Store FakeRemoteClient::createStore(const std::string& displayName) {
    std::scoped_lock lock(mutex_);
    model::Store store;
    store.name = fmt::format("fileSearchStores/store-{}", nextStore_++);
    store.display_name = displayName;
    store.create_time = store.update_time = util::now();
    stores_[store.name];
    return store;
}

model::Store FakeRemoteClient::getStore(const std::string& name) {
    std::scoped_lock lock(mutex_);
    const auto it = stores_.find(name);
    if (it == stores_.end()) throw NotFound("Store " + name + " not found");
    model::Store store;
    store.name = name;
    store.active_documents_count = it->second.size();
    return store;
}

void FakeRemoteClient::deleteStore(const std::string& name, bool) {
    std::scoped_lock lock(mutex_);
    if (stores_.erase(name) == 0) throw NotFound("Store " + name + " not found");
}

std::vector<model::Document> FakeRemoteClient::listDocuments(const std::string& storeName) {
    std::scoped_lock lock(mutex_);
    if (failListing_) throw Error(503, "Service unavailable");
    const auto it = stores_.find(storeName);
    if (it == stores_.end()) throw NotFound("Store " + storeName + " not found");
    return it->second;
}

model::Document FakeRemoteClient::getDocument(const std::string& name) {
    std::scoped_lock lock(mutex_);
    for (const auto& [store, docs] : stores_)
        for (const auto& d : docs)
            if (d.name == name) return d;
    throw NotFound("Document " + name + " not found");
}

model::Operation FakeRemoteClient::upload(const std::string& storeName,
                                          const std::filesystem::path& path,
                                          const model::UploadRequest& req) {
    std::scoped_lock lock(mutex_);
    uploads_.push_back(req);

    const auto scripted = scripts_.find(req.display_name);
    const auto script = scripted == scripts_.end() ? defaultScript_ : scripted->second;

    if (script.upload_status) throw Error(*script.upload_status, "Upload rejected for " + req.display_name);
    if (!stores_.contains(storeName)) throw NotFound("Store " + storeName + " not found");

    PendingOperation op;
    op.store = storeName;
    op.request = req;
    op.size = std::filesystem::file_size(path);
    op.script = script;
    op.result.name = fmt::format("{}/operations/op-{}", storeName, nextOperation_++);

    if (!script.never_done && script.polls_until_done == 0) settle(op);

    operations_[op.result.name] = op;
    return op.result;
}

model::Operation FakeRemoteClient::getOperation(const std::string& name) {
    std::scoped_lock lock(mutex_);
    ++operationPolls_;

    const auto it = operations_.find(name);
    if (it == operations_.end()) throw NotFound("Operation " + name + " not found");

    auto& op = it->second;
    if (!op.result.done && !op.script.never_done && ++op.polls >= op.script.polls_until_done) settle(op);
    return op.result;
}

void FakeRemoteClient::settle(PendingOperation& op) {
    op.result.done = true;

    if (op.script.operation_error) {
        op.result.error = *op.script.operation_error;
        return;
    }

    model::Document doc;
    doc.name = fmt::format("{}/documents/doc-{}", op.store, nextDocument_++);
    doc.display_name = op.request.display_name;
    doc.custom_metadata = op.request.custom_metadata;
    doc.size_bytes = op.size;
    doc.mime_type = op.request.mime_type.value_or("text/plain");
    doc.state = "STATE_ACTIVE";
    doc.create_time = doc.update_time = util::now();

    stores_[op.store].push_back(doc);
    op.result.document_name = doc.name;
}

bool FakeRemoteClient::deleteDocument(const std::string& name) {
    std::scoped_lock lock(mutex_);
    deleted_.push_back(name);
    for (auto& [store, docs] : stores_)
        if (std::erase_if(docs, [&](const model::Document& d) { return d.name == name; }) > 0) return true;
    return false;
}

void FakeRemoteClient::setDefaultScript(const Script& script) {
    std::scoped_lock lock(mutex_);
    defaultScript_ = script;
}

void FakeRemoteClient::script(const std::string& displayName, const Script& script) {
    std::scoped_lock lock(mutex_);
    scripts_[displayName] = script;
}

void FakeRemoteClient::addDocument(const std::string& storeName, const model::Document& doc) {
    std::scoped_lock lock(mutex_);
    stores_[storeName].push_back(doc);
}

void FakeRemoteClient::addStore(const std::string& name) {
    std::scoped_lock lock(mutex_);
    stores_[name];
}

void FakeRemoteClient::failListing(const bool fail) {
    std::scoped_lock lock(mutex_);
    failListing_ = fail;
}

std::vector<model::UploadRequest> FakeRemoteClient::uploads() const {
    std::scoped_lock lock(mutex_);
    return uploads_;
}

std::vector<std::string> FakeRemoteClient::deletedDocuments() const {
    std::scoped_lock lock(mutex_);
    return deleted_;
}

unsigned int FakeRemoteClient::operationPolls() const {
    std::scoped_lock lock(mutex_);
    return operationPolls_;
}

std::vector<model::Document> FakeRemoteClient::documents(const std::string& storeName) const {
    std::scoped_lock lock(mutex_);
    const auto it = stores_.find(storeName);
    return it == stores_.end() ? std::vector<model::Document>{} : it->second;
}
