#include "services/FilestoreService.hpp"
#include "errors/errors.hpp"
#include "log/Registry.hpp"

#include <fmt/format.h>

using namespace dm::services;
using namespace dm::types;

namespace {

dm::db::FilestorePtr require(const std::shared_ptr<dm::db::DocumentRepository>& repo, const unsigned int id) {
    auto filestore = repo->getFilestore(id);
    if (!filestore) throw dm::errors::NotFound(fmt::format("Filestore {} does not exist", id));
    return filestore;
}

}

FilestoreService::FilestoreService(std::shared_ptr<db::DocumentRepository> repo,
                                   std::shared_ptr<remote::Client> remote,
                                   std::shared_ptr<stats::Aggregator> aggregator)
    : repo_(std::move(repo)), remote_(std::move(remote)), aggregator_(std::move(aggregator)) {}

dm::db::FilestorePtr FilestoreService::create(const std::string& displayName, const std::optional<std::string>& user) {
    if (displayName.empty()) throw std::invalid_argument("Filestore display name must not be empty");

    const auto store = remote_->createStore(displayName);

    Filestore filestore;
    filestore.user = user;
    filestore.name = store.name;
    filestore.display_name = store.display_name.empty() ? displayName : store.display_name;
    filestore.create_time = store.create_time;
    filestore.update_time = store.update_time;

    auto created = repo_->createFilestore(filestore);
    log::Registry::docmirror()->info("[FilestoreService] Created filestore {} ({}) backed by {}",
                                     created->id, created->display_name, created->name);
    return created;
}

dm::db::FilestorePtr FilestoreService::get(const unsigned int id) const {
    return require(repo_, id);
}

std::vector<dm::db::FilestorePtr> FilestoreService::list(const FilestoreQuery& query) const {
    return repo_->queryFilestores(query);
}

void FilestoreService::remove(const unsigned int id) {
    const auto filestore = require(repo_, id);

    try {
        remote_->deleteStore(filestore->name, true);
    } catch (const remote::NotFound&) {
        log::Registry::cloud()->debug("[FilestoreService] Remote store {} was already gone", filestore->name);
    }

    repo_->deleteFilestore(id);
    log::Registry::docmirror()->info("[FilestoreService] Deleted filestore {} ({})", id, filestore->display_name);
}

std::vector<dm::db::DocumentPtr> FilestoreService::documents(const DocumentQuery& query) const {
    return repo_->queryDocuments(query);
}

void FilestoreService::deleteDocument(const unsigned int documentId) {
    const auto doc = repo_->getDocument(documentId);
    if (!doc) throw errors::NotFound(fmt::format("Document {} does not exist", documentId));

    if (doc->name && !remote_->deleteDocument(*doc->name))
        log::Registry::cloud()->debug("[FilestoreService] Remote document {} was already gone", *doc->name);

    repo_->deleteDocument(documentId);
    aggregator_->recompute(doc->filestore_id);
    log::Registry::docmirror()->info("[FilestoreService] Deleted document {} ({})", documentId, doc->display_name);
}

std::vector<dm::remote::model::Document> FilestoreService::remoteDocuments(const unsigned int filestoreId) const {
    return remote_->listDocuments(require(repo_, filestoreId)->name);
}

std::vector<CategorySummary> FilestoreService::categories(const unsigned int filestoreId) const {
    require(repo_, filestoreId);
    return repo_->categories(filestoreId);
}
