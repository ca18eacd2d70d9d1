#include "ingest/IngestionService.hpp"
#include "errors/errors.hpp"
#include "log/Registry.hpp"

#include <fstream>
#include <sstream>

using namespace dm::ingest;
using namespace dm::types;

IncomingFile IncomingFile::fromPath(const std::filesystem::path& path) {
    auto in = std::make_shared<std::ifstream>(path, std::ios::binary);
    if (!*in) throw std::runtime_error("Failed to open " + path.string());
    return {path.filename().string(), std::move(in)};
}

IncomingFile IncomingFile::fromBytes(std::string filename, std::string bytes) {
    return {std::move(filename), std::make_shared<std::istringstream>(std::move(bytes))};
}

IngestionService::IngestionService(std::shared_ptr<db::DocumentRepository> repo,
                                   std::shared_ptr<remote::Client> remote,
                                   std::shared_ptr<storage::ContentStore> store,
                                   util::MimeResolver mime,
                                   WakeFn wake)
    : repo_(std::move(repo)), remote_(std::move(remote)), store_(std::move(store)),
      mime_(std::move(mime)), wake_(std::move(wake)) {}

dm::db::FilestorePtr IngestionService::requireFilestore(const unsigned int filestoreId) const {
    auto filestore = repo_->getFilestore(filestoreId);
    if (!filestore) throw errors::NotFound("Filestore " + std::to_string(filestoreId) + " does not exist");
    return filestore;
}

dm::db::DocumentPtr IngestionService::ingest(const unsigned int filestoreId,
                                             const std::optional<std::string>& category,
                                             const IncomingFile& upload) {
    const auto filestore = requireFilestore(filestoreId);
    auto doc = ingestOne(*filestore, category, upload);
    signal();
    return doc;
}

std::vector<dm::db::DocumentPtr> IngestionService::ingest(const unsigned int filestoreId,
                                                          const std::optional<std::string>& category,
                                                          const std::vector<IncomingFile>& uploads) {
    const auto filestore = requireFilestore(filestoreId);

    std::vector<db::DocumentPtr> docs;
    docs.reserve(uploads.size());
    for (const auto& upload : uploads) docs.push_back(ingestOne(*filestore, category, upload));

    if (!docs.empty()) signal();
    return docs;
}

dm::db::DocumentPtr IngestionService::ingestOne(const Filestore& filestore,
                                                const std::optional<std::string>& category,
                                                const IncomingFile& upload) {
    if (!upload.stream) throw std::invalid_argument("Upload of " + upload.filename + " has no content stream");

    const auto stored = store_->put(*upload.stream, upload.filename);

    if (const auto existing = repo_->findByHash(filestore.id, stored.hash)) {
        log::Registry::ingest()->info("[IngestionService] {} replaces document {} with the same content",
                                      upload.filename, existing->id);
        removeSuperseded(*existing);
    }

    Document doc;
    doc.filestore_id = filestore.id;
    doc.user = filestore.user;
    doc.filename = stored.filename;
    doc.url = stored.url;
    doc.hash = stored.hash;
    doc.size = stored.size;
    doc.display_name = upload.filename;
    doc.mime_type = mime_.inferred(stored.ext);
    doc.state = DocumentState(Lifecycle::Pending);
    if (category && !category->empty()) doc.category = category;

    auto inserted = repo_->insertDocument(doc);
    log::Registry::ingest()->info("[IngestionService] Queued document {} ({}) in filestore {}",
                                  inserted->id, inserted->display_name, filestore.id);
    return inserted;
}

void IngestionService::removeSuperseded(const Document& existing) const {
    if (existing.name) {
        try {
            if (!remote_->deleteDocument(*existing.name))
                log::Registry::ingest()->debug("[IngestionService] Remote copy {} was already gone", *existing.name);
        } catch (const remote::Error& e) {
            log::Registry::ingest()->warn("[IngestionService] Could not delete remote copy {}: {}", *existing.name, e.what());
        }
    }
    repo_->deleteDocument(existing.id);
}

void IngestionService::signal() const {
    if (wake_) wake_();
}
