#include "services/DocumentUploader.hpp"
#include "errors/errors.hpp"
#include "log/Registry.hpp"

#include <fmt/format.h>

using namespace dm::services;
using namespace dm::types;
using namespace dm::concurrency;

DocumentUploader::DocumentUploader(std::shared_ptr<db::DocumentRepository> repo,
                                   std::shared_ptr<remote::Client> remote,
                                   std::shared_ptr<storage::ContentStore> store,
                                   util::MimeResolver mime,
                                   PollPolicy policy,
                                   Interrupt* interrupt)
    : repo_(std::move(repo)), remote_(std::move(remote)), store_(std::move(store)),
      mime_(std::move(mime)), policy_(policy), interrupt_(interrupt) {}

CustomMetadata DocumentUploader::metadataFor(const Document& doc) {
    CustomMetadata metadata{
        CustomMetadataEntry::numeric("id", static_cast<double>(doc.id)),
        CustomMetadataEntry::string("hash", doc.hash)
    };
    if (doc.category && !doc.category->empty())
        metadata.push_back(CustomMetadataEntry::string("category", *doc.category));
    return metadata;
}

dm::db::DocumentPtr DocumentUploader::process(const Document& claimed) const {
    if (!claimed.started_at)
        throw std::logic_error(fmt::format("Document {} was handed to the uploader without a claim", claimed.id));

    try {
        const auto uploaded = upload(claimed);
        auto done = repo_->completeUpload(uploaded);
        if (!done) {
            log::Registry::worker()->warn("[DocumentUploader] Claim on document {} was lost before completion", claimed.id);
            discardOrphan(*uploaded.name);
        } else log::Registry::worker()->info("[DocumentUploader] Uploaded document {} as {}", claimed.id, done->name.value_or(""));
        return done;
    } catch (const Interrupted&) {
        log::Registry::worker()->info("[DocumentUploader] Upload of document {} interrupted, claim left for recovery", claimed.id);
        throw;
    } catch (const std::exception& e) {
        log::Registry::worker()->error("[DocumentUploader] Upload of document {} ({}) failed: {}",
                                       claimed.id, claimed.display_name, e.what());
        auto failed = repo_->failUpload(claimed.id, *claimed.started_at, e.what());
        if (!failed) log::Registry::worker()->warn("[DocumentUploader] Claim on document {} was lost before failure could be recorded", claimed.id);
        return failed;
    }
}

void DocumentUploader::discardOrphan(const std::string& remoteName) const {
    try {
        if (remote_->deleteDocument(remoteName))
            log::Registry::worker()->info("[DocumentUploader] Removed orphaned remote copy {}", remoteName);
        else log::Registry::worker()->debug("[DocumentUploader] Orphaned remote copy {} was already gone", remoteName);
    } catch (const remote::Error& e) {
        log::Registry::worker()->warn("[DocumentUploader] Could not remove orphaned remote copy {}: {}", remoteName, e.what());
    }
}

Document DocumentUploader::upload(const Document& claimed) const {
    const auto filestore = repo_->getFilestore(claimed.filestore_id);
    if (!filestore) throw errors::NotFound(fmt::format("Filestore {} no longer exists", claimed.filestore_id));
    if (filestore->name.empty())
        throw std::runtime_error(fmt::format("Filestore {} has no remote store", filestore->id));

    const auto path = store_->resolve(claimed.url);
    if (!std::filesystem::exists(path))
        throw std::runtime_error(fmt::format("Cached file {} is missing", claimed.url));

    remote::model::UploadRequest req;
    req.display_name = claimed.display_name;
    req.mime_type = mime_.forUpload(util::extensionOf(claimed.filename));
    req.custom_metadata = metadataFor(claimed);

    log::Registry::worker()->debug("[DocumentUploader] Uploading document {} to {} (mime: {})",
                                   claimed.id, filestore->name, req.mime_type.value_or("<remote infers>"));

    auto op = remote_->upload(filestore->name, path, req);
    if (!op.done) {
        const auto opName = op.name;
        op = awaitCompletion([&]() -> std::optional<remote::model::Operation> {
            auto current = remote_->getOperation(opName);
            if (current.done) return current;
            return std::nullopt;
        }, policy_, interrupt_);
    }

    if (op.error) throw std::runtime_error(*op.error);
    if (!op.document_name) throw std::runtime_error(fmt::format("Operation {} finished without a document", op.name));

    const auto remoteDoc = remote_->getDocument(*op.document_name);

    Document uploaded = claimed;
    uploaded.name = remoteDoc.name.empty() ? *op.document_name : remoteDoc.name;
    uploaded.create_time = remoteDoc.create_time;
    uploaded.update_time = remoteDoc.update_time;
    uploaded.size_bytes = remoteDoc.size_bytes;
    if (remoteDoc.mime_type) uploaded.mime_type = remoteDoc.mime_type;
    uploaded.custom_metadata = remoteDoc.custom_metadata ? remoteDoc.custom_metadata : std::optional(req.custom_metadata);
    uploaded.state = DocumentState(Lifecycle::Active);
    uploaded.error.reset();
    return uploaded;
}
