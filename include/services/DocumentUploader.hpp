#pragma once

#include "concurrency/Interrupt.hpp"
#include "concurrency/awaitCompletion.hpp"
#include "db/DocumentRepository.hpp"
#include "remote/Client.hpp"
#include "storage/ContentStore.hpp"
#include "util/mime.hpp"

#include <memory>

namespace dm::services {

// Drives one claimed document through upload and operation polling to a terminal marker
class DocumentUploader {
public:
    DocumentUploader(std::shared_ptr<db::DocumentRepository> repo,
                     std::shared_ptr<remote::Client> remote,
                     std::shared_ptr<storage::ContentStore> store,
                     util::MimeResolver mime,
                     concurrency::PollPolicy policy,
                     concurrency::Interrupt* interrupt = nullptr);

    // Returns the terminal row, or nullptr when the claim was taken over in the meantime.
    // A remote copy created for a lost claim is deleted again.
    // Every failure is recorded on the document except concurrency::Interrupted, which
    // is rethrown with the claim left in place.
    db::DocumentPtr process(const types::Document& claimed) const;

    static types::CustomMetadata metadataFor(const types::Document& doc);

private:
    std::shared_ptr<db::DocumentRepository> repo_;
    std::shared_ptr<remote::Client> remote_;
    std::shared_ptr<storage::ContentStore> store_;
    util::MimeResolver mime_;
    concurrency::PollPolicy policy_;
    concurrency::Interrupt* interrupt_;

    types::Document upload(const types::Document& claimed) const;

    // Best-effort; a 404 counts as removed
    void discardOrphan(const std::string& remoteName) const;
};

}
