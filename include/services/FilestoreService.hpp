#pragma once

#include "db/DocumentRepository.hpp"
#include "remote/Client.hpp"
#include "stats/Aggregator.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace dm::services {

// Filestore and document administration that spans the remote store and the local rows
class FilestoreService {
public:
    FilestoreService(std::shared_ptr<db::DocumentRepository> repo,
                     std::shared_ptr<remote::Client> remote,
                     std::shared_ptr<stats::Aggregator> aggregator);

    // Provisions the remote store first, then records it locally
    db::FilestorePtr create(const std::string& displayName, const std::optional<std::string>& user = std::nullopt);

    db::FilestorePtr get(unsigned int id) const;

    std::vector<db::FilestorePtr> list(const types::FilestoreQuery& query) const;

    // Force-deletes the remote store, then the filestore and its documents
    void remove(unsigned int id);

    std::vector<db::DocumentPtr> documents(const types::DocumentQuery& query) const;

    // A remote 404 counts as deleted; other remote errors abort before the local delete
    void deleteDocument(unsigned int documentId);

    std::vector<remote::model::Document> remoteDocuments(unsigned int filestoreId) const;

    std::vector<types::CategorySummary> categories(unsigned int filestoreId) const;

private:
    std::shared_ptr<db::DocumentRepository> repo_;
    std::shared_ptr<remote::Client> remote_;
    std::shared_ptr<stats::Aggregator> aggregator_;
};

}
