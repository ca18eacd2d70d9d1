#pragma once

#include "db/DocumentRepository.hpp"

namespace dm::db {

// DocumentRepository over PostgreSQL. Requires Transactions::init().
class PgRepository final : public DocumentRepository {
public:
    FilestorePtr createFilestore(const types::Filestore& filestore) override;
    FilestorePtr getFilestore(unsigned int id) override;
    std::vector<FilestorePtr> queryFilestores(const types::FilestoreQuery& query) override;
    void updateFilestoreStats(unsigned int id, const types::FilestoreStats& stats) override;
    bool deleteFilestore(unsigned int id) override;

    DocumentPtr insertDocument(const types::Document& doc) override;
    DocumentPtr getDocument(unsigned int id) override;
    DocumentPtr findByHash(unsigned int filestoreId, const std::string& hash) override;
    std::vector<DocumentPtr> queryDocuments(const types::DocumentQuery& query) override;
    std::vector<DocumentPtr> listDocuments(unsigned int filestoreId) override;
    unsigned int updateDocuments(const std::vector<types::DocumentUpdate>& updates) override;
    bool deleteDocument(unsigned int id) override;
    unsigned int deleteDocumentsByFilestore(unsigned int filestoreId) override;

    std::vector<DocumentPtr> claimPending(unsigned int limit) override;
    DocumentPtr retryClaim(unsigned int id) override;
    DocumentPtr completeUpload(const types::Document& uploaded) override;
    DocumentPtr failUpload(unsigned int id, std::time_t startedAt, const std::string& error) override;
    unsigned int releaseStaleClaims(std::chrono::seconds olderThan) override;
    bool hasClaimable() override;

    std::vector<types::CategorySummary> categories(unsigned int filestoreId) override;
};

}
