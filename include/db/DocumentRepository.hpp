#pragma once

#include "types/Document.hpp"
#include "types/DocumentQuery.hpp"
#include "types/Filestore.hpp"

#include <chrono>
#include <ctime>
#include <memory>
#include <string>
#include <vector>

namespace dm::db {

using DocumentPtr = std::shared_ptr<types::Document>;
using FilestorePtr = std::shared_ptr<types::Filestore>;

// Persistence boundary for filestores and documents. The queue operations are
// conditional updates: a claim only takes rows that are unclaimed and carry no
// terminal marker, and terminal writes only land on the attempt that claimed them.
class DocumentRepository {
public:
    virtual ~DocumentRepository() = default;

    virtual FilestorePtr createFilestore(const types::Filestore& filestore) = 0;
    virtual FilestorePtr getFilestore(unsigned int id) = 0;
    virtual std::vector<FilestorePtr> queryFilestores(const types::FilestoreQuery& query) = 0;
    virtual void updateFilestoreStats(unsigned int id, const types::FilestoreStats& stats) = 0;
    virtual bool deleteFilestore(unsigned int id) = 0;   // cascades to documents

    virtual DocumentPtr insertDocument(const types::Document& doc) = 0;
    virtual DocumentPtr getDocument(unsigned int id) = 0;
    virtual DocumentPtr findByHash(unsigned int filestoreId, const std::string& hash) = 0;
    virtual std::vector<DocumentPtr> queryDocuments(const types::DocumentQuery& query) = 0;

    // Every document of the filestore, id ascending
    virtual std::vector<DocumentPtr> listDocuments(unsigned int filestoreId) = 0;

    // Writes the reconciliation columns (remote fields, state, uploadedAt, error) in one transaction.
    // Rows whose markers moved since they were read are skipped. Returns the rows written.
    virtual unsigned int updateDocuments(const std::vector<types::DocumentUpdate>& updates) = 0;

    virtual bool deleteDocument(unsigned int id) = 0;
    virtual unsigned int deleteDocumentsByFilestore(unsigned int filestoreId) = 0;

    // Claims up to limit unclaimed documents, oldest first. Result is id ascending.
    virtual std::vector<DocumentPtr> claimPending(unsigned int limit) = 0;

    // Resets the terminal markers of a document that is not in flight and claims it.
    // nullptr when the document is already claimed.
    virtual DocumentPtr retryClaim(unsigned int id) = 0;

    // Terminal writes. nullptr when the claim identified by startedAt no longer holds.
    virtual DocumentPtr completeUpload(const types::Document& uploaded) = 0;
    virtual DocumentPtr failUpload(unsigned int id, std::time_t startedAt, const std::string& error) = 0;

    // Releases claims older than the given age that never reached a terminal marker
    virtual unsigned int releaseStaleClaims(std::chrono::seconds olderThan) = 0;

    virtual bool hasClaimable() = 0;

    virtual std::vector<types::CategorySummary> categories(unsigned int filestoreId) = 0;
};

}
