#include "db/PgRepository.hpp"
#include "db/Transactions.hpp"
#include "log/Registry.hpp"
#include "util/timestamp.hpp"

#include <algorithm>
#include <nlohmann/json.hpp>
#include <fmt/format.h>
#include <fmt/ranges.h>

using namespace dm::types;
using namespace dm::util;

namespace dm::db {

namespace {

std::optional<std::string> ts(const std::optional<std::time_t>& t) {
    if (!t) return std::nullopt;
    return timestampToString(*t);
}

std::optional<std::string> customMetadataJson(const std::optional<CustomMetadata>& cm) {
    if (!cm) return std::nullopt;
    return nlohmann::json(*cm).dump();
}

std::optional<long long> optSize(const std::optional<uintmax_t>& v) {
    if (!v) return std::nullopt;
    return static_cast<long long>(*v);
}

DocumentPtr firstOrNull(const pqxx::result& res) {
    if (res.empty()) return nullptr;
    return std::make_shared<Document>(res[0]);
}

// Positional placeholder builder for the dynamic document query
struct SqlBuilder {
    pqxx::params params;
    std::vector<std::string> where;
    int next = 1;

    template <typename T>
    std::string bind(T&& value) {
        params.append(std::forward<T>(value));
        return fmt::format("${}", next++);
    }

    [[nodiscard]] std::string whereClause() const {
        if (where.empty()) return "";
        return fmt::format(" WHERE {}", fmt::join(where, " AND "));
    }
};

std::string orderBy(const std::string& sort) {
    if (sort == "failed")
        return "ORDER BY CASE WHEN error IS NOT NULL AND error <> '' THEN 0 ELSE 1 END, id DESC";
    if (sort == "uploading")
        return "ORDER BY CASE WHEN uploaded_at IS NULL AND error IS NULL THEN created_at ELSE 'infinity'::timestamp END, "
               "uploaded_at DESC NULLS LAST, id DESC";
    if (sort == "issues")
        return "ORDER BY CASE WHEN state IN ('MISSING_METADATA', 'DUPLICATE_FILE', 'MISSING_FROM_REMOTE', "
               "'METADATA_MISMATCH') THEN 0 ELSE 1 END, id DESC";

    const bool desc = sort.starts_with("-");
    const auto field = desc ? sort.substr(1) : sort;
    const auto col = documentColumn(field);
    if (!col) throw std::invalid_argument("Unknown sort key: " + sort);
    if (*col == "id") return desc ? "ORDER BY id DESC" : "ORDER BY id";
    return fmt::format("ORDER BY {} {}, id {}", *col, desc ? "DESC" : "ASC", desc ? "DESC" : "ASC");
}

}

FilestorePtr PgRepository::createFilestore(const Filestore& filestore) {
    return Transactions::exec("PgRepository::createFilestore", [&](pqxx::work& txn) {
        pqxx::params p;
        p.append(filestore.user);
        p.append(filestore.name);
        p.append(filestore.display_name);
        p.append(ts(filestore.create_time));
        p.append(ts(filestore.update_time));
        p.append(filestore.metadata);
        p.append(filestore.ref);
        return std::make_shared<Filestore>(txn.exec(pqxx::prepped{"insert_filestore"}, p).one_row());
    });
}

FilestorePtr PgRepository::getFilestore(const unsigned int id) {
    return Transactions::exec("PgRepository::getFilestore", [&](pqxx::work& txn) -> FilestorePtr {
        const auto res = txn.exec(pqxx::prepped{"get_filestore"}, pqxx::params{id});
        if (res.empty()) return nullptr;
        return std::make_shared<Filestore>(res[0]);
    });
}

std::vector<FilestorePtr> PgRepository::queryFilestores(const FilestoreQuery& query) {
    return Transactions::exec("PgRepository::queryFilestores", [&](pqxx::work& txn) {
        SqlBuilder b;
        if (query.user) b.where.push_back("user_id = " + b.bind(*query.user));
        if (query.q) b.where.push_back("display_name ILIKE " + b.bind("%" + *query.q + "%"));
        const auto where = b.whereClause();
        const auto take = b.bind(query.limit());
        const auto skip = b.bind(query.skip);
        const auto sql = fmt::format("SELECT * FROM filestore{} ORDER BY id DESC LIMIT {} OFFSET {}", where, take, skip);
        return filestores_from_pq_res(txn.exec(sql, b.params));
    });
}

void PgRepository::updateFilestoreStats(const unsigned int id, const FilestoreStats& stats) {
    Transactions::exec("PgRepository::updateFilestoreStats", [&](pqxx::work& txn) {
        pqxx::params p{id, stats.active, stats.pending, stats.failed, static_cast<long long>(stats.size_bytes)};
        txn.exec(pqxx::prepped{"update_filestore_stats"}, p);
    });
}

bool PgRepository::deleteFilestore(const unsigned int id) {
    return Transactions::exec("PgRepository::deleteFilestore", [&](pqxx::work& txn) {
        return txn.exec(pqxx::prepped{"delete_filestore"}, pqxx::params{id}).affected_rows() > 0;
    });
}

DocumentPtr PgRepository::insertDocument(const Document& doc) {
    return Transactions::exec("PgRepository::insertDocument", [&](pqxx::work& txn) {
        pqxx::params p;
        p.append(doc.filestore_id);
        p.append(doc.user);
        p.append(doc.filename);
        p.append(doc.url);
        p.append(doc.hash);
        p.append(static_cast<long long>(doc.size));
        p.append(doc.display_name);
        p.append(doc.mime_type);
        p.append(to_string(doc.state));
        p.append(doc.category);
        p.append(doc.tags);
        p.append(doc.metadata);
        p.append(doc.ref);
        return std::make_shared<Document>(txn.exec(pqxx::prepped{"insert_document"}, p).one_row());
    });
}

DocumentPtr PgRepository::getDocument(const unsigned int id) {
    return Transactions::exec("PgRepository::getDocument", [&](pqxx::work& txn) {
        return firstOrNull(txn.exec(pqxx::prepped{"get_document"}, pqxx::params{id}));
    });
}

DocumentPtr PgRepository::findByHash(const unsigned int filestoreId, const std::string& hash) {
    return Transactions::exec("PgRepository::findByHash", [&](pqxx::work& txn) {
        return firstOrNull(txn.exec(pqxx::prepped{"get_document_by_hash"}, pqxx::params{filestoreId, hash}));
    });
}

std::vector<DocumentPtr> PgRepository::queryDocuments(const DocumentQuery& query) {
    SqlBuilder b;

    if (query.filestore_id) b.where.push_back("filestore_id = " + b.bind(*query.filestore_id));
    if (query.category) {
        if (query.category->empty()) b.where.emplace_back("(category IS NULL OR category = '')");
        else b.where.push_back("category = " + b.bind(*query.category));
    }
    if (query.hash) b.where.push_back("hash = " + b.bind(*query.hash));
    if (query.display_name) b.where.push_back("display_name = " + b.bind(*query.display_name));
    if (query.user) b.where.push_back("user_id = " + b.bind(*query.user));
    if (query.q) b.where.push_back("display_name ILIKE " + b.bind("%" + *query.q + "%"));

    if (!query.ids.empty()) {
        std::vector<std::string> ph;
        for (const auto id : query.ids) ph.push_back(b.bind(id));
        b.where.push_back(fmt::format("id IN ({})", fmt::join(ph, ", ")));
    }

    if (!query.display_names.empty()) {
        std::vector<std::string> ph;
        for (const auto& n : query.display_names) ph.push_back(b.bind(n));
        b.where.push_back(fmt::format("display_name IN ({})", fmt::join(ph, ", ")));
    }

    for (const auto& field : query.null_columns) {
        const auto col = documentColumn(field);
        if (!col) throw std::invalid_argument("Unknown column in null filter: " + field);
        b.where.push_back(*col + " IS NULL");
    }

    for (const auto& field : query.not_null_columns) {
        const auto col = documentColumn(field);
        if (!col) throw std::invalid_argument("Unknown column in notNull filter: " + field);
        b.where.push_back(*col + " IS NOT NULL");
    }

    const auto where = b.whereClause();
    const auto order = orderBy(query.sort);
    const auto take = b.bind(query.limit());
    const auto skip = b.bind(query.skip);
    const auto sql = fmt::format("SELECT * FROM document{} {} LIMIT {} OFFSET {}", where, order, take, skip);

    return Transactions::exec("PgRepository::queryDocuments", [&](pqxx::work& txn) {
        return documents_from_pq_res(txn.exec(sql, b.params));
    });
}

std::vector<DocumentPtr> PgRepository::listDocuments(const unsigned int filestoreId) {
    return Transactions::exec("PgRepository::listDocuments", [&](pqxx::work& txn) {
        return documents_from_pq_res(txn.exec(pqxx::prepped{"list_documents_by_filestore"}, pqxx::params{filestoreId}));
    });
}

unsigned int PgRepository::updateDocuments(const std::vector<DocumentUpdate>& updates) {
    if (updates.empty()) return 0;

    return Transactions::exec("PgRepository::updateDocuments", [&](pqxx::work& txn) {
        unsigned int written = 0;
        for (const auto& [doc, expected] : updates) {
            pqxx::params p;
            p.append(doc.id);
            p.append(doc.name);
            p.append(customMetadataJson(doc.custom_metadata));
            p.append(ts(doc.create_time));
            p.append(ts(doc.update_time));
            p.append(optSize(doc.size_bytes));
            p.append(doc.mime_type);
            p.append(to_string(doc.state));
            p.append(ts(doc.uploaded_at));
            p.append(doc.error);
            p.append(ts(expected.started_at));
            p.append(ts(expected.uploaded_at));
            p.append(expected.error);

            if (txn.exec(pqxx::prepped{"update_document_reconciliation"}, p).affected_rows() > 0) ++written;
            else log::Registry::db()->debug("[PgRepository] Document {} changed since it was read; reconciliation skipped", doc.id);
        }
        return written;
    });
}

bool PgRepository::deleteDocument(const unsigned int id) {
    return Transactions::exec("PgRepository::deleteDocument", [&](pqxx::work& txn) {
        return txn.exec(pqxx::prepped{"delete_document"}, pqxx::params{id}).affected_rows() > 0;
    });
}

unsigned int PgRepository::deleteDocumentsByFilestore(const unsigned int filestoreId) {
    return Transactions::exec("PgRepository::deleteDocumentsByFilestore", [&](pqxx::work& txn) {
        return static_cast<unsigned int>(
            txn.exec(pqxx::prepped{"delete_documents_by_filestore"}, pqxx::params{filestoreId}).affected_rows());
    });
}

std::vector<DocumentPtr> PgRepository::claimPending(const unsigned int limit) {
    auto docs = Transactions::exec("PgRepository::claimPending", [&](pqxx::work& txn) {
        return documents_from_pq_res(txn.exec(pqxx::prepped{"claim_pending_documents"}, pqxx::params{limit}));
    });
    std::ranges::sort(docs, [](const DocumentPtr& a, const DocumentPtr& b) { return a->id < b->id; });
    return docs;
}

DocumentPtr PgRepository::retryClaim(const unsigned int id) {
    return Transactions::exec("PgRepository::retryClaim", [&](pqxx::work& txn) {
        return firstOrNull(txn.exec(pqxx::prepped{"retry_claim_document"}, pqxx::params{id}));
    });
}

DocumentPtr PgRepository::completeUpload(const Document& uploaded) {
    if (!uploaded.started_at) throw std::invalid_argument("completeUpload requires a claimed document");

    return Transactions::exec("PgRepository::completeUpload", [&](pqxx::work& txn) {
        pqxx::params p;
        p.append(uploaded.id);
        p.append(timestampToString(*uploaded.started_at));
        p.append(uploaded.name);
        p.append(ts(uploaded.create_time));
        p.append(ts(uploaded.update_time));
        p.append(optSize(uploaded.size_bytes));
        p.append(uploaded.mime_type);
        p.append(customMetadataJson(uploaded.custom_metadata));
        return firstOrNull(txn.exec(pqxx::prepped{"complete_upload"}, p));
    });
}

DocumentPtr PgRepository::failUpload(const unsigned int id, const std::time_t startedAt, const std::string& error) {
    const auto message = error.empty() ? std::string("Unknown error") : error;
    return Transactions::exec("PgRepository::failUpload", [&](pqxx::work& txn) {
        return firstOrNull(txn.exec(pqxx::prepped{"fail_upload"},
                                    pqxx::params{id, timestampToString(startedAt), message}));
    });
}

unsigned int PgRepository::releaseStaleClaims(const std::chrono::seconds olderThan) {
    return Transactions::exec("PgRepository::releaseStaleClaims", [&](pqxx::work& txn) {
        const auto res = txn.exec(pqxx::prepped{"release_stale_claims"},
                                  pqxx::params{static_cast<double>(olderThan.count())});
        return static_cast<unsigned int>(res.affected_rows());
    });
}

bool PgRepository::hasClaimable() {
    return Transactions::exec("PgRepository::hasClaimable", [&](pqxx::work& txn) {
        return txn.exec(pqxx::prepped{"has_claimable_documents"}).one_field().as<bool>();
    });
}

std::vector<CategorySummary> PgRepository::categories(const unsigned int filestoreId) {
    return Transactions::exec("PgRepository::categories", [&](pqxx::work& txn) {
        std::vector<CategorySummary> out;
        for (const auto& row : txn.exec(pqxx::prepped{"document_categories"}, pqxx::params{filestoreId})) {
            CategorySummary c;
            c.category = row["category"].as<std::optional<std::string>>();
            c.count = row["count"].as<unsigned int>();
            c.size = row["size"].as<uintmax_t>();
            out.push_back(std::move(c));
        }
        return out;
    });
}

}
