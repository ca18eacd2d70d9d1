#include "db/DBConnection.hpp"

// A row is claimable when it carries no claim and no terminal marker
#define DM_CLAIMABLE "started_at IS NULL AND uploaded_at IS NULL AND error IS NULL"
#define DM_IN_FLIGHT "started_at IS NOT NULL AND uploaded_at IS NULL AND error IS NULL"

void dm::db::DBConnection::initPreparedDocuments() const {
    conn_->prepare("insert_document",
                   "INSERT INTO document (filestore_id, user_id, filename, url, hash, size, display_name, "
                   "mime_type, state, category, tags, metadata, ref) "
                   "VALUES ($1, $2, $3, $4, $5, $6, $7, $8, $9, $10, $11::jsonb, $12::jsonb, $13) RETURNING *");

    conn_->prepare("get_document", "SELECT * FROM document WHERE id = $1");

    conn_->prepare("get_document_by_hash", "SELECT * FROM document WHERE filestore_id = $1 AND hash = $2");

    conn_->prepare("list_documents_by_filestore", "SELECT * FROM document WHERE filestore_id = $1 ORDER BY id");

    conn_->prepare("update_document_reconciliation",
                   "UPDATE document SET name = $2, custom_metadata = $3::jsonb, create_time = $4::timestamp, "
                   "update_time = $5::timestamp, size_bytes = $6, mime_type = $7, state = $8, "
                   "uploaded_at = $9::timestamp, error = $10, updated_at = LOCALTIMESTAMP "
                   "WHERE id = $1 AND started_at IS NOT DISTINCT FROM $11::timestamp "
                   "AND date_trunc('second', uploaded_at) IS NOT DISTINCT FROM $12::timestamp "
                   "AND error IS NOT DISTINCT FROM $13");

    conn_->prepare("delete_document", "DELETE FROM document WHERE id = $1");

    conn_->prepare("delete_documents_by_filestore", "DELETE FROM document WHERE filestore_id = $1");

    conn_->prepare("claim_pending_documents",
                   "UPDATE document SET started_at = date_trunc('second', LOCALTIMESTAMP), updated_at = LOCALTIMESTAMP "
                   "WHERE id IN (SELECT id FROM document WHERE " DM_CLAIMABLE " "
                   "ORDER BY created_at, id LIMIT $1 FOR UPDATE SKIP LOCKED) "
                   "AND " DM_CLAIMABLE " RETURNING *");

    conn_->prepare("retry_claim_document",
                   "UPDATE document SET error = NULL, uploaded_at = NULL, name = NULL, state = 'STATE_PENDING', "
                   "started_at = date_trunc('second', LOCALTIMESTAMP), updated_at = LOCALTIMESTAMP "
                   "WHERE id = $1 AND NOT (" DM_IN_FLIGHT ") RETURNING *");

    conn_->prepare("complete_upload",
                   "UPDATE document SET name = $3, create_time = $4::timestamp, update_time = $5::timestamp, "
                   "size_bytes = $6, mime_type = COALESCE($7, mime_type), custom_metadata = $8::jsonb, "
                   "state = 'STATE_ACTIVE', uploaded_at = LOCALTIMESTAMP, error = NULL, updated_at = LOCALTIMESTAMP "
                   "WHERE id = $1 AND started_at = $2::timestamp AND uploaded_at IS NULL AND error IS NULL RETURNING *");

    conn_->prepare("fail_upload",
                   "UPDATE document SET state = 'STATE_FAILED', error = $3, updated_at = LOCALTIMESTAMP "
                   "WHERE id = $1 AND started_at = $2::timestamp AND uploaded_at IS NULL AND error IS NULL RETURNING *");

    conn_->prepare("release_stale_claims",
                   "UPDATE document SET started_at = NULL, updated_at = LOCALTIMESTAMP "
                   "WHERE " DM_IN_FLIGHT " AND started_at < LOCALTIMESTAMP - make_interval(secs => $1)");

    conn_->prepare("has_claimable_documents", "SELECT EXISTS (SELECT 1 FROM document WHERE " DM_CLAIMABLE ")");

    conn_->prepare("document_categories",
                   "SELECT category, COUNT(*) AS count, COALESCE(SUM(size), 0) AS size FROM document "
                   "WHERE filestore_id = $1 GROUP BY category ORDER BY category NULLS FIRST");
}

#undef DM_CLAIMABLE
#undef DM_IN_FLIGHT
