#include "db/DBConnection.hpp"

void dm::db::DBConnection::initPreparedFilestores() const {
    conn_->prepare("insert_filestore",
                   "INSERT INTO filestore (user_id, name, display_name, create_time, update_time, metadata, ref) "
                   "VALUES ($1, $2, $3, $4::timestamp, $5::timestamp, $6::jsonb, $7) RETURNING *");

    conn_->prepare("get_filestore", "SELECT * FROM filestore WHERE id = $1");

    conn_->prepare("update_filestore_stats",
                   "UPDATE filestore SET active_documents_count = $2, pending_documents_count = $3, "
                   "failed_documents_count = $4, size_bytes = $5, updated_at = LOCALTIMESTAMP WHERE id = $1");

    conn_->prepare("delete_filestore", "DELETE FROM filestore WHERE id = $1");
}
