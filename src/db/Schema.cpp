#include "db/Schema.hpp"
#include "log/Registry.hpp"

#include <pqxx/pqxx>

namespace dm::db {

void Schema::init(const std::string& connectionString) {
    pqxx::connection conn(connectionString);
    pqxx::work txn(conn);

    txn.exec(R"(
CREATE TABLE IF NOT EXISTS filestore
(
    id                       SERIAL        PRIMARY KEY,
    user_id                  TEXT,
    name                     TEXT          NOT NULL,
    display_name             TEXT          NOT NULL,
    create_time              TIMESTAMP,
    update_time              TIMESTAMP,
    active_documents_count   INTEGER       NOT NULL DEFAULT 0,
    pending_documents_count  INTEGER       NOT NULL DEFAULT 0,
    failed_documents_count   INTEGER       NOT NULL DEFAULT 0,
    size_bytes               BIGINT        NOT NULL DEFAULT 0,
    metadata                 JSONB         NOT NULL DEFAULT '{}',
    error                    TEXT,
    ref                      TEXT,
    created_at               TIMESTAMP     NOT NULL DEFAULT CURRENT_TIMESTAMP,
    updated_at               TIMESTAMP     NOT NULL DEFAULT CURRENT_TIMESTAMP,
    UNIQUE (user_id, display_name)
);
    )");

    txn.exec(R"(
CREATE TABLE IF NOT EXISTS document
(
    id               SERIAL        PRIMARY KEY,
    filestore_id     INTEGER       NOT NULL REFERENCES filestore (id) ON DELETE CASCADE,
    user_id          TEXT,
    filename         TEXT          NOT NULL,
    url              TEXT          NOT NULL,
    hash             TEXT          NOT NULL,
    size             BIGINT        NOT NULL,
    display_name     TEXT          NOT NULL,
    name             TEXT,
    custom_metadata  JSONB,
    create_time      TIMESTAMP,
    update_time      TIMESTAMP,
    size_bytes       BIGINT,
    mime_type        TEXT,
    state            TEXT          NOT NULL DEFAULT 'STATE_PENDING',
    category         TEXT,
    tags             JSONB         NOT NULL DEFAULT '[]',
    started_at       TIMESTAMP,
    uploaded_at      TIMESTAMP,
    metadata         JSONB         NOT NULL DEFAULT '{}',
    error            TEXT,
    ref              TEXT,
    created_at       TIMESTAMP     NOT NULL DEFAULT CURRENT_TIMESTAMP,
    updated_at       TIMESTAMP     NOT NULL DEFAULT CURRENT_TIMESTAMP,
    UNIQUE (filestore_id, hash)
);
    )");

    txn.exec("CREATE INDEX IF NOT EXISTS idx_filestore_user ON filestore (user_id)");
    txn.exec("CREATE INDEX IF NOT EXISTS idx_document_user ON document (user_id)");
    txn.exec("CREATE INDEX IF NOT EXISTS idx_document_filestore ON document (filestore_id, id)");
    txn.exec("CREATE INDEX IF NOT EXISTS idx_document_display_name ON document (filestore_id, display_name)");
    txn.exec("CREATE INDEX IF NOT EXISTS idx_document_created_at ON document (created_at)");
    txn.exec("CREATE INDEX IF NOT EXISTS idx_document_claimable ON document (created_at, id) "
             "WHERE started_at IS NULL AND uploaded_at IS NULL AND error IS NULL");

    txn.commit();
    log::Registry::db()->info("[Schema] Tables ready");
}

}
