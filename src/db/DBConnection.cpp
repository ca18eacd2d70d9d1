#include "db/DBConnection.hpp"
#include "log/Registry.hpp"

#include <pqxx/pqxx>
#include <stdexcept>

namespace dm::db {

DBConnection::DBConnection(const std::string& connectionString)
    : conn_(std::make_unique<pqxx::connection>(connectionString)) {
    // timestamps are stored without zone and read back as UTC
    pqxx::nontransaction tx(*conn_);
    tx.exec("SET TIME ZONE 'UTC'");
    log::Registry::db()->debug("[DBConnection] Connected to {}", conn_->dbname());
}

DBConnection::~DBConnection() { if (conn_ && conn_->is_open()) conn_->close(); }

pqxx::connection& DBConnection::get() const { return *conn_; }

void DBConnection::initPrepared() const {
    if (!conn_ || !conn_->is_open()) throw std::runtime_error("Database connection is not open");

    initPreparedFilestores();
    initPreparedDocuments();
}

}
