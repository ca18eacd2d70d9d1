#pragma once

#include <memory>
#include <string>
#include <pqxx/connection>

namespace dm::db {

class DBConnection {
  public:
    explicit DBConnection(const std::string& connectionString);
    ~DBConnection();

    [[nodiscard]] pqxx::connection& get() const;

    void initPrepared() const;

  private:
    std::unique_ptr<pqxx::connection> conn_;

    void initPreparedFilestores() const;
    void initPreparedDocuments() const;
};

}
