#pragma once

#include <memory>
#include <string>
#include <pqxx/connection>

namespace km::config { struct DatabaseConfig; }

namespace km::db {

class DBConnection {
  public:
    explicit DBConnection(const config::DatabaseConfig& cfg);
    ~DBConnection();

    [[nodiscard]] pqxx::connection& get() const;

    void initPrepared() const;

  private:
    std::unique_ptr<pqxx::connection> conn_;

    void initPreparedUsers() const;
    void initPreparedSuperKeys() const;
    void initPreparedKeyEntries() const;
};

} // namespace km::db
