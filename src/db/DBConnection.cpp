#include "db/DBConnection.hpp"
#include "config/Config.hpp"
#include "log/Registry.hpp"

#include <fstream>
#include <stdexcept>

namespace km::db {

// Quotes a libpq keyword/value connection parameter.
static std::string quote_conninfo(const std::string& v) {
    std::string out = "'";
    for (const char c : v) {
        if (c == '\'' || c == '\\') out.push_back('\\');
        out.push_back(c);
    }
    out.push_back('\'');
    return out;
}

static std::string readPassword(const std::filesystem::path& f) {
    if (f.empty() || !std::filesystem::exists(f)) {
        log::Registry::db()->debug("[DBConnection] No password file at {}, relying on peer/trust auth", f.string());
        return {};
    }

    std::ifstream in(f);
    if (!in.is_open()) throw std::runtime_error("Failed to open database password file: " + f.string());

    std::string pass;
    std::getline(in, pass);
    return pass;
}

DBConnection::DBConnection(const config::DatabaseConfig& cfg) {
    std::string conninfo =
        "host=" + quote_conninfo(cfg.host) +
        " port=" + std::to_string(cfg.port) +
        " dbname=" + quote_conninfo(cfg.name) +
        " user=" + quote_conninfo(cfg.user);

    if (const auto password = readPassword(cfg.password_file); !password.empty())
        conninfo += " password=" + quote_conninfo(password);

    conn_ = std::make_unique<pqxx::connection>(conninfo);
    log::Registry::db()->debug("[DBConnection] Connected to {}@{}:{}/{}", cfg.user, cfg.host, cfg.port, cfg.name);
}

DBConnection::~DBConnection() { if (conn_ && conn_->is_open()) conn_->close(); }

pqxx::connection& DBConnection::get() const { return *conn_; }

void DBConnection::initPrepared() const {
    if (!conn_ || !conn_->is_open()) throw std::runtime_error("Database connection is not open");

    initPreparedUsers();
    initPreparedSuperKeys();
    initPreparedKeyEntries();
}

} // namespace km::db
