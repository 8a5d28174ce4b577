#pragma once

#include <cstdlib>
#include <string>
#include <libpq-fe.h>

#include "polystore/config.hpp"
#include "polystore/error.hpp"

namespace polystore::db {

// Database connection configuration
struct ConnectionConfig {
    std::string dbname;
    std::string host;
    std::string port;
    std::string user;
    std::string password;

    ConnectionConfig() {
        // Read from PS_DB_* env vars with defaults
        auto get_env = [](const char* name, const char* def) -> std::string {
            const char* val = std::getenv(name);
            return val ? val : def;
        };
        dbname = get_env("PS_DB_NAME", "polystore");
        host = get_env("PS_DB_HOST", "localhost");
        port = get_env("PS_DB_PORT", "5432");
        user = get_env("PS_DB_USER", "postgres");
        password = get_env("PS_DB_PASS", "");
    }

    // db.* keys of a loaded Config
    static ConnectionConfig from_config(const Config& config) {
        ConnectionConfig c;
        c.dbname = config.get<std::string>("db.name", c.dbname);
        c.host = config.get<std::string>("db.host", c.host);
        c.port = config.get<std::string>("db.port", c.port);
        c.user = config.get<std::string>("db.user", c.user);
        c.password = config.get<std::string>("db.password", c.password);
        return c;
    }

    // Build libpq connection string
    std::string to_conninfo() const {
        std::string conninfo = "dbname=" + dbname;
        if (!host.empty()) conninfo += " host=" + host;
        if (!port.empty()) conninfo += " port=" + port;
        if (!user.empty()) conninfo += " user=" + user;
        if (!password.empty()) conninfo += " password=" + password;
        return conninfo;
    }

    // Parse from command line args (modifies index)
    // Returns false if unknown arg
    bool parse_arg(int argc, char** argv, int& i) {
        std::string arg = argv[i];
        if ((arg == "-d" || arg == "--dbname") && i + 1 < argc) {
            dbname = argv[++i];
            return true;
        }
        if ((arg == "-h" || arg == "--host") && i + 1 < argc) {
            host = argv[++i];
            return true;
        }
        if ((arg == "-p" || arg == "--port") && i + 1 < argc) {
            port = argv[++i];
            return true;
        }
        if ((arg == "-U" || arg == "--user") && i + 1 < argc) {
            user = argv[++i];
            return true;
        }
        if ((arg == "-W" || arg == "--password") && i + 1 < argc) {
            password = argv[++i];
            return true;
        }
        return false;
    }
};

// RAII wrapper for PGconn
class Connection {
public:
    Connection() : conn_(nullptr) {}

    explicit Connection(const std::string& conninfo) {
        conn_ = PQconnectdb(conninfo.c_str());
    }

    explicit Connection(const ConnectionConfig& config)
        : Connection(config.to_conninfo()) {}

    ~Connection() {
        if (conn_) {
            PQfinish(conn_);
        }
    }

    // Move only
    Connection(Connection&& other) noexcept : conn_(other.conn_) {
        other.conn_ = nullptr;
    }

    Connection& operator=(Connection&& other) noexcept {
        if (this != &other) {
            if (conn_) PQfinish(conn_);
            conn_ = other.conn_;
            other.conn_ = nullptr;
        }
        return *this;
    }

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    PGconn* get() const { return conn_; }
    operator PGconn*() const { return conn_; }

    bool ok() const {
        return conn_ && PQstatus(conn_) == CONNECTION_OK;
    }

    const char* error() const {
        return conn_ ? PQerrorMessage(conn_) : "No connection";
    }

private:
    PGconn* conn_;
};

// RAII wrapper for PGresult
class Result {
public:
    explicit Result(PGresult* res) : res_(res) {}
    ~Result() { if (res_) PQclear(res_); }

    Result(const Result&) = delete;
    Result& operator=(const Result&) = delete;

    PGresult* get() const { return res_; }
    ExecStatusType status() const { return PQresultStatus(res_); }
    bool ok() const {
        auto s = status();
        return s == PGRES_COMMAND_OK || s == PGRES_TUPLES_OK;
    }
    int rows() const { return res_ ? PQntuples(res_) : 0; }

    // Empty string if null or out of bounds
    std::string get_string(int row, int col) const {
        if (!res_ || row >= PQntuples(res_) || col >= PQnfields(res_)) return {};
        if (PQgetisnull(res_, row, col)) return {};
        const char* val = PQgetvalue(res_, row, col);
        return val ? val : "";
    }

private:
    PGresult* res_;
};

/**
 * RAII transaction wrapper. Rolls back unless commit() was called.
 *
 * @throws DatabaseError if BEGIN or COMMIT fails
 */
class Transaction {
public:
    explicit Transaction(PGconn* conn) : conn_(conn), done_(false) {
        Result res(PQexec(conn_, "BEGIN"));
        if (res.status() != PGRES_COMMAND_OK) {
            done_ = true;
            throw DatabaseError(std::string("BEGIN failed: ") + PQerrorMessage(conn_));
        }
    }

    ~Transaction() {
        if (!done_) {
            Result res(PQexec(conn_, "ROLLBACK"));
        }
    }

    void commit() {
        if (done_) return;
        done_ = true;
        Result res(PQexec(conn_, "COMMIT"));
        if (res.status() != PGRES_COMMAND_OK) {
            throw DatabaseError(std::string("COMMIT failed: ") + PQerrorMessage(conn_));
        }
    }

    void rollback() {
        if (done_) return;
        done_ = true;
        Result res(PQexec(conn_, "ROLLBACK"));
    }

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

private:
    PGconn* conn_;
    bool done_;
};

// Execute query and check result
inline bool exec_ok(PGconn* conn, const char* query) {
    Result res(PQexec(conn, query));
    return res.ok();
}

} // namespace polystore::db
