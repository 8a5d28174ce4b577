#include "polystore/stores/pg_record_store.hpp"

#include <cctype>

#include "polystore/error.hpp"
#include "polystore/logging.hpp"

namespace polystore {

namespace {

bool is_record_id(const std::string& id) {
    if (id.empty() || id.size() > 18) return false;
    for (char c : id) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

} // anonymous namespace

PgRecordStore::PgRecordStore(std::string name, const db::ConnectionConfig& config, std::string table)
    : name_(std::move(name)), table_(std::move(table)), conn_(config) {
    POLYSTORE_CHECK_ARGUMENT(valid_identifier(table_), "invalid table name '" + table_ + "'");

    if (!conn_.ok()) {
        throw DatabaseError(std::string("Connection failed: ") + conn_.error(), name_,
                            "Check PS_DB_HOST / PS_DB_PORT / PS_DB_NAME / PS_DB_USER");
    }
    ensure_schema();
    LOG_INFO("Store ", name_, " ready on table ", table_);
}

bool PgRecordStore::valid_identifier(const std::string& name) {
    if (name.empty() || name.size() > 63) return false;
    if (!(std::islower(static_cast<unsigned char>(name[0])) || name[0] == '_')) return false;
    for (char c : name) {
        if (!(std::islower(static_cast<unsigned char>(c)) ||
              std::isdigit(static_cast<unsigned char>(c)) || c == '_')) {
            return false;
        }
    }
    return true;
}

std::string PgRecordStore::text_array(const std::vector<std::string>& values) {
    std::string out = "{";
    for (size_t i = 0; i < values.size(); ++i) {
        if (i) out += ',';
        out += '"';
        for (char c : values[i]) {
            if (c == '"' || c == '\\') out += '\\';
            out += c;
        }
        out += '"';
    }
    out += '}';
    return out;
}

void PgRecordStore::ensure_schema() {
    const std::string ddl =
        "CREATE TABLE IF NOT EXISTS " + table_ + " ("
        "  record_id BIGSERIAL PRIMARY KEY,"
        "  document_id TEXT NOT NULL,"
        "  saga_id TEXT NOT NULL,"
        "  source TEXT,"
        "  content_digest BYTEA NOT NULL,"
        "  size_bytes BIGINT NOT NULL,"
        "  chunk_count BIGINT NOT NULL,"
        "  chunk_refs TEXT[] NOT NULL DEFAULT '{}',"
        "  metadata JSONB NOT NULL DEFAULT '{}'::jsonb,"
        "  created_at TIMESTAMPTZ NOT NULL DEFAULT now()"
        ")";

    std::lock_guard<std::mutex> lock(mutex_);
    db::Result res(PQexec(conn_, ddl.c_str()));
    if (res.status() != PGRES_COMMAND_OK) {
        throw DatabaseError(std::string("Schema setup failed: ") + PQerrorMessage(conn_), table_);
    }
}

std::string PgRecordStore::insert(const StoreRecord& record) {
    std::vector<std::string> meta_keys, meta_values;
    for (const auto& [k, v] : record.metadata) {
        meta_keys.push_back(k);
        meta_values.push_back(v);
    }

    const std::string digest = "\\x" + record.content_digest.to_hex();
    const std::string size = std::to_string(record.size_bytes);
    const std::string chunks = std::to_string(record.chunk_count);
    const std::string refs = text_array(record.chunk_refs);
    const std::string keys = text_array(meta_keys);
    const std::string values = text_array(meta_values);

    const char* params[9] = {
        record.document_id.c_str(), record.saga_id.c_str(), record.source.c_str(),
        digest.c_str(), size.c_str(), chunks.c_str(), refs.c_str(),
        keys.c_str(), values.c_str()
    };

    const std::string sql =
        "INSERT INTO " + table_ +
        " (document_id, saga_id, source, content_digest, size_bytes, chunk_count, chunk_refs, metadata)"
        " VALUES ($1, $2, $3, $4::bytea, $5::bigint, $6::bigint, $7::text[],"
        " jsonb_object($8::text[], $9::text[]))"
        " RETURNING record_id";

    std::lock_guard<std::mutex> lock(mutex_);
    try {
        db::Transaction tx(conn_);
        db::Result res(PQexecParams(conn_, sql.c_str(), 9, nullptr, params, nullptr, nullptr, 0));
        if (res.status() != PGRES_TUPLES_OK || res.rows() != 1) {
            throw StoreError(std::string("Insert failed: ") + PQerrorMessage(conn_), name_);
        }
        std::string id = res.get_string(0, 0);
        tx.commit();
        return id;
    } catch (const DatabaseError& e) {
        throw StoreError(e.message(), name_);
    }
}

bool PgRecordStore::remove(const std::string& record_id) {
    if (!is_record_id(record_id)) {
        LOG_WARN("Store ", name_, ": ignoring malformed record id '", record_id, "'");
        return false;
    }

    const std::string sql = "DELETE FROM " + table_ + " WHERE record_id = $1::bigint";
    const char* params[1] = {record_id.c_str()};

    std::lock_guard<std::mutex> lock(mutex_);
    db::Result res(PQexecParams(conn_, sql.c_str(), 1, nullptr, params, nullptr, nullptr, 0));
    if (res.status() != PGRES_COMMAND_OK) {
        LOG_ERROR("Store ", name_, ": delete of ", record_id, " failed: ", PQerrorMessage(conn_));
        return false;
    }
    return true;
}

bool PgRecordStore::exists(const std::string& record_id) const {
    if (!is_record_id(record_id)) return false;

    const std::string sql = "SELECT 1 FROM " + table_ + " WHERE record_id = $1::bigint";
    const char* params[1] = {record_id.c_str()};

    std::lock_guard<std::mutex> lock(mutex_);
    db::Result res(PQexecParams(conn_, sql.c_str(), 1, nullptr, params, nullptr, nullptr, 0));
    if (res.status() != PGRES_TUPLES_OK) {
        throw StoreError(std::string("Lookup failed: ") + PQerrorMessage(conn_), name_);
    }
    return res.rows() > 0;
}

} // namespace polystore
