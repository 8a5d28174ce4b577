#pragma once

#include <mutex>
#include <string>
#include <vector>

#include "polystore/db/connection.hpp"
#include "polystore/record_store.hpp"

namespace polystore {

/**
 * DownstreamStore backed by one PostgreSQL table.
 *
 * Used for the relational document table and the graph node table. Record
 * ids are the table's BIGSERIAL keys. The table is created on construction
 * if missing.
 */
class PgRecordStore : public DownstreamStore {
public:
    /**
     * @param name  Store name for logs (e.g. "postgres-relational")
     * @param table Unqualified table name, [a-z_][a-z0-9_]*
     * @throws DatabaseError if the connection or schema setup fails
     */
    PgRecordStore(std::string name, const db::ConnectionConfig& config, std::string table);

    std::string name() const override { return name_; }
    std::string insert(const StoreRecord& record) override;
    bool remove(const std::string& record_id) override;
    bool exists(const std::string& record_id) const override;

    const std::string& table() const { return table_; }

    // '{"a","b"}' array literal for text[] parameters
    static std::string text_array(const std::vector<std::string>& values);
    static bool valid_identifier(const std::string& name);

private:
    void ensure_schema();

    std::string name_;
    std::string table_;
    db::Connection conn_;
    mutable std::mutex mutex_;
};

} // namespace polystore
