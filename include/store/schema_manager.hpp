/**
 * @file schema_manager.hpp
 * @brief DDL for the statement partitions and namespace bindings
 */

#pragma once

#include <database/postgres_connection.hpp>
#include <store/store_tables.hpp>
#include <string>
#include <vector>

namespace RdfPg {

struct IndexSpec {
    std::string name;
    std::vector<std::string> columns;
};

struct TableSpec {
    std::string name;
    std::string create_sql;
    std::vector<IndexSpec> indices;
};

/**
 * @brief Creates, clears and drops the tables of one logical store
 *
 * Clearing and dropping are best-effort: each statement runs under its own
 * savepoint, failures are logged and counted, and the loop carries on.
 */
class SchemaManager {
public:
    SchemaManager(PostgresConnection& db, StoreTables tables, std::string identifier);

    /**
     * @brief Tables in creation order with their fixed index sets
     */
    static std::vector<TableSpec> table_specs(const StoreTables& tables);

    /**
     * @brief True when all five tables of the prefix are present in pg_class
     */
    bool exists();

    /**
     * @brief Create the schema, or delete every row if it already exists
     * @return Number of tables that could not be cleared (0 on the create path)
     */
    size_t initialize();

    /**
     * @brief Drop every table and index of the store
     * @return Number of DROP statements that failed
     */
    size_t destroy();

private:
    void create();
    size_t clear();

    PostgresConnection& db_;
    StoreTables tables_;
    std::string identifier_;
};

} // namespace RdfPg
