/**
 * @file schema_manager.cpp
 * @brief Partition table DDL and lifecycle
 */

#include <store/schema_manager.hpp>
#include <utils/logger.hpp>
#include <utility>

namespace RdfPg {

SchemaManager::SchemaManager(PostgresConnection& db, StoreTables tables, std::string identifier)
    : db_(db), tables_(std::move(tables)), identifier_(std::move(identifier)) {}

std::vector<TableSpec> SchemaManager::table_specs(const StoreTables& t) {
    const std::string& p = t.prefix;

    return {
        {
            t.asserted,
            "CREATE TABLE " + t.asserted + " ("
            "subject text not NULL, "
            "predicate text not NULL, "
            "object text not NULL, "
            "context text not NULL, "
            "termComb smallint not NULL)",
            {
                {p + "_A_termComb_index", {"termComb"}},
                {p + "_A_s_index", {"subject"}},
                {p + "_A_p_index", {"predicate"}},
                {p + "_A_o_index", {"object"}},
                {p + "_A_c_index", {"context"}},
            }
        },
        {
            t.type,
            "CREATE TABLE " + t.type + " ("
            "member text not NULL, "
            "klass text not NULL, "
            "context text not NULL, "
            "termComb smallint not NULL)",
            {
                {p + "_T_termComb_index", {"termComb"}},
                {p + "_member_index", {"member"}},
                {p + "_klass_index", {"klass"}},
                {p + "_c_index", {"context"}},
            }
        },
        {
            t.quoted,
            "CREATE TABLE " + t.quoted + " ("
            "subject text not NULL, "
            "predicate text not NULL, "
            "object text, "
            "context text not NULL, "
            "termComb smallint not NULL, "
            "objLanguage varchar(3), "
            "objDatatype text)",
            {
                {p + "_Q_termComb_index", {"termComb"}},
                {p + "_Q_s_index", {"subject"}},
                {p + "_Q_p_index", {"predicate"}},
                {p + "_Q_o_index", {"object"}},
                {p + "_Q_c_index", {"context"}},
            }
        },
        {
            t.namespaces,
            "CREATE TABLE " + t.namespaces + " ("
            "prefix varchar(20) UNIQUE not NULL, "
            "uri text, "
            "PRIMARY KEY (prefix))",
            {
                {p + "_uri_index", {"uri"}},
            }
        },
        {
            t.literal,
            "CREATE TABLE " + t.literal + " ("
            "subject text not NULL, "
            "predicate text not NULL, "
            "object text, "
            "context text not NULL, "
            "termComb smallint not NULL, "
            "objLanguage varchar(3), "
            "objDatatype text)",
            {
                {p + "_L_termComb_index", {"termComb"}},
                {p + "_L_s_index", {"subject"}},
                {p + "_L_p_index", {"predicate"}},
                {p + "_L_c_index", {"context"}},
            }
        },
    };
}

bool SchemaManager::exists() {
    std::vector<std::string> names = tables_.all();

    auto found = db_.query_single(
        "SELECT COUNT(*) FROM pg_class "
        "WHERE relkind = 'r' AND pg_table_is_visible(oid) "
        "AND relname IN ($1, $2, $3, $4, $5)",
        names
    );

    return found && std::stoul(*found) == names.size();
}

size_t SchemaManager::initialize() {
    if (!exists()) {
        create();
        return 0;
    }
    return clear();
}

void SchemaManager::create() {
    PostgresConnection::Transaction tx(db_);
    auto specs = table_specs(tables_);

    for (const auto& spec : specs) {
        db_.execute(spec.create_sql);
    }

    for (const auto& spec : specs) {
        db_.execute("COMMENT ON TABLE " + spec.name + " IS " +
                    db_.quote_literal("identifier: " + identifier_));
    }

    for (const auto& spec : specs) {
        for (const auto& index : spec.indices) {
            std::string columns;
            for (size_t i = 0; i < index.columns.size(); ++i) {
                if (i) columns += ", ";
                columns += index.columns[i];
            }
            db_.execute("CREATE INDEX " + index.name + " ON " + spec.name + " (" + columns + ")");
        }
    }

    tx.commit();
    Logger::info("Created store '" + identifier_ + "' (" + tables_.prefix + ")");
}

size_t SchemaManager::clear() {
    PostgresConnection::Transaction tx(db_);
    size_t failures = 0;

    for (const auto& name : tables_.all()) {
        std::string error;
        if (!tx.try_execute("DELETE FROM " + name, &error)) {
            Logger::warn("unable to clear table: " + name + " (" + error + ")");
            ++failures;
        }
    }

    tx.commit();
    Logger::debug("Cleared store '" + identifier_ + "' with " + std::to_string(failures) + " failures");
    return failures;
}

size_t SchemaManager::destroy() {
    PostgresConnection::Transaction tx(db_);
    size_t failures = 0;
    auto specs = table_specs(tables_);

    for (const auto& spec : specs) {
        std::string error;
        if (!tx.try_execute("DROP TABLE IF EXISTS " + spec.name + " CASCADE", &error)) {
            Logger::warn("unable to drop table: " + spec.name + " (" + error + ")");
            ++failures;
        }
    }

    for (const auto& spec : specs) {
        for (const auto& index : spec.indices) {
            std::string error;
            if (!tx.try_execute("DROP INDEX IF EXISTS " + index.name + " CASCADE", &error)) {
                Logger::warn("unable to drop index: " + index.name + " (" + error + ")");
                ++failures;
            }
        }
    }

    tx.commit();
    Logger::info("Destroyed store '" + identifier_ + "' (" + tables_.prefix + "), " +
                 std::to_string(failures) + " failed statements");
    return failures;
}

} // namespace RdfPg
