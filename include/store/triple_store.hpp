/**
 * @file triple_store.hpp
 * @brief Partitioned, context-aware RDF triple store on PostgreSQL
 */

#pragma once

#include <config/store_config.hpp>
#include <database/postgres_connection.hpp>
#include <rdf/pattern.hpp>
#include <rdf/term.hpp>
#include <store/partition_planner.hpp>
#include <store/result_reconstructor.hpp>
#include <store/schema_manager.hpp>
#include <store/store_tables.hpp>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace RdfPg {

enum class StoreStatus {
    Valid,
    NoStore
};

/**
 * @brief A statement plus the context it is asserted (or quoted) in
 */
struct Quad {
    Triple triple;
    Graph context;
    bool quoted = false;
};

struct StoreStatistics {
    size_t type_statements = 0;
    size_t quoted_statements = 0;
    size_t asserted_statements = 0;
    size_t literal_statements = 0;
    size_t contexts = 0;

    /// Asserted statements of all three asserted partitions
    size_t total() const { return type_statements + asserted_statements + literal_statements; }
};

/**
 * @brief Lazy stream of pattern matches
 *
 * Holds the store's connection in single-row mode until exhausted or
 * destroyed; other store operations fail with QueryError meanwhile.
 * The cursor shares ownership of the connection, so it stays valid after
 * the store is closed, reopened or destroyed.
 */
class TripleCursor {
public:
    TripleCursor() = default;
    TripleCursor(TripleCursor&&) noexcept = default;
    TripleCursor& operator=(TripleCursor&& other) noexcept;
    ~TripleCursor();

    std::optional<TripleMatch> next();

    /// Drain the rest of the stream into a vector
    std::vector<TripleMatch> collect();

private:
    friend class TripleStore;
    TripleCursor(std::shared_ptr<PostgresConnection> connection, ResultStream rows);

    void release() noexcept;

    // declared first so it is destroyed after the stream that reads from it
    std::shared_ptr<PostgresConnection> connection_;
    std::unique_ptr<ResultStream> rows_;
    std::unique_ptr<ResultReconstructor> reconstructor_;
};

/**
 * @brief PostgreSQL store formula-aware implementation
 *
 * Statements live in four partitions (see PartitionPlanner): asserted
 * non rdf:type, asserted rdf:type (class membership), literal-valued and
 * quoted (formula) statements. Namespace bindings are kept in a fifth table.
 *
 * Single-threaded: one connection per store, callers serialize access.
 */
class TripleStore {
public:
    explicit TripleStore(std::string identifier);
    ~TripleStore();

    TripleStore(const TripleStore&) = delete;
    TripleStore& operator=(const TripleStore&) = delete;

    /**
     * @brief Connect, optionally create the schema, and check that it exists
     * @return NoStore when the tables are missing or the existence check fails
     * @throws ConnectionError when the backend cannot be reached
     */
    StoreStatus open(const StoreConfig& config, bool create = true);

    /// Drop the store's connection; a live TripleCursor keeps it until done
    void close();
    bool is_open() const { return db_ != nullptr; }

    bool exists();

    /**
     * @brief Create the tables, or empty them if they already exist
     * @return Number of tables that could not be cleared
     */
    size_t initialize();

    /**
     * @brief Drop every table and index of this store
     *
     * Uses the open connection, or connects with config if the store is closed.
     * @return Number of DROP statements that failed
     */
    size_t destroy(const StoreConfig& config);

    void add(const Triple& triple, const Graph& context, bool quoted = false);

    /**
     * @brief Bulk add through COPY, in one transaction
     * @return Number of quads submitted
     */
    size_t add_n(const std::vector<Quad>& quads);

    void remove(const TriplePattern& pattern, const TermPattern& context = TermPattern::any());

    TripleCursor triples(const TriplePattern& pattern, const TermPattern& context = TermPattern::any());

    /**
     * @brief Number of statements, optionally restricted to one context
     */
    size_t count(const TermPattern& context = TermPattern::any());

    /**
     * @brief Contexts of the store, or of the triples matching pattern
     */
    std::vector<Graph> contexts(const std::optional<TriplePattern>& pattern = std::nullopt);

    StoreStatistics statistics();
    std::string describe();

    void bind(const std::string& prefix, const std::string& uri);
    std::optional<std::string> prefix(const std::string& uri);
    std::optional<std::string> namespace_uri(const std::string& prefix);
    std::vector<std::pair<std::string, std::string>> namespaces();

    const std::string& identifier() const { return identifier_; }
    const StoreTables& tables() const { return tables_; }

    /**
     * @brief Partition a statement is stored in
     */
    static PartitionKind route(const Triple& triple, bool quoted);

private:
    PostgresConnection& db();
    std::pair<std::string, std::vector<std::string>> insert_statement(const Quad& quad) const;

    std::string identifier_;
    StoreTables tables_;
    PartitionPlanner planner_;
    std::shared_ptr<PostgresConnection> db_;
};

} // namespace RdfPg
