/**
 * @file partition_planner.hpp
 * @brief Partition selection and UNION query construction
 */

#pragma once

#include <rdf/pattern.hpp>
#include <store/store_tables.hpp>
#include <optional>
#include <string>
#include <vector>

namespace RdfPg {

enum class SelectMode {
    Triples,   // full 7-column rows, ordered for grouping
    Count,     // one (partition, COUNT(*)) row per partition
    Contexts   // context column only
};

/**
 * @brief One partition's contribution to a UNION query
 */
struct PartitionSelect {
    std::string table;
    std::string alias;
    std::string where;
    PartitionKind kind;
};

/**
 * @brief SQL text plus its bound parameters
 *
 * An empty plan (no SQL) means no partition can match; callers return an
 * empty result without querying.
 */
struct QueryPlan {
    std::string sql;
    std::vector<std::string> params;
    std::vector<PartitionKind> partitions;

    bool empty() const { return sql.empty(); }
};

/**
 * @brief Decides which partitions a pattern touches and builds the query
 *
 * Selection rules, for pattern (s, p, o) and optional context:
 * 1. p is exactly rdf:type: type partition only.
 * 2. p is a wildcard or a regex matching rdf:type: literal (if o may be a
 *    literal), asserted (if o may be a non-literal) and type.
 * 3. otherwise: literal and asserted under the same object filter.
 * 4. an explicit context adds the quoted partition.
 *
 * Full-row queries are always terminated by ORDER_BY; ResultReconstructor
 * relies on it to group a triple's contexts. termComb is the last key: its
 * leading base-5 digits are the subject, predicate and object kinds, so a
 * URI and a literal with the same text never interleave.
 */
class PartitionPlanner {
public:
    static constexpr const char* ORDER_BY = " ORDER BY subject, predicate, object, objLanguage, objDatatype, termComb";

    explicit PartitionPlanner(StoreTables tables);

    const StoreTables& tables() const { return tables_; }

    /**
     * @brief Partitions relevant to a pattern, in UNION order (literal, asserted, type, quoted)
     */
    static std::vector<PartitionKind> relevant_partitions(const TriplePattern& pattern, bool context_given);

    /**
     * @brief Full-row UNION ALL query for triple retrieval
     */
    QueryPlan triples(const TriplePattern& pattern, const TermPattern& context) const;

    /**
     * @brief Statement count; rows are (partition, count) and must be summed
     *
     * Without a context: type + asserted + literal rows. With a context the
     * quoted partition joins and a single row counts distinct triples.
     */
    QueryPlan count(const TermPattern& context) const;

    /**
     * @brief Distinct contexts, optionally of the triples matching a pattern
     *
     * The quoted partition never participates.
     */
    QueryPlan contexts(const std::optional<TriplePattern>& pattern) const;

    /**
     * @brief (partition, count) for type, quoted, asserted and literal
     */
    QueryPlan partition_counts() const;

    /**
     * @brief One DELETE per relevant partition, each with its own parameters
     */
    std::vector<QueryPlan> deletions(const TriplePattern& pattern, const TermPattern& context) const;

    /**
     * @brief Join per-partition selects with UNION (distinct) or UNION ALL
     */
    static std::string union_select(const std::vector<PartitionSelect>& selects, bool distinct, SelectMode mode);

private:
    StoreTables tables_;
};

} // namespace RdfPg
