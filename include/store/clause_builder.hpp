/**
 * @file clause_builder.hpp
 * @brief SQL boolean fragments for triple pattern components
 */

#pragma once

#include <rdf/pattern.hpp>
#include <store/store_tables.hpp>
#include <string>
#include <vector>

namespace RdfPg {

/**
 * @brief Builds WHERE fragments and collects their bound parameters
 *
 * Placeholders are numbered $1, $2, ... in the order values are bound, so
 * one builder serves every partition of a single statement. Use a fresh
 * builder per statement.
 */
class ClauseBuilder {
public:
    /**
     * @brief Fragment for one column
     *
     * Any -> "" (no constraint), Exact -> "col = $n", Regex -> "col ~ $n",
     * Null -> "col IS NULL", Alternatives -> "(f1 OR f2 ...)".
     */
    std::string column(const std::string& column, const TermPattern& value, const std::string& alias = "");

    /**
     * @brief Full "WHERE ..." clause for one partition, or "" when unconstrained
     *
     * The type partition matches subject against member and object against
     * klass. A regex or alternatives predicate is tested against the
     * rdf:type URI on the server, so the planner's client-side regex check
     * only prunes partitions.
     */
    std::string where(PartitionKind kind, const std::string& alias,
                      const TriplePattern& pattern, const TermPattern& context);

    const std::vector<std::string>& parameters() const { return params_; }
    std::vector<std::string> take_parameters() { return std::move(params_); }

private:
    std::string bind(const std::string& value);
    std::string fragment(const std::string& lhs, const TermPattern& value);

    std::vector<std::string> params_;
};

} // namespace RdfPg
