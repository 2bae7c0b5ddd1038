/**
 * @file result_reconstructor.hpp
 * @brief Folds ordered UNION rows into triples with their contexts
 */

#pragma once

#include <database/postgres_connection.hpp>
#include <rdf/term.hpp>
#include <optional>
#include <vector>

namespace RdfPg {

/**
 * @brief One matched triple and every context it is asserted in
 */
struct TripleMatch {
    Triple triple;
    std::vector<Graph> contexts;
};

/**
 * @brief Groups consecutive rows that carry the same triple
 *
 * Input rows are (subject, predicate, object, context, termComb,
 * objLanguage, objDatatype) sorted by PartitionPlanner::ORDER_BY. Rows of
 * one triple must be adjacent; an unsorted source yields the same triple
 * more than once. Single pass, not restartable.
 */
class ResultReconstructor {
public:
    explicit ResultReconstructor(RowSource& rows);

    /**
     * @brief Next triple and its contexts, or nullopt when the rows run out
     * @throws std::runtime_error on a short row or a bad termComb
     */
    std::optional<TripleMatch> next();

    struct DecodedRow {
        Triple triple;
        Graph context;
    };

    static DecodedRow decode(const Row& row);

private:
    bool fetch();

    RowSource& rows_;
    Row row_;
    std::optional<DecodedRow> pending_;
    bool exhausted_ = false;
};

} // namespace RdfPg
