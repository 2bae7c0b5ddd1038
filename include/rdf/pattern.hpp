/**
 * @file pattern.hpp
 * @brief Per-position match values for triple pattern queries
 */

#pragma once

#include <rdf/term.hpp>
#include <string>
#include <vector>

namespace RdfPg {

/**
 * @brief What one triple position (or the context) must match
 *
 * - Any: wildcard, no constraint
 * - Exact: equal to a term (a Graph converts to its identifier)
 * - Regex: PostgreSQL regular expression over the stored text
 * - Null: the column IS NULL
 * - Alternatives: any of a list of Exact/Regex/Null patterns
 */
class TermPattern {
public:
    enum class Kind {
        Any,
        Exact,
        Regex,
        Null,
        Alternatives
    };

    TermPattern() = default;
    TermPattern(Term term) : kind_(Kind::Exact), term_(std::move(term)) {}
    TermPattern(const Graph& graph) : kind_(Kind::Exact), term_(graph.identifier) {}

    static TermPattern any() { return {}; }
    static TermPattern regex(std::string expression);
    static TermPattern null();
    static TermPattern one_of(std::vector<TermPattern> alternatives);

    Kind kind() const { return kind_; }
    bool is_any() const { return kind_ == Kind::Any; }

    const Term& term() const { return term_; }
    const std::string& expression() const { return expression_; }
    const std::vector<TermPattern>& alternatives() const { return alternatives_; }

    /// Exact URI equal to uri
    bool is_uri(const std::string& uri) const;

    /**
     * @brief Whether a regex pattern can match text
     *
     * Uses search semantics like PostgreSQL's ~ operator. An expression
     * std::regex cannot compile counts as a possible match.
     */
    bool may_match(const std::string& text) const;

    /// Could this pattern select a row whose object is a literal
    bool may_be_literal() const;

    /// Could this pattern select a row whose object is not a literal
    bool may_be_non_literal() const;

private:
    Kind kind_ = Kind::Any;
    Term term_;
    std::string expression_;
    std::vector<TermPattern> alternatives_;
};

struct TriplePattern {
    TermPattern subject;
    TermPattern predicate;
    TermPattern object;

    static TriplePattern any() { return {}; }
    static TriplePattern of(const Triple& t) { return {t.subject, t.predicate, t.object}; }
};

} // namespace RdfPg
