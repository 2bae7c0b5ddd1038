/**
 * @file term.hpp
 * @brief RDF terms, triples, graphs and the termComb column encoding
 */

#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <utility>

namespace RdfPg {

inline constexpr const char* RDF_TYPE = "http://www.w3.org/1999/02/22-rdf-syntax-ns#type";

/**
 * @brief Kind of an RDF term; the numeric value is its termComb digit
 */
enum class TermKind : uint8_t {
    URI = 0,
    BNode = 1,
    Literal = 2,
    Formula = 3,
    Variable = 4
};

/**
 * @brief A URI, blank node, literal, formula (quoted graph) or variable
 *
 * value holds the lexical text stored in the database. language and
 * datatype are only meaningful for literals and are empty when absent.
 */
struct Term {
    TermKind kind = TermKind::URI;
    std::string value;
    std::string language;
    std::string datatype;

    static Term uri(std::string value) { return {TermKind::URI, std::move(value), {}, {}}; }
    static Term bnode(std::string id) { return {TermKind::BNode, std::move(id), {}, {}}; }
    static Term formula(std::string id) { return {TermKind::Formula, std::move(id), {}, {}}; }
    static Term variable(std::string name) { return {TermKind::Variable, std::move(name), {}, {}}; }
    static Term literal(std::string value, std::string language = {}, std::string datatype = {}) {
        return {TermKind::Literal, std::move(value), std::move(language), std::move(datatype)};
    }

    bool is_literal() const { return kind == TermKind::Literal; }

    bool operator==(const Term& o) const {
        return kind == o.kind && value == o.value && language == o.language && datatype == o.datatype;
    }
    bool operator!=(const Term& o) const { return !(*this == o); }

    /**
     * @brief N-Triples style rendering (<uri>, _:id, "lit"@en, "lit"^^<dt>, {id}, ?v)
     */
    std::string to_string() const;
};

struct Triple {
    Term subject;
    Term predicate;
    Term object;

    bool operator==(const Triple& o) const {
        return subject == o.subject && predicate == o.predicate && object == o.object;
    }
    bool operator!=(const Triple& o) const { return !(*this == o); }

    std::string to_string() const;
};

/**
 * @brief A context: the named graph (or formula) a statement is asserted in
 */
struct Graph {
    Term identifier;

    static Graph named(std::string uri) { return {Term::uri(std::move(uri))}; }
    static Graph quoted(std::string id) { return {Term::formula(std::move(id))}; }

    bool is_formula() const { return identifier.kind == TermKind::Formula; }

    bool operator==(const Graph& o) const { return identifier == o.identifier; }
    bool operator!=(const Graph& o) const { return !(*this == o); }
};

/**
 * @brief termComb: term kinds of (subject, predicate, object, context) packed
 * as base-5 digits, s*125 + p*25 + o*5 + c. Always fits a smallint.
 */
namespace TermComb {

inline constexpr int COMBINATIONS = 625;

int encode(TermKind subject, TermKind predicate, TermKind object, TermKind context);

/**
 * @throws std::runtime_error when value is outside [0, 625)
 */
std::array<TermKind, 4> decode(int value);

} // namespace TermComb

} // namespace RdfPg
