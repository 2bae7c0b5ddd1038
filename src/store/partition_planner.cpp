#include <store/partition_planner.hpp>
#include <store/clause_builder.hpp>
#include <rdf/term.hpp>
#include <utility>

namespace RdfPg {

namespace {

std::string with_where(const std::string& sql, const std::string& where) {
    return where.empty() ? sql : sql + " " + where;
}

std::string select_list(const PartitionSelect& s, SelectMode mode) {
    const std::string& a = s.alias;

    if (mode == SelectMode::Count) {
        return std::string("SELECT '") + partition_name(s.kind) + "' AS part, COUNT(*) AS statements";
    }
    if (mode == SelectMode::Contexts) {
        return "SELECT " + a + ".context";
    }

    switch (s.kind) {
        case PartitionKind::AssertedType:
            return "SELECT " + a + ".member AS subject, '" + RDF_TYPE + "' AS predicate, " +
                   a + ".klass AS object, " + a + ".context AS context, " +
                   a + ".termComb AS termComb, NULL AS objLanguage, NULL AS objDatatype";
        case PartitionKind::AssertedNonType:
            return "SELECT " + a + ".*, NULL AS objLanguage, NULL AS objDatatype";
        case PartitionKind::Literal:
        case PartitionKind::Quoted:
            return "SELECT " + a + ".*";
    }
    return "SELECT " + a + ".*";
}

// Identity of a triple for distinct counts: (s, p, o) text, the s/p/o kind
// digits of termComb, and the literal's language and datatype
std::string key_select(const PartitionSelect& s) {
    const std::string& a = s.alias;
    std::string cols;

    switch (s.kind) {
        case PartitionKind::AssertedType:
            cols = a + ".member AS subject, '" + RDF_TYPE + "' AS predicate, " + a + ".klass AS object, " +
                   a + ".termComb / 5 AS kinds, NULL AS objLanguage, NULL AS objDatatype";
            break;
        case PartitionKind::AssertedNonType:
            cols = a + ".subject, " + a + ".predicate, " + a + ".object, " +
                   a + ".termComb / 5 AS kinds, NULL AS objLanguage, NULL AS objDatatype";
            break;
        case PartitionKind::Literal:
        case PartitionKind::Quoted:
            cols = a + ".subject, " + a + ".predicate, " + a + ".object, " +
                   a + ".termComb / 5 AS kinds, " + a + ".objLanguage, " + a + ".objDatatype";
            break;
    }
    return with_where("SELECT " + cols + " FROM " + s.table + " AS " + a, s.where);
}

bool may_be_type(const TermPattern& predicate) {
    switch (predicate.kind()) {
        case TermPattern::Kind::Any:
            return true;
        case TermPattern::Kind::Regex:
            return predicate.may_match(RDF_TYPE);
        case TermPattern::Kind::Alternatives:
            for (const auto& alt : predicate.alternatives()) {
                if (alt.is_uri(RDF_TYPE) || may_be_type(alt)) return true;
            }
            return false;
        default:
            return false;
    }
}

} // namespace

PartitionPlanner::PartitionPlanner(StoreTables tables) : tables_(std::move(tables)) {}

std::vector<PartitionKind> PartitionPlanner::relevant_partitions(const TriplePattern& pattern, bool context_given) {
    std::vector<PartitionKind> kinds;
    const TermPattern& predicate = pattern.predicate;
    const TermPattern& object = pattern.object;

    if (predicate.is_uri(RDF_TYPE)) {
        kinds.push_back(PartitionKind::AssertedType);
    } else {
        if (object.may_be_literal()) kinds.push_back(PartitionKind::Literal);
        if (object.may_be_non_literal()) kinds.push_back(PartitionKind::AssertedNonType);
        if (may_be_type(predicate)) kinds.push_back(PartitionKind::AssertedType);
    }

    if (context_given) kinds.push_back(PartitionKind::Quoted);
    return kinds;
}

std::string PartitionPlanner::union_select(const std::vector<PartitionSelect>& selects, bool distinct, SelectMode mode) {
    std::string sql;
    const char* glue = distinct ? " UNION " : " UNION ALL ";

    for (size_t i = 0; i < selects.size(); ++i) {
        const auto& s = selects[i];
        if (i) sql += glue;
        sql += with_where(select_list(s, mode) + " FROM " + s.table + " AS " + s.alias, s.where);
    }

    if (mode == SelectMode::Triples && !sql.empty()) {
        sql += ORDER_BY;
    }
    return sql;
}

QueryPlan PartitionPlanner::triples(const TriplePattern& pattern, const TermPattern& context) const {
    QueryPlan plan;
    plan.partitions = relevant_partitions(pattern, !context.is_any());

    ClauseBuilder clauses;
    std::vector<PartitionSelect> selects;
    for (PartitionKind kind : plan.partitions) {
        const char* alias = StoreTables::alias(kind);
        selects.push_back({tables_.table(kind), alias, clauses.where(kind, alias, pattern, context), kind});
    }

    plan.sql = union_select(selects, false, SelectMode::Triples);
    plan.params = clauses.take_parameters();
    return plan;
}

QueryPlan PartitionPlanner::count(const TermPattern& context) const {
    QueryPlan plan;
    ClauseBuilder clauses;
    std::vector<PartitionSelect> selects;

    if (context.is_any()) {
        plan.partitions = {PartitionKind::AssertedType, PartitionKind::AssertedNonType, PartitionKind::Literal};
    } else {
        plan.partitions = {PartitionKind::AssertedType, PartitionKind::Quoted,
                           PartitionKind::AssertedNonType, PartitionKind::Literal};
    }

    for (PartitionKind kind : plan.partitions) {
        const char* alias = StoreTables::alias(kind);
        std::string where;
        std::string ctx = clauses.column("context", context, alias);
        if (!ctx.empty()) where = "WHERE " + ctx;
        selects.push_back({tables_.table(kind), alias, where, kind});
    }

    if (context.is_any()) {
        plan.sql = union_select(selects, false, SelectMode::Count);
    } else {
        // a triple counts once even if it shows up in more than one partition
        std::string inner;
        for (size_t i = 0; i < selects.size(); ++i) {
            if (i) inner += " UNION ";
            inner += key_select(selects[i]);
        }
        plan.sql = "SELECT 'all' AS part, COUNT(*) AS statements FROM (" + inner + ") AS matched";
    }

    plan.params = clauses.take_parameters();
    return plan;
}

QueryPlan PartitionPlanner::contexts(const std::optional<TriplePattern>& pattern) const {
    QueryPlan plan;
    ClauseBuilder clauses;
    std::vector<PartitionSelect> selects;

    if (pattern) {
        plan.partitions = relevant_partitions(*pattern, false);
    } else {
        plan.partitions = {PartitionKind::AssertedType, PartitionKind::AssertedNonType, PartitionKind::Literal};
    }

    for (PartitionKind kind : plan.partitions) {
        const char* alias = StoreTables::alias(kind);
        std::string where = pattern ? clauses.where(kind, alias, *pattern, TermPattern::any()) : "";
        selects.push_back({tables_.table(kind), alias, where, kind});
    }

    plan.sql = union_select(selects, true, SelectMode::Contexts);
    plan.params = clauses.take_parameters();
    return plan;
}

QueryPlan PartitionPlanner::partition_counts() const {
    QueryPlan plan;
    plan.partitions = {PartitionKind::AssertedType, PartitionKind::Quoted,
                       PartitionKind::AssertedNonType, PartitionKind::Literal};

    std::vector<PartitionSelect> selects;
    for (PartitionKind kind : plan.partitions) {
        selects.push_back({tables_.table(kind), StoreTables::alias(kind), "", kind});
    }

    plan.sql = union_select(selects, false, SelectMode::Count);
    return plan;
}

std::vector<QueryPlan> PartitionPlanner::deletions(const TriplePattern& pattern, const TermPattern& context) const {
    std::vector<QueryPlan> plans;

    for (PartitionKind kind : relevant_partitions(pattern, !context.is_any())) {
        ClauseBuilder clauses;
        const char* alias = StoreTables::alias(kind);

        QueryPlan plan;
        plan.partitions = {kind};
        plan.sql = with_where("DELETE FROM " + tables_.table(kind) + " AS " + alias,
                              clauses.where(kind, alias, pattern, context));
        plan.params = clauses.take_parameters();
        plans.push_back(std::move(plan));
    }
    return plans;
}

} // namespace RdfPg
