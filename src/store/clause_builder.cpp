#include <store/clause_builder.hpp>

namespace RdfPg {

namespace {

std::string join(const std::vector<std::string>& parts, const char* sep) {
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i) out += sep;
        out += parts[i];
    }
    return out;
}

} // namespace

std::string ClauseBuilder::bind(const std::string& value) {
    params_.push_back(value);
    return "$" + std::to_string(params_.size());
}

std::string ClauseBuilder::column(const std::string& column, const TermPattern& value, const std::string& alias) {
    return fragment(alias.empty() ? column : alias + "." + column, value);
}

std::string ClauseBuilder::fragment(const std::string& qualified, const TermPattern& value) {
    switch (value.kind()) {
        case TermPattern::Kind::Any:
            return "";
        case TermPattern::Kind::Exact:
            return qualified + " = " + bind(value.term().value);
        case TermPattern::Kind::Regex:
            return qualified + " ~ " + bind(value.expression());
        case TermPattern::Kind::Null:
            return qualified + " IS NULL";
        case TermPattern::Kind::Alternatives: {
            std::vector<std::string> parts;
            for (const auto& alt : value.alternatives()) {
                std::string part = fragment(qualified, alt);
                // a wildcard alternative matches everything
                parts.push_back(part.empty() ? "TRUE" : part);
            }
            if (parts.empty()) return "FALSE";
            return "(" + join(parts, " OR ") + ")";
        }
    }
    return "";
}

std::string ClauseBuilder::where(PartitionKind kind, const std::string& alias,
                                 const TriplePattern& pattern, const TermPattern& context) {
    std::vector<std::string> parts;
    auto add = [&](const std::string& part) {
        if (!part.empty()) parts.push_back(part);
    };

    if (kind == PartitionKind::AssertedType) {
        add(column("member", pattern.subject, alias));
        const TermPattern::Kind pk = pattern.predicate.kind();
        if (pk == TermPattern::Kind::Regex || pk == TermPattern::Kind::Alternatives) {
            add(fragment(std::string("'") + RDF_TYPE + "'", pattern.predicate));
        }
        add(column("klass", pattern.object, alias));
        add(column("context", context, alias));
    } else {
        add(column("subject", pattern.subject, alias));
        add(column("predicate", pattern.predicate, alias));
        add(column("object", pattern.object, alias));
        add(column("context", context, alias));

        // literal and quoted rows carry the literal's language and datatype
        const bool typed_columns = kind == PartitionKind::Literal || kind == PartitionKind::Quoted;
        if (typed_columns && pattern.object.kind() == TermPattern::Kind::Exact && pattern.object.term().is_literal()) {
            const Term& lit = pattern.object.term();
            const std::string prefix = alias.empty() ? "" : alias + ".";
            add(lit.language.empty() ? prefix + "objLanguage IS NULL"
                                     : prefix + "objLanguage = " + bind(lit.language));
            add(lit.datatype.empty() ? prefix + "objDatatype IS NULL"
                                     : prefix + "objDatatype = " + bind(lit.datatype));
        }
    }

    if (parts.empty()) return "";
    return "WHERE " + join(parts, " AND ");
}

} // namespace RdfPg
