#include <rdf/pattern.hpp>
#include <regex>

namespace RdfPg {

TermPattern TermPattern::regex(std::string expression) {
    TermPattern p;
    p.kind_ = Kind::Regex;
    p.expression_ = std::move(expression);
    return p;
}

TermPattern TermPattern::null() {
    TermPattern p;
    p.kind_ = Kind::Null;
    return p;
}

TermPattern TermPattern::one_of(std::vector<TermPattern> alternatives) {
    TermPattern p;
    p.kind_ = Kind::Alternatives;
    p.alternatives_ = std::move(alternatives);
    return p;
}

bool TermPattern::is_uri(const std::string& uri) const {
    return kind_ == Kind::Exact && term_.kind == TermKind::URI && term_.value == uri;
}

bool TermPattern::may_match(const std::string& text) const {
    if (kind_ != Kind::Regex) return false;
    try {
        return std::regex_search(text, std::regex(expression_));
    } catch (const std::regex_error&) {
        return true;
    }
}

bool TermPattern::may_be_literal() const {
    switch (kind_) {
        case Kind::Any:
        case Kind::Regex:
        case Kind::Null:
            return true;
        case Kind::Exact:
            return term_.is_literal();
        case Kind::Alternatives:
            for (const auto& alt : alternatives_) {
                if (alt.may_be_literal()) return true;
            }
            return false;
    }
    return false;
}

bool TermPattern::may_be_non_literal() const {
    switch (kind_) {
        case Kind::Any:
        case Kind::Regex:
            return true;
        case Kind::Null:
            // object is NOT NULL in the asserted partition
            return false;
        case Kind::Exact:
            return !term_.is_literal();
        case Kind::Alternatives:
            for (const auto& alt : alternatives_) {
                if (alt.may_be_non_literal()) return true;
            }
            return false;
    }
    return false;
}

} // namespace RdfPg
