#include <rdf/term.hpp>
#include <stdexcept>

namespace RdfPg {

std::string Term::to_string() const {
    switch (kind) {
        case TermKind::URI:      return "<" + value + ">";
        case TermKind::BNode:    return "_:" + value;
        case TermKind::Formula:  return "{" + value + "}";
        case TermKind::Variable: return "?" + value;
        case TermKind::Literal:  break;
    }

    std::string out = "\"";
    for (char c : value) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n";  break;
            default:   out += c;      break;
        }
    }
    out += "\"";
    if (!language.empty()) out += "@" + language;
    else if (!datatype.empty()) out += "^^<" + datatype + ">";
    return out;
}

std::string Triple::to_string() const {
    return subject.to_string() + " " + predicate.to_string() + " " + object.to_string() + " .";
}

namespace TermComb {

int encode(TermKind subject, TermKind predicate, TermKind object, TermKind context) {
    return static_cast<int>(subject) * 125 + static_cast<int>(predicate) * 25 +
           static_cast<int>(object) * 5 + static_cast<int>(context);
}

std::array<TermKind, 4> decode(int value) {
    if (value < 0 || value >= COMBINATIONS) {
        throw std::runtime_error("Invalid termComb value: " + std::to_string(value));
    }
    return {
        static_cast<TermKind>(value / 125),
        static_cast<TermKind>((value / 25) % 5),
        static_cast<TermKind>((value / 5) % 5),
        static_cast<TermKind>(value % 5)
    };
}

} // namespace TermComb

} // namespace RdfPg
