#include <store/result_reconstructor.hpp>
#include <stdexcept>
#include <utility>

namespace RdfPg {

namespace {

constexpr size_t ROW_COLUMNS = 7;

int parse_term_comb(const std::string& text) {
    if (text.empty()) {
        throw std::runtime_error("Missing termComb value");
    }
    size_t used = 0;
    int value = 0;
    try {
        value = std::stoi(text, &used);
    } catch (const std::logic_error&) {
        throw std::runtime_error("Invalid termComb value: " + text);
    }
    if (used != text.size()) {
        throw std::runtime_error("Invalid termComb value: " + text);
    }
    return value;
}

Term make_term(TermKind kind, const std::string& value) {
    return {kind, value, {}, {}};
}

} // namespace

ResultReconstructor::ResultReconstructor(RowSource& rows) : rows_(rows) {}

ResultReconstructor::DecodedRow ResultReconstructor::decode(const Row& row) {
    if (row.size() < ROW_COLUMNS) {
        throw std::runtime_error("Statement row has " + std::to_string(row.size()) +
                                 " columns, expected " + std::to_string(ROW_COLUMNS));
    }

    auto kinds = TermComb::decode(parse_term_comb(row[4]));

    DecodedRow decoded;
    decoded.triple.subject = make_term(kinds[0], row[0]);
    decoded.triple.predicate = make_term(kinds[1], row[1]);
    if (kinds[2] == TermKind::Literal) {
        decoded.triple.object = Term::literal(row[2], row[5], row[6]);
    } else {
        decoded.triple.object = make_term(kinds[2], row[2]);
    }
    decoded.context.identifier = make_term(kinds[3], row[3]);
    return decoded;
}

bool ResultReconstructor::fetch() {
    if (exhausted_) return false;
    if (!rows_.next(row_)) {
        exhausted_ = true;
        return false;
    }
    pending_ = decode(row_);
    return true;
}

std::optional<TripleMatch> ResultReconstructor::next() {
    if (!pending_ && !fetch()) {
        return std::nullopt;
    }

    TripleMatch match;
    match.triple = std::move(pending_->triple);
    match.contexts.push_back(std::move(pending_->context));
    pending_.reset();

    while (fetch()) {
        if (pending_->triple != match.triple) break;
        match.contexts.push_back(std::move(pending_->context));
        pending_.reset();
    }

    return match;
}

} // namespace RdfPg
