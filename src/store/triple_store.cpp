/**
 * @file triple_store.cpp
 * @brief Store lifecycle, write path and pattern queries
 */

#include <store/triple_store.hpp>
#include <database/bulk_copy.hpp>
#include <utils/logger.hpp>
#include <map>
#include <sstream>

namespace RdfPg {

namespace {

int term_comb(const Triple& t, const Graph& context) {
    return TermComb::encode(t.subject.kind, t.predicate.kind, t.object.kind, context.identifier.kind);
}

std::optional<std::string> nullable(const std::string& value) {
    if (value.empty()) return std::nullopt;
    return value;
}

} // namespace

// ============================================================================
// TripleCursor
// ============================================================================

TripleCursor::TripleCursor(std::shared_ptr<PostgresConnection> connection, ResultStream rows)
    : connection_(std::move(connection)),
      rows_(std::make_unique<ResultStream>(std::move(rows))),
      reconstructor_(std::make_unique<ResultReconstructor>(*rows_)) {}

TripleCursor::~TripleCursor() {
    release();
}

TripleCursor& TripleCursor::operator=(TripleCursor&& other) noexcept {
    if (this != &other) {
        release();
        connection_ = std::move(other.connection_);
        rows_ = std::move(other.rows_);
        reconstructor_ = std::move(other.reconstructor_);
    }
    return *this;
}

void TripleCursor::release() noexcept {
    // the stream drains through the connection, so it must go first
    reconstructor_.reset();
    rows_.reset();
    connection_.reset();
}

std::optional<TripleMatch> TripleCursor::next() {
    if (!reconstructor_) return std::nullopt;
    return reconstructor_->next();
}

std::vector<TripleMatch> TripleCursor::collect() {
    std::vector<TripleMatch> matches;
    while (auto match = next()) {
        matches.push_back(std::move(*match));
    }
    return matches;
}

// ============================================================================
// TripleStore
// ============================================================================

TripleStore::TripleStore(std::string identifier)
    : identifier_(std::move(identifier)),
      tables_(StoreTables::for_identifier(identifier_)),
      planner_(tables_) {}

TripleStore::~TripleStore() = default;

PostgresConnection& TripleStore::db() {
    if (!db_) {
        throw std::runtime_error("Store '" + identifier_ + "' is not open");
    }
    return *db_;
}

StoreStatus TripleStore::open(const StoreConfig& config, bool create) {
    db_ = std::make_shared<PostgresConnection>(config.to_conninfo());

    if (create) {
        initialize();
    }

    bool present = false;
    try {
        present = exists();
    } catch (const QueryError& e) {
        Logger::warn("Existence check for store '" + identifier_ + "' failed: " + e.what());
    }

    if (!present) {
        db_.reset();
        return StoreStatus::NoStore;
    }
    return StoreStatus::Valid;
}

void TripleStore::close() {
    db_.reset();
}

bool TripleStore::exists() {
    return SchemaManager(db(), tables_, identifier_).exists();
}

size_t TripleStore::initialize() {
    return SchemaManager(db(), tables_, identifier_).initialize();
}

size_t TripleStore::destroy(const StoreConfig& config) {
    if (db_) {
        return SchemaManager(*db_, tables_, identifier_).destroy();
    }

    PostgresConnection conn(config.to_conninfo());
    return SchemaManager(conn, tables_, identifier_).destroy();
}

PartitionKind TripleStore::route(const Triple& triple, bool quoted) {
    if (quoted) return PartitionKind::Quoted;
    if (triple.predicate.kind == TermKind::URI && triple.predicate.value == RDF_TYPE) {
        return PartitionKind::AssertedType;
    }
    if (triple.object.is_literal()) return PartitionKind::Literal;
    return PartitionKind::AssertedNonType;
}

std::pair<std::string, std::vector<std::string>> TripleStore::insert_statement(const Quad& quad) const {
    const Triple& t = quad.triple;
    const std::string comb = std::to_string(term_comb(t, quad.context));
    const std::string& ctx = quad.context.identifier.value;

    PartitionKind kind = route(t, quad.quoted);
    const std::string& table = tables_.table(kind);

    switch (kind) {
        case PartitionKind::AssertedType:
            return {
                "INSERT INTO " + table + " (member, klass, context, termComb) "
                "SELECT $1::text, $2::text, $3::text, $4::smallint WHERE NOT EXISTS ("
                "SELECT 1 FROM " + table + " WHERE member = $1::text AND klass = $2::text "
                "AND context = $3::text AND termComb = $4::smallint)",
                {t.subject.value, t.object.value, ctx, comb}
            };
        case PartitionKind::AssertedNonType:
            return {
                "INSERT INTO " + table + " (subject, predicate, object, context, termComb) "
                "SELECT $1::text, $2::text, $3::text, $4::text, $5::smallint WHERE NOT EXISTS ("
                "SELECT 1 FROM " + table + " WHERE subject = $1::text AND predicate = $2::text "
                "AND object = $3::text AND context = $4::text AND termComb = $5::smallint)",
                {t.subject.value, t.predicate.value, t.object.value, ctx, comb}
            };
        case PartitionKind::Literal:
        case PartitionKind::Quoted:
            return {
                "INSERT INTO " + table + " (subject, predicate, object, context, termComb, objLanguage, objDatatype) "
                "SELECT $1::text, $2::text, $3::text, $4::text, $5::smallint, "
                "NULLIF($6::text, ''), NULLIF($7::text, '') WHERE NOT EXISTS ("
                "SELECT 1 FROM " + table + " WHERE subject = $1::text AND predicate = $2::text "
                "AND object = $3::text AND context = $4::text AND termComb = $5::smallint "
                "AND objLanguage IS NOT DISTINCT FROM NULLIF($6::text, '') "
                "AND objDatatype IS NOT DISTINCT FROM NULLIF($7::text, ''))",
                {t.subject.value, t.predicate.value, t.object.value, ctx, comb,
                 t.object.language, t.object.datatype}
            };
    }
    throw std::logic_error("unreachable partition kind");
}

void TripleStore::add(const Triple& triple, const Graph& context, bool quoted) {
    auto [sql, params] = insert_statement({triple, context, quoted});
    db().execute(sql, params);
}

size_t TripleStore::add_n(const std::vector<Quad>& quads) {
    if (quads.empty()) return 0;

    std::map<PartitionKind, std::vector<const Quad*>> by_partition;
    for (const auto& quad : quads) {
        by_partition[route(quad.triple, quad.quoted)].push_back(&quad);
    }

    PostgresConnection::Transaction tx(db());

    for (const auto& [kind, batch] : by_partition) {
        BulkCopy copy(db());

        if (kind == PartitionKind::AssertedType) {
            copy.begin_table(tables_.table(kind), {"member", "klass", "context", "termcomb"});
            for (const Quad* q : batch) {
                copy.add_row({q->triple.subject.value, q->triple.object.value,
                              q->context.identifier.value, std::to_string(term_comb(q->triple, q->context))});
            }
        } else if (kind == PartitionKind::AssertedNonType) {
            copy.begin_table(tables_.table(kind), {"subject", "predicate", "object", "context", "termcomb"});
            for (const Quad* q : batch) {
                copy.add_row({q->triple.subject.value, q->triple.predicate.value, q->triple.object.value,
                              q->context.identifier.value, std::to_string(term_comb(q->triple, q->context))});
            }
        } else {
            copy.begin_table(tables_.table(kind), {"subject", "predicate", "object", "context",
                                                   "termcomb", "objlanguage", "objdatatype"});
            for (const Quad* q : batch) {
                copy.add_row({q->triple.subject.value, q->triple.predicate.value, q->triple.object.value,
                              q->context.identifier.value, std::to_string(term_comb(q->triple, q->context)),
                              nullable(q->triple.object.language), nullable(q->triple.object.datatype)});
            }
        }

        copy.flush();
        Logger::debug("Loaded " + std::to_string(batch.size()) + " rows into the " +
                      partition_name(kind) + " partition");
    }

    tx.commit();
    return quads.size();
}

void TripleStore::remove(const TriplePattern& pattern, const TermPattern& context) {
    auto plans = planner_.deletions(pattern, context);

    PostgresConnection::Transaction tx(db());
    for (const auto& plan : plans) {
        db().execute(plan.sql, plan.params);
    }
    tx.commit();
}

TripleCursor TripleStore::triples(const TriplePattern& pattern, const TermPattern& context) {
    QueryPlan plan = planner_.triples(pattern, context);
    if (plan.empty()) {
        return TripleCursor();
    }
    return TripleCursor(db_, db().stream(plan.sql, plan.params));
}

size_t TripleStore::count(const TermPattern& context) {
    QueryPlan plan = planner_.count(context);

    size_t total = 0;
    db().query(plan.sql, plan.params, [&](const Row& row) {
        total += std::stoull(row[1]);
    });
    return total;
}

std::vector<Graph> TripleStore::contexts(const std::optional<TriplePattern>& pattern) {
    QueryPlan plan = planner_.contexts(pattern);

    std::vector<Graph> graphs;
    if (plan.empty()) return graphs;

    db().query(plan.sql, plan.params, [&](const Row& row) {
        graphs.push_back(Graph::named(row[0]));
    });
    return graphs;
}

StoreStatistics TripleStore::statistics() {
    QueryPlan plan = planner_.partition_counts();

    std::map<std::string, size_t> counts;
    db().query(plan.sql, plan.params, [&](const Row& row) {
        counts[row[0]] = std::stoull(row[1]);
    });

    StoreStatistics stats;
    stats.type_statements = counts[partition_name(PartitionKind::AssertedType)];
    stats.quoted_statements = counts[partition_name(PartitionKind::Quoted)];
    stats.asserted_statements = counts[partition_name(PartitionKind::AssertedNonType)];
    stats.literal_statements = counts[partition_name(PartitionKind::Literal)];
    stats.contexts = contexts().size();
    return stats;
}

std::string TripleStore::describe() {
    StoreStatistics s = statistics();

    std::ostringstream out;
    out << "<Partitioned PostgreSQL N3 Store: " << s.contexts << " contexts, "
        << s.type_statements << " classification assertions, "
        << s.quoted_statements << " quoted statements, "
        << s.literal_statements << " property/value assertions, and "
        << s.asserted_statements << " other assertions>";
    return out.str();
}

// ============================================================================
// Namespace bindings
// ============================================================================

void TripleStore::bind(const std::string& prefix, const std::string& uri) {
    db().execute(
        "INSERT INTO " + tables_.namespaces + " (prefix, uri) VALUES ($1, $2) "
        "ON CONFLICT (prefix) DO UPDATE SET uri = EXCLUDED.uri",
        {prefix, uri}
    );
}

std::optional<std::string> TripleStore::prefix(const std::string& uri) {
    return db().query_single(
        "SELECT prefix FROM " + tables_.namespaces + " WHERE uri = $1 ORDER BY prefix LIMIT 1",
        {uri}
    );
}

std::optional<std::string> TripleStore::namespace_uri(const std::string& prefix) {
    return db().query_single(
        "SELECT uri FROM " + tables_.namespaces + " WHERE prefix = $1",
        {prefix}
    );
}

std::vector<std::pair<std::string, std::string>> TripleStore::namespaces() {
    std::vector<std::pair<std::string, std::string>> bindings;
    db().query("SELECT prefix, uri FROM " + tables_.namespaces + " ORDER BY prefix", {},
               [&](const Row& row) {
                   bindings.emplace_back(row[0], row[1]);
               });
    return bindings;
}

} // namespace RdfPg
