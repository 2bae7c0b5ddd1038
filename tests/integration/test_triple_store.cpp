/**
 * @file test_triple_store.cpp
 * @brief Functional tests for TripleStore against a live PostgreSQL server
 *
 * Set RDFPG_TEST_CONFIG to a configuration string, e.g.
 *   RDFPG_TEST_CONFIG="user=postgres password=postgres dbname=rdfpg_test host=localhost"
 * Tests are skipped when it is unset or the server is unreachable.
 */

#include <gtest/gtest.h>
#include <store/triple_store.hpp>
#include <algorithm>
#include <cstdlib>

using namespace RdfPg;

namespace {

const Term ALICE = Term::uri("http://ex.org/alice");
const Term BOB = Term::uri("http://ex.org/bob");
const Term CAROL = Term::uri("http://ex.org/carol");
const Term KNOWS = Term::uri("http://xmlns.com/foaf/0.1/knows");
const Term NAME = Term::uri("http://xmlns.com/foaf/0.1/name");
const Term PERSON = Term::uri("http://xmlns.com/foaf/0.1/Person");
const Term TYPE = Term::uri(RDF_TYPE);
const Graph G1 = Graph::named("http://ex.org/g1");
const Graph G2 = Graph::named("http://ex.org/g2");
const Graph FORMULA = Graph::quoted("f1");

bool has_context(const std::vector<Graph>& graphs, const Graph& g) {
    return std::find(graphs.begin(), graphs.end(), g) != graphs.end();
}

} // namespace

class TripleStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        const char* env = std::getenv("RDFPG_TEST_CONFIG");
        if (env == nullptr || *env == '\0') {
            GTEST_SKIP() << "RDFPG_TEST_CONFIG not set - skipping integration test.";
        }

        config_ = StoreConfig::parse(env);
        store_ = std::make_unique<TripleStore>("rdfpg-integration-test");
        try {
            ASSERT_EQ(store_->open(config_), StoreStatus::Valid);
        } catch (const ConnectionError& e) {
            store_.reset();
            GTEST_SKIP() << "Database not available - skipping integration test: " << e.what();
        }
    }

    void TearDown() override {
        if (store_) {
            store_->destroy(config_);
            store_.reset();
        }
    }

    std::vector<TripleMatch> all(const TriplePattern& pattern = TriplePattern::any(),
                                 const TermPattern& context = TermPattern::any()) {
        return store_->triples(pattern, context).collect();
    }

    StoreConfig config_;
    std::unique_ptr<TripleStore> store_;
};

TEST_F(TripleStoreTest, RoundTripInOneContext) {
    store_->add({ALICE, KNOWS, BOB}, G1);

    auto matches = all(TriplePattern::any(), G1);
    ASSERT_EQ(matches.size(), 1u);
    EXPECT_EQ(matches[0].triple, (Triple{ALICE, KNOWS, BOB}));
    ASSERT_EQ(matches[0].contexts.size(), 1u);
    EXPECT_EQ(matches[0].contexts[0], G1);
}

TEST_F(TripleStoreTest, DuplicateAddIsIgnored) {
    store_->add({ALICE, NAME, Term::literal("Alice", "en")}, G1);
    store_->add({ALICE, NAME, Term::literal("Alice", "en")}, G1);
    store_->add({ALICE, TYPE, PERSON}, G1);
    store_->add({ALICE, TYPE, PERSON}, G1);

    EXPECT_EQ(store_->count(), 2u);
}

TEST_F(TripleStoreTest, SameTripleInTwoContextsIsReturnedOnce) {
    store_->add({ALICE, KNOWS, BOB}, G1);
    store_->add({ALICE, KNOWS, BOB}, G2);

    auto matches = all();
    ASSERT_EQ(matches.size(), 1u);
    ASSERT_EQ(matches[0].contexts.size(), 2u);
    EXPECT_TRUE(has_context(matches[0].contexts, G1));
    EXPECT_TRUE(has_context(matches[0].contexts, G2));
}

TEST_F(TripleStoreTest, InterleavedInsertsStillGroup) {
    store_->add({ALICE, KNOWS, BOB}, G1);
    store_->add({CAROL, KNOWS, BOB}, G1);
    store_->add({ALICE, NAME, Term::literal("Alice")}, G1);
    store_->add({ALICE, KNOWS, BOB}, G2);
    store_->add({CAROL, KNOWS, BOB}, G2);

    auto matches = all();
    ASSERT_EQ(matches.size(), 3u);
    for (const auto& match : matches) {
        if (match.triple.object.is_literal()) {
            EXPECT_EQ(match.contexts.size(), 1u);
        } else {
            EXPECT_EQ(match.contexts.size(), 2u) << match.triple.to_string();
        }
    }
}

TEST_F(TripleStoreTest, TermKindsSurviveTheRoundTrip) {
    Term blank = Term::bnode("b0");
    Term typed = Term::literal("42", "", "http://www.w3.org/2001/XMLSchema#integer");
    store_->add({blank, NAME, typed}, G1);
    store_->add({blank, TYPE, PERSON}, G1);

    auto literal = all({blank, NAME, TermPattern::any()});
    ASSERT_EQ(literal.size(), 1u);
    EXPECT_EQ(literal[0].triple.subject, blank);
    EXPECT_EQ(literal[0].triple.object, typed);

    auto typed_match = all({TermPattern::any(), NAME, typed});
    EXPECT_EQ(typed_match.size(), 1u);
    EXPECT_TRUE(all({TermPattern::any(), NAME, Term::literal("42")}).empty());

    auto type = all({blank, TYPE, TermPattern::any()});
    ASSERT_EQ(type.size(), 1u);
    EXPECT_EQ(type[0].triple.predicate, TYPE);
    EXPECT_EQ(type[0].triple.object, PERSON);
}

TEST_F(TripleStoreTest, PatternKinds) {
    store_->add({ALICE, KNOWS, BOB}, G1);
    store_->add({ALICE, KNOWS, CAROL}, G1);
    store_->add({BOB, KNOWS, CAROL}, G1);

    EXPECT_EQ(all({TermPattern::any(), KNOWS, TermPattern::one_of({BOB, CAROL})}).size(), 3u);
    EXPECT_EQ(all({TermPattern::one_of({ALICE}), TermPattern::any(), TermPattern::any()}).size(), 2u);
    EXPECT_EQ(all({TermPattern::regex("bob$"), TermPattern::any(), TermPattern::any()}).size(), 1u);
    EXPECT_TRUE(all({TermPattern::any(), KNOWS, TermPattern::one_of({})}).empty());
}

TEST_F(TripleStoreTest, CountWithAndWithoutContext) {
    store_->add({ALICE, KNOWS, BOB}, G1);
    store_->add({ALICE, TYPE, PERSON}, G1);
    store_->add({ALICE, NAME, Term::literal("Alice")}, G2);
    store_->add({ALICE, KNOWS, BOB}, G2);

    EXPECT_EQ(store_->count(), 4u);
    EXPECT_EQ(store_->count(G1), 2u);
    EXPECT_EQ(store_->count(G2), 2u);
    EXPECT_EQ(store_->count(Graph::named("http://ex.org/empty")), 0u);
}

TEST_F(TripleStoreTest, QuotedStatementsOnlyVisibleThroughTheirFormula) {
    store_->add({ALICE, KNOWS, BOB}, FORMULA, true);

    EXPECT_TRUE(all().empty());
    EXPECT_EQ(store_->count(), 0u);
    EXPECT_TRUE(store_->contexts().empty());

    auto quoted = all(TriplePattern::any(), FORMULA);
    ASSERT_EQ(quoted.size(), 1u);
    EXPECT_TRUE(quoted[0].contexts[0].is_formula());
    EXPECT_EQ(store_->count(FORMULA), 1u);
    EXPECT_EQ(store_->statistics().quoted_statements, 1u);
}

TEST_F(TripleStoreTest, ContextsOfStoreAndOfPattern) {
    store_->add({ALICE, KNOWS, BOB}, G1);
    store_->add({CAROL, NAME, Term::literal("Carol")}, G2);

    auto contexts = store_->contexts();
    EXPECT_EQ(contexts.size(), 2u);
    EXPECT_TRUE(has_context(contexts, G1));
    EXPECT_TRUE(has_context(contexts, G2));

    auto carol = store_->contexts(TriplePattern{CAROL, TermPattern::any(), TermPattern::any()});
    ASSERT_EQ(carol.size(), 1u);
    EXPECT_EQ(carol[0], G2);
}

TEST_F(TripleStoreTest, RemoveByPatternAndContext) {
    store_->add({ALICE, KNOWS, BOB}, G1);
    store_->add({ALICE, KNOWS, BOB}, G2);
    store_->add({ALICE, TYPE, PERSON}, G1);
    store_->add({ALICE, NAME, Term::literal("Alice")}, G1);

    store_->remove({ALICE, KNOWS, BOB}, G1);
    auto remaining = all({ALICE, KNOWS, BOB});
    ASSERT_EQ(remaining.size(), 1u);
    EXPECT_EQ(remaining[0].contexts, std::vector<Graph>{G2});

    store_->remove({ALICE, TermPattern::any(), TermPattern::any()});
    EXPECT_EQ(store_->count(), 0u);
}

TEST_F(TripleStoreTest, BulkAdd) {
    std::vector<Quad> quads = {
        {{ALICE, KNOWS, BOB}, G1},
        {{ALICE, TYPE, PERSON}, G1},
        {{ALICE, NAME, Term::literal("tab\there", "en")}, G1},
        {{BOB, NAME, Term::literal("Bob")}, G2},
        {{CAROL, KNOWS, ALICE}, FORMULA, true},
        {{ALICE, KNOWS, BOB}, G1},
    };
    EXPECT_EQ(store_->add_n(quads), quads.size());

    EXPECT_EQ(store_->count(), 4u);
    auto stats = store_->statistics();
    EXPECT_EQ(stats.asserted_statements, 1u);
    EXPECT_EQ(stats.type_statements, 1u);
    EXPECT_EQ(stats.literal_statements, 2u);
    EXPECT_EQ(stats.quoted_statements, 1u);
    EXPECT_EQ(stats.contexts, 2u);

    auto escaped = all({ALICE, NAME, TermPattern::any()});
    ASSERT_EQ(escaped.size(), 1u);
    EXPECT_EQ(escaped[0].triple.object, Term::literal("tab\there", "en"));

    // existing rows are not duplicated by a second load
    store_->add_n(quads);
    EXPECT_EQ(store_->count(), 4u);
}

TEST_F(TripleStoreTest, NamespaceBindings) {
    store_->bind("foaf", "http://xmlns.com/foaf/0.1/");
    store_->bind("ex", "http://ex.org/");
    store_->bind("ex", "http://example.org/");

    EXPECT_EQ(store_->namespace_uri("ex").value_or(""), "http://example.org/");
    EXPECT_EQ(store_->prefix("http://xmlns.com/foaf/0.1/").value_or(""), "foaf");
    EXPECT_FALSE(store_->namespace_uri("nope").has_value());

    auto bindings = store_->namespaces();
    ASSERT_EQ(bindings.size(), 2u);
    EXPECT_EQ(bindings[0].first, "ex");
    EXPECT_EQ(bindings[1].first, "foaf");
}

TEST_F(TripleStoreTest, CursorBlocksOtherQueriesUntilDone) {
    store_->add({ALICE, KNOWS, BOB}, G1);
    store_->add({BOB, KNOWS, CAROL}, G1);

    {
        TripleCursor cursor = store_->triples(TriplePattern::any());
        ASSERT_TRUE(cursor.next().has_value());
        EXPECT_THROW(store_->count(), QueryError);
    }
    EXPECT_EQ(store_->count(), 2u);
}

TEST_F(TripleStoreTest, CursorOutlivesClose) {
    store_->add({ALICE, KNOWS, BOB}, G1);
    store_->add({ALICE, KNOWS, CAROL}, G1);

    TripleCursor cursor = store_->triples(TriplePattern::any());
    ASSERT_TRUE(cursor.next().has_value());

    store_->close();
    EXPECT_FALSE(store_->is_open());
    EXPECT_EQ(cursor.collect().size(), 1u);
    EXPECT_FALSE(cursor.next().has_value());
}

TEST_F(TripleStoreTest, CursorOutlivesItsStore) {
    store_->add({ALICE, KNOWS, BOB}, G1);
    store_->add({ALICE, KNOWS, CAROL}, G2);

    auto other = std::make_unique<TripleStore>("rdfpg-integration-test");
    ASSERT_EQ(other->open(config_, false), StoreStatus::Valid);

    TripleCursor cursor = other->triples(TriplePattern::any());
    other.reset();

    EXPECT_EQ(cursor.collect().size(), 2u);

    // reassigning drains the previous stream before its connection goes away
    cursor = store_->triples({ALICE, KNOWS, BOB});
    EXPECT_EQ(cursor.collect().size(), 1u);
}

TEST_F(TripleStoreTest, LanguageVariantsCountSeparately) {
    store_->add({ALICE, NAME, Term::literal("chat", "en")}, G1);
    store_->add({ALICE, NAME, Term::literal("chat", "fr")}, G1);

    EXPECT_EQ(store_->count(G1), 2u);
    EXPECT_EQ(store_->count(), 2u);
    EXPECT_EQ(all(TriplePattern::any(), G1).size(), 2u);
}

TEST_F(TripleStoreTest, UriAndLiteralWithSameTextStayApart) {
    const std::string x = "http://ex.org/x";
    store_->add({ALICE, KNOWS, Term::uri(x)}, G1);
    store_->add({ALICE, KNOWS, Term::uri(x)}, G2);
    store_->add({ALICE, KNOWS, Term::literal(x)}, G1);
    store_->add({ALICE, KNOWS, Term::literal(x)}, G2);

    auto matches = all();
    ASSERT_EQ(matches.size(), 2u);
    for (const auto& match : matches) {
        EXPECT_EQ(match.contexts.size(), 2u) << match.triple.to_string();
    }
    EXPECT_NE(matches[0].triple.object, matches[1].triple.object);

    EXPECT_EQ(store_->count(G1), 2u);
    EXPECT_EQ(store_->count(), 4u);
}

TEST_F(TripleStoreTest, RegexPredicateSkipsTypeStatements) {
    store_->add({ALICE, TYPE, PERSON}, G1);
    store_->add({ALICE, KNOWS, BOB}, G1);

    auto matches = all({TermPattern::any(), TermPattern::regex("[[:<:]]knows"), TermPattern::any()});
    ASSERT_EQ(matches.size(), 1u);
    EXPECT_EQ(matches[0].triple, (Triple{ALICE, KNOWS, BOB}));

    auto types = all({TermPattern::any(), TermPattern::regex("#type$"), TermPattern::any()});
    ASSERT_EQ(types.size(), 1u);
    EXPECT_EQ(types[0].triple, (Triple{ALICE, TYPE, PERSON}));
}

TEST_F(TripleStoreTest, InitializeTwiceClears) {
    store_->add({ALICE, KNOWS, BOB}, G1);
    store_->bind("ex", "http://ex.org/");

    EXPECT_EQ(store_->initialize(), 0u);
    EXPECT_TRUE(store_->exists());
    EXPECT_EQ(store_->count(), 0u);
    EXPECT_TRUE(store_->namespaces().empty());
}

TEST_F(TripleStoreTest, DestroyThenExistsIsFalse) {
    EXPECT_TRUE(store_->exists());
    EXPECT_EQ(store_->destroy(config_), 0u);
    EXPECT_FALSE(store_->exists());

    TripleStore reopened("rdfpg-integration-test");
    EXPECT_EQ(reopened.open(config_, false), StoreStatus::NoStore);
    EXPECT_FALSE(reopened.is_open());

    // destroying a missing store is harmless
    EXPECT_EQ(store_->destroy(config_), 0u);
}
