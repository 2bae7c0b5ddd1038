/**
 * @file test_term.cpp
 * @brief Unit tests for terms and the termComb encoding
 */

#include <gtest/gtest.h>
#include <rdf/term.hpp>
#include <set>

using namespace RdfPg;

TEST(TermCombTest, EncodesBaseFiveDigits) {
    EXPECT_EQ(TermComb::encode(TermKind::URI, TermKind::URI, TermKind::URI, TermKind::URI), 0);
    EXPECT_EQ(TermComb::encode(TermKind::URI, TermKind::URI, TermKind::Literal, TermKind::URI), 10);
    EXPECT_EQ(TermComb::encode(TermKind::BNode, TermKind::URI, TermKind::URI, TermKind::Formula), 128);
    EXPECT_EQ(TermComb::encode(TermKind::Variable, TermKind::Variable, TermKind::Variable, TermKind::Variable), 624);
}

TEST(TermCombTest, EveryCombinationDecodesBack) {
    std::set<int> seen;
    for (int s = 0; s < 5; ++s)
        for (int p = 0; p < 5; ++p)
            for (int o = 0; o < 5; ++o)
                for (int c = 0; c < 5; ++c) {
                    auto ks = static_cast<TermKind>(s);
                    auto kp = static_cast<TermKind>(p);
                    auto ko = static_cast<TermKind>(o);
                    auto kc = static_cast<TermKind>(c);
                    int code = TermComb::encode(ks, kp, ko, kc);
                    ASSERT_GE(code, 0);
                    ASSERT_LT(code, TermComb::COMBINATIONS);
                    seen.insert(code);

                    auto decoded = TermComb::decode(code);
                    EXPECT_EQ(decoded[0], ks);
                    EXPECT_EQ(decoded[1], kp);
                    EXPECT_EQ(decoded[2], ko);
                    EXPECT_EQ(decoded[3], kc);
                }
    EXPECT_EQ(seen.size(), static_cast<size_t>(TermComb::COMBINATIONS));
}

TEST(TermCombTest, DecodeRejectsOutOfRange) {
    EXPECT_THROW(TermComb::decode(-1), std::runtime_error);
    EXPECT_THROW(TermComb::decode(625), std::runtime_error);
}

TEST(TermTest, Rendering) {
    EXPECT_EQ(Term::uri("http://ex.org/a").to_string(), "<http://ex.org/a>");
    EXPECT_EQ(Term::bnode("b0").to_string(), "_:b0");
    EXPECT_EQ(Term::formula("f1").to_string(), "{f1}");
    EXPECT_EQ(Term::variable("x").to_string(), "?x");
    EXPECT_EQ(Term::literal("chat", "fr").to_string(), "\"chat\"@fr");
    EXPECT_EQ(Term::literal("1", "", "http://www.w3.org/2001/XMLSchema#integer").to_string(),
              "\"1\"^^<http://www.w3.org/2001/XMLSchema#integer>");
    EXPECT_EQ(Term::literal("say \"hi\"").to_string(), "\"say \\\"hi\\\"\"");
}

TEST(TermTest, LiteralEqualityIncludesLanguageAndDatatype) {
    EXPECT_EQ(Term::literal("x"), Term::literal("x"));
    EXPECT_NE(Term::literal("x", "en"), Term::literal("x"));
    EXPECT_NE(Term::literal("x", "", "http://ex.org/dt"), Term::literal("x"));
    EXPECT_NE(Term::uri("x"), Term::literal("x"));
}

TEST(TermTest, GraphKinds) {
    EXPECT_FALSE(Graph::named("http://ex.org/g").is_formula());
    EXPECT_TRUE(Graph::quoted("f").is_formula());
    EXPECT_EQ(Graph::named("http://ex.org/g").identifier.kind, TermKind::URI);
}
