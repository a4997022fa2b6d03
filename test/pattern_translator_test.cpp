#include <gtest/gtest.h>
#include <string>
#include <vector>
#include <stdexcept>

#include "codec/term_codec.hpp"
#include "database/pattern_translator.hpp"

namespace test {

using quint::Term;
using quint::TermCodec;
using quint::TermMatch;
using quint::QuintPattern;
using quint::TermOperators;
using quint::OperatorValue;
using quint::PatternTranslator;

class PatternTranslatorTest : public testing::Test {
protected:
    static QuintPattern objectPattern(const TermOperators &ops) {
        QuintPattern pattern;
        pattern.object = TermMatch(ops);
        return pattern;
    }

    static std::vector<std::string> paramTexts(const quint::SqlBuilder &builder) {
        std::vector<std::string> texts;
        for (const auto &param : builder.params()) {
            texts.push_back(param.toText());
        }
        return texts;
    }
};

TEST_F(PatternTranslatorTest, EmptyPatternHasNoCondition) {
    QuintPattern pattern;
    EXPECT_TRUE(PatternTranslator::conditions(pattern).empty());
    EXPECT_TRUE(PatternTranslator::whereClause(pattern).empty());
}

TEST_F(PatternTranslatorTest, ConcreteTermsInColumnOrder) {
    QuintPattern pattern;
    pattern.object = TermMatch(Term::literal("Alice"));
    pattern.subject = TermMatch(Term::namedNode("http://ex/alice"));
    pattern.graph = TermMatch(Term::namedNode("http://ex/g"));

    auto where = PatternTranslator::whereClause(pattern);
    EXPECT_EQ(" WHERE graph = ? AND subject = ? AND object = ?", where.text());
    std::vector<std::string> expect = {"http://ex/g", "http://ex/alice", "\"Alice\""};
    EXPECT_EQ(expect, paramTexts(where));
}

TEST_F(PatternTranslatorTest, AliasQualifiesColumns) {
    QuintPattern pattern;
    pattern.predicate = TermMatch(Term::namedNode("http://ex/p"));
    auto conds = PatternTranslator::conditions(pattern, "q1");
    EXPECT_EQ("q1.predicate = ?", conds.text());
}

TEST_F(PatternTranslatorTest, StartsWithIsAnIndexRange) {
    TermOperators ops;
    ops.starts_with = "ns:a/";
    QuintPattern pattern;
    pattern.graph = TermMatch(ops);

    auto conds = PatternTranslator::conditions(pattern);
    EXPECT_EQ("graph >= ? AND graph < ?", conds.text());
    std::vector<std::string> expect = {"ns:a/", "ns:a/" + TermCodec::MAX_CHAR};
    EXPECT_EQ(expect, paramTexts(conds));
}

TEST_F(PatternTranslatorTest, NumericBoundsUseTheSortablePrefix) {
    TermOperators ops;
    ops.gt = OperatorValue(5);
    ops.lte = OperatorValue(Term::typedLiteral("10", quint::xsd::INTEGER));
    ops.gte = OperatorValue(1.5);
    auto conds = PatternTranslator::conditions(objectPattern(ops));

    EXPECT_EQ("object > ? AND object >= ? AND object <= ?", conds.text());
    std::vector<std::string> expect = {
            TermCodec::numericPrefix(5) + TermCodec::SEP + TermCodec::MAX_CHAR,
            TermCodec::numericPrefix(1.5),
            TermCodec::numericPrefix(10) + TermCodec::SEP + TermCodec::MAX_CHAR,
    };
    EXPECT_EQ(expect, paramTexts(conds));
}

TEST_F(PatternTranslatorTest, NumberEqualityMatchesTheStoredLiteral) {
    TermOperators ops;
    ops.eq = OperatorValue(7);
    auto conds = PatternTranslator::conditions(objectPattern(ops));
    EXPECT_EQ("object = ?", conds.text());
    ASSERT_EQ(1u, conds.params().size());
    EXPECT_EQ(TermCodec::encodeObject(Term::typedLiteral("7", quint::xsd::INTEGER)), conds.params()[0].text());
}

TEST_F(PatternTranslatorTest, RawObjectValuesAreQuoted) {
    EXPECT_EQ("\"hello\"",
              PatternTranslator::encodeValue(OperatorValue("hello"), quint::OBJECT, PatternTranslator::OP_EQ).text());
    EXPECT_EQ("\"hello\"@en",
              PatternTranslator::encodeValue(OperatorValue("\"hello\"@en"), quint::OBJECT,
                                             PatternTranslator::OP_EQ).text());
    EXPECT_EQ("hello",
              PatternTranslator::encodeValue(OperatorValue("hello"), quint::SUBJECT, PatternTranslator::OP_EQ).text());
}

TEST_F(PatternTranslatorTest, EmptySets) {
    TermOperators in;
    in.in = std::vector<OperatorValue>{};
    auto conds = PatternTranslator::conditions(objectPattern(in));
    EXPECT_EQ("1 = 0", conds.text());
    EXPECT_TRUE(conds.params().empty());

    TermOperators not_in;
    not_in.not_in = std::vector<OperatorValue>{};
    EXPECT_TRUE(PatternTranslator::conditions(objectPattern(not_in)).empty());
}

TEST_F(PatternTranslatorTest, InList) {
    TermOperators ops;
    ops.in = std::vector<OperatorValue>{Term::namedNode("http://ex/a"), Term::namedNode("http://ex/b")};
    QuintPattern pattern;
    pattern.subject = TermMatch(ops);
    auto conds = PatternTranslator::conditions(pattern);
    EXPECT_EQ("subject IN (?, ?)", conds.text());
    std::vector<std::string> expect = {"http://ex/a", "http://ex/b"};
    EXPECT_EQ(expect, paramTexts(conds));
}

TEST_F(PatternTranslatorTest, LikeOperandsAreEscaped) {
    TermOperators ops;
    ops.ends_with = "50%\"";
    ops.contains = "a_b";
    auto conds = PatternTranslator::conditions(objectPattern(ops));
    EXPECT_EQ("object LIKE ? ESCAPE '\\' AND object LIKE ? ESCAPE '\\'", conds.text());
    std::vector<std::string> expect = {"%50\\%\"", "%a\\_b%"};
    EXPECT_EQ(expect, paramTexts(conds));
}

TEST_F(PatternTranslatorTest, IsNull) {
    TermOperators ops;
    ops.is_null = true;
    EXPECT_EQ("object IS NULL", PatternTranslator::conditions(objectPattern(ops)).text());
    ops.is_null = false;
    EXPECT_EQ("object IS NOT NULL", PatternTranslator::conditions(objectPattern(ops)).text());
}

TEST_F(PatternTranslatorTest, RegexPrefix) {
    EXPECT_EQ("abc", PatternTranslator::regexPrefix("^abc.*"));
    EXPECT_EQ("abc", PatternTranslator::regexPrefix("^abc"));
    EXPECT_EQ("", PatternTranslator::regexPrefix("abc"));
    EXPECT_EQ("a", PatternTranslator::regexPrefix("^ab?c"));
    EXPECT_EQ("a.b", PatternTranslator::regexPrefix("^a\\.b"));
    EXPECT_EQ("", PatternTranslator::regexPrefix("^a|b"));
    EXPECT_EQ("", PatternTranslator::regexPrefix("^\\d+"));
}

TEST_F(PatternTranslatorTest, RegexBecomesARangeAndAClientFilter) {
    TermOperators ops;
    ops.regex = "^http://ex/a";
    QuintPattern pattern;
    pattern.subject = TermMatch(ops);

    auto conds = PatternTranslator::conditions(pattern);
    EXPECT_EQ("subject >= ? AND subject < ?", conds.text());

    auto filters = PatternTranslator::regexFilters(pattern);
    ASSERT_EQ(1u, filters.size());
    EXPECT_EQ(quint::SUBJECT, filters[0].field);
    EXPECT_TRUE(std::regex_search(std::string("http://ex/alice"), filters[0].regex));
    EXPECT_FALSE(std::regex_search(std::string("http://ex/bob"), filters[0].regex));
}

TEST_F(PatternTranslatorTest, RegexIsRejectedInCompoundPatterns) {
    TermOperators ops;
    ops.regex = "foo";
    EXPECT_THROW(PatternTranslator::conditions(objectPattern(ops), "q0"), std::invalid_argument);
}

} // namespace test
