#include <gtest/gtest.h>
#include <cmath>
#include <limits>
#include <string>
#include <vector>

#include "codec/term_codec.hpp"

namespace test {

using quint::Term;
using quint::TermCodec;

class TermCodecTest : public testing::Test {
protected:
    static void expectAscending(const std::vector<std::string> &keys) {
        for (size_t i = 1; i < keys.size(); ++i) {
            EXPECT_LT(keys[i - 1], keys[i]) << "position " << i;
        }
    }
};

TEST_F(TermCodecTest, FpEncodeFollowsNumericOrder) {
    std::vector<double> values = {
            -std::numeric_limits<double>::infinity(),
            -1e10, -1000, -1.5, -1, -0.5, -1e-5,
            0,
            1e-5, 0.5, 1, 1.5, 1000, 1e10,
            std::numeric_limits<double>::infinity(),
    };
    std::vector<std::string> keys;
    for (double value : values) {
        keys.push_back(TermCodec::fpEncode(value));
    }
    expectAscending(keys);
}

TEST_F(TermCodecTest, FpEncodeShapes) {
    EXPECT_EQ("30000.00000000000000000", TermCodec::fpEncode(0.0));
    EXPECT_EQ(TermCodec::fpEncode(42.0), TermCodec::fpEncode(std::string("42")));
    EXPECT_EQ(TermCodec::fpEncode(std::nan("")), TermCodec::fpEncode(std::string("abc")));
    EXPECT_EQ(23u, TermCodec::fpEncode(123.25).size());
    EXPECT_EQ(23u, TermCodec::fpEncode(-0.001).size());
    EXPECT_EQ('5', TermCodec::fpEncode(123.25)[0]);
    EXPECT_EQ('1', TermCodec::fpEncode(-123.25)[0]);
}

TEST_F(TermCodecTest, FpEncodeSpecialValues) {
    EXPECT_EQ("00000.00000000000000000", TermCodec::fpEncode(-std::numeric_limits<double>::infinity()));
    EXPECT_EQ("30000.00000000000000000", TermCodec::fpEncode(-0.0));
    EXPECT_EQ("60000.00000000000000000", TermCodec::fpEncode(std::numeric_limits<double>::infinity()));
    EXPECT_EQ("70000.00000000000000000", TermCodec::fpEncode(std::numeric_limits<double>::quiet_NaN()));
    // FP_ZERO and FP_NAN are the <cmath> classification macros, not the encodings
    EXPECT_EQ(FP_ZERO, std::fpclassify(0.0));
    EXPECT_EQ(FP_NAN, std::fpclassify(std::numeric_limits<double>::quiet_NaN()));
}

TEST_F(TermCodecTest, SubjectPredicateGraphEncoding) {
    EXPECT_EQ("http://ex/a", TermCodec::encodeTerm(Term::namedNode("http://ex/a")));
    EXPECT_EQ("_:b0", TermCodec::encodeTerm(Term::blankNode("b0")));
    EXPECT_EQ("", TermCodec::encodeTerm(Term::defaultGraph()));
    EXPECT_EQ("\"hi\"", TermCodec::encodeTerm(Term::literal("hi")));
    EXPECT_EQ("\"hi\"@en", TermCodec::encodeTerm(Term::langLiteral("hi", "en")));
    EXPECT_EQ("\"x\"^^<http://ex/dt>", TermCodec::encodeTerm(Term::typedLiteral("x", "http://ex/dt")));

    EXPECT_TRUE(TermCodec::decodeTerm("").isDefaultGraph());
    EXPECT_EQ(Term::blankNode("b0"), TermCodec::decodeTerm("_:b0"));
    EXPECT_EQ(Term::namedNode("http://ex/a"), TermCodec::decodeTerm("http://ex/a"));
}

TEST_F(TermCodecTest, ObjectsDecodeToTheEncodedTerm) {
    std::vector<Term> terms = {
            Term::namedNode("http://ex/a"),
            Term::blankNode("n1"),
            Term::literal("plain text"),
            Term::literal("with \"quotes\" inside"),
            Term::langLiteral("bonjour", "fr"),
            Term::typedLiteral("x", "http://ex/dt"),
            Term::typedLiteral("42", quint::xsd::INTEGER),
            Term::typedLiteral("-3.25", quint::xsd::DECIMAL),
            Term::typedLiteral("1.5e3", quint::xsd::DOUBLE),
            Term::typedLiteral("7", "http://www.w3.org/2001/XMLSchema#int"),
            Term::typedLiteral("2024-01-02T03:04:05Z", quint::xsd::DATE_TIME),
    };
    for (const auto &term : terms) {
        EXPECT_EQ(term, TermCodec::decodeObject(TermCodec::encodeObject(term))) << term.toString();
    }
}

TEST_F(TermCodecTest, NumericObjectKey) {
    Term literal = Term::typedLiteral("42", quint::xsd::INTEGER);
    std::string expect = "N" + TermCodec::SEP + TermCodec::fpEncode(42.0) + TermCodec::SEP
                       + quint::xsd::INTEGER + TermCodec::SEP + "42";
    EXPECT_EQ(expect, TermCodec::encodeObject(literal));

    std::string prefix;
    ASSERT_TRUE(TermCodec::sortablePrefix(literal, prefix));
    EXPECT_EQ(TermCodec::numericPrefix(42), prefix);
    EXPECT_EQ(0u, TermCodec::encodeObject(literal).find(prefix));
    EXPECT_FALSE(TermCodec::sortablePrefix(Term::literal("42"), prefix));
}

TEST_F(TermCodecTest, NumericObjectsSortAcrossDatatypes) {
    std::vector<std::string> keys = {
            TermCodec::encodeObject(Term::typedLiteral("-7", quint::xsd::INTEGER)),
            TermCodec::encodeObject(Term::typedLiteral("2.5", quint::xsd::DECIMAL)),
            TermCodec::encodeObject(Term::typedLiteral("3", quint::xsd::INTEGER)),
            TermCodec::encodeObject(Term::typedLiteral("1e2", quint::xsd::DOUBLE)),
    };
    expectAscending(keys);
}

TEST_F(TermCodecTest, DateTimeObjectsSortChronologically) {
    std::string key = TermCodec::encodeObject(Term::typedLiteral("2024-01-01T00:00:00Z", quint::xsd::DATE_TIME));
    EXPECT_EQ(0u, key.find("D" + TermCodec::SEP));

    // 10:00+02:00 is 08:00 UTC
    std::vector<std::string> keys = {
            TermCodec::encodeObject(Term::typedLiteral("1969-12-31T23:59:59Z", quint::xsd::DATE_TIME)),
            TermCodec::encodeObject(Term::typedLiteral("2024-01-01T10:00:00+02:00", quint::xsd::DATE_TIME)),
            TermCodec::encodeObject(Term::typedLiteral("2024-01-01T09:00:00Z", quint::xsd::DATE_TIME)),
            TermCodec::encodeObject(Term::typedLiteral("2024-01-01T09:00:00.500Z", quint::xsd::DATE_TIME)),
    };
    expectAscending(keys);
}

TEST_F(TermCodecTest, DateTimeToEpochMillis) {
    EXPECT_DOUBLE_EQ(0.0, TermCodec::dateTimeToEpochMillis("1970-01-01T00:00:00Z"));
    EXPECT_DOUBLE_EQ(1000.0, TermCodec::dateTimeToEpochMillis("1970-01-01T00:00:01Z"));
    EXPECT_DOUBLE_EQ(86400000.0 + 250.0, TermCodec::dateTimeToEpochMillis("1970-01-02T00:00:00.25"));
    EXPECT_DOUBLE_EQ(-3600000.0, TermCodec::dateTimeToEpochMillis("1970-01-01T00:00:00+01:00"));
    EXPECT_TRUE(std::isnan(TermCodec::dateTimeToEpochMillis("yesterday")));
    EXPECT_TRUE(std::isnan(TermCodec::dateTimeToEpochMillis("2024-13-01T00:00:00Z")));
}

TEST_F(TermCodecTest, OutOfRangeYearsEncodeAsNaN) {
    EXPECT_TRUE(std::isnan(TermCodec::dateTimeToEpochMillis("12345678901-01-01T00:00:00Z")));
    EXPECT_TRUE(std::isnan(TermCodec::dateTimeToEpochMillis("99999-01-01T00:00:00Z")));
    EXPECT_TRUE(std::isnan(TermCodec::dateTimeToEpochMillis("-0044-03-15T12:00:00Z")));
    // 67506 - 65536 would read as 1970 once narrowed
    EXPECT_TRUE(std::isnan(TermCodec::dateTimeToEpochMillis("67506-01-01T00:00:00Z")));

    Term far_future = Term::typedLiteral("12345678901-01-01T00:00:00Z", quint::xsd::DATE_TIME);
    std::string key = TermCodec::encodeObject(far_future);
    EXPECT_EQ("D" + TermCodec::SEP + TermCodec::fpEncode(std::numeric_limits<double>::quiet_NaN())
              + TermCodec::SEP + far_future.value(), key);
    EXPECT_EQ(far_future, TermCodec::decodeObject(key));
}

TEST_F(TermCodecTest, CorruptKeysReadBackAsIri) {
    std::string corrupt = "N" + TermCodec::SEP + "garbage";
    EXPECT_EQ(Term::namedNode(corrupt), TermCodec::decodeObject(corrupt));
    EXPECT_EQ(Term::namedNode("\"unterminated"), TermCodec::decodeTerm("\"unterminated"));
}

} // namespace test
