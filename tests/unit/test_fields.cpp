#include <cmath>
#include <gtest/gtest.h>
#include <string>
#include <vector>

#include "data/fields.hpp"

using namespace numcsv::data;

// ─── split_fields ────────────────────────────────────────────────────────────

TEST(SplitFields, Basic)
{
    auto f = split_fields("a,b,c", ",");
    ASSERT_EQ(f.size(), 3u);
    EXPECT_EQ(f[0], "a");
    EXPECT_EQ(f[1], "b");
    EXPECT_EQ(f[2], "c");
}

TEST(SplitFields, EmptyLineGivesOneEmptyField)
{
    auto f = split_fields("", ",");
    ASSERT_EQ(f.size(), 1u);
    EXPECT_TRUE(f[0].empty());
}

TEST(SplitFields, KeepsEmptyFields)
{
    auto f = split_fields("a,,b,", ",");
    ASSERT_EQ(f.size(), 4u);
    EXPECT_EQ(f[0], "a");
    EXPECT_EQ(f[1], "");
    EXPECT_EQ(f[2], "b");
    EXPECT_EQ(f[3], "");
}

TEST(SplitFields, MultiCharacterDelimiter)
{
    auto f = split_fields("1::2:3::", "::");
    ASSERT_EQ(f.size(), 3u);
    EXPECT_EQ(f[0], "1");
    EXPECT_EQ(f[1], "2:3");
    EXPECT_EQ(f[2], "");
}

TEST(SplitFields, NoQuoteAwareness)
{
    auto f = split_fields("\"a,b\",c", ",");
    ASSERT_EQ(f.size(), 3u);
    EXPECT_EQ(f[0], "\"a");
    EXPECT_EQ(f[1], "b\"");
}

TEST(SplitFields, TabDelimiter)
{
    auto f = split_fields("1\t2\t3", "\t");
    EXPECT_EQ(f.size(), 3u);
}

// ─── drop_trailing_empty ─────────────────────────────────────────────────────

TEST(DropTrailingEmpty, DropsOnlyOne)
{
    std::vector<std::string> f = {"1", "", ""};
    EXPECT_TRUE(drop_trailing_empty(f));
    EXPECT_EQ(f.size(), 2u);
    EXPECT_TRUE(drop_trailing_empty(f));
    EXPECT_EQ(f.size(), 1u);
    EXPECT_FALSE(drop_trailing_empty(f));
    EXPECT_EQ(f.size(), 1u);
}

TEST(DropTrailingEmpty, EmptyVector)
{
    std::vector<std::string> f;
    EXPECT_FALSE(drop_trailing_empty(f));
}

// ─── strip_quotes ────────────────────────────────────────────────────────────

TEST(StripQuotes, SurroundingPair)
{
    EXPECT_EQ(strip_quotes("\"x\""), "x");
}

TEST(StripQuotes, UnquotedUnchanged)
{
    EXPECT_EQ(strip_quotes("x"), "x");
    EXPECT_EQ(strip_quotes(""), "");
}

TEST(StripQuotes, OneSideOnly)
{
    EXPECT_EQ(strip_quotes("\"x"), "x");
    EXPECT_EQ(strip_quotes("x\""), "x");
}

TEST(StripQuotes, AtMostOneEachSide)
{
    EXPECT_EQ(strip_quotes("\"\"x\"\""), "\"x\"");
    EXPECT_EQ(strip_quotes("\"\""), "");
    EXPECT_EQ(strip_quotes("\""), "");
}

TEST(StripQuotes, InnerQuotesKept)
{
    EXPECT_EQ(strip_quotes("a\"b"), "a\"b");
}

// ─── parse_double ────────────────────────────────────────────────────────────

TEST(ParseDouble, Decimal)
{
    EXPECT_DOUBLE_EQ(*parse_double("1"), 1.0);
    EXPECT_DOUBLE_EQ(*parse_double("-2.5"), -2.5);
    EXPECT_DOUBLE_EQ(*parse_double("+4"), 4.0);
    EXPECT_DOUBLE_EQ(*parse_double(".5"), 0.5);
    EXPECT_DOUBLE_EQ(*parse_double("5."), 5.0);
    EXPECT_DOUBLE_EQ(*parse_double("007"), 7.0);
}

TEST(ParseDouble, Scientific)
{
    EXPECT_DOUBLE_EQ(*parse_double("1e-3"), 0.001);
    EXPECT_DOUBLE_EQ(*parse_double("1E+3"), 1000.0);
    EXPECT_DOUBLE_EQ(*parse_double("-6.02e23"), -6.02e23);
}

TEST(ParseDouble, SpecialValues)
{
    auto inf = parse_double("inf");
    ASSERT_TRUE(inf.has_value());
    EXPECT_TRUE(std::isinf(*inf));
    EXPECT_GT(*inf, 0.0);

    auto ninf = parse_double("-Infinity");
    ASSERT_TRUE(ninf.has_value());
    EXPECT_TRUE(std::isinf(*ninf));
    EXPECT_LT(*ninf, 0.0);

    auto nan = parse_double("NaN");
    ASSERT_TRUE(nan.has_value());
    EXPECT_TRUE(std::isnan(*nan));
}

TEST(ParseDouble, RejectsMalformed)
{
    EXPECT_FALSE(parse_double("").has_value());
    EXPECT_FALSE(parse_double("+").has_value());
    EXPECT_FALSE(parse_double("abc").has_value());
    EXPECT_FALSE(parse_double("1,5").has_value());
    EXPECT_FALSE(parse_double("1.2.3").has_value());
    EXPECT_FALSE(parse_double("++1").has_value());
    EXPECT_FALSE(parse_double("+-1").has_value());
    EXPECT_FALSE(parse_double("0x10").has_value());
    EXPECT_FALSE(parse_double("\"1\"").has_value());
}

TEST(ParseDouble, RejectsWhitespace)
{
    EXPECT_FALSE(parse_double(" 1").has_value());
    EXPECT_FALSE(parse_double("1 ").has_value());
}

TEST(ParseDouble, RejectsOverflow)
{
    EXPECT_FALSE(parse_double("1e400").has_value());
    EXPECT_FALSE(parse_double("-1e400").has_value());
}

TEST(ParseDouble, UnderflowIsZero)
{
    auto tiny = parse_double("1e-400");
    ASSERT_TRUE(tiny.has_value());
    EXPECT_EQ(*tiny, 0.0);
    EXPECT_FALSE(std::signbit(*tiny));

    auto neg = parse_double("-2.5e-999");
    ASSERT_TRUE(neg.has_value());
    EXPECT_EQ(*neg, 0.0);
    EXPECT_TRUE(std::signbit(*neg));

    auto leading_zeros = parse_double("0.0001e-399");
    ASSERT_TRUE(leading_zeros.has_value());
    EXPECT_EQ(*leading_zeros, 0.0);
}

TEST(ParseDouble, SubnormalKept)
{
    auto v = parse_double("4e-320");
    ASSERT_TRUE(v.has_value());
    EXPECT_GT(*v, 0.0);
}

TEST(ParseDouble, LargeMantissaWithSmallExponentOverflows)
{
    EXPECT_FALSE(parse_double("1000e306").has_value());
    EXPECT_FALSE(parse_double("1e99999999999999999999").has_value());
}

TEST(ParseDouble, RejectsNanPayload)
{
    EXPECT_FALSE(parse_double("nan(abc)").has_value());
    EXPECT_FALSE(parse_double("NaN(123)").has_value());
    EXPECT_FALSE(parse_double("-nan()").has_value());
}
