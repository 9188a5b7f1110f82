#include "trianglecheck/core/SideValue.h"

#include "TestSupport.h"

#include <gtest/gtest.h>

#include <cstdint>
#include <variant>

using namespace trianglecheck;
using trianglecheck::test::failingSide;
using trianglecheck::test::resultOf;

namespace {

SideValue text(const char *token) { return sideFromText(token); }

} // anonymous namespace

TEST(SideFromText, IntegerToken) {
    SideValue s = text("3");
    ASSERT_TRUE(s.isNumeric());
    ASSERT_TRUE(std::holds_alternative<int64_t>(*s.number()));
    EXPECT_EQ(std::get<int64_t>(*s.number()), 3);
    EXPECT_EQ(s.typeName(), "integer");
    EXPECT_EQ(s.spelling(), "3");
}

TEST(SideFromText, NegativeIntegerIsStillNumeric) {
    SideValue s = text("-1");
    ASSERT_TRUE(s.isNumeric());
    EXPECT_EQ(std::get<int64_t>(*s.number()), -1);
}

TEST(SideFromText, RealTokens) {
    SideValue s = text("2.5");
    ASSERT_TRUE(s.isNumeric());
    ASSERT_TRUE(std::holds_alternative<double>(*s.number()));
    EXPECT_DOUBLE_EQ(std::get<double>(*s.number()), 2.5);
    EXPECT_EQ(s.typeName(), "real");

    EXPECT_DOUBLE_EQ(std::get<double>(*text("1e3").number()), 1000.0);
}

TEST(SideFromText, IntegerOverflowFallsBackToReal) {
    SideValue s = text("99999999999999999999");
    ASSERT_TRUE(s.isNumeric());
    EXPECT_EQ(s.typeName(), "real");
}

TEST(SideFromText, NonNumericTokens) {
    for (const char *token : {"abc", "", "3x", " 3", "three"}) {
        SideValue s = text(token);
        EXPECT_FALSE(s.isNumeric()) << "'" << token << "'";
        EXPECT_EQ(s.typeName(), "string");
        EXPECT_EQ(s.spelling(), token);
    }
}

TEST(SideValue, SynthesizedSpellings) {
    EXPECT_EQ(SideValue::integer(42).spelling(), "42");
    EXPECT_EQ(SideValue::real(2.5).spelling(), "2.5");
    EXPECT_EQ(SideValue::real(4.0, "4.0").spelling(), "4.0");
    EXPECT_FALSE(SideValue().isNumeric());
    EXPECT_EQ(SideValue().typeName(), "null");
}

TEST(EvaluateSides, NumericTextSides) {
    EXPECT_EQ(resultOf(evaluateSides(text("3"), text("4"), text("5"))), "true");
    EXPECT_EQ(resultOf(evaluateSides(text("1"), text("2"), text("3"))), "false");
    EXPECT_EQ(resultOf(evaluateSides(text("1"), text("2"), text("2.5"))), "true");
    EXPECT_EQ(resultOf(evaluateSides(text("1"), text("2.0"), text("5"))), "false");
}

TEST(EvaluateSides, NonNumericSideIsInvalidType) {
    EXPECT_EQ(resultOf(evaluateSides(text("abc"), text("4"), text("5"))),
              "InvalidType");
    EXPECT_EQ(resultOf(evaluateSides(SideValue::integer(3),
                                     SideValue::nonNumeric("[]", "sequence"),
                                     SideValue::integer(5))),
              "InvalidType");
    EXPECT_EQ(resultOf(evaluateSides(SideValue::integer(3),
                                     SideValue::integer(4),
                                     SideValue::nonNumeric("{}", "mapping"))),
              "InvalidType");
    EXPECT_EQ(resultOf(evaluateSides(SideValue(), SideValue::integer(4),
                                     SideValue::integer(5))),
              "InvalidType");
}

TEST(EvaluateSides, TypeCheckPrecedesValueCheck) {
    EXPECT_EQ(resultOf(evaluateSides(text("-1"), text("x"), text("0"))),
              "InvalidType");
    EXPECT_EQ(failingSide(evaluateSides(text("-1"), text("x"), text("0"))), 1);
    EXPECT_EQ(failingSide(evaluateSides(text("3"), text("-4"), text("y"))), 2);
}

TEST(EvaluateSides, NonPositiveNumericSideIsInvalidValue) {
    EXPECT_EQ(resultOf(evaluateSides(text("-1"), text("2"), text("3"))),
              "InvalidValue");
    EXPECT_EQ(resultOf(evaluateSides(text("1"), text("0.0"), text("3"))),
              "InvalidValue");
}

TEST(EvaluateSides, InvalidTypeMessageMentionsNumeric) {
    auto result = evaluateSides(text("3"), text("four"), text("5"));
    ASSERT_FALSE(static_cast<bool>(result));
    std::string msg = llvm::toString(result.takeError());
    EXPECT_NE(msg.find("InvalidType"), std::string::npos);
    EXPECT_NE(msg.find("numeric"), std::string::npos);
    EXPECT_NE(msg.find("side b"), std::string::npos);
}
