#include "trianglecheck/core/SideValue.h"
#include "trianglecheck/core/TriangleValidator.h"
#include "trianglecheck/core/ValidationError.h"

#include <llvm/ADT/SmallString.h>
#include <llvm/ADT/StringSwitch.h>
#include <llvm/Support/Casting.h>
#include <llvm/Support/YAMLParser.h>

#include <limits>
#include <sstream>

namespace trianglecheck {

namespace {

template <typename T>
std::string spell(T v) {
    std::ostringstream os;
    os << v;
    return os.str();
}

enum class PlainScalar { Null, Boolean, PosInf, NegInf, NaN, Other };

// YAML core-schema spellings that are not plain decimal numbers.
PlainScalar classifyPlainScalar(llvm::StringRef value) {
    return llvm::StringSwitch<PlainScalar>(value)
        .Cases("null", "Null", "NULL", "~", PlainScalar::Null)
        .Cases("true", "True", "TRUE", PlainScalar::Boolean)
        .Cases("false", "False", "FALSE", PlainScalar::Boolean)
        .Cases(".inf", ".Inf", ".INF", PlainScalar::PosInf)
        .Cases("+.inf", "+.Inf", "+.INF", PlainScalar::PosInf)
        .Cases("-.inf", "-.Inf", "-.INF", PlainScalar::NegInf)
        .Cases(".nan", ".NaN", ".NAN", PlainScalar::NaN)
        .Default(PlainScalar::Other);
}

} // anonymous namespace

SideValue SideValue::integer(int64_t v, std::string spelling) {
    SideValue s;
    s.number_ = v;
    s.spelling_ = spelling.empty() ? spell(v) : std::move(spelling);
    s.typeName_ = "integer";
    return s;
}

SideValue SideValue::real(double v, std::string spelling) {
    SideValue s;
    s.number_ = v;
    s.spelling_ = spelling.empty() ? spell(v) : std::move(spelling);
    s.typeName_ = "real";
    return s;
}

SideValue SideValue::nonNumeric(std::string spelling, std::string typeName) {
    SideValue s;
    s.spelling_ = std::move(spelling);
    s.typeName_ = std::move(typeName);
    return s;
}

SideValue sideFromText(llvm::StringRef token) {
    int64_t i = 0;
    if (!token.getAsInteger(10, i))
        return SideValue::integer(i, token.str());

    double d = 0.0;
    if (!token.getAsDouble(d))
        return SideValue::real(d, token.str());

    return SideValue::nonNumeric(token.str(), "string");
}

SideValue sideFromYAML(llvm::yaml::Node *node) {
    using namespace llvm::yaml;

    if (!node || llvm::isa<NullNode>(node))
        return SideValue::nonNumeric("null", "null");

    if (auto *scalar = llvm::dyn_cast<ScalarNode>(node)) {
        llvm::StringRef raw = scalar->getRawValue();
        if (raw.startswith("\"") || raw.startswith("'"))
            return SideValue::nonNumeric(raw.str(), "string");

        llvm::SmallString<32> storage;
        llvm::StringRef value = scalar->getValue(storage);
        switch (classifyPlainScalar(value)) {
            case PlainScalar::Null:
                return SideValue::nonNumeric(value.str(), "null");
            case PlainScalar::Boolean:
                return SideValue::nonNumeric(value.str(), "boolean");
            case PlainScalar::PosInf:
                return SideValue::real(std::numeric_limits<double>::infinity(),
                                       value.str());
            case PlainScalar::NegInf:
                return SideValue::real(-std::numeric_limits<double>::infinity(),
                                       value.str());
            case PlainScalar::NaN:
                return SideValue::real(std::numeric_limits<double>::quiet_NaN(),
                                       value.str());
            case PlainScalar::Other:
                break;
        }
        return sideFromText(value);
    }

    if (auto *block = llvm::dyn_cast<BlockScalarNode>(node))
        return SideValue::nonNumeric(block->getValue().str(), "string");

    if (llvm::isa<SequenceNode>(node)) {
        node->skip();
        return SideValue::nonNumeric("[...]", "sequence");
    }

    if (llvm::isa<MappingNode>(node)) {
        node->skip();
        return SideValue::nonNumeric("{...}", "mapping");
    }

    node->skip();
    return SideValue::nonNumeric("*alias", "alias");
}

llvm::Expected<bool> evaluateSides(const SideValue &a, const SideValue &b,
                                   const SideValue &c) {
    const SideValue *sides[] = {&a, &b, &c};
    for (unsigned i = 0; i < 3; ++i) {
        if (!sides[i]->isNumeric())
            return llvm::make_error<ValidationError>(
                ValidationErrorKind::InvalidType, i);
    }

    return std::visit(
        [](auto x, auto y, auto z) { return canFormTriangle(x, y, z); },
        *a.number(), *b.number(), *c.number());
}

} // namespace trianglecheck
