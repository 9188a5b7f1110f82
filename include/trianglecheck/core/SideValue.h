#pragma once

#include <llvm/ADT/StringRef.h>
#include <llvm/Support/Error.h>

#include <cstdint>
#include <optional>
#include <string>
#include <variant>

namespace llvm {
namespace yaml {
class Node;
} // namespace yaml
} // namespace llvm

namespace trianglecheck {

using SideNumber = std::variant<int64_t, double>;

// A side length as read from text or YAML, before validation. Non-numeric
// values are kept so that the type check can reject them at evaluation time.
class SideValue {
public:
    SideValue() = default;

    static SideValue integer(int64_t v, std::string spelling = {});
    static SideValue real(double v, std::string spelling = {});
    static SideValue nonNumeric(std::string spelling, std::string typeName);

    bool isNumeric() const { return number_.has_value(); }
    const std::optional<SideNumber> &number() const { return number_; }

    // Source text of the value, or a synthesized spelling for numbers built
    // in code.
    const std::string &spelling() const { return spelling_; }

    // "integer", "real", or the kind of non-numeric value
    // ("string", "null", "boolean", "sequence", "mapping").
    const std::string &typeName() const { return typeName_; }

private:
    std::optional<SideNumber> number_;
    std::string spelling_;
    std::string typeName_ = "null";
};

// Classifies a command-line token.
SideValue sideFromText(llvm::StringRef token);

// Classifies a YAML node. Quoted scalars are always strings. Collections are
// consumed (skipped) so the caller can continue iterating the stream.
SideValue sideFromYAML(llvm::yaml::Node *node);

// Type check over all three sides first, then canFormTriangle() on their
// native numeric types.
llvm::Expected<bool> evaluateSides(const SideValue &a, const SideValue &b,
                                   const SideValue &c);

} // namespace trianglecheck
