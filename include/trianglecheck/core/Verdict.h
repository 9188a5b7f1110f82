#pragma once

#include "trianglecheck/core/Candidate.h"

#include <llvm/Support/Error.h>

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace trianglecheck {

enum class Outcome : uint8_t {
    Triangle,
    NotTriangle,
    InvalidType,
    InvalidValue,
};

constexpr std::string_view outcomeName(Outcome o) {
    switch (o) {
        case Outcome::Triangle:     return "triangle";
        case Outcome::NotTriangle:  return "not-triangle";
        case Outcome::InvalidType:  return "InvalidType";
        case Outcome::InvalidValue: return "InvalidValue";
    }
    return "unknown";
}

constexpr bool isRejection(Outcome o) {
    return o == Outcome::InvalidType || o == Outcome::InvalidValue;
}

struct Verdict {
    Candidate   candidate;
    Outcome     outcome = Outcome::NotTriangle;
    std::string message; // Error reason for rejections, empty otherwise
};

struct Summary {
    size_t total        = 0;
    size_t triangles    = 0;
    size_t nonTriangles = 0;
    size_t invalidType  = 0;
    size_t invalidValue = 0;

    size_t rejected() const { return invalidType + invalidValue; }
};

// Folds a predicate result into an Outcome, consuming any error. A
// ValidationError maps to its kind and fills `message`; any other error is
// passed back to the caller.
llvm::Expected<Outcome> toOutcome(llvm::Expected<bool> result,
                                  std::string &message);

llvm::Expected<Verdict> evaluateCandidate(const Candidate &candidate);

// Verdicts in candidate order. Stops at the first error that is not a
// ValidationError.
llvm::Expected<std::vector<Verdict>>
evaluateAll(const std::vector<Candidate> &candidates);

Summary summarize(const std::vector<Verdict> &verdicts);

} // namespace trianglecheck
