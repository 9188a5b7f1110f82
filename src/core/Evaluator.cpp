#include "trianglecheck/core/Verdict.h"
#include "trianglecheck/core/ValidationError.h"

namespace trianglecheck {

llvm::Expected<Outcome> toOutcome(llvm::Expected<bool> result,
                                  std::string &message) {
    if (result)
        return *result ? Outcome::Triangle : Outcome::NotTriangle;

    Outcome outcome = Outcome::NotTriangle;
    llvm::Error rest = llvm::handleErrors(
        result.takeError(), [&](const ValidationError &E) {
            outcome = E.kind() == ValidationErrorKind::InvalidType
                          ? Outcome::InvalidType
                          : Outcome::InvalidValue;
            message = E.reason();
        });
    if (rest)
        return rest;
    return outcome;
}

llvm::Expected<Verdict> evaluateCandidate(const Candidate &candidate) {
    Verdict v;
    v.candidate = candidate;

    const auto &s = candidate.sides;
    auto outcome = toOutcome(evaluateSides(s[0], s[1], s[2]), v.message);
    if (!outcome)
        return outcome.takeError();
    v.outcome = *outcome;
    return v;
}

llvm::Expected<std::vector<Verdict>>
evaluateAll(const std::vector<Candidate> &candidates) {
    std::vector<Verdict> verdicts;
    verdicts.reserve(candidates.size());
    for (const auto &c : candidates) {
        auto v = evaluateCandidate(c);
        if (!v)
            return v.takeError();
        verdicts.push_back(std::move(*v));
    }
    return verdicts;
}

Summary summarize(const std::vector<Verdict> &verdicts) {
    Summary s;
    s.total = verdicts.size();
    for (const auto &v : verdicts) {
        switch (v.outcome) {
            case Outcome::Triangle:     ++s.triangles;    break;
            case Outcome::NotTriangle:  ++s.nonTriangles; break;
            case Outcome::InvalidType:  ++s.invalidType;  break;
            case Outcome::InvalidValue: ++s.invalidValue; break;
        }
    }
    return s;
}

} // namespace trianglecheck
