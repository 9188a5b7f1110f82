#include "trianglecheck/core/Version.h"
#include "trianglecheck/input/CandidateLoader.h"
#include "trianglecheck/output/OutputFormatter.h"

#include <gtest/gtest.h>

using namespace trianglecheck;

namespace {

std::vector<Verdict> verdictsFor(const char *yaml) {
    auto cands = loadCandidatesFromBuffer(yaml, "cases.yaml");
    if (!cands) {
        ADD_FAILURE() << llvm::toString(cands.takeError());
        return {};
    }
    auto verdicts = evaluateAll(*cands);
    if (!verdicts) {
        ADD_FAILURE() << llvm::toString(verdicts.takeError());
        return {};
    }
    return std::move(*verdicts);
}

bool contains(const std::string &haystack, const std::string &needle) {
    return haystack.find(needle) != std::string::npos;
}

const char *kCases = "candidates:\n"
                     "  - name: right\n"
                     "    sides: [3, 4, 5]\n"
                     "  - [1, 2, 3]\n"
                     "  - [\"3\", 4, 5]\n"
                     "  - [0, 2, 3]\n";

} // anonymous namespace

TEST(CLIOutput, OneLinePerVerdictAndSummary) {
    CLIOutputFormatter fmt;
    std::string out = fmt.format(verdictsFor(kCases));

    EXPECT_TRUE(contains(out, "cases.yaml:2: right (3, 4, 5): triangle\n")) << out;
    EXPECT_TRUE(contains(out, "cases.yaml:4: (1, 2, 3): not-triangle\n")) << out;
    EXPECT_TRUE(contains(out, "(\"3\", 4, 5): InvalidType: all sides must be "
                              "numeric (integer or floating-point) (side a)\n"))
        << out;
    EXPECT_TRUE(contains(out, "(0, 2, 3): InvalidValue: all sides must be "
                              "positive numbers (side a)\n"))
        << out;
    EXPECT_TRUE(contains(out, "trianglecheck: 4 candidate(s): 1 triangle(s), "
                              "1 non-triangle(s), 2 rejected "
                              "(1 InvalidType, 1 InvalidValue).\n"))
        << out;
}

TEST(CLIOutput, ArgumentCandidatesHaveNoLocation) {
    std::vector<std::string> tokens = {"3", "4", "5"};
    auto c = candidateFromArgs(tokens);
    ASSERT_TRUE(static_cast<bool>(c)) << llvm::toString(c.takeError());
    auto verdicts = evaluateAll({*c});
    ASSERT_TRUE(static_cast<bool>(verdicts)) << llvm::toString(verdicts.takeError());

    CLIOutputFormatter fmt(/*showSummary=*/false);
    EXPECT_EQ(fmt.format(*verdicts), "(3, 4, 5): triangle\n");
}

TEST(CLIOutput, EmptyRun) {
    CLIOutputFormatter fmt;
    EXPECT_EQ(fmt.format(std::vector<Verdict>{}),
              "trianglecheck: no candidates evaluated.\n");
}

TEST(JSONOutput, VerdictsMetadataAndSummary) {
    ExecutionMetadata meta;
    meta.toolVersion = kToolVersion;
    meta.configPath = "trianglecheck.config.yaml";
    meta.inputSources = {"cases.yaml"};

    JSONOutputFormatter fmt;
    std::string out = fmt.format(verdictsFor(kCases), meta);

    EXPECT_TRUE(contains(out, std::string("\"version\": \"") + kToolVersion + "\""));
    EXPECT_TRUE(contains(out, "\"configPath\": \"trianglecheck.config.yaml\""));
    EXPECT_TRUE(contains(out, "\"inputSources\": [\"cases.yaml\"]"));
    EXPECT_TRUE(contains(out, "\"name\": \"right\""));
    EXPECT_TRUE(contains(out, "\"line\": 2"));
    EXPECT_TRUE(contains(out, "{\"value\": \"\\\"3\\\"\", \"type\": \"string\"}"))
        << out;
    EXPECT_TRUE(contains(out, "\"outcome\": \"InvalidType\""));
    EXPECT_TRUE(contains(out, "\"outcome\": \"not-triangle\""));
    EXPECT_TRUE(contains(out, "\"invalidValue\": 1"));
    EXPECT_EQ(out.substr(out.size() - 6), "  }\n}\n");
}

TEST(JSONOutput, WithoutSummaryTheArrayClosesTheObject) {
    JSONOutputFormatter fmt(/*showSummary=*/false);
    std::string out = fmt.format(verdictsFor("- [3, 4, 5]\n"));
    EXPECT_FALSE(contains(out, "\"summary\""));
    EXPECT_EQ(out.substr(out.size() - 6), "  ]\n}\n");
}

TEST(FormatSides, UsesSourceSpelling) {
    Candidate c;
    c.sides = {SideValue::real(4.0, "4.0"), SideValue::integer(3),
               SideValue::nonNumeric("[...]", "sequence")};
    EXPECT_EQ(formatSides(c), "4.0, 3, [...]");
}
