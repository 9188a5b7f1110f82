#include "trianglecheck/core/Config.h"
#include "trianglecheck/core/ExecutionMetadata.h"
#include "trianglecheck/core/Verdict.h"
#include "trianglecheck/core/Version.h"
#include "trianglecheck/input/CandidateLoader.h"
#include "trianglecheck/output/OutputFormatter.h"

#include <llvm/Support/CommandLine.h>
#include <llvm/Support/FileSystem.h>
#include <llvm/Support/raw_ostream.h>

#include <algorithm>
#include <memory>
#include <string>
#include <vector>

static llvm::cl::OptionCategory TriangleCat("trianglecheck options");

static llvm::cl::list<std::string> Sides(
    llvm::cl::Positional,
    llvm::cl::desc("<a> <b> <c> (put -- before negative sides)"),
    llvm::cl::cat(TriangleCat));

static llvm::cl::opt<std::string> InputPath(
    "input",
    llvm::cl::desc("YAML batch file of candidates ('-' for stdin)"),
    llvm::cl::value_desc("file"),
    llvm::cl::cat(TriangleCat));

static llvm::cl::opt<bool> Examples(
    "examples",
    llvm::cl::desc("Evaluate the built-in example candidates"),
    llvm::cl::cat(TriangleCat));

static llvm::cl::opt<std::string> ConfigPath(
    "config",
    llvm::cl::desc("Path to trianglecheck.config.yaml"),
    llvm::cl::value_desc("file"),
    llvm::cl::cat(TriangleCat));

static llvm::cl::opt<std::string> OutputFormat(
    "format",
    llvm::cl::desc("Output format (cli|json)"),
    llvm::cl::init("cli"),
    llvm::cl::cat(TriangleCat));

static llvm::cl::opt<std::string> OutputFile(
    "output",
    llvm::cl::desc("Write output to file instead of stdout"),
    llvm::cl::value_desc("file"),
    llvm::cl::cat(TriangleCat));

static llvm::cl::opt<bool> NoSummary(
    "no-summary",
    llvm::cl::desc("Omit the summary line / object"),
    llvm::cl::cat(TriangleCat));

static llvm::cl::opt<bool> FailOnNonTriangle(
    "fail-on-non-triangle",
    llvm::cl::desc("Exit with status 1 when any candidate forms no triangle"),
    llvm::cl::cat(TriangleCat));

int main(int argc, const char **argv) {
    llvm::cl::HideUnrelatedOptions(TriangleCat);
    llvm::cl::SetVersionPrinter([](llvm::raw_ostream &os) {
        os << "trianglecheck " << trianglecheck::kToolVersion << "\n";
    });
    if (!llvm::cl::ParseCommandLineOptions(
            argc, argv, "Triangle inequality checker\n", &llvm::errs()))
        return 2;

    // Load config.
    trianglecheck::Config cfg = ConfigPath.empty()
        ? trianglecheck::Config::defaults()
        : trianglecheck::Config::loadFromFile(ConfigPath);

    // CLI overrides.
    if (OutputFormat != "cli" && OutputFormat != "json") {
        llvm::errs() << "trianglecheck: error: unknown format '"
                     << OutputFormat << "' (expected cli or json)\n";
        return 2;
    }
    if (OutputFormat.getNumOccurrences() > 0)
        cfg.jsonOutput = OutputFormat == "json";
    if (!OutputFile.empty())
        cfg.outputFile = OutputFile;
    if (NoSummary)
        cfg.showSummary = false;
    if (FailOnNonTriangle)
        cfg.failOnNonTriangle = true;

    trianglecheck::ExecutionMetadata execMeta;
    execMeta.toolVersion = trianglecheck::kToolVersion;
    execMeta.configPath = ConfigPath.getValue();

    // Gather candidates: examples, then the batch file, then positionals.
    std::vector<trianglecheck::Candidate> candidates;

    if (Examples) {
        auto examples = trianglecheck::exampleCandidates();
        candidates.insert(candidates.end(), examples.begin(), examples.end());
        execMeta.inputSources.push_back("examples");
    }

    if (!InputPath.empty()) {
        auto loaded = trianglecheck::loadCandidatesFromFile(InputPath);
        if (!loaded) {
            llvm::errs() << "trianglecheck: error: "
                         << llvm::toString(loaded.takeError()) << "\n";
            return 2;
        }
        if (loaded->empty())
            llvm::errs() << "trianglecheck: warning: no candidates in '"
                         << InputPath << "'\n";
        candidates.insert(candidates.end(), loaded->begin(), loaded->end());
        execMeta.inputSources.push_back(InputPath);
    }

    if (!Sides.empty()) {
        std::vector<std::string> tokens(Sides.begin(), Sides.end());
        auto candidate = trianglecheck::candidateFromArgs(tokens);
        if (!candidate) {
            llvm::errs() << "trianglecheck: error: "
                         << llvm::toString(candidate.takeError()) << "\n";
            return 2;
        }
        candidates.push_back(std::move(*candidate));
        execMeta.inputSources.push_back("args");
    }

    if (execMeta.inputSources.empty()) {
        llvm::errs() << "trianglecheck: error: nothing to evaluate; pass "
                        "<a> <b> <c>, --input=<file> or --examples\n";
        return 2;
    }

    auto verdicts = trianglecheck::evaluateAll(candidates);
    if (!verdicts) {
        llvm::errs() << "trianglecheck: error: "
                     << llvm::toString(verdicts.takeError()) << "\n";
        return 2;
    }

    // Format output.
    std::unique_ptr<trianglecheck::OutputFormatter> formatter;
    if (cfg.jsonOutput)
        formatter = std::make_unique<trianglecheck::JSONOutputFormatter>(
            cfg.showSummary);
    else
        formatter = std::make_unique<trianglecheck::CLIOutputFormatter>(
            cfg.showSummary);

    std::string output = formatter->format(*verdicts, execMeta);

    // Emit.
    if (cfg.outputFile.empty()) {
        llvm::outs() << output;
    } else {
        std::error_code EC;
        llvm::raw_fd_ostream file(cfg.outputFile, EC, llvm::sys::fs::OF_Text);
        if (EC) {
            llvm::errs() << "trianglecheck: error: cannot open output file '"
                         << cfg.outputFile << "': " << EC.message() << "\n";
            return 2;
        }
        file << output;
    }

    auto failed = [&](const trianglecheck::Verdict &v) {
        if (trianglecheck::isRejection(v.outcome))
            return cfg.failOnInvalidInput;
        return v.outcome == trianglecheck::Outcome::NotTriangle &&
               cfg.failOnNonTriangle;
    };
    return std::any_of(verdicts->begin(), verdicts->end(), failed) ? 1 : 0;
}
