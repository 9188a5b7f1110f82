#pragma once

#include "trianglecheck/core/ExecutionMetadata.h"
#include "trianglecheck/core/Verdict.h"

#include <string>
#include <vector>

namespace trianglecheck {

class OutputFormatter {
public:
    explicit OutputFormatter(bool showSummary = true)
        : showSummary_(showSummary) {}
    virtual ~OutputFormatter() = default;

    virtual std::string format(const std::vector<Verdict> &verdicts) = 0;
    virtual std::string format(const std::vector<Verdict> &verdicts,
                               const ExecutionMetadata & /*meta*/) {
        return format(verdicts);
    }

protected:
    bool showSummary_;
};

class CLIOutputFormatter : public OutputFormatter {
public:
    using OutputFormatter::OutputFormatter;
    using OutputFormatter::format;
    std::string format(const std::vector<Verdict> &verdicts) override;
};

class JSONOutputFormatter : public OutputFormatter {
public:
    using OutputFormatter::OutputFormatter;
    std::string format(const std::vector<Verdict> &verdicts) override;
    std::string format(const std::vector<Verdict> &verdicts,
                       const ExecutionMetadata &meta) override;
};

// "3, 4, 5" using each side's spelling.
std::string formatSides(const Candidate &candidate);

} // namespace trianglecheck
