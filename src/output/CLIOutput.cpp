#include "trianglecheck/output/OutputFormatter.h"

#include <sstream>

namespace trianglecheck {

std::string formatSides(const Candidate &candidate) {
    std::string out;
    for (size_t i = 0; i < candidate.sides.size(); ++i) {
        if (i)
            out += ", ";
        out += candidate.sides[i].spelling();
    }
    return out;
}

std::string CLIOutputFormatter::format(const std::vector<Verdict> &verdicts) {
    std::ostringstream os;

    for (const auto &v : verdicts) {
        const auto &c = v.candidate;
        if (c.location.line != 0)
            os << c.location.file << ":" << c.location.line << ": ";
        if (!c.label.empty())
            os << c.label << " ";

        os << "(" << formatSides(c) << "): " << outcomeName(v.outcome);
        if (!v.message.empty())
            os << ": " << v.message;
        os << "\n";
    }

    if (!showSummary_)
        return os.str();

    Summary s = summarize(verdicts);
    if (s.total == 0) {
        os << "trianglecheck: no candidates evaluated.\n";
        return os.str();
    }

    os << "\ntrianglecheck: " << s.total << " candidate(s): "
       << s.triangles << " triangle(s), "
       << s.nonTriangles << " non-triangle(s), "
       << s.rejected() << " rejected";
    if (s.rejected() > 0)
        os << " (" << s.invalidType << " InvalidType, "
           << s.invalidValue << " InvalidValue)";
    os << ".\n";

    return os.str();
}

} // namespace trianglecheck
