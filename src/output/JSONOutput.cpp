#include "trianglecheck/core/Version.h"
#include "trianglecheck/output/OutputFormatter.h"

#include <cstdio>
#include <sstream>

namespace trianglecheck {

namespace {

std::string escape(const std::string &s) {
    std::string out;
    out.reserve(s.size() + 8);
    for (char c : s) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n";  break;
            case '\r': out += "\\r";  break;
            case '\t': out += "\\t";  break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    snprintf(buf, sizeof(buf), "\\u%04x",
                             static_cast<unsigned>(static_cast<unsigned char>(c)));
                    out += buf;
                } else {
                    out += c;
                }
                break;
        }
    }
    return out;
}

void writeVerdicts(std::ostringstream &os, const std::vector<Verdict> &verdicts,
                   bool more) {
    os << "  \"verdicts\": [\n";

    for (size_t i = 0; i < verdicts.size(); ++i) {
        const auto &v = verdicts[i];
        const auto &c = v.candidate;
        os << "    {\n";
        if (!c.label.empty())
            os << "      \"name\": \"" << escape(c.label) << "\",\n";
        if (c.location.line != 0) {
            os << "      \"location\": {\n";
            os << "        \"file\": \"" << escape(c.location.file) << "\",\n";
            os << "        \"line\": " << c.location.line << ",\n";
            os << "        \"column\": " << c.location.column << "\n";
            os << "      },\n";
        }

        os << "      \"sides\": [";
        for (size_t j = 0; j < c.sides.size(); ++j) {
            os << "{\"value\": \"" << escape(c.sides[j].spelling())
               << "\", \"type\": \"" << escape(c.sides[j].typeName()) << "\"}";
            if (j + 1 < c.sides.size()) os << ", ";
        }
        os << "],\n";

        os << "      \"outcome\": \"" << outcomeName(v.outcome) << "\"";
        if (!v.message.empty())
            os << ",\n      \"message\": \"" << escape(v.message) << "\"";
        os << "\n    }";
        if (i + 1 < verdicts.size()) os << ",";
        os << "\n";
    }

    os << "  ]" << (more ? "," : "") << "\n";
}

void writeSummary(std::ostringstream &os, const std::vector<Verdict> &verdicts) {
    Summary s = summarize(verdicts);
    os << "  \"summary\": {\n";
    os << "    \"total\": " << s.total << ",\n";
    os << "    \"triangles\": " << s.triangles << ",\n";
    os << "    \"nonTriangles\": " << s.nonTriangles << ",\n";
    os << "    \"invalidType\": " << s.invalidType << ",\n";
    os << "    \"invalidValue\": " << s.invalidValue << "\n";
    os << "  }\n";
}

} // anonymous namespace

std::string JSONOutputFormatter::format(const std::vector<Verdict> &verdicts) {
    ExecutionMetadata meta;
    meta.toolVersion = kToolVersion;
    return format(verdicts, meta);
}

std::string JSONOutputFormatter::format(const std::vector<Verdict> &verdicts,
                                        const ExecutionMetadata &meta) {
    std::ostringstream os;
    os << "{\n";
    os << "  \"version\": \"" << escape(meta.toolVersion) << "\",\n";

    os << "  \"metadata\": {\n";
    os << "    \"configPath\": \"" << escape(meta.configPath) << "\",\n";
    os << "    \"inputSources\": [";
    for (size_t i = 0; i < meta.inputSources.size(); ++i) {
        os << "\"" << escape(meta.inputSources[i]) << "\"";
        if (i + 1 < meta.inputSources.size()) os << ", ";
    }
    os << "]\n";
    os << "  },\n";

    writeVerdicts(os, verdicts, showSummary_);
    if (showSummary_)
        writeSummary(os, verdicts);

    os << "}\n";
    return os.str();
}

} // namespace trianglecheck
