#pragma once

#include <string>

namespace trianglecheck {

struct Config {
    // Output
    bool jsonOutput          = false;
    std::string outputFile;             // empty = stdout
    bool showSummary         = true;

    // Exit status: which outcomes make the run fail
    bool failOnInvalidInput  = true;    // InvalidType / InvalidValue
    bool failOnNonTriangle   = false;

    static Config loadFromFile(const std::string &path);
    static Config defaults();
};

} // namespace trianglecheck
