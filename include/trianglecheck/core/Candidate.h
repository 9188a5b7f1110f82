#pragma once

#include "trianglecheck/core/SideValue.h"

#include <array>
#include <string>

namespace trianglecheck {

struct SourceLocation {
    std::string file;
    unsigned line   = 0; // 0 = not read from a file
    unsigned column = 0;
};

struct Candidate {
    std::string              label;    // Optional, from a batch file `name:`
    std::array<SideValue, 3> sides;
    SourceLocation           location;
};

} // namespace trianglecheck
