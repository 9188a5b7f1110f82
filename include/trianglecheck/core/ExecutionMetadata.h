#pragma once

#include <string>
#include <vector>

namespace trianglecheck {

struct ExecutionMetadata {
    std::string toolVersion;
    std::string configPath;                 // empty = defaults
    std::vector<std::string> inputSources;  // "args", "examples", or a file path
};

} // namespace trianglecheck
