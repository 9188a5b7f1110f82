#pragma once

#include "trianglecheck/core/Candidate.h"

#include <llvm/ADT/ArrayRef.h>
#include <llvm/ADT/StringRef.h>
#include <llvm/Support/Error.h>

#include <string>
#include <vector>

namespace trianglecheck {

// Builds a candidate from exactly three command-line tokens.
llvm::Expected<Candidate> candidateFromArgs(llvm::ArrayRef<std::string> tokens);

// Parses a batch document. Accepted shapes:
//
//   candidates:              # or a bare top-level sequence
//     - [3, 4, 5]
//     - name: degenerate
//       sides: [1, 2, 3]
//
// Side values keep their YAML type, so `"3"`, `~`, `[]` and `{}` become
// non-numeric sides. Structural problems are load errors carrying
// `bufferName:line`.
llvm::Expected<std::vector<Candidate>>
loadCandidatesFromBuffer(llvm::StringRef yaml, llvm::StringRef bufferName);

// Reads a batch file; "-" reads stdin.
llvm::Expected<std::vector<Candidate>>
loadCandidatesFromFile(const std::string &path);

// The demonstration set: (3, 4, 5), (5, 5, 5), (1, 2, 5), (1, 2, 3).
std::vector<Candidate> exampleCandidates();

} // namespace trianglecheck
