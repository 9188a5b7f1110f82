#include "trianglecheck/core/Config.h"

#include <llvm/Support/MemoryBuffer.h>
#include <llvm/Support/YAMLParser.h>
#include <llvm/Support/YAMLTraits.h>
#include <llvm/Support/raw_ostream.h>

namespace llvm {
namespace yaml {

template <>
struct MappingTraits<trianglecheck::Config> {
    static void mapping(IO &io, trianglecheck::Config &cfg) {
        io.mapOptional("json_output",           cfg.jsonOutput);
        io.mapOptional("output_file",           cfg.outputFile);
        io.mapOptional("show_summary",          cfg.showSummary);
        io.mapOptional("fail_on_invalid_input", cfg.failOnInvalidInput);
        io.mapOptional("fail_on_non_triangle",  cfg.failOnNonTriangle);
    }
};

} // namespace yaml
} // namespace llvm

namespace trianglecheck {

Config Config::defaults() {
    return Config{};
}

Config Config::loadFromFile(const std::string &path) {
    auto bufOrErr = llvm::MemoryBuffer::getFile(path);
    if (!bufOrErr) {
        llvm::errs() << "trianglecheck: warning: cannot open config '"
                     << path << "', using defaults\n";
        return defaults();
    }

    Config cfg = defaults();
    llvm::yaml::Input yin(bufOrErr.get()->getBuffer());
    yin >> cfg;

    if (yin.error()) {
        llvm::errs() << "trianglecheck: warning: config parse error in '"
                     << path << "', using defaults\n";
        return defaults();
    }

    return cfg;
}

} // namespace trianglecheck
