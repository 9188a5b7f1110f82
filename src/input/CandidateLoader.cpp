#include "trianglecheck/input/CandidateLoader.h"

#include <llvm/ADT/SmallString.h>
#include <llvm/ADT/Twine.h>
#include <llvm/Support/Casting.h>
#include <llvm/Support/MemoryBuffer.h>
#include <llvm/Support/SourceMgr.h>
#include <llvm/Support/YAMLParser.h>
#include <llvm/Support/raw_ostream.h>

#include <memory>
#include <system_error>

namespace trianglecheck {

namespace {

llvm::Error invalidInput(const llvm::Twine &msg) {
    return llvm::createStringError(
        std::make_error_code(std::errc::invalid_argument), msg);
}

// Keeps the first diagnostic the YAML scanner reports instead of printing it.
void captureDiagnostic(const llvm::SMDiagnostic &D, void *ctx) {
    auto *out = static_cast<std::string *>(ctx);
    if (!out->empty())
        return;
    llvm::raw_string_ostream os(*out);
    os << D.getLineNo() << ": " << D.getMessage();
}

class BatchParser {
public:
    BatchParser(llvm::StringRef yaml, llvm::StringRef bufferName)
        : bufferName_(bufferName.str()) {
        sm_.setDiagHandler(captureDiagnostic, &parseError_);
        stream_ = std::make_unique<llvm::yaml::Stream>(yaml, sm_);
    }

    llvm::Expected<std::vector<Candidate>> parse() {
        using namespace llvm::yaml;

        std::vector<Candidate> out;
        Node *root = stream_->begin()->getRoot();
        if (!root || llvm::isa<NullNode>(root))
            return finish(std::move(out));

        if (auto *seq = llvm::dyn_cast<SequenceNode>(root)) {
            if (auto err = parseList(seq, out))
                return err;
            return finish(std::move(out));
        }

        auto *map = llvm::dyn_cast<MappingNode>(root);
        if (!map)
            return fail(root, "expected a 'candidates' mapping or a sequence "
                              "of candidates");

        bool sawList = false;
        for (auto &kv : *map) {
            std::string key = scalarText(kv.getKey());
            if (key == "candidates") {
                auto *list = llvm::dyn_cast_or_null<SequenceNode>(kv.getValue());
                if (!list)
                    return fail(kv.getValue(), "'candidates' must be a sequence");
                if (auto err = parseList(list, out))
                    return err;
                sawList = true;
            } else {
                warnUnknownKey(kv.getKey(), key);
            }
        }

        if (!sawList && !stream_->failed())
            return fail(root, "missing 'candidates' key");
        return finish(std::move(out));
    }

private:
    llvm::Error parseList(llvm::yaml::SequenceNode *list,
                          std::vector<Candidate> &out) {
        for (auto &entry : *list) {
            auto c = parseCandidate(&entry);
            if (!c)
                return c.takeError();
            out.push_back(std::move(*c));
        }
        return llvm::Error::success();
    }

    llvm::Expected<Candidate> parseCandidate(llvm::yaml::Node *entry) {
        using namespace llvm::yaml;

        Candidate c;
        c.location = locate(entry);

        if (auto *sides = llvm::dyn_cast<SequenceNode>(entry)) {
            if (auto err = parseSides(sides, entry, c))
                return err;
            return c;
        }

        auto *map = llvm::dyn_cast<MappingNode>(entry);
        if (!map)
            return fail(entry, "a candidate must be a sequence of three sides "
                               "or a mapping with 'sides'");

        bool sawSides = false;
        for (auto &kv : *map) {
            std::string key = scalarText(kv.getKey());
            if (key == "name") {
                c.label = scalarText(kv.getValue());
            } else if (key == "sides") {
                auto *sides = llvm::dyn_cast_or_null<SequenceNode>(kv.getValue());
                if (!sides)
                    return fail(kv.getValue(), "'sides' must be a sequence");
                if (auto err = parseSides(sides, entry, c))
                    return err;
                sawSides = true;
            } else {
                warnUnknownKey(kv.getKey(), key);
            }
        }

        if (!sawSides)
            return fail(entry, "candidate has no 'sides'");
        return c;
    }

    llvm::Error parseSides(llvm::yaml::SequenceNode *sides,
                           llvm::yaml::Node *entry, Candidate &c) {
        unsigned count = 0;
        for (auto &side : *sides) {
            if (count < c.sides.size())
                c.sides[count] = sideFromYAML(&side);
            ++count;
        }
        if (count != c.sides.size())
            return fail(entry, "expected 3 sides, found " + llvm::Twine(count));
        return llvm::Error::success();
    }

    std::string scalarText(llvm::yaml::Node *node) {
        auto *scalar = llvm::dyn_cast_or_null<llvm::yaml::ScalarNode>(node);
        if (!scalar) {
            if (node)
                node->skip();
            return {};
        }
        llvm::SmallString<32> storage;
        return scalar->getValue(storage).str();
    }

    SourceLocation locate(llvm::yaml::Node *node) {
        SourceLocation loc;
        loc.file = bufferName_;
        if (node && node->getSourceRange().Start.isValid()) {
            auto lc = sm_.getLineAndColumn(node->getSourceRange().Start);
            loc.line = lc.first;
            loc.column = lc.second;
        }
        return loc;
    }

    void warnUnknownKey(llvm::yaml::Node *keyNode, const std::string &key) {
        llvm::errs() << "trianglecheck: warning: " << bufferName_ << ":"
                     << locate(keyNode).line << ": unknown key '" << key
                     << "', ignored\n";
    }

    // Scanner errors take precedence over structural ones, since the node
    // tree is unreliable after the scanner has failed.
    llvm::Error fail(llvm::yaml::Node *node, const llvm::Twine &msg) {
        if (stream_->failed())
            return invalidInput(bufferName_ + ":" + parseError_);
        return invalidInput(bufferName_ + ":" + llvm::Twine(locate(node).line) +
                            ": " + msg);
    }

    llvm::Expected<std::vector<Candidate>>
    finish(std::vector<Candidate> out) {
        if (stream_->failed())
            return invalidInput(bufferName_ + ":" + parseError_);
        return out;
    }

    std::string bufferName_;
    std::string parseError_;
    llvm::SourceMgr sm_;
    std::unique_ptr<llvm::yaml::Stream> stream_;
};

Candidate example(const char *label, int64_t a, int64_t b, int64_t c) {
    Candidate cand;
    cand.label = label;
    cand.sides = {SideValue::integer(a), SideValue::integer(b),
                  SideValue::integer(c)};
    return cand;
}

} // anonymous namespace

llvm::Expected<Candidate> candidateFromArgs(llvm::ArrayRef<std::string> tokens) {
    if (tokens.size() != 3)
        return invalidInput("expected three side lengths, got " +
                            llvm::Twine(static_cast<unsigned>(tokens.size())));

    Candidate c;
    for (size_t i = 0; i < tokens.size(); ++i)
        c.sides[i] = sideFromText(tokens[i]);
    return c;
}

llvm::Expected<std::vector<Candidate>>
loadCandidatesFromBuffer(llvm::StringRef yaml, llvm::StringRef bufferName) {
    BatchParser parser(yaml, bufferName);
    return parser.parse();
}

llvm::Expected<std::vector<Candidate>>
loadCandidatesFromFile(const std::string &path) {
    auto bufOrErr = llvm::MemoryBuffer::getFileOrSTDIN(path);
    if (!bufOrErr)
        return llvm::createStringError(bufOrErr.getError(),
                                       "cannot open '" + path + "': " +
                                           bufOrErr.getError().message());

    return loadCandidatesFromBuffer((*bufOrErr)->getBuffer(),
                                    path == "-" ? "<stdin>" : path);
}

std::vector<Candidate> exampleCandidates() {
    return {
        example("right", 3, 4, 5),
        example("equilateral", 5, 5, 5),
        example("too-short", 1, 2, 5),
        example("degenerate", 1, 2, 3),
    };
}

} // namespace trianglecheck
