#pragma once

#include <llvm/Support/Error.h>
#include <llvm/Support/raw_ostream.h>

#include <cstdint>
#include <string>
#include <string_view>
#include <system_error>

namespace trianglecheck {

enum class ValidationErrorKind : uint8_t {
    InvalidType,  // A side is not an integer or floating-point value
    InvalidValue, // A side is zero, negative or NaN
};

constexpr std::string_view validationErrorKindName(ValidationErrorKind k) {
    switch (k) {
        case ValidationErrorKind::InvalidType:  return "InvalidType";
        case ValidationErrorKind::InvalidValue: return "InvalidValue";
    }
    return "Unknown";
}

// Name of the side at position `index` in a candidate (a, b, c).
constexpr char sideName(unsigned index) {
    return index < 3 ? static_cast<char>('a' + index) : '?';
}

class ValidationError : public llvm::ErrorInfo<ValidationError> {
public:
    static char ID;

    ValidationError(ValidationErrorKind kind, unsigned sideIndex);

    ValidationErrorKind kind() const { return kind_; }
    unsigned sideIndex() const { return sideIndex_; }

    // Human-readable reason, without the kind prefix. message() and
    // llvm::toString() go through log() and carry the kind name.
    std::string reason() const;

    void log(llvm::raw_ostream &os) const override;
    std::error_code convertToErrorCode() const override;

private:
    ValidationErrorKind kind_;
    unsigned sideIndex_;
};

} // namespace trianglecheck
