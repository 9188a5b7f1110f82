#include "trianglecheck/core/ValidationError.h"

namespace trianglecheck {

char ValidationError::ID = 0;

ValidationError::ValidationError(ValidationErrorKind kind, unsigned sideIndex)
    : kind_(kind), sideIndex_(sideIndex) {}

std::string ValidationError::reason() const {
    std::string msg;
    switch (kind_) {
        case ValidationErrorKind::InvalidType:
            msg = "all sides must be numeric (integer or floating-point)";
            break;
        case ValidationErrorKind::InvalidValue:
            msg = "all sides must be positive numbers";
            break;
    }
    msg += " (side ";
    msg += sideName(sideIndex_);
    msg += ")";
    return msg;
}

void ValidationError::log(llvm::raw_ostream &os) const {
    os << validationErrorKindName(kind_) << ": " << reason();
}

std::error_code ValidationError::convertToErrorCode() const {
    return std::make_error_code(std::errc::invalid_argument);
}

} // namespace trianglecheck
