#include <model/errors.hpp>

namespace FemCanon {

const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::MandatoryFieldMissing: return "MandatoryFieldMissing";
        case ErrorKind::OptionalFieldMissing:  return "OptionalFieldMissing";
        case ErrorKind::TextDecodeError:       return "TextDecodeError";
        case ErrorKind::SourceLoadFailure:     return "SourceLoadFailure";
        case ErrorKind::UnsupportedVariant:    return "UnsupportedVariant";
        case ErrorKind::InvalidFieldValue:     return "InvalidFieldValue";
        case ErrorKind::DuplicateGroupName:    return "DuplicateGroupName";
        case ErrorKind::StoreWriteFailure:     return "StoreWriteFailure";
    }
    return "Unknown";
}

} // namespace FemCanon
