#pragma once

#include <stdexcept>
#include <string>

namespace FemCanon {

enum class ErrorKind {
    MandatoryFieldMissing,
    OptionalFieldMissing,
    TextDecodeError,
    SourceLoadFailure,
    UnsupportedVariant,
    InvalidFieldValue,
    DuplicateGroupName,
    StoreWriteFailure
};

const char* to_string(ErrorKind kind);

/**
 * @brief Fatal conversion failure.
 *
 * Thrown by every stage; the run aborts and nothing is written. The message
 * carries the source path of the offending field when there is one.
 */
class ConversionError : public std::runtime_error {
public:
    ConversionError(ErrorKind kind, const std::string& message)
        : std::runtime_error(std::string(to_string(kind)) + ": " + message), kind_(kind) {}

    ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

} // namespace FemCanon
