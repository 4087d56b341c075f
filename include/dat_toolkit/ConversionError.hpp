#pragma once
#include <stdexcept>
#include <string>

namespace dat_toolkit {

enum class ErrorKind {
    UnreadableSource,
    UnknownVariant,
    MalformedInput,
    BackupFailed,
    UnwritableDestination,
    UnwritableLog
};

const char* toString(ErrorKind kind);

// Thrown by the codec and file helpers; ConversionWorker turns it into a failed outcome.
class ConversionError : public std::runtime_error {
public:
    ConversionError(ErrorKind kind, const std::string& what)
        : std::runtime_error(what), kind_(kind) {}

    ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

} // namespace dat_toolkit
