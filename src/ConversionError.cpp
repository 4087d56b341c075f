#include "dat_toolkit/ConversionError.hpp"

namespace dat_toolkit {

const char* toString(ErrorKind kind)
{
    switch (kind) {
    case ErrorKind::UnreadableSource:      return "unreadable source";
    case ErrorKind::UnknownVariant:        return "unknown variant";
    case ErrorKind::MalformedInput:        return "malformed input";
    case ErrorKind::BackupFailed:          return "backup failed";
    case ErrorKind::UnwritableDestination: return "unwritable destination";
    case ErrorKind::UnwritableLog:         return "unwritable log";
    }
    return "unknown error";
}

} // namespace dat_toolkit
