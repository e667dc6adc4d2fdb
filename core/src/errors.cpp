// Turtle - Errors Implementation

#include <turtle/errors.h>

namespace turtle {

const char* errorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::InvalidColor:          return "InvalidColor";
        case ErrorKind::DomainRange:           return "DomainRange";
        case ErrorKind::IrreversibleOperation: return "IrreversibleOperation";
        case ErrorKind::NotImplemented:        return "NotImplemented";
        case ErrorKind::TypeMismatch:          return "TypeMismatch";
        case ErrorKind::Arity:                 return "Arity";
        case ErrorKind::UnknownCommand:        return "UnknownCommand";
    }
    return "Unknown";
}

} // namespace turtle
