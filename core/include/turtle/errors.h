#pragma once

/**
 * @file errors.h
 * @brief Exception types raised by the turtle core and command table
 *
 * Every failure is reported as a TurtleError subclass. A failing operation
 * never leaves a Canvas partially modified.
 */

#include <stdexcept>
#include <string>

namespace turtle {

/// @brief Category of a TurtleError, for callers that switch on failures
enum class ErrorKind {
    InvalidColor,          ///< Token is neither a named color nor a hex color
    DomainRange,           ///< Numeric component outside its allowed range
    IrreversibleOperation, ///< Mutation attempted while the session is fragile
    NotImplemented,        ///< Reserved operation with no implementation
    TypeMismatch,          ///< Operand has the wrong type or is not finite
    Arity,                 ///< Wrong number of operands for a command
    UnknownCommand         ///< Command name not registered
};

/// @brief Human-readable name of an error kind ("InvalidColor", ...)
const char* errorKindName(ErrorKind kind);

/**
 * @brief Base class of all turtle errors
 */
class TurtleError : public std::runtime_error {
public:
    TurtleError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), m_kind(kind) {}

    ErrorKind kind() const { return m_kind; }

private:
    ErrorKind m_kind;
};

/**
 * @brief A color token failed validation
 *
 * Carries the token exactly as the caller supplied it.
 */
class InvalidColorError : public TurtleError {
public:
    explicit InvalidColorError(const std::string& token)
        : TurtleError(ErrorKind::InvalidColor,
                      "Expected a valid CSS or hex color code, received '" + token + "'.")
        , m_token(token) {}

    const std::string& token() const { return m_token; }

private:
    std::string m_token;
};

class DomainRangeError : public TurtleError {
public:
    explicit DomainRangeError(const std::string& message)
        : TurtleError(ErrorKind::DomainRange, message) {}
};

class IrreversibleOperationError : public TurtleError {
public:
    explicit IrreversibleOperationError(const std::string& operation)
        : TurtleError(ErrorKind::IrreversibleOperation,
                      "Cannot run '" + operation + "': the session is in fragile mode.")
        , m_operation(operation) {}

    /// @brief Name of the rejected operation
    const std::string& operation() const { return m_operation; }

private:
    std::string m_operation;
};

class NotImplementedError : public TurtleError {
public:
    explicit NotImplementedError(const std::string& what)
        : TurtleError(ErrorKind::NotImplemented, what + " not yet implemented") {}
};

class TypeMismatchError : public TurtleError {
public:
    explicit TypeMismatchError(const std::string& message)
        : TurtleError(ErrorKind::TypeMismatch, message) {}
};

class ArityError : public TurtleError {
public:
    explicit ArityError(const std::string& message)
        : TurtleError(ErrorKind::Arity, message) {}
};

class UnknownCommandError : public TurtleError {
public:
    explicit UnknownCommandError(const std::string& name)
        : TurtleError(ErrorKind::UnknownCommand, "Unknown command: " + name) {}
};

} // namespace turtle
