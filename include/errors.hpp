/**
 * errors.hpp
 *
 * Exception types thrown by the assembler and simulator components.
 * Every class carries an ErrorKind so callers that collect errors into
 * result structs (Assembler::Result, StepResult) can keep the kind.
 */

#ifndef ERRORS_HPP
#define ERRORS_HPP

#include <stdexcept>
#include <string>

enum class ErrorKind {
    NONE,
    UNKNOWN_OPCODE,
    DUPLICATE_LABEL,
    UNDEFINED_LABEL,
    RANGE,
    SYNTAX,
    PC_OUT_OF_BOUNDS,
    MEMORY_OUT_OF_BOUNDS,
    FORMAT,
    IO
};

inline std::string error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NONE:                 return "none";
        case ErrorKind::UNKNOWN_OPCODE:       return "unknown opcode";
        case ErrorKind::DUPLICATE_LABEL:      return "duplicate label";
        case ErrorKind::UNDEFINED_LABEL:      return "undefined label";
        case ErrorKind::RANGE:                return "out of range";
        case ErrorKind::SYNTAX:               return "syntax error";
        case ErrorKind::PC_OUT_OF_BOUNDS:     return "pc out of bounds";
        case ErrorKind::MEMORY_OUT_OF_BOUNDS: return "memory address out of bounds";
        case ErrorKind::FORMAT:               return "bad machine code";
        case ErrorKind::IO:                   return "i/o error";
    }
    return "unknown";
}

class Lc2kError : public std::runtime_error {
public:
    Lc2kError(ErrorKind kind, const std::string& msg)
        : std::runtime_error(msg), error_kind(kind) {}

    ErrorKind kind() const { return error_kind; }

private:
    ErrorKind error_kind;
};

class UnknownOpcodeError : public Lc2kError {
public:
    explicit UnknownOpcodeError(const std::string& msg)
        : Lc2kError(ErrorKind::UNKNOWN_OPCODE, msg) {}
};

class DuplicateLabelError : public Lc2kError {
public:
    explicit DuplicateLabelError(const std::string& msg)
        : Lc2kError(ErrorKind::DUPLICATE_LABEL, msg) {}
};

class UndefinedLabelError : public Lc2kError {
public:
    explicit UndefinedLabelError(const std::string& msg)
        : Lc2kError(ErrorKind::UNDEFINED_LABEL, msg) {}
};

class RangeError : public Lc2kError {
public:
    explicit RangeError(const std::string& msg)
        : Lc2kError(ErrorKind::RANGE, msg) {}
};

class SyntaxError : public Lc2kError {
public:
    explicit SyntaxError(const std::string& msg)
        : Lc2kError(ErrorKind::SYNTAX, msg) {}
};

class PcOutOfBoundsError : public Lc2kError {
public:
    explicit PcOutOfBoundsError(const std::string& msg)
        : Lc2kError(ErrorKind::PC_OUT_OF_BOUNDS, msg) {}
};

class MemoryAddressError : public Lc2kError {
public:
    explicit MemoryAddressError(const std::string& msg)
        : Lc2kError(ErrorKind::MEMORY_OUT_OF_BOUNDS, msg) {}
};

// Malformed machine-code file
class FormatError : public Lc2kError {
public:
    explicit FormatError(const std::string& msg)
        : Lc2kError(ErrorKind::FORMAT, msg) {}
};

class IoError : public Lc2kError {
public:
    explicit IoError(const std::string& msg)
        : Lc2kError(ErrorKind::IO, msg) {}
};

#endif // ERRORS_HPP
