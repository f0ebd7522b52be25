#ifndef RESGUARD_ERROR_HPP
#define RESGUARD_ERROR_HPP

#include <string>

#include "resguard/result.hpp"

// @safe
namespace resguard {

// Every failure a managed resource can report. None of them is fatal.
enum class ErrorKind {
    AcquisitionFailure,  // the resource could not be opened or connected
    InvalidOperation,    // operation on a closed, failed or wrong-mode resource
    ReleaseFailure,      // close/flush failed; the resource is still marked closed
};

const char* to_string(ErrorKind kind);

struct Error {
    ErrorKind kind;
    std::string message;

    Error() : kind(ErrorKind::InvalidOperation) {}
    Error(ErrorKind k, std::string msg) : kind(k), message(std::move(msg)) {}

    // "InvalidOperation: file 'x' is not open for writing"
    std::string describe() const;
};

inline Error acquisition_failure(std::string msg) {
    return Error(ErrorKind::AcquisitionFailure, std::move(msg));
}

inline Error invalid_operation(std::string msg) {
    return Error(ErrorKind::InvalidOperation, std::move(msg));
}

inline Error release_failure(std::string msg) {
    return Error(ErrorKind::ReleaseFailure, std::move(msg));
}

// Shorthands used throughout the library
template<typename T>
using Outcome = Result<T, Error>;

using Status = Result<void, Error>;

} // namespace resguard

#endif // RESGUARD_ERROR_HPP
