#include "resguard/error.hpp"

namespace resguard {

const char* to_string(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::AcquisitionFailure:
        return "AcquisitionFailure";
    case ErrorKind::InvalidOperation:
        return "InvalidOperation";
    case ErrorKind::ReleaseFailure:
        return "ReleaseFailure";
    }
    return "Unknown";
}

std::string Error::describe() const {
    std::string out = to_string(kind);
    if (!message.empty()) {
        out += ": ";
        out += message;
    }
    return out;
}

} // namespace resguard
