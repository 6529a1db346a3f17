#pragma once
#include <stdexcept>
#include <string>

enum class ErrorKind {
    AccessDenied,
    NotFound,
    InvalidInput,
    IoFailure,
    ResourceLimit
};

// Machine-readable kind, reported as error.data.kind in JSON-RPC errors.
inline const char* errorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::AccessDenied: return "access_denied";
        case ErrorKind::NotFound: return "not_found";
        case ErrorKind::InvalidInput: return "invalid_input";
        case ErrorKind::IoFailure: return "io_failure";
        case ErrorKind::ResourceLimit: return "resource_limit";
    }
    return "io_failure";
}

class ToolError : public std::runtime_error {
public:
    ToolError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};
