#pragma once

#include <exception>
#include <string>

namespace nodefs {

enum class ErrorCode {
    NotFound,             // Path or child doesn't exist
    AlreadyExists,        // Create/rename target collision
    UnsupportedOperation, // Capability not implemented by this backend
    PermissionDenied,     // Permission/auth failure
    BrokenLink,           // Link target unresolvable
    Disconnected,         // Backend connectivity lost
    IOFailure,            // Generic backend-level failure
    PathEscape,           // Name would leave the parent's subtree
    NotAFolder,           // Folder operation on a non-folder
    NotAFile,             // File operation on something that exists but is not a file
    InvalidPath,          // Malformed path or address
    ConfigError           // YAML config parsing error
};

inline const char* error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::NotFound:             return "NotFound";
        case ErrorCode::AlreadyExists:        return "AlreadyExists";
        case ErrorCode::UnsupportedOperation: return "UnsupportedOperation";
        case ErrorCode::PermissionDenied:     return "PermissionDenied";
        case ErrorCode::BrokenLink:           return "BrokenLink";
        case ErrorCode::Disconnected:         return "Disconnected";
        case ErrorCode::IOFailure:            return "IOFailure";
        case ErrorCode::PathEscape:           return "PathEscape";
        case ErrorCode::NotAFolder:           return "NotAFolder";
        case ErrorCode::NotAFile:             return "NotAFile";
        case ErrorCode::InvalidPath:          return "InvalidPath";
        case ErrorCode::ConfigError:          return "ConfigError";
        default:                              return "Unknown";
    }
}

class FSError : public std::exception {
public:
    FSError(ErrorCode code, const std::string& message)
        : code_(code), message_(message), path_() {
        build_what();
    }

    FSError(ErrorCode code, const std::string& path, const std::string& message)
        : code_(code), message_(message), path_(path) {
        build_what();
    }

    ErrorCode code() const noexcept { return code_; }
    const char* what() const noexcept override { return what_.c_str(); }
    const std::string& message() const noexcept { return message_; }
    const std::string& path() const noexcept { return path_; }

private:
    void build_what() {
        what_ = std::string("[nodefs::") + error_code_to_string(code_) + "] " + message_;
        if (!path_.empty()) {
            what_ += " (path: " + path_ + ")";
        }
    }

    ErrorCode code_;
    std::string message_;
    std::string path_;
    std::string what_;
};

// Map a POSIX errno value to an FSError for the given path
FSError error_from_errno(int err, const std::string& path, const std::string& operation);

} // namespace nodefs
