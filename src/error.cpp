#include "nodefs/error.hpp"
#include <cerrno>
#include <cstring>

namespace nodefs {

FSError error_from_errno(int err, const std::string& path, const std::string& operation) {
    std::string message = operation + ": " + std::strerror(err);
    switch (err) {
        case ENOENT:
#ifdef ENODATA
        case ENODATA:
#endif
            return FSError(ErrorCode::NotFound, path, message);
        case EEXIST:
            return FSError(ErrorCode::AlreadyExists, path, message);
        case EACCES:
        case EPERM:
        case EROFS:
            return FSError(ErrorCode::PermissionDenied, path, message);
        case ENOTDIR:
            return FSError(ErrorCode::NotAFolder, path, message);
        case ELOOP:
            return FSError(ErrorCode::BrokenLink, path, message);
        case ENOTSUP:
#if defined(EOPNOTSUPP) && EOPNOTSUPP != ENOTSUP
        case EOPNOTSUPP:
#endif
        case ENOSYS:
        case EXDEV:
            return FSError(ErrorCode::UnsupportedOperation, path, message);
        case ENAMETOOLONG:
        case EINVAL:
            return FSError(ErrorCode::InvalidPath, path, message);
        // Network filesystems surface lost connections through these
        case EPIPE:
        case ECONNRESET:
        case ECONNABORTED:
        case ECONNREFUSED:
        case ENOTCONN:
        case ETIMEDOUT:
        case EHOSTUNREACH:
        case ENETDOWN:
        case ENETUNREACH:
#ifdef ESTALE
        case ESTALE:
#endif
            return FSError(ErrorCode::Disconnected, path, message);
        default:
            return FSError(ErrorCode::IOFailure, path, message);
    }
}

} // namespace nodefs
