#include "UAC/Error.h"
#include <cerrno>

namespace UAC {

TransferError transferErrorFromErrno(int err) noexcept {
    switch (err) {
        case 0:         return TransferError::Success;
        case ETIMEDOUT: return TransferError::Timeout;
        case EPIPE:     return TransferError::Stall;
        case ENODEV:
        case ENOENT:    return TransferError::NoDevice;
        case EACCES:
        case EPERM:     return TransferError::NotPermitted;
        case EINVAL:    return TransferError::BadArgument;
        case EBADF:     return TransferError::NotOpen;
        default:        return TransferError::IOError;
    }
}

} // namespace UAC
