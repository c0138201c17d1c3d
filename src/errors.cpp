//
//  errors.cpp
//
//  Error taxonomy of the download engine
//

#include "msdl/errors.hpp"

namespace msdl {

const char* ErrorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NOT_FOUND: return "NotFound";
        case ErrorKind::UNAUTHORIZED: return "Unauthorized";
        case ErrorKind::TRANSIENT_NETWORK: return "TransientNetwork";
        case ErrorKind::INTEGRITY_ERROR: return "IntegrityError";
        case ErrorKind::TRANSFER_FAILED: return "TransferFailed";
        case ErrorKind::CANCELLED: return "Cancelled";
    }
    return "Unknown";
}

ErrorKind ErrorKindFromHttpStatus(int status) {
    if (status == 404 || status == 410) {
        return ErrorKind::NOT_FOUND;
    }
    if (status == 401 || status == 403) {
        return ErrorKind::UNAUTHORIZED;
    }
    if (status == 416) {
        return ErrorKind::INTEGRITY_ERROR;
    }
    if (status == 408 || status == 429 || status >= 500) {
        return ErrorKind::TRANSIENT_NETWORK;
    }
    // Remaining 3xx/4xx mean the request itself is wrong; retrying will not help.
    return ErrorKind::TRANSFER_FAILED;
}

} // namespace msdl
