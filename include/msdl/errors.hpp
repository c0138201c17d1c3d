//
//  errors.hpp
//
//  Error taxonomy of the download engine
//

#pragma once

#include <stdexcept>
#include <string>

namespace msdl {

enum class ErrorKind {
    NOT_FOUND,          // repository or path absent, never retried
    UNAUTHORIZED,       // missing or rejected bearer token, never retried
    TRANSIENT_NETWORK,  // timeout, reset, 5xx; retried with backoff
    INTEGRITY_ERROR,    // hash mismatch, 416, resume/disk inconsistency; never retried
    TRANSFER_FAILED,    // retry budget exhausted
    CANCELLED
};

const char* ErrorKindName(ErrorKind kind);

// Every engine failure travels as a DownloadException carrying its kind.
class DownloadException : public std::runtime_error {
public:
    DownloadException(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

    bool retryable() const { return kind_ == ErrorKind::TRANSIENT_NETWORK; }

private:
    ErrorKind kind_;
};

// Maps an HTTP status onto the taxonomy; 2xx is not an error and is never passed here.
ErrorKind ErrorKindFromHttpStatus(int status);

} // namespace msdl
