//
//  sha256_verifier.hpp
//
//  SHA-256 of files on disk through OpenSSL EVP
//

#pragma once

#include <string>

namespace msdl {

class Sha256Verifier {
public:
    // Lowercase hex digest of the file. Throws DownloadException(INTEGRITY_ERROR) if it cannot be read.
    static std::string Sha256Hex(const std::string& file_path);

    // Case-insensitive comparison against an expected hex digest.
    static bool Verify(const std::string& file_path, const std::string& expected_hex);
};

} // namespace msdl
