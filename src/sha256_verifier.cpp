//
//  sha256_verifier.cpp
//
//  SHA-256 of files on disk through OpenSSL EVP
//

#include "msdl/sha256_verifier.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <memory>
#include <vector>

#include <openssl/evp.h>

#include "msdl/errors.hpp"

namespace msdl {

namespace {

std::string HexEncode(const unsigned char* digest, unsigned int length) {
    static const char* hex = "0123456789abcdef";
    std::string out;
    out.reserve(length * 2);
    for (unsigned int i = 0; i < length; ++i) {
        out.push_back(hex[digest[i] >> 4]);
        out.push_back(hex[digest[i] & 0x0F]);
    }
    return out;
}

} // namespace

std::string Sha256Verifier::Sha256Hex(const std::string& file_path) {
    std::ifstream file(file_path, std::ios::binary);
    if (!file) {
        throw DownloadException(ErrorKind::INTEGRITY_ERROR, "Cannot read '" + file_path + "' for hashing");
    }

    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), EVP_MD_CTX_free);
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        throw DownloadException(ErrorKind::INTEGRITY_ERROR, "Cannot initialize SHA-256 digest");
    }

    std::vector<char> buffer(1 << 20);
    while (file) {
        file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        std::streamsize count = file.gcount();
        if (count > 0 && EVP_DigestUpdate(ctx.get(), buffer.data(), static_cast<size_t>(count)) != 1) {
            throw DownloadException(ErrorKind::INTEGRITY_ERROR, "SHA-256 update failed for '" + file_path + "'");
        }
    }
    if (file.bad()) {
        throw DownloadException(ErrorKind::INTEGRITY_ERROR, "Read error while hashing '" + file_path + "'");
    }

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_length = 0;
    if (EVP_DigestFinal_ex(ctx.get(), digest, &digest_length) != 1) {
        throw DownloadException(ErrorKind::INTEGRITY_ERROR, "SHA-256 finalize failed for '" + file_path + "'");
    }
    return HexEncode(digest, digest_length);
}

bool Sha256Verifier::Verify(const std::string& file_path, const std::string& expected_hex) {
    std::string expected = expected_hex;
    std::transform(expected.begin(), expected.end(), expected.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return Sha256Hex(file_path) == expected;
}

} // namespace msdl
