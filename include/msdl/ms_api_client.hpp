//
//  ms_api_client.hpp
//
//  ModelScope hub API: file manifests and token verification
//

#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "msdl/cancellation_token.hpp"
#include "msdl/dl_config.hpp"
#include "msdl/http_transport.hpp"
#include "msdl/model_name_utils.hpp"

namespace msdl {

struct RemoteFile {
    std::string path;  // relative to the repository root, '/' separated
    std::string name;  // last path component
    int64_t size = 0;
    std::optional<std::string> sha256;  // lowercase hex when the hub publishes one
};

class MsApiClient {
public:
    MsApiClient(std::shared_ptr<HttpTransport> transport, DownloadConfig config);

    // Blob entries of the repository in manifest order. With `path` set, exactly
    // that file or DownloadException(NOT_FOUND).
    std::vector<RemoteFile> ListFiles(const RepositoryId& repo,
                                      const std::optional<std::string>& path = std::nullopt,
                                      CancellationToken* token = nullptr);

    // POST /api/v1/login; throws UNAUTHORIZED when the hub rejects the token.
    void Login(const std::string& access_token);

    std::string GetFilesUrl(const RepositoryId& repo) const;
    std::string GetFileUrl(const RepositoryId& repo, const std::string& path) const;

    // Bearer header when a token is configured, otherwise empty.
    httplib::Headers AuthHeaders() const;

    const DownloadConfig& config() const { return config_; }

    // Runs request_func until it returns or throws a non-retryable error.
    // Retryable failures sleep with exponential backoff, interrupted by `token`.
    static void PerformRequestWithRetry(const std::function<void()>& request_func, const DownloadConfig& config,
                                        CancellationToken* token, const std::string& what);

    // Hub JSON envelope to a manifest; throws TRANSIENT_NETWORK on malformed JSON.
    static std::vector<RemoteFile> ParseFilesResponse(const std::string& body, const RepositoryId& repo);

private:
    RequestOptions MakeRequestOptions() const;

    std::shared_ptr<HttpTransport> transport_;
    DownloadConfig config_;
};

// Percent-encodes everything outside the URL unreserved set, keeping '/'.
std::string EncodeUrlPath(const std::string& path);

} // namespace msdl
