//
//  ms_api_client.cpp
//
//  ModelScope hub API: file manifests and token verification
//

#include "msdl/ms_api_client.hpp"

#include <cctype>
#include <chrono>
#include <thread>
#include <utility>

#include <rapidjson/document.h>
#include <rapidjson/error/en.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include "msdl/errors.hpp"
#include "msdl/log_utils.hpp"

namespace msdl {

namespace {

std::string GetStringMember(const rapidjson::Value& object, const char* key) {
    if (object.HasMember(key) && object[key].IsString()) {
        return object[key].GetString();
    }
    return "";
}

std::string BaseName(const std::string& path) {
    auto pos = path.find_last_of('/');
    return pos == std::string::npos ? path : path.substr(pos + 1);
}

std::string TrimTrailingSlash(std::string url) {
    while (!url.empty() && url.back() == '/') {
        url.pop_back();
    }
    return url;
}

[[noreturn]] void ThrowForStatus(int status, const std::string& what) {
    ErrorKind kind = ErrorKindFromHttpStatus(status);
    std::string message = what + " failed with HTTP " + std::to_string(status);
    if (kind == ErrorKind::UNAUTHORIZED) {
        message += " (access denied; run 'msdl login --token <token>')";
    }
    throw DownloadException(kind, message);
}

} // namespace

std::string EncodeUrlPath(const std::string& path) {
    static const char* hex = "0123456789ABCDEF";
    std::string encoded;
    encoded.reserve(path.size());
    for (unsigned char c : path) {
        if ((c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') ||
            c == '-' || c == '_' || c == '.' || c == '~' || c == '/') {
            encoded.push_back(static_cast<char>(c));
        } else {
            encoded.push_back('%');
            encoded.push_back(hex[c >> 4]);
            encoded.push_back(hex[c & 0x0F]);
        }
    }
    return encoded;
}

MsApiClient::MsApiClient(std::shared_ptr<HttpTransport> transport, DownloadConfig config)
    : transport_(std::move(transport)), config_(std::move(config)) {
    config_.endpoint = TrimTrailingSlash(config_.endpoint);
}

RequestOptions MsApiClient::MakeRequestOptions() const {
    RequestOptions options;
    options.connect_timeout_seconds = config_.connect_timeout_seconds;
    options.read_timeout_seconds = config_.request_timeout_seconds;
    return options;
}

httplib::Headers MsApiClient::AuthHeaders() const {
    httplib::Headers headers;
    if (!config_.access_token.empty()) {
        headers.emplace("Authorization", "Bearer " + config_.access_token);
    }
    return headers;
}

std::string MsApiClient::GetFilesUrl(const RepositoryId& repo) const {
    return config_.endpoint + "/api/v1/models/" + EncodeUrlPath(repo.ToString()) +
           "/repo/files?Revision=" + EncodeUrlPath(config_.revision) + "&Recursive=true";
}

std::string MsApiClient::GetFileUrl(const RepositoryId& repo, const std::string& path) const {
    return config_.endpoint + "/models/" + EncodeUrlPath(repo.ToString()) + "/resolve/" +
           EncodeUrlPath(config_.revision) + "/" + EncodeUrlPath(path);
}

void MsApiClient::PerformRequestWithRetry(const std::function<void()>& request_func, const DownloadConfig& config,
                                          CancellationToken* token, const std::string& what) {
    const int max_attempts = config.max_attempts > 0 ? config.max_attempts : 1;
    for (int attempt = 1;; ++attempt) {
        if (token && token->IsCancelled()) {
            throw DownloadException(ErrorKind::CANCELLED, what + " cancelled");
        }
        try {
            request_func();
            return;
        } catch (const DownloadException& e) {
            if (!e.retryable() || attempt >= max_attempts) {
                throw;
            }
            int64_t delay_ms = BackoffDelayMs(config, attempt);
            LOG_WARNING_TAG(what + " attempt " + std::to_string(attempt) + "/" + std::to_string(max_attempts) +
                                " failed: " + e.what() + ", retrying in " + std::to_string(delay_ms) + "ms",
                            "MsApiClient");
            if (token) {
                if (token->WaitFor(std::chrono::milliseconds(delay_ms))) {
                    throw DownloadException(ErrorKind::CANCELLED, what + " cancelled");
                }
            } else {
                std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms));
            }
        }
    }
}

std::vector<RemoteFile> MsApiClient::ParseFilesResponse(const std::string& body, const RepositoryId& repo) {
    rapidjson::Document doc;
    if (doc.Parse(body.c_str()).HasParseError() || !doc.IsObject()) {
        std::string reason = doc.HasParseError() ? rapidjson::GetParseError_En(doc.GetParseError())
                                                 : "top level is not an object";
        throw DownloadException(ErrorKind::TRANSIENT_NETWORK,
                                "Malformed file list for " + repo.ToString() + ": " + reason);
    }

    if (doc.HasMember("Success") && doc["Success"].IsBool() && !doc["Success"].GetBool()) {
        std::string message = GetStringMember(doc, "Message");
        throw DownloadException(ErrorKind::NOT_FOUND, "Repository " + repo.ToString() + " not found" +
                                                          (message.empty() ? "" : ": " + message));
    }

    if (!doc.HasMember("Data") || !doc["Data"].IsObject()) {
        throw DownloadException(ErrorKind::TRANSIENT_NETWORK,
                                "Malformed file list for " + repo.ToString() + ": missing Data");
    }
    const rapidjson::Value& data = doc["Data"];
    if (!data.HasMember("Files") || !data["Files"].IsArray()) {
        throw DownloadException(ErrorKind::TRANSIENT_NETWORK,
                                "Malformed file list for " + repo.ToString() + ": missing Data.Files");
    }

    std::vector<RemoteFile> files;
    const rapidjson::Value& entries = data["Files"];
    for (rapidjson::Value::ConstValueIterator it = entries.Begin(); it != entries.End(); ++it) {
        if (!it->IsObject() || GetStringMember(*it, "Type") != "blob") {
            continue;
        }
        RemoteFile file;
        file.path = GetStringMember(*it, "Path");
        if (!ModelNameUtils::IsSafeRelativePath(file.path)) {
            LOG_WARNING_TAG("Skipping manifest entry with unsafe path '" + file.path + "'", "MsApiClient");
            continue;
        }
        file.name = GetStringMember(*it, "Name");
        if (file.name.empty()) {
            file.name = BaseName(file.path);
        }
        if (it->HasMember("Size")) {
            const rapidjson::Value& size = (*it)["Size"];
            if (size.IsInt64()) {
                file.size = size.GetInt64();
            } else if (size.IsNumber()) {
                file.size = static_cast<int64_t>(size.GetDouble());
            }
        }
        if (file.size < 0) {
            throw DownloadException(ErrorKind::TRANSIENT_NETWORK,
                                    "Malformed file list for " + repo.ToString() + ": negative size for " + file.path);
        }
        std::string sha = GetStringMember(*it, "Sha256");
        if (!sha.empty()) {
            for (auto& c : sha) {
                c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
            }
            file.sha256 = sha;
        }
        files.push_back(std::move(file));
    }
    return files;
}

std::vector<RemoteFile> MsApiClient::ListFiles(const RepositoryId& repo, const std::optional<std::string>& path,
                                               CancellationToken* token) {
    const std::string url = GetFilesUrl(repo);
    LOG_DEBUG_TAG("Resolving " + repo.ToString() + " via " + url, "MsApiClient");

    std::vector<RemoteFile> files;
    auto request_func = [&]() {
        HttpResponse response = transport_->Get(url, AuthHeaders(), MakeRequestOptions());
        if (!response.Ok()) {
            throw DownloadException(ErrorKind::TRANSIENT_NETWORK,
                                    "File list request for " + repo.ToString() + " failed: " +
                                        httplib::to_string(response.error));
        }
        if (response.status < 200 || response.status >= 300) {
            ThrowForStatus(response.status, "File list request for " + repo.ToString());
        }
        files = ParseFilesResponse(response.body, repo);
    };
    PerformRequestWithRetry(request_func, config_, token, "File list request for " + repo.ToString());

    LOG_DEBUG_TAG(repo.ToString() + " has " + std::to_string(files.size()) + " files", "MsApiClient");

    if (!path) {
        return files;
    }
    for (auto& file : files) {
        if (file.path == *path) {
            return {file};
        }
    }
    throw DownloadException(ErrorKind::NOT_FOUND, "File '" + *path + "' not found in " + repo.ToString());
}

void MsApiClient::Login(const std::string& access_token) {
    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
    writer.StartObject();
    writer.Key("AccessToken");
    writer.String(access_token.c_str());
    writer.EndObject();

    const std::string url = config_.endpoint + "/api/v1/login";
    auto request_func = [&]() {
        HttpResponse response =
            transport_->Post(url, httplib::Headers(), buffer.GetString(), "application/json", MakeRequestOptions());
        if (!response.Ok()) {
            throw DownloadException(ErrorKind::TRANSIENT_NETWORK,
                                    "Login request failed: " + httplib::to_string(response.error));
        }
        if (response.status < 200 || response.status >= 300) {
            ErrorKind kind = ErrorKindFromHttpStatus(response.status);
            if (kind == ErrorKind::UNAUTHORIZED || kind == ErrorKind::NOT_FOUND) {
                throw DownloadException(ErrorKind::UNAUTHORIZED,
                                        "Access token rejected (HTTP " + std::to_string(response.status) + ")");
            }
            ThrowForStatus(response.status, "Login request");
        }
        rapidjson::Document doc;
        if (!doc.Parse(response.body.c_str()).HasParseError() && doc.IsObject() && doc.HasMember("Success") &&
            doc["Success"].IsBool() && !doc["Success"].GetBool()) {
            std::string message = GetStringMember(doc, "Message");
            throw DownloadException(ErrorKind::UNAUTHORIZED,
                                    "Access token rejected" + (message.empty() ? "" : ": " + message));
        }
    };
    PerformRequestWithRetry(request_func, config_, nullptr, "Login request");
    LOG_DEBUG_TAG("Access token accepted by " + config_.endpoint, "MsApiClient");
}

} // namespace msdl
