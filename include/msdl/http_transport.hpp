//
//  http_transport.hpp
//
//  Blocking HTTP seam between the engine and cpp-httplib
//

#pragma once

#include <functional>
#include <string>
#include <tuple>

#include <httplib.h>

namespace msdl {

constexpr const char* kUserAgent = "msdl/1.0";

struct RequestOptions {
    int connect_timeout_seconds = 10;
    // Bounds every socket read, so a stalled body fails instead of hanging the worker.
    int read_timeout_seconds = 30;
};

struct HttpResponse {
    int status = 0;
    httplib::Headers headers;
    std::string body;  // empty for streamed requests
    httplib::Error error = httplib::Error::Success;

    // False when no HTTP response was received at all.
    bool Ok() const { return error == httplib::Error::Success; }

    std::string GetHeader(const std::string& key) const {
        auto it = headers.find(key);
        return it == headers.end() ? std::string() : it->second;
    }
};

// Called once with status and headers; returning false aborts the request.
using ResponseHandler = std::function<bool(int status, const httplib::Headers& headers)>;
// Called for every body segment; returning false aborts the request.
using ContentReceiver = std::function<bool(const char* data, size_t length)>;

class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    virtual HttpResponse Get(const std::string& url, const httplib::Headers& headers,
                             const RequestOptions& options) = 0;

    virtual HttpResponse GetStream(const std::string& url, const httplib::Headers& headers,
                                   const RequestOptions& options, const ResponseHandler& on_response,
                                   const ContentReceiver& on_data) = 0;

    virtual HttpResponse Post(const std::string& url, const httplib::Headers& headers, const std::string& body,
                              const std::string& content_type, const RequestOptions& options) = 0;
};

// HttpTransport over httplib::Client, one client per request, redirects followed.
class HttplibTransport : public HttpTransport {
public:
    HttpResponse Get(const std::string& url, const httplib::Headers& headers,
                     const RequestOptions& options) override;

    HttpResponse GetStream(const std::string& url, const httplib::Headers& headers,
                           const RequestOptions& options, const ResponseHandler& on_response,
                           const ContentReceiver& on_data) override;

    HttpResponse Post(const std::string& url, const httplib::Headers& headers, const std::string& body,
                      const std::string& content_type, const RequestOptions& options) override;

    // Splits "https://host[:port]/path?q" into {"https://host[:port]", "/path?q"}.
    // A URL without a scheme is treated as https.
    static std::tuple<std::string, std::string> ParseUrl(const std::string& url);

private:
    static void ConfigureClient(httplib::Client& client, const RequestOptions& options);
    static HttpResponse FromResult(const httplib::Result& result);
};

// "bytes=start-last" for the half-open interval [start, end)
std::string MakeRangeHeader(int64_t start, int64_t end);

} // namespace msdl
