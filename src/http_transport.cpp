//
//  http_transport.cpp
//
//  Blocking HTTP seam between the engine and cpp-httplib
//

#include "msdl/http_transport.hpp"
#include "msdl/log_utils.hpp"

namespace msdl {

static inline std::string Trim(const std::string& input) {
    const char* whitespace = " \t\n\r";
    const auto start = input.find_first_not_of(whitespace);
    if (start == std::string::npos) {
        return "";
    }
    const auto end = input.find_last_not_of(whitespace);
    return input.substr(start, end - start + 1);
}

std::tuple<std::string, std::string> HttplibTransport::ParseUrl(const std::string& url) {
    const std::string cleaned = Trim(url);
    if (cleaned.empty()) {
        return {"", ""};
    }

    std::string scheme = "https://";
    size_t host_start = 0;
    if (cleaned.rfind("https://", 0) == 0) {
        host_start = 8;
    } else if (cleaned.rfind("http://", 0) == 0) {
        scheme = "http://";
        host_start = 7;
    }

    const size_t path_start = cleaned.find_first_of("/?", host_start);
    if (path_start != std::string::npos) {
        const std::string host = cleaned.substr(host_start, path_start - host_start);
        std::string path = cleaned.substr(path_start);
        if (path.front() == '?') {
            path = "/" + path;
        }
        return {scheme + host, path};
    }
    const std::string host = cleaned.substr(host_start);
    if (host.empty()) {
        return {"", ""};
    }
    return {scheme + host, "/"};
}

void HttplibTransport::ConfigureClient(httplib::Client& client, const RequestOptions& options) {
    client.set_connection_timeout(options.connect_timeout_seconds, 0);
    client.set_read_timeout(options.read_timeout_seconds, 0);
    client.set_write_timeout(options.read_timeout_seconds, 0);
    client.set_follow_location(true);
    client.set_keep_alive(false);
#ifdef CPPHTTPLIB_OPENSSL_SUPPORT
    client.enable_server_certificate_verification(true);
#endif
}

HttpResponse HttplibTransport::FromResult(const httplib::Result& result) {
    HttpResponse response;
    response.error = result.error();
    if (result) {
        response.status = result->status;
        response.headers = result->headers;
        response.body = result->body;
    }
    return response;
}

HttpResponse HttplibTransport::Get(const std::string& url, const httplib::Headers& headers,
                                   const RequestOptions& options) {
    auto [origin, path] = ParseUrl(url);
    httplib::Client client(origin);
    ConfigureClient(client, options);

    httplib::Headers request_headers = headers;
    request_headers.emplace("User-Agent", kUserAgent);

    LOG_DEBUG_TAG("GET " + url, "HttplibTransport");
    return FromResult(client.Get(path, request_headers));
}

HttpResponse HttplibTransport::GetStream(const std::string& url, const httplib::Headers& headers,
                                         const RequestOptions& options, const ResponseHandler& on_response,
                                         const ContentReceiver& on_data) {
    auto [origin, path] = ParseUrl(url);
    httplib::Client client(origin);
    ConfigureClient(client, options);

    httplib::Headers request_headers = headers;
    request_headers.emplace("User-Agent", kUserAgent);
    // Ranges address raw bytes; a compressed body would break offset arithmetic.
    request_headers.emplace("Accept-Encoding", "identity");

    auto range_it = request_headers.find("Range");
    LOG_DEBUG_TAG("GET " + url + (range_it != request_headers.end() ? " " + range_it->second : std::string()),
                  "HttplibTransport");

    auto result = client.Get(
        path, request_headers,
        [&](const httplib::Response& response) { return on_response(response.status, response.headers); },
        [&](const char* data, size_t data_length) { return on_data(data, data_length); });

    HttpResponse response;
    response.error = result.error();
    if (result) {
        response.status = result->status;
        response.headers = result->headers;
    }
    return response;
}

HttpResponse HttplibTransport::Post(const std::string& url, const httplib::Headers& headers,
                                    const std::string& body, const std::string& content_type,
                                    const RequestOptions& options) {
    auto [origin, path] = ParseUrl(url);
    httplib::Client client(origin);
    ConfigureClient(client, options);

    httplib::Headers request_headers = headers;
    request_headers.emplace("User-Agent", kUserAgent);

    LOG_DEBUG_TAG("POST " + url, "HttplibTransport");
    return FromResult(client.Post(path, request_headers, body, content_type));
}

std::string MakeRangeHeader(int64_t start, int64_t end) {
    return "bytes=" + std::to_string(start) + "-" + std::to_string(end - 1);
}

} // namespace msdl
