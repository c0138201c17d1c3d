#include <catch2/catch_test_macros.hpp>
#include "msdl/http_transport.hpp"
#include "msdl/ms_model_downloader.hpp"

#include "fake_hub.hpp"

#include <string>
#include <thread>

namespace {

// httplib::Server on an ephemeral loopback port for the lifetime of the object.
class LocalServer {
public:
    LocalServer() {
        port_ = server_.bind_to_any_port("127.0.0.1");
        thread_ = std::thread([this] { server_.listen_after_bind(); });
        server_.wait_until_ready();
    }
    ~LocalServer() {
        server_.stop();
        thread_.join();
    }

    httplib::Server& server() { return server_; }
    std::string origin() const { return "http://127.0.0.1:" + std::to_string(port_); }

private:
    httplib::Server server_;
    int port_ = 0;
    std::thread thread_;
};

msdl::RequestOptions ShortTimeouts() {
    msdl::RequestOptions options;
    options.connect_timeout_seconds = 5;
    options.read_timeout_seconds = 5;
    return options;
}

} // namespace

TEST_CASE("ParseUrl - Origin and path", "[http_transport]") {
    auto [origin, path] = msdl::HttplibTransport::ParseUrl("https://modelscope.cn/api/v1/models/a/b?x=1");
    REQUIRE(origin == "https://modelscope.cn");
    REQUIRE(path == "/api/v1/models/a/b?x=1");

    auto [origin2, path2] = msdl::HttplibTransport::ParseUrl("http://127.0.0.1:8080");
    REQUIRE(origin2 == "http://127.0.0.1:8080");
    REQUIRE(path2 == "/");

    auto [origin3, path3] = msdl::HttplibTransport::ParseUrl("  modelscope.cn/models ");
    REQUIRE(origin3 == "https://modelscope.cn");
    REQUIRE(path3 == "/models");
}

TEST_CASE("MakeRangeHeader - Inclusive last byte", "[http_transport]") {
    REQUIRE(msdl::MakeRangeHeader(0, 100) == "bytes=0-99");
    REQUIRE(msdl::MakeRangeHeader(4096, 8192) == "bytes=4096-8191");
}

TEST_CASE("HttplibTransport - GET with headers", "[http_transport]") {
    LocalServer local;
    std::string seen_auth;
    std::string seen_agent;
    local.server().Get("/hello", [&](const httplib::Request& req, httplib::Response& res) {
        seen_auth = req.get_header_value("Authorization");
        seen_agent = req.get_header_value("User-Agent");
        res.set_content("world", "text/plain");
    });

    msdl::HttplibTransport transport;
    auto response = transport.Get(local.origin() + "/hello", {{"Authorization", "Bearer t"}}, ShortTimeouts());
    REQUIRE(response.Ok());
    REQUIRE(response.status == 200);
    REQUIRE(response.body == "world");
    REQUIRE(seen_auth == "Bearer t");
    REQUIRE(seen_agent == msdl::kUserAgent);
}

TEST_CASE("HttplibTransport - Ranged stream", "[http_transport]") {
    LocalServer local;
    const std::string content = msdl_test::MakeContent(10000, 3);
    local.server().Get("/file.bin", [&](const httplib::Request& req, httplib::Response& res) {
        res.set_content(content, "application/octet-stream");
    });

    msdl::HttplibTransport transport;
    int status = 0;
    std::string content_range;
    std::string received;
    auto response = transport.GetStream(
        local.origin() + "/file.bin", {{"Range", msdl::MakeRangeHeader(1000, 3000)}}, ShortTimeouts(),
        [&](int s, const httplib::Headers& headers) {
            status = s;
            auto it = headers.find("Content-Range");
            content_range = it == headers.end() ? "" : it->second;
            return true;
        },
        [&](const char* data, size_t length) {
            received.append(data, length);
            return true;
        });

    REQUIRE(response.Ok());
    REQUIRE(status == 206);
    REQUIRE(content_range == "bytes 1000-2999/10000");
    REQUIRE(received == content.substr(1000, 2000));
}

TEST_CASE("HttplibTransport - Aborted stream reports an error", "[http_transport]") {
    LocalServer local;
    const std::string content = msdl_test::MakeContent(100000, 4);
    local.server().Get("/file.bin", [&](const httplib::Request& req, httplib::Response& res) {
        res.set_content(content, "application/octet-stream");
    });

    msdl::HttplibTransport transport;
    auto response = transport.GetStream(
        local.origin() + "/file.bin", {}, ShortTimeouts(), [](int, const httplib::Headers&) { return true; },
        [](const char*, size_t) { return false; });
    REQUIRE_FALSE(response.Ok());
}

TEST_CASE("HttplibTransport - Connection refused", "[http_transport]") {
    int port = 0;
    {
        LocalServer local;
        port = std::stoi(local.origin().substr(local.origin().rfind(':') + 1));
    }
    msdl::HttplibTransport transport;
    auto response = transport.Get("http://127.0.0.1:" + std::to_string(port) + "/", {}, ShortTimeouts());
    REQUIRE_FALSE(response.Ok());
}

TEST_CASE("HttplibTransport - POST body", "[http_transport]") {
    LocalServer local;
    std::string seen_body;
    std::string seen_type;
    local.server().Post("/api/v1/login", [&](const httplib::Request& req, httplib::Response& res) {
        seen_body = req.body;
        seen_type = req.get_header_value("Content-Type");
        res.set_content(R"({"Success":true})", "application/json");
    });

    msdl::HttplibTransport transport;
    auto response = transport.Post(local.origin() + "/api/v1/login", {}, R"({"AccessToken":"x"})",
                                   "application/json", ShortTimeouts());
    REQUIRE(response.status == 200);
    REQUIRE(seen_body == R"({"AccessToken":"x"})");
    REQUIRE(seen_type == "application/json");
}

TEST_CASE("MsModelDownloader - End to end over HTTP", "[http_transport]") {
    LocalServer local;
    const std::string weights = msdl_test::MakeContent(300000, 5);
    const std::string config_json = R"({"model_type":"qwen2"})";
    std::string seen_revision;
    local.server().Get("/api/v1/models/MNN/demo/repo/files", [&](const httplib::Request& req, httplib::Response& res) {
        seen_revision = req.get_param_value("Revision");
        std::string body = R"({"Code":200,"Success":true,"Data":{"Files":[)";
        body += R"({"Name":"config.json","Path":"config.json","Type":"blob","Size":)" +
                std::to_string(config_json.size()) + R"(,"Sha256":")" + msdl_test::Sha256Of(config_json) + "\"},";
        body += R"({"Name":"model.bin","Path":"weights/model.bin","Type":"blob","Size":)" +
                std::to_string(weights.size()) + R"(,"Sha256":")" + msdl_test::Sha256Of(weights) + "\"}";
        body += "]}}";
        res.set_content(body, "application/json");
    });
    local.server().Get(R"(/models/MNN/demo/resolve/master/(.+))",
                       [&](const httplib::Request& req, httplib::Response& res) {
                           const std::string path = req.matches[1];
                           if (path == "config.json") {
                               res.set_content(config_json, "application/json");
                           } else if (path == "weights/model.bin") {
                               res.set_content(weights, "application/octet-stream");
                           } else {
                               res.status = 404;
                           }
                       });

    msdl_test::TempDir dir("http_e2e");
    msdl::DownloadConfig config;
    config.endpoint = local.origin();
    config.max_workers = 3;
    config.chunk_threshold_bytes = 64 * 1024;
    config.min_chunk_bytes = 32 * 1024;
    config.request_timeout_seconds = 5;

    msdl::DownloadRequest request;
    request.repo = {"MNN", "demo"};
    request.save_dir = dir.str();
    auto result = msdl::MsModelDownloader(config).Download(request);

    REQUIRE(seen_revision == "master");
    REQUIRE(result.success());
    REQUIRE(result.succeeded.size() == 2);
    REQUIRE(msdl_test::ReadFile(dir.path() / "MNN" / "demo" / "config.json") == config_json);
    REQUIRE(msdl_test::ReadFile(dir.path() / "MNN" / "demo" / "weights" / "model.bin") == weights);
}
