#include <catch2/catch_test_macros.hpp>
#include "msdl/log_utils.hpp"

#include "fake_hub.hpp"

#include <cstdio>
#include <fcntl.h>
#include <string>
#include <unistd.h>

namespace {

// Redirects stderr into a file until Stop().
class StderrCapture {
public:
    explicit StderrCapture(const std::string& path) : path_(path) {
        fflush(stderr);
        saved_fd_ = dup(STDERR_FILENO);
        int fd = open(path_.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
        dup2(fd, STDERR_FILENO);
        close(fd);
    }
    ~StderrCapture() { Stop(); }

    std::string Stop() {
        if (saved_fd_ >= 0) {
            fflush(stderr);
            dup2(saved_fd_, STDERR_FILENO);
            close(saved_fd_);
            saved_fd_ = -1;
        }
        return msdl_test::ReadFile(path_);
    }

private:
    std::string path_;
    int saved_fd_ = -1;
};

} // namespace

TEST_CASE("LogUtils - Error lines carry level and tag", "[log_utils]") {
    msdl_test::TempDir dir("log_error");
    StderrCapture capture((dir.path() / "stderr.txt").string());
    LOG_ERROR(std::string("weights/model.bin: ") + "range 2 failed");
    LOG_ERROR_TAG("giving up", "ChunkWorkerPool");
    const std::string output = capture.Stop();

    REQUIRE(output.find("[ERROR] weights/model.bin: range 2 failed") != std::string::npos);
    REQUIRE(output.find("[ERROR] [ChunkWorkerPool] giving up") != std::string::npos);
}

TEST_CASE("LogUtils - Debug only when verbose", "[log_utils]") {
    msdl_test::TempDir dir("log_debug");
    StderrCapture capture((dir.path() / "stderr.txt").string());
    msdl::LogUtils::SetVerbose(false);
    LOG_DEBUG_TAG("hidden", "Test");
    msdl::LogUtils::SetVerbose(true);
    LOG_DEBUG_TAG("shown", "Test");
    msdl::LogUtils::SetVerbose(false);
    const std::string output = capture.Stop();

    REQUIRE(output.find("hidden") == std::string::npos);
    REQUIRE(output.find("[DEBUG] [Test] shown") != std::string::npos);
}

TEST_CASE("LogUtils - File sizes and progress", "[log_utils]") {
    REQUIRE(msdl::LogUtils::FormatFileSize(512) == "512 B");
    REQUIRE(msdl::LogUtils::FormatFileSize(1536) == "1.50 KB");
    REQUIRE(msdl::LogUtils::FormatFileSize(-1) == "N/A");
    REQUIRE(msdl::LogUtils::FormatProgress(0.42) == "42.0%");
}
