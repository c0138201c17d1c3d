#include <catch2/catch_test_macros.hpp>
#include "msdl/destination_file.hpp"
#include "msdl/errors.hpp"
#include "msdl/sha256_verifier.hpp"

#include "fake_hub.hpp"

#include <filesystem>
#include <string>

namespace fs = std::filesystem;

TEST_CASE("DestinationFile - Writes at offsets in any order", "[destination_file]") {
    msdl_test::TempDir dir("dest_offsets");
    const auto path = (dir.path() / "out.bin").string();
    auto file = msdl::DestinationFile::Open(path);
    file->Resize(10);
    file->WriteAt(5, "56789", 5);
    file->WriteAt(0, "01234", 5);
    file->Sync();
    REQUIRE(msdl_test::ReadFile(path) == "0123456789");
    REQUIRE(file->path() == path);
}

TEST_CASE("DestinationFile - Open keeps existing bytes", "[destination_file]") {
    msdl_test::TempDir dir("dest_keep");
    const auto path = dir.path() / "out.bin";
    msdl_test::WriteFile(path, "abcdef");
    auto file = msdl::DestinationFile::Open(path.string());
    file->Resize(8);
    REQUIRE(fs::file_size(path) == 8);
    REQUIRE(msdl_test::ReadFile(path).substr(0, 6) == "abcdef");
}

TEST_CASE("DestinationFile - Missing parent directory", "[destination_file]") {
    msdl_test::TempDir dir("dest_missing");
    try {
        msdl::DestinationFile::Open((dir.path() / "no" / "such" / "file").string());
        FAIL("Open succeeded without a parent directory");
    } catch (const msdl::DownloadException& e) {
        REQUIRE(e.kind() == msdl::ErrorKind::TRANSFER_FAILED);
    }
}

TEST_CASE("Sha256Verifier - Known digest", "[sha256]") {
    msdl_test::TempDir dir("sha_known");
    const auto path = (dir.path() / "abc.txt").string();
    msdl_test::WriteFile(path, "abc");
    REQUIRE(msdl::Sha256Verifier::Sha256Hex(path) ==
            "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    REQUIRE(msdl::Sha256Verifier::Verify(path, "BA7816BF8F01CFEA414140DE5DAE2223B00361A396177A9CB410FF61F20015AD"));
    REQUIRE_FALSE(msdl::Sha256Verifier::Verify(path, std::string(64, '0')));
}

TEST_CASE("Sha256Verifier - Larger than one read buffer", "[sha256]") {
    msdl_test::TempDir dir("sha_large");
    const auto path = (dir.path() / "big.bin").string();
    auto content = msdl_test::MakeContent(3 * 1024 * 1024 + 17, 42);
    msdl_test::WriteFile(path, content);
    REQUIRE(msdl::Sha256Verifier::Sha256Hex(path) == msdl_test::Sha256Of(content));
}

TEST_CASE("Sha256Verifier - Unreadable file", "[sha256]") {
    REQUIRE_THROWS_AS(msdl::Sha256Verifier::Sha256Hex("/nonexistent/msdl/file"), msdl::DownloadException);
}
