//
//  destination_file.cpp
//
//  Offset-addressed writer shared by the range workers of one file
//

#include "msdl/destination_file.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#include <utility>

#include "msdl/errors.hpp"

namespace msdl {

namespace {

[[noreturn]] void ThrowIoError(const std::string& what, const std::string& path) {
    throw DownloadException(ErrorKind::TRANSFER_FAILED, what + " '" + path + "': " + std::strerror(errno));
}

} // namespace

std::shared_ptr<DestinationFile> DestinationFile::Open(const std::string& path) {
    int fd = ::open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    if (fd < 0) {
        ThrowIoError("Cannot open", path);
    }
    return std::shared_ptr<DestinationFile>(new DestinationFile(fd, path));
}

DestinationFile::DestinationFile(int fd, std::string path) : fd_(fd), path_(std::move(path)) {}

DestinationFile::~DestinationFile() {
    if (fd_ >= 0) {
        ::close(fd_);
    }
}

void DestinationFile::Resize(int64_t size) {
    struct stat st {};
    if (::fstat(fd_, &st) != 0) {
        ThrowIoError("Cannot stat", path_);
    }
    if (st.st_size == size) {
        return;
    }
    if (::ftruncate(fd_, static_cast<off_t>(size)) != 0) {
        ThrowIoError("Cannot resize", path_);
    }
}

void DestinationFile::WriteAt(int64_t offset, const char* data, size_t length) {
    while (length > 0) {
        ssize_t written = ::pwrite(fd_, data, length, static_cast<off_t>(offset));
        if (written < 0) {
            if (errno == EINTR) {
                continue;
            }
            ThrowIoError("Write failed for", path_);
        }
        data += written;
        length -= static_cast<size_t>(written);
        offset += written;
    }
}

void DestinationFile::Sync() {
#if defined(__APPLE__)
    int rc = ::fsync(fd_);
#else
    int rc = ::fdatasync(fd_);
#endif
    if (rc != 0) {
        ThrowIoError("Sync failed for", path_);
    }
}

} // namespace msdl
