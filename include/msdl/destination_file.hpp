//
//  destination_file.hpp
//
//  Offset-addressed writer shared by the range workers of one file
//

#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

namespace msdl {

class DestinationFile {
public:
    // Opens (creating if needed) without truncating. Throws DownloadException(TRANSFER_FAILED).
    static std::shared_ptr<DestinationFile> Open(const std::string& path);

    ~DestinationFile();

    DestinationFile(const DestinationFile&) = delete;
    DestinationFile& operator=(const DestinationFile&) = delete;

    // Sets the logical size; growing leaves a hole where the platform supports sparse files.
    void Resize(int64_t size);

    // Writes all of `length` bytes at `offset`; safe for disjoint offsets from several threads.
    void WriteAt(int64_t offset, const char* data, size_t length);

    // Flushes written data to stable storage.
    void Sync();

    const std::string& path() const { return path_; }

private:
    DestinationFile(int fd, std::string path);

    int fd_ = -1;
    std::string path_;
};

} // namespace msdl
