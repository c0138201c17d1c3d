//
//  resume_state.cpp
//
//  Durable per-file record of committed byte ranges
//

#include "msdl/resume_state.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <fstream>
#include <unistd.h>

#include <nlohmann/json.hpp>

#include "msdl/errors.hpp"
#include "msdl/log_utils.hpp"
#include "msdl/sha256_verifier.hpp"

namespace fs = std::filesystem;

namespace msdl {

namespace {

constexpr int kSidecarVersion = 1;

// Writes `content` to `path` through a temporary file, fsync and rename.
void WriteFileAtomically(const std::string& path, const std::string& content) {
    const std::string tmp_path = path + ".tmp";
    int fd = ::open(tmp_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0) {
        throw DownloadException(ErrorKind::TRANSFER_FAILED,
                                "Cannot write resume state '" + tmp_path + "': " + std::strerror(errno));
    }
    const char* data = content.data();
    size_t remaining = content.size();
    while (remaining > 0) {
        ssize_t written = ::write(fd, data, remaining);
        if (written < 0) {
            if (errno == EINTR) {
                continue;
            }
            int saved = errno;
            ::close(fd);
            throw DownloadException(ErrorKind::TRANSFER_FAILED,
                                    "Cannot write resume state '" + tmp_path + "': " + std::strerror(saved));
        }
        data += written;
        remaining -= static_cast<size_t>(written);
    }
    if (::fsync(fd) != 0) {
        int saved = errno;
        ::close(fd);
        throw DownloadException(ErrorKind::TRANSFER_FAILED,
                                "Cannot sync resume state '" + tmp_path + "': " + std::strerror(saved));
    }
    ::close(fd);
    if (std::rename(tmp_path.c_str(), path.c_str()) != 0) {
        throw DownloadException(ErrorKind::TRANSFER_FAILED,
                                "Cannot replace resume state '" + path + "': " + std::strerror(errno));
    }
}

ResumeState EmptyState(const TransferPlan& plan) {
    ResumeState state;
    state.committed.assign(plan.ranges.size(), 0);
    return state;
}

} // namespace

void ResumeState::ApplyTo(TransferPlan& plan) const {
    for (size_t i = 0; i < plan.ranges.size() && i < committed.size(); ++i) {
        plan.ranges[i].state = committed[i] >= plan.ranges[i].length() ? RangeState::DONE : RangeState::PENDING;
    }
}

std::string ResumeStateTracker::SidecarPath(const std::string& destination) {
    return destination + kResumeSuffix;
}

ResumeState ResumeStateTracker::Discard(const TransferPlan& plan, const std::string& reason) {
    LOG_WARNING_TAG("Discarding partial download of " + plan.remote_path + ": " + reason, "ResumeState");
    std::error_code ec;
    fs::remove(SidecarPath(plan.destination), ec);
    fs::remove(plan.destination, ec);
    if (ec) {
        throw DownloadException(ErrorKind::TRANSFER_FAILED,
                                "Cannot remove stale file '" + plan.destination + "': " + ec.message());
    }
    return EmptyState(plan);
}

ResumeState ResumeStateTracker::Load(const TransferPlan& plan) {
    const std::string sidecar_path = SidecarPath(plan.destination);
    std::error_code ec;
    const bool destination_exists = fs::is_regular_file(plan.destination, ec);
    const int64_t destination_size =
        destination_exists ? static_cast<int64_t>(fs::file_size(plan.destination, ec)) : -1;
    if (ec) {
        return Discard(plan, "cannot stat destination (" + ec.message() + ")");
    }

    if (!fs::exists(sidecar_path, ec)) {
        if (!destination_exists) {
            return EmptyState(plan);
        }
        if (destination_size > plan.total_size) {
            return Discard(plan, "destination is larger than the remote file");
        }
        // A preallocated destination is full size before any byte arrives, so untracked
        // bytes are kept only when Finalize can check them against a digest.
        if (plan.total_size > 0 && !plan.sha256) {
            return Discard(plan, "no resume state and no checksum for the existing bytes");
        }
        // Without bookkeeping the existing bytes are an append-mode watermark.
        ResumeState state = EmptyState(plan);
        for (size_t i = 0; i < plan.ranges.size(); ++i) {
            const auto& range = plan.ranges[i];
            state.committed[i] = std::clamp<int64_t>(destination_size - range.start, 0, range.length());
        }
        state.resumed = destination_size > 0 || plan.total_size == 0;
        LOG_DEBUG_TAG(plan.remote_path + ": found " + std::to_string(destination_size) + " bytes without sidecar",
                      "ResumeState");
        return state;
    }

    nlohmann::json sidecar;
    try {
        std::ifstream in(sidecar_path);
        sidecar = nlohmann::json::parse(in);
    } catch (const nlohmann::json::exception& e) {
        return Discard(plan, std::string("unreadable sidecar (") + e.what() + ")");
    }

    ResumeState state = EmptyState(plan);
    try {
        if (sidecar.value("total_size", int64_t{-1}) != plan.total_size) {
            return Discard(plan, "remote size changed");
        }
        const auto& ranges = sidecar.at("ranges");
        if (!ranges.is_array() || ranges.size() != plan.ranges.size()) {
            return Discard(plan, "range layout changed");
        }
        for (size_t i = 0; i < plan.ranges.size(); ++i) {
            const auto& range = plan.ranges[i];
            if (ranges[i].at("start").get<int64_t>() != range.start ||
                ranges[i].at("end").get<int64_t>() != range.end) {
                return Discard(plan, "range layout changed");
            }
            int64_t committed = ranges[i].at("committed").get<int64_t>();
            if (committed < 0 || committed > range.length()) {
                return Discard(plan, "sidecar claims impossible progress");
            }
            state.committed[i] = committed;
        }
    } catch (const nlohmann::json::exception& e) {
        return Discard(plan, std::string("malformed sidecar (") + e.what() + ")");
    }

    if (!destination_exists) {
        return Discard(plan, "destination is missing");
    }
    if (destination_size > plan.total_size) {
        return Discard(plan, "destination is larger than the remote file");
    }
    for (size_t i = 0; i < plan.ranges.size(); ++i) {
        if (state.committed[i] > 0 && plan.ranges[i].start + state.committed[i] > destination_size) {
            return Discard(plan, "destination is shorter than recorded progress");
        }
    }

    state.resumed = true;
    LOG_DEBUG_TAG(plan.remote_path + ": resuming with " + LogUtils::FormatFileSize(state.CommittedBytes()) +
                      " already committed",
                  "ResumeState");
    return state;
}

std::shared_ptr<ResumeStateTracker::FileEntry> ResumeStateTracker::GetEntry(const std::string& destination) {
    std::lock_guard<std::mutex> lock(entries_mutex_);
    auto it = entries_.find(destination);
    if (it == entries_.end()) {
        throw DownloadException(ErrorKind::TRANSFER_FAILED, "No resume state registered for '" + destination + "'");
    }
    return it->second;
}

void ResumeStateTracker::Persist(const std::string& destination, const FileEntry& entry) {
    nlohmann::json sidecar;
    sidecar["version"] = kSidecarVersion;
    sidecar["remote_path"] = entry.remote_path;
    sidecar["total_size"] = entry.total_size;
    sidecar["ranges"] = nlohmann::json::array();
    for (size_t i = 0; i < entry.ranges.size(); ++i) {
        sidecar["ranges"].push_back({{"start", entry.ranges[i].start},
                                     {"end", entry.ranges[i].end},
                                     {"committed", entry.committed[i]}});
    }
    WriteFileAtomically(SidecarPath(destination), sidecar.dump());
}

void ResumeStateTracker::Begin(const TransferPlan& plan, const ResumeState& state) {
    auto entry = std::make_shared<FileEntry>();
    entry->remote_path = plan.remote_path;
    entry->total_size = plan.total_size;
    entry->ranges = plan.ranges;
    entry->committed = state.committed;
    entry->committed.resize(plan.ranges.size(), 0);
    {
        std::lock_guard<std::mutex> lock(entries_mutex_);
        entries_[plan.destination] = entry;
    }
    std::lock_guard<std::mutex> lock(entry->mutex);
    Persist(plan.destination, *entry);
}

void ResumeStateTracker::RecordProgress(const std::string& destination, size_t range_index, int64_t committed) {
    auto entry = GetEntry(destination);
    std::lock_guard<std::mutex> lock(entry->mutex);
    if (range_index >= entry->ranges.size()) {
        throw DownloadException(ErrorKind::TRANSFER_FAILED, "Range index out of bounds for '" + destination + "'");
    }
    committed = std::min(committed, entry->ranges[range_index].length());
    if (committed <= entry->committed[range_index]) {
        return;
    }
    entry->committed[range_index] = committed;
    Persist(destination, *entry);
}

void ResumeStateTracker::RecordComplete(const std::string& destination, size_t range_index) {
    auto entry = GetEntry(destination);
    std::lock_guard<std::mutex> lock(entry->mutex);
    if (range_index >= entry->ranges.size()) {
        throw DownloadException(ErrorKind::TRANSFER_FAILED, "Range index out of bounds for '" + destination + "'");
    }
    entry->committed[range_index] = entry->ranges[range_index].length();
    Persist(destination, *entry);
}

std::vector<int64_t> ResumeStateTracker::Snapshot(const std::string& destination) {
    std::shared_ptr<FileEntry> entry;
    {
        std::lock_guard<std::mutex> lock(entries_mutex_);
        auto it = entries_.find(destination);
        if (it == entries_.end()) {
            return {};
        }
        entry = it->second;
    }
    std::lock_guard<std::mutex> lock(entry->mutex);
    return entry->committed;
}

bool ResumeStateTracker::IsComplete(const TransferPlan& plan) {
    const std::vector<int64_t> committed = Snapshot(plan.destination);
    for (size_t i = 0; i < plan.ranges.size(); ++i) {
        bool done = i < committed.size() ? committed[i] >= plan.ranges[i].length()
                                         : plan.ranges[i].state == RangeState::DONE;
        if (!done) {
            return false;
        }
    }
    return true;
}

void ResumeStateTracker::Finalize(const TransferPlan& plan, const std::optional<std::string>& expected_sha256) {
    if (!IsComplete(plan)) {
        throw DownloadException(ErrorKind::INTEGRITY_ERROR, plan.remote_path + ": not every range is complete");
    }

    std::error_code ec;
    auto size = fs::file_size(plan.destination, ec);
    if (ec || static_cast<int64_t>(size) != plan.total_size) {
        throw DownloadException(ErrorKind::INTEGRITY_ERROR,
                                plan.remote_path + ": size on disk does not match " +
                                    std::to_string(plan.total_size) + " bytes");
    }

    if (expected_sha256 && !expected_sha256->empty()) {
        if (!Sha256Verifier::Verify(plan.destination, *expected_sha256)) {
            throw DownloadException(ErrorKind::INTEGRITY_ERROR,
                                    plan.remote_path + ": SHA-256 mismatch, partial file kept at " + plan.destination);
        }
        LOG_DEBUG_TAG(plan.remote_path + ": SHA-256 verified", "ResumeState");
    }

    fs::remove(SidecarPath(plan.destination), ec);
    if (ec) {
        throw DownloadException(ErrorKind::TRANSFER_FAILED,
                                "Cannot remove resume state for '" + plan.destination + "': " + ec.message());
    }
    std::lock_guard<std::mutex> lock(entries_mutex_);
    entries_.erase(plan.destination);
}

} // namespace msdl
