//
//  resume_state.hpp
//
//  Durable per-file record of committed byte ranges
//

#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "msdl/transfer_planner.hpp"

namespace msdl {

constexpr const char* kResumeSuffix = ".msdl-resume";

// Committed byte count per range of a plan, same order as TransferPlan::ranges.
struct ResumeState {
    std::vector<int64_t> committed;
    // True when bytes from an earlier run were kept.
    bool resumed = false;

    int64_t CommittedBytes() const {
        int64_t total = 0;
        for (auto bytes : committed) {
            total += bytes;
        }
        return total;
    }

    // Marks ranges whose committed count equals their length as DONE.
    void ApplyTo(TransferPlan& plan) const;
};

class ResumeStateTracker {
public:
    // Inspects the destination and its sidecar. Any inconsistency deletes both and
    // returns an empty state so the file is fetched again from zero. A destination
    // without a sidecar is reused only when `plan.sha256` is set.
    ResumeState Load(const TransferPlan& plan);

    // Writes the sidecar for `plan`; must precede any write to the destination.
    void Begin(const TransferPlan& plan, const ResumeState& state);

    // Checkpoints a partially written range. Smaller values than already recorded are ignored.
    void RecordProgress(const std::string& destination, size_t range_index, int64_t committed);

    // Durably marks a range complete; returns after the sidecar reached the disk.
    void RecordComplete(const std::string& destination, size_t range_index);

    // True when every range of `plan` is recorded complete, or DONE in the plan when the
    // file was never begun in this tracker.
    bool IsComplete(const TransferPlan& plan);

    // Checks every range is complete, the size matches and, when given, the SHA-256.
    // Removes the sidecar on success; throws DownloadException(INTEGRITY_ERROR) otherwise.
    void Finalize(const TransferPlan& plan, const std::optional<std::string>& expected_sha256);

    // Committed counts currently held in memory for a destination; empty if unknown.
    std::vector<int64_t> Snapshot(const std::string& destination);

    static std::string SidecarPath(const std::string& destination);

private:
    struct FileEntry {
        std::mutex mutex;
        std::string remote_path;
        int64_t total_size = 0;
        std::vector<ChunkRange> ranges;
        std::vector<int64_t> committed;
    };

    std::shared_ptr<FileEntry> GetEntry(const std::string& destination);
    static void Persist(const std::string& destination, const FileEntry& entry);
    static ResumeState Discard(const TransferPlan& plan, const std::string& reason);

    std::mutex entries_mutex_;
    std::map<std::string, std::shared_ptr<FileEntry>> entries_;
};

} // namespace msdl
