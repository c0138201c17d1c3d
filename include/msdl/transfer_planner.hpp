//
//  transfer_planner.hpp
//
//  Partitioning of a remote file into byte ranges
//

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "msdl/dl_config.hpp"
#include "msdl/ms_api_client.hpp"

namespace msdl {

enum class RangeState {
    PENDING,
    IN_FLIGHT,
    DONE
};

// Half-open byte interval [start, end) of a file.
struct ChunkRange {
    int64_t start = 0;
    int64_t end = 0;
    RangeState state = RangeState::PENDING;

    int64_t length() const { return end - start; }
};

struct TransferPlan {
    std::string remote_path;
    std::string destination;
    int64_t total_size = 0;
    std::vector<ChunkRange> ranges;  // contiguous, covering [0, total_size)
    std::optional<std::string> sha256;

    bool IsComplete() const {
        for (const auto& range : ranges) {
            if (range.state != RangeState::DONE) {
                return false;
            }
        }
        return true;
    }
};

class TransferPlanner {
public:
    // Same (size, config) always yields the same boundaries.
    static TransferPlan PlanTransfer(const RemoteFile& file, const std::string& destination,
                                     const DownloadConfig& config);

    // Range count chosen for a file of `size` bytes.
    static int64_t RangeCount(int64_t size, const DownloadConfig& config);
};

} // namespace msdl
