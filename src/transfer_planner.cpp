//
//  transfer_planner.cpp
//
//  Partitioning of a remote file into byte ranges
//

#include "msdl/transfer_planner.hpp"

#include <algorithm>

#include "msdl/log_utils.hpp"

namespace msdl {

int64_t TransferPlanner::RangeCount(int64_t size, const DownloadConfig& config) {
    if (size <= 0) {
        return 0;
    }
    if (size < config.chunk_threshold_bytes || config.max_workers <= 1) {
        return 1;
    }
    const int64_t min_chunk = std::max<int64_t>(config.min_chunk_bytes, 1);
    const int64_t by_size = (size + min_chunk - 1) / min_chunk;
    return std::max<int64_t>(1, std::min<int64_t>(config.max_workers, by_size));
}

TransferPlan TransferPlanner::PlanTransfer(const RemoteFile& file, const std::string& destination,
                                           const DownloadConfig& config) {
    TransferPlan plan;
    plan.remote_path = file.path;
    plan.destination = destination;
    plan.total_size = file.size;
    plan.sha256 = file.sha256;

    const int64_t count = RangeCount(file.size, config);
    if (count == 0) {
        return plan;
    }

    const int64_t chunk = file.size / count;
    plan.ranges.reserve(static_cast<size_t>(count));
    for (int64_t i = 0; i < count; ++i) {
        ChunkRange range;
        range.start = i * chunk;
        range.end = (i == count - 1) ? file.size : (i + 1) * chunk;
        plan.ranges.push_back(range);
    }

    LOG_DEBUG_TAG("Planned " + file.path + " (" + LogUtils::FormatFileSize(file.size) + ") as " +
                      std::to_string(count) + " range(s)",
                  "TransferPlanner");
    return plan;
}

} // namespace msdl
