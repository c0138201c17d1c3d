//
//  chunk_worker_pool.hpp
//
//  Fixed worker threads fetching byte ranges into destination files
//

#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "msdl/cancellation_token.hpp"
#include "msdl/destination_file.hpp"
#include "msdl/dl_config.hpp"
#include "msdl/errors.hpp"
#include "msdl/http_transport.hpp"
#include "msdl/progress_reporter.hpp"
#include "msdl/resume_state.hpp"
#include "msdl/transfer_planner.hpp"

namespace msdl {

// State shared by every range task of one file.
class FileTransfer {
public:
    FileTransfer(TransferPlan plan, std::string url, std::shared_ptr<DestinationFile> destination)
        : plan_(std::move(plan)), url_(std::move(url)), destination_(std::move(destination)) {}

    const TransferPlan& plan() const { return plan_; }
    const std::string& url() const { return url_; }
    DestinationFile& destination() { return *destination_; }

    // The first failure wins; later ones are only logged.
    void Fail(const DownloadException& error);
    bool failed() const { return failed_.load(std::memory_order_acquire); }
    std::optional<DownloadException> error() const;

private:
    TransferPlan plan_;
    std::string url_;
    std::shared_ptr<DestinationFile> destination_;
    std::atomic<bool> failed_{false};
    mutable std::mutex error_mutex_;
    std::optional<DownloadException> error_;
};

struct DownloadTask {
    std::shared_ptr<FileTransfer> transfer;
    size_t range_index = 0;
    // Bytes of the range already on disk and recorded.
    int64_t resume_offset = 0;
};

class ChunkWorkerPool {
public:
    ChunkWorkerPool(std::shared_ptr<HttpTransport> transport, ResumeStateTracker& tracker,
                    ProgressReporter& reporter, CancellationToken& token, const DownloadConfig& config,
                    httplib::Headers request_headers);
    ~ChunkWorkerPool();

    ChunkWorkerPool(const ChunkWorkerPool&) = delete;
    ChunkWorkerPool& operator=(const ChunkWorkerPool&) = delete;

    void Submit(DownloadTask task);

    // Blocks until every submitted task has finished or been skipped.
    void Wait();

    int worker_count() const { return static_cast<int>(workers_.size()); }

private:
    void WorkerLoop();
    void RunTask(DownloadTask& task);
    // One HTTP request for the rest of the range; advances `committed` as bytes land.
    void FetchOnce(DownloadTask& task, int64_t& committed, int64_t& checkpointed);
    void Checkpoint(DownloadTask& task, int64_t committed);
    // Keeps the written prefix of an interrupted range for the next run.
    void CheckpointOnCancel(DownloadTask& task, int64_t committed, int64_t checkpointed);

    std::shared_ptr<HttpTransport> transport_;
    ResumeStateTracker& tracker_;
    ProgressReporter& reporter_;
    CancellationToken& token_;
    DownloadConfig config_;
    httplib::Headers request_headers_;

    std::mutex mutex_;
    std::condition_variable task_cv_;
    std::condition_variable idle_cv_;
    std::deque<DownloadTask> queue_;
    size_t unfinished_ = 0;
    bool stopping_ = false;
    std::vector<std::thread> workers_;
};

// Parses "bytes first-last/total"; total is -1 for "*". Returns false if malformed.
bool ParseContentRange(const std::string& value, int64_t& first, int64_t& last, int64_t& total);

} // namespace msdl
