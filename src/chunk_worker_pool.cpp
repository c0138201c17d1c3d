//
//  chunk_worker_pool.cpp
//
//  Fixed worker threads fetching byte ranges into destination files
//

#include "msdl/chunk_worker_pool.hpp"

#include <algorithm>
#include <chrono>
#include <cstdlib>

#include "msdl/log_utils.hpp"

namespace msdl {

void FileTransfer::Fail(const DownloadException& error) {
    std::lock_guard<std::mutex> lock(error_mutex_);
    if (error_) {
        LOG_DEBUG_TAG(plan_.remote_path + ": additional failure: " + error.what(), "ChunkWorkerPool");
        return;
    }
    error_ = error;
    failed_.store(true, std::memory_order_release);
}

std::optional<DownloadException> FileTransfer::error() const {
    std::lock_guard<std::mutex> lock(error_mutex_);
    return error_;
}

bool ParseContentRange(const std::string& value, int64_t& first, int64_t& last, int64_t& total) {
    const std::string prefix = "bytes ";
    if (value.compare(0, prefix.size(), prefix) != 0) {
        return false;
    }
    const char* p = value.c_str() + prefix.size();
    char* end = nullptr;
    first = std::strtoll(p, &end, 10);
    if (end == p || *end != '-') {
        return false;
    }
    p = end + 1;
    last = std::strtoll(p, &end, 10);
    if (end == p || *end != '/') {
        return false;
    }
    p = end + 1;
    if (*p == '*') {
        total = -1;
        return p[1] == '\0';
    }
    total = std::strtoll(p, &end, 10);
    return end != p && *end == '\0' && first <= last;
}

ChunkWorkerPool::ChunkWorkerPool(std::shared_ptr<HttpTransport> transport, ResumeStateTracker& tracker,
                                 ProgressReporter& reporter, CancellationToken& token, const DownloadConfig& config,
                                 httplib::Headers request_headers)
    : transport_(std::move(transport)),
      tracker_(tracker),
      reporter_(reporter),
      token_(token),
      config_(config),
      request_headers_(std::move(request_headers)) {
    const int count = config_.max_workers > 0 ? config_.max_workers : 1;
    workers_.reserve(static_cast<size_t>(count));
    for (int i = 0; i < count; ++i) {
        workers_.emplace_back(&ChunkWorkerPool::WorkerLoop, this);
    }
}

ChunkWorkerPool::~ChunkWorkerPool() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    task_cv_.notify_all();
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

void ChunkWorkerPool::Submit(DownloadTask task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        queue_.push_back(std::move(task));
        ++unfinished_;
    }
    task_cv_.notify_one();
}

void ChunkWorkerPool::Wait() {
    std::unique_lock<std::mutex> lock(mutex_);
    idle_cv_.wait(lock, [this] { return unfinished_ == 0; });
}

void ChunkWorkerPool::WorkerLoop() {
    while (true) {
        DownloadTask task;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            task_cv_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
            if (stopping_) {
                return;
            }
            task = std::move(queue_.front());
            queue_.pop_front();
        }

        RunTask(task);
        task.transfer.reset();

        {
            std::lock_guard<std::mutex> lock(mutex_);
            --unfinished_;
            if (unfinished_ == 0) {
                idle_cv_.notify_all();
            }
        }
    }
}

void ChunkWorkerPool::Checkpoint(DownloadTask& task, int64_t committed) {
    task.transfer->destination().Sync();
    tracker_.RecordProgress(task.transfer->plan().destination, task.range_index, committed);
}

void ChunkWorkerPool::CheckpointOnCancel(DownloadTask& task, int64_t committed, int64_t checkpointed) {
    if (committed <= checkpointed) {
        return;
    }
    try {
        Checkpoint(task, committed);
    } catch (const DownloadException& e) {
        LOG_WARNING_TAG(task.transfer->plan().remote_path + ": cannot record progress on cancel: " + e.what(),
                        "ChunkWorkerPool");
    }
}

void ChunkWorkerPool::RunTask(DownloadTask& task) {
    auto& transfer = *task.transfer;
    const auto& plan = transfer.plan();
    const ChunkRange& range = plan.ranges[task.range_index];
    const std::string label = plan.remote_path + " [" + std::to_string(range.start) + "-" +
                              std::to_string(range.end) + ")";

    // Ranges not yet started are left pending for a later resume.
    if (transfer.failed() || token_.IsCancelled()) {
        return;
    }

    int64_t committed = task.resume_offset;
    int64_t checkpointed = committed;
    const int max_attempts = config_.max_attempts > 0 ? config_.max_attempts : 1;

    for (int attempt = 1;; ++attempt) {
        try {
            FetchOnce(task, committed, checkpointed);
            transfer.destination().Sync();
            tracker_.RecordComplete(plan.destination, task.range_index);
            LOG_DEBUG_TAG(label + " complete", "ChunkWorkerPool");
            return;
        } catch (const DownloadException& e) {
            if (e.kind() == ErrorKind::CANCELLED) {
                CheckpointOnCancel(task, committed, checkpointed);
                LOG_DEBUG_TAG(label + " cancelled at " + std::to_string(committed) + " bytes", "ChunkWorkerPool");
                return;
            }
            if (!e.retryable()) {
                LOG_ERROR(label + ": " + e.what());
                transfer.Fail(e);
                return;
            }
            if (attempt >= max_attempts) {
                DownloadException exhausted(ErrorKind::TRANSFER_FAILED,
                                            plan.remote_path + ": giving up after " + std::to_string(attempt) +
                                                " attempts: " + e.what());
                LOG_ERROR(label + ": " + exhausted.what());
                transfer.Fail(exhausted);
                return;
            }
            int64_t delay_ms = BackoffDelayMs(config_, attempt);
            LOG_WARNING_TAG(label + " attempt " + std::to_string(attempt) + "/" + std::to_string(max_attempts) +
                                " failed: " + e.what() + ", retrying in " + std::to_string(delay_ms) + "ms",
                            "ChunkWorkerPool");
            if (token_.WaitFor(std::chrono::milliseconds(delay_ms))) {
                CheckpointOnCancel(task, committed, checkpointed);
                return;
            }
        } catch (const std::exception& e) {
            LOG_ERROR(label + ": " + e.what());
            transfer.Fail(DownloadException(ErrorKind::TRANSFER_FAILED, plan.remote_path + ": " + e.what()));
            return;
        }
    }
}

void ChunkWorkerPool::FetchOnce(DownloadTask& task, int64_t& committed, int64_t& checkpointed) {
    auto& transfer = *task.transfer;
    const auto& plan = transfer.plan();
    const ChunkRange& range = plan.ranges[task.range_index];

    if (token_.IsCancelled()) {
        throw DownloadException(ErrorKind::CANCELLED, plan.remote_path + " cancelled");
    }
    if (committed >= range.length()) {
        return;
    }

    const int64_t request_start = range.start + committed;
    const bool whole_file = range.start == 0 && range.end == plan.total_size;

    httplib::Headers headers = request_headers_;
    headers.emplace("Range", MakeRangeHeader(request_start, range.end));

    RequestOptions options;
    options.connect_timeout_seconds = config_.connect_timeout_seconds;
    options.read_timeout_seconds = config_.request_timeout_seconds;

    std::optional<DownloadException> failure;
    int64_t position = request_start;
    // Leading body bytes to drop when the server answers a resumed request with the full file.
    int64_t skip = 0;

    auto on_response = [&](int status, const httplib::Headers& response_headers) {
        if (status == 206) {
            auto it = response_headers.find("Content-Range");
            int64_t first = 0, last = 0, total = 0;
            if (it == response_headers.end() || !ParseContentRange(it->second, first, last, total)) {
                failure = DownloadException(ErrorKind::INTEGRITY_ERROR,
                                            plan.remote_path + ": missing or malformed Content-Range");
                return false;
            }
            if (first != request_start || last != range.end - 1) {
                failure = DownloadException(ErrorKind::INTEGRITY_ERROR,
                                            plan.remote_path + ": server returned " + it->second + " for " +
                                                MakeRangeHeader(request_start, range.end));
                return false;
            }
            if (total >= 0 && total != plan.total_size) {
                failure = DownloadException(ErrorKind::INTEGRITY_ERROR,
                                            plan.remote_path + ": remote size " + std::to_string(total) +
                                                " differs from manifest size " + std::to_string(plan.total_size));
                return false;
            }
            return true;
        }
        if (status == 200) {
            if (!whole_file) {
                failure = DownloadException(ErrorKind::INTEGRITY_ERROR,
                                            plan.remote_path + ": server ignored the range request");
                return false;
            }
            skip = request_start;
            return true;
        }
        ErrorKind kind = ErrorKindFromHttpStatus(status);
        std::string message = plan.remote_path + ": HTTP " + std::to_string(status);
        if (kind == ErrorKind::UNAUTHORIZED) {
            message += " (access denied; run 'msdl login --token <token>')";
        }
        failure = DownloadException(kind, message);
        return false;
    };

    auto on_data = [&](const char* data, size_t length) {
        if (token_.IsCancelled()) {
            failure = DownloadException(ErrorKind::CANCELLED, plan.remote_path + " cancelled");
            return false;
        }
        if (skip > 0) {
            const int64_t dropped = std::min<int64_t>(skip, static_cast<int64_t>(length));
            skip -= dropped;
            data += dropped;
            length -= static_cast<size_t>(dropped);
            if (length == 0) {
                return true;
            }
        }
        if (position + static_cast<int64_t>(length) > range.end) {
            failure = DownloadException(ErrorKind::INTEGRITY_ERROR,
                                        plan.remote_path + ": response body is longer than the requested range");
            return false;
        }
        try {
            transfer.destination().WriteAt(position, data, length);
            position += static_cast<int64_t>(length);
            committed += static_cast<int64_t>(length);
            reporter_.AddBytes(plan.remote_path, static_cast<int64_t>(length));
            if (config_.checkpoint_bytes > 0 && committed - checkpointed >= config_.checkpoint_bytes) {
                Checkpoint(task, committed);
                checkpointed = committed;
            }
        } catch (const DownloadException& e) {
            failure = e;
            return false;
        }
        return true;
    };

    HttpResponse response = transport_->GetStream(transfer.url(), headers, options, on_response, on_data);

    if (failure) {
        throw *failure;
    }
    if (!response.Ok()) {
        throw DownloadException(ErrorKind::TRANSIENT_NETWORK,
                                plan.remote_path + ": " + httplib::to_string(response.error));
    }
    if (position < range.end) {
        throw DownloadException(ErrorKind::TRANSIENT_NETWORK,
                                plan.remote_path + ": connection closed after " +
                                    std::to_string(position - range.start) + " of " +
                                    std::to_string(range.length()) + " bytes");
    }
}

} // namespace msdl
