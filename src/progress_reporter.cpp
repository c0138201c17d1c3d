//
//  progress_reporter.cpp
//
//  Per-file progress aggregation and asynchronous listener dispatch
//

#include "msdl/progress_reporter.hpp"

#include <algorithm>
#include <exception>
#include <utility>

#include "msdl/log_utils.hpp"

namespace msdl {

ProgressReporter::ProgressReporter(ProgressListener* listener) : listener_(listener) {
    thread_ = std::thread(&ProgressReporter::Run, this);
}

ProgressReporter::~ProgressReporter() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    queue_cv_.notify_all();
    if (thread_.joinable()) {
        thread_.join();
    }
}

void ProgressReporter::FileStarted(const std::string& name, int64_t total, int64_t already_downloaded) {
    ProgressEvent start;
    start.file_name = name;
    start.kind = ProgressEventKind::START;
    start.total = total;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& counters = files_[name];
        counters.total = total;
        counters.downloaded = std::max(counters.downloaded, already_downloaded);
        start.downloaded = counters.downloaded;
    }
    Enqueue(std::move(start));
    if (already_downloaded > 0) {
        AddBytes(name, 0);
    }
}

void ProgressReporter::AddBytes(const std::string& name, int64_t delta) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& counters = files_[name];
    if (delta > 0) {
        counters.downloaded += delta;
    }
    auto pending = pending_progress_.find(name);
    if (pending != pending_progress_.end()) {
        pending->second->downloaded = counters.downloaded;
        return;
    }
    ProgressEvent event;
    event.file_name = name;
    event.kind = ProgressEventKind::PROGRESS;
    event.downloaded = counters.downloaded;
    event.total = counters.total;
    queue_.push_back(std::move(event));
    pending_progress_[name] = std::prev(queue_.end());
    queue_cv_.notify_one();
}

void ProgressReporter::FileCompleted(const std::string& name) {
    ProgressEvent event;
    event.file_name = name;
    event.kind = ProgressEventKind::COMPLETE;
    Enqueue(std::move(event));
}

void ProgressReporter::FileFailed(const std::string& name, const std::string& error) {
    ProgressEvent event;
    event.file_name = name;
    event.kind = ProgressEventKind::ERROR;
    event.error = error;
    Enqueue(std::move(event));
}

void ProgressReporter::Enqueue(ProgressEvent event) {
    std::lock_guard<std::mutex> lock(mutex_);
    // A later progress update must not jump ahead of this event.
    pending_progress_.erase(event.file_name);
    queue_.push_back(std::move(event));
    queue_cv_.notify_one();
}

void ProgressReporter::Flush() {
    std::unique_lock<std::mutex> lock(mutex_);
    idle_cv_.wait(lock, [this] { return queue_.empty() && !dispatching_; });
}

int64_t ProgressReporter::Downloaded(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = files_.find(name);
    return it == files_.end() ? 0 : it->second.downloaded;
}

void ProgressReporter::Dispatch(const ProgressEvent& event) {
    if (!listener_) {
        return;
    }
    try {
        switch (event.kind) {
            case ProgressEventKind::START:
                listener_->OnFileStart(event.file_name, event.total);
                break;
            case ProgressEventKind::PROGRESS:
                listener_->OnFileProgress(event.file_name, event.downloaded, event.total);
                break;
            case ProgressEventKind::COMPLETE:
                listener_->OnFileComplete(event.file_name);
                break;
            case ProgressEventKind::ERROR:
                listener_->OnFileError(event.file_name, event.error);
                break;
        }
    } catch (const std::exception& e) {
        LOG_WARNING_TAG("Progress listener threw for " + event.file_name + ": " + e.what(), "ProgressReporter");
    }
}

void ProgressReporter::Run() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (true) {
        queue_cv_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
        if (queue_.empty()) {
            if (stopping_) {
                break;
            }
            continue;
        }

        auto pending = pending_progress_.find(queue_.front().file_name);
        if (pending != pending_progress_.end() && pending->second == queue_.begin()) {
            pending_progress_.erase(pending);
        }
        ProgressEvent event = std::move(queue_.front());
        queue_.pop_front();

        bool deliver = true;
        if (event.kind == ProgressEventKind::PROGRESS) {
            auto& counters = files_[event.file_name];
            deliver = event.downloaded >= counters.reported;
            counters.reported = std::max(counters.reported, event.downloaded);
        }
        if (!deliver) {
            if (queue_.empty()) {
                idle_cv_.notify_all();
            }
            continue;
        }

        dispatching_ = true;
        lock.unlock();
        Dispatch(event);
        lock.lock();
        dispatching_ = false;
        if (queue_.empty()) {
            idle_cv_.notify_all();
        }
    }
    idle_cv_.notify_all();
}

} // namespace msdl
