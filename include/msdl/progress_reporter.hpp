//
//  progress_reporter.hpp
//
//  Per-file progress aggregation and asynchronous listener dispatch
//

#pragma once

#include <condition_variable>
#include <cstdint>
#include <list>
#include <map>
#include <mutex>
#include <string>
#include <thread>

namespace msdl {

// Observer of one download invocation. Callbacks arrive on the reporter thread,
// never concurrently with each other.
class ProgressListener {
public:
    virtual ~ProgressListener() = default;

    virtual void OnFileStart(const std::string& name, int64_t total) {}
    virtual void OnFileProgress(const std::string& name, int64_t downloaded, int64_t total) {}
    virtual void OnFileComplete(const std::string& name) {}
    virtual void OnFileError(const std::string& name, const std::string& error) {}
};

enum class ProgressEventKind {
    START,
    PROGRESS,
    COMPLETE,
    ERROR
};

struct ProgressEvent {
    std::string file_name;
    ProgressEventKind kind = ProgressEventKind::PROGRESS;
    int64_t downloaded = 0;
    int64_t total = 0;
    std::string error;
};

class ProgressReporter {
public:
    // `listener` may be null; it must outlive the reporter.
    explicit ProgressReporter(ProgressListener* listener);
    ~ProgressReporter();

    ProgressReporter(const ProgressReporter&) = delete;
    ProgressReporter& operator=(const ProgressReporter&) = delete;

    // `already_downloaded` counts bytes kept from an earlier run.
    void FileStarted(const std::string& name, int64_t total, int64_t already_downloaded);

    // Called by workers for every written segment; never blocks on the listener.
    void AddBytes(const std::string& name, int64_t delta);

    void FileCompleted(const std::string& name);
    void FileFailed(const std::string& name, const std::string& error);

    // Blocks until every queued event has been delivered.
    void Flush();

    int64_t Downloaded(const std::string& name) const;

private:
    struct FileCounters {
        int64_t downloaded = 0;
        int64_t total = 0;
        int64_t reported = 0;
    };

    void Enqueue(ProgressEvent event);
    void Dispatch(const ProgressEvent& event);
    void Run();

    ProgressListener* listener_;

    mutable std::mutex mutex_;
    std::condition_variable queue_cv_;
    std::condition_variable idle_cv_;
    std::list<ProgressEvent> queue_;
    // Queued PROGRESS event per file, updated in place while it waits.
    std::map<std::string, std::list<ProgressEvent>::iterator> pending_progress_;
    std::map<std::string, FileCounters> files_;
    bool dispatching_ = false;
    bool stopping_ = false;

    std::thread thread_;
};

} // namespace msdl
