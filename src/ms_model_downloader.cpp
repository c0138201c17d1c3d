//
//  ms_model_downloader.cpp
//
//  Download orchestrator: resolve, plan, transfer, verify
//

#include "msdl/ms_model_downloader.hpp"

#include <utility>

#include "msdl/chunk_worker_pool.hpp"
#include "msdl/destination_file.hpp"
#include "msdl/log_utils.hpp"
#include "msdl/resume_state.hpp"
#include "msdl/transfer_planner.hpp"

namespace fs = std::filesystem;

namespace msdl {

namespace {

// Per-file bookkeeping across the stages of one invocation.
struct FileJob {
    RemoteFile remote;
    TransferPlan plan;
    ResumeState state;
    std::shared_ptr<FileTransfer> transfer;
    std::optional<DownloadException> error;
};

FileOutcome MakeOutcome(const FileJob& job) {
    FileOutcome outcome;
    outcome.remote_path = job.remote.path;
    outcome.local_path = job.plan.destination;
    outcome.size = job.remote.size;
    if (job.error) {
        outcome.error_kind = job.error->kind();
        outcome.message = job.error->what();
    }
    return outcome;
}

} // namespace

const char* DownloadStageName(DownloadStage stage) {
    switch (stage) {
        case DownloadStage::RESOLVING: return "resolving";
        case DownloadStage::PLANNING: return "planning";
        case DownloadStage::TRANSFERRING: return "transferring";
        case DownloadStage::VERIFYING: return "verifying";
        case DownloadStage::DONE: return "done";
        case DownloadStage::FAILED: return "failed";
        case DownloadStage::CANCELLED: return "cancelled";
    }
    return "unknown";
}

MsModelDownloader::MsModelDownloader(DownloadConfig config, std::shared_ptr<HttpTransport> transport,
                                     std::shared_ptr<CancellationToken> token)
    : config_(std::move(config)), transport_(std::move(transport)), token_(std::move(token)) {
    if (!transport_) {
        transport_ = std::make_shared<HttplibTransport>();
    }
    if (!token_) {
        token_ = std::make_shared<CancellationToken>();
        owns_token_ = true;
    }
}

fs::path MsModelDownloader::GetModelPath(const std::string& save_dir, const RepositoryId& repo) {
    return fs::path(save_dir) / repo.owner / repo.name;
}

void MsModelDownloader::Cancel() {
    token_->Cancel();
}

void MsModelDownloader::SetStage(DownloadStage stage, const RepositoryId& repo) {
    stage_.store(stage);
    LOG_DEBUG_TAG(repo.ToString() + ": " + DownloadStageName(stage), "MsModelDownloader");
}

DownloadResult MsModelDownloader::Download(const DownloadRequest& request) {
    if (owns_token_) {
        token_->Reset();
    }
    DownloadResult result;
    const RepositoryId& repo = request.repo;
    const fs::path model_path = GetModelPath(request.save_dir, repo);
    result.model_path = model_path.string();

    MsApiClient api(transport_, config_);

    SetStage(DownloadStage::RESOLVING, repo);
    std::vector<RemoteFile> files;
    try {
        files = api.ListFiles(repo, request.file_path, token_.get());
    } catch (const DownloadException& e) {
        result.stage = e.kind() == ErrorKind::CANCELLED ? DownloadStage::CANCELLED : DownloadStage::FAILED;
        result.error_kind = e.kind();
        result.error_message = e.what();
        SetStage(result.stage, repo);
        return result;
    }

    ProgressReporter reporter(listener_);
    ResumeStateTracker tracker;
    std::vector<FileJob> jobs;
    jobs.reserve(files.size());

    SetStage(DownloadStage::PLANNING, repo);
    for (auto& remote : files) {
        FileJob job;
        job.remote = remote;
        const fs::path destination = model_path / fs::path(remote.path);
        job.plan = TransferPlanner::PlanTransfer(remote, destination.string(), config_);
        if (!config_.verify_sha256) {
            job.plan.sha256.reset();
        }
        try {
            std::error_code ec;
            fs::create_directories(destination.parent_path(), ec);
            if (ec) {
                throw DownloadException(ErrorKind::TRANSFER_FAILED,
                                        "Cannot create " + destination.parent_path().string() + ": " + ec.message());
            }
            job.state = tracker.Load(job.plan);
            job.state.ApplyTo(job.plan);

            if (job.plan.ranges.empty()) {
                DestinationFile::Open(job.plan.destination)->Resize(0);
            } else if (!job.plan.IsComplete()) {
                tracker.Begin(job.plan, job.state);
                auto destination_file = DestinationFile::Open(job.plan.destination);
                destination_file->Resize(job.plan.total_size);
                job.transfer = std::make_shared<FileTransfer>(job.plan, api.GetFileUrl(repo, remote.path),
                                                              std::move(destination_file));
            }
            reporter.FileStarted(remote.path, remote.size, job.state.CommittedBytes());
        } catch (const DownloadException& e) {
            LOG_ERROR(remote.path + ": " + e.what());
            job.error = e;
        }
        jobs.push_back(std::move(job));
    }

    SetStage(DownloadStage::TRANSFERRING, repo);
    {
        ChunkWorkerPool pool(transport_, tracker, reporter, *token_, config_, api.AuthHeaders());
        for (auto& job : jobs) {
            if (!job.transfer) {
                continue;
            }
            for (size_t i = 0; i < job.plan.ranges.size(); ++i) {
                if (job.plan.ranges[i].state == RangeState::DONE) {
                    continue;
                }
                DownloadTask task;
                task.transfer = job.transfer;
                task.range_index = i;
                task.resume_offset = job.state.committed[i];
                pool.Submit(std::move(task));
            }
        }
        pool.Wait();
    }

    for (auto& job : jobs) {
        if (job.transfer && !job.error) {
            job.error = job.transfer->error();
        }
        // Closes the destination once no task refers to it any more.
        job.transfer.reset();
    }

    const bool cancelled = token_->IsCancelled();
    if (!cancelled) {
        SetStage(DownloadStage::VERIFYING, repo);
    }
    for (auto& job : jobs) {
        // Files the cancellation cut short stay resumable and are not reported as errors.
        const bool cut_short = job.error ? job.error->kind() == ErrorKind::CANCELLED
                                         : cancelled && !tracker.IsComplete(job.plan);
        if (cut_short) {
            if (!job.error) {
                job.error = DownloadException(ErrorKind::CANCELLED, job.remote.path + " cancelled");
            }
            result.failed.push_back(MakeOutcome(job));
            continue;
        }
        if (!job.error) {
            try {
                tracker.Finalize(job.plan, job.plan.sha256);
            } catch (const DownloadException& e) {
                LOG_ERROR_TAG(job.remote.path + ": " + e.what(), "MsModelDownloader");
                job.error = e;
            }
        }
        if (job.error) {
            reporter.FileFailed(job.remote.path, job.error->what());
            result.failed.push_back(MakeOutcome(job));
        } else {
            reporter.FileCompleted(job.remote.path);
            result.succeeded.push_back(MakeOutcome(job));
        }
    }
    reporter.Flush();

    if (cancelled) {
        result.stage = DownloadStage::CANCELLED;
        result.error_kind = ErrorKind::CANCELLED;
        result.error_message = "Download of " + repo.ToString() + " cancelled; run again to resume";
        SetStage(result.stage, repo);
        return result;
    }

    result.stage = result.failed.empty() ? DownloadStage::DONE : DownloadStage::FAILED;
    if (!result.failed.empty()) {
        result.error_kind = result.failed.front().error_kind;
        result.error_message = std::to_string(result.failed.size()) + " of " + std::to_string(jobs.size()) +
                               " file(s) failed";
    }
    LOG_DEBUG_TAG(repo.ToString() + ": " + std::to_string(result.succeeded.size()) + " succeeded, " +
                      std::to_string(result.failed.size()) + " failed",
                  "MsModelDownloader");
    SetStage(result.stage, repo);
    return result;
}

} // namespace msdl
