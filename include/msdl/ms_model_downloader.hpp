//
//  ms_model_downloader.hpp
//
//  Download orchestrator: resolve, plan, transfer, verify
//

#pragma once

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "msdl/cancellation_token.hpp"
#include "msdl/dl_config.hpp"
#include "msdl/errors.hpp"
#include "msdl/http_transport.hpp"
#include "msdl/model_name_utils.hpp"
#include "msdl/ms_api_client.hpp"
#include "msdl/progress_reporter.hpp"

namespace msdl {

enum class DownloadStage {
    RESOLVING,
    PLANNING,
    TRANSFERRING,
    VERIFYING,
    DONE,
    FAILED,
    CANCELLED
};

const char* DownloadStageName(DownloadStage stage);

struct DownloadRequest {
    RepositoryId repo;
    // Single repository-relative file; the whole repository when unset.
    std::optional<std::string> file_path;
    std::string save_dir;
};

struct FileOutcome {
    std::string remote_path;
    std::string local_path;
    int64_t size = 0;
    std::optional<ErrorKind> error_kind;
    std::string message;
};

struct DownloadResult {
    DownloadStage stage = DownloadStage::RESOLVING;
    std::vector<FileOutcome> succeeded;
    std::vector<FileOutcome> failed;
    // Set when the invocation as a whole failed before any file was attempted.
    std::optional<ErrorKind> error_kind;
    std::string error_message;
    std::string model_path;

    bool success() const { return stage == DownloadStage::DONE; }
    bool cancelled() const { return stage == DownloadStage::CANCELLED; }
};

class MsModelDownloader {
public:
    // A null transport selects HttplibTransport; a null token creates a private one.
    explicit MsModelDownloader(DownloadConfig config, std::shared_ptr<HttpTransport> transport = nullptr,
                               std::shared_ptr<CancellationToken> token = nullptr);

    // `listener` may be null and must outlive Download().
    void SetListener(ProgressListener* listener) { listener_ = listener; }

    // Never throws for download failures; they are reported in the result.
    // A private token is cleared on entry, so a cancelled downloader can run again;
    // a token passed to the constructor is left to its owner.
    DownloadResult Download(const DownloadRequest& request);

    // Cooperative; safe from any thread. In-flight ranges stop at the next segment.
    // Files finished before the cancellation are still verified and reported.
    void Cancel();

    CancellationToken& cancellation_token() { return *token_; }

    DownloadStage stage() const { return stage_.load(); }

    // <save_dir>/<owner>/<name>
    static std::filesystem::path GetModelPath(const std::string& save_dir, const RepositoryId& repo);

private:
    void SetStage(DownloadStage stage, const RepositoryId& repo);

    DownloadConfig config_;
    std::shared_ptr<HttpTransport> transport_;
    ProgressListener* listener_ = nullptr;
    std::shared_ptr<CancellationToken> token_;
    bool owns_token_ = false;
    std::atomic<DownloadStage> stage_{DownloadStage::RESOLVING};
};

} // namespace msdl
