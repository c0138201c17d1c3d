//
//  cli_download_listener.hpp
//
//  CLI-specific download listeners for user interface feedback
//

#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <string>

#include "msdl/progress_reporter.hpp"

namespace msdl {

class SilentDownloadListener : public ProgressListener {
};

// One plain line per event, suitable for logs and pipes.
class LineDownloadListener : public ProgressListener {
public:
    // Progress lines are printed each time a file crosses another `step_percent`.
    explicit LineDownloadListener(int step_percent = 10) : step_percent_(step_percent) {}

    void OnFileStart(const std::string& name, int64_t total) override;
    void OnFileProgress(const std::string& name, int64_t downloaded, int64_t total) override;
    void OnFileComplete(const std::string& name) override;
    void OnFileError(const std::string& name, const std::string& error) override;

private:
    int step_percent_;
    std::map<std::string, int> last_step_;
};

// Single redrawn bar aggregating all files of the invocation.
class CLIDownloadListener : public ProgressListener {
public:
    explicit CLIDownloadListener(std::chrono::milliseconds redraw_interval = std::chrono::milliseconds(100))
        : redraw_interval_(redraw_interval) {}

    void OnFileStart(const std::string& name, int64_t total) override;
    void OnFileProgress(const std::string& name, int64_t downloaded, int64_t total) override;
    void OnFileComplete(const std::string& name) override;
    void OnFileError(const std::string& name, const std::string& error) override;

    // Draws the final state and moves to a fresh line.
    void EndProgress();

private:
    struct FileProgress {
        int64_t downloaded = 0;
        int64_t total = 0;
    };

    void Redraw(bool force);
    void ClearLine();

    std::chrono::milliseconds redraw_interval_;
    std::chrono::steady_clock::time_point last_draw_{};
    std::map<std::string, FileProgress> files_;
    std::string current_file_;
    int completed_ = 0;
    bool bar_visible_ = false;
};

} // namespace msdl
