//
//  cli_download_listener.cpp
//
//  CLI-specific download listeners for user interface feedback
//

#include "msdl/cli_download_listener.hpp"

#include <iostream>

#include "msdl/log_utils.hpp"
#include "msdl/user_interface.hpp"

namespace msdl {

void LineDownloadListener::OnFileStart(const std::string& name, int64_t total) {
    std::cout << "start " << name << " (" << LogUtils::FormatFileSize(total) << ")" << std::endl;
    last_step_[name] = -1;
}

void LineDownloadListener::OnFileProgress(const std::string& name, int64_t downloaded, int64_t total) {
    if (total <= 0 || step_percent_ <= 0) {
        return;
    }
    int step = static_cast<int>(downloaded * 100 / total) / step_percent_;
    auto it = last_step_.find(name);
    if (it != last_step_.end() && step <= it->second) {
        return;
    }
    last_step_[name] = step;
    std::cout << "progress " << name << " " << LogUtils::FormatProgress(static_cast<double>(downloaded) / total)
              << " " << LogUtils::FormatFileSize(downloaded) << "/" << LogUtils::FormatFileSize(total) << std::endl;
}

void LineDownloadListener::OnFileComplete(const std::string& name) {
    std::cout << "done " << name << std::endl;
    last_step_.erase(name);
}

void LineDownloadListener::OnFileError(const std::string& name, const std::string& error) {
    std::cout << "error " << name << ": " << error << std::endl;
    last_step_.erase(name);
}

void CLIDownloadListener::OnFileStart(const std::string& name, int64_t total) {
    files_[name].total = total;
    current_file_ = name;
    Redraw(false);
}

void CLIDownloadListener::OnFileProgress(const std::string& name, int64_t downloaded, int64_t total) {
    auto& file = files_[name];
    file.downloaded = downloaded;
    file.total = total;
    current_file_ = name;
    Redraw(false);
}

void CLIDownloadListener::OnFileComplete(const std::string& name) {
    auto& file = files_[name];
    file.downloaded = file.total;
    ++completed_;
    ClearLine();
    UserInterface::ShowSuccess(name + " (" + LogUtils::FormatFileSize(file.total) + ")");
    Redraw(true);
}

void CLIDownloadListener::OnFileError(const std::string& name, const std::string& error) {
    ClearLine();
    UserInterface::ShowError(name + ": " + error);
    Redraw(true);
}

void CLIDownloadListener::EndProgress() {
    if (bar_visible_) {
        Redraw(true);
        std::cout << std::endl;
        bar_visible_ = false;
    }
}

void CLIDownloadListener::ClearLine() {
    if (bar_visible_) {
        std::cout << "\r\033[K" << std::flush;
        bar_visible_ = false;
    }
}

void CLIDownloadListener::Redraw(bool force) {
    auto now = std::chrono::steady_clock::now();
    if (!force && bar_visible_ && now - last_draw_ < redraw_interval_) {
        return;
    }
    last_draw_ = now;

    int64_t downloaded = 0;
    int64_t total = 0;
    for (const auto& entry : files_) {
        downloaded += entry.second.downloaded;
        total += entry.second.total;
    }
    double progress = total > 0 ? static_cast<double>(downloaded) / total : 0.0;
    std::string label = "[" + std::to_string(completed_) + "/" + std::to_string(files_.size()) + "]";
    std::string suffix = LogUtils::FormatFileSize(downloaded) + " / " + LogUtils::FormatFileSize(total);
    if (!current_file_.empty() && completed_ < static_cast<int>(files_.size())) {
        suffix += "  " + current_file_;
    }
    std::cout << "\r\033[K" << UserInterface::RenderBar(label, progress, suffix) << std::flush;
    bar_visible_ = true;
}

} // namespace msdl
