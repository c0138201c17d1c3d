//
//  log_utils.cpp
//
//  Centralized stderr logging for the download engine and the CLI
//

#include "msdl/log_utils.hpp"

#include <atomic>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <mutex>
#include <sstream>
#include <unistd.h>

namespace msdl {

namespace {

std::atomic<bool> g_verbose{false};

// Workers log concurrently; one line must not interleave with another.
std::mutex g_write_mutex;

const char* LevelName(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARNING: return "WARN";
        case LogLevel::ERROR: return "ERROR";
    }
    return "INFO";
}

const std::string& LevelColor(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return Colors::CYAN;
        case LogLevel::WARNING: return Colors::YELLOW;
        case LogLevel::ERROR: return Colors::RED;
        default: return Colors::RESET;
    }
}

} // namespace

void LogUtils::SetVerbose(bool verbose) {
    g_verbose.store(verbose, std::memory_order_relaxed);
}

bool LogUtils::IsVerbose() {
    return g_verbose.load(std::memory_order_relaxed);
}

void LogUtils::Debug(const std::string& message, const std::string& tag) {
    Write(LogLevel::DEBUG, message, tag);
}

void LogUtils::Info(const std::string& message, const std::string& tag) {
    Write(LogLevel::INFO, message, tag);
}

void LogUtils::Warning(const std::string& message, const std::string& tag) {
    Write(LogLevel::WARNING, message, tag);
}

void LogUtils::Error(const std::string& message, const std::string& tag) {
    Write(LogLevel::ERROR, message, tag);
}

std::string LogUtils::FormatFileSize(int64_t bytes) {
    static const char* units[] = {"B", "KB", "MB", "GB", "TB"};
    if (bytes < 0) {
        return "N/A";
    }
    int unit_index = 0;
    double size = static_cast<double>(bytes);
    while (size >= 1024.0 && unit_index < 4) {
        size /= 1024.0;
        ++unit_index;
    }
    std::ostringstream oss;
    if (unit_index == 0) {
        oss << bytes << " B";
    } else {
        oss << std::fixed << std::setprecision(2) << size << " " << units[unit_index];
    }
    return oss.str();
}

std::string LogUtils::FormatProgress(double progress) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1) << progress * 100.0 << "%";
    return oss.str();
}

std::string LogUtils::GetTimestamp() {
    auto now = std::chrono::system_clock::now();
    auto seconds = std::chrono::system_clock::to_time_t(now);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
    std::tm local_tm{};
    localtime_r(&seconds, &local_tm);
    std::ostringstream oss;
    oss << std::put_time(&local_tm, "%Y-%m-%d %H:%M:%S") << "." << std::setw(3) << std::setfill('0') << millis;
    return oss.str();
}

std::string LogUtils::FormatMessage(LogLevel level, const std::string& message, const std::string& tag) {
    std::ostringstream oss;
    oss << "[" << GetTimestamp() << "] [" << LevelName(level) << "]";
    if (!tag.empty()) {
        oss << " [" << tag << "]";
    }
    oss << " " << message;
    return oss.str();
}

void LogUtils::Write(LogLevel level, const std::string& message, const std::string& tag) {
    static const bool colored = isatty(fileno(stderr)) != 0;
    std::string line = FormatMessage(level, message, tag);
    std::lock_guard<std::mutex> lock(g_write_mutex);
    if (colored && level != LogLevel::INFO) {
        fprintf(stderr, "%s%s%s\n", LevelColor(level).c_str(), line.c_str(), Colors::RESET.c_str());
    } else {
        fprintf(stderr, "%s\n", line.c_str());
    }
}

} // namespace msdl
