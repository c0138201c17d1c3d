//
//  log_utils.hpp
//
//  Centralized stderr logging for the download engine and the CLI
//

#pragma once

#include <cstdint>
#include <string>

namespace msdl {

// Terminal color constants for colored logging
namespace Colors {
    const std::string RESET = "\033[0m";
    const std::string RED = "\033[31m";
    const std::string GREEN = "\033[32m";
    const std::string YELLOW = "\033[33m";
    const std::string BLUE = "\033[34m";
    const std::string CYAN = "\033[36m";
    const std::string BOLD = "\033[1m";
}

enum class LogLevel {
    DEBUG,
    INFO,
    WARNING,
    ERROR
};

class LogUtils {
public:
    // Set global verbose mode
    static void SetVerbose(bool verbose);

    static bool IsVerbose();

    static void Debug(const std::string& message, const std::string& tag = "");
    static void Info(const std::string& message, const std::string& tag = "");
    static void Warning(const std::string& message, const std::string& tag = "");
    static void Error(const std::string& message, const std::string& tag = "");

    // Only outputs when verbose is enabled
    static void DebugIfVerbose(const std::string& message, const std::string& tag = "") {
        if (IsVerbose()) {
            Debug(message, tag);
        }
    }

    // "1.50 GB", "512 B"
    static std::string FormatFileSize(int64_t bytes);

    // "42.0%"
    static std::string FormatProgress(double progress);

    // "2024-12-18 10:21:07.123"
    static std::string GetTimestamp();

private:
    static std::string FormatMessage(LogLevel level, const std::string& message, const std::string& tag);
    static void Write(LogLevel level, const std::string& message, const std::string& tag);
};

#define LOG_DEBUG(msg) msdl::LogUtils::DebugIfVerbose(msg)
#define LOG_DEBUG_TAG(msg, tag) msdl::LogUtils::DebugIfVerbose(msg, tag)
#define LOG_INFO(msg) msdl::LogUtils::Info(msg)
#define LOG_INFO_TAG(msg, tag) msdl::LogUtils::Info(msg, tag)
#define LOG_WARNING(msg) msdl::LogUtils::Warning(msg)
#define LOG_WARNING_TAG(msg, tag) msdl::LogUtils::Warning(msg, tag)

#define LOG_ERROR(msg) msdl::LogUtils::Error(msg)
#define LOG_ERROR_TAG(msg, tag) msdl::LogUtils::Error(msg, tag)

} // namespace msdl
