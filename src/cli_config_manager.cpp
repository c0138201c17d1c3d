//
//  cli_config_manager.cpp
//
//  Configuration management implementation
//

#include "msdl/cli_config_manager.hpp"

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sys/stat.h>

#include <nlohmann/json.hpp>

#include "msdl/file_utils.hpp"
#include "msdl/log_utils.hpp"

namespace fs = std::filesystem;

namespace msdl {

namespace {

bool ParsePositiveInt(const std::string& value, int max_value, int& out) {
    try {
        size_t consumed = 0;
        int parsed = std::stoi(value, &consumed);
        if (consumed != value.size() || parsed < 1 || parsed > max_value) {
            return false;
        }
        out = parsed;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

bool ParseBool(const std::string& value, bool& out) {
    std::string lower = value;
    std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);
    if (lower == "true" || lower == "1" || lower == "yes" || lower == "on") {
        out = true;
        return true;
    }
    if (lower == "false" || lower == "0" || lower == "no" || lower == "off") {
        out = false;
        return true;
    }
    return false;
}

std::string MaskToken(const std::string& token) {
    if (token.empty()) {
        return "Not set";
    }
    return token.substr(0, std::min<size_t>(4, token.size())) + "****";
}

} // namespace

ConfigManager& ConfigManager::GetInstance() {
    static ConfigManager instance;
    return instance;
}

Config ConfigManager::GetDefaultConfig() {
    DownloadConfig engine;
    return {
        kDefaultSaveDir,
        engine.endpoint,
        engine.revision,
        engine.max_workers,
        static_cast<int>(engine.chunk_threshold_bytes / kMiB),
        static_cast<int>(engine.min_chunk_bytes / kMiB),
        engine.request_timeout_seconds,
        engine.max_attempts,
        engine.verify_sha256,
        "",
        {}
    };
}

void ConfigManager::SetConfigDir(const std::string& dir) {
    config_dir_override_ = dir;
    current_config_ = GetDefaultConfig();
}

std::string ConfigManager::GetConfigFilePath() const {
    std::string config_dir = config_dir_override_.empty() ? FileUtils::ExpandTilde(kConfigDir)
                                                         : config_dir_override_;
    return (fs::path(config_dir) / kConfigFileName).string();
}

Config ConfigManager::LoadConfig() {
    current_config_ = LoadFromEnvironment(LoadPersisted());
    return current_config_;
}

Config ConfigManager::LoadPersisted() {
    return LoadFromFile(GetDefaultConfig());
}

Config ConfigManager::LoadFromFile(Config config) {
    std::string config_path = GetConfigFilePath();
    std::error_code ec;
    if (!fs::exists(config_path, ec)) {
        return config;
    }

    try {
        std::ifstream file(config_path);
        nlohmann::json j;
        file >> j;

        // Only override if value exists in file
        if (j.contains("save_dir") && !j["save_dir"].get<std::string>().empty()) {
            config.save_dir = j["save_dir"].get<std::string>();
        }
        if (j.contains("endpoint") && !j["endpoint"].get<std::string>().empty()) {
            config.endpoint = j["endpoint"].get<std::string>();
        }
        if (j.contains("revision") && !j["revision"].get<std::string>().empty()) {
            config.revision = j["revision"].get<std::string>();
        }
        config.max_workers = j.value("max_workers", config.max_workers);
        config.chunk_threshold_mb = j.value("chunk_threshold_mb", config.chunk_threshold_mb);
        config.min_chunk_mb = j.value("min_chunk_mb", config.min_chunk_mb);
        config.request_timeout = j.value("request_timeout", config.request_timeout);
        config.max_attempts = j.value("max_attempts", config.max_attempts);
        config.verify_sha256 = j.value("verify_sha256", config.verify_sha256);
        config.access_token = j.value("access_token", config.access_token);
        if (j.contains("known_save_dirs") && j["known_save_dirs"].is_array()) {
            config.known_save_dirs = j["known_save_dirs"].get<std::vector<std::string>>();
        }
    } catch (const nlohmann::json::exception& e) {
        LOG_WARNING_TAG("Ignoring unreadable config file " + config_path + ": " + e.what(), "ConfigManager");
        return GetDefaultConfig();
    }
    return config;
}

Config ConfigManager::LoadFromEnvironment(Config config) {
    if (const char* env_token = std::getenv("MODELSCOPE_API_TOKEN")) {
        if (env_token[0] != '\0') {
            config.access_token = env_token;
        }
    }
    if (const char* env_save_dir = std::getenv("MSDL_SAVE_DIR")) {
        if (env_save_dir[0] != '\0') {
            config.save_dir = env_save_dir;
        }
    }
    return config;
}

bool ConfigManager::SaveConfig(const Config& config) {
    try {
        std::string config_path = GetConfigFilePath();
        fs::create_directories(fs::path(config_path).parent_path());

        nlohmann::json j;
        j["save_dir"] = config.save_dir;
        j["endpoint"] = config.endpoint;
        j["revision"] = config.revision;
        j["max_workers"] = config.max_workers;
        j["chunk_threshold_mb"] = config.chunk_threshold_mb;
        j["min_chunk_mb"] = config.min_chunk_mb;
        j["request_timeout"] = config.request_timeout;
        j["max_attempts"] = config.max_attempts;
        j["verify_sha256"] = config.verify_sha256;
        j["access_token"] = config.access_token;
        j["known_save_dirs"] = config.known_save_dirs;

        std::ofstream file(config_path);
        if (!file.is_open()) {
            LOG_ERROR("Failed to open configuration file " + config_path);
            return false;
        }
        file << j.dump(2);
        file.close();
        if (!file) {
            LOG_ERROR("Failed to write configuration file " + config_path);
            return false;
        }
        // The file may hold an access token.
        if (::chmod(config_path.c_str(), 0600) != 0) {
            LOG_WARNING_TAG("Cannot restrict permissions of " + config_path, "ConfigManager");
        }
        current_config_ = LoadFromEnvironment(config);
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to save configuration file: " + std::string(e.what()));
        return false;
    }
}

void ConfigManager::ShowConfig(const Config& config) {
    std::cout << "Configuration (" << GetConfigFilePath() << "):\n";
    std::cout << "  Save Directory(save_dir): " << config.save_dir << "\n";
    std::cout << "  Endpoint(endpoint): " << config.endpoint << "\n";
    std::cout << "  Revision(revision): " << config.revision << "\n";
    std::cout << "  Workers(max_workers): " << config.max_workers << "\n";
    std::cout << "  Chunk Threshold MB(chunk_threshold_mb): " << config.chunk_threshold_mb << "\n";
    std::cout << "  Min Chunk MB(min_chunk_mb): " << config.min_chunk_mb << "\n";
    std::cout << "  Request Timeout(request_timeout): " << config.request_timeout << "s\n";
    std::cout << "  Max Attempts(max_attempts): " << config.max_attempts << "\n";
    std::cout << "  Verify SHA-256(verify_sha256): " << (config.verify_sha256 ? "true" : "false") << "\n";
    std::cout << "  Access Token(access_token): " << MaskToken(config.access_token) << "\n";
    std::cout << "  Known Save Directories: " << config.known_save_dirs.size() << "\n";
    for (const auto& dir : config.known_save_dirs) {
        std::cout << "    " << dir << "\n";
    }
}

bool ConfigManager::SetConfigValue(const std::string& key, const std::string& value) {
    Config config = LoadPersisted();

    if (key == "save_dir") {
        if (value.empty()) {
            return false;
        }
        config.save_dir = value;
    } else if (key == "endpoint") {
        if (value.rfind("http://", 0) != 0 && value.rfind("https://", 0) != 0) {
            return false;
        }
        config.endpoint = value;
    } else if (key == "revision") {
        if (value.empty()) {
            return false;
        }
        config.revision = value;
    } else if (key == "max_workers") {
        if (!ParsePositiveInt(value, 64, config.max_workers)) {
            return false;
        }
    } else if (key == "chunk_threshold_mb") {
        if (!ParsePositiveInt(value, 1 << 20, config.chunk_threshold_mb)) {
            return false;
        }
    } else if (key == "min_chunk_mb") {
        if (!ParsePositiveInt(value, 1 << 20, config.min_chunk_mb)) {
            return false;
        }
    } else if (key == "request_timeout") {
        if (!ParsePositiveInt(value, 3600, config.request_timeout)) {
            return false;
        }
    } else if (key == "max_attempts") {
        if (!ParsePositiveInt(value, 100, config.max_attempts)) {
            return false;
        }
    } else if (key == "verify_sha256") {
        if (!ParseBool(value, config.verify_sha256)) {
            return false;
        }
    } else if (key == "access_token") {
        config.access_token = value;
    } else {
        return false;
    }
    return SaveConfig(config);
}

bool ConfigManager::AppendKnownSaveDir(const std::string& dir) {
    std::error_code ec;
    fs::path canonical = fs::canonical(FileUtils::ExpandTilde(dir), ec);
    if (ec) {
        LOG_WARNING_TAG("Cannot canonicalize save directory " + dir + ": " + ec.message(), "ConfigManager");
        return false;
    }

    Config config = LoadPersisted();
    std::vector<std::string> kept;
    for (const auto& known : config.known_save_dirs) {
        if (fs::exists(known, ec) && std::find(kept.begin(), kept.end(), known) == kept.end()) {
            kept.push_back(known);
        }
    }
    bool already_known = std::find(kept.begin(), kept.end(), canonical.string()) != kept.end();
    if (already_known && kept.size() == config.known_save_dirs.size()) {
        return true;
    }
    if (!already_known) {
        kept.push_back(canonical.string());
    }
    config.known_save_dirs = kept;
    return SaveConfig(config);
}

bool ConfigManager::SetAccessToken(const std::string& token) {
    Config config = LoadPersisted();
    config.access_token = token;
    return SaveConfig(config);
}

bool ConfigManager::ClearAccessToken() {
    Config config = LoadPersisted();
    if (config.access_token.empty()) {
        return true;
    }
    config.access_token.clear();
    return SaveConfig(config);
}

bool ConfigManager::ResetConfig() {
    try {
        std::string config_file = GetConfigFilePath();
        Config persisted = LoadPersisted();

        // Delete the config file if it exists
        if (fs::exists(config_file)) {
            fs::remove(config_file);
        }

        // Known save directories describe the disk, not a preference; keep them.
        if (!persisted.known_save_dirs.empty()) {
            Config defaults = GetDefaultConfig();
            defaults.known_save_dirs = persisted.known_save_dirs;
            return SaveConfig(defaults);
        }
        LoadConfig();
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to reset configuration: " + std::string(e.what()));
        return false;
    }
}

DownloadConfig ConfigManager::ToDownloadConfig(const Config& config) const {
    DownloadConfig engine;
    engine.endpoint = config.endpoint;
    engine.revision = config.revision;
    engine.max_workers = config.max_workers;
    engine.chunk_threshold_bytes = static_cast<int64_t>(config.chunk_threshold_mb) * kMiB;
    engine.min_chunk_bytes = static_cast<int64_t>(config.min_chunk_mb) * kMiB;
    engine.request_timeout_seconds = config.request_timeout;
    engine.max_attempts = config.max_attempts;
    engine.verify_sha256 = config.verify_sha256;
    engine.access_token = config.access_token;
    return engine;
}

std::string ConfigManager::GetSaveDir() const {
    return FileUtils::ExpandTilde(current_config_.save_dir.empty() ? kDefaultSaveDir : current_config_.save_dir);
}

std::string ConfigManager::GetConfigHelp() const {
    return R"(
Available configuration keys:
  save_dir            - Directory models are downloaded into (default: ~/.modelscope/models)
  endpoint            - Hub endpoint (default: https://modelscope.cn)
  revision            - Repository revision (default: master)
  max_workers         - Parallel range downloads, 1-64 (default: 4)
  chunk_threshold_mb  - Files at least this large are split into ranges (default: 8)
  min_chunk_mb        - Minimum range size (default: 4)
  request_timeout     - Per-request read timeout in seconds (default: 30)
  max_attempts        - Attempts per range, first try included (default: 3)
  verify_sha256       - Verify published SHA-256 digests, true/false (default: true)
  access_token        - Bearer token; prefer 'msdl login --token <token>'

Environment Variables (take precedence over config):
  MODELSCOPE_API_TOKEN - Access token
  MSDL_SAVE_DIR        - Save directory

Examples:
  msdl config set max_workers 8
  msdl config set save_dir ~/models
  msdl config show
)";
}

} // namespace msdl
