//
//  cli_config_manager.hpp
//
//  Configuration management for msdl
//

#pragma once

#include <string>

#include "msdl/dl_config.hpp"
#include "msdl/msdl_config.hpp"

namespace msdl {

class ConfigManager {
public:
    // Singleton pattern
    static ConfigManager& GetInstance();

    // Defaults, then the config file, then MODELSCOPE_API_TOKEN / MSDL_SAVE_DIR.
    Config LoadConfig();
    bool SaveConfig(const Config& config);
    void ShowConfig(const Config& config);
    // Validates and applies one key to the loaded config; false for unknown keys or bad values.
    bool SetConfigValue(const std::string& key, const std::string& value);
    bool ResetConfig();
    std::string GetConfigHelp() const;

    // Records a save directory for 'msdl list'; canonicalized and de-duplicated.
    bool AppendKnownSaveDir(const std::string& dir);
    bool SetAccessToken(const std::string& token);
    bool ClearAccessToken();

    // Engine settings derived from the loaded config.
    DownloadConfig ToDownloadConfig(const Config& config) const;

    std::string GetSaveDir() const;
    std::string GetConfigFilePath() const;

    // Redirects the config file, for tests. Empty restores the default location.
    void SetConfigDir(const std::string& dir);

    static Config GetDefaultConfig();

private:
    ConfigManager() = default;
    ~ConfigManager() = default;
    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;

    Config LoadFromFile(Config config);
    Config LoadFromEnvironment(Config config);
    // File contents without environment overrides, so they are never persisted.
    Config LoadPersisted();

    Config current_config_ = GetDefaultConfig();
    std::string config_dir_override_;
};

} // namespace msdl
