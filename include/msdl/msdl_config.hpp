//
//  msdl_config.hpp
//
//  Persistent command line settings
//

#pragma once

#include <string>
#include <vector>

namespace msdl {

const char* const kDefaultSaveDir = "~/.modelscope/models";
const char* const kConfigDir = "~/.modelscope/config";
const char* const kConfigFileName = "config.json";

// Centralized configuration structure used by ConfigManager
struct Config {
    std::string save_dir;
    std::string endpoint;
    std::string revision;
    int max_workers;
    int chunk_threshold_mb;
    int min_chunk_mb;
    int request_timeout;
    int max_attempts;
    bool verify_sha256;
    std::string access_token;
    // Canonical directories a download has been saved into, for 'msdl list'.
    std::vector<std::string> known_save_dirs;
};

} // namespace msdl
