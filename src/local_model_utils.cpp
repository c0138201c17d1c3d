//
//  local_model_utils.cpp
//
//  Utility functions for local model operations (listing, scanning)
//

#include "msdl/local_model_utils.hpp"

#include <algorithm>
#include <filesystem>
#include <iostream>

#include "msdl/cli_config_manager.hpp"
#include "msdl/log_utils.hpp"
#include "msdl/resume_state.hpp"

namespace fs = std::filesystem;

namespace msdl {

namespace {

bool IsHidden(const fs::path& path) {
    std::string name = path.filename().string();
    return name.empty() || name[0] == '.';
}

bool EndsWith(const std::string& value, const std::string& suffix) {
    return value.size() >= suffix.size() && value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace

bool LocalModelUtils::CheckIsDownloadedModel(const std::string& model_path) {
    std::error_code ec;
    fs::recursive_directory_iterator it(model_path, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        return false;
    }
    for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (ec) {
            LOG_DEBUG_TAG("Stopped scanning " + model_path + ": " + ec.message(), "LocalModelUtils");
            return false;
        }
        if (EndsWith(it->path().filename().string(), kResumeSuffix)) {
            return false;
        }
    }
    return true;
}

std::vector<LocalModel> LocalModelUtils::ListLocalModelsInner(const std::vector<std::string>& save_dirs) {
    std::vector<LocalModel> models;
    for (const auto& save_dir : save_dirs) {
        std::error_code ec;
        if (!fs::is_directory(save_dir, ec)) {
            LOG_DEBUG_TAG("Skipping missing save directory: " + save_dir, "LocalModelUtils");
            continue;
        }
        LOG_DEBUG_TAG("Scanning save directory: " + save_dir, "LocalModelUtils");

        // This level is the owner, the next one the model name.
        for (const auto& owner_entry : fs::directory_iterator(save_dir, ec)) {
            if (!owner_entry.is_directory(ec) || IsHidden(owner_entry.path())) {
                continue;
            }
            std::error_code inner_ec;
            for (const auto& model_entry : fs::directory_iterator(owner_entry.path(), inner_ec)) {
                if (!model_entry.is_directory(inner_ec) || IsHidden(model_entry.path())) {
                    continue;
                }
                LocalModel model;
                model.model_id = owner_entry.path().filename().string() + "/" +
                                 model_entry.path().filename().string();
                model.path = model_entry.path().string();
                model.complete = CheckIsDownloadedModel(model.path);
                models.push_back(std::move(model));
            }
        }
    }
    std::sort(models.begin(), models.end(), [](const LocalModel& a, const LocalModel& b) {
        return a.model_id == b.model_id ? a.path < b.path : a.model_id < b.model_id;
    });
    return models;
}

int LocalModelUtils::ListLocalModels() {
    auto& config_mgr = ConfigManager::GetInstance();
    Config config = config_mgr.LoadConfig();

    std::vector<std::string> save_dirs = config.known_save_dirs;
    std::string current = config_mgr.GetSaveDir();
    std::error_code ec;
    fs::path canonical = fs::weakly_canonical(current, ec);
    if (!ec && std::find(save_dirs.begin(), save_dirs.end(), canonical.string()) == save_dirs.end()) {
        save_dirs.push_back(canonical.string());
    }

    auto models = ListLocalModelsInner(save_dirs);
    if (models.empty()) {
        std::cout << "No local models found.\n";
        std::cout << "Use 'msdl download <owner/name>' to download one.\n";
        return 0;
    }

    std::cout << "Local models:\n";
    for (const auto& model : models) {
        std::cout << "  📁 " << model.model_id << (model.complete ? "" : "  (incomplete)") << "\n";
        std::cout << "      " << model.path << "\n";
    }
    return 0;
}

} // namespace msdl
