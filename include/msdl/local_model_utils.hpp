//
//  local_model_utils.hpp
//
//  Utility functions for local model operations (listing, scanning)
//

#pragma once

#include <string>
#include <vector>

namespace msdl {

struct LocalModel {
    std::string model_id;  // owner/name
    std::string path;
    // False while any file of the model still has a resume sidecar.
    bool complete = true;
};

class LocalModelUtils {
public:
    // Every <dir>/<owner>/<name> directory under the given save directories.
    // Missing save directories and hidden entries are skipped.
    static std::vector<LocalModel> ListLocalModelsInner(const std::vector<std::string>& save_dirs);

    // List all local models under the known save directories (with formatted output)
    static int ListLocalModels();

    // True when no *.msdl-resume sidecar exists below the model directory.
    static bool CheckIsDownloadedModel(const std::string& model_path);
};

} // namespace msdl
