//
//  file_utils.hpp
//
//  Home-relative path helpers
//

#pragma once

#include <string>

namespace msdl {

class FileUtils {
public:
    // "~/x" -> "$HOME/x"; other paths are returned unchanged.
    static std::string ExpandTilde(const std::string& path);

    // $HOME, or the passwd entry when HOME is unset. Empty if neither is available.
    static std::string GetHomeDir();

    // ~/.modelscope
    static std::string GetBaseDir();
};

} // namespace msdl
