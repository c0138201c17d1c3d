//
//  file_utils.cpp
//
//  Home-relative path helpers
//

#include "msdl/file_utils.hpp"

#include <cstdlib>
#include <pwd.h>
#include <unistd.h>

namespace msdl {

std::string FileUtils::GetHomeDir() {
    if (const char* home = std::getenv("HOME")) {
        if (home[0] != '\0') {
            return home;
        }
    }
    if (const passwd* pw = ::getpwuid(::getuid())) {
        if (pw->pw_dir) {
            return pw->pw_dir;
        }
    }
    return "";
}

std::string FileUtils::ExpandTilde(const std::string& path) {
    if (path.empty() || path[0] != '~') {
        return path;
    }
    if (path.size() > 1 && path[1] != '/') {
        return path;
    }
    return GetHomeDir() + path.substr(1);
}

std::string FileUtils::GetBaseDir() {
    return GetHomeDir() + "/.modelscope";
}

} // namespace msdl
