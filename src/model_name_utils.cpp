//
//  model_name_utils.cpp
//
//  Repository identifier parsing and validation
//

#include "msdl/model_name_utils.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace msdl {

namespace {

std::string ToLower(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

} // namespace

bool ModelNameUtils::IsValidSegment(const std::string& segment) {
    if (segment.empty() || segment == "." || segment == "..") {
        return false;
    }
    return std::none_of(segment.begin(), segment.end(), [](unsigned char c) {
        return std::isspace(c) || c == '\\' || c == ':' || c == '?' || c == '#';
    });
}

RepositoryId ModelNameUtils::ParseRepositoryId(const std::string& text) {
    std::string id = text;
    if (ToLower(id).rfind("ms:", 0) == 0) {
        id = id.substr(3);
    } else if (ToLower(id).rfind("modelscope/", 0) == 0) {
        id = id.substr(11);
    }

    size_t slash_pos = id.find('/');
    if (slash_pos == std::string::npos || id.find('/', slash_pos + 1) != std::string::npos) {
        throw std::invalid_argument("Invalid model ID '" + text + "', expected: owner/name");
    }

    RepositoryId repo{id.substr(0, slash_pos), id.substr(slash_pos + 1)};
    if (!IsValidSegment(repo.owner) || !IsValidSegment(repo.name)) {
        throw std::invalid_argument("Invalid model ID '" + text + "', expected: owner/name");
    }
    return repo;
}

bool ModelNameUtils::IsSafeRelativePath(const std::string& path) {
    if (path.empty() || path.front() == '/') {
        return false;
    }
    size_t start = 0;
    while (start <= path.size()) {
        size_t end = path.find('/', start);
        if (end == std::string::npos) {
            end = path.size();
        }
        std::string segment = path.substr(start, end - start);
        if (segment.empty() || segment == "." || segment == "..") {
            return false;
        }
        start = end + 1;
    }
    return true;
}

} // namespace msdl
