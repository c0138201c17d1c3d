//
//  model_name_utils.hpp
//
//  Repository identifier parsing and validation
//

#pragma once

#include <string>

namespace msdl {

// owner/name pair identifying a hub repository
struct RepositoryId {
    std::string owner;
    std::string name;

    std::string ToString() const { return owner + "/" + name; }

    bool operator==(const RepositoryId& other) const {
        return owner == other.owner && name == other.name;
    }
};

class ModelNameUtils {
public:
    // Parses "owner/name"; a leading "modelscope/" or "ms:" is stripped.
    // Throws std::invalid_argument on anything else.
    static RepositoryId ParseRepositoryId(const std::string& text);

    // True for a relative repository path without "..", absolute prefixes or empty segments.
    static bool IsSafeRelativePath(const std::string& path);

private:
    static bool IsValidSegment(const std::string& segment);
};

} // namespace msdl
