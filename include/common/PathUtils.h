#pragma once

#include <string>
#include <filesystem>

namespace gridradar {
namespace utils {

class PathUtils {
public:
    // Directory holding the running executable (falls back to the CWD)
    static std::filesystem::path getExecutableDir();
    
    // Resolves against the CWD first, then the executable directory
    static std::filesystem::path resolveRelativePath(const std::string& relative_path);
};

} // namespace utils
} // namespace gridradar
