#include "common/PathUtils.h"
#include <system_error>

namespace gridradar {
namespace utils {

std::filesystem::path PathUtils::getExecutableDir() {
    std::error_code ec;
    auto exe_path = std::filesystem::read_symlink("/proc/self/exe", ec);
    if (ec || exe_path.empty()) {
        return std::filesystem::current_path();
    }
    return exe_path.parent_path();
}

std::filesystem::path PathUtils::resolveRelativePath(const std::string& relative_path) {
    std::error_code ec;
    auto from_cwd = std::filesystem::current_path(ec) / relative_path;
    if (!ec && std::filesystem::exists(from_cwd)) {
        return from_cwd;
    }
    auto from_exe = getExecutableDir() / relative_path;
    if (std::filesystem::exists(from_exe)) {
        return from_exe;
    }
    // Neither exists yet: the working directory wins
    return ec ? from_exe : from_cwd;
}

} // namespace utils
} // namespace gridradar
