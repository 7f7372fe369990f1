#include "common/PathUtils.h"

#include <system_error>

namespace stockcast {
namespace utils {

std::filesystem::path PathUtils::getExecutableDir() {
    std::error_code ec;
    const auto exe_path = std::filesystem::read_symlink("/proc/self/exe", ec);
    if (ec || exe_path.empty()) {
        return std::filesystem::current_path();
    }
    return exe_path.parent_path();
}

std::filesystem::path PathUtils::resolveRelativePath(const std::string& relative_path) {
    return getExecutableDir() / relative_path;
}

std::filesystem::path PathUtils::resolve(const std::string& path) {
    if (std::filesystem::path(path).is_absolute()) {
        return path;
    }
    return resolveRelativePath(path);
}

std::filesystem::path PathUtils::getConfigDir() {
    return getExecutableDir() / "config";
}

} // namespace utils
} // namespace stockcast
