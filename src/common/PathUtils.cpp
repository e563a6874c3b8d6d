#include "common/PathUtils.h"

#include <system_error>

namespace dcabot {
namespace utils {

std::filesystem::path PathUtils::getExecutableDir() {
    std::error_code ec;
    auto exe_path = std::filesystem::read_symlink("/proc/self/exe", ec);
    if (ec) {
        // procfs 가 없는 환경에서는 현재 작업 디렉토리 사용
        return std::filesystem::current_path();
    }
    return exe_path.parent_path();
}

std::filesystem::path PathUtils::resolveRelativePath(const std::string& relative_path) {
    return getExecutableDir() / relative_path;
}

std::filesystem::path PathUtils::getConfigDir() {
    return getExecutableDir() / "config";
}

} // namespace utils
} // namespace dcabot
