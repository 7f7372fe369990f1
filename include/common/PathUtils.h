#pragma once

#include <string>
#include <filesystem>

namespace stockcast {
namespace utils {

class PathUtils {
public:
    // 실행 파일의 디렉토리 경로 반환 (/proc/self/exe 기준, 실패 시 현재 작업 디렉토리)
    static std::filesystem::path getExecutableDir();

    // 실행 파일 기준 상대 경로를 절대 경로로 변환
    static std::filesystem::path resolveRelativePath(const std::string& relative_path);

    // 절대 경로는 그대로, 상대 경로는 실행 파일 기준으로
    static std::filesystem::path resolve(const std::string& path);

    // config 디렉토리 경로
    static std::filesystem::path getConfigDir();
};

} // namespace utils
} // namespace stockcast
