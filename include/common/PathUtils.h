#pragma once

#include <string>
#include <filesystem>

namespace marketlens {
namespace utils {

class PathUtils {
public:
    // Directory of the running executable (falls back to the working directory)
    static std::filesystem::path getExecutableDir();

    // Resolve a path relative to the executable directory
    static std::filesystem::path resolveRelativePath(const std::string& relative_path);

    // Resolve a user-supplied path: absolute as-is, relative against the working directory
    // first and the executable directory second.
    static std::filesystem::path resolveInputPath(const std::string& path);
};

} // namespace utils
} // namespace marketlens
