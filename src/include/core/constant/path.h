#pragma once

#include <cstdlib>
#include <filesystem>

namespace fileferry::core {
namespace path {

inline const std::filesystem::path kLogDir = std::filesystem::temp_directory_path() / "FileFerry"
                                             / "logs";

inline const std::filesystem::path kConfigDir =
#if defined(_WIN32) || defined(_WIN64)
    std::filesystem::path(std::getenv("APPDATA")) / "FileFerry";
#else
    std::filesystem::path(std::getenv("HOME")) / ".config" / "FileFerry";
#endif

inline const std::filesystem::path kDataDir =
#if defined(_WIN32) || defined(_WIN64)
    std::filesystem::path(std::getenv("APPDATA")) / "FileFerry" / "data";
#elif defined(__APPLE__)
    std::filesystem::path(std::getenv("HOME")) / "Library" / "Application Support" / "FileFerry";
#else
    std::filesystem::path(std::getenv("HOME")) / ".local" / "share" / "FileFerry";
#endif

} // namespace path
} // namespace fileferry::core
