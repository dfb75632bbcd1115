#pragma once

#include <cstdlib>
#include <filesystem>

namespace ferry::core {
namespace path {

inline const std::filesystem::path kHomeDir = []() -> std::filesystem::path {
#if defined(_WIN32) || defined(_WIN64)
    const char* home = std::getenv("USERPROFILE");
#else
    const char* home = std::getenv("HOME");
#endif
    return home != nullptr ? std::filesystem::path(home) : std::filesystem::current_path();
}();

inline const std::filesystem::path kLogDir = std::filesystem::temp_directory_path() / "ferry"
                                             / "logs";

inline const std::filesystem::path kConfigDir =
#if defined(_WIN32) || defined(_WIN64)
    kHomeDir / "AppData" / "Roaming" / "ferry";
#else
    kHomeDir / ".config" / "ferry";
#endif

inline const std::filesystem::path kDefaultStorageDir = "./uploads";

} // namespace path
} // namespace ferry::core
