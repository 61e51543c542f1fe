#pragma once

#include <cstdlib>
#include <filesystem>

#if defined(_WIN32) || defined(_WIN64)
#include <combaseapi.h>
#include <knownfolders.h>
#include <shlobj_core.h>
#endif

namespace peerdrop::core {
namespace path {

namespace details {

inline std::filesystem::path EnvPath(const char* name) {
    const char* value = std::getenv(name);
    if (value == nullptr || *value == '\0') {
        return std::filesystem::temp_directory_path();
    }
    return std::filesystem::path(value);
}

} // namespace details

inline const std::filesystem::path kLogDir = std::filesystem::temp_directory_path() / "PeerDrop"
                                             / "logs";

inline const std::filesystem::path kConfigDir =
#if defined(_WIN32) || defined(_WIN64)
    details::EnvPath("APPDATA") / "PeerDrop";
#elif defined(__APPLE__)
    details::EnvPath("HOME") / "Library" / "Application Support" / "PeerDrop";
#else
    details::EnvPath("HOME") / ".config" / "PeerDrop";
#endif

inline const std::filesystem::path kSystemDownloadDir = []() -> std::filesystem::path {
#if defined(_WIN32) || defined(_WIN64)
    PWSTR path = nullptr;
    if (SUCCEEDED(SHGetKnownFolderPath(FOLDERID_Downloads, 0, nullptr, &path))) {
        auto saveDir = std::filesystem::path(path);
        CoTaskMemFree(path);
        return saveDir;
    } else {
        return details::EnvPath("USERPROFILE") / "Downloads";
    }
#else
    return details::EnvPath("HOME") / "Downloads";
#endif
}();

} // namespace path
} // namespace peerdrop::core
