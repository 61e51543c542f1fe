/*
    config.h
    Transfer settings persisted in a TOML file.

    Example usage:

    - Read a setting:
        std::uint16_t port = peerdrop::core::settings.port;
        auto delay = peerdrop::core::settings.pacing_delay_ms;
    - Write a setting and persist it:
        peerdrop::core::settings.save_dir = "/path/to/save";
        peerdrop::core::SaveConfig();

    Layout of config.toml:

        [transfer]
        port = 56789
        save-dir = "/home/me/Downloads"
        pacing-delay-ms = 10
        stall-timeout-seconds = 30
        allow-incomplete = false
        log-level = "info"
*/

#pragma once

#include <core/constant/path.h>
#include <cstdint>
#include <filesystem>
#include <string>
#include <toml++/toml.hpp>

namespace peerdrop::core {

inline toml::table config;

struct Settings {
    std::uint16_t port;                   // Port the sender listens on
    std::filesystem::path save_dir;       // Directory to save received files
    std::uint32_t pacing_delay_ms;        // Wait between two chunks
    std::uint32_t stall_timeout_seconds;  // Abort a transfer without progress, 0 disables
    bool allow_incomplete;                // Complete with missing chunks instead of failing
    std::string log_level;                // debug | info | warning | error
};

inline Settings settings;

inline const std::filesystem::path kDefaultConfigPath = path::kConfigDir / "config.toml";

void InitConfig(const std::filesystem::path& path = kDefaultConfigPath);

void SaveConfig(const std::filesystem::path& path = kDefaultConfigPath);

} // namespace peerdrop::core
