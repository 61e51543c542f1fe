#include <core/constant/transfer.h>
#include <core/util/config.h>
#include <fstream>
#include <spdlog/spdlog.h>

namespace peerdrop::core {

static void LoadSetting() {
    if (!config.contains("transfer")) {
        config.insert("transfer", toml::table{});
    }
    auto& setting = config["transfer"].ref<toml::table>();

    auto port = setting["port"].value_or<std::int64_t>(transfer::kDefaultPort);
    if (port <= 0 || port > 65535) {
        spdlog::warn("Invalid port {} in config, using {}", port, transfer::kDefaultPort);
        port = transfer::kDefaultPort;
    }
    settings.port = static_cast<std::uint16_t>(port);

    settings.save_dir = setting["save-dir"].value_or(path::kSystemDownloadDir.string());

    auto pacing = setting["pacing-delay-ms"].value_or<std::int64_t>(
        transfer::kDefaultPacingDelay.count());
    if (pacing < 0) {
        spdlog::warn("Negative pacing delay in config, using {} ms",
                     transfer::kDefaultPacingDelay.count());
        pacing = transfer::kDefaultPacingDelay.count();
    }
    settings.pacing_delay_ms = static_cast<std::uint32_t>(pacing);

    auto timeout = setting["stall-timeout-seconds"].value_or<std::int64_t>(
        transfer::kDefaultStallTimeout.count());
    if (timeout < 0) {
        spdlog::warn("Negative stall timeout in config, using {} s",
                     transfer::kDefaultStallTimeout.count());
        timeout = transfer::kDefaultStallTimeout.count();
    }
    settings.stall_timeout_seconds = static_cast<std::uint32_t>(timeout);

    settings.allow_incomplete = setting["allow-incomplete"].value_or(false);
    settings.log_level = setting["log-level"].value_or(std::string("info"));
}

void InitConfig(const std::filesystem::path& path) {
    auto dir = path.parent_path();
    if (!dir.empty() && !std::filesystem::exists(dir)) {
        spdlog::info("Config directory does not exist, creating...");
        std::filesystem::create_directories(dir);
    }
    bool created = false;
    if (!std::filesystem::exists(path)) {
        std::ofstream ofs(path);
        spdlog::info("Config file does not exist, creating...");
        created = true;
    }
    try {
        config = toml::parse_file(path.string());
    } catch (const toml::parse_error& err) {
        spdlog::error("\"{}\" could not be parsed: {}", path.string(), err.description());
        config = toml::table{};
    }

    LoadSetting();
    if (created) {
        SaveConfig(path);
    }
}

void SaveConfig(const std::filesystem::path& path) {
    std::ofstream ofs(path);
    if (!ofs.is_open()) {
        spdlog::error("Failed to open \"{}\" for saving config.", path.string());
        return;
    }
    config.insert_or_assign("transfer",
                            toml::table{
                                {"port", static_cast<std::int64_t>(settings.port)},
                                {"save-dir", settings.save_dir.string()},
                                {"pacing-delay-ms",
                                 static_cast<std::int64_t>(settings.pacing_delay_ms)},
                                {"stall-timeout-seconds",
                                 static_cast<std::int64_t>(settings.stall_timeout_seconds)},
                                {"allow-incomplete", settings.allow_incomplete},
                                {"log-level", settings.log_level},
                            });
    ofs << config;
}

} // namespace peerdrop::core
