#pragma once

#include <chrono>
#include <cstdio>
#include <ctime>
#include <filesystem>
#include <memory>
#include <spdlog/async.h>
#include <spdlog/async_logger.h>
#include <spdlog/details/thread_pool.h>
#include <spdlog/sinks/daily_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <string>
#include <string_view>

namespace peerdrop {

class Logger {
    using LoggerType = spdlog::async_logger;

public:
    using Level = spdlog::level::level_enum;

    // Logs go to a daily file under log_dir and to stderr
    Logger(Level level,
           const std::filesystem::path& log_dir,
           std::size_t q_max_items = 8192,
           std::size_t thread_count = 1) {
        if (!std::filesystem::exists(log_dir)) {
            std::filesystem::create_directories(log_dir);
        }

        spdlog::file_event_handlers handlers;
        handlers.after_open = [](const spdlog::filename_t& filename, std::FILE* fstream) {
            if (fstream) {
                auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
                std::fprintf(fstream, "[Log Start: %s | %s]\n", filename.c_str(), std::ctime(&now));
            }
        };
        handlers.before_close = [](const spdlog::filename_t& filename, std::FILE* fstream) {
            if (fstream) {
                auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
                std::fprintf(fstream, "[Log End: %s | %s]\n\n", filename.c_str(), std::ctime(&now));
            }
        };
        auto file_sink = std::make_shared<spdlog::sinks::daily_file_sink_mt>(
            (log_dir / "peerdrop.log").string(), 0, 0, false, 0, handlers);
        // Progress is drawn on stdout, keep log lines on stderr
        auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();

        thread_pool_ = std::make_shared<spdlog::details::thread_pool>(q_max_items, thread_count);
        logger_ = std::make_shared<LoggerType>("peerdrop",
                                               spdlog::sinks_init_list{file_sink, console_sink},
                                               thread_pool_);

#ifdef PEERDROP_RELEASE
        console_sink->set_level(Level::warn);
#endif
        logger_->set_level(level);
        logger_->set_error_handler(
            [this](const std::string& msg) { logger_->error("*** LOGGER ERROR ***: {}", msg); });

        /* more about pattern:
         * https://github.com/gabime/spdlog/wiki/3.-Custom-formatting
         */
        console_sink->set_pattern("\033[36m[%Y-%m-%d %H:%M:%S.%e] \033[92m[%n] \033[0m%^[%l]%$ %v");
        spdlog::set_default_logger(logger_);
    }
    auto& logger() { return logger_; }
    [[nodiscard]] Level logLevel() const { return logger_->level(); }
    void set_log_level(Level level) { logger_->set_level(level); }
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    ~Logger() { spdlog::shutdown(); }

    // "debug" | "info" | "warning" | "error", anything else maps to info
    static Level ParseLevel(std::string_view name) {
        if (name == "debug") {
            return Level::debug;
        }
        if (name == "warning" || name == "warn") {
            return Level::warn;
        }
        if (name == "error") {
            return Level::err;
        }
        return Level::info;
    }

private:
    std::shared_ptr<LoggerType> logger_;
    std::shared_ptr<spdlog::details::thread_pool> thread_pool_;
};

} // namespace peerdrop
