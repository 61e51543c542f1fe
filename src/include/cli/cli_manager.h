#pragma once

#include "argument_parser.h"
#include "progress_display.h"
#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <core/transfer/transfer_session.h>
#include <core/util/config.h>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace peerdrop::cli {

class CliManager {
public:
    CliManager(boost::asio::io_context& ioc, const CliOptions& options);
    ~CliManager();

    // Runs the command to completion, returns the process exit code
    int Run();

    // Command line flags win over the config file for this run
    static void ApplyOverrides(const CliOptions& options, core::Settings& settings);

private:
    boost::asio::awaitable<int> dispatch();
    boost::asio::awaitable<int> runSend(std::filesystem::path file_path);
    boost::asio::awaitable<int> runReceive(std::string host, std::uint16_t port);

    // Resumes on Completed, Errored or a closed channel (std::nullopt if no transfer began)
    boost::asio::awaitable<std::optional<core::TransferStatus>> waitForOutcome();

    int saveReceivedFile(const core::TransferStatus& status);

    boost::asio::io_context& ioc_;
    const CliOptions& options_;
    ProgressDisplay display_;
    core::TransferSession session_;
    core::ProgressChannel::Subscription display_subscription_;
};

} // namespace peerdrop::cli
