#include <utility>  // before Boost.Asio: Boost 1.74 awaitable.hpp uses std::exchange without it
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/system/system_error.hpp>
#include <cli/cli_manager.h>
#include <core/network/tcp_channel.h>
#include <core/security/file_hasher.h>
#include <core/util/file_store.h>
#include <exception>
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

namespace fs = std::filesystem;
namespace net = boost::asio;
using json = nlohmann::json;

using namespace peerdrop::core;

namespace peerdrop::cli {

CliManager::CliManager(net::io_context& ioc, const CliOptions& options)
    : ioc_(ioc)
    , options_(options)
    , display_(options.json_output)
    , session_(ioc, SessionOptions::FromSettings(settings)) {
    display_subscription_ = session_.progress().Subscribe(
        [this](const ProgressChannel::Value& status) { display_.Update(status); });
}

CliManager::~CliManager() = default;

void CliManager::ApplyOverrides(const CliOptions& options, Settings& settings) {
    if (options.port) {
        settings.port = *options.port;
    }
    if (options.output_dir) {
        settings.save_dir = *options.output_dir;
    }
    if (options.log_level) {
        settings.log_level = *options.log_level;
    }
    if (options.pacing_delay_ms) {
        settings.pacing_delay_ms = *options.pacing_delay_ms;
    }
    if (options.stall_timeout_seconds) {
        settings.stall_timeout_seconds = *options.stall_timeout_seconds;
    }
    if (options.allow_incomplete) {
        settings.allow_incomplete = true;
    }
}

int CliManager::Run() {
    int exit_code = 1;
    net::co_spawn(ioc_, dispatch(), [&exit_code](std::exception_ptr e, int code) {
        if (e) {
            try {
                std::rethrow_exception(e);
            } catch (const std::exception& ex) {
                spdlog::error("Unhandled error: {}", ex.what());
            }
            exit_code = 1;
            return;
        }
        exit_code = code;
    });
    ioc_.run();
    return exit_code;
}

net::awaitable<int> CliManager::dispatch() {
    if (*options_.command == "send") {
        co_return co_await runSend(options_.command_args[0]);
    }
    auto port = static_cast<std::uint16_t>(ParseNumber(options_.command_args[1], "port", 1, 65535));
    co_return co_await runReceive(options_.command_args[0], port);
}

net::awaitable<int> CliManager::runSend(fs::path file_path) {
    OutgoingFile file;
    try {
        file = LoadOutgoingFile(file_path);
    } catch (const std::exception& e) {
        display_.PrintError(e.what());
        co_return 1;
    }
    auto checksum = FileHasher::CalculateDataChecksum(file.bytes);
    auto file_name = file.metadata.file_name;
    auto file_size = file.metadata.file_size;

    std::shared_ptr<TcpChannel> channel;
    try {
        auto acceptor = TcpChannel::Listen(ioc_, settings.port);
        display_.PrintInfo(fmt::format("Waiting for a receiver on port {}",
                                       acceptor.local_endpoint().port()));
        channel = co_await TcpChannel::Accept(acceptor);
    } catch (const boost::system::system_error& e) {
        display_.PrintError(fmt::format("Cannot accept a receiver: {}", e.what()));
        co_return 1;
    }
    display_.PrintInfo("Receiver connected from " + channel->remote_address());

    session_.Attach(channel);
    channel->Start();
    auto ec = co_await session_.SendFile(std::move(file));
    session_.Cleanup();

    if (ec) {
        display_.PrintError(fmt::format("Sending {} failed: {}", file_name, ec.message()));
        co_return 1;
    }

    if (display_.json_output()) {
        display_.PrintJson(json{{"event", "sent"},
                                {"file_name", file_name},
                                {"file_size", file_size},
                                {"sha256", checksum}});
    } else {
        display_.PrintInfo(fmt::format("Sent {} ({} bytes)", file_name, file_size));
        display_.PrintInfo("SHA-256: " + checksum);
    }
    co_return 0;
}

net::awaitable<int> CliManager::runReceive(std::string host, std::uint16_t port) {
    std::shared_ptr<TcpChannel> channel;
    try {
        channel = co_await TcpChannel::Connect(host, port);
    } catch (const boost::system::system_error& e) {
        display_.PrintError(fmt::format("Cannot connect to {}:{}: {}", host, port, e.what()));
        co_return 1;
    }

    session_.Attach(channel);
    channel->Start();
    auto outcome = co_await waitForOutcome();

    int exit_code = 1;
    if (!outcome) {
        display_.PrintError("The sender closed the connection before sending a file");
    } else if (outcome->phase == TransferPhase::kCompleted && outcome->payload) {
        exit_code = saveReceivedFile(*outcome);
    }
    session_.Cleanup();
    co_return exit_code;
}

net::awaitable<std::optional<TransferStatus>> CliManager::waitForOutcome() {
    net::steady_timer signal(ioc_, net::steady_timer::time_point::max());
    std::optional<TransferStatus> outcome;

    auto subscription = session_.progress().Subscribe([&](const ProgressChannel::Value& status) {
        if (status
            && (status->phase == TransferPhase::kCompleted
                || status->phase == TransferPhase::kErrored)) {
            outcome = *status;
            signal.cancel();
        }
    });
    session_.SetChannelClosedCallback([&signal] { signal.cancel(); });

    if (!outcome) {
        boost::system::error_code ec;
        co_await signal.async_wait(net::redirect_error(net::use_awaitable, ec));
    }
    session_.SetChannelClosedCallback(nullptr);
    co_return outcome;
}

int CliManager::saveReceivedFile(const TransferStatus& status) {
    const auto& file = *status.payload;
    fs::path saved_path;
    try {
        saved_path = SaveReceivedFile(settings.save_dir, file);
    } catch (const std::exception& e) {
        display_.PrintError(fmt::format("Cannot save {}: {}", file.metadata.file_name, e.what()));
        return 1;
    }
    auto checksum = FileHasher::CalculateDataChecksum(file.bytes);

    if (display_.json_output()) {
        display_.PrintJson(json{{"event", "saved"},
                                {"file_name", file.metadata.file_name},
                                {"path", saved_path.string()},
                                {"file_size", file.bytes.size()},
                                {"sha256", checksum}});
    } else {
        if (file.bytes.size() != file.metadata.file_size) {
            display_.PrintError(fmt::format("{} is incomplete: {} of {} bytes",
                                            file.metadata.file_name,
                                            file.bytes.size(),
                                            file.metadata.file_size));
        }
        display_.PrintInfo("Saved to " + saved_path.string());
        display_.PrintInfo("SHA-256: " + checksum);
    }
    return 0;
}

} // namespace peerdrop::cli
