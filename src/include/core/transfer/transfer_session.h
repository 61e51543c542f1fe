#pragma once

#include "file_receiver.h"
#include "file_sender.h"
#include "progress_channel.h"
#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <chrono>
#include <core/constant/transfer.h>
#include <core/model/message.h>
#include <core/model/outgoing_file.h>
#include <core/network/message_channel.h>
#include <core/util/config.h>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <system_error>
#include <utility>

namespace peerdrop::core {

struct SessionOptions {
    std::chrono::milliseconds pacing_delay{transfer::kDefaultPacingDelay};
    std::chrono::seconds stall_timeout{transfer::kDefaultStallTimeout}; // 0 disables the watchdog
    bool allow_incomplete{false};

    static SessionOptions FromSettings(const Settings& settings);
};

/**
 * @brief Binds one channel to a sender, a receiver and their progress channel.
 *
 * Inbound messages go to the receiver, SendFile drives the sender. Channel loss
 * and stalls end a live transfer with an Errored status. The session must
 * outlive any SendFile it started.
 */
class TransferSession {
public:
    using ChannelClosedCallback = std::function<void()>;

    explicit TransferSession(boost::asio::io_context& ioc, SessionOptions options = {});
    ~TransferSession();

    TransferSession(const TransferSession&) = delete;
    TransferSession& operator=(const TransferSession&) = delete;

    ProgressChannel& progress() { return progress_; }
    const std::string& id() const { return session_id_; }

    // Replaces the current channel. Publishes Connecting if the channel is not open yet.
    void Attach(std::shared_ptr<MessageChannel> channel);

    boost::asio::awaitable<std::error_code> SendFile(const std::filesystem::path& file_path);
    boost::asio::awaitable<std::error_code> SendFile(OutgoingFile file);

    void OnMessage(Message message);

    // Called after the attached channel closed or failed, whether or not a transfer was live
    void SetChannelClosedCallback(ChannelClosedCallback callback) {
        channel_closed_callback_ = std::move(callback);
    }

    // Cancels the send, drops the receive buffer, closes the channel and resets progress
    void Cleanup();

private:
    void onOpen();
    void onClose();
    void onError(const std::string& detail);
    void onProgress(const ProgressChannel::Value& status);
    void armWatchdog();
    void onStall();
    void detach();

    boost::asio::io_context& ioc_;
    SessionOptions options_;
    std::string session_id_;
    ProgressChannel progress_;
    FileReceiver receiver_;
    FileSender sender_;
    std::shared_ptr<MessageChannel> channel_;
    ChannelClosedCallback channel_closed_callback_;
    boost::asio::steady_timer stall_timer_;
    std::shared_ptr<int> alive_token_; // Expires with the session, guards timer handlers
    ProgressChannel::Subscription watchdog_subscription_;
};

} // namespace peerdrop::core
