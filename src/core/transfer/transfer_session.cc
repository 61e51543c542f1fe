#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <core/transfer/transfer_session.h>
#include <core/util/file_store.h>
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>
#include <utility>

namespace net = boost::asio;

namespace peerdrop::core {

SessionOptions SessionOptions::FromSettings(const Settings& settings) {
    return SessionOptions{
        .pacing_delay = std::chrono::milliseconds(settings.pacing_delay_ms),
        .stall_timeout = std::chrono::seconds(settings.stall_timeout_seconds),
        .allow_incomplete = settings.allow_incomplete,
    };
}

TransferSession::TransferSession(net::io_context& ioc, SessionOptions options)
    : ioc_(ioc)
    , options_(options)
    , session_id_(boost::uuids::to_string(boost::uuids::random_generator()()))
    , receiver_(progress_, options.allow_incomplete)
    , sender_(progress_, options.pacing_delay)
    , stall_timer_(ioc)
    , alive_token_(std::make_shared<int>(0)) {
    watchdog_subscription_ = progress_.Subscribe(
        [this](const ProgressChannel::Value& status) { onProgress(status); });
    spdlog::debug("Transfer session {} created", session_id_);
}

TransferSession::~TransferSession() {
    watchdog_subscription_.Cancel();
    stall_timer_.cancel();
    detach();
    spdlog::debug("Transfer session {} destroyed", session_id_);
}

void TransferSession::Attach(std::shared_ptr<MessageChannel> channel) {
    detach();
    channel_ = std::move(channel);
    if (!channel_) {
        return;
    }

    channel_->set_message_handler([this](Message message) { OnMessage(std::move(message)); });
    channel_->set_open_handler([this] { onOpen(); });
    channel_->set_close_handler([this] { onClose(); });
    channel_->set_error_handler([this](const std::string& detail) { onError(detail); });

    if (!channel_->IsOpen()) {
        progress_.Publish(TransferStatus::Connecting());
    }
}

net::awaitable<std::error_code> TransferSession::SendFile(const std::filesystem::path& file_path) {
    if (!channel_ || !channel_->IsOpen()) {
        spdlog::error("[{}] Cannot send {}, channel is not open", session_id_, file_path.string());
        co_return make_error_code(TransferError::kChannelNotReady);
    }

    OutgoingFile file;
    try {
        file = LoadOutgoingFile(file_path);
    } catch (const std::exception& e) {
        spdlog::error("[{}] {}", session_id_, e.what());
        progress_.Publish(TransferStatus::Errored(file_path.filename().string(),
                                                  0,
                                                  0,
                                                  TransferError::kFileUnreadable,
                                                  e.what()));
        co_return make_error_code(TransferError::kFileUnreadable);
    }
    co_return co_await SendFile(std::move(file));
}

net::awaitable<std::error_code> TransferSession::SendFile(OutgoingFile file) {
    auto channel = channel_;
    if (!channel || !channel->IsOpen()) {
        spdlog::error("[{}] Cannot send {}, channel is not open",
                      session_id_,
                      file.metadata.file_name);
        co_return make_error_code(TransferError::kChannelNotReady);
    }
    spdlog::info("[{}] Sending {}", session_id_, file.metadata.file_name);
    co_return co_await sender_.Send(*channel, std::move(file));
}

void TransferSession::OnMessage(Message message) {
    receiver_.OnMessage(std::move(message));
}

void TransferSession::Cleanup() {
    spdlog::info("[{}] Cleaning up", session_id_);
    stall_timer_.cancel();
    sender_.Cancel(TransferError::kCancelled);
    receiver_.Reset();
    detach();
    progress_.Reset();
}

void TransferSession::onOpen() {
    spdlog::info("[{}] Channel open", session_id_);
}

void TransferSession::onClose() {
    spdlog::info("[{}] Channel closed", session_id_);
    receiver_.Abort(TransferError::kChannelError, "channel closed by peer");
    sender_.Cancel(TransferError::kChannelError, "channel closed by peer");
    if (channel_closed_callback_) {
        channel_closed_callback_();
    }
}

void TransferSession::onError(const std::string& detail) {
    spdlog::error("[{}] Channel error: {}", session_id_, detail);
    receiver_.Abort(TransferError::kChannelError, detail);
    sender_.Cancel(TransferError::kChannelError, detail);
}

void TransferSession::onProgress(const ProgressChannel::Value& status) {
    if (status && status->phase == TransferPhase::kTransferring) {
        armWatchdog();
    } else {
        stall_timer_.cancel();
    }
}

void TransferSession::armWatchdog() {
    if (options_.stall_timeout.count() <= 0) {
        return;
    }
    stall_timer_.expires_after(options_.stall_timeout);
    stall_timer_.async_wait([this, token = std::weak_ptr(alive_token_)](
                                const boost::system::error_code& ec) {
        if (ec || token.expired()) {
            return;
        }
        onStall();
    });
}

void TransferSession::onStall() {
    if (!receiver_.is_receiving() && !sender_.is_sending()) {
        return;
    }
    auto detail = fmt::format("no progress for {} seconds", options_.stall_timeout.count());
    spdlog::warn("[{}] Transfer stalled: {}", session_id_, detail);
    receiver_.Abort(TransferError::kTimedOut, detail);
    sender_.Cancel(TransferError::kTimedOut, detail);
    if (channel_) {
        channel_->Close();
    }
}

void TransferSession::detach() {
    if (!channel_) {
        return;
    }
    channel_->ClearHandlers();
    channel_->Close();
    channel_.reset();
}

} // namespace peerdrop::core
