#include <utility>  // before Boost.Asio: Boost 1.74 awaitable.hpp uses std::exchange without it
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/system/system_error.hpp>
#include <core/transfer/chunking.h>
#include <core/transfer/file_sender.h>
#include <spdlog/spdlog.h>
#include <utility>

namespace net = boost::asio;

namespace peerdrop::core {

FileSender::FileSender(ProgressChannel& progress, std::chrono::milliseconds pacing_delay)
    : progress_(progress)
    , pacing_delay_(pacing_delay) {}

void FileSender::Cancel(TransferError reason, std::string detail) {
    if (!sending_ || cancel_request_) {
        return;
    }
    spdlog::info("Cancelling send: {}", TransferErrorToString(reason));
    cancel_request_ = CancelRequest{reason, std::move(detail)};
    if (pacing_timer_ != nullptr) {
        pacing_timer_->cancel();
    }
}

net::awaitable<std::error_code> FileSender::Send(MessageChannel& channel, OutgoingFile file) {
    if (sending_) {
        spdlog::error("A send is already in progress");
        co_return std::make_error_code(std::errc::operation_in_progress);
    }
    if (!channel.IsOpen()) {
        spdlog::error("Cannot send {}, channel is not open", file.metadata.file_name);
        co_return make_error_code(TransferError::kChannelNotReady);
    }

    if (file.metadata.file_size != file.bytes.size()) {
        spdlog::warn("Metadata of {} announces {} bytes, sending the {} bytes loaded",
                     file.metadata.file_name,
                     file.metadata.file_size,
                     file.bytes.size());
        file.metadata.file_size = file.bytes.size();
    }

    sending_ = true;
    cancel_request_.reset();
    net::steady_timer pacing_timer(co_await net::this_coro::executor);
    pacing_timer_ = &pacing_timer;

    const auto& metadata = file.metadata;
    const std::uint64_t total_bytes = file.bytes.size();
    const auto chunk_count = ChunkCount(total_bytes);
    std::uint64_t bytes_sent = 0;
    std::optional<std::string> transport_failure;

    spdlog::info("Sending {} ({} bytes, {} chunks)", metadata.file_name, total_bytes, chunk_count);

    try {
        co_await channel.Send(MetadataMessage{metadata});
        if (!cancel_request_) {
            progress_.Publish(TransferStatus::Transferring(metadata.file_name, 0, total_bytes));
        }

        for (std::uint64_t index = 0; index < chunk_count && !cancel_request_; ++index) {
            auto bounds = ChunkAt(index, total_bytes);
            Message chunk = ChunkMessage{
                .index = static_cast<std::uint32_t>(index),
                .data = BinaryData(file.bytes.begin() + static_cast<std::ptrdiff_t>(bounds.begin),
                                   file.bytes.begin() + static_cast<std::ptrdiff_t>(bounds.end)),
                .is_last = index + 1 == chunk_count,
            };
            co_await channel.Send(chunk);
            bytes_sent = bounds.end;
            if (cancel_request_) {
                break;
            }
            progress_.Publish(
                TransferStatus::Transferring(metadata.file_name, bytes_sent, total_bytes));

            if (index % 10 == 0 || index + 1 == chunk_count) {
                spdlog::info("Sent chunk {}/{} of {}", index + 1, chunk_count, metadata.file_name);
            }

            if (index + 1 < chunk_count && pacing_delay_.count() > 0 && !cancel_request_) {
                pacing_timer.expires_after(pacing_delay_);
                boost::system::error_code ec;
                co_await pacing_timer.async_wait(net::redirect_error(net::use_awaitable, ec));
            }
        }

        if (!cancel_request_) {
            co_await channel.Send(CompleteMessage{});
        }
    } catch (const boost::system::system_error& e) {
        if (!cancel_request_) {
            transport_failure = e.what();
        }
    }

    pacing_timer_ = nullptr;
    sending_ = false;

    if (cancel_request_) {
        co_return finishCancelled(metadata, bytes_sent);
    }
    if (transport_failure) {
        spdlog::error("Failed to send {}: {}", metadata.file_name, *transport_failure);
        progress_.Publish(TransferStatus::Errored(metadata.file_name,
                                                  bytes_sent,
                                                  total_bytes,
                                                  TransferError::kChannelError,
                                                  *transport_failure));
        co_return make_error_code(TransferError::kChannelError);
    }

    spdlog::info("Sent {} ({} bytes)", metadata.file_name, total_bytes);
    progress_.Publish(TransferStatus::Completed(metadata.file_name, total_bytes, total_bytes));
    co_return std::error_code{};
}

std::error_code FileSender::finishCancelled(const FileMetadata& metadata,
                                            std::uint64_t bytes_sent) {
    auto request = std::move(*cancel_request_);
    cancel_request_.reset();

    spdlog::info("Send of {} stopped after {} bytes: {}",
                 metadata.file_name,
                 bytes_sent,
                 TransferErrorToString(request.reason));
    if (request.reason != TransferError::kCancelled) {
        auto detail = request.detail.empty() ? std::string(TransferErrorToString(request.reason))
                                             : std::move(request.detail);
        progress_.Publish(TransferStatus::Errored(metadata.file_name,
                                                  bytes_sent,
                                                  metadata.file_size,
                                                  request.reason,
                                                  std::move(detail)));
    }
    return make_error_code(request.reason);
}

} // namespace peerdrop::core
