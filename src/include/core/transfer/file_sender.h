#pragma once

#include "progress_channel.h"
#include <boost/asio/awaitable.hpp>
#include <boost/asio/steady_timer.hpp>
#include <chrono>
#include <core/constant/transfer.h>
#include <core/model/outgoing_file.h>
#include <core/model/transfer_error.h>
#include <core/network/message_channel.h>
#include <optional>
#include <string>
#include <system_error>

namespace peerdrop::core {

/**
 * @brief Sending side of the transfer protocol.
 *
 * Emits the metadata, the chunks in index order with a pacing delay between
 * them, then the completion marker. Progress goes to the shared progress channel.
 * At most one Send runs at a time.
 */
class FileSender {
public:
    explicit FileSender(ProgressChannel& progress,
                        std::chrono::milliseconds pacing_delay = transfer::kDefaultPacingDelay);

    // Empty error code on success, TransferError values otherwise
    boost::asio::awaitable<std::error_code> Send(MessageChannel& channel, OutgoingFile file);

    // Stops the running send before its next chunk. kCancelled ends silently,
    // any other reason is published as an Errored status.
    void Cancel(TransferError reason = TransferError::kCancelled, std::string detail = {});

    bool is_sending() const { return sending_; }

    void set_pacing_delay(std::chrono::milliseconds pacing_delay) { pacing_delay_ = pacing_delay; }

private:
    struct CancelRequest {
        TransferError reason;
        std::string detail;
    };

    std::error_code finishCancelled(const FileMetadata& metadata, std::uint64_t bytes_sent);

    ProgressChannel& progress_;
    std::chrono::milliseconds pacing_delay_;
    bool sending_{false};
    std::optional<CancelRequest> cancel_request_;
    boost::asio::steady_timer* pacing_timer_{nullptr}; // Timer of the running send
};

} // namespace peerdrop::core
