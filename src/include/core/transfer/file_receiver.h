#pragma once

#include "progress_channel.h"
#include "receive_buffer.h"
#include <core/model/message.h>
#include <core/model/transfer_error.h>
#include <string>
#include <variant>

namespace peerdrop::core {

/**
 * @brief Receiving side of the transfer protocol.
 *
 * Consumes inbound messages in arrival order and reports through the progress
 * channel only. Idle until a metadata message allocates a ReceiveBuffer, back to
 * Idle once the completion marker or an error ends the transfer.
 */
class FileReceiver {
public:
    explicit FileReceiver(ProgressChannel& progress, bool allow_incomplete = false);

    void OnMessage(Message message);

    // Ends a live transfer with an Errored status, no-op while idle
    void Abort(TransferError error, std::string detail);

    // Drops a live transfer without publishing
    void Reset();

    bool is_receiving() const { return std::holds_alternative<Receiving>(state_); }

    void set_allow_incomplete(bool allow_incomplete) { allow_incomplete_ = allow_incomplete; }

private:
    struct Idle {};
    struct Receiving {
        ReceiveBuffer buffer;
    };

    void onMetadata(MetadataMessage& message);
    void onChunk(Receiving& receiving, ChunkMessage& chunk);
    void onComplete(Receiving& receiving);
    void fail(TransferError error, std::string detail);

    ProgressChannel& progress_;
    bool allow_incomplete_;
    std::variant<Idle, Receiving> state_;
};

} // namespace peerdrop::core
