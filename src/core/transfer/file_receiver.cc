#include <core/transfer/file_receiver.h>
#include <memory>
#include <new>
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <utility>

namespace peerdrop::core {

FileReceiver::FileReceiver(ProgressChannel& progress, bool allow_incomplete)
    : progress_(progress)
    , allow_incomplete_(allow_incomplete) {}

void FileReceiver::OnMessage(Message message) {
    if (auto* metadata = std::get_if<MetadataMessage>(&message)) {
        onMetadata(*metadata);
        return;
    }

    auto* receiving = std::get_if<Receiving>(&state_);
    if (receiving == nullptr) {
        spdlog::debug("Ignoring {} message, no transfer in progress",
                      MessageKindToString(KindOf(message)));
        return;
    }

    if (auto* chunk = std::get_if<ChunkMessage>(&message)) {
        onChunk(*receiving, *chunk);
    } else {
        onComplete(*receiving);
    }
}

void FileReceiver::Abort(TransferError error, std::string detail) {
    if (!is_receiving()) {
        return;
    }
    fail(error, std::move(detail));
}

void FileReceiver::Reset() {
    if (auto* receiving = std::get_if<Receiving>(&state_)) {
        spdlog::debug("Discarding receive buffer of {}", receiving->buffer.metadata().file_name);
    }
    state_ = Idle{};
}

void FileReceiver::onMetadata(MetadataMessage& message) {
    if (auto* receiving = std::get_if<Receiving>(&state_)) {
        spdlog::warn("New file {} announced while {} was incomplete ({}/{} chunks), discarding it",
                     message.metadata.file_name,
                     receiving->buffer.metadata().file_name,
                     receiving->buffer.filled_count(),
                     receiving->buffer.slot_count());
        state_ = Idle{};
    }

    auto file_name = message.metadata.file_name;
    auto file_size = message.metadata.file_size;
    try {
        state_.emplace<Receiving>(Receiving{ReceiveBuffer(std::move(message.metadata))});
    } catch (const std::length_error& e) {
        spdlog::error("Cannot receive {} ({} bytes): {}", file_name, file_size, e.what());
        state_ = Idle{};
        progress_.Publish(TransferStatus::Errored(file_name,
                                                  0,
                                                  file_size,
                                                  TransferError::kFileTooLarge,
                                                  e.what()));
        return;
    } catch (const std::bad_alloc&) {
        spdlog::error("Cannot allocate a receive buffer for {} ({} bytes)", file_name, file_size);
        state_ = Idle{};
        progress_.Publish(TransferStatus::Errored(file_name,
                                                  0,
                                                  file_size,
                                                  TransferError::kFileTooLarge,
                                                  "receive buffer could not be allocated"));
        return;
    }

    spdlog::info("Receiving {} ({} bytes, {} chunks)",
                 file_name,
                 file_size,
                 std::get<Receiving>(state_).buffer.slot_count());
    progress_.Publish(TransferStatus::Transferring(std::move(file_name), 0, file_size));
}

void FileReceiver::onChunk(Receiving& receiving, ChunkMessage& chunk) {
    auto& buffer = receiving.buffer;
    const auto index = chunk.index;
    const auto size = chunk.data.size();

    switch (buffer.Place(index, std::move(chunk.data))) {
    case ReceiveBuffer::PlaceResult::kOutOfRange:
        fail(TransferError::kChunkIndexOutOfRange,
             fmt::format("chunk index {} is beyond the {} chunks of the file",
                         index,
                         buffer.slot_count()));
        return;
    case ReceiveBuffer::PlaceResult::kSizeMismatch:
        fail(TransferError::kChunkSizeMismatch,
             fmt::format("chunk {} carries {} bytes, expected {}",
                         index,
                         size,
                         buffer.ExpectedSize(index)));
        return;
    case ReceiveBuffer::PlaceResult::kDuplicate:
        spdlog::warn("Duplicate chunk {} of {} ignored", index, buffer.metadata().file_name);
        return;
    case ReceiveBuffer::PlaceResult::kStored:
        break;
    }

    const bool last_slot = index + 1 == buffer.slot_count();
    if (chunk.is_last != last_slot) {
        spdlog::warn("Chunk {} of {} has is_last={} but the file has {} chunks",
                     index,
                     buffer.metadata().file_name,
                     chunk.is_last,
                     buffer.slot_count());
    }

    if (index % 10 == 0 || last_slot) {
        spdlog::info("Received chunk {}/{} of {}",
                     index + 1,
                     buffer.slot_count(),
                     buffer.metadata().file_name);
    }

    progress_.Publish(TransferStatus::Transferring(buffer.metadata().file_name,
                                                   buffer.bytes_received(),
                                                   buffer.metadata().file_size));
}

void FileReceiver::onComplete(Receiving& receiving) {
    auto& buffer = receiving.buffer;
    const auto expected = buffer.metadata().file_size;
    const auto actual = buffer.bytes_received();

    if (!buffer.complete()) {
        auto missing_chunks = buffer.slot_count() - buffer.filled_count();
        if (!allow_incomplete_) {
            fail(TransferError::kIncompleteTransfer,
                 fmt::format("expected {} bytes, received {} ({} chunks missing)",
                             expected,
                             actual,
                             missing_chunks));
            return;
        }
        spdlog::warn("Completing {} with missing data: expected {} bytes, received {}, missing {}",
                     buffer.metadata().file_name,
                     expected,
                     actual,
                     expected - actual);
    }

    auto metadata = buffer.metadata();
    auto file = std::make_shared<ReceivedFile>(ReceivedFile{metadata, buffer.Assemble()});
    state_ = Idle{};

    spdlog::info("Received {} ({} bytes)", metadata.file_name, file->bytes.size());
    progress_.Publish(
        TransferStatus::Completed(metadata.file_name, actual, expected, std::move(file)));
}

void FileReceiver::fail(TransferError error, std::string detail) {
    auto& buffer = std::get<Receiving>(state_).buffer;
    auto file_name = buffer.metadata().file_name;
    auto bytes_received = buffer.bytes_received();
    auto total_bytes = buffer.metadata().file_size;
    state_ = Idle{};

    spdlog::error("Transfer of {} failed: {} ({})",
                  file_name,
                  TransferErrorToString(error),
                  detail);
    progress_.Publish(TransferStatus::Errored(std::move(file_name),
                                              bytes_received,
                                              total_bytes,
                                              error,
                                              std::move(detail)));
}

} // namespace peerdrop::core
