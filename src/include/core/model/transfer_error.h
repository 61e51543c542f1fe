#pragma once

#include <nlohmann/json.hpp>
#include <string_view>
#include <system_error>

namespace peerdrop::core {

enum class TransferError {
    kChannelNotReady = 1,  // Send attempted before the channel was open
    kChunkIndexOutOfRange, // Peer sent a chunk index beyond the announced file
    kChunkSizeMismatch,    // Chunk payload does not match the size of its slot
    kIncompleteTransfer,   // Completion marker arrived while chunks were missing
    kChannelError,         // Underlying transport failed or closed mid transfer
    kCancelled,            // Transfer torn down locally
    kTimedOut,             // No progress within the stall timeout
    kFileUnreadable,       // Local file could not be loaded
    kFileTooLarge,         // Announced file cannot be indexed or buffered
};

NLOHMANN_JSON_SERIALIZE_ENUM(TransferError,
                             {
                                 {TransferError::kChannelNotReady, "ChannelNotReady"},
                                 {TransferError::kChunkIndexOutOfRange, "ChunkIndexOutOfRange"},
                                 {TransferError::kChunkSizeMismatch, "ChunkSizeMismatch"},
                                 {TransferError::kIncompleteTransfer, "IncompleteTransfer"},
                                 {TransferError::kChannelError, "ChannelError"},
                                 {TransferError::kCancelled, "Cancelled"},
                                 {TransferError::kTimedOut, "TimedOut"},
                                 {TransferError::kFileUnreadable, "FileUnreadable"},
                                 {TransferError::kFileTooLarge, "FileTooLarge"},
                             });

std::string_view TransferErrorToString(TransferError error);

const std::error_category& TransferErrorCategory() noexcept;

std::error_code make_error_code(TransferError error) noexcept;

} // namespace peerdrop::core

template<>
struct std::is_error_code_enum<peerdrop::core::TransferError> : std::true_type {};
