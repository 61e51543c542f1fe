#pragma once

#include <core/constant/transfer.h>
#include <core/model/file_metadata.h>
#include <core/util/binary_message.h>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace peerdrop::core {

// Slot array for one in-progress transfer, indexed by chunk index
class ReceiveBuffer {
public:
    enum class PlaceResult {
        kStored,
        kDuplicate,    // Slot already filled, nothing changed
        kOutOfRange,   // Index beyond the announced file
        kSizeMismatch, // Payload size differs from the slot size
    };

    // Throws std::length_error if the file needs more chunks than a u32 index can address
    explicit ReceiveBuffer(FileMetadata metadata, std::size_t chunk_size = transfer::kChunkSize);

    PlaceResult Place(std::uint32_t index, BinaryData&& bytes);

    // Concatenates the filled slots in index order, skipping empty ones.
    // The slots are moved out, the buffer is empty afterwards.
    BinaryData Assemble();

    std::size_t ExpectedSize(std::uint32_t index) const;

    const FileMetadata& metadata() const { return metadata_; }
    std::size_t slot_count() const { return slots_.size(); }
    std::size_t filled_count() const { return filled_count_; }
    std::uint64_t bytes_received() const { return bytes_received_; }
    bool complete() const { return filled_count_ == slots_.size(); }

private:
    FileMetadata metadata_;
    std::size_t chunk_size_;
    std::vector<std::optional<BinaryData>> slots_;
    std::size_t filled_count_{0};
    std::uint64_t bytes_received_{0}; // Running sum, never recomputed from the slots
};

} // namespace peerdrop::core
