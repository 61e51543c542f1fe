#include <core/transfer/chunking.h>
#include <core/transfer/receive_buffer.h>
#include <limits>
#include <stdexcept>
#include <utility>

namespace peerdrop::core {

ReceiveBuffer::ReceiveBuffer(FileMetadata metadata, std::size_t chunk_size)
    : metadata_(std::move(metadata))
    , chunk_size_(chunk_size) {
    auto count = ChunkCount(metadata_.file_size, chunk_size_);
    if (count > static_cast<std::uint64_t>(std::numeric_limits<std::uint32_t>::max()) + 1) {
        throw std::length_error("file needs more chunks than a chunk index can address");
    }
    slots_.resize(static_cast<std::size_t>(count));
}

ReceiveBuffer::PlaceResult ReceiveBuffer::Place(std::uint32_t index, BinaryData&& bytes) {
    if (index >= slots_.size()) {
        return PlaceResult::kOutOfRange;
    }
    auto& slot = slots_[index];
    if (slot.has_value()) {
        return PlaceResult::kDuplicate;
    }
    if (bytes.size() != ExpectedSize(index)) {
        return PlaceResult::kSizeMismatch;
    }
    bytes_received_ += bytes.size();
    ++filled_count_;
    slot = std::move(bytes);
    return PlaceResult::kStored;
}

BinaryData ReceiveBuffer::Assemble() {
    BinaryData file_bytes;
    file_bytes.reserve(static_cast<std::size_t>(bytes_received_));
    for (auto& slot : slots_) {
        if (slot && !slot->empty()) {
            file_bytes.insert(file_bytes.end(), slot->begin(), slot->end());
            slot.reset();
        }
    }
    slots_.clear();
    filled_count_ = 0;
    bytes_received_ = 0;
    return file_bytes;
}

std::size_t ReceiveBuffer::ExpectedSize(std::uint32_t index) const {
    auto bounds = ChunkAt(index, metadata_.file_size, chunk_size_);
    return static_cast<std::size_t>(bounds.end - bounds.begin);
}

} // namespace peerdrop::core
