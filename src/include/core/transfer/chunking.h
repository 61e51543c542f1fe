#pragma once

#include <algorithm>
#include <core/constant/transfer.h>
#include <cstddef>
#include <cstdint>

namespace peerdrop::core {

struct ChunkBounds {
    std::uint64_t begin;
    std::uint64_t end; // Exclusive
};

inline std::uint64_t ChunkCount(std::uint64_t file_size,
                                std::size_t chunk_size = transfer::kChunkSize) {
    // No rounding addition, it would wrap near the top of the range
    return file_size / chunk_size + (file_size % chunk_size != 0 ? 1 : 0);
}

inline ChunkBounds ChunkAt(std::uint64_t index,
                           std::uint64_t file_size,
                           std::size_t chunk_size = transfer::kChunkSize) {
    std::uint64_t begin = std::min<std::uint64_t>(index * chunk_size, file_size);
    return {begin, begin + std::min<std::uint64_t>(chunk_size, file_size - begin)};
}

} // namespace peerdrop::core
