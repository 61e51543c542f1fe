#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>

namespace peerdrop::core {

namespace transfer {

constexpr std::size_t kChunkSize = 16 * 1024;    // 16 KB
constexpr std::size_t kMaxChunkSize = 64 * 1024; // Practical message ceiling of a data channel

static_assert(kChunkSize <= kMaxChunkSize, "chunk size must stay below the message ceiling");

// Header JSON of the largest message plus its raw chunk bytes
constexpr std::size_t kMaxFrameSize = kMaxChunkSize + 4096;

constexpr std::chrono::milliseconds kDefaultPacingDelay{10};
constexpr std::chrono::seconds kDefaultStallTimeout{30};

constexpr std::uint16_t kDefaultPort = 56789;

} // namespace transfer

} // namespace peerdrop::core
