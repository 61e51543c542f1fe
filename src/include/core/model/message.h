#pragma once

#include "file_metadata.h"
#include <core/util/binary_message.h>
#include <cstdint>
#include <optional>
#include <string_view>
#include <variant>

namespace peerdrop::core {

enum class MessageKind {
    kMetadata, // Sent once, before any chunk
    kChunk,    // One slice of the file
    kComplete, // Sent after the last chunk
};

struct MetadataMessage {
    FileMetadata metadata;
};

struct ChunkMessage {
    std::uint32_t index{0};
    BinaryData data;
    bool is_last{false};
};

struct CompleteMessage {};

using Message = std::variant<MetadataMessage, ChunkMessage, CompleteMessage>;

inline std::string_view MessageKindToString(MessageKind kind) {
    switch (kind) {
    case MessageKind::kMetadata:
        return "metadata";
    case MessageKind::kChunk:
        return "chunk";
    case MessageKind::kComplete:
        return "complete";
    }
    return "unknown";
}

inline std::optional<MessageKind> MessageKindFromString(std::string_view kind) {
    if (kind == "metadata") {
        return MessageKind::kMetadata;
    }
    if (kind == "chunk") {
        return MessageKind::kChunk;
    }
    if (kind == "complete") {
        return MessageKind::kComplete;
    }
    return std::nullopt;
}

inline MessageKind KindOf(const Message& message) {
    switch (message.index()) {
    case 0:
        return MessageKind::kMetadata;
    case 1:
        return MessageKind::kChunk;
    default:
        return MessageKind::kComplete;
    }
}

} // namespace peerdrop::core
