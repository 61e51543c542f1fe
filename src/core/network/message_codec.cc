#include <core/network/message_codec.h>
#include <limits>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

using json = nlohmann::json;

namespace peerdrop::core {

namespace {

json headerOf(MessageKind kind) {
    json header;
    header["kind"] = MessageKindToString(kind);
    return header;
}

// Negative or fractional numbers would be converted silently by get<>()
std::uint64_t unsignedField(const json& header, const char* name, std::uint64_t max) {
    const auto& field = header.at(name);
    if (!field.is_number_unsigned()) {
        throw std::runtime_error(std::string(name) + " is not an unsigned integer");
    }
    auto value = field.get<std::uint64_t>();
    if (value > max) {
        throw std::runtime_error(std::string(name) + " is out of range");
    }
    return value;
}

} // namespace

BinaryMessage EncodeMessage(const Message& message) {
    static const BinaryData kNoData;

    json header = headerOf(KindOf(message));
    if (const auto* metadata = std::get_if<MetadataMessage>(&message)) {
        header.update(json(metadata->metadata));
        return CreateBinaryMessage(header, kNoData);
    }
    if (const auto* chunk = std::get_if<ChunkMessage>(&message)) {
        header["index"] = chunk->index;
        header["is_last"] = chunk->is_last;
        return CreateBinaryMessage(header, chunk->data);
    }
    return CreateBinaryMessage(header, kNoData);
}

Message DecodeMessage(const BinaryMessage& frame) {
    json header;
    BinaryData data;
    if (!ParseBinaryMessage(frame, header, data)) {
        throw std::runtime_error("malformed message frame");
    }
    if (!header.is_object() || !header.contains("kind") || !header["kind"].is_string()) {
        throw std::runtime_error("message header has no kind");
    }

    auto kind_name = header["kind"].get<std::string>();
    auto kind = MessageKindFromString(kind_name);
    if (!kind) {
        throw std::runtime_error("unknown message kind: " + kind_name);
    }

    try {
        switch (*kind) {
        case MessageKind::kMetadata:
            unsignedField(header, "file_size", std::numeric_limits<std::uint64_t>::max());
            return MetadataMessage{header.get<FileMetadata>()};
        case MessageKind::kChunk: {
            ChunkMessage chunk;
            chunk.index = static_cast<std::uint32_t>(
                unsignedField(header, "index", std::numeric_limits<std::uint32_t>::max()));
            chunk.is_last = header.at("is_last").get<bool>();
            chunk.data = std::move(data);
            return chunk;
        }
        case MessageKind::kComplete:
            return CompleteMessage{};
        }
    } catch (const json::exception& e) {
        throw std::runtime_error("invalid " + kind_name + " header: " + e.what());
    }
    throw std::runtime_error("unknown message kind: " + kind_name);
}

} // namespace peerdrop::core
