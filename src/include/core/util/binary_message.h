#pragma once

#include <cstdint>
#include <cstring>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <string>
#include <vector>

#ifdef _WIN32
#include <winsock2.h>
#else
#include <arpa/inet.h>
#endif

namespace peerdrop {

using BinaryData = std::vector<std::uint8_t>;
using BinaryMessage = std::vector<std::uint8_t>;

namespace details {

struct BinaryHeader {
    std::uint32_t header_size;
};

} // namespace details

// Layout: | u32 big-endian header size | JSON header | raw data |
inline BinaryMessage CreateBinaryMessage(const nlohmann::json& header, const BinaryData& data) {
    const std::string header_str = header.dump();

    BinaryMessage message;
    message.resize(sizeof(details::BinaryHeader) + header_str.size() + data.size());

    details::BinaryHeader binary_header;
    binary_header.header_size = htonl(static_cast<std::uint32_t>(header_str.size()));

    std::memcpy(message.data(), &binary_header, sizeof(binary_header));
    std::memcpy(message.data() + sizeof(binary_header), header_str.data(), header_str.size());
    if (!data.empty()) {
        std::memcpy(message.data() + sizeof(binary_header) + header_str.size(),
                    data.data(),
                    data.size());
    }

    return message;
}

inline bool ParseBinaryMessage(const BinaryMessage& message,
                               nlohmann::json& header,
                               BinaryData& data) {
    if (message.size() < sizeof(details::BinaryHeader)) {
        return false;
    }

    details::BinaryHeader binary_header;
    std::memcpy(&binary_header, message.data(), sizeof(binary_header));

    std::uint32_t header_size = ntohl(binary_header.header_size);

    if (message.size() - sizeof(binary_header) < header_size) {
        return false;
    }

    std::string header_str(reinterpret_cast<const char*>(message.data() + sizeof(binary_header)),
                           header_size);
    try {
        header = nlohmann::json::parse(header_str);
    } catch (const nlohmann::json::exception& e) {
        spdlog::error("Failed to parse message header JSON: {}", e.what());
        return false;
    }

    std::size_t data_size = message.size() - sizeof(binary_header) - header_size;
    if (data_size > 0) {
        data.resize(data_size);
        std::memcpy(data.data(), message.data() + sizeof(binary_header) + header_size, data_size);
    } else {
        data.clear();
    }

    return true;
}

} // namespace peerdrop
