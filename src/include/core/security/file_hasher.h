#pragma once

#include <core/util/binary_message.h>
#include <string>

namespace peerdrop::core {

class FileHasher {
public:
    // Lowercase hex SHA-256, throws std::runtime_error if OpenSSL fails
    static std::string CalculateDataChecksum(const BinaryData& data);
};

} // namespace peerdrop::core
