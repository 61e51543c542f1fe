#pragma once

#include <core/model/message.h>
#include <core/util/binary_message.h>

namespace peerdrop::core {

// Metadata and completion carry only a JSON header, chunks append their raw bytes
BinaryMessage EncodeMessage(const Message& message);

// Throws std::runtime_error on a malformed frame or an unknown kind
Message DecodeMessage(const BinaryMessage& frame);

} // namespace peerdrop::core
