#pragma once

#include "file_metadata.h"
#include <core/util/binary_message.h>

namespace peerdrop::core {

// A fully reconstructed file, handed to consumers through the completed status
struct ReceivedFile {
    FileMetadata metadata;
    BinaryData bytes;
};

} // namespace peerdrop::core
