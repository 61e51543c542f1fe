#pragma once

#include "file_metadata.h"
#include <core/util/binary_message.h>

namespace peerdrop::core {

// The whole file is held in memory for the duration of a send
struct OutgoingFile {
    FileMetadata metadata;
    BinaryData bytes;
};

} // namespace peerdrop::core
