#pragma once

#include <core/model/outgoing_file.h>
#include <core/model/received_file.h>
#include <filesystem>
#include <string>
#include <string_view>

namespace peerdrop::core {

// Reads the whole file into memory, throws std::runtime_error when it cannot be read
OutgoingFile LoadOutgoingFile(const std::filesystem::path& file_path);

// Strips any directory part a peer may have put into the announced name
std::string SanitizeFileName(std::string_view file_name);

// "name.ext" -> "name (1).ext" -> "name (2).ext" ... until the path is free
std::filesystem::path UniqueSavePath(const std::filesystem::path& save_dir,
                                     std::string_view file_name);

// Writes the payload under save_dir without overwriting, returns the final path
std::filesystem::path SaveReceivedFile(const std::filesystem::path& save_dir,
                                       const ReceivedFile& file);

} // namespace peerdrop::core
