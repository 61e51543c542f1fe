#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>

namespace peerdrop::core {

struct FileMetadata {
    std::string file_name;
    std::uint64_t file_size{0};
    std::string mime_type;

    bool operator==(const FileMetadata&) const = default;

    NLOHMANN_DEFINE_TYPE_INTRUSIVE(FileMetadata, file_name, file_size, mime_type);
};

} // namespace peerdrop::core
