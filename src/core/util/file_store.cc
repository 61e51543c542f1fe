#include <core/model/mime_type.h>
#include <core/util/file_store.h>
#include <fstream>
#include <regex>
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace fs = std::filesystem;

namespace peerdrop::core {

OutgoingFile LoadOutgoingFile(const fs::path& file_path) {
    std::error_code ec;
    if (!fs::is_regular_file(file_path, ec)) {
        throw std::runtime_error(fmt::format("Not a regular file: {}", file_path.string()));
    }

    auto file_size = fs::file_size(file_path, ec);
    if (ec) {
        throw std::runtime_error(
            fmt::format("Failed to stat {}: {}", file_path.string(), ec.message()));
    }

    std::ifstream file(file_path, std::ios::binary);
    if (!file) {
        throw std::runtime_error(fmt::format("Failed to open file: {}", file_path.string()));
    }

    OutgoingFile outgoing;
    outgoing.bytes.resize(file_size);
    if (file_size > 0) {
        file.read(reinterpret_cast<char*>(outgoing.bytes.data()),
                  static_cast<std::streamsize>(file_size));
        if (static_cast<std::uint64_t>(file.gcount()) != file_size) {
            throw std::runtime_error(fmt::format("Short read on {}: {} of {} bytes",
                                                 file_path.string(),
                                                 file.gcount(),
                                                 file_size));
        }
    }

    outgoing.metadata.file_name = file_path.filename().string();
    outgoing.metadata.file_size = file_size;
    outgoing.metadata.mime_type = GuessMimeType(file_path);

    spdlog::debug("Loaded {} ({} bytes, {})",
                  outgoing.metadata.file_name,
                  outgoing.metadata.file_size,
                  outgoing.metadata.mime_type);
    return outgoing;
}

std::string SanitizeFileName(std::string_view file_name) {
    auto pos = file_name.find_last_of("/\\");
    if (pos != std::string_view::npos) {
        file_name.remove_prefix(pos + 1);
    }
    if (file_name.empty() || file_name == "." || file_name == "..") {
        return "received.bin";
    }
    return std::string(file_name);
}

fs::path UniqueSavePath(const fs::path& save_dir, std::string_view file_name) {
    fs::path final_file_path = save_dir / SanitizeFileName(file_name);
    if (!fs::exists(final_file_path)) {
        return final_file_path;
    }

    std::string stem = final_file_path.stem().string();
    std::string ext = final_file_path.extension().string();
    int counter = 1;

    // Continue numbering when the name already has the format "name (n)"
    std::regex pattern(R"((.*) \((\d+)\)$)");
    std::smatch matches;
    if (std::regex_match(stem, matches, pattern)) {
        stem = matches[1].str();
        counter = std::stoi(matches[2].str()) + 1;
    }

    do {
        std::string new_stem = stem + " (" + std::to_string(counter) + ")";
        final_file_path = save_dir / (new_stem + ext);
        ++counter;
    } while (fs::exists(final_file_path));

    return final_file_path;
}

fs::path SaveReceivedFile(const fs::path& save_dir, const ReceivedFile& file) {
    if (!fs::exists(save_dir)) {
        fs::create_directories(save_dir);
    }

    fs::path final_file_path = UniqueSavePath(save_dir, file.metadata.file_name);

    std::ofstream out(final_file_path, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw std::runtime_error(
            fmt::format("Failed to create file {}", final_file_path.string()));
    }
    out.write(reinterpret_cast<const char*>(file.bytes.data()),
              static_cast<std::streamsize>(file.bytes.size()));
    out.close();
    if (!out) {
        throw std::runtime_error(
            fmt::format("Failed to write file {}", final_file_path.string()));
    }

    spdlog::info("File {} received successfully, saved as \"{}\"",
                 file.metadata.file_name,
                 final_file_path.string());
    return final_file_path;
}

} // namespace peerdrop::core
