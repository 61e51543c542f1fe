#pragma once

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <string>
#include <string_view>

namespace peerdrop::core {

inline constexpr std::string_view kDefaultMimeType = "application/octet-stream";

inline std::string GuessMimeType(const std::filesystem::path& path) {
    std::string ext = path.extension().string();

    // If there's no extension or it's just a dot
    if (ext.empty() || ext == ".") {
        return std::string(kDefaultMimeType);
    }

    ext = ext.substr(1);
    std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) {
        return std::tolower(c);
    });

    // Image formats
    if (ext == "jpg" || ext == "jpeg") {
        return "image/jpeg";
    }
    if (ext == "png" || ext == "gif" || ext == "bmp" || ext == "tiff" || ext == "webp"
        || ext == "heic" || ext == "heif") {
        return "image/" + ext;
    }
    if (ext == "svg") {
        return "image/svg+xml";
    }
    if (ext == "ico") {
        return "image/vnd.microsoft.icon";
    }

    // Video formats
    if (ext == "mp4" || ext == "webm" || ext == "mpeg") {
        return "video/" + ext;
    }
    if (ext == "mkv") {
        return "video/x-matroska";
    }
    if (ext == "mov") {
        return "video/quicktime";
    }
    if (ext == "avi") {
        return "video/x-msvideo";
    }

    // Audio formats
    if (ext == "mp3") {
        return "audio/mpeg";
    }
    if (ext == "wav" || ext == "ogg" || ext == "flac" || ext == "aac" || ext == "opus") {
        return "audio/" + ext;
    }

    // Text formats
    if (ext == "txt" || ext == "log" || ext == "ini") {
        return "text/plain";
    }
    if (ext == "md") {
        return "text/markdown";
    }
    if (ext == "csv" || ext == "html" || ext == "css") {
        return "text/" + ext;
    }
    if (ext == "json" || ext == "xml" || ext == "pdf" || ext == "zip" || ext == "rtf") {
        return "application/" + ext;
    }
    if (ext == "epub") {
        return "application/epub+zip";
    }
    if (ext == "yaml" || ext == "yml") {
        return "application/yaml";
    }

    // Archive formats
    if (ext == "gz" || ext == "tgz") {
        return "application/gzip";
    }
    if (ext == "tar") {
        return "application/x-tar";
    }
    if (ext == "7z") {
        return "application/x-7z-compressed";
    }
    if (ext == "bz2") {
        return "application/x-bzip2";
    }
    if (ext == "xz") {
        return "application/x-xz";
    }

    // Office documents
    if (ext == "doc") {
        return "application/msword";
    }
    if (ext == "docx") {
        return "application/vnd.openxmlformats-officedocument.wordprocessingml.document";
    }
    if (ext == "xlsx") {
        return "application/vnd.openxmlformats-officedocument.spreadsheetml.sheet";
    }
    if (ext == "pptx") {
        return "application/vnd.openxmlformats-officedocument.presentationml.presentation";
    }

    return std::string(kDefaultMimeType);
}

} // namespace peerdrop::core
