#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace fsUtils
{
    // Size of a regular file, or nullopt if it does not exist / is not a file.
    std::optional<int64_t> regularFileSize(const std::string &path);

    // True if path names a regular file with at least one byte in it.
    bool isUsableFile(const std::string &path);

    // Reads exactly size bytes starting at offset into out.
    // Returns false on open failure or short read.
    bool readChunk(const std::string &path, int64_t offset, int64_t size, std::string &out);

    bool ensureParentDirectory(const std::string &path);

    std::string computeSHA256Hash(const std::string &content);

    // Hash of the compact dump of a JSON value. nlohmann orders object keys,
    // so equal documents hash equally.
    std::string contentVersion(const nlohmann::json &payload);
}
