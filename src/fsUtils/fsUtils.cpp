#include "fsUtils.hpp"
#include "../logger/Mylogger.hpp"
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <openssl/sha.h>

namespace fsUtils
{
    std::optional<int64_t> regularFileSize(const std::string &path)
    {
        if (path.empty())
            return std::nullopt;
        std::error_code ec;
        if (!std::filesystem::is_regular_file(path, ec) || ec)
            return std::nullopt;
        auto size = std::filesystem::file_size(path, ec);
        if (ec)
        {
            MyLogger::error("Failed to stat '" + path + "': " + ec.message());
            return std::nullopt;
        }
        return static_cast<int64_t>(size);
    }

    bool isUsableFile(const std::string &path)
    {
        auto size = regularFileSize(path);
        return size && *size > 0;
    }

    bool readChunk(const std::string &path, int64_t offset, int64_t size, std::string &out)
    {
        std::ifstream file(path, std::ios::binary);
        if (!file.is_open())
        {
            MyLogger::error("Error opening file for chunk read: " + path);
            return false;
        }
        out.assign(static_cast<size_t>(size), '\0');
        file.seekg(offset, std::ios::beg);
        file.read(&out[0], size);
        if (file.gcount() != size)
        {
            MyLogger::error("Short read on " + path + " at offset " + std::to_string(offset) +
                            ": wanted " + std::to_string(size) + ", got " + std::to_string(file.gcount()));
            out.clear();
            return false;
        }
        return true;
    }

    bool ensureParentDirectory(const std::string &path)
    {
        auto parent = std::filesystem::path(path).parent_path();
        if (parent.empty())
            return true;
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec)
        {
            MyLogger::error("Error creating directory '" + parent.string() + "': " + ec.message());
            return false;
        }
        return true;
    }

    std::string computeSHA256Hash(const std::string &content)
    {
        unsigned char hash[SHA256_DIGEST_LENGTH];
        SHA256(reinterpret_cast<const unsigned char *>(content.data()), content.size(), hash);
        std::ostringstream oss;
        for (unsigned char byte : hash)
        {
            oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(byte);
        }
        return oss.str();
    }

    std::string contentVersion(const nlohmann::json &payload)
    {
        return computeSHA256Hash(payload.dump());
    }

} // namespace fsUtils
