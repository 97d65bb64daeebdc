#include "transport.hpp"
#include "../logger/Mylogger.hpp"
#include <chrono>
#include <thread>
#include <curl/curl.h>
#include <nlohmann/json.hpp>

namespace transport
{
    namespace
    {
        size_t WriteCallback(void *contents, size_t size, size_t nmemb, void *userp)
        {
            std::string *s = static_cast<std::string *>(userp);
            size_t totalSize = size * nmemb;
            s->append(static_cast<char *>(contents), totalSize);
            return totalSize;
        }
    }

    ChunkResponse parseChunkResponse(long http_code, const std::string &body)
    {
        ChunkResponse res;
        res.httpCode = http_code;
        res.kind = errors::classifyHttpStatus(http_code);
        if (res.kind != errors::ErrorKind::None)
        {
            res.err = "HTTP error code: " + std::to_string(http_code);
            return res;
        }

        try
        {
            auto j = nlohmann::json::parse(body);
            res.success = true;
            res.chunkUploaded = j.value("chunkUploaded", false);
            if (j.contains("nextOffset") && j["nextOffset"].is_number_integer())
                res.nextOffset = j["nextOffset"].get<int64_t>();
            if (!res.chunkUploaded)
            {
                // 2xx without an acknowledgement: the server may be
                // reassembling, so the chunk is simply sent again later.
                res.kind = errors::ErrorKind::TransientIO;
                res.err = "Server did not acknowledge chunk";
            }
        }
        catch (const nlohmann::json::exception &e)
        {
            res.success = false;
            res.kind = errors::ErrorKind::TransientIO;
            res.err = std::string("Malformed chunk response: ") + e.what();
        }
        return res;
    }

    CurlTransport::CurlTransport(const CurlOptions &options, std::shared_ptr<auth::TokenHolder> token)
        : options_(options), token_(std::move(token)) {}

    ChunkResponse CurlTransport::postChunk(const std::string &upload_id,
                                           int64_t chunk_index,
                                           int64_t total_chunks,
                                           const std::string &data)
    {
        ChunkResponse res;
        for (int attempt = 0; attempt <= options_.retries; ++attempt)
        {
            res = sendOnce(upload_id, chunk_index, total_chunks, data);
            if (res.success && res.chunkUploaded)
                return res;
            if (!errors::isRetryable(res.kind) || attempt == options_.retries)
                break;

            auto delay = backoff::exponentialDelay(attempt, options_.retry_backoff);
            MyLogger::warning("Transport >> chunk " + std::to_string(chunk_index) + " of " + upload_id +
                              " failed (" + res.err + "), retry " + std::to_string(attempt + 1) +
                              " in " + std::to_string(delay) + " ms");
            std::this_thread::sleep_for(std::chrono::milliseconds(delay));
        }
        return res;
    }

    ChunkResponse CurlTransport::sendOnce(const std::string &upload_id,
                                          int64_t chunk_index,
                                          int64_t total_chunks,
                                          const std::string &data)
    {
        ChunkResponse res;
        CURL *curl = curl_easy_init();
        if (!curl)
        {
            res.kind = errors::ErrorKind::TransientIO;
            res.err = "Failed to initialize CURL";
            return res;
        }

        const std::string url = options_.base_url + "/api/uploads/chunk";
        std::string readBuffer;
        curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
        curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, options_.timeout_ms);
        curl_easy_setopt(curl, CURLOPT_POST, 1L);
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, data.data());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(data.size()));
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, WriteCallback);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &readBuffer);
        curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

        struct curl_slist *headers = nullptr;
        headers = curl_slist_append(headers, "Content-Type: application/octet-stream");
        headers = curl_slist_append(headers, ("X-Upload-Id: " + upload_id).c_str());
        headers = curl_slist_append(headers, ("X-Chunk-Index: " + std::to_string(chunk_index)).c_str());
        headers = curl_slist_append(headers, ("X-Total-Chunks: " + std::to_string(total_chunks)).c_str());
        const std::string token = token_ ? token_->get() : std::string();
        if (!token.empty())
            headers = curl_slist_append(headers, ("Authorization: Bearer " + token).c_str());
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);

        CURLcode curlRes = curl_easy_perform(curl);
        if (curlRes != CURLE_OK)
        {
            res.kind = errors::classifyCurlCode(curlRes);
            res.err = curl_easy_strerror(curlRes);
            curl_easy_cleanup(curl);
            curl_slist_free_all(headers);
            return res;
        }
        long httpCode = 0;
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &httpCode);
        curl_easy_cleanup(curl);
        curl_slist_free_all(headers);

        MyLogger::debug("Transport >> chunk " + std::to_string(chunk_index) + "/" + std::to_string(total_chunks) +
                        " of " + upload_id + " -> HTTP " + std::to_string(httpCode));
        return parseChunkResponse(httpCode, readBuffer);
    }
} // namespace transport
