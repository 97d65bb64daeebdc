#ifndef TRANSPORT_HPP
#define TRANSPORT_HPP

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include "../auth/token_holder.hpp"
#include "../backoff/backoff.hpp"
#include "../errors/errors.hpp"

namespace transport
{
    struct ChunkResponse
    {
        bool success = false;       // request reached the server and got a 2xx
        bool chunkUploaded = false; // server acknowledged the chunk
        std::optional<int64_t> nextOffset;
        errors::ErrorKind kind = errors::ErrorKind::None;
        std::string err;
        long httpCode = 0;
    };

    // Chunked request/response primitive. Timeouts and request-level retries
    // belong to the implementation, not to its callers.
    class Transport
    {
    public:
        virtual ~Transport() = default;
        virtual ChunkResponse postChunk(const std::string &upload_id,
                                        int64_t chunk_index,
                                        int64_t total_chunks,
                                        const std::string &data) = 0;
    };

    struct CurlOptions
    {
        std::string base_url;
        long timeout_ms = 30000;
        int retries = 3;
        backoff::Policy retry_backoff{500, 8000};
    };

    // POSTs each chunk as application/octet-stream to <base_url>/api/uploads/chunk
    // with the chunk coordinates in headers; expects a JSON body
    // {"chunkUploaded": bool, "nextOffset": int?}.
    class CurlTransport : public Transport
    {
    public:
        CurlTransport(const CurlOptions &options, std::shared_ptr<auth::TokenHolder> token);

        ChunkResponse postChunk(const std::string &upload_id,
                                int64_t chunk_index,
                                int64_t total_chunks,
                                const std::string &data) override;

    private:
        ChunkResponse sendOnce(const std::string &upload_id,
                               int64_t chunk_index,
                               int64_t total_chunks,
                               const std::string &data);

        CurlOptions options_;
        std::shared_ptr<auth::TokenHolder> token_;
    };

    // Parses a chunk acknowledgement body. Exposed for tests.
    ChunkResponse parseChunkResponse(long http_code, const std::string &body);
} // namespace transport

#endif // TRANSPORT_HPP
