#pragma once

#include "lsync/download/asset_source.hpp"

#include <chrono>
#include <cstddef>
#include <map>
#include <string>

namespace lsync::download {

/**
 * @brief Plain HTTP/1.1 asset transport over Boost.Asio
 *
 * PROTOCOL:
 * - probe(): HEAD; size from Content-Length, range support from
 *   "Accept-Ranges: bytes"
 * - fetch(): GET with "Range: bytes=<offset>-" when offset > 0. A 206
 *   continues at offset; a 200 means the server ignored the range and the
 *   first offset bytes are discarded
 * - One connection per request ("Connection: close")
 *
 * TIMEOUTS:
 * Resolve, connect, send and every read wait at most idle_timeout for
 * progress. A server that stops sending mid-head or mid-body fails the
 * call with TransientNetwork instead of pinning the download worker.
 *
 * ERRORS:
 * Connection failures, idle timeouts, 5xx and bodies cut short map to TransientNetwork;
 * 404 maps to NotFound; other 4xx to InvalidArgument.
 *
 * LIMITATIONS:
 * No TLS and no chunked transfer coding; presigned asset URLs served over
 * http with a Content-Length are what this transport expects.
 */
class HttpAssetSource final : public AssetSource {
public:
    static constexpr std::chrono::milliseconds kDefaultIdleTimeout{30000};

    explicit HttpAssetSource(std::size_t chunk_size = 64 * 1024,
                             std::chrono::milliseconds idle_timeout = kDefaultIdleTimeout)
        : chunk_size_(chunk_size == 0 ? 1 : chunk_size),
          idle_timeout_(idle_timeout.count() > 0 ? idle_timeout : kDefaultIdleTimeout) {}

    Result<AssetProbe> probe(const std::string& url) override;
    Result<void> fetch(const std::string& url, std::uint64_t offset, const ChunkSink& sink) override;

    struct Url {
        std::string host;
        std::string port;
        std::string target;
    };

    static Result<Url> parse_url(const std::string& url);

    struct ResponseHead {
        int status = 0;
        std::map<std::string, std::string> headers;  ///< Lower-cased names

        [[nodiscard]] std::string header(const std::string& name) const {
            auto it = headers.find(name);
            return it == headers.end() ? std::string{} : it->second;
        }
    };

private:
    std::size_t chunk_size_;
    std::chrono::milliseconds idle_timeout_;
};

} // namespace lsync::download
