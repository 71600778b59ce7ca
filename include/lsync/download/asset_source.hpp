#pragma once

#include "lsync/core/result.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace lsync::download {

/**
 * @brief What a source reports about an asset before the transfer
 */
struct AssetProbe {
    std::optional<std::uint64_t> total_bytes;
    bool supports_range = false;
};

/// Receives body bytes in order. Returning an error aborts the fetch with it.
using ChunkSink = std::function<Result<void>(const char* data, std::size_t size)>;

/**
 * @brief Transport for binary assets
 *
 * Implementations report connection-level failures as
 * ErrorCode::TransientNetwork so the download manager can retry them.
 */
class AssetSource {
public:
    virtual ~AssetSource() = default;

    virtual Result<AssetProbe> probe(const std::string& url) = 0;

    /**
     * Stream the asset starting at offset into sink.
     *
     * A source without range support must still honour offset by
     * discarding the first offset bytes.
     */
    virtual Result<void> fetch(const std::string& url, std::uint64_t offset, const ChunkSink& sink) = 0;
};

/**
 * @brief Serves assets from the local filesystem
 *
 * Accepts "file://" URLs and plain paths; always supports ranges.
 */
class FileAssetSource final : public AssetSource {
public:
    explicit FileAssetSource(std::size_t chunk_size = 64 * 1024) : chunk_size_(chunk_size == 0 ? 1 : chunk_size) {}

    Result<AssetProbe> probe(const std::string& url) override;
    Result<void> fetch(const std::string& url, std::uint64_t offset, const ChunkSink& sink) override;

    static std::string to_path(const std::string& url);

private:
    std::size_t chunk_size_;
};

} // namespace lsync::download
