#include "lsync/download/asset_source.hpp"

#include <filesystem>
#include <fstream>
#include <vector>

namespace lsync::download {

namespace fs = std::filesystem;

std::string FileAssetSource::to_path(const std::string& url) {
    static const std::string scheme = "file://";
    if (url.compare(0, scheme.size(), scheme) == 0) {
        return url.substr(scheme.size());
    }
    return url;
}

Result<AssetProbe> FileAssetSource::probe(const std::string& url) {
    const fs::path path = to_path(url);
    std::error_code ec;
    const auto size = fs::file_size(path, ec);
    if (ec) {
        return Err<AssetProbe>(ErrorCode::NotFound, "Asset not found: " + path.string());
    }
    AssetProbe probe;
    probe.total_bytes = static_cast<std::uint64_t>(size);
    probe.supports_range = true;
    return Ok(probe);
}

Result<void> FileAssetSource::fetch(const std::string& url, std::uint64_t offset, const ChunkSink& sink) {
    const fs::path path = to_path(url);
    std::ifstream input(path, std::ios::binary);
    if (!input) {
        return Err<void>(ErrorCode::NotFound, "Asset not found: " + path.string());
    }
    input.seekg(static_cast<std::streamoff>(offset));
    if (!input) {
        return Err<void>(ErrorCode::InvalidArgument, "Offset beyond end of asset: " + path.string());
    }

    std::vector<char> buffer(chunk_size_);
    while (input) {
        input.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        const auto read = input.gcount();
        if (read <= 0) {
            break;
        }
        auto written = sink(buffer.data(), static_cast<std::size_t>(read));
        if (written.is_error()) {
            return written;
        }
    }
    if (input.bad()) {
        return Err<void>(ErrorCode::Io, "Read failed: " + path.string());
    }
    return Ok();
}

} // namespace lsync::download
