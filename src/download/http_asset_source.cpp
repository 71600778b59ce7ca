#include "lsync/download/http_asset_source.hpp"

#include <boost/asio.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <istream>
#include <optional>
#include <sstream>
#include <utility>
#include <vector>

namespace lsync::download {

namespace asio = boost::asio;
using tcp = asio::ip::tcp;

namespace {

std::string to_lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

std::string trim(const std::string& value) {
    const auto first = value.find_first_not_of(" \t\r");
    if (first == std::string::npos) {
        return {};
    }
    const auto last = value.find_last_not_of(" \t\r");
    return value.substr(first, last - first + 1);
}

std::optional<std::uint64_t> parse_u64(const std::string& text) {
    if (text.empty() || !std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isdigit(c); })) {
        return std::nullopt;
    }
    try {
        return static_cast<std::uint64_t>(std::stoull(text));
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

Result<void> status_to_error(int status, const std::string& url) {
    if (status >= 500) {
        return Err<void>(ErrorCode::TransientNetwork, "HTTP " + std::to_string(status) + " from " + url);
    }
    if (status == 404 || status == 410) {
        return Err<void>(ErrorCode::NotFound, "HTTP " + std::to_string(status) + " from " + url);
    }
    return Err<void>(ErrorCode::InvalidArgument, "HTTP " + std::to_string(status) + " from " + url);
}

/// One request/response exchange. Every socket operation runs on a private
/// io_context and is abandoned when no progress is made for idle_timeout.
class Connection {
public:
    Connection(const HttpAssetSource::Url& url, std::chrono::milliseconds idle_timeout)
        : url_(url), socket_(io_), resolver_(io_), idle_timeout_(idle_timeout) {}

    Result<void> send(const std::string& request) {
        tcp::resolver::results_type endpoints;
        auto ec = await([&](boost::system::error_code& result) {
            resolver_.async_resolve(url_.host, url_.port,
                                    [&](const boost::system::error_code& e, tcp::resolver::results_type found) {
                                        result = e;
                                        endpoints = std::move(found);
                                    });
        });
        if (ec) {
            return failure("resolve " + url_.host, ec);
        }
        ec = await([&](boost::system::error_code& result) {
            asio::async_connect(socket_, endpoints,
                                [&](const boost::system::error_code& e, const tcp::endpoint&) { result = e; });
        });
        if (ec) {
            return failure("connect " + url_.host + ":" + url_.port, ec);
        }
        ec = await([&](boost::system::error_code& result) {
            asio::async_write(socket_, asio::buffer(request),
                              [&](const boost::system::error_code& e, std::size_t) { result = e; });
        });
        if (ec) {
            return failure("send request", ec);
        }
        return Ok();
    }

    Result<HttpAssetSource::ResponseHead> read_head() {
        auto ec = await([&](boost::system::error_code& result) {
            asio::async_read_until(socket_, buffer_, "\r\n\r\n",
                                   [&](const boost::system::error_code& e, std::size_t) { result = e; });
        });
        if (ec) {
            return Err<HttpAssetSource::ResponseHead>(failure("reading response head", ec).error());
        }
        return parse_head();
    }

    /// Returns 0 with ec == eof once the server closed the connection.
    std::size_t read_some(std::vector<char>& chunk, boost::system::error_code& ec) {
        std::size_t read = 0;
        ec = await([&](boost::system::error_code& result) {
            socket_.async_read_some(asio::buffer(chunk), [&](const boost::system::error_code& e, std::size_t n) {
                result = e;
                read = n;
            });
        });
        return read;
    }

    /// Body bytes that arrived together with the head.
    std::string take_buffered() {
        const auto bufs = buffer_.data();
        std::string leftover(asio::buffers_begin(bufs), asio::buffers_end(bufs));
        buffer_.consume(buffer_.size());
        return leftover;
    }

    Result<void> failure(const std::string& what, const boost::system::error_code& ec) const {
        if (ec == asio::error::timed_out) {
            return Err<void>(ErrorCode::TransientNetwork,
                             what + ": no data from " + url_.host + ":" + url_.port + " for " +
                                 std::to_string(idle_timeout_.count()) + "ms");
        }
        return Err<void>(ErrorCode::TransientNetwork, what + ": " + ec.message());
    }

private:
    template<typename Start>
    boost::system::error_code await(Start start) {
        boost::system::error_code result = asio::error::would_block;
        start(result);
        io_.restart();
        io_.run_for(idle_timeout_);
        if (!io_.stopped()) {
            // Timed out: cancel and let the aborted handler run before returning
            boost::system::error_code ignored;
            resolver_.cancel();
            socket_.close(ignored);
            io_.run();
            return asio::error::timed_out;
        }
        return result;
    }

    Result<HttpAssetSource::ResponseHead> parse_head() {
        std::istream stream(&buffer_);
        std::string status_line;
        std::getline(stream, status_line);

        HttpAssetSource::ResponseHead head;
        std::istringstream parser(status_line);
        std::string version;
        parser >> version >> head.status;
        if (!parser || version.compare(0, 5, "HTTP/") != 0) {
            return Err<HttpAssetSource::ResponseHead>(ErrorCode::TransientNetwork,
                                                      "malformed status line: " + trim(status_line));
        }

        std::string line;
        while (std::getline(stream, line) && line != "\r" && !line.empty()) {
            const auto colon = line.find(':');
            if (colon == std::string::npos) {
                continue;
            }
            head.headers[to_lower(trim(line.substr(0, colon)))] = trim(line.substr(colon + 1));
        }
        return Ok(std::move(head));
    }

    HttpAssetSource::Url url_;
    asio::io_context io_;
    tcp::socket socket_;
    tcp::resolver resolver_;
    asio::streambuf buffer_;
    std::chrono::milliseconds idle_timeout_;
};

std::string build_request(const char* method, const HttpAssetSource::Url& url, std::uint64_t offset) {
    std::ostringstream request;
    request << method << " " << url.target << " HTTP/1.1\r\n"
            << "Host: " << url.host << "\r\n"
            << "Accept: */*\r\n"
            << "Connection: close\r\n";
    if (offset > 0) {
        request << "Range: bytes=" << offset << "-\r\n";
    }
    request << "\r\n";
    return request.str();
}

} // namespace

Result<HttpAssetSource::Url> HttpAssetSource::parse_url(const std::string& url) {
    static const std::string scheme = "http://";
    if (url.compare(0, 8, "https://") == 0) {
        return Err<Url>(ErrorCode::InvalidArgument, "https is not supported by this transport: " + url);
    }
    if (url.compare(0, scheme.size(), scheme) != 0) {
        return Err<Url>(ErrorCode::InvalidArgument, "Not an http URL: " + url);
    }

    const auto rest = url.substr(scheme.size());
    const auto slash = rest.find('/');
    const auto authority = rest.substr(0, slash);
    Url parsed;
    parsed.target = slash == std::string::npos ? "/" : rest.substr(slash);

    const auto colon = authority.rfind(':');
    if (colon == std::string::npos) {
        parsed.host = authority;
        parsed.port = "80";
    } else {
        parsed.host = authority.substr(0, colon);
        parsed.port = authority.substr(colon + 1);
    }
    if (parsed.host.empty() || parsed.port.empty()) {
        return Err<Url>(ErrorCode::InvalidArgument, "Malformed URL: " + url);
    }
    return Ok(std::move(parsed));
}

Result<AssetProbe> HttpAssetSource::probe(const std::string& url) {
    auto parsed = parse_url(url);
    if (parsed.is_error()) {
        return Err<AssetProbe>(parsed.error());
    }

    Connection connection(parsed.value(), idle_timeout_);
    auto sent = connection.send(build_request("HEAD", parsed.value(), 0));
    if (sent.is_error()) {
        return Err<AssetProbe>(sent.error());
    }

    auto head = connection.read_head();
    if (head.is_error()) {
        return Err<AssetProbe>(head.error());
    }
    if (head.value().status < 200 || head.value().status >= 300) {
        return Err<AssetProbe>(status_to_error(head.value().status, url).error());
    }

    AssetProbe probe;
    probe.total_bytes = parse_u64(head.value().header("content-length"));
    probe.supports_range = to_lower(head.value().header("accept-ranges")) == "bytes";
    spdlog::debug("[Http] probe {} size={} ranges={}", url,
                  probe.total_bytes ? std::to_string(*probe.total_bytes) : "unknown", probe.supports_range);
    return Ok(probe);
}

Result<void> HttpAssetSource::fetch(const std::string& url, std::uint64_t offset, const ChunkSink& sink) {
    auto parsed = parse_url(url);
    if (parsed.is_error()) {
        return Err<void>(parsed.error());
    }

    Connection connection(parsed.value(), idle_timeout_);
    auto sent = connection.send(build_request("GET", parsed.value(), offset));
    if (sent.is_error()) {
        return sent;
    }

    auto head_result = connection.read_head();
    if (head_result.is_error()) {
        return Err<void>(head_result.error());
    }
    const auto& head = head_result.value();

    std::uint64_t to_skip = 0;
    if (head.status == 206) {
        // "bytes <start>-<end>/<total>"
        const auto range = head.header("content-range");
        const auto space = range.find(' ');
        const auto dash = range.find('-');
        const auto start = (space != std::string::npos && dash != std::string::npos && dash > space)
            ? parse_u64(range.substr(space + 1, dash - space - 1))
            : std::nullopt;
        if (!start || *start != offset) {
            return Err<void>(ErrorCode::InvalidArgument, "Unexpected Content-Range '" + range + "' from " + url);
        }
    } else if (head.status == 200) {
        to_skip = offset;
    } else {
        return status_to_error(head.status, url);
    }

    if (to_lower(head.header("transfer-encoding")).find("chunked") != std::string::npos) {
        return Err<void>(ErrorCode::InvalidArgument, "Chunked responses are not supported: " + url);
    }
    const auto content_length = parse_u64(head.header("content-length"));

    std::uint64_t received = 0;
    auto deliver = [&](const char* data, std::size_t size) -> Result<void> {
        received += size;
        if (to_skip > 0) {
            const auto skip = static_cast<std::size_t>(std::min<std::uint64_t>(to_skip, size));
            data += skip;
            size -= skip;
            to_skip -= skip;
        }
        if (size == 0) {
            return Ok();
        }
        return sink(data, size);
    };

    const auto leftover = connection.take_buffered();
    if (!leftover.empty()) {
        auto delivered = deliver(leftover.data(), leftover.size());
        if (delivered.is_error()) {
            return delivered;
        }
    }

    std::vector<char> chunk(chunk_size_);
    boost::system::error_code ec;
    while (!content_length || received < *content_length) {
        const std::size_t n = connection.read_some(chunk, ec);
        if (n > 0) {
            auto delivered = deliver(chunk.data(), n);
            if (delivered.is_error()) {
                return delivered;
            }
        }
        if (ec == asio::error::eof) {
            break;
        }
        if (ec) {
            return connection.failure("connection lost after " + std::to_string(received) + " bytes", ec);
        }
    }

    if (content_length && received < *content_length) {
        return Err<void>(ErrorCode::TransientNetwork,
                         "connection closed after " + std::to_string(received) + " of " +
                             std::to_string(*content_length) + " bytes");
    }
    return Ok();
}

} // namespace lsync::download
