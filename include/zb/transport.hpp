#pragma once

#include <zb/result.hpp>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>

namespace zb {

// Byte source for bottle downloads. Implementations must be safe to call
// from several threads at once.
class Transport {
public:
    // Receives body chunks in order; return false to abort the transfer
    using ChunkSink = std::function<bool(const uint8_t* data, size_t len)>;

    virtual ~Transport() = default;

    // Stream the body at `url` into `sink`.
    // Errors: Timeout, TransportFailure.
    virtual Status get(const std::string& url, const ChunkSink& sink) = 0;
};

struct TransportOptions {
    long connect_timeout_s = 30;
    long timeout_s = 300;            // whole transfer, 0 = none
    std::string user_agent = "zb/0.1";
};

// libcurl-backed transport; handles http(s) and file:// URLs
class CurlTransport : public Transport {
public:
    explicit CurlTransport(TransportOptions opts = {});

    Status get(const std::string& url, const ChunkSink& sink) override;

private:
    TransportOptions opts_;
};

} // namespace zb
