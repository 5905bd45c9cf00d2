/**
 * @file http_transport.h
 * @brief modelrt - HTTP Transport (internal)
 *
 * Range-capable transport used by the download manager. HttplibTransport is
 * the built-in client; AdapterTransport forwards to a transport supplied by
 * the binding through the platform adapter.
 */

#ifndef MRT_HTTP_TRANSPORT_H
#define MRT_HTTP_TRANSPORT_H

#include <functional>
#include <memory>
#include <string>

#include "mrt/core/mrt_platform_adapter.h"

namespace mrt {

struct HttpProbeResult {
    int64_t content_length = -1;
    bool accepts_ranges = false;
};

class HttpTransport {
   public:
    // Return false to abort before any body bytes
    using StatusHandler = std::function<bool(int status)>;
    // Return false to stop at this chunk boundary
    using ChunkHandler = std::function<bool(const uint8_t* data, size_t size)>;

    virtual ~HttpTransport() = default;

    virtual mrt_result_t probe(const std::string& url, HttpProbeResult* out) = 0;

    // MRT_SUCCESS when the response completed or a handler stopped it
    virtual mrt_result_t get(const std::string& url, int64_t offset, const StatusHandler& on_status,
                             const ChunkHandler& on_chunk) = 0;
};

class HttplibTransport : public HttpTransport {
   public:
    explicit HttplibTransport(int connect_timeout_sec = 15, int read_timeout_sec = 60);

    mrt_result_t probe(const std::string& url, HttpProbeResult* out) override;
    mrt_result_t get(const std::string& url, int64_t offset, const StatusHandler& on_status,
                     const ChunkHandler& on_chunk) override;

   private:
    int connect_timeout_sec_;
    int read_timeout_sec_;
};

class AdapterTransport : public HttpTransport {
   public:
    explicit AdapterTransport(const mrt_http_transport_t& transport) : transport_(transport) {}

    mrt_result_t probe(const std::string& url, HttpProbeResult* out) override;
    mrt_result_t get(const std::string& url, int64_t offset, const StatusHandler& on_status,
                     const ChunkHandler& on_chunk) override;

   private:
    mrt_http_transport_t transport_;
};

// The binding's transport when it supplied one, the built-in client otherwise
std::shared_ptr<HttpTransport> make_http_transport(const mrt_http_transport_t* adapter_transport);

}  // namespace mrt

#endif  // MRT_HTTP_TRANSPORT_H
