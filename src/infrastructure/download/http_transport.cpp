/**
 * @file http_transport.cpp
 * @brief modelrt - HTTP Transport Implementation
 */

#include "infrastructure/download/http_transport.h"

#include <httplib.h>

#include <cstdlib>
#include <string>

#include "mrt/core/mrt_error.h"
#include "mrt/core/mrt_logger.h"

namespace mrt {

namespace {

struct ParsedUrl {
    std::string origin;  // scheme://host[:port]
    std::string path;
};

bool parse_url(const std::string& url, ParsedUrl* out) {
    auto scheme_end = url.find("://");
    if (scheme_end == std::string::npos) {
        return false;
    }
    std::string scheme = url.substr(0, scheme_end);
    if (scheme != "http" && scheme != "https") {
        return false;
    }
    auto path_start = url.find('/', scheme_end + 3);
    if (path_start == std::string::npos) {
        out->origin = url;
        out->path = "/";
    } else {
        out->origin = url.substr(0, path_start);
        out->path = url.substr(path_start);
    }
    return out->origin.size() > scheme_end + 3;
}

mrt_result_t invalid_url(const std::string& url) {
    std::string details = "Unsupported URL: " + url;
    mrt_error_set_details(details.c_str());
    return MRT_ERROR_INVALID_ARGUMENT;
}

}  // namespace

// =============================================================================
// HTTPLIB TRANSPORT
// =============================================================================

HttplibTransport::HttplibTransport(int connect_timeout_sec, int read_timeout_sec)
    : connect_timeout_sec_(connect_timeout_sec), read_timeout_sec_(read_timeout_sec) {}

mrt_result_t HttplibTransport::probe(const std::string& url, HttpProbeResult* out) {
    ParsedUrl parsed;
    if (!parse_url(url, &parsed)) {
        return invalid_url(url);
    }

    httplib::Client client(parsed.origin);
    client.set_follow_location(true);
    client.set_connection_timeout(connect_timeout_sec_, 0);
    client.set_read_timeout(read_timeout_sec_, 0);

    auto res = client.Head(parsed.path);
    if (!res) {
        std::string details = "HEAD " + url + " failed: " + httplib::to_string(res.error());
        mrt_error_set_details(details.c_str());
        MRT_LOG_WARNING("Download", "%s", details.c_str());
        return MRT_ERROR_NETWORK;
    }
    if (res->status < 200 || res->status >= 300) {
        std::string details = "HEAD " + url + " returned HTTP " + std::to_string(res->status);
        mrt_error_set_details(details.c_str());
        return MRT_ERROR_NETWORK;
    }

    out->content_length = -1;
    if (res->has_header("Content-Length")) {
        out->content_length = std::strtoll(res->get_header_value("Content-Length").c_str(),
                                           nullptr, 10);
    }
    out->accepts_ranges = res->get_header_value("Accept-Ranges") == "bytes";
    return MRT_SUCCESS;
}

mrt_result_t HttplibTransport::get(const std::string& url, int64_t offset,
                                   const StatusHandler& on_status, const ChunkHandler& on_chunk) {
    ParsedUrl parsed;
    if (!parse_url(url, &parsed)) {
        return invalid_url(url);
    }

    httplib::Client client(parsed.origin);
    client.set_follow_location(true);
    client.set_connection_timeout(connect_timeout_sec_, 0);
    client.set_read_timeout(read_timeout_sec_, 0);

    httplib::Headers headers;
    if (offset > 0) {
        headers.emplace("Range", "bytes=" + std::to_string(offset) + "-");
    }

    auto res = client.Get(
        parsed.path, headers,
        [&on_status](const httplib::Response& response) { return on_status(response.status); },
        [&on_chunk](const char* data, size_t length) {
            return on_chunk(reinterpret_cast<const uint8_t*>(data), length);
        });

    if (!res) {
        if (res.error() == httplib::Error::Canceled) {
            return MRT_SUCCESS;
        }
        std::string details = "GET " + url + " failed: " + httplib::to_string(res.error());
        mrt_error_set_details(details.c_str());
        MRT_LOG_WARNING("Download", "%s", details.c_str());
        return MRT_ERROR_NETWORK;
    }
    return MRT_SUCCESS;
}

// =============================================================================
// ADAPTER TRANSPORT
// =============================================================================

namespace {

struct SinkContext {
    const HttpTransport::StatusHandler* on_status;
    const HttpTransport::ChunkHandler* on_chunk;
};

mrt_bool_t status_trampoline(int32_t status, void* sink_user_data) {
    auto* sink = static_cast<SinkContext*>(sink_user_data);
    return (*sink->on_status)(status) ? MRT_TRUE : MRT_FALSE;
}

mrt_bool_t chunk_trampoline(const uint8_t* data, size_t size, void* sink_user_data) {
    auto* sink = static_cast<SinkContext*>(sink_user_data);
    return (*sink->on_chunk)(data, size) ? MRT_TRUE : MRT_FALSE;
}

}  // namespace

mrt_result_t AdapterTransport::probe(const std::string& url, HttpProbeResult* out) {
    if (transport_.probe == nullptr) {
        return MRT_ERROR_NOT_SUPPORTED;
    }
    int64_t length = -1;
    mrt_bool_t ranges = MRT_FALSE;
    mrt_result_t rc = transport_.probe(url.c_str(), &length, &ranges, transport_.user_data);
    if (rc != MRT_SUCCESS) {
        return rc;
    }
    out->content_length = length;
    out->accepts_ranges = ranges == MRT_TRUE;
    return MRT_SUCCESS;
}

mrt_result_t AdapterTransport::get(const std::string& url, int64_t offset,
                                   const StatusHandler& on_status, const ChunkHandler& on_chunk) {
    if (transport_.get == nullptr) {
        return MRT_ERROR_NOT_SUPPORTED;
    }
    SinkContext sink{&on_status, &on_chunk};
    return transport_.get(url.c_str(), offset, status_trampoline, chunk_trampoline, &sink,
                          transport_.user_data);
}

std::shared_ptr<HttpTransport> make_http_transport(const mrt_http_transport_t* adapter_transport) {
    if (adapter_transport != nullptr && adapter_transport->probe != nullptr &&
        adapter_transport->get != nullptr) {
        return std::make_shared<AdapterTransport>(*adapter_transport);
    }
    return std::make_shared<HttplibTransport>();
}

}  // namespace mrt
