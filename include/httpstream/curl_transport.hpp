#pragma once

#include "httpstream/http.hpp"

#include <chrono>
#include <memory>
#include <string>

namespace httpstream {

// libcurl transport configuration.
// The request timeout can be overridden with HTTPSTREAM_REQUEST_TIMEOUT
// (seconds) when left at its default.
struct CurlTransportConfig {
    std::chrono::milliseconds connect_timeout{30000};
    std::chrono::milliseconds total_timeout{300000};

    // Whole-body fetch limit (0 = unlimited)
    size_t max_response_size = 0;

    // Bytes a streamed GET may hold before the transfer is paused
    size_t stream_high_water = 1024 * 1024;

    // Idle easy handles kept for connection reuse
    size_t max_idle_handles = 8;

    bool verify_ssl = true;
    std::string ca_bundle;
    std::string proxy_url;
    std::string user_agent = "httpstream/1.0";

    bool follow_redirects = true;
    long max_redirects = 10;

    // curl's own verbose trace on stderr
    bool verbose = false;
};

/// Transport built on libcurl.
///
/// fetch() and post() run on a pooled easy handle. open_stream() drives a
/// private multi handle so that body pieces are pulled on demand.
///
/// Per-request options (TransportOptions keys):
///   timeout_ms, connect_timeout_ms   override the configured timeouts
///   verify_ssl                       "true" / "false"
///   ca_bundle                        CA bundle path
///   proxy                            proxy URL
///   user_agent                       User-Agent header
///   follow_redirects                 "true" / "false"
///   max_redirects                    integer
///   header.<Name>                    extra request header
/// Unknown keys are logged at debug level and ignored.
class CurlTransport : public Transport {
public:
    explicit CurlTransport(const CurlTransportConfig& config = {});
    ~CurlTransport() override;

    CurlTransport(const CurlTransport&) = delete;
    CurlTransport& operator=(const CurlTransport&) = delete;

    std::string type_name() const override { return "curl"; }

    HttpResponse fetch(const std::string& url, const TransportOptions& options) override;
    std::unique_ptr<StreamedBody> open_stream(const std::string& url,
                                              const TransportOptions& options) override;
    HttpResponse post(const std::string& url, BodySource& body,
                      const TransportOptions& options) override;

    const CurlTransportConfig& config() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

/// Process-wide CurlTransport with default configuration.
std::shared_ptr<Transport> default_transport();

}  // namespace httpstream
