#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace httpstream {

bool is_success_status(int status);

// HTTP headers (case-insensitive)
class HttpHeaders {
public:
    void add(const std::string& name, const std::string& value);
    void clear() { headers_.clear(); }

    std::optional<std::string> get(const std::string& name) const;
    std::optional<std::string> content_type() const;

private:
    // Headers stored as lowercase name -> values
    std::map<std::string, std::vector<std::string>> headers_;

    static std::string normalize_name(const std::string& name);
};

struct HttpResponse {
    int status_code = 0;
    HttpHeaders headers;
    std::vector<uint8_t> body;

    std::chrono::milliseconds total_time{0};

    bool ok() const { return is_success_status(status_code); }
    std::string body_string() const;

    // Error info (for failed requests)
    std::string error;
    bool is_network_error = false;  // True if error was network-level, not HTTP status
};

/// Opaque key/value options handed to the transport unmodified.
/// See CurlTransport for the keys it understands.
using TransportOptions = std::map<std::string, std::string>;

/// Pull-based request body for streamed uploads.
class BodySource {
public:
    virtual ~BodySource() = default;

    /// Copy up to `max` bytes into `dst`. Returns 0 at end of body.
    virtual size_t read(char* dst, size_t max) = 0;

    /// Total size when known up front; empty means send chunked.
    virtual std::optional<uint64_t> size() const = 0;
};

/// Response of a streamed GET. Status and headers are available as soon
/// as the object exists; the body is pulled with next().
class StreamedBody {
public:
    virtual ~StreamedBody() = default;

    /// HTTP status, or 0 when the request failed before a response.
    virtual int status_code() const = 0;
    virtual const HttpHeaders& headers() const = 0;

    /// Transport error text when status_code() == 0.
    virtual const std::string& error() const = 0;

    /// Next raw piece of the body, of whatever size the network delivered.
    /// Returns false once the body is exhausted.
    virtual bool next(std::string& chunk) = 0;
};

/// Blocking HTTP transport used by RemoteStream.
///
/// Non-2xx statuses are returned, not thrown; network failures set
/// HttpResponse::is_network_error. Callers turn both into FetchError or
/// UploadError.
class Transport {
public:
    virtual ~Transport() = default;

    virtual std::string type_name() const = 0;

    /// Whole-body GET.
    virtual HttpResponse fetch(const std::string& url, const TransportOptions& options) = 0;

    /// Streamed GET; returns once the response status is known.
    virtual std::unique_ptr<StreamedBody> open_stream(const std::string& url,
                                                      const TransportOptions& options) = 0;

    /// Streamed POST of `body`.
    virtual HttpResponse post(const std::string& url, BodySource& body,
                              const TransportOptions& options) = 0;
};

}  // namespace httpstream
