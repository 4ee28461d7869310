#pragma once

#include "httpstream/http.hpp"
#include "httpstream/spool_buffer.hpp"
#include "httpstream/stream_config.hpp"

#include <exception>
#include <memory>
#include <optional>
#include <string>

namespace httpstream {

class MetricsExporter;

enum class FetchState {
    NotFetched,
    Fetched
};

/// Response metadata captured on the NotFetched -> Fetched transition.
struct FetchedResource {
    int status = 0;
    HttpHeaders headers;
    std::string content_type;
    std::string encoding;     // effective encoding, never empty
    uint64_t body_bytes = 0;  // raw bytes received
};

/// Effective text encoding: the configured name, else the Content-Type
/// charset, else DEFAULT_ENCODING.
std::string effective_encoding(const std::string& configured, const HttpHeaders& headers);

/// At-most-once whole-body GET for one RemoteStream.
///
/// The first ensure_fetched() performs the request and hands back a buffer
/// primed with the body (cursor at 0). Every later call returns nullptr
/// without touching the network. A failed fetch is remembered and rethrown
/// by later calls; the stream stays NotFetched and no buffer is produced.
class FetchCoordinator {
public:
    std::unique_ptr<SpoolBuffer> ensure_fetched(Transport& transport, const std::string& url,
                                                const StreamConfig& config,
                                                MetricsExporter* metrics);

    /// Force Fetched without a request (write mode never reads the target).
    void mark_fetched() { state_ = FetchState::Fetched; }

    /// Drop response metadata at release. The state stays Fetched.
    void release() { resource_.reset(); }

    FetchState state() const { return state_; }
    const std::optional<FetchedResource>& resource() const { return resource_; }

    /// Encoding of the fetched response, or `configured` / the default when
    /// nothing was fetched.
    std::string encoding(const std::string& configured) const;

private:
    FetchState state_ = FetchState::NotFetched;
    std::optional<FetchedResource> resource_;
    std::exception_ptr failure_;
};

}  // namespace httpstream
