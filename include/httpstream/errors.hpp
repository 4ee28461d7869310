#pragma once

#include <stdexcept>
#include <string>

namespace httpstream {

/// Base for everything the stream layer throws.
class StreamError : public std::runtime_error {
public:
    explicit StreamError(const std::string& message)
        : std::runtime_error(message) {}
};

/// A request that completed with a non-2xx status, or failed at the
/// transport level (status 0).
class HttpError : public StreamError {
public:
    HttpError(const std::string& what_prefix, const std::string& url,
              int status, std::string body, const std::string& detail = {});

    int status() const { return status_; }
    const std::string& body() const { return body_; }
    const std::string& url() const { return url_; }

    /// True when no HTTP status was received at all.
    bool is_network_error() const { return status_ == 0; }

private:
    std::string url_;
    int status_;
    std::string body_;
};

/// Whole-body or streamed GET failed.
class FetchError : public HttpError {
public:
    FetchError(const std::string& url, int status, std::string body,
               const std::string& detail = {})
        : HttpError("fetch failed", url, status, std::move(body), detail) {}
};

/// Commit POST at scope exit failed.
class UploadError : public HttpError {
public:
    UploadError(const std::string& url, int status, std::string body,
                const std::string& detail = {})
        : HttpError("upload failed", url, status, std::move(body), detail) {}
};

/// Operation not valid in the stream's current mode or state.
class UsageError : public StreamError {
public:
    explicit UsageError(const std::string& message) : StreamError(message) {}
};

/// Text that cannot be converted with the effective encoding.
class CodecError : public StreamError {
public:
    explicit CodecError(const std::string& message) : StreamError(message) {}
};

}  // namespace httpstream
