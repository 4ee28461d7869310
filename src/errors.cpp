#include "httpstream/errors.hpp"

namespace httpstream {

namespace {

// Keep exception messages readable when a server returns a large error page.
constexpr size_t MAX_BODY_IN_MESSAGE = 256;

std::string format_http_error(const std::string& what_prefix, const std::string& url,
                              int status, const std::string& body,
                              const std::string& detail) {
    std::string msg = what_prefix + ": " + url;
    if (status != 0) {
        msg += " (HTTP " + std::to_string(status) + ")";
    }
    if (!detail.empty()) {
        msg += ": " + detail;
    }
    if (!body.empty()) {
        msg += ": ";
        if (body.size() > MAX_BODY_IN_MESSAGE) {
            msg.append(body, 0, MAX_BODY_IN_MESSAGE);
            msg += "...";
        } else {
            msg += body;
        }
    }
    return msg;
}

}  // namespace

HttpError::HttpError(const std::string& what_prefix, const std::string& url,
                     int status, std::string body, const std::string& detail)
    : StreamError(format_http_error(what_prefix, url, status, body, detail))
    , url_(url)
    , status_(status)
    , body_(std::move(body)) {}

}  // namespace httpstream
