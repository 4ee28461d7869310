#include "httpstream/fetch_coordinator.hpp"
#include "httpstream/errors.hpp"
#include "httpstream/log.hpp"
#include "httpstream/metrics.hpp"
#include "httpstream/text_codec.hpp"

namespace httpstream {

std::string effective_encoding(const std::string& configured, const HttpHeaders& headers) {
    if (!configured.empty()) return configured;
    if (auto ct = headers.content_type()) {
        if (auto charset = charset_from_content_type(*ct)) {
            return *charset;
        }
    }
    return DEFAULT_ENCODING;
}

std::string FetchCoordinator::encoding(const std::string& configured) const {
    if (resource_) return resource_->encoding;
    return configured.empty() ? std::string(DEFAULT_ENCODING) : configured;
}

std::unique_ptr<SpoolBuffer> FetchCoordinator::ensure_fetched(Transport& transport,
                                                              const std::string& url,
                                                              const StreamConfig& config,
                                                              MetricsExporter* metrics) {
    if (failure_) {
        std::rethrow_exception(failure_);
    }
    if (state_ == FetchState::Fetched) {
        return nullptr;
    }

    log_debug("GET %s", url.c_str());

    HttpResponse response;
    {
        std::optional<ScopedTimer> timer;
        if (metrics) timer.emplace(metrics->fetch_duration());
        response = transport.fetch(url, config.transport_options);
    }

    try {
        if (response.is_network_error) {
            throw FetchError(url, 0, {}, response.error);
        }
        if (!response.ok()) {
            throw FetchError(url, response.status_code, response.body_string());
        }

        bool binary = is_binary(config.mode);
        std::string encoding = effective_encoding(config.encoding, response.headers);
        auto charset = lookup_charset(encoding);
        if (!binary && !charset) {
            throw CodecError("unsupported encoding '" + encoding + "' for " + url);
        }

        auto buffer = std::make_unique<SpoolBuffer>(
            binary ? BufferKind::Binary : BufferKind::Text,
            config.max_memory_bytes, config.spool_dir);

        std::string_view raw(reinterpret_cast<const char*>(response.body.data()),
                             response.body.size());
        if (binary) {
            buffer->write(raw);
        } else {
            buffer->write(decode_text(raw, *charset));
        }
        buffer->seek(0);

        FetchedResource resource;
        resource.status = response.status_code;
        resource.headers = response.headers;
        resource.content_type = response.headers.content_type().value_or("");
        resource.encoding = encoding;
        resource.body_bytes = response.body.size();
        resource_ = std::move(resource);
        state_ = FetchState::Fetched;

        if (metrics) {
            metrics->fetches_success().Increment();
            metrics->fetch_bytes_total().Increment(static_cast<double>(response.body.size()));
        }
        log_debug("GET %s: HTTP %d, %zu bytes in %lld ms%s", url.c_str(), response.status_code,
                  response.body.size(), static_cast<long long>(response.total_time.count()),
                  buffer->rolled_over() ? " (spooled to disk)" : "");
        return buffer;
    } catch (const StreamError& e) {
        failure_ = std::current_exception();
        if (metrics) metrics->fetches_failure().Increment();
        log_error("%s", e.what());
        throw;
    }
}

}  // namespace httpstream
