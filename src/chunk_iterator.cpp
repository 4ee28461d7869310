#include "httpstream/chunk_iterator.hpp"
#include "httpstream/errors.hpp"
#include "httpstream/fetch_coordinator.hpp"
#include "httpstream/log.hpp"
#include "httpstream/metrics.hpp"

#include <algorithm>

namespace httpstream {

namespace {

// Error pages are kept for the exception, not streamed forever.
constexpr size_t MAX_ERROR_BODY = 64 * 1024;

// Compact pending data once this much has been consumed from its front.
constexpr size_t COMPACT_THRESHOLD = 64 * 1024;

}  // namespace

// ============================================================================
// ChunkReader
// ============================================================================

ChunkReader::ChunkReader(std::unique_ptr<StreamedBody> body, bool text, size_t chunk_size,
                         std::string delimiter, Charset charset, MetricsExporter* metrics)
    : body_(std::move(body))
    , text_(text)
    , chunk_size_(chunk_size)
    , delimiter_(std::move(delimiter))
    , metrics_(metrics) {
    if (text_) {
        decoder_.emplace(charset);
    }
}

bool ChunkReader::next(std::string& out) {
    while (true) {
        if (text_ ? take_line(out) : take_chunk(out)) {
            return true;
        }
        if (finished_) {
            // Whatever is left after the last terminator / full chunk
            if (head_ < pending_.size()) {
                out.assign(pending_, head_, std::string::npos);
                consume(pending_.size() - head_);
                return true;
            }
            return false;
        }
        pull();
    }
}

void ChunkReader::pull() {
    std::string raw;
    if (!body_->next(raw)) {
        finished_ = true;
        if (decoder_) {
            pending_ += decoder_->decode({}, true);
        }
        return;
    }

    if (metrics_) {
        metrics_->stream_bytes_total().Increment(static_cast<double>(raw.size()));
    }
    if (decoder_) {
        pending_ += decoder_->decode(raw);
    } else {
        pending_ += raw;
    }
}

bool ChunkReader::take_chunk(std::string& out) {
    if (pending_.size() - head_ < chunk_size_) {
        return false;
    }
    out.assign(pending_, head_, chunk_size_);
    consume(chunk_size_);
    return true;
}

bool ChunkReader::take_line(std::string& out) {
    size_t from = head_ + scan_;

    if (!delimiter_.empty()) {
        size_t pos = pending_.find(delimiter_, from);
        if (pos == std::string::npos) {
            // A delimiter may straddle the next piece; rescan its possible start.
            size_t avail = pending_.size() - head_;
            scan_ = avail >= delimiter_.size() ? avail - (delimiter_.size() - 1) : 0;
            return false;
        }
        out.assign(pending_, head_, pos - head_);
        consume(pos + delimiter_.size() - head_);
        return true;
    }

    size_t pos = pending_.find_first_of("\r\n", from);
    if (pos == std::string::npos) {
        scan_ = pending_.size() - head_;
        return false;
    }

    size_t terminator = 1;
    if (pending_[pos] == '\r') {
        if (pos + 1 == pending_.size() && !finished_) {
            // Could be the first half of \r\n
            scan_ = pos - head_;
            return false;
        }
        if (pos + 1 < pending_.size() && pending_[pos + 1] == '\n') {
            terminator = 2;
        }
    }

    out.assign(pending_, head_, pos - head_);
    consume(pos + terminator - head_);
    return true;
}

void ChunkReader::consume(size_t n) {
    head_ += n;
    scan_ = 0;
    if (head_ == pending_.size()) {
        pending_.clear();
        head_ = 0;
    } else if (head_ >= COMPACT_THRESHOLD && head_ * 2 >= pending_.size()) {
        pending_.erase(0, head_);
        head_ = 0;
    }
}

// ============================================================================
// ChunkRange
// ============================================================================

ChunkRange::iterator::iterator(std::shared_ptr<ChunkReader> reader)
    : reader_(std::move(reader)) {
    ++*this;
}

ChunkRange::iterator& ChunkRange::iterator::operator++() {
    if (reader_ && !reader_->next(current_)) {
        reader_.reset();
        current_.clear();
    }
    return *this;
}

ChunkRange::ChunkRange(std::shared_ptr<Transport> transport, std::string url,
                       StreamConfig config, MetricsExporter* metrics)
    : transport_(std::move(transport))
    , url_(std::move(url))
    , config_(std::move(config))
    , metrics_(metrics) {
    if (!transport_) {
        throw UsageError("chunk iteration requires a transport");
    }
    if (config_.chunk_size == 0) {
        throw UsageError("chunk_size must be > 0");
    }
}

ChunkRange::iterator ChunkRange::begin() const {
    log_debug("streaming GET %s", url_.c_str());

    auto body = transport_->open_stream(url_, config_.transport_options);
    int status = body->status_code();

    if (status == 0) {
        if (metrics_) metrics_->stream_requests_failure().Increment();
        FetchError err(url_, 0, {}, body->error());
        log_error("%s", err.what());
        throw err;
    }

    if (!is_success_status(status)) {
        std::string error_body;
        std::string piece;
        try {
            while (error_body.size() < MAX_ERROR_BODY && body->next(piece)) {
                error_body += piece;
            }
        } catch (const FetchError& e) {
            // The status is the error being reported; a broken error page is not.
            log_debug("error body of %s cut short: %s", url_.c_str(), e.what());
        }
        if (error_body.size() > MAX_ERROR_BODY) {
            error_body.resize(MAX_ERROR_BODY);
        }

        if (metrics_) metrics_->stream_requests_failure().Increment();
        FetchError err(url_, status, std::move(error_body));
        log_error("%s", err.what());
        throw err;
    }

    bool text = !is_binary(config_.mode);
    Charset charset = Charset::Utf8;
    if (text) {
        std::string encoding = effective_encoding(config_.encoding, body->headers());
        auto cs = lookup_charset(encoding);
        if (!cs) {
            if (metrics_) metrics_->stream_requests_failure().Increment();
            throw CodecError("unsupported encoding '" + encoding + "' for " + url_);
        }
        charset = *cs;
    }

    if (metrics_) metrics_->stream_requests_success().Increment();
    log_debug("streaming GET %s: HTTP %d (%s)", url_.c_str(), status,
              text ? charset_name(charset).c_str() : "binary");

    return iterator(std::make_shared<ChunkReader>(std::move(body), text, config_.chunk_size,
                                                  config_.delimiter, charset, metrics_));
}

}  // namespace httpstream
