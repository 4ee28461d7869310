#include "httpstream/remote_stream.hpp"
#include "httpstream/curl_transport.hpp"
#include "httpstream/metrics.hpp"
#include "httpstream/text_codec.hpp"

#include <algorithm>
#include <cstring>
#include <exception>

namespace httpstream {

namespace {

// Units (bytes or code points) pulled from the buffer per upload read
constexpr int64_t UPLOAD_READ_UNITS = 8192;

// Feeds the upload POST from a buffer, from its current cursor to the end,
// re-encoding text to the wire charset piece by piece.
class BufferBodySource : public BodySource {
public:
    BufferBodySource(SpoolBuffer& buffer, const std::optional<Charset>& encode_as,
                     std::optional<uint64_t> size)
        : buffer_(buffer)
        , size_(size) {
        if (encode_as) encoder_.emplace(*encode_as);
    }

    size_t read(char* dst, size_t max) override {
        try {
            while (staged_pos_ == staged_.size()) {
                if (drained_) return 0;
                std::string piece = buffer_.read(UPLOAD_READ_UNITS);
                if (piece.empty()) {
                    // End of buffer: flush the encoder's shift state, if any
                    drained_ = true;
                    staged_ = encoder_ ? encoder_->encode({}, true) : std::string();
                } else {
                    staged_ = encoder_ ? encoder_->encode(piece) : std::move(piece);
                }
                staged_pos_ = 0;
            }
            size_t n = std::min(max, staged_.size() - staged_pos_);
            std::memcpy(dst, staged_.data() + staged_pos_, n);
            staged_pos_ += n;
            sent_ += n;
            return n;
        } catch (const std::exception&) {
            // The transport may turn this into a plain abort; keep the cause.
            failure_ = std::current_exception();
            throw;
        }
    }

    std::optional<uint64_t> size() const override { return size_; }

    uint64_t bytes_sent() const { return sent_; }
    std::exception_ptr failure() const { return failure_; }

private:
    SpoolBuffer& buffer_;
    std::optional<IncrementalEncoder> encoder_;
    std::optional<uint64_t> size_;

    std::string staged_;
    size_t staged_pos_ = 0;
    bool drained_ = false;
    uint64_t sent_ = 0;
    std::exception_ptr failure_;
};

}  // namespace

const char* session_state_to_string(SessionState state) {
    switch (state) {
        case SessionState::Closed: return "closed";
        case SessionState::OpenForRead: return "open-for-read";
        case SessionState::OpenForWrite: return "open-for-write";
        case SessionState::OpenForAppend: return "open-for-append";
    }
    return "unknown";
}

RemoteStream::RemoteStream(std::string url, StreamConfig config)
    : RemoteStream(std::move(url), default_transport(), std::move(config)) {}

RemoteStream::RemoteStream(std::string url, std::shared_ptr<Transport> transport,
                           StreamConfig config)
    : url_(std::move(url))
    , transport_(std::move(transport))
    , config_(std::move(config)) {
    if (!transport_) {
        throw UsageError("RemoteStream requires a transport");
    }
    if (config_.chunk_size == 0) {
        throw UsageError("chunk_size must be > 0");
    }
    if (!config_.encoding.empty() && !lookup_charset(config_.encoding)) {
        throw CodecError("unsupported encoding: " + config_.encoding);
    }
    buffer_ = make_buffer();
}

RemoteStream::~RemoteStream() {
    if (session_ != SessionState::Closed && commits_on_exit(config_.mode)) {
        log_warn("%s destroyed with an open %s session; buffered data not uploaded",
                 url_.c_str(), open_mode_to_string(config_.mode));
    }
    release();
}

// --- Buffer helpers ---

SpoolBuffer& RemoteStream::buffer(const char* op) {
    if (closed_ || !buffer_) {
        throw UsageError(std::string(op) + " on closed stream " + url_);
    }
    return *buffer_;
}

const SpoolBuffer& RemoteStream::buffer(const char* op) const {
    if (closed_ || !buffer_) {
        throw UsageError(std::string(op) + " on closed stream " + url_);
    }
    return *buffer_;
}

std::unique_ptr<SpoolBuffer> RemoteStream::make_buffer() const {
    return std::make_unique<SpoolBuffer>(
        is_binary(config_.mode) ? BufferKind::Binary : BufferKind::Text,
        config_.max_memory_bytes, config_.spool_dir);
}

void RemoteStream::discard_buffer() {
    if (!buffer_) return;
    if (metrics_ && buffer_->rolled_over()) {
        metrics_->buffer_spills_total().Increment();
    }
    buffer_->close();
    buffer_.reset();
}

// Returns true when this call performed the fetch.
bool RemoteStream::ensure_fetched() {
    auto primed = fetch_.ensure_fetched(*transport_, url_, config_, metrics_);
    if (!primed) return false;
    discard_buffer();
    buffer_ = std::move(primed);
    return true;
}

// --- File interface ---

std::string RemoteStream::read(int64_t size) {
    buffer("read");
    if (!is_write(config_.mode)) {
        ensure_fetched();
    }
    return buffer_->read(size);
}

size_t RemoteStream::write(std::string_view data) {
    buffer("write");
    if (is_read(config_.mode)) {
        throw UsageError(std::string("write on ") + open_mode_to_string(config_.mode) +
                         "-mode stream " + url_);
    }
    if (is_append(config_.mode) && ensure_fetched()) {
        buffer_->seek(0, Whence::End);
    }
    return buffer_->write(data);
}

uint64_t RemoteStream::seek(int64_t offset, Whence whence) {
    return buffer("seek").seek(offset, whence);
}

uint64_t RemoteStream::tell() const {
    return buffer("tell").tell();
}

void RemoteStream::flush() {
    buffer("flush").flush();
}

bool RemoteStream::is_empty() {
    return buffer("is_empty").is_empty();
}

void RemoteStream::close() {
    if (closed_) return;
    if (session_ != SessionState::Closed) {
        log_debug("close() on %s with open session; releasing without upload", url_.c_str());
    }
    release();
}

void RemoteStream::release() {
    discard_buffer();
    fetch_.release();
    session_ = SessionState::Closed;
    closed_ = true;
}

// --- Scoped session ---

void RemoteStream::enter() {
    if (closed_) {
        throw UsageError("enter on closed stream " + url_);
    }
    if (session_ != SessionState::Closed) {
        throw UsageError(std::string("enter on stream already ") +
                         session_state_to_string(session_) + ": " + url_);
    }

    switch (config_.mode) {
        case OpenMode::ReadText:
        case OpenMode::ReadBinary:
            session_ = SessionState::OpenForRead;
            break;
        case OpenMode::WriteText:
        case OpenMode::WriteBinary:
            discard_buffer();
            buffer_ = make_buffer();
            fetch_.mark_fetched();
            session_ = SessionState::OpenForWrite;
            break;
        case OpenMode::AppendText:
        case OpenMode::AppendBinary:
            ensure_fetched();
            buffer_->seek(0, Whence::End);
            session_ = SessionState::OpenForAppend;
            break;
    }
    log_debug("%s: %s", url_.c_str(), session_state_to_string(session_));
}

void RemoteStream::exit(bool caller_failed) {
    if (session_ == SessionState::Closed) {
        throw UsageError("exit without an open session: " + url_);
    }

    // Release runs however the commit ends.
    struct ReleaseGuard {
        RemoteStream& stream;
        ~ReleaseGuard() { stream.release(); }
    } guard{*this};

    if (!commits_on_exit(config_.mode)) {
        return;
    }
    if (caller_failed && !config_.commit_on_error) {
        log_warn("discarding %llu buffered bytes for %s after failure in session",
                 static_cast<unsigned long long>(buffer_->size()), url_.c_str());
        return;
    }
    commit();
}

void RemoteStream::commit() {
    SpoolBuffer& buf = buffer("commit");
    buf.seek(0);

    std::optional<Charset> charset;
    std::optional<uint64_t> size;
    if (is_binary(config_.mode)) {
        size = buf.size();
    } else {
        std::string name = encoding();
        charset = lookup_charset(name);
        if (!charset) {
            throw CodecError("unsupported encoding '" + name + "' for upload to " + url_);
        }
        // Re-encoded length is only known up front when nothing changes.
        if (*charset == Charset::Utf8) size = buf.size();
    }

    BufferBodySource source(buf, charset, size);
    log_debug("POST %s: %llu buffered bytes%s", url_.c_str(),
              static_cast<unsigned long long>(buf.size()),
              buf.rolled_over() ? " (spooled)" : "");

    try {
        HttpResponse response;
        {
            std::optional<ScopedTimer> timer;
            if (metrics_) timer.emplace(metrics_->upload_duration());
            response = transport_->post(url_, source, config_.transport_options);
        }

        if (source.failure()) {
            std::rethrow_exception(source.failure());
        }
        if (response.is_network_error) {
            throw UploadError(url_, 0, {}, response.error);
        }
        if (!response.ok()) {
            throw UploadError(url_, response.status_code, response.body_string());
        }

        if (metrics_) {
            metrics_->uploads_success().Increment();
            metrics_->upload_bytes_total().Increment(static_cast<double>(source.bytes_sent()));
        }
        log_debug("POST %s: HTTP %d, %llu bytes in %lld ms", url_.c_str(), response.status_code,
                  static_cast<unsigned long long>(source.bytes_sent()),
                  static_cast<long long>(response.total_time.count()));
    } catch (const std::exception& e) {
        if (metrics_) metrics_->uploads_failure().Increment();
        log_error("%s", e.what());
        throw;
    }
}

// --- Iteration ---

ChunkRange RemoteStream::chunks() const {
    return ChunkRange(transport_, url_, config_, metrics_);
}

}  // namespace httpstream
