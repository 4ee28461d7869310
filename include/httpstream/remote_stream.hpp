#pragma once

#include "httpstream/chunk_iterator.hpp"
#include "httpstream/errors.hpp"
#include "httpstream/fetch_coordinator.hpp"
#include "httpstream/http.hpp"
#include "httpstream/log.hpp"
#include "httpstream/open_mode.hpp"
#include "httpstream/spool_buffer.hpp"
#include "httpstream/stream_config.hpp"

#include <cstdint>
#include <exception>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

namespace httpstream {

class MetricsExporter;

enum class SessionState {
    Closed,
    OpenForRead,
    OpenForWrite,
    OpenForAppend
};

const char* session_state_to_string(SessionState state);

/// File-like handle on one remote HTTP resource.
///
/// read/write/seek/tell work on a local SpoolBuffer. The first read() pulls
/// the whole body with one GET; later reads never touch the network. Write
/// and append modes upload the buffer with one POST when the session exits.
///
/// Session lifecycle (enter/exit, or with_session()):
///   r/rb  enter: nothing.            exit: release.
///   w/wb  enter: fresh empty buffer. exit: POST buffer, release.
///   a/ab  enter: fetch, seek to end. exit: POST buffer, release.
/// Release always runs, whether the POST or the caller's code failed.
///
/// chunks() streams the resource with its own request and never sees or
/// fills the buffer.
///
/// Not thread-safe.
class RemoteStream {
public:
    /// Uses default_transport().
    explicit RemoteStream(std::string url, StreamConfig config = {});
    RemoteStream(std::string url, std::shared_ptr<Transport> transport, StreamConfig config = {});

    /// Releases the buffer. Never uploads.
    ~RemoteStream();

    RemoteStream(const RemoteStream&) = delete;
    RemoteStream& operator=(const RemoteStream&) = delete;

    // --- File interface ---

    /// Read up to `size` units (bytes, or code points in text modes); -1 reads
    /// to the end. Fetches on first use except in write modes.
    std::string read(int64_t size = -1);

    /// Write at the cursor. Throws UsageError in read modes. In append mode
    /// the existing content is fetched first so writes land after it.
    size_t write(std::string_view data);

    uint64_t seek(int64_t offset, Whence whence = Whence::Set);
    uint64_t tell() const;
    void flush();

    /// True when the buffer holds nothing; the cursor is not moved.
    bool is_empty();

    /// Release the buffer without uploading. Idempotent.
    void close();
    bool closed() const { return closed_; }

    // --- Scoped session ---

    void enter();

    /// Commit (write/append) and release. With caller_failed the commit is
    /// skipped unless commit_on_error is set. Throws UploadError after the
    /// release when the POST fails.
    void exit(bool caller_failed = false);

    SessionState session_state() const { return session_; }

    // --- Iteration ---

    /// Chunks (binary modes) or lines (text modes) of a fresh streamed GET.
    ChunkRange chunks() const;

    /// Record into `metrics` (not owned; may be nullptr).
    void set_metrics(MetricsExporter* metrics) { metrics_ = metrics; }

    const std::string& url() const { return url_; }
    OpenMode mode() const { return config_.mode; }
    const StreamConfig& config() const { return config_; }
    FetchState fetch_state() const { return fetch_.state(); }

    /// Effective text encoding: fetched response, configured, or default.
    std::string encoding() const { return fetch_.encoding(config_.encoding); }

    /// Metadata of the fetched response, until release.
    const std::optional<FetchedResource>& resource() const { return fetch_.resource(); }

private:
    SpoolBuffer& buffer(const char* op);
    const SpoolBuffer& buffer(const char* op) const;
    std::unique_ptr<SpoolBuffer> make_buffer() const;
    void discard_buffer();
    bool ensure_fetched();
    void commit();
    void release();

    std::string url_;
    std::shared_ptr<Transport> transport_;
    StreamConfig config_;

    std::unique_ptr<SpoolBuffer> buffer_;
    FetchCoordinator fetch_;
    SessionState session_ = SessionState::Closed;
    bool closed_ = false;

    MetricsExporter* metrics_ = nullptr;
};

/// Run `fn(stream)` inside an enter()/exit() session.
///
/// If `fn` throws, exit(true) runs and the exception is rethrown; any failure
/// during that exit is logged, not substituted for it. Otherwise exit() runs
/// and its UploadError, if any, propagates.
template <class Fn>
auto with_session(RemoteStream& stream, Fn&& fn) -> std::invoke_result_t<Fn, RemoteStream&> {
    using Result = std::invoke_result_t<Fn, RemoteStream&>;

    auto exit_after_failure = [&stream] {
        try {
            stream.exit(true);
        } catch (const std::exception& e) {
            log_error("release after failure in session for %s: %s",
                      stream.url().c_str(), e.what());
        }
    };

    stream.enter();
    if constexpr (std::is_void_v<Result>) {
        try {
            std::forward<Fn>(fn)(stream);
        } catch (...) {
            exit_after_failure();
            throw;
        }
        stream.exit();
    } else {
        std::optional<Result> result;
        try {
            result.emplace(std::forward<Fn>(fn)(stream));
        } catch (...) {
            exit_after_failure();
            throw;
        }
        stream.exit();
        return std::move(*result);
    }
}

}  // namespace httpstream
