#pragma once

#include "httpstream/http.hpp"
#include "httpstream/stream_config.hpp"
#include "httpstream/text_codec.hpp"

#include <cstddef>
#include <iterator>
#include <memory>
#include <optional>
#include <string>

namespace httpstream {

class MetricsExporter;

/// Turns the raw pieces of one streamed GET into fixed-size binary chunks
/// or text lines.
///
/// Binary: chunks of exactly chunk_size bytes, the last one possibly shorter.
/// Text: pieces are decoded incrementally to UTF-8 and split on `delimiter`,
/// or on \n, \r\n and \r when it is empty. Terminators are not included and
/// no empty piece is produced after a final terminator.
/// This holds for an explicit delimiter too: "a;b;" split on ";" yields "a",
/// "b" and no trailing "".
class ChunkReader {
public:
    ChunkReader(std::unique_ptr<StreamedBody> body, bool text, size_t chunk_size,
                std::string delimiter, Charset charset, MetricsExporter* metrics);

    /// Next chunk or line. Returns false at end of body.
    /// Throws FetchError (status 0) when the transfer breaks off.
    bool next(std::string& out);

private:
    void pull();
    bool take_chunk(std::string& out);
    bool take_line(std::string& out);
    void consume(size_t n);

    std::unique_ptr<StreamedBody> body_;
    bool text_;
    size_t chunk_size_;
    std::string delimiter_;
    std::optional<IncrementalDecoder> decoder_;
    MetricsExporter* metrics_;

    std::string pending_;
    size_t head_ = 0;   // start of unconsumed data in pending_
    size_t scan_ = 0;   // bytes after head_ already searched for a terminator
    bool finished_ = false;
};

/// Lazy, restartable sequence over a remote resource. Each begin() issues
/// its own streamed GET, independent of any RemoteStream buffer.
///
///     for (const auto& line : stream.chunks()) { ... }
class ChunkRange {
public:
    class iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = std::string;
        using difference_type = std::ptrdiff_t;
        using pointer = const std::string*;
        using reference = const std::string&;

        iterator() = default;

        reference operator*() const { return current_; }
        pointer operator->() const { return &current_; }

        iterator& operator++();
        iterator operator++(int) {
            iterator tmp = *this;
            ++*this;
            return tmp;
        }

        friend bool operator==(const iterator& a, const iterator& b) {
            return a.reader_ == b.reader_;
        }

    private:
        friend class ChunkRange;
        explicit iterator(std::shared_ptr<ChunkReader> reader);

        std::shared_ptr<ChunkReader> reader_;
        std::string current_;
    };

    ChunkRange(std::shared_ptr<Transport> transport, std::string url, StreamConfig config,
               MetricsExporter* metrics = nullptr);

    /// Open a new streamed request and position on its first item.
    /// Throws FetchError on a non-2xx status or transport failure.
    iterator begin() const;
    iterator end() const { return {}; }

private:
    std::shared_ptr<Transport> transport_;
    std::string url_;
    StreamConfig config_;
    MetricsExporter* metrics_;
};

}  // namespace httpstream
