#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

namespace httpstream {

enum class BufferKind {
    Binary,  // raw bytes; sizes count bytes
    Text     // UTF-8 text; read sizes count code points
};

enum class Whence {
    Set = 0,
    Cur = 1,
    End = 2
};

/// In-memory byte store that moves its content to an anonymous temporary
/// file once it grows past `max_memory` bytes. Reads, writes and seeks
/// behave the same before and after the move.
///
/// max_memory == 0 keeps everything in memory.
///
/// Invariant: 0 <= tell() <= size().
class SpoolBuffer {
public:
    SpoolBuffer(BufferKind kind, uint64_t max_memory,
                std::filesystem::path spool_dir = {});
    ~SpoolBuffer();

    SpoolBuffer(const SpoolBuffer&) = delete;
    SpoolBuffer& operator=(const SpoolBuffer&) = delete;

    /// Write at the cursor, overwriting and extending as needed.
    /// Returns the number of bytes written.
    size_t write(std::string_view data);

    /// Read up to `size` units from the cursor (bytes for Binary, code
    /// points for Text). A negative size reads to the end.
    std::string read(int64_t size = -1);

    /// Move the cursor. Negative targets throw UsageError; targets past the
    /// end are clamped to size().
    uint64_t seek(int64_t offset, Whence whence = Whence::Set);
    uint64_t tell() const;

    /// Current content length in bytes.
    uint64_t size() const;

    /// True when the content is empty. The cursor is left where it was.
    bool is_empty();

    void flush();

    /// Release memory and the spill file. Idempotent.
    void close();
    bool closed() const { return closed_; }

    BufferKind kind() const { return kind_; }
    bool rolled_over() const { return fd_ >= 0; }
    uint64_t max_memory() const { return max_memory_; }

private:
    void check_open(const char* op) const;
    void rollover();
    std::string read_bytes(uint64_t count);
    void write_file(const char* data, size_t len, uint64_t offset);
    size_t read_file(char* data, size_t len, uint64_t offset) const;

    BufferKind kind_;
    uint64_t max_memory_;
    std::filesystem::path spool_dir_;

    std::string memory_;  // used until rollover
    int fd_ = -1;         // spill file after rollover

    uint64_t pos_ = 0;
    uint64_t size_ = 0;
    bool closed_ = false;
};

}  // namespace httpstream
