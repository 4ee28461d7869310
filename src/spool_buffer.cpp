#include "httpstream/spool_buffer.hpp"
#include "httpstream/errors.hpp"
#include "httpstream/log.hpp"
#include "httpstream/text_codec.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <system_error>
#include <unistd.h>

namespace httpstream {

namespace {

// Largest UTF-8 sequence; bounds how many bytes a text read can need.
constexpr uint64_t MAX_UTF8_BYTES = 4;

}  // namespace

SpoolBuffer::SpoolBuffer(BufferKind kind, uint64_t max_memory,
                         std::filesystem::path spool_dir)
    : kind_(kind)
    , max_memory_(max_memory)
    , spool_dir_(std::move(spool_dir)) {}

SpoolBuffer::~SpoolBuffer() {
    close();
}

void SpoolBuffer::check_open(const char* op) const {
    if (closed_) {
        throw UsageError(std::string(op) + " on closed buffer");
    }
}

size_t SpoolBuffer::write(std::string_view data) {
    check_open("write");
    if (data.empty()) return 0;

    if (fd_ >= 0) {
        write_file(data.data(), data.size(), pos_);
    } else {
        if (pos_ + data.size() > memory_.size()) {
            memory_.resize(pos_ + data.size());
        }
        std::memcpy(memory_.data() + pos_, data.data(), data.size());
    }

    pos_ += data.size();
    size_ = std::max(size_, pos_);

    if (fd_ < 0 && max_memory_ > 0 && size_ > max_memory_) {
        rollover();
    }
    return data.size();
}

std::string SpoolBuffer::read(int64_t size) {
    check_open("read");
    uint64_t remaining = size_ - pos_;

    if (size < 0) {
        return read_bytes(remaining);
    }
    if (kind_ == BufferKind::Binary) {
        return read_bytes(std::min<uint64_t>(static_cast<uint64_t>(size), remaining));
    }

    // Text: `size` counts code points. Over-read, then give back the tail.
    auto want = static_cast<uint64_t>(size);
    uint64_t span = (want > remaining / MAX_UTF8_BYTES) ? remaining : want * MAX_UTF8_BYTES;
    std::string data = read_bytes(span);

    size_t keep = utf8_prefix_bytes(data, want);
    if (keep == 0 && want > 0 && !data.empty()) {
        // Truncated or stray byte at the end; hand it out rather than stall.
        keep = 1;
    }
    pos_ -= data.size() - keep;
    data.resize(keep);
    return data;
}

uint64_t SpoolBuffer::seek(int64_t offset, Whence whence) {
    check_open("seek");

    int64_t base = 0;
    switch (whence) {
        case Whence::Set: base = 0; break;
        case Whence::Cur: base = static_cast<int64_t>(pos_); break;
        case Whence::End: base = static_cast<int64_t>(size_); break;
    }

    int64_t target = base + offset;
    if (target < 0) {
        throw UsageError("negative seek position " + std::to_string(target));
    }
    pos_ = std::min<uint64_t>(static_cast<uint64_t>(target), size_);
    return pos_;
}

uint64_t SpoolBuffer::tell() const {
    check_open("tell");
    return pos_;
}

uint64_t SpoolBuffer::size() const {
    return size_;
}

bool SpoolBuffer::is_empty() {
    uint64_t current = tell();
    bool empty = seek(0, Whence::End) == 0;
    seek(static_cast<int64_t>(current));
    return empty;
}

void SpoolBuffer::flush() {
    check_open("flush");
    // Writes to the spill file go straight through pwrite(); nothing is
    // held in user space.
}

void SpoolBuffer::close() {
    if (closed_) return;
    closed_ = true;
    memory_.clear();
    memory_.shrink_to_fit();
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
    pos_ = 0;
    size_ = 0;
}

void SpoolBuffer::rollover() {
    auto dir = spool_dir_.empty() ? std::filesystem::temp_directory_path() : spool_dir_;
    std::string tpl = (dir / "httpstream-spool-XXXXXX").string();

    int fd = mkstemp(tpl.data());
    if (fd < 0) {
        throw std::system_error(errno, std::generic_category(),
                                "cannot create spool file in " + dir.string());
    }
    // Anonymous from here on: the file disappears with the descriptor.
    unlink(tpl.c_str());
    fd_ = fd;

    try {
        write_file(memory_.data(), memory_.size(), 0);
    } catch (...) {
        ::close(fd_);
        fd_ = -1;
        throw;
    }

    log_debug("spool buffer rolled over to disk at %llu bytes (threshold %llu)",
              static_cast<unsigned long long>(size_),
              static_cast<unsigned long long>(max_memory_));

    memory_.clear();
    memory_.shrink_to_fit();
}

std::string SpoolBuffer::read_bytes(uint64_t count) {
    std::string out;
    if (count == 0) return out;

    if (fd_ >= 0) {
        out.resize(count);
        size_t got = read_file(out.data(), count, pos_);
        out.resize(got);
    } else {
        out.assign(memory_, pos_, count);
    }
    pos_ += out.size();
    return out;
}

void SpoolBuffer::write_file(const char* data, size_t len, uint64_t offset) {
    size_t done = 0;
    while (done < len) {
        ssize_t n = pwrite(fd_, data + done, len - done, static_cast<off_t>(offset + done));
        if (n < 0) {
            if (errno == EINTR) continue;
            throw std::system_error(errno, std::generic_category(), "spool file write failed");
        }
        done += static_cast<size_t>(n);
    }
}

size_t SpoolBuffer::read_file(char* data, size_t len, uint64_t offset) const {
    size_t done = 0;
    while (done < len) {
        ssize_t n = pread(fd_, data + done, len - done, static_cast<off_t>(offset + done));
        if (n < 0) {
            if (errno == EINTR) continue;
            throw std::system_error(errno, std::generic_category(), "spool file read failed");
        }
        if (n == 0) break;
        done += static_cast<size_t>(n);
    }
    return done;
}

}  // namespace httpstream
