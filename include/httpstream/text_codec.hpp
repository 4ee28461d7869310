#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace httpstream {

class IconvHandle;

// Text buffers hold UTF-8. Conversion to and from the wire charset happens
// when a body is fetched, streamed, or uploaded.
//
// utf-8, ascii and latin-1 are converted in-tree. Every other charset name
// that iconv(3) knows (windows-1252, iso-8859-15, utf-16, shift_jis, ...)
// goes through iconv.
class Charset {
public:
    enum Kind {
        Utf8,
        Ascii,
        Latin1,
        Iconv
    };

    Charset(Kind kind) : kind_(kind) {}

    /// Charset converted by iconv; `name` is handed to iconv_open() as is.
    static Charset from_iconv(std::string name) {
        Charset c(Iconv);
        c.iconv_name_ = std::move(name);
        return c;
    }

    Kind kind() const { return kind_; }
    const std::string& iconv_name() const { return iconv_name_; }

    friend bool operator==(const Charset& a, const Charset& b) {
        return a.kind_ == b.kind_ && a.iconv_name_ == b.iconv_name_;
    }

private:
    Kind kind_;
    std::string iconv_name_;
};

constexpr const char* DEFAULT_ENCODING = "utf-8";

/// Look up a charset by name (case-insensitive). "utf8", "latin-1",
/// "ISO-8859-1", "us-ascii" and similar aliases map to the built-in
/// charsets; other names are accepted when iconv can convert them to and
/// from UTF-8.
std::optional<Charset> lookup_charset(std::string_view name);

/// Canonical lowercase name of a built-in charset, or the iconv name.
std::string charset_name(const Charset& charset);

/// Extract the charset parameter from a Content-Type header value.
/// "text/plain; charset=\"ISO-8859-1\"" -> "ISO-8859-1".
std::optional<std::string> charset_from_content_type(std::string_view content_type);

/// Decode a complete body to UTF-8. Malformed input becomes U+FFFD.
std::string decode_text(std::string_view bytes, const Charset& charset);

/// Encode UTF-8 text to the charset. Throws CodecError for characters the
/// charset cannot represent.
std::string encode_text(std::string_view utf8, const Charset& charset);

/// Number of bytes of a UTF-8 sequence starting with this lead byte
/// (1 for stray continuation or invalid bytes).
size_t utf8_sequence_length(unsigned char lead);

/// Byte length of the longest prefix of `text` holding at most `max_chars`
/// code points.
size_t utf8_prefix_bytes(std::string_view text, size_t max_chars);

/// Decodes a body that arrives in pieces. A multi-byte sequence split across
/// two pieces is held back until the rest arrives.
class IncrementalDecoder {
public:
    /// Throws CodecError when iconv cannot open the charset.
    explicit IncrementalDecoder(Charset charset);
    ~IncrementalDecoder();

    IncrementalDecoder(const IncrementalDecoder&) = delete;
    IncrementalDecoder& operator=(const IncrementalDecoder&) = delete;

    /// Decode the next piece. Pass final=true for the last one so a
    /// dangling partial sequence is flushed as U+FFFD.
    std::string decode(std::string_view piece, bool final = false);

    const Charset& charset() const { return charset_; }

private:
    Charset charset_;
    std::unique_ptr<IconvHandle> iconv_;
    std::string carry_;
};

/// Encodes UTF-8 text handed over in pieces. Stateful charsets (a utf-16
/// byte order mark, shift sequences) are handled once for the whole text.
class IncrementalEncoder {
public:
    /// Throws CodecError when iconv cannot open the charset.
    explicit IncrementalEncoder(Charset charset);
    ~IncrementalEncoder();

    IncrementalEncoder(const IncrementalEncoder&) = delete;
    IncrementalEncoder& operator=(const IncrementalEncoder&) = delete;

    /// Encode the next piece; final=true flushes any shift state. Throws
    /// CodecError for characters the charset cannot represent.
    std::string encode(std::string_view utf8, bool final = false);

    const Charset& charset() const { return charset_; }

private:
    Charset charset_;
    std::unique_ptr<IconvHandle> iconv_;
    std::string carry_;
    uint64_t offset_ = 0;  // UTF-8 bytes consumed so far, for error messages
};

}  // namespace httpstream
