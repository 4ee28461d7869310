#include "httpstream/text_codec.hpp"
#include "httpstream/errors.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <utility>

#include <iconv.h>

namespace httpstream {

namespace {

constexpr const char* REPLACEMENT_CHAR = "\xEF\xBF\xBD";

std::string normalize_charset_name(std::string_view name) {
    std::string result;
    result.reserve(name.size());
    for (unsigned char c : name) {
        if (c == '_') c = '-';
        result += static_cast<char>(std::tolower(c));
    }
    return result;
}

bool is_continuation(unsigned char c) {
    return (c & 0xC0) == 0x80;
}

// Validity of the second byte of a multi-byte sequence, which also rules out
// overlong forms, surrogates and code points above U+10FFFF.
bool second_byte_ok(unsigned char lead, unsigned char second) {
    switch (lead) {
        case 0xE0: return second >= 0xA0 && second <= 0xBF;
        case 0xED: return second >= 0x80 && second <= 0x9F;
        case 0xF0: return second >= 0x90 && second <= 0xBF;
        case 0xF4: return second >= 0x80 && second <= 0x8F;
        default: return is_continuation(second);
    }
}

void append_utf8(std::string& out, uint32_t cp) {
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

// Copy valid UTF-8 from `in` to `out`, replacing malformed sequences.
// Returns the number of bytes consumed; when !final a trailing incomplete
// sequence is left unconsumed.
size_t sanitize_utf8(std::string_view in, bool final, std::string& out) {
    size_t i = 0;
    while (i < in.size()) {
        auto lead = static_cast<unsigned char>(in[i]);
        if (lead < 0x80) {
            out += static_cast<char>(lead);
            ++i;
            continue;
        }
        size_t len = utf8_sequence_length(lead);
        if (len == 1) {
            out += REPLACEMENT_CHAR;
            ++i;
            continue;
        }

        size_t avail = std::min(len, in.size() - i);
        size_t good = 1;
        if (avail >= 2 && second_byte_ok(lead, static_cast<unsigned char>(in[i + 1]))) {
            good = 2;
            while (good < avail && is_continuation(static_cast<unsigned char>(in[i + good]))) {
                ++good;
            }
        }

        if (good == len) {
            out.append(in.data() + i, len);
            i += len;
        } else if (good == avail && avail < len && !final) {
            // Truncated at the end of this piece; wait for more input.
            return i;
        } else {
            out += REPLACEMENT_CHAR;
            i += good;
        }
    }
    return i;
}

// Next code point of valid UTF-8. Advances `i`.
uint32_t next_code_point(std::string_view text, size_t& i) {
    auto lead = static_cast<unsigned char>(text[i]);
    size_t len = utf8_sequence_length(lead);
    if (len == 1 || i + len > text.size()) {
        ++i;
        return lead < 0x80 ? lead : 0xFFFD;
    }
    uint32_t cp = 0;
    switch (len) {
        case 2: cp = lead & 0x1F; break;
        case 3: cp = lead & 0x0F; break;
        default: cp = lead & 0x07; break;
    }
    for (size_t k = 1; k < len; ++k) {
        cp = (cp << 6) | (static_cast<unsigned char>(text[i + k]) & 0x3F);
    }
    i += len;
    return cp;
}

std::string unencodable_message(uint32_t cp, uint64_t offset, const Charset& charset) {
    char code[16];
    snprintf(code, sizeof(code), "U+%04X", static_cast<unsigned>(cp));
    return std::string("cannot encode character ") + code + " at byte " +
           std::to_string(offset) + " as " + charset_name(charset);
}

// Run `in` through `cd`, appending the output to `out`. Returns the number of
// input bytes consumed. Stops early on an invalid sequence (EILSEQ) or an
// incomplete one at the end of the input (EINVAL); `error` receives errno,
// or 0 when everything was converted.
size_t iconv_run(iconv_t cd, std::string_view in, std::string& out, int& error) {
    char* src = const_cast<char*>(in.data());
    size_t src_left = in.size();
    char buf[4096];
    error = 0;
    while (src_left > 0) {
        char* dst = buf;
        size_t dst_left = sizeof(buf);
        size_t rc = ::iconv(cd, &src, &src_left, &dst, &dst_left);
        int saved = errno;
        out.append(buf, static_cast<size_t>(dst - buf));
        if (rc == static_cast<size_t>(-1)) {
            if (saved == E2BIG) continue;
            error = saved;
            break;
        }
    }
    return in.size() - src_left;
}

// Emit whatever the converter needs to return to its initial shift state.
void iconv_flush(iconv_t cd, std::string& out) {
    char buf[64];
    char* dst = buf;
    size_t dst_left = sizeof(buf);
    ::iconv(cd, nullptr, nullptr, &dst, &dst_left);
    out.append(buf, static_cast<size_t>(dst - buf));
}

}  // namespace

// Owns one iconv_t conversion descriptor.
class IconvHandle {
public:
    IconvHandle(const std::string& to, const std::string& from)
        : cd_(iconv_open(to.c_str(), from.c_str())) {}

    ~IconvHandle() {
        if (ok()) iconv_close(cd_);
    }

    IconvHandle(const IconvHandle&) = delete;
    IconvHandle& operator=(const IconvHandle&) = delete;

    bool ok() const { return cd_ != reinterpret_cast<iconv_t>(-1); }
    iconv_t get() const { return cd_; }

private:
    iconv_t cd_;
};

namespace {

std::unique_ptr<IconvHandle> open_iconv(const Charset& charset, bool decoding) {
    if (charset.kind() != Charset::Iconv) return nullptr;
    auto handle = decoding ? std::make_unique<IconvHandle>("UTF-8", charset.iconv_name())
                           : std::make_unique<IconvHandle>(charset.iconv_name(), "UTF-8");
    if (!handle->ok()) {
        throw CodecError("unsupported charset: " + charset.iconv_name() + " (" +
                         std::strerror(errno) + ")");
    }
    return handle;
}

}  // namespace

std::optional<Charset> lookup_charset(std::string_view name) {
    auto n = normalize_charset_name(name);
    if (n == "utf-8" || n == "utf8") return Charset::Utf8;
    if (n == "ascii" || n == "us-ascii" || n == "ansi-x3.4-1968") return Charset::Ascii;
    if (n == "latin-1" || n == "latin1" || n == "iso-8859-1" || n == "iso8859-1" ||
        n == "l1" || n == "iso-ir-100") {
        return Charset::Latin1;
    }

    // iconv suffixes such as //TRANSLIT change error handling; not a charset
    if (name.empty() || name.find('/') != std::string_view::npos) return std::nullopt;

    std::string iconv_name(name);
    IconvHandle to_utf8("UTF-8", iconv_name);
    IconvHandle from_utf8(iconv_name, "UTF-8");
    if (!to_utf8.ok() || !from_utf8.ok()) return std::nullopt;
    return Charset::from_iconv(std::move(iconv_name));
}

std::string charset_name(const Charset& charset) {
    switch (charset.kind()) {
        case Charset::Utf8: return "utf-8";
        case Charset::Ascii: return "ascii";
        case Charset::Latin1: return "iso-8859-1";
        case Charset::Iconv: return charset.iconv_name();
    }
    return "utf-8";
}

std::optional<std::string> charset_from_content_type(std::string_view content_type) {
    size_t pos = 0;
    while ((pos = content_type.find(';', pos)) != std::string_view::npos) {
        ++pos;
        while (pos < content_type.size() && (content_type[pos] == ' ' || content_type[pos] == '\t')) {
            ++pos;
        }
        size_t eq = content_type.find('=', pos);
        if (eq == std::string_view::npos) break;

        auto key = normalize_charset_name(content_type.substr(pos, eq - pos));
        while (!key.empty() && (key.back() == ' ' || key.back() == '\t')) key.pop_back();
        if (key != "charset") continue;

        size_t end = content_type.find(';', eq + 1);
        std::string value(content_type.substr(eq + 1, end == std::string_view::npos
                                                           ? std::string_view::npos
                                                           : end - eq - 1));
        // Trim whitespace and quotes
        auto not_space = [](unsigned char c) { return !std::isspace(c) && c != '"' && c != '\''; };
        value.erase(value.begin(), std::find_if(value.begin(), value.end(), not_space));
        value.erase(std::find_if(value.rbegin(), value.rend(), not_space).base(), value.end());
        if (value.empty()) return std::nullopt;
        return value;
    }
    return std::nullopt;
}

size_t utf8_sequence_length(unsigned char lead) {
    if (lead < 0x80) return 1;
    if (lead >= 0xC2 && lead <= 0xDF) return 2;
    if (lead >= 0xE0 && lead <= 0xEF) return 3;
    if (lead >= 0xF0 && lead <= 0xF4) return 4;
    return 1;
}

size_t utf8_prefix_bytes(std::string_view text, size_t max_chars) {
    size_t i = 0;
    size_t chars = 0;
    while (i < text.size() && chars < max_chars) {
        size_t len = utf8_sequence_length(static_cast<unsigned char>(text[i]));
        if (i + len > text.size()) break;
        i += len;
        ++chars;
    }
    return i;
}

std::string decode_text(std::string_view bytes, const Charset& charset) {
    IncrementalDecoder decoder(charset);
    return decoder.decode(bytes, true);
}

std::string encode_text(std::string_view utf8, const Charset& charset) {
    IncrementalEncoder encoder(charset);
    return encoder.encode(utf8, true);
}

// ============================================================================
// IncrementalDecoder
// ============================================================================

IncrementalDecoder::IncrementalDecoder(Charset charset)
    : charset_(std::move(charset)), iconv_(open_iconv(charset_, true)) {}

IncrementalDecoder::~IncrementalDecoder() = default;

std::string IncrementalDecoder::decode(std::string_view piece, bool final) {
    std::string out;

    switch (charset_.kind()) {
        case Charset::Utf8: {
            std::string input;
            std::string_view view = piece;
            if (!carry_.empty()) {
                input = carry_;
                input.append(piece.data(), piece.size());
                view = input;
                carry_.clear();
            }
            out.reserve(view.size());
            size_t consumed = sanitize_utf8(view, final, out);
            carry_.assign(view.data() + consumed, view.size() - consumed);
            break;
        }
        case Charset::Ascii:
            out.reserve(piece.size());
            for (unsigned char c : piece) {
                if (c < 0x80) {
                    out += static_cast<char>(c);
                } else {
                    out += REPLACEMENT_CHAR;
                }
            }
            break;
        case Charset::Latin1:
            out.reserve(piece.size() * 2);
            for (unsigned char c : piece) {
                append_utf8(out, c);
            }
            break;
        case Charset::Iconv: {
            std::string input = std::move(carry_);
            carry_.clear();
            input.append(piece.data(), piece.size());
            std::string_view view = input;
            out.reserve(view.size() * 2);

            while (!view.empty()) {
                int error = 0;
                view.remove_prefix(iconv_run(iconv_->get(), view, out, error));
                if (error == 0) break;
                if (error == EILSEQ) {
                    out += REPLACEMENT_CHAR;
                    view.remove_prefix(1);
                } else if (error == EINVAL) {
                    // Sequence split at the end of this piece
                    if (final) {
                        out += REPLACEMENT_CHAR;
                    } else {
                        carry_.assign(view.data(), view.size());
                    }
                    break;
                } else {
                    throw CodecError("decoding " + charset_.iconv_name() + " failed: " +
                                     std::strerror(error));
                }
            }
            if (final) iconv_flush(iconv_->get(), out);
            break;
        }
    }

    return out;
}

// ============================================================================
// IncrementalEncoder
// ============================================================================

IncrementalEncoder::IncrementalEncoder(Charset charset)
    : charset_(std::move(charset)), iconv_(open_iconv(charset_, false)) {}

IncrementalEncoder::~IncrementalEncoder() = default;

std::string IncrementalEncoder::encode(std::string_view utf8, bool final) {
    std::string out;

    switch (charset_.kind()) {
        case Charset::Utf8:
            out.assign(utf8.data(), utf8.size());
            break;
        case Charset::Ascii:
        case Charset::Latin1: {
            const uint32_t limit = (charset_.kind() == Charset::Ascii) ? 0x7F : 0xFF;
            out.reserve(utf8.size());
            size_t i = 0;
            while (i < utf8.size()) {
                size_t start = i;
                uint32_t cp = next_code_point(utf8, i);
                if (cp > limit) {
                    throw CodecError(unencodable_message(cp, offset_ + start, charset_));
                }
                out += static_cast<char>(cp);
            }
            break;
        }
        case Charset::Iconv: {
            std::string input = std::move(carry_);
            carry_.clear();
            input.append(utf8.data(), utf8.size());
            std::string_view view = input;
            out.reserve(view.size());

            int error = 0;
            size_t used = iconv_run(iconv_->get(), view, out, error);
            if (error == EILSEQ) {
                size_t at = used;
                uint32_t cp = next_code_point(view, at);
                throw CodecError(unencodable_message(cp, offset_ + used, charset_));
            }
            if (error == EINVAL) {
                if (final) {
                    throw CodecError("incomplete UTF-8 sequence at byte " +
                                     std::to_string(offset_ + used));
                }
                carry_.assign(view.data() + used, view.size() - used);
            } else if (error != 0) {
                throw CodecError("encoding " + charset_.iconv_name() + " failed: " +
                                 std::strerror(error));
            }
            offset_ += used;
            if (final) iconv_flush(iconv_->get(), out);
            return out;
        }
    }

    offset_ += utf8.size();
    return out;
}

}  // namespace httpstream
