#pragma once

#include <optional>
#include <string>

namespace httpstream {

/// How a RemoteStream is opened. Decided once at construction.
enum class OpenMode {
    ReadText,
    ReadBinary,
    WriteText,
    WriteBinary,
    AppendText,
    AppendBinary
};

/// Parse a mode string: r, rb, rt, w, wb, wt, a, ab, at.
/// Returns empty optional for anything else.
std::optional<OpenMode> parse_open_mode(const std::string& mode);

const char* open_mode_to_string(OpenMode mode);

bool is_binary(OpenMode mode);
bool is_read(OpenMode mode);
bool is_write(OpenMode mode);
bool is_append(OpenMode mode);

/// True for write and append modes, which upload on scope exit.
bool commits_on_exit(OpenMode mode);

}  // namespace httpstream
