#include "httpstream/open_mode.hpp"

namespace httpstream {

std::optional<OpenMode> parse_open_mode(const std::string& mode) {
    if (mode == "r" || mode == "rt") return OpenMode::ReadText;
    if (mode == "rb") return OpenMode::ReadBinary;
    if (mode == "w" || mode == "wt") return OpenMode::WriteText;
    if (mode == "wb") return OpenMode::WriteBinary;
    if (mode == "a" || mode == "at") return OpenMode::AppendText;
    if (mode == "ab") return OpenMode::AppendBinary;
    return std::nullopt;
}

const char* open_mode_to_string(OpenMode mode) {
    switch (mode) {
        case OpenMode::ReadText: return "r";
        case OpenMode::ReadBinary: return "rb";
        case OpenMode::WriteText: return "w";
        case OpenMode::WriteBinary: return "wb";
        case OpenMode::AppendText: return "a";
        case OpenMode::AppendBinary: return "ab";
    }
    return "r";
}

bool is_binary(OpenMode mode) {
    switch (mode) {
        case OpenMode::ReadBinary:
        case OpenMode::WriteBinary:
        case OpenMode::AppendBinary:
            return true;
        case OpenMode::ReadText:
        case OpenMode::WriteText:
        case OpenMode::AppendText:
            return false;
    }
    return false;
}

bool is_read(OpenMode mode) {
    return mode == OpenMode::ReadText || mode == OpenMode::ReadBinary;
}

bool is_write(OpenMode mode) {
    return mode == OpenMode::WriteText || mode == OpenMode::WriteBinary;
}

bool is_append(OpenMode mode) {
    return mode == OpenMode::AppendText || mode == OpenMode::AppendBinary;
}

bool commits_on_exit(OpenMode mode) {
    return is_write(mode) || is_append(mode);
}

}  // namespace httpstream
