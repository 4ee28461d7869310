#pragma once

#include "httpstream/http.hpp"
#include "httpstream/open_mode.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace httpstream {

/// Per-stream configuration. Every field has a usable default.
struct StreamConfig {
    OpenMode mode = OpenMode::ReadText;

    // Bytes held in memory before the buffer spills to disk (0 = never spill)
    uint64_t max_memory_bytes = 0;

    // Where spill files are created. Default: system temp directory
    std::filesystem::path spool_dir;

    // Text encoding. Empty = take the response charset, else utf-8
    std::string encoding;

    // Iteration
    size_t chunk_size = 8192;
    std::string delimiter;  // Text iteration only. Empty = \n, \r\n or \r

    // Upload what was written even when caller code failed inside a session
    bool commit_on_error = false;

    // Passed through to the transport unmodified
    TransportOptions transport_options;

    /// Load configuration from a JSON file, overlaying onto current values.
    bool load_json(const std::filesystem::path& path);

    /// Validate field values. Returns error message or empty string.
    std::string validate() const;
};

enum class ToolCommand {
    Get,     // print the body
    Put,     // upload input, replacing the resource
    Append,  // upload fetched content + input
    Lines,   // iterate text lines
    Chunks   // iterate binary chunks
};

std::optional<ToolCommand> parse_tool_command(const std::string& name);

/// Configuration for the httpstream command line tool.
struct ToolConfig {
    ToolCommand command = ToolCommand::Get;
    std::string url;

    StreamConfig stream;
    bool mode_given = false;  // --mode or "mode" in the JSON file

    // Input for put/append (default: stdin), output for get (default: stdout)
    std::filesystem::path input_path;
    std::filesystem::path output_path;

    bool verbose = false;

    // Prometheus metrics (textfile collector)
    std::filesystem::path metrics_file;
    size_t metrics_interval_secs = 15;

    /// Parse configuration from command line arguments.
    /// Returns empty optional on error (prints usage to stderr).
    static std::optional<ToolConfig> from_args(int argc, char* argv[]);

    /// Load configuration from a JSON file, overlaying onto current values.
    bool load_json(const std::filesystem::path& path);

    /// Pick the command's default mode when none was given.
    void apply_defaults();

    /// Validate required fields. Returns error message or empty string.
    std::string validate() const;
};

}  // namespace httpstream
