#include "httpstream/stream_config.hpp"
#include "httpstream/text_codec.hpp"

#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <nlohmann/json.hpp>

namespace httpstream {

namespace {

// Overlay the stream keys of a parsed config document onto `config`.
// Throws on malformed values; callers report the message.
void apply_stream_json(const nlohmann::json& j, StreamConfig& config) {
    if (j.contains("mode")) {
        auto name = j["mode"].get<std::string>();
        auto mode = parse_open_mode(name);
        if (!mode) throw std::invalid_argument("invalid mode: " + name);
        config.mode = *mode;
    }
    if (j.contains("max_memory_bytes")) config.max_memory_bytes = j["max_memory_bytes"].get<uint64_t>();
    if (j.contains("max_memory_mb"))
        config.max_memory_bytes = j["max_memory_mb"].get<uint64_t>() * 1024ULL * 1024;
    if (j.contains("spool_dir")) config.spool_dir = j["spool_dir"].get<std::string>();
    if (j.contains("encoding")) config.encoding = j["encoding"].get<std::string>();
    if (j.contains("chunk_size")) config.chunk_size = j["chunk_size"].get<size_t>();
    if (j.contains("delimiter")) config.delimiter = j["delimiter"].get<std::string>();
    if (j.contains("commit_on_error")) config.commit_on_error = j["commit_on_error"].get<bool>();

    // Transport options: strings are taken as-is, other scalars in JSON form
    if (j.contains("options") && j["options"].is_object()) {
        for (auto& [key, val] : j["options"].items()) {
            config.transport_options[key] = val.is_string() ? val.get<std::string>() : val.dump();
        }
    }
}

std::optional<nlohmann::json> read_json_file(const std::filesystem::path& path) {
    std::ifstream ifs(path);
    if (!ifs) {
        std::cerr << "Error: cannot open config file: " << path << "\n";
        return std::nullopt;
    }
    return nlohmann::json::parse(ifs);
}

bool parse_number(const char* value, const char* name, uint64_t& out) {
    try {
        size_t used = 0;
        std::string s = value;
        unsigned long long n = std::stoull(s, &used);
        if (used != s.size() || s[0] == '-') throw std::invalid_argument(s);
        out = n;
        return true;
    } catch (const std::exception&) {
        std::cerr << "Error: " << name << " expects a non-negative integer, got '" << value << "'\n";
        return false;
    }
}

// "\n", "\r", "\t" and "\\" escapes, so a delimiter can be given on a shell line
std::string unescape(const std::string& in) {
    std::string out;
    for (size_t i = 0; i < in.size(); ++i) {
        if (in[i] == '\\' && i + 1 < in.size()) {
            char c = in[++i];
            switch (c) {
                case 'n': out += '\n'; break;
                case 'r': out += '\r'; break;
                case 't': out += '\t'; break;
                case '\\': out += '\\'; break;
                default: out += '\\'; out += c; break;
            }
        } else {
            out += in[i];
        }
    }
    return out;
}

void print_usage() {
    std::cerr <<
        "Usage: httpstream <command> <url> [options]\n"
        "\n"
        "Commands:\n"
        "  get                              Print the resource body\n"
        "  put                              Upload input, replacing the resource\n"
        "  append                           Append input to the resource\n"
        "  lines                            Stream the resource as text lines\n"
        "  chunks                           Stream the resource as binary chunks, printing sizes\n"
        "\n"
        "Stream options:\n"
        "  --mode <r|rb|w|wb|a|ab>          Open mode (default depends on the command)\n"
        "  --memory-threshold <bytes>       Spill the buffer to disk past this size (default: 0, never)\n"
        "  --spool-dir <path>               Directory for spill files (default: system temp)\n"
        "  --encoding <name>                Text encoding, any iconv name (default: from response)\n"
        "  --chunk-size <N>                 Iteration chunk size (default: 8192)\n"
        "  --delimiter <str>                Line delimiter for 'lines' (\\n, \\r, \\t escapes allowed)\n"
        "  --commit-on-error                Upload partial data when input fails mid-way\n"
        "  --option <key=value>             Transport option (repeatable), e.g. timeout_ms=5000\n"
        "\n"
        "Tool options:\n"
        "  --config <path>                  JSON config file\n"
        "  --input <path>                   Input for put/append (default: stdin)\n"
        "  --output <path>                  Output for get/lines (default: stdout)\n"
        "  --metrics-file <path>            Prometheus .prom file for node_exporter textfile collector\n"
        "  --metrics-interval <secs>        Metrics write interval (default: 15)\n"
        "  --verbose                        Verbose output\n"
        "  --help                           Show this help\n";
}

}  // namespace

// --- StreamConfig ---

bool StreamConfig::load_json(const std::filesystem::path& path) {
    try {
        auto j = read_json_file(path);
        if (!j) return false;
        apply_stream_json(*j, *this);
        return true;
    } catch (const std::exception& e) {
        std::cerr << "Error parsing config: " << e.what() << "\n";
        return false;
    }
}

std::string StreamConfig::validate() const {
    if (chunk_size == 0) return "chunk_size must be > 0";
    if (!encoding.empty() && !lookup_charset(encoding)) return "unsupported encoding: " + encoding;
    if (!spool_dir.empty()) {
        if (!std::filesystem::exists(spool_dir)) return "spool_dir does not exist: " + spool_dir.string();
        if (!std::filesystem::is_directory(spool_dir)) return "spool_dir is not a directory: " + spool_dir.string();
    }
    return {};
}

// --- ToolConfig ---

std::optional<ToolCommand> parse_tool_command(const std::string& name) {
    if (name == "get") return ToolCommand::Get;
    if (name == "put") return ToolCommand::Put;
    if (name == "append") return ToolCommand::Append;
    if (name == "lines") return ToolCommand::Lines;
    if (name == "chunks") return ToolCommand::Chunks;
    return std::nullopt;
}

std::optional<ToolConfig> ToolConfig::from_args(int argc, char* argv[]) {
    ToolConfig config;
    bool have_command = false;

    auto next_arg = [&](int& i, const char* name) -> const char* {
        if (i + 1 >= argc) {
            std::cerr << "Error: " << name << " requires an argument\n";
            return nullptr;
        }
        return argv[++i];
    };

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--mode") {
            auto* v = next_arg(i, "--mode");
            if (!v) return std::nullopt;
            auto mode = parse_open_mode(v);
            if (!mode) {
                std::cerr << "Error: invalid mode: " << v << "\n";
                return std::nullopt;
            }
            config.stream.mode = *mode;
            config.mode_given = true;
        } else if (arg == "--memory-threshold") {
            auto* v = next_arg(i, "--memory-threshold");
            if (!v) return std::nullopt;
            if (!parse_number(v, "--memory-threshold", config.stream.max_memory_bytes)) return std::nullopt;
        } else if (arg == "--spool-dir") {
            auto* v = next_arg(i, "--spool-dir");
            if (!v) return std::nullopt;
            config.stream.spool_dir = v;
        } else if (arg == "--encoding") {
            auto* v = next_arg(i, "--encoding");
            if (!v) return std::nullopt;
            config.stream.encoding = v;
        } else if (arg == "--chunk-size") {
            auto* v = next_arg(i, "--chunk-size");
            if (!v) return std::nullopt;
            uint64_t n = 0;
            if (!parse_number(v, "--chunk-size", n)) return std::nullopt;
            config.stream.chunk_size = static_cast<size_t>(n);
        } else if (arg == "--delimiter") {
            auto* v = next_arg(i, "--delimiter");
            if (!v) return std::nullopt;
            config.stream.delimiter = unescape(v);
        } else if (arg == "--commit-on-error") {
            config.stream.commit_on_error = true;
        } else if (arg == "--option") {
            auto* v = next_arg(i, "--option");
            if (!v) return std::nullopt;
            const char* eq = std::strchr(v, '=');
            if (!eq || eq == v) {
                std::cerr << "Error: --option expects key=value, got '" << v << "'\n";
                return std::nullopt;
            }
            config.stream.transport_options[std::string(v, eq)] = eq + 1;
        } else if (arg == "--config") {
            auto* v = next_arg(i, "--config");
            if (!v) return std::nullopt;
            if (!config.load_json(v)) return std::nullopt;
        } else if (arg == "--input") {
            auto* v = next_arg(i, "--input");
            if (!v) return std::nullopt;
            config.input_path = v;
        } else if (arg == "--output") {
            auto* v = next_arg(i, "--output");
            if (!v) return std::nullopt;
            config.output_path = v;
        } else if (arg == "--metrics-file") {
            auto* v = next_arg(i, "--metrics-file");
            if (!v) return std::nullopt;
            config.metrics_file = v;
        } else if (arg == "--metrics-interval") {
            auto* v = next_arg(i, "--metrics-interval");
            if (!v) return std::nullopt;
            uint64_t n = 0;
            if (!parse_number(v, "--metrics-interval", n)) return std::nullopt;
            config.metrics_interval_secs = static_cast<size_t>(n);
        } else if (arg == "--verbose" || arg == "-v") {
            config.verbose = true;
        } else if (arg == "--help" || arg == "-h") {
            print_usage();
            return std::nullopt;
        } else if (arg.compare(0, 2, "--") == 0) {
            std::cerr << "Error: unknown option: " << arg << "\n";
            return std::nullopt;
        } else if (!have_command) {
            auto command = parse_tool_command(arg);
            if (!command) {
                std::cerr << "Error: unknown command: " << arg << "\n";
                print_usage();
                return std::nullopt;
            }
            config.command = *command;
            have_command = true;
        } else if (config.url.empty()) {
            config.url = arg;
        } else {
            std::cerr << "Error: unexpected argument: " << arg << "\n";
            return std::nullopt;
        }
    }

    if (!have_command) {
        print_usage();
        return std::nullopt;
    }

    config.apply_defaults();
    return config;
}

bool ToolConfig::load_json(const std::filesystem::path& path) {
    try {
        auto j = read_json_file(path);
        if (!j) return false;

        apply_stream_json(*j, stream);
        if (j->contains("mode")) mode_given = true;

        if (j->contains("url")) url = (*j)["url"].get<std::string>();
        if (j->contains("input")) input_path = (*j)["input"].get<std::string>();
        if (j->contains("output")) output_path = (*j)["output"].get<std::string>();
        if (j->contains("verbose")) verbose = (*j)["verbose"].get<bool>();
        if (j->contains("metrics_file")) metrics_file = (*j)["metrics_file"].get<std::string>();
        if (j->contains("metrics_interval")) metrics_interval_secs = (*j)["metrics_interval"].get<size_t>();

        return true;
    } catch (const std::exception& e) {
        std::cerr << "Error parsing config: " << e.what() << "\n";
        return false;
    }
}

void ToolConfig::apply_defaults() {
    if (mode_given) return;
    switch (command) {
        case ToolCommand::Get: stream.mode = OpenMode::ReadBinary; break;
        case ToolCommand::Put: stream.mode = OpenMode::WriteBinary; break;
        case ToolCommand::Append: stream.mode = OpenMode::AppendBinary; break;
        case ToolCommand::Lines: stream.mode = OpenMode::ReadText; break;
        case ToolCommand::Chunks: stream.mode = OpenMode::ReadBinary; break;
    }
}

std::string ToolConfig::validate() const {
    if (url.empty()) return "url is required";
    if (url.compare(0, 7, "http://") != 0 && url.compare(0, 8, "https://") != 0)
        return "url must start with http:// or https://: " + url;

    auto err = stream.validate();
    if (!err.empty()) return err;

    const char* mode = open_mode_to_string(stream.mode);
    switch (command) {
        case ToolCommand::Get:
            if (!is_read(stream.mode)) return std::string("get requires a read mode, not ") + mode;
            break;
        case ToolCommand::Put:
            if (!is_write(stream.mode)) return std::string("put requires a write mode, not ") + mode;
            break;
        case ToolCommand::Append:
            if (!is_append(stream.mode)) return std::string("append requires an append mode, not ") + mode;
            break;
        case ToolCommand::Lines:
            if (stream.mode != OpenMode::ReadText) return std::string("lines requires mode r, not ") + mode;
            break;
        case ToolCommand::Chunks:
            if (stream.mode != OpenMode::ReadBinary) return std::string("chunks requires mode rb, not ") + mode;
            break;
    }

    if (!metrics_file.empty() && metrics_interval_secs == 0) return "metrics_interval must be > 0";
    if (!input_path.empty() && !std::filesystem::exists(input_path))
        return "input does not exist: " + input_path.string();
    return {};
}

}  // namespace httpstream
