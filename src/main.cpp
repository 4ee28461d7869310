// httpstream: command line front end for RemoteStream.
//
// Usage: httpstream <command> <url> [options]
//
// Commands:
//   get       Print the resource body (whole-body GET)
//   put       Upload stdin or --input, replacing the resource
//   append    Fetch the resource, append stdin or --input, upload
//   lines     Stream the resource as text lines
//   chunks    Stream the resource as binary chunks, printing their sizes

#include "httpstream/log.hpp"
#include "httpstream/metrics.hpp"
#include "httpstream/remote_io.hpp"
#include "httpstream/remote_stream.hpp"
#include "httpstream/stream_config.hpp"

#include <chrono>
#include <fstream>
#include <iostream>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>

using namespace httpstream;

namespace {

// Input is copied into the buffer in pieces of this size
constexpr size_t INPUT_PIECE = 64 * 1024;

const char* command_name(ToolCommand command) {
    switch (command) {
        case ToolCommand::Get: return "get";
        case ToolCommand::Put: return "put";
        case ToolCommand::Append: return "append";
        case ToolCommand::Lines: return "lines";
        case ToolCommand::Chunks: return "chunks";
    }
    return "?";
}

// Writes to --output when given, stdout otherwise.
class Output {
public:
    explicit Output(const std::filesystem::path& path) {
        if (!path.empty()) {
            file_.open(path, std::ios::binary | std::ios::trunc);
            if (!file_) {
                throw std::runtime_error("cannot open output file: " + path.string());
            }
        }
    }

    std::ostream& stream() { return file_.is_open() ? static_cast<std::ostream&>(file_) : std::cout; }

    void finish() {
        stream().flush();
        if (!stream().good()) {
            throw std::runtime_error("write to output failed");
        }
    }

private:
    std::ofstream file_;
};

int run_get(const ToolConfig& config, MetricsExporter* metrics) {
    auto body = read_remote(config.url, config.stream, nullptr, metrics);
    if (!body.is_ok()) {
        log_error("get %s: %s", config.url.c_str(), body.error_message().c_str());
        return 1;
    }

    Output out(config.output_path);
    out.stream().write(body.value().data(), static_cast<std::streamsize>(body.value().size()));
    out.finish();
    if (!config.output_path.empty()) {
        log_info("wrote %zu bytes to %s", body.value().size(), config.output_path.c_str());
    }
    return 0;
}

int run_upload(const ToolConfig& config, MetricsExporter* metrics) {
    std::ifstream file;
    std::istream* in = &std::cin;
    if (!config.input_path.empty()) {
        file.open(config.input_path, std::ios::binary);
        if (!file) {
            log_error("cannot open input file: %s", config.input_path.c_str());
            return 1;
        }
        in = &file;
    }

    RemoteStream stream(config.url, config.stream);
    stream.set_metrics(metrics);

    uint64_t total = with_session(stream, [&](RemoteStream& s) {
        uint64_t written = 0;
        std::string piece(INPUT_PIECE, '\0');
        while (in->read(piece.data(), static_cast<std::streamsize>(piece.size())) || in->gcount() > 0) {
            written += s.write(std::string_view(piece.data(), static_cast<size_t>(in->gcount())));
        }
        if (in->bad()) {
            throw std::runtime_error("reading input failed");
        }
        return written;
    });

    log_info("%s: %llu bytes to %s", command_name(config.command),
             static_cast<unsigned long long>(total), config.url.c_str());
    return 0;
}

int run_iterate(const ToolConfig& config, MetricsExporter* metrics) {
    RemoteStream stream(config.url, config.stream);
    stream.set_metrics(metrics);

    Output out(config.output_path);
    uint64_t count = 0;
    uint64_t bytes = 0;
    for (const auto& item : stream.chunks()) {
        ++count;
        bytes += item.size();
        if (config.command == ToolCommand::Lines) {
            out.stream() << item << '\n';
        } else {
            out.stream() << "chunk " << count << ": " << item.size() << " bytes\n";
        }
    }
    out.finish();
    log_debug("%s %s: %llu items, %llu bytes", command_name(config.command), config.url.c_str(),
              static_cast<unsigned long long>(count), static_cast<unsigned long long>(bytes));
    return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
    auto config_opt = ToolConfig::from_args(argc, argv);
    if (!config_opt) {
        return 1;
    }
    auto config = std::move(*config_opt);

    auto err = config.validate();
    if (!err.empty()) {
        std::cerr << "Configuration error: " << err << "\n";
        return 1;
    }

    set_verbose(config.verbose);
    log_debug("%s %s (mode %s, memory threshold %llu, chunk size %zu)",
              command_name(config.command), config.url.c_str(),
              open_mode_to_string(config.stream.mode),
              static_cast<unsigned long long>(config.stream.max_memory_bytes),
              config.stream.chunk_size);

    std::unique_ptr<MetricsExporter> metrics;
    if (!config.metrics_file.empty()) {
        metrics = std::make_unique<MetricsExporter>(
            config.metrics_file, std::chrono::seconds(config.metrics_interval_secs),
            std::map<std::string, std::string>{{"command", command_name(config.command)}});
        metrics->start();
    }

    int rc = 1;
    try {
        switch (config.command) {
            case ToolCommand::Get:
                rc = run_get(config, metrics.get());
                break;
            case ToolCommand::Put:
            case ToolCommand::Append:
                rc = run_upload(config, metrics.get());
                break;
            case ToolCommand::Lines:
            case ToolCommand::Chunks:
                rc = run_iterate(config, metrics.get());
                break;
        }
    } catch (const StreamError& e) {
        log_error("%s", e.what());
    } catch (const std::exception& e) {
        log_error("%s %s: %s", command_name(config.command), config.url.c_str(), e.what());
    }

    if (metrics) {
        metrics->stop();
    }
    return rc;
}
