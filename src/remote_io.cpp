#include "httpstream/remote_io.hpp"
#include "httpstream/curl_transport.hpp"
#include "httpstream/errors.hpp"
#include "httpstream/remote_stream.hpp"

namespace httpstream {

Maybe<std::string> read_remote(const std::string& url, const StreamConfig& config,
                               std::shared_ptr<Transport> transport,
                               MetricsExporter* metrics) {
    return capture([&]() -> std::string {
        if (!is_read(config.mode)) {
            throw UsageError(std::string("read_remote needs a read mode, not ") +
                             open_mode_to_string(config.mode));
        }
        RemoteStream stream(url, transport ? transport : default_transport(), config);
        stream.set_metrics(metrics);
        return with_session(stream, [](RemoteStream& s) { return s.read(); });
    });
}

Maybe<size_t> write_remote(const std::string& url, std::string_view data,
                           const StreamConfig& config,
                           std::shared_ptr<Transport> transport,
                           MetricsExporter* metrics) {
    return capture([&]() -> size_t {
        if (!commits_on_exit(config.mode)) {
            throw UsageError(std::string("write_remote needs a write or append mode, not ") +
                             open_mode_to_string(config.mode));
        }
        RemoteStream stream(url, transport ? transport : default_transport(), config);
        stream.set_metrics(metrics);
        return with_session(stream, [data](RemoteStream& s) { return s.write(data); });
    });
}

}  // namespace httpstream
