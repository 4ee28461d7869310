#pragma once

#include "httpstream/http.hpp"
#include "httpstream/maybe.hpp"
#include "httpstream/stream_config.hpp"

#include <memory>
#include <string>
#include <string_view>

namespace httpstream {

class MetricsExporter;

// One-shot helpers that run a whole session and report failure through
// Maybe instead of throwing. A null transport means default_transport().

/// Read the whole resource. config.mode must be r or rb.
Maybe<std::string> read_remote(const std::string& url, const StreamConfig& config = {},
                               std::shared_ptr<Transport> transport = nullptr,
                               MetricsExporter* metrics = nullptr);

/// Upload `data`, replacing (w, wb) or extending (a, ab) the resource.
/// Returns the number of units written.
Maybe<size_t> write_remote(const std::string& url, std::string_view data,
                           const StreamConfig& config,
                           std::shared_ptr<Transport> transport = nullptr,
                           MetricsExporter* metrics = nullptr);

}  // namespace httpstream
