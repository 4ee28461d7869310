#include "httpstream/curl_transport.hpp"
#include "httpstream/errors.hpp"
#include "httpstream/log.hpp"

#include <curl/curl.h>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <mutex>
#include <strings.h>
#include <vector>

namespace httpstream {

// ============================================================================
// Environment-based configuration helpers
// ============================================================================

// Get request timeout from environment or use default
static std::chrono::seconds get_request_timeout() {
    if (const char* env = std::getenv("HTTPSTREAM_REQUEST_TIMEOUT")) {
        try {
            unsigned long secs = std::stoul(env);
            // Sanity check: at least 1 second, at most 1 hour
            if (secs >= 1 && secs <= 3600) {
                return std::chrono::seconds(secs);
            }
            log_warn("HTTPSTREAM_REQUEST_TIMEOUT=%s out of range [1,3600], using default", env);
        } catch (const std::exception&) {
            log_warn("invalid HTTPSTREAM_REQUEST_TIMEOUT=%s, using default", env);
        }
    }
    return std::chrono::seconds(300);
}

// ============================================================================
// Utility functions
// ============================================================================

bool is_success_status(int status) {
    return status >= 200 && status < 300;
}

// ============================================================================
// HttpHeaders
// ============================================================================

std::string HttpHeaders::normalize_name(const std::string& name) {
    std::string result = name;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return result;
}

void HttpHeaders::add(const std::string& name, const std::string& value) {
    std::string key = normalize_name(name);
    headers_[key].push_back(value);
}

std::optional<std::string> HttpHeaders::get(const std::string& name) const {
    auto it = headers_.find(normalize_name(name));
    if (it != headers_.end() && !it->second.empty()) {
        return it->second[0];
    }
    return std::nullopt;
}

std::optional<std::string> HttpHeaders::content_type() const {
    return get("Content-Type");
}

// ============================================================================
// HttpResponse
// ============================================================================

std::string HttpResponse::body_string() const {
    return std::string(body.begin(), body.end());
}

// ============================================================================
// CURL callback functions
// ============================================================================

// Context for bounded response accumulation
struct WriteCallbackContext {
    std::vector<uint8_t>* response;
    size_t max_size;
    size_t current_size;
    bool size_exceeded;
};

static size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* ctx = static_cast<WriteCallbackContext*>(userdata);
    size_t bytes = size * nmemb;

    // Check if adding this data would exceed the limit
    if (ctx->max_size > 0 && ctx->current_size + bytes > ctx->max_size) {
        ctx->size_exceeded = true;
        return 0;  // Return 0 to signal error and abort transfer
    }

    ctx->response->insert(ctx->response->end(), ptr, ptr + bytes);
    ctx->current_size += bytes;
    return bytes;
}

static size_t header_callback(char* buffer, size_t size, size_t nitems, void* userdata) {
    auto* headers = static_cast<HttpHeaders*>(userdata);
    size_t bytes = size * nitems;

    std::string line(buffer, bytes);

    // Remove trailing CRLF
    while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) {
        line.pop_back();
    }

    if (line.empty()) {
        return bytes;
    }

    // A new status line starts a new header block (redirects, 100-continue);
    // only the final response's headers are kept.
    if (line.starts_with("HTTP/")) {
        headers->clear();
        return bytes;
    }

    // Parse header
    size_t colon = line.find(':');
    if (colon != std::string::npos) {
        std::string name = line.substr(0, colon);
        std::string value = line.substr(colon + 1);

        // Trim leading whitespace from value
        size_t start = value.find_first_not_of(" \t");
        if (start != std::string::npos) {
            value = value.substr(start);
        } else {
            value.clear();
        }

        headers->add(name, value);
    }

    return bytes;
}

static size_t read_callback(char* buffer, size_t size, size_t nitems, void* userdata) {
    auto* source = static_cast<BodySource*>(userdata);
    try {
        return source->read(buffer, size * nitems);
    } catch (const std::exception& e) {
        // Exceptions must not cross libcurl; abort the transfer instead.
        log_error("upload body read failed: %s", e.what());
        return CURL_READFUNC_ABORT;
    }
}

// ============================================================================
// Per-request settings
// ============================================================================

namespace {

struct RequestSettings {
    std::chrono::milliseconds connect_timeout;
    std::chrono::milliseconds total_timeout;
    bool verify_ssl;
    std::string ca_bundle;
    std::string proxy_url;
    std::string user_agent;
    bool follow_redirects;
    long max_redirects;
    std::vector<std::string> extra_headers;  // "Name: value"
};

std::optional<bool> parse_bool_option(const std::string& value) {
    std::string v = value;
    std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c) { return std::tolower(c); });
    if (v == "true" || v == "1" || v == "yes" || v == "on") return true;
    if (v == "false" || v == "0" || v == "no" || v == "off") return false;
    return std::nullopt;
}

std::optional<long long> parse_int_option(const std::string& value) {
    try {
        size_t used = 0;
        long long n = std::stoll(value, &used);
        if (used != value.size() || n < 0) return std::nullopt;
        return n;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

RequestSettings resolve_settings(const CurlTransportConfig& config,
                                 const TransportOptions& options) {
    RequestSettings s{
        config.connect_timeout,
        config.total_timeout,
        config.verify_ssl,
        config.ca_bundle,
        config.proxy_url,
        config.user_agent,
        config.follow_redirects,
        config.max_redirects,
        {},
    };

    for (const auto& [key, value] : options) {
        if (key == "timeout_ms" || key == "connect_timeout_ms" || key == "max_redirects") {
            auto n = parse_int_option(value);
            if (!n) {
                log_warn("ignoring transport option %s=%s: not a non-negative integer",
                         key.c_str(), value.c_str());
                continue;
            }
            if (key == "timeout_ms") {
                s.total_timeout = std::chrono::milliseconds(*n);
            } else if (key == "connect_timeout_ms") {
                s.connect_timeout = std::chrono::milliseconds(*n);
            } else {
                s.max_redirects = static_cast<long>(*n);
            }
        } else if (key == "verify_ssl" || key == "follow_redirects") {
            auto b = parse_bool_option(value);
            if (!b) {
                log_warn("ignoring transport option %s=%s: not a boolean",
                         key.c_str(), value.c_str());
                continue;
            }
            (key == "verify_ssl" ? s.verify_ssl : s.follow_redirects) = *b;
        } else if (key == "ca_bundle") {
            s.ca_bundle = value;
        } else if (key == "proxy") {
            s.proxy_url = value;
        } else if (key == "user_agent") {
            s.user_agent = value;
        } else if (key.starts_with("header.") && key.size() > 7) {
            s.extra_headers.push_back(key.substr(7) + ": " + value);
        } else {
            log_debug("transport option %s not understood by curl transport, ignored",
                      key.c_str());
        }
    }
    return s;
}

// True when a header.<name> option supplies this header.
bool has_header(const RequestSettings& s, const std::string& name) {
    return std::any_of(s.extra_headers.begin(), s.extra_headers.end(),
                       [&](const std::string& h) {
                           return h.size() > name.size() && h[name.size()] == ':' &&
                                  strncasecmp(h.c_str(), name.c_str(), name.size()) == 0;
                       });
}

// Owns a curl_slist for the lifetime of one request.
class HeaderList {
public:
    HeaderList() = default;
    ~HeaderList() {
        if (list_) curl_slist_free_all(list_);
    }

    HeaderList(const HeaderList&) = delete;
    HeaderList& operator=(const HeaderList&) = delete;

    void append(const std::string& header) {
        list_ = curl_slist_append(list_, header.c_str());
    }
    curl_slist* get() const { return list_; }

private:
    curl_slist* list_ = nullptr;
};

// Options shared by every request kind.
void configure_handle(CURL* curl, const std::string& url, const RequestSettings& s,
                      HeaderList& headers, bool verbose) {
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());

    for (const auto& h : s.extra_headers) {
        headers.append(h);
    }
    if (headers.get()) {
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers.get());
    }

    if (!s.user_agent.empty()) {
        curl_easy_setopt(curl, CURLOPT_USERAGENT, s.user_agent.c_str());
    }

    // Timeouts
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS,
                     static_cast<long>(s.connect_timeout.count()));
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS,
                     static_cast<long>(s.total_timeout.count()));

    if (s.verify_ssl) {
        curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
        curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 2L);
    } else {
        static std::once_flag ssl_warning;
        std::call_once(ssl_warning, [] {
            log_warn("SSL verification disabled; connections are open to man-in-the-middle attacks");
        });
        curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 0L);
        curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 0L);
    }

    if (!s.ca_bundle.empty()) {
        curl_easy_setopt(curl, CURLOPT_CAINFO, s.ca_bundle.c_str());
    }

    if (!s.proxy_url.empty()) {
        curl_easy_setopt(curl, CURLOPT_PROXY, s.proxy_url.c_str());
    }

    if (s.follow_redirects) {
        curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(curl, CURLOPT_MAXREDIRS, s.max_redirects);
    }

    // Signals are unsafe for timeouts in multi-threaded embedders
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    if (verbose) {
        curl_easy_setopt(curl, CURLOPT_VERBOSE, 1L);
    }
}

void ensure_curl_initialized() {
    // Initialize CURL globally (thread-safe)
    static std::once_flag curl_init_flag;
    std::call_once(curl_init_flag, []() {
        curl_global_init(CURL_GLOBAL_ALL);
    });
}

}  // namespace

// ============================================================================
// CurlStreamedBody - pull-based streamed GET over a multi handle
// ============================================================================

namespace {

class CurlStreamedBody : public StreamedBody {
public:
    CurlStreamedBody(const std::string& url, const RequestSettings& settings,
                     size_t high_water, bool verbose)
        : url_(url)
        , high_water_(high_water) {
        multi_ = curl_multi_init();
        easy_ = curl_easy_init();
        if (!multi_ || !easy_) {
            cleanup();
            throw FetchError(url_, 0, {}, "failed to initialize curl handles");
        }

        configure_handle(easy_, url_, settings, headers_list_, verbose);
        curl_easy_setopt(easy_, CURLOPT_HTTPGET, 1L);
        curl_easy_setopt(easy_, CURLOPT_WRITEFUNCTION, &CurlStreamedBody::on_data);
        curl_easy_setopt(easy_, CURLOPT_WRITEDATA, this);
        curl_easy_setopt(easy_, CURLOPT_HEADERFUNCTION, header_callback);
        curl_easy_setopt(easy_, CURLOPT_HEADERDATA, &headers_);

        curl_multi_add_handle(multi_, easy_);

        // Block until the status is known: first body bytes or completion.
        while (pending_.empty() && !done_) {
            pump();
        }

        long code = 0;
        curl_easy_getinfo(easy_, CURLINFO_RESPONSE_CODE, &code);
        status_code_ = error_.empty() ? static_cast<int>(code) : 0;
    }

    ~CurlStreamedBody() override {
        cleanup();
    }

    CurlStreamedBody(const CurlStreamedBody&) = delete;
    CurlStreamedBody& operator=(const CurlStreamedBody&) = delete;

    int status_code() const override { return status_code_; }
    const HttpHeaders& headers() const override { return headers_; }
    const std::string& error() const override { return error_; }

    bool next(std::string& chunk) override {
        while (pending_.empty() && !done_) {
            pump();
        }
        if (pending_.empty()) {
            if (!error_.empty()) {
                throw FetchError(url_, 0, {}, error_);
            }
            return false;
        }

        chunk.swap(pending_);
        pending_.clear();

        if (paused_) {
            paused_ = false;
            curl_easy_pause(easy_, CURLPAUSE_CONT);
        }
        return true;
    }

private:
    static size_t on_data(char* ptr, size_t size, size_t nmemb, void* userdata) {
        auto* self = static_cast<CurlStreamedBody*>(userdata);
        size_t bytes = size * nmemb;
        if (self->high_water_ > 0 && self->pending_.size() >= self->high_water_) {
            // curl redelivers this data after CURLPAUSE_CONT
            self->paused_ = true;
            return CURL_WRITEFUNC_PAUSE;
        }
        self->pending_.append(ptr, bytes);
        return bytes;
    }

    void pump() {
        int running = 0;
        CURLMcode mc = curl_multi_perform(multi_, &running);
        if (mc != CURLM_OK) {
            error_ = curl_multi_strerror(mc);
            done_ = true;
            return;
        }

        if (running == 0) {
            int left = 0;
            while (CURLMsg* msg = curl_multi_info_read(multi_, &left)) {
                if (msg->msg == CURLMSG_DONE && msg->data.result != CURLE_OK) {
                    error_ = curl_easy_strerror(msg->data.result);
                }
            }
            done_ = true;
            return;
        }

        if (pending_.empty()) {
            curl_multi_poll(multi_, nullptr, 0, 1000, nullptr);
        }
    }

    void cleanup() {
        if (multi_ && easy_) {
            curl_multi_remove_handle(multi_, easy_);
        }
        if (easy_) {
            curl_easy_cleanup(easy_);
            easy_ = nullptr;
        }
        if (multi_) {
            curl_multi_cleanup(multi_);
            multi_ = nullptr;
        }
    }

    std::string url_;
    size_t high_water_;

    CURLM* multi_ = nullptr;
    CURL* easy_ = nullptr;
    HeaderList headers_list_;

    HttpHeaders headers_;
    int status_code_ = 0;
    std::string pending_;
    std::string error_;
    bool done_ = false;
    bool paused_ = false;
};

}  // namespace

// ============================================================================
// CurlTransport Implementation
// ============================================================================

class CurlTransport::Impl {
public:
    explicit Impl(const CurlTransportConfig& config)
        : config_(config) {
        ensure_curl_initialized();

        // Apply environment-based override for the total timeout
        if (config_.total_timeout == std::chrono::milliseconds{300000}) {  // Default
            config_.total_timeout =
                std::chrono::duration_cast<std::chrono::milliseconds>(get_request_timeout());
        }
    }

    ~Impl() {
        std::lock_guard<std::mutex> lock(pool_mutex_);
        for (CURL* handle : idle_handles_) {
            curl_easy_cleanup(handle);
        }
        idle_handles_.clear();
    }

    const CurlTransportConfig& config() const { return config_; }

    HttpResponse fetch(const std::string& url, const TransportOptions& options) {
        HttpResponse response;
        auto settings = resolve_settings(config_, options);

        CURL* curl = acquire_handle();
        if (!curl) {
            response.error = "failed to create curl handle";
            response.is_network_error = true;
            return response;
        }

        HeaderList headers;
        configure_handle(curl, url, settings, headers, config_.verbose);
        curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);

        std::vector<uint8_t> response_body;
        WriteCallbackContext write_ctx{&response_body, config_.max_response_size, 0, false};
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &write_ctx);
        curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_callback);
        curl_easy_setopt(curl, CURLOPT_HEADERDATA, &response.headers);

        perform(curl, response, write_ctx.size_exceeded);
        if (!response.is_network_error) {
            response.body = std::move(response_body);
        }

        release_handle(curl);
        return response;
    }

    HttpResponse post(const std::string& url, BodySource& body, const TransportOptions& options) {
        HttpResponse response;
        auto settings = resolve_settings(config_, options);

        CURL* curl = acquire_handle();
        if (!curl) {
            response.error = "failed to create curl handle";
            response.is_network_error = true;
            return response;
        }

        HeaderList headers;
        auto body_size = body.size();
        if (!body_size) {
            headers.append("Transfer-Encoding: chunked");
        }
        // CURLOPT_POST implies a form Content-Type; send none unless the caller set one
        if (!has_header(settings, "Content-Type")) {
            headers.append("Content-Type:");
        }
        configure_handle(curl, url, settings, headers, config_.verbose);

        curl_easy_setopt(curl, CURLOPT_POST, 1L);
        curl_easy_setopt(curl, CURLOPT_READFUNCTION, read_callback);
        curl_easy_setopt(curl, CURLOPT_READDATA, &body);
        if (body_size) {
            curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE,
                             static_cast<curl_off_t>(*body_size));
        }

        std::vector<uint8_t> response_body;
        WriteCallbackContext write_ctx{&response_body, config_.max_response_size, 0, false};
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &write_ctx);
        curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_callback);
        curl_easy_setopt(curl, CURLOPT_HEADERDATA, &response.headers);

        perform(curl, response, write_ctx.size_exceeded);
        if (!response.is_network_error) {
            response.body = std::move(response_body);
        }

        release_handle(curl);
        return response;
    }

    std::unique_ptr<StreamedBody> open_stream(const std::string& url,
                                              const TransportOptions& options) {
        auto settings = resolve_settings(config_, options);
        return std::make_unique<CurlStreamedBody>(url, settings, config_.stream_high_water,
                                                  config_.verbose);
    }

private:
    void perform(CURL* curl, HttpResponse& response, const bool& size_exceeded) {
        auto start_time = std::chrono::steady_clock::now();
        CURLcode res = curl_easy_perform(curl);
        auto end_time = std::chrono::steady_clock::now();

        response.total_time = std::chrono::duration_cast<std::chrono::milliseconds>(
            end_time - start_time);

        if (res == CURLE_WRITE_ERROR && size_exceeded) {
            response.error = "Response body exceeded maximum size limit of " +
                             std::to_string(config_.max_response_size) + " bytes";
            response.is_network_error = false;
            response.status_code = 413;  // Payload Too Large
        } else if (res != CURLE_OK) {
            response.error = curl_easy_strerror(res);
            response.is_network_error = true;
        } else {
            long code = 0;
            curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &code);
            response.status_code = static_cast<int>(code);
        }
    }

    // Acquire a handle from the pool or create a new one
    CURL* acquire_handle() {
        {
            std::lock_guard<std::mutex> lock(pool_mutex_);
            if (!idle_handles_.empty()) {
                CURL* handle = idle_handles_.back();
                idle_handles_.pop_back();
                return handle;
            }
        }
        return curl_easy_init();
    }

    // Return a handle to the pool
    void release_handle(CURL* handle) {
        if (!handle) return;

        // Reset handle for reuse; keeps the connection cache
        curl_easy_reset(handle);

        std::lock_guard<std::mutex> lock(pool_mutex_);
        if (idle_handles_.size() < config_.max_idle_handles) {
            idle_handles_.push_back(handle);
        } else {
            curl_easy_cleanup(handle);
        }
    }

    CurlTransportConfig config_;

    std::mutex pool_mutex_;
    std::vector<CURL*> idle_handles_;
};

CurlTransport::CurlTransport(const CurlTransportConfig& config)
    : impl_(std::make_unique<Impl>(config)) {}

CurlTransport::~CurlTransport() = default;

HttpResponse CurlTransport::fetch(const std::string& url, const TransportOptions& options) {
    return impl_->fetch(url, options);
}

std::unique_ptr<StreamedBody> CurlTransport::open_stream(const std::string& url,
                                                         const TransportOptions& options) {
    return impl_->open_stream(url, options);
}

HttpResponse CurlTransport::post(const std::string& url, BodySource& body,
                                 const TransportOptions& options) {
    return impl_->post(url, body, options);
}

const CurlTransportConfig& CurlTransport::config() const {
    return impl_->config();
}

std::shared_ptr<Transport> default_transport() {
    static std::shared_ptr<Transport> transport = std::make_shared<CurlTransport>();
    return transport;
}

}  // namespace httpstream
