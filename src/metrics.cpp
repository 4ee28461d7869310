#include "httpstream/metrics.hpp"
#include "httpstream/log.hpp"

#include <fstream>
#include <prometheus/text_serializer.h>

namespace httpstream {

MetricsExporter::MetricsExporter(const std::filesystem::path& prom_file_path,
                                 std::chrono::seconds write_interval,
                                 const std::map<std::string, std::string>& labels)
    : prom_file_path_(prom_file_path)
    , write_interval_(write_interval)
    , registry_(std::make_shared<prometheus::Registry>()) {

    // --- Counters ---

    auto& fetches_family = prometheus::BuildCounter()
        .Name("httpstream_fetches_total")
        .Help("Total whole-body fetches")
        .Labels(labels)
        .Register(*registry_);
    fetches_success_ = &fetches_family.Add({{"result", "success"}});
    fetches_failure_ = &fetches_family.Add({{"result", "failure"}});

    fetch_bytes_total_ = &prometheus::BuildCounter()
        .Name("httpstream_fetch_bytes_total")
        .Help("Total body bytes fetched into buffers")
        .Labels(labels)
        .Register(*registry_)
        .Add({});

    auto& uploads_family = prometheus::BuildCounter()
        .Name("httpstream_uploads_total")
        .Help("Total commit uploads")
        .Labels(labels)
        .Register(*registry_);
    uploads_success_ = &uploads_family.Add({{"result", "success"}});
    uploads_failure_ = &uploads_family.Add({{"result", "failure"}});

    upload_bytes_total_ = &prometheus::BuildCounter()
        .Name("httpstream_upload_bytes_total")
        .Help("Total body bytes uploaded")
        .Labels(labels)
        .Register(*registry_)
        .Add({});

    auto& stream_family = prometheus::BuildCounter()
        .Name("httpstream_stream_requests_total")
        .Help("Total streamed GET requests opened for iteration")
        .Labels(labels)
        .Register(*registry_);
    stream_requests_success_ = &stream_family.Add({{"result", "success"}});
    stream_requests_failure_ = &stream_family.Add({{"result", "failure"}});

    stream_bytes_total_ = &prometheus::BuildCounter()
        .Name("httpstream_stream_bytes_total")
        .Help("Total raw bytes received by iteration")
        .Labels(labels)
        .Register(*registry_)
        .Add({});

    buffer_spills_total_ = &prometheus::BuildCounter()
        .Name("httpstream_buffer_spills_total")
        .Help("Total buffers that spilled to a temporary file")
        .Labels(labels)
        .Register(*registry_)
        .Add({});

    // --- Histograms ---

    fetch_duration_ = &prometheus::BuildHistogram()
        .Name("httpstream_fetch_duration_seconds")
        .Help("Whole-body fetch duration in seconds")
        .Labels(labels)
        .Register(*registry_)
        .Add({}, prometheus::Histogram::BucketBoundaries{
            0.005, 0.01, 0.05, 0.1, 0.25, 0.5, 1, 2.5, 5, 10, 30, 60});

    upload_duration_ = &prometheus::BuildHistogram()
        .Name("httpstream_upload_duration_seconds")
        .Help("Commit upload duration in seconds")
        .Labels(labels)
        .Register(*registry_)
        .Add({}, prometheus::Histogram::BucketBoundaries{
            0.01, 0.05, 0.1, 0.25, 0.5, 1, 2.5, 5, 10, 30, 60, 120, 300});
}

MetricsExporter::~MetricsExporter() {
    stop();
}

void MetricsExporter::start() {
    {
        std::lock_guard lock(cv_mutex_);
        if (running_) return;
        running_ = true;
    }
    writer_thread_ = std::thread(&MetricsExporter::writer_loop, this);
}

void MetricsExporter::stop() {
    bool was_running = false;
    {
        std::lock_guard lock(cv_mutex_);
        was_running = running_;
        running_ = false;
    }
    if (was_running) {
        cv_.notify_all();
        if (writer_thread_.joinable()) {
            writer_thread_.join();
        }
    }
    // Always write a final snapshot
    write_file();
}

void MetricsExporter::writer_loop() {
    while (true) {
        {
            std::unique_lock lock(cv_mutex_);
            cv_.wait_for(lock, write_interval_, [this] { return !running_; });
            if (!running_) break;
        }
        write_file();
    }
}

bool MetricsExporter::write_file() {
    std::lock_guard lock(file_mutex_);

    auto tmp_path = prom_file_path_;
    tmp_path += ".tmp";

    prometheus::TextSerializer serializer;
    auto metrics = registry_->Collect();

    std::ofstream ofs(tmp_path, std::ios::trunc);
    if (!ofs) {
        log_warn("cannot open metrics file %s", tmp_path.c_str());
        return false;
    }
    ofs << serializer.Serialize(metrics);
    ofs.close();
    if (!ofs.good()) {
        log_warn("failed writing metrics file %s", tmp_path.c_str());
        return false;
    }

    std::error_code ec;
    std::filesystem::rename(tmp_path, prom_file_path_, ec);
    if (ec) {
        log_warn("cannot rename metrics file to %s: %s",
                 prom_file_path_.c_str(), ec.message().c_str());
        return false;
    }
    return true;
}

}  // namespace httpstream
