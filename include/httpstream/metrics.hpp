#pragma once

#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include <prometheus/counter.h>
#include <prometheus/histogram.h>
#include <prometheus/registry.h>

namespace httpstream {

/// RAII timer that observes a histogram with elapsed duration on destruction.
class ScopedTimer {
public:
    explicit ScopedTimer(prometheus::Histogram& histogram)
        : histogram_(histogram)
        , start_(std::chrono::steady_clock::now()) {}

    ~ScopedTimer() {
        auto elapsed = std::chrono::steady_clock::now() - start_;
        double secs = std::chrono::duration<double>(elapsed).count();
        histogram_.Observe(secs);
    }

    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

private:
    prometheus::Histogram& histogram_;
    std::chrono::steady_clock::time_point start_;
};

/// Exports stream metrics to a Prometheus textfile for node_exporter pickup.
///
/// Owns a prometheus::Registry with all metric families. A background writer
/// thread periodically serializes the registry to a .prom file using atomic
/// temp+rename. Counters may be shared by any number of streams.
class MetricsExporter {
public:
    /// @param prom_file_path  Path to the .prom output file.
    /// @param write_interval  How often to write the file (default 15s).
    /// @param labels          Constant labels applied to all metrics.
    MetricsExporter(const std::filesystem::path& prom_file_path,
                    std::chrono::seconds write_interval = std::chrono::seconds(15),
                    const std::map<std::string, std::string>& labels = {});
    ~MetricsExporter();

    MetricsExporter(const MetricsExporter&) = delete;
    MetricsExporter& operator=(const MetricsExporter&) = delete;

    /// Start the background writer thread.
    void start();

    /// Stop the background writer thread (writes one final snapshot).
    void stop();

    /// Serialize the registry to the textfile now. Returns false on I/O failure.
    bool write_file();

    const std::filesystem::path& path() const { return prom_file_path_; }

    // --- Counter accessors ---
    prometheus::Counter& fetches_success() { return *fetches_success_; }
    prometheus::Counter& fetches_failure() { return *fetches_failure_; }
    prometheus::Counter& fetch_bytes_total() { return *fetch_bytes_total_; }
    prometheus::Counter& uploads_success() { return *uploads_success_; }
    prometheus::Counter& uploads_failure() { return *uploads_failure_; }
    prometheus::Counter& upload_bytes_total() { return *upload_bytes_total_; }
    prometheus::Counter& stream_requests_success() { return *stream_requests_success_; }
    prometheus::Counter& stream_requests_failure() { return *stream_requests_failure_; }
    prometheus::Counter& stream_bytes_total() { return *stream_bytes_total_; }
    prometheus::Counter& buffer_spills_total() { return *buffer_spills_total_; }

    // --- Histogram accessors ---
    prometheus::Histogram& fetch_duration() { return *fetch_duration_; }
    prometheus::Histogram& upload_duration() { return *upload_duration_; }

private:
    void writer_loop();

    std::filesystem::path prom_file_path_;
    std::chrono::seconds write_interval_;

    std::shared_ptr<prometheus::Registry> registry_;

    // --- Counters ---
    prometheus::Counter* fetches_success_;
    prometheus::Counter* fetches_failure_;
    prometheus::Counter* fetch_bytes_total_;
    prometheus::Counter* uploads_success_;
    prometheus::Counter* uploads_failure_;
    prometheus::Counter* upload_bytes_total_;
    prometheus::Counter* stream_requests_success_;
    prometheus::Counter* stream_requests_failure_;
    prometheus::Counter* stream_bytes_total_;
    prometheus::Counter* buffer_spills_total_;

    // --- Histograms ---
    prometheus::Histogram* fetch_duration_;
    prometheus::Histogram* upload_duration_;

    // Writer thread
    std::thread writer_thread_;
    std::mutex cv_mutex_;
    std::condition_variable cv_;
    bool running_ = false;

    // Serializes write_file() between the writer thread and stop()
    std::mutex file_mutex_;
};

}  // namespace httpstream
