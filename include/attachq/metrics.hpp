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
#include <prometheus/gauge.h>
#include <prometheus/histogram.h>
#include <prometheus/registry.h>

namespace attachq {

class UploadQueueService;

/// RAII timer that observes a histogram with elapsed duration on destruction.
class ScopedTimer {
public:
    explicit ScopedTimer(prometheus::Histogram& histogram)
        : histogram_(histogram)
        , start_(std::chrono::steady_clock::now()) {}

    ~ScopedTimer() {
        auto elapsed = std::chrono::steady_clock::now() - start_;
        histogram_.Observe(std::chrono::duration<double>(elapsed).count());
    }

    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

private:
    prometheus::Histogram& histogram_;
    std::chrono::steady_clock::time_point start_;
};

/// Exports upload queue metrics to a Prometheus textfile for node_exporter pickup.
///
/// Counters and the duration histogram are fed by the queue service as it
/// processes items. Phase gauges are sampled from the queue before each write.
/// The file is replaced atomically (temp + rename).
class MetricsExporter {
public:
    MetricsExporter(const std::filesystem::path& prom_file_path,
                    std::chrono::seconds write_interval,
                    const std::map<std::string, std::string>& labels = {});
    ~MetricsExporter();

    MetricsExporter(const MetricsExporter&) = delete;
    MetricsExporter& operator=(const MetricsExporter&) = delete;

    /// Queue to sample gauges from (not owned). Must outlive the exporter or be reset.
    void set_queue(const UploadQueueService* queue);

    /// Start the background writer thread.
    void start();

    /// Stop the background writer thread (writes one final snapshot).
    void stop();

    /// Sample gauges and write the file now.
    void flush();

    prometheus::Counter& uploads_success() { return *uploads_success_; }
    prometheus::Counter& uploads_failure() { return *uploads_failure_; }
    prometheus::Counter& upload_bytes_total() { return *upload_bytes_total_; }
    prometheus::Counter& retries_total() { return *retries_total_; }
    prometheus::Counter& presign_failures_total() { return *presign_failures_total_; }

    prometheus::Histogram& upload_duration() { return *upload_duration_; }

    const std::filesystem::path& path() const { return prom_file_path_; }

private:
    void writer_loop();
    void update_gauges();
    void write_file();

    std::filesystem::path prom_file_path_;
    std::chrono::seconds write_interval_;

    std::shared_ptr<prometheus::Registry> registry_;

    std::mutex queue_mutex_;
    const UploadQueueService* queue_ = nullptr;

    // --- Counters ---
    prometheus::Counter* uploads_success_;
    prometheus::Counter* uploads_failure_;
    prometheus::Counter* upload_bytes_total_;
    prometheus::Counter* retries_total_;
    prometheus::Counter* presign_failures_total_;

    // --- Gauges ---
    prometheus::Gauge* items_queued_;
    prometheus::Gauge* items_uploading_;
    prometheus::Gauge* items_completed_;
    prometheus::Gauge* items_failed_;
    prometheus::Gauge* items_total_;
    prometheus::Gauge* queue_paused_;

    // --- Histograms ---
    prometheus::Histogram* upload_duration_;

    // Writer thread
    std::thread writer_thread_;
    std::mutex cv_mutex_;
    std::condition_variable cv_;
    bool running_ = false;
};

}  // namespace attachq
