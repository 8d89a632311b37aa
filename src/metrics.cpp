#include "attachq/metrics.hpp"
#include "attachq/log.hpp"
#include "attachq/upload_queue.hpp"

#include <fstream>
#include <prometheus/text_serializer.h>

namespace attachq {

MetricsExporter::MetricsExporter(const std::filesystem::path& prom_file_path,
                                 std::chrono::seconds write_interval,
                                 const std::map<std::string, std::string>& labels)
    : prom_file_path_(prom_file_path)
    , write_interval_(write_interval)
    , registry_(std::make_shared<prometheus::Registry>()) {

    // --- Counters ---

    auto& uploads_family = prometheus::BuildCounter()
        .Name("attachq_uploads_total")
        .Help("Uploads that reached a terminal phase")
        .Labels(labels)
        .Register(*registry_);
    uploads_success_ = &uploads_family.Add({{"result", "success"}});
    uploads_failure_ = &uploads_family.Add({{"result", "failure"}});

    auto counter_reg = [&](const std::string& name, const std::string& help) -> prometheus::Counter& {
        return prometheus::BuildCounter()
            .Name(name)
            .Help(help)
            .Labels(labels)
            .Register(*registry_)
            .Add({});
    };

    upload_bytes_total_ = &counter_reg("attachq_upload_bytes_total", "Total bytes uploaded");
    retries_total_ = &counter_reg("attachq_retries_total", "Upload attempts scheduled for retry");
    presign_failures_total_ = &counter_reg("attachq_presign_failures_total",
                                           "Enqueue calls rejected by presign");

    // --- Gauges ---

    auto& items_family = prometheus::BuildGauge()
        .Name("attachq_queue_items")
        .Help("Queue items by phase")
        .Labels(labels)
        .Register(*registry_);
    items_queued_ = &items_family.Add({{"phase", "queued"}});
    items_uploading_ = &items_family.Add({{"phase", "uploading"}});
    items_completed_ = &items_family.Add({{"phase", "completed"}});
    items_failed_ = &items_family.Add({{"phase", "failed"}});

    auto gauge_reg = [&](const std::string& name, const std::string& help) -> prometheus::Gauge& {
        return prometheus::BuildGauge()
            .Name(name)
            .Help(help)
            .Labels(labels)
            .Register(*registry_)
            .Add({});
    };

    items_total_ = &gauge_reg("attachq_queue_items_total", "Total queue items");
    queue_paused_ = &gauge_reg("attachq_queue_paused", "1 while paused for lost connectivity");

    // --- Histograms ---

    upload_duration_ = &prometheus::BuildHistogram()
        .Name("attachq_upload_duration_seconds")
        .Help("Duration of a single transfer attempt in seconds")
        .Labels(labels)
        .Register(*registry_)
        .Add({}, prometheus::Histogram::BucketBoundaries{
            0.1, 0.25, 0.5, 1, 2.5, 5, 10, 30, 60, 120, 300, 600});
}

MetricsExporter::~MetricsExporter() {
    stop();
}

void MetricsExporter::set_queue(const UploadQueueService* queue) {
    std::lock_guard lock(queue_mutex_);
    queue_ = queue;
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
    flush();
}

void MetricsExporter::flush() {
    update_gauges();
    write_file();
}

void MetricsExporter::writer_loop() {
    while (true) {
        {
            std::unique_lock lock(cv_mutex_);
            cv_.wait_for(lock, write_interval_, [this] { return !running_; });
            if (!running_) break;
        }
        flush();
    }
}

void MetricsExporter::update_gauges() {
    std::lock_guard lock(queue_mutex_);
    if (!queue_) return;

    auto status = queue_->get_queue_status();
    items_queued_->Set(static_cast<double>(status.queued));
    items_uploading_->Set(static_cast<double>(status.uploading));
    items_completed_->Set(static_cast<double>(status.completed));
    items_failed_->Set(static_cast<double>(status.failed));
    items_total_->Set(static_cast<double>(status.total));
    queue_paused_->Set(status.paused ? 1.0 : 0.0);
}

void MetricsExporter::write_file() {
    if (prom_file_path_.empty()) return;

    auto tmp_path = prom_file_path_;
    tmp_path += ".tmp";

    prometheus::TextSerializer serializer;
    auto metrics = registry_->Collect();

    std::ofstream ofs(tmp_path, std::ios::trunc);
    if (!ofs) {
        log_error("[metrics] Cannot write %s", tmp_path.c_str());
        return;
    }
    ofs << serializer.Serialize(metrics);
    ofs.close();
    if (!ofs.good()) return;

    std::error_code ec;
    std::filesystem::rename(tmp_path, prom_file_path_, ec);
    if (ec) {
        log_error("[metrics] Cannot rename %s: %s", tmp_path.c_str(), ec.message().c_str());
    }
}

}  // namespace attachq
