#include "attachq/control_plane.hpp"
#include "attachq/log.hpp"
#include "attachq/metrics.hpp"
#include "attachq/mime.hpp"
#include "attachq/network_monitor.hpp"
#include "attachq/queue_config.hpp"
#include "attachq/queue_storage.hpp"
#include "attachq/transfer_executor.hpp"
#include "attachq/upload_queue.hpp"

#include <chrono>
#include <csignal>
#include <cstdio>
#include <ctime>
#include <fstream>
#include <iostream>
#include <memory>
#include <thread>
#include <unistd.h>

namespace {
volatile std::sig_atomic_t g_shutdown_requested = 0;

void signal_handler(int sig) {
    (void)sig;
    g_shutdown_requested = 1;
}

void write_pid_file(const std::filesystem::path& path) {
    std::ofstream ofs(path);
    if (ofs) {
        ofs << getpid() << "\n";
    }
}

std::string format_time(attachq::TimePoint tp) {
    std::time_t t = attachq::Clock::to_time_t(tp);
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return buf;
}

void print_status(const attachq::UploadQueueService& queue) {
    for (const auto& item : queue.items()) {
        std::cout << item.attachment_id << "  " << attachq::phase_to_string(item.phase)
                  << "  " << static_cast<int>(item.progress * 100) << "%"
                  << "  attempt " << item.attempt_number << "/" << item.max_attempts
                  << "  " << item.file_name << " (" << item.file_size << " bytes)";
        if (item.scheduled_retry_at) {
            std::cout << "  retry at " << format_time(*item.scheduled_retry_at);
        }
        if (item.last_error) {
            std::cout << "  error: " << *item.last_error;
        }
        std::cout << "\n";
    }

    auto s = queue.get_queue_status();
    std::cout << "total=" << s.total << " queued=" << s.queued << " uploading=" << s.uploading
              << " completed=" << s.completed << " failed=" << s.failed
              << (s.paused ? " (paused)" : "") << std::endl;
}

// Returns the number of files that could not be queued.
int enqueue_files(attachq::UploadQueueService& queue, const attachq::QueueConfig& config) {
    int failures = 0;
    for (const auto& arg : config.command_args) {
        std::filesystem::path file = std::filesystem::absolute(arg);
        std::error_code ec;
        if (!std::filesystem::is_regular_file(file, ec)) {
            attachq::log_error("Not a regular file: %s", file.c_str());
            ++failures;
            continue;
        }
        auto size = std::filesystem::file_size(file, ec);
        if (ec) {
            attachq::log_error("Cannot stat %s: %s", file.c_str(), ec.message().c_str());
            ++failures;
            continue;
        }

        std::string mime = config.mime_type.empty() ? attachq::guess_mime_type(file)
                                                    : config.mime_type;
        auto result = queue.enqueue(file.string(), mime, file.filename().string(), size);
        if (!result.success) {
            attachq::log_error("Failed to enqueue %s: %s", file.c_str(),
                               result.error_message.c_str());
            ++failures;
            continue;
        }
        std::cout << result.attachment_id << "  " << file.string() << std::endl;
    }
    return failures;
}
}  // namespace

int main(int argc, char* argv[]) {
    auto config_opt = attachq::QueueConfig::from_args(argc, argv);
    if (!config_opt) {
        return 1;
    }
    auto config = std::move(*config_opt);

    auto err = config.validate();
    if (!err.empty()) {
        std::cerr << "Configuration error: " << err << "\n";
        return 1;
    }

    // Redirect log output if log file specified
    if (!config.log_file.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(
            std::filesystem::path(config.log_file).parent_path(), ec);
        FILE* log = fopen(config.log_file.c_str(), "a");
        if (log) {
            dup2(fileno(log), STDOUT_FILENO);
            dup2(fileno(log), STDERR_FILENO);
            fclose(log);
        }
    }

    attachq::set_verbose(config.verbose);

    const bool daemon_mode = config.processes_queue();
    if (daemon_mode) {
        attachq::log_info("attachq starting...");
        attachq::log_info("  api-url: %s", config.api_base_url.c_str());
        attachq::log_info("  publishable-key: ****");
        attachq::log_info("  storage: %s", config.storage_path.c_str());
        attachq::log_info("  retry: base=%lldms max=%lldms jitter=%lldms attempts=%u",
                          static_cast<long long>(config.retry.base_delay.count()),
                          static_cast<long long>(config.retry.max_delay.count()),
                          static_cast<long long>(config.retry.jitter.count()),
                          config.retry.max_attempts);
        if (config.max_pending_items > 0) {
            attachq::log_info("  max-pending: %zu", config.max_pending_items);
        }
    }

    // Collaborators
    auto storage = std::make_shared<attachq::QueueStorage>(config.storage_path);
    auto control_plane =
        std::make_shared<attachq::HttpControlPlaneClient>(config.control_plane_config());
    auto transfer = std::make_shared<attachq::HttpTransferExecutor>();

    std::shared_ptr<attachq::NetworkMonitor> network;
    if (daemon_mode && !config.probe_url.empty() && config.probe_interval.count() > 0) {
        network = std::make_shared<attachq::ProbeNetworkMonitor>(config.probe_url,
                                                                 config.probe_interval);
    } else {
        network = std::make_shared<attachq::ManualNetworkMonitor>(true);
    }

    std::unique_ptr<attachq::MetricsExporter> metrics;
    if (daemon_mode && !config.metrics_file.empty()) {
        metrics = std::make_unique<attachq::MetricsExporter>(
            config.metrics_file, std::chrono::seconds(config.metrics_interval_secs));
    }

    attachq::UploadQueueService queue(storage, control_plane, transfer, network, metrics.get());

    err = queue.initialize(config.queue_config());
    if (!err.empty()) {
        std::cerr << "Failed to start upload queue: " << err << std::endl;
        return 1;
    }

    // --- One-shot commands ---

    if (config.command == "status") {
        print_status(queue);
        return 0;
    }
    if (config.command == "retry" || config.command == "cancel") {
        const auto& id = config.command_args.front();
        err = config.command == "retry" ? queue.retry_item(id) : queue.cancel_item(id);
        if (!err.empty()) {
            std::cerr << "Error: " << err << std::endl;
            return 1;
        }
        std::cout << config.command << ": " << id << std::endl;
        return 0;
    }
    if (config.command == "clear-completed") {
        std::cout << "Removed " << queue.clear_completed() << " completed items" << std::endl;
        return 0;
    }
    if (config.command == "clear-failed") {
        std::cout << "Removed " << queue.clear_failed() << " failed items" << std::endl;
        return 0;
    }

    // --- Processing: run / enqueue ---

    if (!config.pid_file.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(
            std::filesystem::path(config.pid_file).parent_path(), ec);
        write_pid_file(config.pid_file);
    }

    struct sigaction sa;
    sa.sa_handler = signal_handler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);

    auto progress_sub = queue.on_progress([](const attachq::UploadProgress& p) {
        if (p.error && p.phase != attachq::UploadPhase::Uploading) {
            attachq::log_info("[progress] %s %s %.0f%% (%s)", p.attachment_id.c_str(),
                              attachq::phase_to_string(p.phase), p.progress * 100,
                              p.error->c_str());
        } else {
            attachq::log_info("[progress] %s %s %.0f%%", p.attachment_id.c_str(),
                              attachq::phase_to_string(p.phase), p.progress * 100);
        }
    });

    if (metrics) {
        metrics->set_queue(&queue);
        metrics->start();
    }
    network->start();

    int enqueue_failures = 0;
    if (config.command == "enqueue") {
        enqueue_failures = enqueue_files(queue, config);
    }

    attachq::log_info("attachq running (PID %d)", static_cast<int>(getpid()));

    // Wait until shutdown signal or, with --exit-when-idle, an empty queue
    while (!g_shutdown_requested) {
        if (config.exit_when_idle && queue.is_idle()) break;
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    auto status = queue.get_queue_status();
    network->stop();
    queue.destroy();
    queue.flush_events();
    if (metrics) {
        metrics->set_queue(nullptr);
        metrics->stop();
    }

    if (!config.pid_file.empty()) {
        unlink(config.pid_file.c_str());
    }

    attachq::log_info("attachq exited cleanly (completed=%zu failed=%zu pending=%zu)",
                      status.completed, status.failed, status.queued + status.uploading);
    return enqueue_failures > 0 ? 1 : 0;
}
