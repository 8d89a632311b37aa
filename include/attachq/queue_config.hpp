#pragma once

#include "attachq/control_plane.hpp"
#include "attachq/retry_policy.hpp"
#include "attachq/upload_queue.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace attachq {

/// Configuration for the attachq daemon / CLI.
struct QueueConfig {
    // Control plane
    std::string api_base_url;
    std::string publishable_key;  // Or ATTACHQ_PUBLISHABLE_KEY env
    std::string user_token;
    std::chrono::seconds request_timeout{30};
    int api_max_retries = 3;  // Per control-plane request

    // Storage
    std::filesystem::path state_dir;     // Default: $HOME/.attachq
    std::filesystem::path storage_path;  // Default: <state_dir>/queue.db

    // Retry
    RetryConfig retry;

    // Queue bound (0 = unbounded)
    size_t max_pending_items = 0;

    // Connectivity probing. An empty URL or a zero interval disables probing
    // and the network is assumed to be up.
    std::string probe_url;  // Default: api_base_url
    std::chrono::seconds probe_interval{30};

    // Daemon
    bool verbose = false;
    bool exit_when_idle = false;
    std::filesystem::path pid_file;
    std::filesystem::path log_file;

    // Prometheus metrics (textfile collector)
    std::filesystem::path metrics_file;
    size_t metrics_interval_secs = 15;

    // Command: run, enqueue, status, retry, cancel, clear-completed, clear-failed
    std::string command = "run";
    std::vector<std::string> command_args;
    std::string mime_type;  // enqueue: overrides extension-based detection

    /// Parse configuration from command line arguments.
    /// Returns empty optional on error or --help (prints usage to stderr).
    static std::optional<QueueConfig> from_args(int argc, char* argv[]);

    /// Load configuration from a JSON file, overlaying onto current values.
    bool load_json(const std::filesystem::path& path);

    /// Fill in defaults (state_dir, storage_path, probe_url).
    void apply_defaults();

    /// Validate required fields. Returns error message or empty string.
    std::string validate() const;

    UploadQueueConfig queue_config() const;
    ControlPlaneConfig control_plane_config() const;

    /// True for commands that keep the worker running.
    bool processes_queue() const { return command == "run" || command == "enqueue"; }
};

}  // namespace attachq
