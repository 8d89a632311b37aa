#include "attachq/queue_config.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <set>
#include <nlohmann/json.hpp>

namespace attachq {

namespace {

const std::set<std::string>& known_commands() {
    static const std::set<std::string> commands = {
        "run", "enqueue", "status", "retry", "cancel", "clear-completed", "clear-failed",
    };
    return commands;
}

void print_usage() {
    std::cerr <<
        "Usage: attachq --api-url <url> --publishable-key <key> [options] [command]\n"
        "\n"
        "Commands:\n"
        "  run                              Process the persisted queue (default)\n"
        "  enqueue <file>...                Queue files for upload, then process\n"
        "  status                           Print queue items and counts\n"
        "  retry <attachment_id>            Requeue a failed item\n"
        "  cancel <attachment_id>           Remove an item, cancelling its upload\n"
        "  clear-completed                  Remove completed items\n"
        "  clear-failed                     Remove failed items\n"
        "\n"
        "Control plane:\n"
        "  --api-url <url>                  API base URL\n"
        "  --publishable-key <key>          Publishable key (or ATTACHQ_PUBLISHABLE_KEY env)\n"
        "  --user-token <token>             Optional end-user token\n"
        "  --request-timeout <secs>         API request timeout (default: 30)\n"
        "  --api-retries <N>                Retries per API request on 429/5xx/network errors (default: 3)\n"
        "\n"
        "Queue options:\n"
        "  --config <path>                  JSON config file\n"
        "  --state-dir <path>               State directory (default: $HOME/.attachq)\n"
        "  --storage-path <path>            Queue database (default: <state-dir>/queue.db)\n"
        "  --retry-base-ms <N>              First retry delay (default: 2000)\n"
        "  --retry-max-ms <N>               Retry delay cap (default: 60000)\n"
        "  --retry-jitter-ms <N>            Retry jitter, +/- (default: 1000)\n"
        "  --retry-attempts <N>             Attempts per item (default: 3)\n"
        "  --max-pending <N>                Reject enqueue beyond N pending items (default: 0, unbounded)\n"
        "  --mime <type>                    MIME type for enqueued files (default: from extension)\n"
        "\n"
        "Connectivity:\n"
        "  --probe-url <url>                URL probed with HEAD (default: API base URL)\n"
        "  --probe-interval <secs>          Probe interval, 0 disables (default: 30)\n"
        "\n"
        "Daemon:\n"
        "  --exit-when-idle                 Exit once no pending items remain\n"
        "  --verbose                        Verbose output\n"
        "  --pid-file <path>                PID file path\n"
        "  --log-file <path>                Log file path\n"
        "  --metrics-file <path>            Prometheus .prom file for node_exporter textfile collector\n"
        "  --metrics-interval <secs>        Metrics write interval (default: 15)\n"
        "  --help                           Show this help\n";
}

}  // namespace

std::optional<QueueConfig> QueueConfig::from_args(int argc, char* argv[]) {
    QueueConfig config;
    bool command_seen = false;

    auto next_arg = [&](int& i, const char* name) -> const char* {
        if (i + 1 >= argc) {
            std::cerr << "Error: " << name << " requires an argument\n";
            return nullptr;
        }
        return argv[++i];
    };

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];

            if (arg == "--api-url") {
                auto* v = next_arg(i, "--api-url");
                if (!v) return std::nullopt;
                config.api_base_url = v;
            } else if (arg == "--publishable-key") {
                auto* v = next_arg(i, "--publishable-key");
                if (!v) return std::nullopt;
                config.publishable_key = v;
            } else if (arg == "--user-token") {
                auto* v = next_arg(i, "--user-token");
                if (!v) return std::nullopt;
                config.user_token = v;
            } else if (arg == "--request-timeout") {
                auto* v = next_arg(i, "--request-timeout");
                if (!v) return std::nullopt;
                config.request_timeout = std::chrono::seconds(std::stoull(v));
            } else if (arg == "--api-retries") {
                auto* v = next_arg(i, "--api-retries");
                if (!v) return std::nullopt;
                config.api_max_retries = std::stoi(v);
            } else if (arg == "--config") {
                auto* v = next_arg(i, "--config");
                if (!v) return std::nullopt;
                if (!config.load_json(v)) return std::nullopt;
            } else if (arg == "--state-dir") {
                auto* v = next_arg(i, "--state-dir");
                if (!v) return std::nullopt;
                config.state_dir = v;
            } else if (arg == "--storage-path") {
                auto* v = next_arg(i, "--storage-path");
                if (!v) return std::nullopt;
                config.storage_path = v;
            } else if (arg == "--retry-base-ms") {
                auto* v = next_arg(i, "--retry-base-ms");
                if (!v) return std::nullopt;
                config.retry.base_delay = std::chrono::milliseconds(std::stoull(v));
            } else if (arg == "--retry-max-ms") {
                auto* v = next_arg(i, "--retry-max-ms");
                if (!v) return std::nullopt;
                config.retry.max_delay = std::chrono::milliseconds(std::stoull(v));
            } else if (arg == "--retry-jitter-ms") {
                auto* v = next_arg(i, "--retry-jitter-ms");
                if (!v) return std::nullopt;
                config.retry.jitter = std::chrono::milliseconds(std::stoull(v));
            } else if (arg == "--retry-attempts") {
                auto* v = next_arg(i, "--retry-attempts");
                if (!v) return std::nullopt;
                config.retry.max_attempts = static_cast<uint32_t>(std::stoul(v));
            } else if (arg == "--max-pending") {
                auto* v = next_arg(i, "--max-pending");
                if (!v) return std::nullopt;
                config.max_pending_items = std::stoull(v);
            } else if (arg == "--mime") {
                auto* v = next_arg(i, "--mime");
                if (!v) return std::nullopt;
                config.mime_type = v;
            } else if (arg == "--probe-url") {
                auto* v = next_arg(i, "--probe-url");
                if (!v) return std::nullopt;
                config.probe_url = v;
            } else if (arg == "--probe-interval") {
                auto* v = next_arg(i, "--probe-interval");
                if (!v) return std::nullopt;
                config.probe_interval = std::chrono::seconds(std::stoull(v));
            } else if (arg == "--exit-when-idle") {
                config.exit_when_idle = true;
            } else if (arg == "--verbose") {
                config.verbose = true;
            } else if (arg == "--pid-file") {
                auto* v = next_arg(i, "--pid-file");
                if (!v) return std::nullopt;
                config.pid_file = v;
            } else if (arg == "--log-file") {
                auto* v = next_arg(i, "--log-file");
                if (!v) return std::nullopt;
                config.log_file = v;
            } else if (arg == "--metrics-file") {
                auto* v = next_arg(i, "--metrics-file");
                if (!v) return std::nullopt;
                config.metrics_file = v;
            } else if (arg == "--metrics-interval") {
                auto* v = next_arg(i, "--metrics-interval");
                if (!v) return std::nullopt;
                config.metrics_interval_secs = std::stoull(v);
            } else if (arg == "--help" || arg == "-h") {
                print_usage();
                return std::nullopt;
            } else if (arg.compare(0, 2, "--") == 0) {
                std::cerr << "Error: unknown option: " << arg << "\n";
                return std::nullopt;
            } else if (!command_seen) {
                if (known_commands().count(arg) == 0) {
                    std::cerr << "Error: unknown command: " << arg << "\n";
                    return std::nullopt;
                }
                config.command = arg;
                command_seen = true;
            } else {
                config.command_args.push_back(arg);
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: invalid numeric argument (" << e.what() << ")\n";
        return std::nullopt;
    }

    if (config.publishable_key.empty()) {
        if (const char* v = std::getenv("ATTACHQ_PUBLISHABLE_KEY")) {
            config.publishable_key = v;
        }
    }

    config.apply_defaults();
    return config;
}

bool QueueConfig::load_json(const std::filesystem::path& path) {
    try {
        std::ifstream ifs(path);
        if (!ifs) {
            std::cerr << "Error: cannot open config file: " << path << "\n";
            return false;
        }
        auto j = nlohmann::json::parse(ifs);

        if (j.contains("api_base_url")) api_base_url = j["api_base_url"].get<std::string>();
        if (j.contains("publishable_key")) publishable_key = j["publishable_key"].get<std::string>();
        if (j.contains("user_token")) user_token = j["user_token"].get<std::string>();
        if (j.contains("request_timeout"))
            request_timeout = std::chrono::seconds(j["request_timeout"].get<uint64_t>());
        if (j.contains("api_max_retries")) api_max_retries = j["api_max_retries"].get<int>();
        if (j.contains("state_dir")) state_dir = j["state_dir"].get<std::string>();
        if (j.contains("storage_path")) storage_path = j["storage_path"].get<std::string>();
        if (j.contains("max_pending_items")) max_pending_items = j["max_pending_items"].get<size_t>();
        if (j.contains("probe_url")) probe_url = j["probe_url"].get<std::string>();
        if (j.contains("probe_interval"))
            probe_interval = std::chrono::seconds(j["probe_interval"].get<uint64_t>());
        if (j.contains("verbose")) verbose = j["verbose"].get<bool>();
        if (j.contains("exit_when_idle")) exit_when_idle = j["exit_when_idle"].get<bool>();
        if (j.contains("pid_file")) pid_file = j["pid_file"].get<std::string>();
        if (j.contains("log_file")) log_file = j["log_file"].get<std::string>();
        if (j.contains("metrics_file")) metrics_file = j["metrics_file"].get<std::string>();
        if (j.contains("metrics_interval")) metrics_interval_secs = j["metrics_interval"].get<size_t>();

        if (j.contains("retry") && j["retry"].is_object()) {
            auto& jr = j["retry"];
            if (jr.contains("base_delay_ms"))
                retry.base_delay = std::chrono::milliseconds(jr["base_delay_ms"].get<uint64_t>());
            if (jr.contains("max_delay_ms"))
                retry.max_delay = std::chrono::milliseconds(jr["max_delay_ms"].get<uint64_t>());
            if (jr.contains("jitter_ms"))
                retry.jitter = std::chrono::milliseconds(jr["jitter_ms"].get<uint64_t>());
            if (jr.contains("max_attempts")) retry.max_attempts = jr["max_attempts"].get<uint32_t>();
        }

        return true;
    } catch (const std::exception& e) {
        std::cerr << "Error parsing config: " << e.what() << "\n";
        return false;
    }
}

void QueueConfig::apply_defaults() {
    if (state_dir.empty()) {
        const char* home = std::getenv("HOME");
        state_dir = std::filesystem::path(home && *home ? home : ".") / ".attachq";
    }
    if (storage_path.empty()) {
        storage_path = state_dir / "queue.db";
    }
    if (probe_url.empty()) {
        probe_url = api_base_url;
    }
}

std::string QueueConfig::validate() const {
    if (api_base_url.empty()) return "api_base_url is required (--api-url)";
    if (api_base_url.compare(0, 7, "http://") != 0 && api_base_url.compare(0, 8, "https://") != 0)
        return "api_base_url must start with http:// or https://";
    if (publishable_key.empty())
        return "publishable_key is required (--publishable-key or ATTACHQ_PUBLISHABLE_KEY)";
    if (api_max_retries < 0) return "api_max_retries must be >= 0";
    if (retry.max_attempts == 0) return "retry.max_attempts must be >= 1";
    if (retry.base_delay > retry.max_delay) return "retry.base_delay_ms must be <= retry.max_delay_ms";
    if (storage_path.empty()) return "storage_path is required";

    if (known_commands().count(command) == 0) return "unknown command: " + command;
    if (command == "enqueue" && command_args.empty()) return "enqueue requires at least one file";
    if ((command == "retry" || command == "cancel") && command_args.size() != 1)
        return command + " requires exactly one attachment id";
    if (command != "enqueue" && command != "retry" && command != "cancel" && !command_args.empty())
        return command + " takes no arguments";
    return {};
}

UploadQueueConfig QueueConfig::queue_config() const {
    UploadQueueConfig qc;
    qc.retry = retry;
    qc.max_pending_items = max_pending_items;
    qc.process_items = processes_queue();
    return qc;
}

ControlPlaneConfig QueueConfig::control_plane_config() const {
    ControlPlaneConfig cp;
    cp.base_url = api_base_url;
    cp.publishable_key = publishable_key;
    cp.user_token = user_token;
    cp.request_timeout = request_timeout;
    cp.max_retries = api_max_retries;
    return cp;
}

}  // namespace attachq
