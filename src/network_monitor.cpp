#include "attachq/network_monitor.hpp"
#include "attachq/log.hpp"

namespace attachq {

void ManualNetworkMonitor::set_connected(bool connected) {
    // Serialize so events are published in the order the flips happen
    std::lock_guard lock(mutex_);
    if (connected_.exchange(connected) == connected) return;
    changes_.publish(ConnectivityChanged{connected});
}

ProbeNetworkMonitor::ProbeNetworkMonitor(std::string probe_url, std::chrono::seconds interval,
                                         const HttpClientConfig& http_config)
    : probe_url_(std::move(probe_url)), interval_(interval), http_(http_config) {}

ProbeNetworkMonitor::~ProbeNetworkMonitor() {
    stop();
}

void ProbeNetworkMonitor::start() {
    {
        std::lock_guard lock(cv_mutex_);
        if (running_) return;
        running_ = true;
    }
    probe_thread_ = std::thread(&ProbeNetworkMonitor::probe_loop, this);
    log_info("[network] Probing %s every %lds", probe_url_.c_str(),
             static_cast<long>(interval_.count()));
}

void ProbeNetworkMonitor::stop() {
    {
        std::lock_guard lock(cv_mutex_);
        if (!running_) return;
        running_ = false;
    }
    cv_.notify_all();
    if (probe_thread_.joinable()) probe_thread_.join();
}

bool ProbeNetworkMonitor::probe_once() {
    HttpRequest req;
    req.method = HttpMethod::HEAD;
    req.url = probe_url_;
    req.connect_timeout = std::chrono::milliseconds(5000);
    req.total_timeout = std::chrono::milliseconds(10000);

    auto resp = http_.execute(req);
    bool connected = !resp.is_network_error && resp.status_code > 0;

    if (connected_.exchange(connected) != connected) {
        if (connected) {
            log_info("[network] Connectivity restored");
        } else {
            log_warn("[network] Connectivity lost: %s", resp.error.c_str());
        }
        changes_.publish(ConnectivityChanged{connected});
    }
    return connected;
}

void ProbeNetworkMonitor::probe_loop() {
    while (true) {
        probe_once();

        std::unique_lock lock(cv_mutex_);
        cv_.wait_for(lock, interval_, [this] { return !running_; });
        if (!running_) break;
    }
}

}  // namespace attachq
