#pragma once

#include "attachq/event_channel.hpp"
#include "attachq/http_client.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>

namespace attachq {

/// Connectivity transition.
struct ConnectivityChanged {
    bool connected = true;
};

/// Source of connectivity transitions. Implementations publish on changes()
/// only when the state actually flips.
class NetworkMonitor {
public:
    virtual ~NetworkMonitor() = default;

    virtual bool is_connected() const = 0;

    /// Begin observing. Default: nothing to do.
    virtual void start() {}

    /// Stop observing. Default: nothing to do.
    virtual void stop() {}

    EventChannel<ConnectivityChanged>& changes() { return changes_; }

protected:
    EventChannel<ConnectivityChanged> changes_;
};

/// Connectivity driven by the caller (tests, embedding applications).
class ManualNetworkMonitor : public NetworkMonitor {
public:
    explicit ManualNetworkMonitor(bool connected = true) : connected_(connected) {}

    bool is_connected() const override { return connected_.load(); }

    /// Publishes a ConnectivityChanged event when the state changes.
    void set_connected(bool connected);

private:
    std::mutex mutex_;
    std::atomic<bool> connected_;
};

/// Polls a URL with HEAD requests. Any HTTP response counts as connected;
/// a network-level failure counts as disconnected.
class ProbeNetworkMonitor : public NetworkMonitor {
public:
    ProbeNetworkMonitor(std::string probe_url, std::chrono::seconds interval,
                        const HttpClientConfig& http_config = {});
    ~ProbeNetworkMonitor() override;

    ProbeNetworkMonitor(const ProbeNetworkMonitor&) = delete;
    ProbeNetworkMonitor& operator=(const ProbeNetworkMonitor&) = delete;

    bool is_connected() const override { return connected_.load(); }

    void start() override;
    void stop() override;

    /// Run a single probe and publish on change. Returns the observed state.
    bool probe_once();

private:
    void probe_loop();

    std::string probe_url_;
    std::chrono::seconds interval_;
    HttpClient http_;

    std::atomic<bool> connected_{true};

    std::thread probe_thread_;
    std::mutex cv_mutex_;
    std::condition_variable cv_;
    bool running_ = false;
};

}  // namespace attachq
