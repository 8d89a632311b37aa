#pragma once

#include "attachq/http_client.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <string>

namespace attachq {

/// Cancellation token shared between the queue and an in-flight transfer.
class TransferHandle {
public:
    void cancel() { cancelled_.store(true); }
    bool cancelled() const { return cancelled_.load(); }

private:
    std::atomic<bool> cancelled_{false};
};

/// Called with (bytes_sent, bytes_expected). bytes_expected may be 0 while unknown.
using TransferProgressCallback = std::function<void(uint64_t, uint64_t)>;

struct TransferRequest {
    std::string url;
    std::string local_file;
    std::map<std::string, std::string> headers;
    TransferProgressCallback on_progress;
};

struct TransferResult {
    int status = 0;          // HTTP status, 0 when no response was received
    uint64_t bytes_sent = 0;
    bool cancelled = false;
    std::string error;       // Empty when a response was received

    bool success() const { return error.empty() && !cancelled && status >= 200 && status < 300; }
};

/// Streams a local file to a presigned URL.
class TransferExecutor {
public:
    virtual ~TransferExecutor() = default;

    /// Blocks until the transfer finishes, fails, or `handle` is cancelled.
    virtual TransferResult execute(const TransferRequest& request,
                                   std::shared_ptr<TransferHandle> handle) = 0;
};

/// TransferExecutor that issues a binary HTTP PUT via libcurl.
class HttpTransferExecutor : public TransferExecutor {
public:
    explicit HttpTransferExecutor(const HttpClientConfig& config = {});

    TransferResult execute(const TransferRequest& request,
                           std::shared_ptr<TransferHandle> handle) override;

private:
    HttpClient http_;
};

}  // namespace attachq
