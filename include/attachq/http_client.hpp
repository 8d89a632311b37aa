#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>

namespace attachq {

enum class HttpMethod {
    GET,
    POST,
    PUT,
    HEAD,
};

bool is_success_status(int status);

// 429 and 5xx
bool is_retryable_status(int status);

// Request headers; a later set() with the same name (any case) replaces the earlier one
class HttpHeaders {
public:
    void set(const std::string& name, const std::string& value);

    const std::map<std::string, std::pair<std::string, std::string>>& all() const {
        return headers_;
    }

private:
    // lowercase name -> (name as given, value)
    std::map<std::string, std::pair<std::string, std::string>> headers_;
};

// Upload side of libcurl's transfer info
struct HttpProgress {
    uint64_t upload_total = 0;
    uint64_t upload_now = 0;
};

using HttpProgressCallback = std::function<bool(const HttpProgress&)>;  // Return false to abort

struct HttpRequest {
    HttpMethod method = HttpMethod::GET;
    std::string url;
    HttpHeaders headers;
    std::string body;

    // PUT only: stream the request body from this file instead of `body`
    std::string upload_file;

    std::chrono::milliseconds connect_timeout{30000};
    std::chrono::milliseconds total_timeout{0};  // 0 = no overall limit

    HttpProgressCallback progress_callback;

    // Used by execute_with_retry
    int max_retries = 0;
    std::chrono::milliseconds initial_retry_delay{500};
    double retry_backoff_multiplier = 2.0;
    std::chrono::milliseconds max_retry_delay{10000};  // Also caps Retry-After
};

struct HttpResponse {
    int status_code = 0;
    std::string body;
    std::string error;
    bool is_network_error = false;  // No HTTP response was received
    bool aborted = false;           // Progress callback asked to stop
    std::optional<std::chrono::seconds> retry_after;  // From a Retry-After header
    int attempts = 1;

    bool ok() const { return error.empty() && is_success_status(status_code); }
};

struct HttpClientConfig {
    std::string user_agent = "attachq/1.0";
    size_t max_response_size = 4 * 1024 * 1024;
    bool verbose = false;
};

/// Blocking libcurl client. One easy handle per request; safe to share
/// between threads.
class HttpClient {
public:
    explicit HttpClient(const HttpClientConfig& config = {});

    HttpResponse execute(const HttpRequest& request) const;

    /// execute(), repeated on network errors and retryable statuses with
    /// exponential backoff, up to request.max_retries extra attempts. A
    /// Retry-After header replaces the computed delay.
    HttpResponse execute_with_retry(const HttpRequest& request) const;

    const HttpClientConfig& config() const { return config_; }

private:
    HttpClientConfig config_;
};

}  // namespace attachq
