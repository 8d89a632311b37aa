#pragma once

#include "attachq/http_client.hpp"
#include "attachq/queue_types.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace attachq {

struct PresignResult {
    bool success = false;
    std::string attachment_id;
    std::string upload_url;
    TimePoint upload_expires_at;
    std::string error_message;
};

struct ControlPlaneResult {
    bool success = false;
    std::string error_message;
};

/// Remote API that issues presigned upload URLs and tracks attachment state.
class ControlPlaneClient {
public:
    virtual ~ControlPlaneClient() = default;

    /// Request a presigned upload URL for a new attachment.
    virtual PresignResult presign(const std::string& file_name, const std::string& content_type,
                                  uint64_t file_size) = 0;

    /// Tell the server the bytes for `attachment_id` are in storage.
    virtual ControlPlaneResult confirm(const std::string& attachment_id,
                                       uint64_t bytes_uploaded) = 0;

    /// Record a permanent client-side failure. Callers treat this as best effort.
    virtual ControlPlaneResult report_failure(const std::string& attachment_id,
                                              const std::string& error) = 0;
};

struct ControlPlaneConfig {
    std::string base_url;         // e.g. "https://api.example.com"
    std::string publishable_key;  // Sent as X-Publishable-Key
    std::string user_token;       // Sent as X-User-Token when non-empty
    std::chrono::seconds request_timeout{30};

    // Request-level retry on network errors, 429 and 5xx
    int max_retries = 3;
    std::chrono::milliseconds retry_base_delay{1000};
    std::chrono::milliseconds retry_max_delay{30000};
};

/// ControlPlaneClient over HTTPS/JSON.
///
///   POST {base}/v1/attachments/presign         {filename, content_type, size}
///   POST {base}/v1/attachments/{id}/confirm    {bytes_uploaded}
///   POST {base}/v1/attachments/{id}/failure    {error}
class HttpControlPlaneClient : public ControlPlaneClient {
public:
    explicit HttpControlPlaneClient(ControlPlaneConfig config);

    PresignResult presign(const std::string& file_name, const std::string& content_type,
                          uint64_t file_size) override;
    ControlPlaneResult confirm(const std::string& attachment_id,
                               uint64_t bytes_uploaded) override;
    ControlPlaneResult report_failure(const std::string& attachment_id,
                                      const std::string& error) override;

private:
    HttpResponse post(const std::string& path, const std::string& body) const;
    std::string endpoint(const std::string& path) const;

    ControlPlaneConfig config_;
    HttpClient http_;
};

/// Parse an ISO-8601 UTC timestamp ("2024-05-01T12:00:00Z", optional
/// fractional seconds). Returns nullopt when malformed.
std::optional<TimePoint> parse_iso8601(const std::string& text);

/// Extract a readable message from an API error body {"error": {"code", "message"}}.
/// Falls back to "HTTP <status>" when the body has no such shape.
std::string describe_api_error(const HttpResponse& response);

}  // namespace attachq
