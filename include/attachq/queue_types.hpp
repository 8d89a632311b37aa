#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json_fwd.hpp>

namespace attachq {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

/// Phases of an attachment's upload lifecycle.
///
///   Queued -> Uploading -> Confirming -> Completed
///
/// Uploading and Confirming fall back to Queued when a retry is scheduled, or
/// advance to Failed once attempts are exhausted. Completed and Failed are
/// terminal: only deletion removes an item from them.
enum class UploadPhase {
    Queued,
    Uploading,
    Confirming,
    Completed,
    Failed,
};

const char* phase_to_string(UploadPhase phase);
std::optional<UploadPhase> phase_from_string(const std::string& name);

inline bool is_terminal(UploadPhase phase) {
    return phase == UploadPhase::Completed || phase == UploadPhase::Failed;
}

/// One attachment's upload lifecycle record.
struct QueueItem {
    // Identity
    std::string id;             // Internal queue item id (random UUID)
    uint64_t sequence = 0;      // Enqueue order; the loop picks the lowest eligible
    std::string attachment_id;  // Server-assigned, used for all external addressing

    // Payload descriptors (immutable after creation)
    std::string local_file;
    std::string mime_type;
    std::string file_name;
    uint64_t file_size = 0;

    // Transfer target
    std::string upload_url;
    TimePoint upload_expires_at;

    // State
    UploadPhase phase = UploadPhase::Queued;
    double progress = 0.0;
    uint32_t attempt_number = 0;
    uint32_t max_attempts = 3;
    std::optional<std::string> last_error;

    // Timestamps
    TimePoint created_at;
    std::optional<TimePoint> started_at;
    std::optional<TimePoint> completed_at;
    std::optional<TimePoint> scheduled_retry_at;
};

/// Aggregate counts, recomputed from the live item set on every call.
struct QueueStatus {
    size_t total = 0;
    size_t queued = 0;
    size_t uploading = 0;  // Uploading + Confirming
    size_t completed = 0;
    size_t failed = 0;
    bool paused = false;
};

/// Read-only progress event payload.
struct UploadProgress {
    std::string attachment_id;
    UploadPhase phase = UploadPhase::Queued;
    double progress = 0.0;
    std::optional<std::string> error;
};

struct UploadCompleted {
    std::string attachment_id;
};

struct UploadFailed {
    std::string attachment_id;
    std::string error;
};

/// Schema version of the persisted envelope.
constexpr int kPersistedQueueVersion = 1;

/// Versioned envelope written to queue storage: { "version": 1, "items": [...] }
struct PersistedQueue {
    int version = kPersistedQueueVersion;
    std::vector<QueueItem> items;
};

int64_t to_epoch_ms(TimePoint tp);
TimePoint from_epoch_ms(int64_t ms);

/// Random RFC 4122 version 4 UUID, e.g. "3f0c2a9e-....".
std::string generate_queue_id();

void to_json(nlohmann::json& j, const QueueItem& item);
void from_json(const nlohmann::json& j, QueueItem& item);
void to_json(nlohmann::json& j, const PersistedQueue& queue);
void from_json(const nlohmann::json& j, PersistedQueue& queue);

}  // namespace attachq
