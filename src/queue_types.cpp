#include "attachq/queue_types.hpp"

#include <array>
#include <cstdio>
#include <random>
#include <stdexcept>

#include <nlohmann/json.hpp>
#include <openssl/rand.h>

namespace attachq {

const char* phase_to_string(UploadPhase phase) {
    switch (phase) {
        case UploadPhase::Queued: return "queued";
        case UploadPhase::Uploading: return "uploading";
        case UploadPhase::Confirming: return "confirming";
        case UploadPhase::Completed: return "completed";
        case UploadPhase::Failed: return "failed";
    }
    return "unknown";
}

std::optional<UploadPhase> phase_from_string(const std::string& name) {
    if (name == "queued") return UploadPhase::Queued;
    if (name == "uploading") return UploadPhase::Uploading;
    if (name == "confirming") return UploadPhase::Confirming;
    if (name == "completed") return UploadPhase::Completed;
    if (name == "failed") return UploadPhase::Failed;
    return std::nullopt;
}

int64_t to_epoch_ms(TimePoint tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               tp.time_since_epoch())
        .count();
}

TimePoint from_epoch_ms(int64_t ms) {
    return TimePoint(std::chrono::duration_cast<Clock::duration>(
        std::chrono::milliseconds(ms)));
}

std::string generate_queue_id() {
    std::array<unsigned char, 16> bytes{};
    if (RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1) {
        // CSPRNG unavailable; ids only need to be unique within this queue
        std::random_device rd;
        for (auto& b : bytes) b = static_cast<unsigned char>(rd());
    }

    bytes[6] = static_cast<unsigned char>((bytes[6] & 0x0f) | 0x40);  // version 4
    bytes[8] = static_cast<unsigned char>((bytes[8] & 0x3f) | 0x80);  // RFC 4122 variant

    char buf[37];
    std::snprintf(buf, sizeof(buf),
                  "%02x%02x%02x%02x-%02x%02x-%02x%02x-%02x%02x-%02x%02x%02x%02x%02x%02x",
                  bytes[0], bytes[1], bytes[2], bytes[3], bytes[4], bytes[5],
                  bytes[6], bytes[7], bytes[8], bytes[9], bytes[10], bytes[11],
                  bytes[12], bytes[13], bytes[14], bytes[15]);
    return std::string(buf);
}

// --- JSON ---

namespace {

void put_optional_time(nlohmann::json& j, const char* key, const std::optional<TimePoint>& tp) {
    if (tp) j[key] = to_epoch_ms(*tp);
}

std::optional<TimePoint> get_optional_time(const nlohmann::json& j, const char* key) {
    if (!j.contains(key) || j[key].is_null()) return std::nullopt;
    return from_epoch_ms(j[key].get<int64_t>());
}

}  // namespace

void to_json(nlohmann::json& j, const QueueItem& item) {
    j = nlohmann::json{
        {"id", item.id},
        {"sequence", item.sequence},
        {"attachment_id", item.attachment_id},
        {"local_file", item.local_file},
        {"mime_type", item.mime_type},
        {"file_name", item.file_name},
        {"file_size", item.file_size},
        {"upload_url", item.upload_url},
        {"upload_expires_at", to_epoch_ms(item.upload_expires_at)},
        {"phase", phase_to_string(item.phase)},
        {"progress", item.progress},
        {"attempt_number", item.attempt_number},
        {"max_attempts", item.max_attempts},
        {"created_at", to_epoch_ms(item.created_at)},
    };
    if (item.last_error) j["last_error"] = *item.last_error;
    put_optional_time(j, "started_at", item.started_at);
    put_optional_time(j, "completed_at", item.completed_at);
    put_optional_time(j, "scheduled_retry_at", item.scheduled_retry_at);
}

void from_json(const nlohmann::json& j, QueueItem& item) {
    item.id = j.at("id").get<std::string>();
    item.sequence = j.value("sequence", uint64_t{0});
    item.attachment_id = j.at("attachment_id").get<std::string>();
    item.local_file = j.at("local_file").get<std::string>();
    item.mime_type = j.at("mime_type").get<std::string>();
    item.file_name = j.at("file_name").get<std::string>();
    item.file_size = j.at("file_size").get<uint64_t>();
    item.upload_url = j.at("upload_url").get<std::string>();
    item.upload_expires_at = from_epoch_ms(j.at("upload_expires_at").get<int64_t>());

    auto phase_name = j.at("phase").get<std::string>();
    auto phase = phase_from_string(phase_name);
    if (!phase) throw std::runtime_error("unknown upload phase: " + phase_name);
    item.phase = *phase;

    item.progress = j.value("progress", 0.0);
    item.attempt_number = j.value("attempt_number", uint32_t{0});
    item.max_attempts = j.value("max_attempts", uint32_t{3});
    if (j.contains("last_error") && j["last_error"].is_string()) {
        item.last_error = j["last_error"].get<std::string>();
    } else {
        item.last_error.reset();
    }
    item.created_at = from_epoch_ms(j.at("created_at").get<int64_t>());
    item.started_at = get_optional_time(j, "started_at");
    item.completed_at = get_optional_time(j, "completed_at");
    item.scheduled_retry_at = get_optional_time(j, "scheduled_retry_at");
}

void to_json(nlohmann::json& j, const PersistedQueue& queue) {
    j = nlohmann::json{
        {"version", queue.version},
        {"items", queue.items},
    };
}

void from_json(const nlohmann::json& j, PersistedQueue& queue) {
    queue.version = j.at("version").get<int>();
    queue.items.clear();
    if (queue.version != kPersistedQueueVersion) return;  // Caller decides what to do
    queue.items = j.at("items").get<std::vector<QueueItem>>();
}

}  // namespace attachq
