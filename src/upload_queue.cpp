#include "attachq/upload_queue.hpp"
#include "attachq/log.hpp"
#include "attachq/metrics.hpp"

#include <algorithm>

namespace attachq {

namespace {

UploadProgress make_progress(const QueueItem& item) {
    return UploadProgress{item.attachment_id, item.phase, item.progress, item.last_error};
}

long long as_millis(std::chrono::milliseconds d) {
    return static_cast<long long>(d.count());
}

}  // namespace

UploadQueueService::UploadQueueService(std::shared_ptr<QueueStorage> storage,
                                       std::shared_ptr<ControlPlaneClient> control_plane,
                                       std::shared_ptr<TransferExecutor> transfer,
                                       std::shared_ptr<NetworkMonitor> network,
                                       MetricsExporter* metrics)
    : storage_(std::move(storage))
    , control_plane_(std::move(control_plane))
    , transfer_(std::move(transfer))
    , network_(std::move(network))
    , metrics_(metrics) {}

UploadQueueService::~UploadQueueService() {
    destroy();
}

// ============================================================================
// Lifecycle
// ============================================================================

std::string UploadQueueService::initialize(const UploadQueueConfig& config) {
    std::lock_guard lifecycle(lifecycle_mutex_);
    {
        std::lock_guard lock(mutex_);
        if (initialized_) return "";
    }

    if (!storage_ || !control_plane_ || !transfer_) {
        return "Upload queue requires storage, control plane and transfer executor";
    }
    if (config.retry.max_attempts == 0) {
        return "retry.max_attempts must be at least 1";
    }
    if (config.retry.base_delay > config.retry.max_delay) {
        return "retry.base_delay must not exceed retry.max_delay";
    }

    // One process owns a queue database at a time
    auto owner = std::make_unique<QueueLock>(QueueLock::for_database(storage_->path()));
    if (auto err = owner->try_lock(); !err.empty()) {
        log_error("[upload-queue] %s", err.c_str());
        return err;
    }
    owner_lock_ = std::move(owner);

    auto loaded = storage_->load_queue();

    // Listen before sampling connectivity so no transition is missed
    if (network_) {
        network_subscription_ = network_->changes().listen([this](const ConnectivityChanged& ev) {
            on_connectivity_changed(ev.connected);
        });
    }

    size_t recovered = 0;
    {
        std::lock_guard lock(mutex_);
        config_ = config;
        retry_policy_ = std::make_unique<RetryPolicy>(config.retry);
        items_.clear();
        scheduler_.clear();
        active_sequence_.reset();
        active_handle_.reset();
        next_sequence_ = 1;

        std::sort(loaded.begin(), loaded.end(),
                  [](const QueueItem& a, const QueueItem& b) { return a.sequence < b.sequence; });

        bool has_queued = false;
        for (auto& item : loaded) {
            // Crash recovery: an interrupted attempt starts over and is not charged
            if (item.phase == UploadPhase::Uploading || item.phase == UploadPhase::Confirming) {
                item.phase = UploadPhase::Queued;
                item.progress = 0.0;
                if (item.attempt_number > 0) --item.attempt_number;
                ++recovered;
            }
            if (item.sequence == 0 || items_.count(item.sequence)) {
                item.sequence = next_sequence_;
            }
            next_sequence_ = std::max(next_sequence_, item.sequence + 1);

            if (item.phase == UploadPhase::Queued) {
                has_queued = true;
                if (item.scheduled_retry_at) {
                    scheduler_.schedule(item.sequence, *item.scheduled_retry_at);
                }
            }
            uint64_t seq = item.sequence;
            items_.emplace(seq, std::move(item));
        }

        stats_.items_recovered += recovered;
        paused_ = network_ && !network_->is_connected();
        stopping_ = false;
        trigger_ = has_queued;
        initialized_ = true;

        if (recovered > 0) persist();
    }

    if (config.process_items) {
        worker_thread_ = std::thread(&UploadQueueService::worker_loop, this);
    }

    log_info("[upload-queue] Initialized with %zu items (%zu recovered)%s",
             loaded.size(), recovered, is_paused() ? ", paused: offline" : "");
    return "";
}

void UploadQueueService::destroy() {
    std::lock_guard lifecycle(lifecycle_mutex_);
    {
        std::lock_guard lock(mutex_);
        if (!initialized_) return;
        initialized_ = false;
        stopping_ = true;
        if (active_handle_) active_handle_->cancel();
    }
    cv_.notify_all();
    if (worker_thread_.joinable()) worker_thread_.join();

    network_subscription_.unsubscribe();
    if (network_) {
        // Let an in-flight connectivity callback finish before state goes away
        network_->changes().flush();
    }

    {
        std::lock_guard lock(mutex_);
        items_.clear();
        scheduler_.clear();
        active_sequence_.reset();
        active_handle_.reset();
        paused_ = false;
        trigger_ = false;
        stopping_ = false;
    }
    owner_lock_.reset();
    log_info("[upload-queue] Stopped");
}

bool UploadQueueService::is_initialized() const {
    std::lock_guard lock(mutex_);
    return initialized_;
}

// ============================================================================
// Queue operations
// ============================================================================

EnqueueResult UploadQueueService::enqueue(const std::string& local_file,
                                          const std::string& mime_type,
                                          const std::string& file_name,
                                          uint64_t file_size) {
    EnqueueResult result;
    {
        std::lock_guard lock(mutex_);
        if (!initialized_) {
            result.error_message = "Upload queue not initialized";
            return result;
        }
        if (config_.max_pending_items > 0 && pending_count() >= config_.max_pending_items) {
            result.error_message = "Upload queue is full (" +
                                   std::to_string(config_.max_pending_items) + " pending items)";
            return result;
        }
    }

    PresignResult presigned;
    try {
        presigned = control_plane_->presign(file_name, mime_type, file_size);
    } catch (const std::exception& e) {
        presigned.success = false;
        presigned.error_message = std::string("Presign failed: ") + e.what();
    }

    std::lock_guard lock(mutex_);
    if (!presigned.success) {
        ++stats_.presign_failures;
        if (metrics_) metrics_->presign_failures_total().Increment();
        log_error("[upload-queue] Cannot enqueue %s: %s", file_name.c_str(),
                  presigned.error_message.c_str());
        result.error_message = presigned.error_message;
        return result;
    }
    if (!initialized_) {
        result.error_message = "Upload queue was shut down";
        return result;
    }

    QueueItem item;
    item.id = generate_queue_id();
    const uint64_t seq = next_sequence_++;
    item.sequence = seq;
    item.attachment_id = presigned.attachment_id;
    item.local_file = local_file;
    item.mime_type = mime_type;
    item.file_name = file_name;
    item.file_size = file_size;
    item.upload_url = presigned.upload_url;
    item.upload_expires_at = presigned.upload_expires_at;
    item.phase = UploadPhase::Queued;
    item.max_attempts = config_.retry.max_attempts;
    item.created_at = Clock::now();

    auto& stored = items_.emplace(seq, std::move(item)).first->second;
    ++stats_.enqueued;
    persist();
    emit_progress(stored);

    log_info("[upload-queue] Queued %s as %s (%lu bytes)", stored.file_name.c_str(),
             stored.attachment_id.c_str(), static_cast<unsigned long>(stored.file_size));

    result.success = true;
    result.attachment_id = stored.attachment_id;
    result.queue_item_id = stored.id;
    wake_worker();
    return result;
}

QueueStatus UploadQueueService::get_queue_status() const {
    std::lock_guard lock(mutex_);
    QueueStatus status;
    status.total = items_.size();
    status.paused = paused_;
    for (const auto& [seq, item] : items_) {
        switch (item.phase) {
            case UploadPhase::Queued: ++status.queued; break;
            case UploadPhase::Uploading:
            case UploadPhase::Confirming: ++status.uploading; break;
            case UploadPhase::Completed: ++status.completed; break;
            case UploadPhase::Failed: ++status.failed; break;
        }
    }
    return status;
}

std::optional<QueueItem> UploadQueueService::get_item_by_attachment_id(
        const std::string& attachment_id) const {
    std::lock_guard lock(mutex_);
    const QueueItem* item = find_by_attachment_id(attachment_id);
    if (!item) return std::nullopt;
    return *item;
}

std::vector<QueueItem> UploadQueueService::items() const {
    std::lock_guard lock(mutex_);
    std::vector<QueueItem> out;
    out.reserve(items_.size());
    for (const auto& [seq, item] : items_) out.push_back(item);
    return out;
}

std::string UploadQueueService::retry_item(const std::string& attachment_id) {
    std::lock_guard lock(mutex_);
    if (!initialized_) return "Upload queue not initialized";

    QueueItem* item = find_by_attachment_id(attachment_id);
    if (!item) return "No queue item for attachment " + attachment_id;
    if (item->phase != UploadPhase::Failed) {
        return "Attachment " + attachment_id + " is not failed (phase: " +
               phase_to_string(item->phase) + ")";
    }

    item->phase = UploadPhase::Queued;
    item->attempt_number = 0;
    item->progress = 0.0;
    item->last_error.reset();
    item->scheduled_retry_at.reset();
    item->completed_at.reset();
    scheduler_.cancel(item->sequence);

    persist();
    emit_progress(*item);
    log_info("[upload-queue] Retrying %s", attachment_id.c_str());
    wake_worker();
    return "";
}

std::string UploadQueueService::cancel_item(const std::string& attachment_id) {
    std::lock_guard lock(mutex_);
    if (!initialized_) return "Upload queue not initialized";

    QueueItem* item = find_by_attachment_id(attachment_id);
    if (!item) return "No queue item for attachment " + attachment_id;

    uint64_t seq = item->sequence;
    if (active_sequence_ == seq && active_handle_) {
        active_handle_->cancel();
        active_handle_.reset();
        active_sequence_.reset();
    }
    scheduler_.cancel(seq);
    items_.erase(seq);
    persist();

    log_info("[upload-queue] Cancelled %s", attachment_id.c_str());
    return "";
}

size_t UploadQueueService::clear_completed() {
    std::lock_guard lock(mutex_);
    if (!initialized_) return 0;
    return remove_phase(UploadPhase::Completed);
}

size_t UploadQueueService::clear_failed() {
    std::lock_guard lock(mutex_);
    if (!initialized_) return 0;
    return remove_phase(UploadPhase::Failed);
}

bool UploadQueueService::is_idle() const {
    std::lock_guard lock(mutex_);
    return pending_count() == 0;
}

bool UploadQueueService::is_paused() const {
    std::lock_guard lock(mutex_);
    return paused_;
}

// ============================================================================
// Events
// ============================================================================

Subscription UploadQueueService::on_progress(std::function<void(const UploadProgress&)> callback) {
    return progress_events_.listen(std::move(callback));
}

Subscription UploadQueueService::on_complete(std::function<void(const UploadCompleted&)> callback) {
    return complete_events_.listen(std::move(callback));
}

Subscription UploadQueueService::on_error(std::function<void(const UploadFailed&)> callback) {
    return error_events_.listen(std::move(callback));
}

std::shared_ptr<EventReceiver<UploadProgress>> UploadQueueService::subscribe_progress() {
    return progress_events_.subscribe();
}

std::shared_ptr<EventReceiver<UploadCompleted>> UploadQueueService::subscribe_complete() {
    return complete_events_.subscribe();
}

std::shared_ptr<EventReceiver<UploadFailed>> UploadQueueService::subscribe_error() {
    return error_events_.subscribe();
}

void UploadQueueService::flush_events() {
    progress_events_.flush();
    complete_events_.flush();
    error_events_.flush();
}

UploadQueueService::Stats UploadQueueService::get_stats() const {
    std::lock_guard lock(mutex_);
    return stats_;
}

// ============================================================================
// Worker
// ============================================================================

void UploadQueueService::worker_loop() {
    Lock lock(mutex_);
    while (!stopping_) {
        if (!paused_) {
            auto next = select_next(Clock::now());
            if (next) {
                process_item(lock, *next);
                continue;
            }
        }

        // Nothing eligible: sleep until triggered or the earliest retry is due
        trigger_ = false;
        auto wake = [this] { return stopping_ || (trigger_ && !paused_); };
        std::optional<TimePoint> due = paused_ ? std::nullopt : scheduler_.next_due();
        if (due) {
            cv_.wait_until(lock, *due, wake);
        } else {
            cv_.wait(lock, wake);
        }
    }
}

std::optional<uint64_t> UploadQueueService::select_next(TimePoint now) {
    scheduler_.pop_due(now);
    for (const auto& [seq, item] : items_) {
        if (item.phase != UploadPhase::Queued) continue;
        if (item.scheduled_retry_at && *item.scheduled_retry_at > now) continue;
        return seq;
    }
    return std::nullopt;
}

void UploadQueueService::process_item(Lock& lock, uint64_t sequence) {
    auto now = Clock::now();
    QueueItem& item = items_.at(sequence);

    if (item.upload_expires_at <= now) {
        fail_item(lock, sequence, "Upload URL expired");
        return;
    }
    // Guard for a persisted item whose attempt count already exhausts its budget
    if (item.attempt_number >= item.max_attempts) {
        fail_item(lock, sequence, item.last_error.value_or("Maximum upload attempts reached"));
        return;
    }

    item.phase = UploadPhase::Uploading;
    item.attempt_number += 1;
    item.started_at = now;
    item.progress = 0.0;
    item.scheduled_retry_at.reset();
    scheduler_.cancel(sequence);

    auto handle = std::make_shared<TransferHandle>();
    active_sequence_ = sequence;
    active_handle_ = handle;
    const uint32_t attempt = item.attempt_number;

    persist();
    emit_progress(item);
    log_info("[upload-queue] Uploading %s (attempt %u/%u)", item.attachment_id.c_str(),
             attempt, item.max_attempts);

    TransferRequest request;
    request.url = item.upload_url;
    request.local_file = item.local_file;
    request.headers["Content-Type"] = item.mime_type;
    request.on_progress = [this, sequence, attempt, handle](uint64_t sent, uint64_t expected) {
        on_transfer_progress(sequence, attempt, handle, sent, expected);
    };
    const std::string attachment_id = item.attachment_id;
    const uint64_t file_size = item.file_size;

    auto release_active = [&] {
        if (active_handle_ == handle) {
            active_handle_.reset();
            active_sequence_.reset();
        }
    };

    // --- Transfer (unlocked) ---
    lock.unlock();
    TransferResult transferred;
    try {
        if (metrics_) {
            ScopedTimer timer(metrics_->upload_duration());
            transferred = transfer_->execute(request, handle);
        } else {
            transferred = transfer_->execute(request, handle);
        }
    } catch (const std::exception& e) {
        transferred = TransferResult{};
        transferred.error = std::string("Transfer error: ") + e.what();
    }
    lock.lock();

    if (stopping_ || handle->cancelled() || !items_.count(sequence)) {
        // Cancelled, paused or destroyed; whoever cancelled owns the item state
        ++stats_.transfers_cancelled;
        release_active();
        log_debug("[upload-queue] Transfer for %s abandoned", attachment_id.c_str());
        return;
    }

    if (!transferred.success()) {
        std::string error = !transferred.error.empty()
                                ? transferred.error
                                : "Upload failed with HTTP status " + std::to_string(transferred.status);
        release_active();
        handle_attempt_failure(lock, sequence, error);
        return;
    }

    {
        QueueItem& current = items_.at(sequence);
        current.phase = UploadPhase::Confirming;
        current.progress = 1.0;
        persist();
        emit_progress(current);
    }

    // --- Confirm (unlocked) ---
    lock.unlock();
    ControlPlaneResult confirmed;
    try {
        confirmed = control_plane_->confirm(attachment_id, file_size);
    } catch (const std::exception& e) {
        confirmed = ControlPlaneResult{};
        confirmed.error_message = std::string("Confirm failed: ") + e.what();
    }
    lock.lock();

    release_active();
    if (stopping_ || handle->cancelled() || !items_.count(sequence)) {
        log_debug("[upload-queue] Confirmation for %s abandoned", attachment_id.c_str());
        return;
    }

    if (!confirmed.success) {
        handle_attempt_failure(lock, sequence, confirmed.error_message);
        return;
    }

    QueueItem& done = items_.at(sequence);
    done.phase = UploadPhase::Completed;
    done.progress = 1.0;
    done.completed_at = Clock::now();
    done.last_error.reset();
    done.scheduled_retry_at.reset();

    ++stats_.uploads_completed;
    if (metrics_) {
        metrics_->uploads_success().Increment();
        metrics_->upload_bytes_total().Increment(static_cast<double>(file_size));
    }

    persist();
    emit_progress(done);
    complete_events_.publish(UploadCompleted{attachment_id});
    log_info("[upload-queue] Completed %s", attachment_id.c_str());
}

void UploadQueueService::on_transfer_progress(uint64_t sequence, uint32_t attempt,
                                              const std::shared_ptr<TransferHandle>& handle,
                                              uint64_t bytes_sent, uint64_t bytes_expected) {
    std::lock_guard lock(mutex_);
    if (handle->cancelled() || active_handle_ != handle) return;

    auto it = items_.find(sequence);
    if (it == items_.end()) return;
    QueueItem& item = it->second;
    if (item.phase != UploadPhase::Uploading || item.attempt_number != attempt) return;

    double fraction = bytes_expected > 0
                          ? static_cast<double>(bytes_sent) / static_cast<double>(bytes_expected)
                          : 0.0;
    fraction = std::clamp(fraction, 0.0, 1.0);
    if (fraction <= item.progress) return;

    item.progress = fraction;
    emit_progress(item);
}

// ============================================================================
// Outcomes
// ============================================================================

void UploadQueueService::handle_attempt_failure(Lock& lock, uint64_t sequence,
                                                const std::string& error) {
    QueueItem& item = items_.at(sequence);
    if (item.attempt_number < item.max_attempts) {
        schedule_retry(item, error);
    } else {
        fail_item(lock, sequence, error);
    }
}

void UploadQueueService::schedule_retry(QueueItem& item, const std::string& error) {
    auto delay = retry_policy_->next_delay(item.attempt_number);

    item.phase = UploadPhase::Queued;
    item.progress = 0.0;
    item.last_error = error;
    item.scheduled_retry_at = Clock::now() + delay;
    scheduler_.schedule(item.sequence, *item.scheduled_retry_at);

    ++stats_.retries_scheduled;
    if (metrics_) metrics_->retries_total().Increment();

    persist();
    emit_progress(item);
    log_warn("[upload-queue] Attempt %u/%u for %s failed: %s (retry in %lldms)",
             item.attempt_number, item.max_attempts, item.attachment_id.c_str(),
             error.c_str(), as_millis(delay));
}

void UploadQueueService::fail_item(Lock& lock, uint64_t sequence, const std::string& error) {
    auto it = items_.find(sequence);
    if (it == items_.end()) return;
    QueueItem& item = it->second;

    item.phase = UploadPhase::Failed;
    item.last_error = error;
    item.completed_at = Clock::now();
    item.scheduled_retry_at.reset();
    scheduler_.cancel(sequence);

    ++stats_.uploads_failed;
    if (metrics_) metrics_->uploads_failure().Increment();

    persist();
    emit_progress(item);
    error_events_.publish(UploadFailed{item.attachment_id, error});
    log_error("[upload-queue] %s failed permanently: %s", item.attachment_id.c_str(),
              error.c_str());

    // Best effort; the local outcome stands either way
    const std::string attachment_id = item.attachment_id;
    lock.unlock();
    ControlPlaneResult reported;
    try {
        reported = control_plane_->report_failure(attachment_id, error);
    } catch (const std::exception& e) {
        reported = ControlPlaneResult{};
        reported.error_message = e.what();
    }
    if (!reported.success) {
        log_warn("[upload-queue] Could not report failure of %s: %s", attachment_id.c_str(),
                 reported.error_message.c_str());
    }
    lock.lock();
}

// ============================================================================
// Connectivity
// ============================================================================

void UploadQueueService::on_connectivity_changed(bool connected) {
    std::lock_guard lock(mutex_);
    if (!initialized_) return;

    if (!connected) {
        if (paused_) return;
        paused_ = true;
        log_warn("[upload-queue] Connectivity lost, pausing queue");

        if (active_handle_ && active_sequence_) {
            auto it = items_.find(*active_sequence_);
            // Confirmation is allowed to run to completion
            if (it != items_.end() && it->second.phase == UploadPhase::Uploading) {
                active_handle_->cancel();
                active_handle_.reset();
                active_sequence_.reset();
                // A cancelled attempt does not use up the attempt budget
                it->second.phase = UploadPhase::Queued;
                it->second.progress = 0.0;
                if (it->second.attempt_number > 0) --it->second.attempt_number;
                emit_progress(it->second);
            }
        }
        persist();
    } else {
        if (!paused_) return;
        paused_ = false;
        log_info("[upload-queue] Connectivity restored, resuming queue");
        wake_worker();
    }
}

// ============================================================================
// Helpers
// ============================================================================

void UploadQueueService::persist() {
    std::vector<QueueItem> snapshot;
    snapshot.reserve(items_.size());
    for (const auto& [seq, item] : items_) snapshot.push_back(item);
    if (!storage_->save_queue(snapshot)) {
        log_warn("[upload-queue] Queue state not persisted (%zu items)", snapshot.size());
    }
}

void UploadQueueService::emit_progress(const QueueItem& item) {
    progress_events_.publish(make_progress(item));
}

void UploadQueueService::wake_worker() {
    trigger_ = true;
    cv_.notify_all();
}

QueueItem* UploadQueueService::find_by_attachment_id(const std::string& attachment_id) {
    for (auto& [seq, item] : items_) {
        if (item.attachment_id == attachment_id) return &item;
    }
    return nullptr;
}

const QueueItem* UploadQueueService::find_by_attachment_id(const std::string& attachment_id) const {
    for (const auto& [seq, item] : items_) {
        if (item.attachment_id == attachment_id) return &item;
    }
    return nullptr;
}

size_t UploadQueueService::pending_count() const {
    return static_cast<size_t>(std::count_if(items_.begin(), items_.end(), [](const auto& entry) {
        return !is_terminal(entry.second.phase);
    }));
}

size_t UploadQueueService::remove_phase(UploadPhase phase) {
    size_t removed = 0;
    for (auto it = items_.begin(); it != items_.end();) {
        if (it->second.phase == phase) {
            scheduler_.cancel(it->first);
            it = items_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    persist();
    if (removed > 0) {
        log_info("[upload-queue] Cleared %zu %s items", removed, phase_to_string(phase));
    }
    return removed;
}

}  // namespace attachq
