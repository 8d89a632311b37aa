#pragma once

#include "attachq/control_plane.hpp"
#include "attachq/event_channel.hpp"
#include "attachq/network_monitor.hpp"
#include "attachq/queue_lock.hpp"
#include "attachq/queue_storage.hpp"
#include "attachq/queue_types.hpp"
#include "attachq/retry_policy.hpp"
#include "attachq/retry_scheduler.hpp"
#include "attachq/transfer_executor.hpp"

#include <condition_variable>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace attachq {

class MetricsExporter;

struct UploadQueueConfig {
    RetryConfig retry;

    /// Maximum non-terminal items accepted by enqueue(). 0 = unbounded.
    size_t max_pending_items = 0;

    /// When false no worker is started: items can be inspected and edited
    /// but nothing is uploaded.
    bool process_items = true;
};

struct EnqueueResult {
    bool success = false;
    std::string attachment_id;
    std::string queue_item_id;
    std::string error_message;
};

/// Background attachment upload queue.
///
/// Accepts local files, presigns them with the control plane, and uploads
/// them one at a time on a dedicated worker thread:
///
///   enqueue -> presign -> Queued -> Uploading -> Confirming -> Completed
///
/// Failed attempts are retried with exponential backoff until max_attempts,
/// after which the item is Failed and reported to the control plane. The full
/// queue is persisted after every state change, and items caught mid-transfer
/// by a crash are reset to Queued on the next initialize().
///
/// Losing connectivity pauses the queue and cancels the in-flight transfer;
/// regaining it resumes processing.
///
/// All item mutations happen under a single mutex. Transfers and control-plane
/// calls run on the worker thread with the mutex released. Events are
/// published in mutation order; callback listeners run on each channel's
/// dispatcher thread and may call back into the service.
class UploadQueueService {
public:
    UploadQueueService(std::shared_ptr<QueueStorage> storage,
                       std::shared_ptr<ControlPlaneClient> control_plane,
                       std::shared_ptr<TransferExecutor> transfer,
                       std::shared_ptr<NetworkMonitor> network,
                       MetricsExporter* metrics = nullptr);
    ~UploadQueueService();

    UploadQueueService(const UploadQueueService&) = delete;
    UploadQueueService& operator=(const UploadQueueService&) = delete;

    /// Load persisted items, recover interrupted ones, start the worker.
    /// Returns error message on failure, empty string on success.
    /// Calling it again while initialized is a no-op.
    std::string initialize(const UploadQueueConfig& config);

    /// Cancel any in-flight transfer, stop the worker and drop in-memory state.
    /// Persisted state is kept. initialize() must be called again before reuse.
    void destroy();

    bool is_initialized() const;

    // --- Queue operations ---

    /// Presign and queue a local file. Returns once the item is persisted;
    /// the upload itself happens in the background.
    EnqueueResult enqueue(const std::string& local_file, const std::string& mime_type,
                          const std::string& file_name, uint64_t file_size);

    QueueStatus get_queue_status() const;

    std::optional<QueueItem> get_item_by_attachment_id(const std::string& attachment_id) const;

    /// Snapshot of all items in enqueue order.
    std::vector<QueueItem> items() const;

    /// Requeue a Failed item with a fresh attempt budget.
    /// Returns error message on failure, empty string on success.
    std::string retry_item(const std::string& attachment_id);

    /// Cancel any active transfer for the item and remove it, whatever its phase.
    /// Returns error message on failure, empty string on success.
    std::string cancel_item(const std::string& attachment_id);

    /// Remove all Completed items. Returns the number removed.
    size_t clear_completed();

    /// Remove all Failed items. Returns the number removed.
    size_t clear_failed();

    /// True when no item is Queued, Uploading or Confirming.
    bool is_idle() const;

    bool is_paused() const;

    // --- Events ---

    Subscription on_progress(std::function<void(const UploadProgress&)> callback);
    Subscription on_complete(std::function<void(const UploadCompleted&)> callback);
    Subscription on_error(std::function<void(const UploadFailed&)> callback);

    std::shared_ptr<EventReceiver<UploadProgress>> subscribe_progress();
    std::shared_ptr<EventReceiver<UploadCompleted>> subscribe_complete();
    std::shared_ptr<EventReceiver<UploadFailed>> subscribe_error();

    /// Wait until every callback listener has seen the events published so far.
    void flush_events();

    // --- Statistics ---

    struct Stats {
        uint64_t enqueued = 0;
        uint64_t uploads_completed = 0;
        uint64_t uploads_failed = 0;
        uint64_t retries_scheduled = 0;
        uint64_t transfers_cancelled = 0;
        uint64_t presign_failures = 0;
        uint64_t items_recovered = 0;
    };
    Stats get_stats() const;

private:
    using Lock = std::unique_lock<std::mutex>;

    // Worker
    void worker_loop();
    std::optional<uint64_t> select_next(TimePoint now);
    void process_item(Lock& lock, uint64_t sequence);
    void on_transfer_progress(uint64_t sequence, uint32_t attempt,
                              const std::shared_ptr<TransferHandle>& handle,
                              uint64_t bytes_sent, uint64_t bytes_expected);

    // Outcomes (called with mutex_ held)
    void handle_attempt_failure(Lock& lock, uint64_t sequence, const std::string& error);
    void schedule_retry(QueueItem& item, const std::string& error);
    void fail_item(Lock& lock, uint64_t sequence, const std::string& error);

    // Connectivity
    void on_connectivity_changed(bool connected);

    // Helpers (called with mutex_ held)
    void persist();
    void emit_progress(const QueueItem& item);
    void wake_worker();
    QueueItem* find_by_attachment_id(const std::string& attachment_id);
    const QueueItem* find_by_attachment_id(const std::string& attachment_id) const;
    size_t pending_count() const;
    size_t remove_phase(UploadPhase phase);

    // Collaborators
    std::shared_ptr<QueueStorage> storage_;
    std::shared_ptr<ControlPlaneClient> control_plane_;
    std::shared_ptr<TransferExecutor> transfer_;
    std::shared_ptr<NetworkMonitor> network_;
    MetricsExporter* metrics_ = nullptr;  // Not owned, may be null

    std::mutex lifecycle_mutex_;  // Serializes initialize() and destroy()
    std::unique_ptr<QueueLock> owner_lock_;  // Held while initialized

    // Guarded by mutex_
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    UploadQueueConfig config_;
    std::unique_ptr<RetryPolicy> retry_policy_;
    std::map<uint64_t, QueueItem> items_;  // Keyed by sequence
    uint64_t next_sequence_ = 1;
    RetryScheduler scheduler_;
    bool initialized_ = false;
    bool stopping_ = false;
    bool paused_ = false;
    bool trigger_ = false;
    std::optional<uint64_t> active_sequence_;
    std::shared_ptr<TransferHandle> active_handle_;
    Stats stats_;

    std::thread worker_thread_;
    Subscription network_subscription_;

    // Declared last so listeners are stopped before the state they may touch
    EventChannel<UploadProgress> progress_events_;
    EventChannel<UploadCompleted> complete_events_;
    EventChannel<UploadFailed> error_events_;
};

}  // namespace attachq
