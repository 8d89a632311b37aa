#include "attachq/transfer_executor.hpp"
#include "attachq/log.hpp"

#include <filesystem>

namespace attachq {

HttpTransferExecutor::HttpTransferExecutor(const HttpClientConfig& config) : http_(config) {}

TransferResult HttpTransferExecutor::execute(const TransferRequest& request,
                                             std::shared_ptr<TransferHandle> handle) {
    TransferResult result;

    std::error_code ec;
    auto size = std::filesystem::file_size(request.local_file, ec);
    if (ec) {
        result.error = "Cannot read " + request.local_file + ": " + ec.message();
        return result;
    }

    HttpRequest req;
    req.method = HttpMethod::PUT;
    req.url = request.url;
    req.upload_file = request.local_file;
    for (const auto& [name, value] : request.headers) {
        req.headers.set(name, value);
    }
    // No wall-clock limit on an attempt
    req.total_timeout = std::chrono::milliseconds(0);

    uint64_t last_reported = 0;
    req.progress_callback = [&](const HttpProgress& p) {
        if (handle && handle->cancelled()) return false;
        uint64_t expected = p.upload_total > 0 ? p.upload_total : size;
        if (p.upload_now != last_reported && request.on_progress) {
            last_reported = p.upload_now;
            request.on_progress(p.upload_now, expected);
        }
        return true;
    };

    if (handle && handle->cancelled()) {
        result.cancelled = true;
        result.error = "Transfer cancelled";
        return result;
    }

    auto resp = http_.execute(req);
    result.bytes_sent = last_reported;

    if (resp.aborted) {
        result.cancelled = true;
        result.error = "Transfer cancelled";
        return result;
    }
    if (!resp.error.empty()) {
        result.error = resp.error;
        return result;
    }

    result.status = resp.status_code;
    if (is_success_status(resp.status_code)) {
        result.bytes_sent = size;
    } else {
        log_debug("[transfer] PUT returned HTTP %d: %s", resp.status_code, resp.body.c_str());
    }
    return result;
}

}  // namespace attachq
