#include "attachq/http_client.hpp"
#include "attachq/log.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <memory>
#include <mutex>
#include <sys/types.h>
#include <thread>

#include <curl/curl.h>

namespace attachq {

bool is_success_status(int status) {
    return status / 100 == 2;
}

bool is_retryable_status(int status) {
    return status == 429 || status / 100 == 5;
}

void HttpHeaders::set(const std::string& name, const std::string& value) {
    std::string key(name);
    for (auto& c : key) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    headers_[key] = {name, value};
}

namespace {

using EasyHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;
using HeaderList = std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)>;
using FileHandle = std::unique_ptr<FILE, decltype(&std::fclose)>;

/// State shared with libcurl callbacks for one request.
struct CurlTransfer {
    const HttpRequest& request;
    HttpResponse& response;
    size_t body_limit;
    FileHandle source{nullptr, &std::fclose};
    bool overflowed = false;
    bool aborted = false;

    static size_t on_body(char* data, size_t size, size_t count, void* self) {
        auto* t = static_cast<CurlTransfer*>(self);
        size_t n = size * count;
        if (t->body_limit > 0 && t->response.body.size() + n > t->body_limit) {
            t->overflowed = true;
            return 0;
        }
        t->response.body.append(data, n);
        return n;
    }

    static size_t on_read(char* buffer, size_t size, size_t count, void* self) {
        auto* t = static_cast<CurlTransfer*>(self);
        size_t n = std::fread(buffer, 1, size * count, t->source.get());
        if (n == 0 && std::ferror(t->source.get())) return CURL_READFUNC_ABORT;
        return n;
    }

    static int on_seek(void* self, curl_off_t offset, int origin) {
        auto* t = static_cast<CurlTransfer*>(self);
        // Rewind for a redirected or re-sent upload
        if (fseeko(t->source.get(), static_cast<off_t>(offset), origin) != 0) {
            return CURL_SEEKFUNC_CANTSEEK;
        }
        return CURL_SEEKFUNC_OK;
    }

    static int on_progress(void* self, curl_off_t, curl_off_t, curl_off_t ul_total,
                           curl_off_t ul_now) {
        auto* t = static_cast<CurlTransfer*>(self);
        HttpProgress p;
        p.upload_total = static_cast<uint64_t>(ul_total);
        p.upload_now = static_cast<uint64_t>(ul_now);
        if (t->request.progress_callback(p)) return 0;
        t->aborted = true;
        return 1;
    }
};

// Returns an error message, empty on success.
std::string set_method_and_body(CURL* h, CurlTransfer& t) {
    const HttpRequest& req = t.request;
    switch (req.method) {
        case HttpMethod::GET:
            curl_easy_setopt(h, CURLOPT_HTTPGET, 1L);
            return {};
        case HttpMethod::HEAD:
            curl_easy_setopt(h, CURLOPT_NOBODY, 1L);
            return {};
        case HttpMethod::POST:
            curl_easy_setopt(h, CURLOPT_POSTFIELDS, req.body.data());
            curl_easy_setopt(h, CURLOPT_POSTFIELDSIZE_LARGE,
                             static_cast<curl_off_t>(req.body.size()));
            return {};
        case HttpMethod::PUT:
            break;
    }

    if (req.upload_file.empty()) {
        curl_easy_setopt(h, CURLOPT_CUSTOMREQUEST, "PUT");
        curl_easy_setopt(h, CURLOPT_POSTFIELDS, req.body.data());
        curl_easy_setopt(h, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(req.body.size()));
        return {};
    }

    t.source.reset(std::fopen(req.upload_file.c_str(), "rb"));
    if (!t.source) return "Cannot open " + req.upload_file;
    if (std::fseek(t.source.get(), 0, SEEK_END) != 0) return "Cannot seek " + req.upload_file;
    long length = std::ftell(t.source.get());
    std::rewind(t.source.get());
    if (length < 0) return "Cannot determine size of " + req.upload_file;

    curl_easy_setopt(h, CURLOPT_UPLOAD, 1L);
    curl_easy_setopt(h, CURLOPT_READFUNCTION, &CurlTransfer::on_read);
    curl_easy_setopt(h, CURLOPT_READDATA, &t);
    curl_easy_setopt(h, CURLOPT_SEEKFUNCTION, &CurlTransfer::on_seek);
    curl_easy_setopt(h, CURLOPT_SEEKDATA, &t);
    curl_easy_setopt(h, CURLOPT_INFILESIZE_LARGE, static_cast<curl_off_t>(length));
    return {};
}

}  // namespace

HttpClient::HttpClient(const HttpClientConfig& config) : config_(config) {
    static std::once_flag global_init;
    std::call_once(global_init, [] { curl_global_init(CURL_GLOBAL_ALL); });
}

HttpResponse HttpClient::execute(const HttpRequest& request) const {
    HttpResponse response;

    EasyHandle handle(curl_easy_init(), &curl_easy_cleanup);
    if (!handle) {
        response.error = "curl_easy_init failed";
        response.is_network_error = true;
        return response;
    }
    CURL* h = handle.get();
    CurlTransfer transfer{request, response, config_.max_response_size};

    curl_easy_setopt(h, CURLOPT_URL, request.url.c_str());
    if (auto err = set_method_and_body(h, transfer); !err.empty()) {
        response.error = err;
        return response;
    }

    HeaderList header_list(nullptr, &curl_slist_free_all);
    for (const auto& [key, entry] : request.headers.all()) {
        std::string line = entry.first + ": " + entry.second;
        curl_slist* appended = curl_slist_append(header_list.get(), line.c_str());
        if (!appended) {
            response.error = "Out of memory building request headers";
            return response;
        }
        header_list.release();
        header_list.reset(appended);
    }
    if (header_list) curl_easy_setopt(h, CURLOPT_HTTPHEADER, header_list.get());
    if (!config_.user_agent.empty()) curl_easy_setopt(h, CURLOPT_USERAGENT, config_.user_agent.c_str());

    curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, &CurlTransfer::on_body);
    curl_easy_setopt(h, CURLOPT_WRITEDATA, &transfer);
    if (request.progress_callback) {
        curl_easy_setopt(h, CURLOPT_NOPROGRESS, 0L);
        curl_easy_setopt(h, CURLOPT_XFERINFOFUNCTION, &CurlTransfer::on_progress);
        curl_easy_setopt(h, CURLOPT_XFERINFODATA, &transfer);
    }

    curl_easy_setopt(h, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(request.connect_timeout.count()));
    curl_easy_setopt(h, CURLOPT_TIMEOUT_MS, static_cast<long>(request.total_timeout.count()));
    curl_easy_setopt(h, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(h, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(h, CURLOPT_MAXREDIRS, 5L);
    if (config_.verbose) curl_easy_setopt(h, CURLOPT_VERBOSE, 1L);

    CURLcode rc = curl_easy_perform(h);
    if (rc == CURLE_OK) {
        long status = 0;
        curl_easy_getinfo(h, CURLINFO_RESPONSE_CODE, &status);
        response.status_code = static_cast<int>(status);
        curl_off_t retry_after = 0;
        if (curl_easy_getinfo(h, CURLINFO_RETRY_AFTER, &retry_after) == CURLE_OK &&
            retry_after > 0) {
            response.retry_after = std::chrono::seconds(retry_after);
        }
    } else if (transfer.aborted) {
        response.aborted = true;
        response.error = "Transfer cancelled";
    } else if (transfer.overflowed) {
        response.error = "Response larger than " + std::to_string(config_.max_response_size) +
                         " bytes";
    } else {
        response.is_network_error = true;
        response.error = curl_easy_strerror(rc);
    }
    return response;
}

HttpResponse HttpClient::execute_with_retry(const HttpRequest& request) const {
    auto delay = request.initial_retry_delay;
    int attempt = 1;

    while (true) {
        HttpResponse response = execute(request);
        response.attempts = attempt;

        if (response.aborted ||
            (!response.is_network_error && !is_retryable_status(response.status_code))) {
            return response;
        }
        if (attempt > request.max_retries) {
            return response;
        }

        auto wait = response.retry_after
                        ? std::chrono::duration_cast<std::chrono::milliseconds>(*response.retry_after)
                        : delay;
        wait = std::min(wait, request.max_retry_delay);
        log_debug("[http] %s returned %s, retry %d/%d in %lldms", request.url.c_str(),
                  response.is_network_error ? response.error.c_str()
                                            : std::to_string(response.status_code).c_str(),
                  attempt, request.max_retries, static_cast<long long>(wait.count()));
        std::this_thread::sleep_for(wait);

        delay = std::chrono::milliseconds(
            static_cast<long long>(delay.count() * request.retry_backoff_multiplier));
        ++attempt;
    }
}

}  // namespace attachq
