#include "attachq/control_plane.hpp"
#include "attachq/log.hpp"

#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>

#include <nlohmann/json.hpp>

namespace attachq {

std::optional<TimePoint> parse_iso8601(const std::string& text) {
    std::tm tm{};
    std::istringstream in(text);
    in >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (in.fail()) return std::nullopt;

    std::chrono::milliseconds fraction{0};
    if (in.peek() == '.') {
        in.get();
        std::string digits;
        while (std::isdigit(in.peek())) digits.push_back(static_cast<char>(in.get()));
        if (digits.empty()) return std::nullopt;
        digits.resize(3, '0');
        fraction = std::chrono::milliseconds(std::stoi(digits));
    }

    // Zone designator: Z, +HH:MM or -HH:MM
    int offset_minutes = 0;
    int c = in.get();
    if (c == '+' || c == '-') {
        std::string zone;
        std::getline(in, zone);
        auto digit = [&](size_t i) { return std::isdigit(static_cast<unsigned char>(zone[i])) != 0; };
        if (zone.size() != 5 || zone[2] != ':' || !digit(0) || !digit(1) || !digit(3) || !digit(4)) {
            return std::nullopt;
        }
        offset_minutes = std::stoi(zone.substr(0, 2)) * 60 + std::stoi(zone.substr(3, 2));
        if (c == '-') offset_minutes = -offset_minutes;
    } else if (c != 'Z' && c != 'z') {
        return std::nullopt;
    } else if (in.peek() != std::char_traits<char>::eof()) {
        return std::nullopt;
    }

    time_t epoch = timegm(&tm);
    if (epoch == static_cast<time_t>(-1)) return std::nullopt;

    return Clock::from_time_t(epoch) - std::chrono::minutes(offset_minutes) +
           std::chrono::duration_cast<Clock::duration>(fraction);
}

std::string describe_api_error(const HttpResponse& response) {
    if (!response.error.empty()) return response.error;

    std::string fallback = "HTTP " + std::to_string(response.status_code);
    auto j = nlohmann::json::parse(response.body, nullptr, false);
    if (j.is_discarded() || !j.is_object() || !j.contains("error")) return fallback;

    const auto& err = j["error"];
    if (err.is_string()) return fallback + ": " + err.get<std::string>();
    if (!err.is_object()) return fallback;

    std::string code = err.contains("code") && err["code"].is_string()
                           ? err["code"].get<std::string>() : "";
    std::string message = err.contains("message") && err["message"].is_string()
                              ? err["message"].get<std::string>() : "";
    if (code.empty() && message.empty()) return fallback;
    if (code.empty()) return fallback + ": " + message;
    if (message.empty()) return fallback + ": " + code;
    return fallback + ": " + code + ": " + message;
}

HttpControlPlaneClient::HttpControlPlaneClient(ControlPlaneConfig config)
    : config_(std::move(config)) {
    while (!config_.base_url.empty() && config_.base_url.back() == '/') {
        config_.base_url.pop_back();
    }
}

std::string HttpControlPlaneClient::endpoint(const std::string& path) const {
    return config_.base_url + path;
}

HttpResponse HttpControlPlaneClient::post(const std::string& path, const std::string& body) const {
    HttpRequest req;
    req.method = HttpMethod::POST;
    req.url = endpoint(path);
    req.headers.set("Content-Type", "application/json");
    req.headers.set("Accept", "application/json");
    req.headers.set("X-Publishable-Key", config_.publishable_key);
    if (!config_.user_token.empty()) {
        req.headers.set("X-User-Token", config_.user_token);
    }
    req.body = body;
    req.total_timeout = std::chrono::duration_cast<std::chrono::milliseconds>(config_.request_timeout);
    req.max_retries = config_.max_retries;
    req.initial_retry_delay = config_.retry_base_delay;
    req.max_retry_delay = config_.retry_max_delay;

    log_debug("[control-plane] POST %s", req.url.c_str());
    return http_.execute_with_retry(req);
}

PresignResult HttpControlPlaneClient::presign(const std::string& file_name,
                                              const std::string& content_type,
                                              uint64_t file_size) {
    PresignResult result;

    nlohmann::json body = {
        {"filename", file_name},
        {"content_type", content_type},
        {"size", file_size},
    };
    auto resp = post("/v1/attachments/presign", body.dump());
    if (!resp.ok()) {
        result.error_message = "Presign failed: " + describe_api_error(resp);
        return result;
    }

    try {
        auto j = nlohmann::json::parse(resp.body);
        result.attachment_id = j.at("attachment_id").get<std::string>();
        result.upload_url = j.at("upload_url").get<std::string>();
        auto expires_text = j.at("upload_expires_at").get<std::string>();
        auto expires = parse_iso8601(expires_text);
        if (!expires) {
            result.error_message = "Presign failed: invalid upload_expires_at '" + expires_text + "'";
            return result;
        }
        result.upload_expires_at = *expires;
    } catch (const nlohmann::json::exception& e) {
        result.error_message = std::string("Presign failed: malformed response: ") + e.what();
        return result;
    }

    if (result.attachment_id.empty() || result.upload_url.empty()) {
        result.error_message = "Presign failed: response missing attachment_id or upload_url";
        return result;
    }

    result.success = true;
    return result;
}

ControlPlaneResult HttpControlPlaneClient::confirm(const std::string& attachment_id,
                                                   uint64_t bytes_uploaded) {
    ControlPlaneResult result;
    nlohmann::json body = {{"bytes_uploaded", bytes_uploaded}};
    auto resp = post("/v1/attachments/" + attachment_id + "/confirm", body.dump());
    if (!resp.ok()) {
        result.error_message = "Confirm failed: " + describe_api_error(resp);
        return result;
    }
    result.success = true;
    return result;
}

ControlPlaneResult HttpControlPlaneClient::report_failure(const std::string& attachment_id,
                                                          const std::string& error) {
    ControlPlaneResult result;
    nlohmann::json body = {{"error", error}};
    auto resp = post("/v1/attachments/" + attachment_id + "/failure", body.dump());
    if (!resp.ok()) {
        result.error_message = "Failure report failed: " + describe_api_error(resp);
        return result;
    }
    result.success = true;
    return result;
}

}  // namespace attachq
