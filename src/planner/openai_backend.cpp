#include "planner/openai_backend.hpp"

#include <curl/curl.h>
#include <algorithm>
#include <memory>
#include <mutex>
#include <utility>
#include <nlohmann/json.hpp>
#include "core/logging/logger.hpp"
#include "planner/plan_parser.hpp"

namespace vrc::planner {

using core::errors::AgentError;
using core::errors::ErrorCategory;
using nlohmann::json;

namespace {

constexpr long kConnectTimeoutMs = 5000;

std::size_t write_callback(char* data, std::size_t size, std::size_t nmemb, void* userp) {
    auto* buffer = static_cast<std::string*>(userp);
    buffer->append(data, size * nmemb);
    return size * nmemb;
}

int progress_callback(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    const auto* cancel = static_cast<const std::atomic_bool*>(clientp);
    // Non-zero aborts the transfer with CURLE_ABORTED_BY_CALLBACK.
    return (cancel != nullptr && cancel->load()) ? 1 : 0;
}

void ensure_curl_initialized() {
    static std::once_flag once;
    std::call_once(once, []() { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

struct CurlDeleter {
    void operator()(CURL* handle) const { curl_easy_cleanup(handle); }
};

struct HeaderListDeleter {
    void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};

std::string trim_url(std::string url) {
    while (!url.empty() && url.back() == '/') {
        url.pop_back();
    }
    return url;
}

}  // namespace

std::optional<AgentError> classify_http_status(const long status, const std::string& body) {
    if (status >= 200 && status < 300) {
        return std::nullopt;
    }
    const std::string snippet = body.substr(0, 200);
    if (status == 429 || status >= 500) {
        return AgentError{ErrorCategory::Planner,
                          "Planner HTTP " + std::to_string(status) + ": " + snippet,
                          "planner_http_error", "", true};
    }
    if (status == 401 || status == 403) {
        return AgentError{ErrorCategory::Planner,
                          "Planner rejected credentials (HTTP " + std::to_string(status) + ")",
                          "planner_unauthorized", "Check api.api_key."};
    }
    return AgentError{ErrorCategory::Planner,
                      "Planner HTTP " + std::to_string(status) + ": " + snippet,
                      "planner_http_error"};
}

OpenAiPlannerBackend::OpenAiPlannerBackend(core::config::ApiConfig config)
    : config_(std::move(config)) {
    ensure_curl_initialized();
}

core::errors::Result<std::string> OpenAiPlannerBackend::complete(
    const std::string& system_prompt, const std::string& user_message,
    const CancelToken& cancel) const {
    std::unique_ptr<CURL, CurlDeleter> curl(curl_easy_init());
    if (!curl) {
        return AgentError{ErrorCategory::Internal, "curl_easy_init failed.",
                          "curl_init_failed"};
    }

    json request_body = {
        {"model", config_.model},
        {"messages",
         json::array({{{"role", "system"}, {"content", system_prompt}},
                      {{"role", "user"}, {"content", user_message}}})},
        {"temperature", 0.2},
        {"max_tokens", 1024}};
    const std::string body =
        request_body.dump(-1, ' ', false, json::error_handler_t::replace);

    const std::string url = trim_url(config_.base_url) + "/chat/completions";
    const std::string auth = "Authorization: Bearer " + config_.api_key;
    curl_slist* raw_headers = nullptr;
    raw_headers = curl_slist_append(raw_headers, "Content-Type: application/json");
    raw_headers = curl_slist_append(raw_headers, auth.c_str());
    std::unique_ptr<curl_slist, HeaderListDeleter> headers(raw_headers);

    std::string response;
    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_POST, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response);
    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT_MS, kConnectTimeoutMs);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(config_.timeout_ms));
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl.get(), CURLOPT_XFERINFOFUNCTION, progress_callback);
    curl_easy_setopt(curl.get(), CURLOPT_XFERINFODATA, cancel.get());

    const CURLcode rc = curl_easy_perform(curl.get());
    if (rc == CURLE_ABORTED_BY_CALLBACK) {
        return AgentError{ErrorCategory::Planner, "Planner call cancelled.",
                          "planner_cancelled"};
    }
    if (rc == CURLE_OPERATION_TIMEDOUT) {
        return AgentError{ErrorCategory::Planner,
                          "Planner call timed out after " +
                              std::to_string(config_.timeout_ms) + " ms",
                          "planner_timeout", "", true};
    }
    if (rc != CURLE_OK) {
        return AgentError{ErrorCategory::Planner,
                          std::string("Planner unreachable: ") + curl_easy_strerror(rc),
                          "planner_unreachable", "Check api.base_url and network access.",
                          true};
    }

    long status = 0;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &status);
    if (auto http_error = classify_http_status(status, response)) {
        return http_error.value();
    }

    try {
        const json parsed = json::parse(response);
        const auto& content = parsed.at("choices").at(0).at("message").at("content");
        if (!content.is_string()) {
            return AgentError{ErrorCategory::Planner, "Planner reply has no text content.",
                              "planner_bad_response"};
        }
        return content.get<std::string>();
    } catch (const json::exception& e) {
        return AgentError{ErrorCategory::Planner,
                          std::string("Unexpected planner response: ") + e.what(),
                          "planner_bad_response"};
    }
}

std::string OpenAiPlannerBackend::models_url() const {
    return trim_url(config_.base_url) + "/models";
}

core::errors::Result<long> OpenAiPlannerBackend::models_status(
    const core::clock::Duration timeout) const {
    std::unique_ptr<CURL, CurlDeleter> curl(curl_easy_init());
    if (!curl) {
        return AgentError{ErrorCategory::Internal, "curl_easy_init failed.",
                          "curl_init_failed"};
    }

    const std::string url = models_url();
    const std::string auth = "Authorization: Bearer " + config_.api_key;
    std::unique_ptr<curl_slist, HeaderListDeleter> headers(
        curl_slist_append(nullptr, auth.c_str()));

    std::string response;
    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response);
    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT_MS,
                     std::min<long>(kConnectTimeoutMs, static_cast<long>(timeout.count())));
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(timeout.count()));
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);

    const CURLcode rc = curl_easy_perform(curl.get());
    if (rc != CURLE_OK) {
        return AgentError{ErrorCategory::Planner,
                          "GET " + url + " failed: " + curl_easy_strerror(rc),
                          "planner_unreachable", "Check api.base_url and network access.",
                          true};
    }
    long status = 0;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &status);
    return status;
}

core::errors::Result<protocol::Intent> OpenAiPlannerBackend::plan(const PlanRequest& request,
                                                                  const CancelToken& cancel) {
    const std::string user_message = build_planner_payload(request).dump(
        -1, ' ', false, json::error_handler_t::replace);
    LOG_DEBUG("Planner request: " + user_message);

    auto completion = complete(kIntentSystemPrompt, user_message, cancel);
    if (core::errors::is_error(completion)) {
        return core::errors::get_error(completion);
    }
    const auto& text = core::errors::get_value(completion);
    LOG_DEBUG("Planner reply: " + text);
    return parse_plan(text);
}

}  // namespace vrc::planner
