#include "backend/http_backend.hpp"

#include <curl/curl.h>
#include <mutex>
#include <utility>
#include <nlohmann/json.hpp>
#include "core/logging/logger.hpp"

namespace autopilot::backend {

using core::errors::AgentError;
using core::errors::ErrorCategory;
using nlohmann::json;

namespace {

std::once_flag g_curl_init;

std::size_t append_body(char* data, std::size_t size, std::size_t nmemb, void* userp) {
    auto* body = static_cast<std::string*>(userp);
    body->append(data, size * nmemb);
    return size * nmemb;
}

AgentError unavailable(const std::string& message) {
    return AgentError{ErrorCategory::Backend, message, "backend_unavailable"};
}

}  // namespace

std::string build_generate_request(const std::string& model, const std::string& prompt) {
    json payload;
    payload["model"] = model;
    payload["prompt"] = prompt;
    payload["stream"] = false;
    return payload.dump(-1, ' ', false, json::error_handler_t::replace);
}

core::errors::Result<std::string> parse_generate_response(const std::string& body) {
    const json reply = json::parse(body, nullptr, false);
    if (reply.is_discarded() || !reply.is_object()) {
        return AgentError{ErrorCategory::Backend, "Backend reply is not a JSON object.",
                          "unexpected_backend_response"};
    }
    const auto it = reply.find("response");
    if (it == reply.end() || !it->is_string()) {
        return AgentError{ErrorCategory::Backend,
                          "Unexpected backend response format: " + reply.dump(),
                          "unexpected_backend_response"};
    }
    return it->get<std::string>();
}

HttpBackend::HttpBackend(core::config::BackendConfig config) : config_(std::move(config)) {
    std::call_once(g_curl_init, [] { static_cast<void>(curl_global_init(CURL_GLOBAL_ALL)); });
}

HttpBackend::~HttpBackend() = default;

core::errors::Result<std::string> HttpBackend::generate(const std::string& prompt) {
    CURL* curl = curl_easy_init();
    if (curl == nullptr) {
        return unavailable("curl_easy_init failed");
    }

    const std::string request_body = build_generate_request(config_.model, prompt);
    std::string response_body;

    struct curl_slist* headers = nullptr;
    headers = curl_slist_append(headers, "Content-Type: application/json");

    curl_easy_setopt(curl, CURLOPT_URL, config_.url.c_str());
    curl_easy_setopt(curl, CURLOPT_POST, 1L);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request_body.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(request_body.size()));
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, append_body);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response_body);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(config_.request_timeout.count()));
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    const CURLcode res = curl_easy_perform(curl);
    long status = 0;
    static_cast<void>(curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status));
    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);

    if (res != CURLE_OK) {
        return unavailable(std::string("request failed: ") + curl_easy_strerror(res));
    }
    if (status < 200 || status >= 300) {
        return unavailable("HTTP status " + std::to_string(status));
    }
    return parse_generate_response(response_body);
}

}  // namespace autopilot::backend
