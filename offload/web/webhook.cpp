/*
 * webhook.cpp
 *
 * Copyright (C) 2026 offload contributors
 */

/*************************************************

Date: 2026-9-7

Description: Webhook delivery over libcurl

**************************************************/

#include "webhook.hpp"

#include <memory>
#include <mutex>

#include <curl/curl.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "offload/error/exception.hpp"

namespace offload::web {

namespace {
constexpr long K_HTTP_OK_MIN = 200;
constexpr long K_HTTP_OK_MAX = 299;

std::once_flag g_curlInitFlag;

struct CurlHandleDeleter {
    void operator()(CURL* handle) const noexcept { curl_easy_cleanup(handle); }
};

struct CurlHeaderDeleter {
    void operator()(curl_slist* list) const noexcept {
        curl_slist_free_all(list);
    }
};

auto discardBody(char* /*ptr*/, size_t size, size_t nmemb, void* /*userp*/)
    -> size_t {
    return size * nmemb;
}
}  // namespace

CurlWebhookSender::CurlWebhookSender(long timeoutSeconds)
    : timeoutSeconds_(timeoutSeconds) {
    std::call_once(g_curlInitFlag,
                   [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

void CurlWebhookSender::send(const std::string& target,
                             const std::string& message) {
    std::unique_ptr<CURL, CurlHandleDeleter> handle(curl_easy_init());
    if (!handle) {
        THROW_RUNTIME_ERROR("Failed to initialize CURL handle");
    }

    const std::string body = nlohmann::json{{"content", message}}.dump();
    std::unique_ptr<curl_slist, CurlHeaderDeleter> headers(
        curl_slist_append(nullptr, "Content-Type: application/json"));

    curl_easy_setopt(handle.get(), CURLOPT_URL, target.c_str());
    curl_easy_setopt(handle.get(), CURLOPT_POST, 1L);
    curl_easy_setopt(handle.get(), CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(handle.get(), CURLOPT_POSTFIELDSIZE,
                     static_cast<long>(body.size()));
    curl_easy_setopt(handle.get(), CURLOPT_HTTPHEADER, headers.get());
    curl_easy_setopt(handle.get(), CURLOPT_TIMEOUT, timeoutSeconds_);
    curl_easy_setopt(handle.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(handle.get(), CURLOPT_WRITEFUNCTION, discardBody);

    const CURLcode res = curl_easy_perform(handle.get());
    if (res != CURLE_OK) {
        THROW_RUNTIME_ERROR("Webhook request failed: ",
                            curl_easy_strerror(res));
    }

    long status = 0;
    curl_easy_getinfo(handle.get(), CURLINFO_RESPONSE_CODE, &status);
    if (status < K_HTTP_OK_MIN || status > K_HTTP_OK_MAX) {
        THROW_RUNTIME_ERROR("Webhook returned HTTP ", status);
    }
    spdlog::debug("Webhook delivered ({} bytes, HTTP {})", body.size(), status);
}

}  // namespace offload::web
