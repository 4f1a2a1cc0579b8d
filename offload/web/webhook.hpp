/*
 * webhook.hpp
 *
 * Copyright (C) 2026 offload contributors
 */

/*************************************************

Date: 2026-9-7

Description: Webhook delivery over libcurl

**************************************************/

#ifndef OFFLOAD_WEB_WEBHOOK_HPP
#define OFFLOAD_WEB_WEBHOOK_HPP

#include <string>

#include "offload/notify/notifier.hpp"

namespace offload::web {

/**
 * @brief Posts `{"content": message}` as JSON to a Discord-style webhook.
 */
class CurlWebhookSender : public notify::WebhookSender {
public:
    static constexpr long K_DEFAULT_TIMEOUT_SECONDS = 10;

    explicit CurlWebhookSender(long timeoutSeconds = K_DEFAULT_TIMEOUT_SECONDS);

    /**
     * @throws offload::error::RuntimeError on transport errors or a non-2xx
     * HTTP status.
     */
    void send(const std::string& target, const std::string& message) override;

private:
    long timeoutSeconds_;
};

}  // namespace offload::web

#endif  // OFFLOAD_WEB_WEBHOOK_HPP
