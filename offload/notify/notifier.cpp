/*
 * notifier.cpp
 *
 * Copyright (C) 2026 offload contributors
 */

/*************************************************

Date: 2026-9-7

Description: Fire-and-forget notifications through a bounded queue

**************************************************/

#include "notifier.hpp"

#include <spdlog/spdlog.h>

namespace offload::notify {

NotificationDispatcher::NotificationDispatcher(
    std::shared_ptr<WebhookSender> sender, std::size_t capacity)
    : sender_(std::move(sender)), capacity_(capacity) {
    worker_ = std::jthread([this](std::stop_token stopToken) { run(stopToken); });
}

NotificationDispatcher::~NotificationDispatcher() {
    worker_.request_stop();
    cv_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
    std::lock_guard lock(mutex_);
    if (!queue_.empty()) {
        spdlog::debug("Discarding {} undelivered notification(s)",
                      queue_.size());
    }
}

bool NotificationDispatcher::enqueue(std::string target, std::string message) {
    {
        std::lock_guard lock(mutex_);
        if (queue_.size() >= capacity_) {
            spdlog::warn("Notification queue full ({}), dropping message",
                         capacity_);
            return false;
        }
        queue_.push_back(Job{std::move(target), std::move(message)});
    }
    cv_.notify_one();
    return true;
}

void NotificationDispatcher::drain() {
    std::unique_lock lock(mutex_);
    idleCv_.wait(lock, [this] { return queue_.empty() && !busy_; });
}

auto NotificationDispatcher::pending() const -> std::size_t {
    std::lock_guard lock(mutex_);
    return queue_.size();
}

void NotificationDispatcher::run(std::stop_token stopToken) {
    spdlog::debug("Notification worker started");
    while (true) {
        Job job;
        {
            std::unique_lock lock(mutex_);
            if (!cv_.wait(lock, stopToken,
                          [this] { return !queue_.empty(); })) {
                break;
            }
            job = std::move(queue_.front());
            queue_.pop_front();
            busy_ = true;
        }

        try {
            sender_->send(job.target, job.message);
        } catch (const std::exception& e) {
            spdlog::warn("Notification delivery failed: {}", e.what());
        }

        {
            std::lock_guard lock(mutex_);
            busy_ = false;
        }
        idleCv_.notify_all();
    }
    spdlog::debug("Notification worker stopped");
}

WebhookNotifier::WebhookNotifier(NotificationDispatcher& dispatcher,
                                 std::string target)
    : dispatcher_(dispatcher), target_(std::move(target)) {}

void WebhookNotifier::notify(const std::string& message) {
    if (target_.empty()) {
        return;
    }
    dispatcher_.enqueue(target_, message);
}

}  // namespace offload::notify
