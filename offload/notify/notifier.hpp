/*
 * notifier.hpp
 *
 * Copyright (C) 2026 offload contributors
 */

/*************************************************

Date: 2026-9-7

Description: Fire-and-forget notifications through a bounded queue

**************************************************/

#ifndef OFFLOAD_NOTIFY_NOTIFIER_HPP
#define OFFLOAD_NOTIFY_NOTIFIER_HPP

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <stop_token>
#include <string>
#include <thread>

namespace offload::notify {

/**
 * @brief Receiver of human readable notification messages.
 *
 * Implementations must return quickly and must never throw.
 */
class Notifier {
public:
    virtual ~Notifier() = default;
    virtual void notify(const std::string& message) = 0;
};

class NullNotifier : public Notifier {
public:
    void notify(const std::string& /*message*/) override {}
};

/**
 * @brief Delivers one message to one target, synchronously.
 *
 * May throw; the dispatcher contains failures.
 */
class WebhookSender {
public:
    virtual ~WebhookSender() = default;
    virtual void send(const std::string& target, const std::string& message) = 0;
};

/**
 * @brief Single worker thread draining a bounded queue of messages.
 *
 * enqueue() never blocks. When the queue is full the new message is dropped.
 * Delivery errors are logged and swallowed. Messages still queued at
 * destruction are discarded.
 */
class NotificationDispatcher {
public:
    static constexpr std::size_t K_DEFAULT_CAPACITY = 64;

    explicit NotificationDispatcher(std::shared_ptr<WebhookSender> sender,
                                    std::size_t capacity = K_DEFAULT_CAPACITY);
    ~NotificationDispatcher();

    NotificationDispatcher(const NotificationDispatcher&) = delete;
    NotificationDispatcher& operator=(const NotificationDispatcher&) = delete;

    /**
     * @return False if the message was dropped.
     */
    bool enqueue(std::string target, std::string message);

    /**
     * @brief Blocks until the queue is empty and no delivery is in flight.
     */
    void drain();

    [[nodiscard]] auto pending() const -> std::size_t;

private:
    struct Job {
        std::string target;
        std::string message;
    };

    void run(std::stop_token stopToken);

    std::shared_ptr<WebhookSender> sender_;
    std::size_t capacity_;
    std::deque<Job> queue_;
    bool busy_{false};
    mutable std::mutex mutex_;
    std::condition_variable_any cv_;
    std::condition_variable_any idleCv_;
    std::jthread worker_;
};

/**
 * @brief Notifier bound to one webhook URL taken from a settings snapshot.
 *
 * An empty URL makes every notify() a no-op.
 */
class WebhookNotifier : public Notifier {
public:
    WebhookNotifier(NotificationDispatcher& dispatcher, std::string target);

    void notify(const std::string& message) override;

private:
    NotificationDispatcher& dispatcher_;
    std::string target_;
};

}  // namespace offload::notify

#endif  // OFFLOAD_NOTIFY_NOTIFIER_HPP
