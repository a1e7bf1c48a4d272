#pragma once

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace bridgelink {

/**
 * Publish/subscribe channel that keeps only the newest value per subscriber.
 *
 * Every subscriber owns a mailbox of depth 1: publishing overwrites whatever the
 * subscriber has not consumed yet, so a slow consumer only ever sees the latest value.
 * Subscriptions unregister themselves when destroyed.
 */
template <typename T>
class LatestValueChannel {
private:
    struct Mailbox {
        std::mutex mutex;
        std::condition_variable cv;
        std::optional<T> value;
        uint64_t delivered = 0;
        bool closed = false;
    };

    struct Registry {
        std::mutex mutex;
        std::vector<std::weak_ptr<Mailbox>> mailboxes;
        bool closed = false;
    };

public:
    class Subscription {
    public:
        ~Subscription() {
            if (auto registry = registry_.lock()) {
                std::lock_guard<std::mutex> lock(registry->mutex);
                auto& boxes = registry->mailboxes;
                boxes.erase(std::remove_if(boxes.begin(), boxes.end(),
                                           [this](const std::weak_ptr<Mailbox>& weak) {
                                               auto box = weak.lock();
                                               return !box || box == mailbox_;
                                           }),
                            boxes.end());
            }
        }

        Subscription(const Subscription&) = delete;
        Subscription& operator=(const Subscription&) = delete;

        /**
         * Wait for the next value.
         * @return false on timeout, or when the channel was closed and nothing is pending
         */
        bool next(T& out, std::chrono::milliseconds timeout) {
            std::unique_lock<std::mutex> lock(mailbox_->mutex);
            mailbox_->cv.wait_for(lock, timeout, [this] { return mailbox_->value.has_value() || mailbox_->closed; });
            return take_locked(out);
        }

        /**
         * Take the pending value without waiting.
         */
        bool try_next(T& out) {
            std::lock_guard<std::mutex> lock(mailbox_->mutex);
            return take_locked(out);
        }

        /**
         * Number of values ever published to this subscriber, including ones that were
         * overwritten before being consumed.
         */
        uint64_t delivered_count() const {
            std::lock_guard<std::mutex> lock(mailbox_->mutex);
            return mailbox_->delivered;
        }

    private:
        friend class LatestValueChannel;

        Subscription(std::shared_ptr<Mailbox> mailbox, std::weak_ptr<Registry> registry)
            : mailbox_(std::move(mailbox)), registry_(std::move(registry)) {}

        bool take_locked(T& out) {
            if (!mailbox_->value) {
                return false;
            }
            out = std::move(*mailbox_->value);
            mailbox_->value.reset();
            return true;
        }

        std::shared_ptr<Mailbox> mailbox_;
        std::weak_ptr<Registry> registry_;
    };

    LatestValueChannel() : registry_(std::make_shared<Registry>()) {}

    ~LatestValueChannel() { close(); }

    LatestValueChannel(const LatestValueChannel&) = delete;
    LatestValueChannel& operator=(const LatestValueChannel&) = delete;

    /**
     * Register a subscriber whose mailbox already holds `initial`.
     */
    std::unique_ptr<Subscription> subscribe(const T& initial) {
        auto mailbox = std::make_shared<Mailbox>();
        mailbox->value = initial;
        mailbox->delivered = 1;

        std::lock_guard<std::mutex> lock(registry_->mutex);
        mailbox->closed = registry_->closed;
        registry_->mailboxes.push_back(mailbox);
        return std::unique_ptr<Subscription>(new Subscription(mailbox, registry_));
    }

    void publish(const T& value) {
        for (const auto& mailbox : live_mailboxes()) {
            {
                std::lock_guard<std::mutex> lock(mailbox->mutex);
                mailbox->value = value;
                mailbox->delivered++;
            }
            mailbox->cv.notify_all();
        }
    }

    /**
     * Wake every waiting subscriber; later next() calls return pending values, then false.
     */
    void close() {
        {
            std::lock_guard<std::mutex> lock(registry_->mutex);
            registry_->closed = true;
        }
        for (const auto& mailbox : live_mailboxes()) {
            {
                std::lock_guard<std::mutex> lock(mailbox->mutex);
                mailbox->closed = true;
            }
            mailbox->cv.notify_all();
        }
    }

    size_t subscriber_count() const { return live_mailboxes().size(); }

private:
    std::vector<std::shared_ptr<Mailbox>> live_mailboxes() const {
        std::vector<std::shared_ptr<Mailbox>> boxes;
        std::lock_guard<std::mutex> lock(registry_->mutex);
        for (const auto& weak : registry_->mailboxes) {
            if (auto box = weak.lock()) {
                boxes.push_back(box);
            }
        }
        return boxes;
    }

    std::shared_ptr<Registry> registry_;
};

} // namespace bridgelink
