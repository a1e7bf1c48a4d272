#pragma once

#include "logger.h"
#include <thread>
#include <vector>
#include <mutex>
#include <atomic>
#include <string>

namespace bridgelink {

/**
 * ThreadManager owns short-lived background threads (host resolution, TXT lookups)
 * for classes that must join all of them before their own state goes away.
 */
class ThreadManager {
public:
    ThreadManager();
    virtual ~ThreadManager();

    /**
     * Take ownership of a running thread. After shutdown_all_threads() the thread
     * is joined at once instead of being kept.
     * @param t Thread to own
     * @param name Label used in debug logs
     */
    void add_managed_thread(std::thread&& t, const std::string& name);

    // Threads handed over after this are joined immediately

    void shutdown_all_threads();

    void join_all_active_threads();

private:
    std::atomic<bool> shutdown_requested_;

    std::vector<std::thread> active_threads_;
    std::mutex active_threads_mutex_;

    ThreadManager(const ThreadManager&) = delete;
    ThreadManager& operator=(const ThreadManager&) = delete;
};

} // namespace bridgelink
