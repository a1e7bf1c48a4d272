#include "threadmanager.h"

#define LOG_THREAD_DEBUG(message) LOG_DEBUG("thread", message)
#define LOG_THREAD_WARN(message)  LOG_WARN("thread", message)

namespace bridgelink {

ThreadManager::ThreadManager() : shutdown_requested_(false) {
}

ThreadManager::~ThreadManager() {
    join_all_active_threads();
}

void ThreadManager::add_managed_thread(std::thread&& t, const std::string& name) {
    {
        std::lock_guard<std::mutex> lock(active_threads_mutex_);
        if (!shutdown_requested_.load()) {
            active_threads_.push_back(std::move(t));
            LOG_THREAD_DEBUG("Tracking thread '" << name << "' (" << active_threads_.size() << " owned)");
            return;
        }
    }

    LOG_THREAD_WARN("Thread '" << name << "' started after shutdown, joining it now");
    if (t.joinable()) {
        t.join();
    }
}

void ThreadManager::shutdown_all_threads() {
    std::lock_guard<std::mutex> lock(active_threads_mutex_);
    shutdown_requested_.store(true);
}

void ThreadManager::join_all_active_threads() {
    std::vector<std::thread> owned;
    {
        std::lock_guard<std::mutex> lock(active_threads_mutex_);
        owned.swap(active_threads_);
    }
    if (owned.empty()) {
        return;
    }

    LOG_THREAD_DEBUG("Joining " << owned.size() << " background thread(s)");
    for (auto& t : owned) {
        if (t.joinable()) {
            t.join();
        }
    }
}

} // namespace bridgelink
