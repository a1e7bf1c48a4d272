#pragma once

#include "bridge_endpoint.h"
#include "latest_value_channel.h"
#include "local_identity.h"
#include "service_browser.h"
#include "threadmanager.h"
#include <chrono>
#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace bridgelink {

const std::string DEFAULT_BRIDGE_SERVICE_TYPE = "_clawdis-bridge._tcp";
const std::string DEFAULT_BROWSE_DOMAIN = "local.";
const int DEFAULT_TXT_RESOLVE_TIMEOUT_MS = 2000;
const size_t DISCOVERY_DEBUG_LOG_CAPACITY = 200;

struct DiscoveryOptions {
    std::string service_type = DEFAULT_BRIDGE_SERVICE_TYPE;
    std::vector<std::string> domains = {DEFAULT_BROWSE_DOMAIN};
    std::string display_name;                    // this node's display name, for local filtering
    int txt_resolve_timeout_ms = DEFAULT_TXT_RESOLVE_TIMEOUT_MS;
    bool detect_local_identity = true;           // look up hostname / canonical name on start()
};

struct DiscoverySnapshot {
    std::vector<BridgeEndpoint> bridges;
    std::string status_text;

    bool operator==(const DiscoverySnapshot& other) const {
        return bridges == other.bridges && status_text == other.status_text;
    }
    bool operator!=(const DiscoverySnapshot& other) const { return !(*this == other); }
};

/**
 * A merged browse result as kept per domain, including ones hidden from the public
 * list because they name this device.
 */
struct DiscoveredRecord {
    BridgeEndpoint endpoint;
    bool is_local = false;
};

struct DebugLogEntry {
    std::chrono::system_clock::time_point timestamp;
    std::string message;
};

/**
 * BridgeDiscovery browses every configured domain for bridge advertisements and keeps
 * a deduplicated, name-sorted list of the bridges that are not this device.
 *
 * Browsers and TXT resolvers report on their own threads. All state lives behind one
 * mutex; snapshots are published to subscribers after it is released. Callbacks from
 * a previous start()/stop() cycle are recognised by generation and dropped.
 *
 * start() and stop() are expected to be called from one controlling thread.
 */
class BridgeDiscovery : public ThreadManager {
public:
    using Subscription = LatestValueChannel<DiscoverySnapshot>::Subscription;

    BridgeDiscovery(ServiceBrowserFactory& factory, const DiscoveryOptions& options = DiscoveryOptions());
    ~BridgeDiscovery() override;

    /**
     * Create and start one browser per domain. Does nothing when already running.
     */
    void start();

    /**
     * Cancel every browser and in-flight TXT resolution, drop all results and set the
     * status to "Stopped". No callback from the stopped run has any effect afterwards.
     */
    void stop();

    bool is_running() const;

    std::vector<BridgeEndpoint> bridges() const;
    std::string status_text() const;
    DiscoverySnapshot snapshot() const;

    /**
     * Subscribe to snapshots. The current snapshot is delivered immediately.
     */
    std::unique_ptr<Subscription> subscribe();

    std::vector<DiscoveredRecord> records_for_domain(const std::string& domain) const;
    std::map<std::string, BrowseState> domain_states() const;
    size_t pending_txt_resolutions() const;

    /**
     * Merge more tokens into the local identity and re-filter the current results.
     */
    void update_local_identity(const LocalIdentity& identity);
    LocalIdentity local_identity() const;

    // Debug log
    void set_debug_logging_enabled(bool enabled);
    bool is_debug_logging_enabled() const;
    std::vector<DebugLogEntry> debug_log() const;

private:
    using ResolverList = std::vector<std::pair<std::string, std::shared_ptr<TxtResolver>>>;

    // Work that has to happen after mutex_ is released
    struct Update {
        bool publish = false;
        ResolverList resolvers_to_start;
    };

    void handle_state(uint64_t generation, const std::string& domain, const BrowseState& state);
    void handle_results(uint64_t generation, const std::string& domain, const std::vector<BrowseResult>& results);
    void handle_txt_resolved(uint64_t generation, const std::string& stable_id, bool success,
                             const TxtRecord& txt, TxtResolveError error);
    void apply_detected_identity(const LocalIdentity& identity);

    DiscoveredRecord build_record_locked(const BrowseResult& result) const;
    void rebuild_all_records_locked();
    void queue_txt_resolution_locked(const BrowseResult& result, const DiscoveredRecord& record,
                                     ResolverList& out);
    void recompute_locked(Update& update);
    std::string compute_status_locked() const;
    void append_debug_log_locked(const std::string& message);

    void finish_update(uint64_t generation, Update& update);
    void publish_latest();

    ServiceBrowserFactory& factory_;
    DiscoveryOptions options_;

    mutable std::mutex mutex_;
    bool running_;
    uint64_t generation_;
    std::map<std::string, std::unique_ptr<ServiceBrowser>> browsers_;
    std::map<std::string, BrowseState> states_;
    std::map<std::string, std::vector<BrowseResult>> results_by_domain_;
    std::map<std::string, std::vector<DiscoveredRecord>> records_by_domain_;
    std::map<std::string, TxtRecord> resolved_txt_;
    std::map<std::string, std::shared_ptr<TxtResolver>> pending_resolvers_;
    std::vector<std::shared_ptr<TxtResolver>> retired_resolvers_;
    LocalIdentity local_identity_;
    std::vector<BridgeEndpoint> bridges_;
    std::string status_text_;
    bool debug_logging_enabled_;
    std::deque<DebugLogEntry> debug_log_;
    uint64_t snapshot_sequence_;

    std::mutex publish_mutex_;
    uint64_t published_sequence_;
    LatestValueChannel<DiscoverySnapshot> channel_;
};

} // namespace bridgelink
