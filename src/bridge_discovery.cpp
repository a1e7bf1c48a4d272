#include "bridge_discovery.h"
#include "bonjour_escapes.h"
#include "bridgelink_log_macros.h"
#include "gateway_txt.h"
#include <algorithm>
#include <set>
#include <sstream>
#include <thread>

namespace bridgelink {

namespace {

std::string strip_trailing_dot(const std::string& name) {
    std::string out = name;
    while (!out.empty() && out.back() == '.') {
        out.pop_back();
    }
    return out;
}

bool display_order(const BridgeEndpoint& a, const BridgeEndpoint& b) {
    std::string left = to_lower_ascii(a.display_name);
    std::string right = to_lower_ascii(b.display_name);
    if (left != right) {
        return left < right;
    }
    return a.stable_id < b.stable_id;
}

} // namespace

BridgeDiscovery::BridgeDiscovery(ServiceBrowserFactory& factory, const DiscoveryOptions& options)
    : factory_(factory),
      options_(options),
      running_(false),
      generation_(0),
      status_text_("Idle"),
      debug_logging_enabled_(false),
      snapshot_sequence_(0),
      published_sequence_(0) {
    LocalIdentity configured;
    std::string display_token = normalize_display_token(options_.display_name);
    if (!display_token.empty()) {
        configured.display_tokens.insert(display_token);
    }
    local_identity_ = configured;
}

BridgeDiscovery::~BridgeDiscovery() {
    stop();
    shutdown_all_threads();
    join_all_active_threads();
    channel_.close();
}

//=============================================================================
// Lifecycle
//=============================================================================

void BridgeDiscovery::start() {
    uint64_t generation = 0;
    std::vector<std::pair<std::string, ServiceBrowser*>> to_start;
    Update update;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (running_) {
            return;
        }
        running_ = true;
        generation = ++generation_;
        append_debug_log_locked("start()");

        if (options_.detect_local_identity) {
            local_identity_ = merge_local_identity(local_identity_, build_local_identity_fast(options_.display_name));
        }

        for (const auto& domain : options_.domains) {
            if (browsers_.count(domain) > 0) {
                continue;
            }
            std::unique_ptr<ServiceBrowser> browser = factory_.create_browser(options_.service_type, domain);
            if (!browser) {
                LOG_DISCOVERY_ERROR("No browser available for domain " << domain);
                continue;
            }
            to_start.emplace_back(domain, browser.get());
            browsers_[domain] = std::move(browser);
        }

        recompute_locked(update);
    }

    LOG_DISCOVERY_INFO("Starting discovery of " << options_.service_type << " in " << to_start.size() << " domain(s)");

    if (options_.detect_local_identity) {
        std::string display_name = options_.display_name;
        add_managed_thread(std::thread([this, display_name]() {
            apply_detected_identity(build_local_identity_slow(display_name));
        }), "local-identity");
    }

    for (const auto& entry : to_start) {
        std::string domain = entry.first;
        entry.second->start(
            [this, generation, domain](const BrowseState& state) {
                handle_state(generation, domain, state);
            },
            [this, generation, domain](const std::vector<BrowseResult>& results) {
                handle_results(generation, domain, results);
            });
    }

    finish_update(generation, update);
}

void BridgeDiscovery::stop() {
    std::map<std::string, std::unique_ptr<ServiceBrowser>> browsers;
    std::map<std::string, std::shared_ptr<TxtResolver>> pending;
    std::vector<std::shared_ptr<TxtResolver>> retired;
    Update update;
    uint64_t generation = 0;
    bool was_running = false;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        was_running = running_;
        running_ = false;
        generation = ++generation_;

        browsers.swap(browsers_);
        pending.swap(pending_resolvers_);
        retired.swap(retired_resolvers_);

        states_.clear();
        results_by_domain_.clear();
        records_by_domain_.clear();
        resolved_txt_.clear();

        append_debug_log_locked("stop()");
        recompute_locked(update);
    }

    // Outside the lock: cancelling a resolver runs its completion handler synchronously
    for (auto& entry : browsers) {
        entry.second->cancel();
    }
    for (auto& entry : pending) {
        entry.second->cancel();
    }

    if (was_running) {
        LOG_DISCOVERY_INFO("Discovery stopped");
    }

    finish_update(generation, update);
}

bool BridgeDiscovery::is_running() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return running_;
}

//=============================================================================
// Accessors
//=============================================================================

std::vector<BridgeEndpoint> BridgeDiscovery::bridges() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return bridges_;
}

std::string BridgeDiscovery::status_text() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return status_text_;
}

DiscoverySnapshot BridgeDiscovery::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    DiscoverySnapshot current;
    current.bridges = bridges_;
    current.status_text = status_text_;
    return current;
}

std::unique_ptr<BridgeDiscovery::Subscription> BridgeDiscovery::subscribe() {
    // Publishing also takes publish_mutex_ first, so nothing older than this can follow
    std::lock_guard<std::mutex> publish_lock(publish_mutex_);
    return channel_.subscribe(snapshot());
}

std::vector<DiscoveredRecord> BridgeDiscovery::records_for_domain(const std::string& domain) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_by_domain_.find(domain);
    if (it == records_by_domain_.end()) {
        return {};
    }
    return it->second;
}

std::map<std::string, BrowseState> BridgeDiscovery::domain_states() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return states_;
}

size_t BridgeDiscovery::pending_txt_resolutions() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_resolvers_.size();
}

void BridgeDiscovery::update_local_identity(const LocalIdentity& identity) {
    apply_detected_identity(identity);
}

LocalIdentity BridgeDiscovery::local_identity() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return local_identity_;
}

void BridgeDiscovery::set_debug_logging_enabled(bool enabled) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (debug_logging_enabled_ == enabled) {
        return;
    }
    debug_logging_enabled_ = enabled;
    debug_log_.clear();
    if (enabled) {
        append_debug_log_locked("debug logging enabled");
        append_debug_log_locked("snapshot: status=" + status_text_ + " bridges=" + std::to_string(bridges_.size()));
    }
}

bool BridgeDiscovery::is_debug_logging_enabled() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return debug_logging_enabled_;
}

std::vector<DebugLogEntry> BridgeDiscovery::debug_log() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::vector<DebugLogEntry>(debug_log_.begin(), debug_log_.end());
}

//=============================================================================
// Callbacks
//=============================================================================

void BridgeDiscovery::handle_state(uint64_t generation, const std::string& domain, const BrowseState& state) {
    Update update;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (generation != generation_) {
            return;
        }
        states_[domain] = state;
        append_debug_log_locked("state[" + domain + "]: " + describe_browse_state(state));

        if (state.kind == BrowseStateKind::FAILED) {
            LOG_DISCOVERY_ERROR("Browser for " << domain << " failed: " << state.error);
        } else if (state.kind == BrowseStateKind::WAITING) {
            LOG_DISCOVERY_WARN("Browser for " << domain << " is waiting: " << state.error);
        } else {
            LOG_DISCOVERY_DEBUG("Browser for " << domain << ": " << describe_browse_state(state));
        }

        recompute_locked(update);
    }
    finish_update(generation, update);
}

void BridgeDiscovery::handle_results(uint64_t generation, const std::string& domain,
                                     const std::vector<BrowseResult>& results) {
    Update update;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (generation != generation_) {
            return;
        }

        std::set<std::string> previous_ids;
        for (const auto& record : records_by_domain_[domain]) {
            previous_ids.insert(record.endpoint.stable_id);
        }

        std::vector<DiscoveredRecord> records;
        std::set<std::string> current_ids;
        for (const auto& result : results) {
            DiscoveredRecord record = build_record_locked(result);
            current_ids.insert(record.endpoint.stable_id);
            queue_txt_resolution_locked(result, record, update.resolvers_to_start);
            records.push_back(record);
        }

        size_t added = 0;
        for (const auto& id : current_ids) {
            if (previous_ids.count(id) == 0) ++added;
        }
        size_t removed = 0;
        for (const auto& id : previous_ids) {
            if (current_ids.count(id) == 0) ++removed;
        }

        results_by_domain_[domain] = results;
        records_by_domain_[domain] = records;

        std::ostringstream message;
        message << "results: total=" << results.size() << " added=" << added << " removed=" << removed;
        append_debug_log_locked(message.str());
        LOG_DISCOVERY_DEBUG(domain << " " << message.str());

        recompute_locked(update);
    }
    finish_update(generation, update);
}

void BridgeDiscovery::handle_txt_resolved(uint64_t generation, const std::string& stable_id, bool success,
                                          const TxtRecord& txt, TxtResolveError error) {
    Update update;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (generation != generation_) {
            return;
        }

        // Keep the resolver alive: this handler may be running on its thread
        auto it = pending_resolvers_.find(stable_id);
        if (it != pending_resolvers_.end()) {
            retired_resolvers_.push_back(it->second);
            pending_resolvers_.erase(it);
        }

        if (!success) {
            LOG_DISCOVERY_DEBUG("TXT resolution for " << stable_id << " ended: " << txt_resolve_error_to_string(error));
            return;
        }

        LOG_DISCOVERY_DEBUG("Resolved TXT for " << stable_id << " (" << txt.size() << " keys)");
        resolved_txt_[stable_id] = txt;
        rebuild_all_records_locked();
        recompute_locked(update);
    }
    finish_update(generation, update);
}

void BridgeDiscovery::apply_detected_identity(const LocalIdentity& identity) {
    Update update;
    uint64_t generation = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        LocalIdentity merged = merge_local_identity(local_identity_, identity);
        if (merged == local_identity_) {
            return;
        }
        local_identity_ = merged;
        generation = generation_;

        rebuild_all_records_locked();
        recompute_locked(update);
    }
    finish_update(generation, update);
}

//=============================================================================
// Record building (mutex_ held)
//=============================================================================

DiscoveredRecord BridgeDiscovery::build_record_locked(const BrowseResult& result) const {
    std::string decoded_name = bonjour_escapes::decode(result.name);
    std::string stable_id = make_stable_id(result.name, result.service_type, result.domain);

    TxtRecord txt = result.txt;
    auto resolved = resolved_txt_.find(stable_id);
    if (resolved != resolved_txt_.end()) {
        txt = merge_txt(result.txt, resolved->second);
    }
    GatewayTxt parsed = parse_gateway_txt(txt);

    DiscoveredRecord record;
    BridgeEndpoint& endpoint = record.endpoint;
    endpoint.stable_id = stable_id;

    std::string pretty_display = parsed.display_name ? prettify_instance_name(*parsed.display_name) : "";
    endpoint.display_name = !pretty_display.empty() ? pretty_display : prettify_service_name(decoded_name);

    endpoint.lan_host = parsed.lan_host;
    endpoint.tailnet_dns = parsed.tailnet_dns;
    endpoint.gateway_port = parsed.gateway_port;
    endpoint.bridge_port = parsed.bridge_port;
    endpoint.canvas_port = parsed.canvas_port;
    endpoint.cli_path = parsed.cli_path;
    endpoint.ssh_port = parsed.ssh_port;

    endpoint.host = strip_trailing_dot(result.host);
    if (endpoint.host.empty()) {
        endpoint.host = parsed.lan_host.value_or(parsed.tailnet_dns.value_or(""));
    }
    endpoint.port = result.port > 0 ? result.port : parsed.bridge_port.value_or(0);

    endpoint.debug_id = decoded_name + "." + result.service_type;
    std::string domain = strip_trailing_dot(result.domain);
    if (!domain.empty()) {
        endpoint.debug_id += "." + domain;
    }

    record.is_local = is_local_gateway(parsed.lan_host.value_or(""), parsed.tailnet_dns.value_or(""),
                                       endpoint.display_name, decoded_name, local_identity_);
    return record;
}

void BridgeDiscovery::rebuild_all_records_locked() {
    for (const auto& entry : results_by_domain_) {
        std::vector<DiscoveredRecord> records;
        for (const auto& result : entry.second) {
            records.push_back(build_record_locked(result));
        }
        records_by_domain_[entry.first] = records;
    }
}

void BridgeDiscovery::queue_txt_resolution_locked(const BrowseResult& result, const DiscoveredRecord& record,
                                                  ResolverList& out) {
    const BridgeEndpoint& endpoint = record.endpoint;
    if (endpoint.lan_host && endpoint.tailnet_dns) {
        return;
    }
    if (resolved_txt_.count(endpoint.stable_id) > 0 || pending_resolvers_.count(endpoint.stable_id) > 0) {
        return;
    }

    std::shared_ptr<TxtResolver> resolver = factory_.create_txt_resolver(result, options_.txt_resolve_timeout_ms);
    if (!resolver) {
        return;
    }
    pending_resolvers_[endpoint.stable_id] = resolver;
    out.emplace_back(endpoint.stable_id, resolver);
}

void BridgeDiscovery::recompute_locked(Update& update) {
    std::vector<BridgeEndpoint> visible;
    for (const auto& entry : records_by_domain_) {
        for (const auto& record : entry.second) {
            if (!record.is_local) {
                visible.push_back(record.endpoint);
            }
        }
    }

    // Last entry for a stable id wins, keeping the position of the first
    std::vector<BridgeEndpoint> deduped;
    std::map<std::string, size_t> index_by_id;
    for (const auto& endpoint : visible) {
        auto it = index_by_id.find(endpoint.stable_id);
        if (it != index_by_id.end()) {
            deduped[it->second] = endpoint;
        } else {
            index_by_id[endpoint.stable_id] = deduped.size();
            deduped.push_back(endpoint);
        }
    }
    std::sort(deduped.begin(), deduped.end(), display_order);

    std::string status = running_ ? compute_status_locked() : (generation_ == 0 ? "Idle" : "Stopped");

    if (deduped == bridges_ && status == status_text_) {
        return;
    }
    bridges_ = deduped;
    status_text_ = status;

    ++snapshot_sequence_;
    update.publish = true;
}

std::string BridgeDiscovery::compute_status_locked() const {
    if (states_.empty()) {
        return browsers_.empty() ? "Idle" : "Setup";
    }

    for (const auto& entry : states_) {
        if (entry.second.kind == BrowseStateKind::FAILED) {
            return "Failed: " + entry.second.error;
        }
    }
    for (const auto& entry : states_) {
        if (entry.second.kind == BrowseStateKind::WAITING) {
            return "Waiting: " + entry.second.error;
        }
    }
    for (const auto& entry : states_) {
        if (entry.second.kind == BrowseStateKind::READY) {
            return "Searching…";
        }
    }
    for (const auto& entry : states_) {
        if (entry.second.kind == BrowseStateKind::SETUP) {
            return "Setup";
        }
    }
    return "Idle";
}

void BridgeDiscovery::append_debug_log_locked(const std::string& message) {
    if (!debug_logging_enabled_) {
        return;
    }
    debug_log_.push_back(DebugLogEntry{std::chrono::system_clock::now(), message});
    while (debug_log_.size() > DISCOVERY_DEBUG_LOG_CAPACITY) {
        debug_log_.pop_front();
    }
}

//=============================================================================
// Outside the lock
//=============================================================================

void BridgeDiscovery::finish_update(uint64_t generation, Update& update) {
    for (auto& entry : update.resolvers_to_start) {
        std::string stable_id = entry.first;
        LOG_DISCOVERY_DEBUG("Resolving TXT for " << stable_id);
        entry.second->start([this, generation, stable_id](bool success, const TxtRecord& txt, TxtResolveError error) {
            handle_txt_resolved(generation, stable_id, success, txt, error);
        });
    }
    update.resolvers_to_start.clear();

    if (update.publish) {
        publish_latest();
    }
}

void BridgeDiscovery::publish_latest() {
    // Always publish the newest state; an older update arriving late finds nothing new
    std::lock_guard<std::mutex> publish_lock(publish_mutex_);
    DiscoverySnapshot latest;
    uint64_t sequence = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        latest.bridges = bridges_;
        latest.status_text = status_text_;
        sequence = snapshot_sequence_;
    }
    if (sequence <= published_sequence_) {
        return;
    }
    published_sequence_ = sequence;
    channel_.publish(latest);
}

} // namespace bridgelink
