#include "dnssd_browser.h"
#include "logger.h"
#include <algorithm>
#include <stdexcept>

#define LOG_DNSSD_DEBUG(message) LOG_DEBUG("dnssd", message)
#define LOG_DNSSD_INFO(message)  LOG_INFO("dnssd", message)
#define LOG_DNSSD_WARN(message)  LOG_WARN("dnssd", message)
#define LOG_DNSSD_ERROR(message) LOG_ERROR("dnssd", message)

namespace bridgelink {

namespace {

const int RECEIVE_SLICE_MS = 250;
const int TXT_QUERY_INTERVAL_MS = 1000;
const uint8_t RCODE_NXDOMAIN = 3;

std::string strip_trailing_dot(const std::string& name) {
    if (!name.empty() && name.back() == '.') {
        return name.substr(0, name.size() - 1);
    }
    return name;
}

std::string host_key(const std::string& host) {
    return to_lower_ascii(strip_trailing_dot(host));
}

DnssdTransport transport_for_domain(const std::string& domain) {
    return is_multicast_domain(domain) ? DnssdTransport::MULTICAST : DnssdTransport::UNICAST;
}

uint16_t initial_transaction_id() {
    auto ticks = std::chrono::steady_clock::now().time_since_epoch().count();
    return static_cast<uint16_t>((ticks & 0xFFFF) | 1);
}

void join_unless_self(std::thread& worker) {
    if (!worker.joinable()) {
        return;
    }
    if (worker.get_id() == std::this_thread::get_id()) {
        worker.detach();
    } else {
        worker.join();
    }
}

} // namespace

//=============================================================================
// DnssdServiceBrowser
//=============================================================================

DnssdServiceBrowser::DnssdServiceBrowser(const std::string& service_type, const std::string& domain,
                                         const DnssdOptions& options)
    : service_type_(service_type),
      domain_(domain),
      browse_name_(service_type + "." + strip_trailing_dot(domain)),
      options_(options),
      transport_(transport_for_domain(domain)),
      running_(false),
      started_(false),
      state_reported_(false),
      unanswered_queries_(0),
      follow_up_due_(false),
      transaction_id_(initial_transaction_id()) {}

DnssdServiceBrowser::~DnssdServiceBrowser() {
    running_.store(false);
    join_unless_self(worker_);
}

void DnssdServiceBrowser::start(StateHandler on_state, ResultsHandler on_results) {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (started_) {
        return;
    }
    started_ = true;

    on_state_ = std::move(on_state);
    on_results_ = std::move(on_results);
    running_.store(true);

    LOG_DNSSD_INFO("Browsing " << browse_name_ << " over "
                   << (transport_ == DnssdTransport::MULTICAST ? "mDNS" : "unicast DNS"));
    worker_ = std::thread(&DnssdServiceBrowser::browse_loop, this);
}

void DnssdServiceBrowser::cancel() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    running_.store(false);

    // Called from one of our own handlers: the loop exits once the handler returns
    if (worker_.joinable() && worker_.get_id() == std::this_thread::get_id()) {
        return;
    }
    if (worker_.joinable()) {
        worker_.join();
        LOG_DNSSD_DEBUG("Stopped browsing " << browse_name_);
    }
}

void DnssdServiceBrowser::browse_loop() {
    update_state(BrowseState::setup());

    DnssdQuerySocket socket(transport_, options_.nameserver, options_.nameserver_port);
    std::string error;
    bool listen = transport_ == DnssdTransport::MULTICAST && options_.listen_on_mdns_port;
    if (!socket.open(listen, &error)) {
        LOG_DNSSD_ERROR("Cannot browse " << browse_name_ << ": " << error);
        update_state(BrowseState::failed(error));
        return;
    }

    update_state(BrowseState::ready());

    int interval_ms = options_.initial_query_interval_ms;
    auto next_query = std::chrono::steady_clock::now();

    while (running_.load()) {
        auto now = std::chrono::steady_clock::now();
        if (now >= next_query) {
            if (!send_browse_query(socket)) {
                update_state(BrowseState::waiting("cannot send query to " + socket.target_ip()));
            } else if (transport_ == DnssdTransport::MULTICAST) {
                update_state(BrowseState::ready());
            } else if (++unanswered_queries_ > options_.unanswered_queries_before_waiting) {
                update_state(BrowseState::waiting("no response from nameserver " + socket.target_ip()));
            }

            next_query = now + std::chrono::milliseconds(interval_ms);
            interval_ms = std::min(interval_ms * 2, options_.max_query_interval_ms);
        }

        if (follow_up_due_) {
            follow_up_due_ = false;
            send_follow_up_queries(socket);
        }

        bool changed = false;
        DnsMessage message;
        if (socket.receive_response(message, RECEIVE_SLICE_MS)) {
            changed = handle_response(message);
        }
        if (expire_instances()) {
            changed = true;
        }

        if (changed && running_.load()) {
            std::vector<BrowseResult> results = current_results();
            if (results != last_results_) {
                last_results_ = results;
                LOG_DNSSD_DEBUG(browse_name_ << ": " << results.size() << " instance(s)");
                on_results_(results);
            }
        }
    }
}

DnsMessage DnssdServiceBrowser::build_query(const std::string& name, DnsRecordType type,
                                            const DnssdQuerySocket& socket) {
    if (transport_ == DnssdTransport::UNICAST) {
        return dns::create_query(name, type, next_transaction_id(), false, true);
    }
    // Multicast listeners use id 0; legacy unicast replies echo a non-zero id
    uint16_t id = socket.is_listener() ? 0 : next_transaction_id();
    return dns::create_query(name, type, id);
}

bool DnssdServiceBrowser::send_browse_query(DnssdQuerySocket& socket) {
    return socket.send_query(build_query(browse_name_, DnsRecordType::PTR, socket));
}

void DnssdServiceBrowser::send_follow_up_queries(DnssdQuerySocket& socket) {
    for (const auto& entry : instances_) {
        const Instance& instance = entry.second;
        std::string full_name = instance.name.full_name();

        if (instance.target.empty()) {
            socket.send_query(build_query(full_name, DnsRecordType::SRV, socket));
        }
        if (!instance.has_txt) {
            socket.send_query(build_query(full_name, DnsRecordType::TXT, socket));
        }
        if (!instance.target.empty() && addresses_.find(host_key(instance.target)) == addresses_.end()) {
            socket.send_query(build_query(instance.target, DnsRecordType::A, socket));
        }
    }
}

bool DnssdServiceBrowser::handle_response(const DnsMessage& message) {
    bool changed = false;

    if (transport_ == DnssdTransport::UNICAST) {
        unanswered_queries_ = 0;
        if (message.rcode() != 0 && message.rcode() != RCODE_NXDOMAIN) {
            update_state(BrowseState::waiting("nameserver error (rcode " + std::to_string(message.rcode()) + ")"));
            return false;
        }
        update_state(BrowseState::ready());
    }

    std::vector<const DnsResourceRecord*> records;
    for (const auto& record : message.answers) records.push_back(&record);
    for (const auto& record : message.additionals) records.push_back(&record);

    // Instances come from PTR records, so those go first
    std::stable_partition(records.begin(), records.end(), [](const DnsResourceRecord* record) {
        return record->type == DnsRecordType::PTR;
    });

    std::vector<std::string> seen_instances;
    for (const DnsResourceRecord* record : records) {
        if (handle_record(message, *record, seen_instances)) {
            changed = true;
        }
    }

    // A unicast answer to our PTR question is the complete instance list
    bool answers_browse_query = false;
    for (const auto& question : message.questions) {
        if (question.type == DnsRecordType::PTR && dns::names_equal(question.name, browse_name_)) {
            answers_browse_query = true;
        }
    }
    if (transport_ == DnssdTransport::UNICAST && answers_browse_query) {
        for (auto it = instances_.begin(); it != instances_.end();) {
            if (std::find(seen_instances.begin(), seen_instances.end(), it->first) == seen_instances.end()) {
                it = instances_.erase(it);
                changed = true;
            } else {
                ++it;
            }
        }
    }

    return changed;
}

bool DnssdServiceBrowser::handle_record(const DnsMessage& message, const DnsResourceRecord& record,
                                        std::vector<std::string>& seen_instances) {
    auto now = std::chrono::steady_clock::now();

    if (record.type == DnsRecordType::A || record.type == DnsRecordType::AAAA) {
        std::string address = dns::decode_address_record(record);
        if (address.empty() || record.ttl == 0) {
            return false;
        }
        std::string& known = addresses_[host_key(record.name)];
        if (known == address) {
            return false;
        }
        // Prefer IPv4 once we have it
        if (!known.empty() && record.type == DnsRecordType::AAAA && known.find(':') == std::string::npos) {
            return false;
        }
        known = address;
        return true;
    }

    if (record.type == DnsRecordType::PTR) {
        if (!dns::names_equal(record.name, browse_name_)) {
            return false;
        }

        std::string target;
        try {
            size_t offset = record.data_offset_in_packet;
            target = dns::read_name(message.raw_packet, offset);
        } catch (const std::out_of_range&) {
            LOG_DNSSD_DEBUG("Malformed PTR record for " << browse_name_);
            return false;
        }

        ServiceInstanceName name;
        if (!dns::parse_service_instance_name(target, name) || !matches_browse_type(name)) {
            return false;
        }

        std::string key = to_lower_ascii(name.full_name());
        if (record.ttl == 0) {
            LOG_DNSSD_DEBUG("Goodbye from " << target);
            return instances_.erase(key) > 0;
        }

        seen_instances.push_back(key);
        auto it = instances_.find(key);
        if (it == instances_.end()) {
            Instance instance;
            instance.name = name;
            instance.expires = now + std::chrono::seconds(record.ttl);
            instances_.emplace(key, instance);
            follow_up_due_ = true;
            LOG_DNSSD_DEBUG("Found " << target);
            return true;
        }
        it->second.expires = now + std::chrono::seconds(record.ttl);
        return false;
    }

    if (record.type != DnsRecordType::SRV && record.type != DnsRecordType::TXT) {
        return false;
    }

    ServiceInstanceName name;
    if (!dns::parse_service_instance_name(record.name, name) || !matches_browse_type(name)) {
        return false;
    }
    auto it = instances_.find(to_lower_ascii(name.full_name()));
    if (it == instances_.end() || record.ttl == 0) {
        return false;
    }
    Instance& instance = it->second;

    if (record.type == DnsRecordType::SRV) {
        uint16_t priority = 0;
        uint16_t weight = 0;
        uint16_t port = 0;
        std::string target;
        if (!dns::decode_srv_record(message.raw_packet, record.data_offset_in_packet, priority, weight, port, target)) {
            return false;
        }
        target = strip_trailing_dot(target);
        if (instance.target == target && instance.port == port) {
            return false;
        }
        instance.target = target;
        instance.port = port;
        follow_up_due_ = true;
        return true;
    }

    TxtRecord txt = dns::decode_txt_record(record.data);
    if (instance.has_txt && instance.txt == txt) {
        return false;
    }
    instance.txt = txt;
    instance.has_txt = true;
    return true;
}

bool DnssdServiceBrowser::expire_instances() {
    auto now = std::chrono::steady_clock::now();
    bool changed = false;
    for (auto it = instances_.begin(); it != instances_.end();) {
        if (it->second.expires <= now) {
            LOG_DNSSD_DEBUG("Expired " << it->second.name.full_name());
            it = instances_.erase(it);
            changed = true;
        } else {
            ++it;
        }
    }
    return changed;
}

bool DnssdServiceBrowser::matches_browse_type(const ServiceInstanceName& name) const {
    return dns::names_equal(name.service_type + "." + name.domain, browse_name_);
}

std::vector<BrowseResult> DnssdServiceBrowser::current_results() const {
    std::vector<BrowseResult> results;
    for (const auto& entry : instances_) {
        const Instance& instance = entry.second;

        BrowseResult result;
        result.name = instance.name.instance;
        result.service_type = service_type_;
        result.domain = domain_;
        result.txt = instance.txt;
        result.port = instance.port;

        auto address = addresses_.find(host_key(instance.target));
        result.host = address != addresses_.end() ? address->second : instance.target;

        results.push_back(result);
    }
    return results;
}

void DnssdServiceBrowser::update_state(const BrowseState& state) {
    if (state_reported_ && last_state_ == state) {
        return;
    }
    last_state_ = state;
    state_reported_ = true;

    LOG_DNSSD_DEBUG(browse_name_ << " state: " << describe_browse_state(state));
    if (running_.load() && on_state_) {
        on_state_(state);
    }
}

uint16_t DnssdServiceBrowser::next_transaction_id() {
    if (++transaction_id_ == 0) {
        transaction_id_ = 1;
    }
    return transaction_id_;
}

//=============================================================================
// DnssdTxtResolver
//=============================================================================

DnssdTxtResolver::DnssdTxtResolver(const BrowseResult& service, int timeout_ms, const DnssdOptions& options)
    : timeout_ms_(timeout_ms),
      options_(options),
      transport_(transport_for_domain(service.domain)),
      started_(false),
      finished_(false),
      stop_requested_(false) {
    ServiceInstanceName name;
    name.instance = service.name;
    name.service_type = service.service_type;
    name.domain = strip_trailing_dot(service.domain);
    full_name_ = name.full_name();
}

DnssdTxtResolver::~DnssdTxtResolver() {
    stop_requested_.store(true);
    join_unless_self(worker_);
}

void DnssdTxtResolver::start(CompletionHandler on_complete) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (started_ || finished_) {
        return;
    }
    started_ = true;
    on_complete_ = std::move(on_complete);
    worker_ = std::thread(&DnssdTxtResolver::resolve_loop, this);
}

void DnssdTxtResolver::cancel() {
    stop_requested_.store(true);
    finish(false, TxtRecord(), TxtResolveError::CANCELLED);
}

void DnssdTxtResolver::resolve_loop() {
    DnssdQuerySocket socket(transport_, options_.nameserver, options_.nameserver_port);
    std::string error;
    if (!socket.open(false, &error)) {
        LOG_DNSSD_WARN("TXT lookup of " << full_name_ << " failed: " << error);
        finish(false, TxtRecord(), TxtResolveError::FAILED);
        return;
    }

    uint16_t id = initial_transaction_id();
    DnsMessage query = dns::create_query(full_name_, DnsRecordType::TXT, id, false,
                                         transport_ == DnssdTransport::UNICAST);

    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms_);
    auto next_query = std::chrono::steady_clock::now();

    while (!stop_requested_.load()) {
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            LOG_DNSSD_DEBUG("TXT lookup of " << full_name_ << " timed out");
            finish(false, TxtRecord(), TxtResolveError::TIMEOUT);
            return;
        }

        if (now >= next_query) {
            if (!socket.send_query(query)) {
                LOG_DNSSD_WARN("Cannot send TXT query for " << full_name_);
                finish(false, TxtRecord(), TxtResolveError::FAILED);
                return;
            }
            next_query = now + std::chrono::milliseconds(TXT_QUERY_INTERVAL_MS);
        }

        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now).count();
        int wait_ms = static_cast<int>(std::min<long long>(RECEIVE_SLICE_MS, std::max<long long>(remaining, 1)));

        DnsMessage response;
        if (!socket.receive_response(response, wait_ms)) {
            continue;
        }

        TxtRecord txt;
        if (find_txt(response, txt)) {
            finish(true, txt, TxtResolveError::NONE);
            return;
        }
        if (transport_ == DnssdTransport::UNICAST && response.header.transaction_id == id &&
            response.rcode() == RCODE_NXDOMAIN) {
            finish(false, TxtRecord(), TxtResolveError::FAILED);
            return;
        }
    }
}

bool DnssdTxtResolver::find_txt(const DnsMessage& message, TxtRecord& txt) const {
    for (const auto* section : {&message.answers, &message.additionals}) {
        for (const auto& record : *section) {
            if (record.type == DnsRecordType::TXT && record.ttl > 0 && dns::names_equal(record.name, full_name_)) {
                txt = dns::decode_txt_record(record.data);
                return true;
            }
        }
    }
    return false;
}

void DnssdTxtResolver::finish(bool success, const TxtRecord& txt, TxtResolveError error) {
    CompletionHandler handler;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (finished_) {
            return;
        }
        finished_ = true;
        handler = std::move(on_complete_);
        on_complete_ = nullptr;
    }

    // The handler may drop the last reference to this resolver; touch nothing after it
    if (handler) {
        handler(success, txt, error);
    }
}

//=============================================================================
// DnssdServiceBrowserFactory
//=============================================================================

DnssdServiceBrowserFactory::DnssdServiceBrowserFactory(const DnssdOptions& options) : options_(options) {}

std::unique_ptr<ServiceBrowser> DnssdServiceBrowserFactory::create_browser(const std::string& service_type,
                                                                           const std::string& domain) {
    return std::make_unique<DnssdServiceBrowser>(service_type, domain, options_);
}

std::shared_ptr<TxtResolver> DnssdServiceBrowserFactory::create_txt_resolver(const BrowseResult& service,
                                                                             int timeout_ms) {
    return std::make_shared<DnssdTxtResolver>(service, timeout_ms, options_);
}

} // namespace bridgelink
