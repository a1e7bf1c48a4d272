#pragma once

#include "dns_message.h"
#include "dnssd_socket.h"
#include "service_browser.h"
#include <atomic>
#include <chrono>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace bridgelink {

struct DnssdOptions {
    std::string nameserver;               // unicast domains; empty uses /etc/resolv.conf
    int nameserver_port = DNS_PORT;
    bool listen_on_mdns_port = true;      // multicast browsers also hear unsolicited announcements
    int initial_query_interval_ms = 1000;
    int max_query_interval_ms = 60000;
    int unanswered_queries_before_waiting = 3;
};

/**
 * DNS-SD browser for one service type in one domain.
 *
 * A worker thread sends PTR queries with exponential backoff, follows up with SRV, TXT
 * and A queries for incomplete instances, and reports the instance set whenever it
 * changes. "local." is browsed over mDNS, any other domain through a unicast nameserver.
 */
class DnssdServiceBrowser : public ServiceBrowser {
public:
    DnssdServiceBrowser(const std::string& service_type, const std::string& domain,
                        const DnssdOptions& options);
    ~DnssdServiceBrowser() override;

    void start(StateHandler on_state, ResultsHandler on_results) override;
    void cancel() override;

private:
    struct Instance {
        ServiceInstanceName name;
        TxtRecord txt;
        bool has_txt = false;
        std::string target;
        int port = 0;
        std::chrono::steady_clock::time_point expires;
    };

    void browse_loop();
    bool send_browse_query(DnssdQuerySocket& socket);
    void send_follow_up_queries(DnssdQuerySocket& socket);
    DnsMessage build_query(const std::string& name, DnsRecordType type, const DnssdQuerySocket& socket);
    bool handle_response(const DnsMessage& message);
    bool handle_record(const DnsMessage& message, const DnsResourceRecord& record,
                       std::vector<std::string>& seen_instances);
    bool expire_instances();
    bool matches_browse_type(const ServiceInstanceName& name) const;
    std::vector<BrowseResult> current_results() const;
    void update_state(const BrowseState& state);
    uint16_t next_transaction_id();

    std::string service_type_;
    std::string domain_;
    std::string browse_name_;
    DnssdOptions options_;
    DnssdTransport transport_;

    StateHandler on_state_;
    ResultsHandler on_results_;

    std::atomic<bool> running_;
    std::thread worker_;
    std::mutex lifecycle_mutex_;
    bool started_;

    // Worker thread only
    std::map<std::string, Instance> instances_;     // keyed by lowercased full name
    std::map<std::string, std::string> addresses_;  // lowercased host name -> address
    std::vector<BrowseResult> last_results_;
    BrowseState last_state_;
    bool state_reported_;
    int unanswered_queries_;
    bool follow_up_due_;
    uint16_t transaction_id_;
};

/**
 * One-shot TXT lookup of a single service instance.
 */
class DnssdTxtResolver : public TxtResolver {
public:
    DnssdTxtResolver(const BrowseResult& service, int timeout_ms, const DnssdOptions& options);
    ~DnssdTxtResolver() override;

    void start(CompletionHandler on_complete) override;
    void cancel() override;

    const std::string& full_name() const { return full_name_; }

private:
    void resolve_loop();
    void finish(bool success, const TxtRecord& txt, TxtResolveError error);
    bool find_txt(const DnsMessage& message, TxtRecord& txt) const;

    std::string full_name_;
    int timeout_ms_;
    DnssdOptions options_;
    DnssdTransport transport_;

    std::mutex mutex_;
    CompletionHandler on_complete_;
    bool started_;
    bool finished_;
    std::atomic<bool> stop_requested_;
    std::thread worker_;
};

class DnssdServiceBrowserFactory : public ServiceBrowserFactory {
public:
    explicit DnssdServiceBrowserFactory(const DnssdOptions& options = DnssdOptions());

    std::unique_ptr<ServiceBrowser> create_browser(const std::string& service_type,
                                                   const std::string& domain) override;
    std::shared_ptr<TxtResolver> create_txt_resolver(const BrowseResult& service, int timeout_ms) override;

private:
    DnssdOptions options_;
};

} // namespace bridgelink
