#include <gtest/gtest.h>
#include "dnssd_browser.h"
#include "socket.h"
#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <thread>

using namespace bridgelink;

namespace {

const std::string SERVICE_TYPE = "_clawdis-bridge._tcp";
const std::string BROWSE_DOMAIN = "tailnet.example.";
const std::string BROWSE_NAME = "_clawdis-bridge._tcp.tailnet.example";
const std::string INSTANCE_NAME = "Studio\\032Bridge._clawdis-bridge._tcp.tailnet.example";
const std::string TARGET_HOST = "studio.tailnet.example";

DnsResourceRecord make_record(const std::string& name, DnsRecordType type, std::vector<uint8_t> data,
                              uint32_t ttl = 120) {
    DnsResourceRecord record;
    record.name = name;
    record.type = type;
    record.ttl = ttl;
    record.data = std::move(data);
    return record;
}

/**
 * Unicast DNS server on loopback that answers from a handler.
 * The handler fills the response for each query; returning false drops the query.
 */
class FakeNameserver {
public:
    using Handler = std::function<bool(const DnsMessage& query, DnsMessage& response)>;

    explicit FakeNameserver(Handler handler)
        : socket_(create_udp_socket_v4(0)), handler_(std::move(handler)), running_(true), queries_(0) {
        port_ = get_bound_port(socket_.get());
        thread_ = std::thread([this]() { serve(); });
    }

    ~FakeNameserver() {
        running_.store(false);
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    int port() const { return port_; }
    int queries() const { return queries_.load(); }

private:
    void serve() {
        while (running_.load()) {
            std::string sender_ip;
            int sender_port = 0;
            std::vector<uint8_t> packet =
                receive_udp_data_with_timeout(socket_.get(), 9000, 50, &sender_ip, &sender_port);
            if (packet.empty()) {
                continue;
            }

            DnsMessage query;
            if (!dns::deserialize_message(packet, query) || query.is_response() || query.questions.empty()) {
                continue;
            }
            ++queries_;

            DnsMessage response;
            response.header.transaction_id = query.header.transaction_id;
            response.header.flags = static_cast<uint16_t>(DnsFlags::RESPONSE);
            response.questions = query.questions;
            if (handler_(query, response)) {
                send_udp_data_to(socket_.get(), dns::serialize_message(response), sender_ip, sender_port);
            }
        }
    }

    ScopedSocket socket_;
    int port_;
    Handler handler_;
    std::atomic<bool> running_;
    std::atomic<int> queries_;
    std::thread thread_;
};

// Complete answer for the studio bridge: PTR plus SRV, TXT and A in the additional section
void answer_with_bridge(const DnsMessage& query, DnsMessage& response) {
    const DnsQuestion& question = query.questions[0];
    if (question.type == DnsRecordType::PTR && dns::names_equal(question.name, BROWSE_NAME)) {
        std::vector<uint8_t> target;
        dns::write_name(target, INSTANCE_NAME);
        response.answers.push_back(make_record(BROWSE_NAME, DnsRecordType::PTR, target));
        response.additionals.push_back(make_record(INSTANCE_NAME, DnsRecordType::SRV,
                                                   dns::encode_srv_record(0, 0, 18790, TARGET_HOST)));
        response.additionals.push_back(make_record(INSTANCE_NAME, DnsRecordType::TXT,
                                                   dns::encode_txt_record({{"lanHost", "studio.local"},
                                                                           {"displayName", "Studio Bridge"}})));
        response.additionals.push_back(make_record(TARGET_HOST, DnsRecordType::A, {100, 64, 0, 10}));
    } else if (question.type == DnsRecordType::TXT && dns::names_equal(question.name, INSTANCE_NAME)) {
        response.answers.push_back(make_record(INSTANCE_NAME, DnsRecordType::TXT,
                                               dns::encode_txt_record({{"tailnetDns", "studio.tailnet.example"}})));
    }
}

/**
 * Collects browser callbacks and lets the test wait for a condition on them.
 */
class BrowseRecorder {
public:
    ServiceBrowser::StateHandler state_handler() {
        return [this](const BrowseState& state) {
            std::lock_guard<std::mutex> lock(mutex_);
            states_.push_back(state);
            cv_.notify_all();
        };
    }

    ServiceBrowser::ResultsHandler results_handler() {
        return [this](const std::vector<BrowseResult>& results) {
            std::lock_guard<std::mutex> lock(mutex_);
            results_.push_back(results);
            cv_.notify_all();
        };
    }

    bool wait_for(const std::function<bool(const std::vector<BrowseState>&,
                                           const std::vector<std::vector<BrowseResult>>&)>& predicate,
                  int timeout_ms = 5000) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms),
                            [&]() { return predicate(states_, results_); });
    }

    std::vector<BrowseState> states() {
        std::lock_guard<std::mutex> lock(mutex_);
        return states_;
    }

    std::vector<BrowseResult> last_results() {
        std::lock_guard<std::mutex> lock(mutex_);
        return results_.empty() ? std::vector<BrowseResult>() : results_.back();
    }

    size_t callback_count() {
        std::lock_guard<std::mutex> lock(mutex_);
        return states_.size() + results_.size();
    }

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<BrowseState> states_;
    std::vector<std::vector<BrowseResult>> results_;
};

bool has_complete_bridge(const std::vector<std::vector<BrowseResult>>& results) {
    if (results.empty() || results.back().size() != 1) {
        return false;
    }
    const BrowseResult& result = results.back()[0];
    return result.port == 18790 && !result.host.empty() && result.txt.count("lanHost") == 1 &&
           result.host == "100.64.0.10";
}

} // namespace

class DnssdBrowserTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(init_socket_library());
        options_.nameserver = "127.0.0.1";
        options_.initial_query_interval_ms = 100;
        options_.max_query_interval_ms = 200;
    }

    void TearDown() override {
        cleanup_socket_library();
    }

    DnssdOptions options_;
};

TEST(DnssdTransportTest, MulticastDomains) {
    EXPECT_TRUE(is_multicast_domain("local."));
    EXPECT_TRUE(is_multicast_domain("LOCAL"));
    EXPECT_FALSE(is_multicast_domain("tailnet.example."));
    EXPECT_FALSE(is_multicast_domain("local.example"));
}

TEST_F(DnssdBrowserTest, UnicastBrowseCollectsInstance) {
    FakeNameserver server([](const DnsMessage& query, DnsMessage& response) {
        answer_with_bridge(query, response);
        return true;
    });
    options_.nameserver_port = server.port();

    BrowseRecorder recorder;
    DnssdServiceBrowser browser(SERVICE_TYPE, BROWSE_DOMAIN, options_);
    browser.start(recorder.state_handler(), recorder.results_handler());

    ASSERT_TRUE(recorder.wait_for([](const std::vector<BrowseState>& states,
                                     const std::vector<std::vector<BrowseResult>>& results) {
        return !states.empty() && has_complete_bridge(results);
    }));
    browser.cancel();

    std::vector<BrowseResult> results = recorder.last_results();
    ASSERT_EQ(results.size(), 1u);
    EXPECT_EQ(results[0].name, "Studio\\032Bridge");
    EXPECT_EQ(results[0].service_type, SERVICE_TYPE);
    EXPECT_EQ(results[0].domain, BROWSE_DOMAIN);
    EXPECT_EQ(results[0].txt.at("displayName"), "Studio Bridge");

    std::vector<BrowseState> states = recorder.states();
    ASSERT_FALSE(states.empty());
    EXPECT_EQ(states.front(), BrowseState::setup());
    bool saw_ready = false;
    for (const auto& state : states) {
        saw_ready = saw_ready || state.kind == BrowseStateKind::READY;
    }
    EXPECT_TRUE(saw_ready);
}

TEST_F(DnssdBrowserTest, InstanceRemovedWhenNoLongerListed) {
    std::atomic<bool> advertise(true);
    FakeNameserver server([&advertise](const DnsMessage& query, DnsMessage& response) {
        if (advertise.load()) {
            answer_with_bridge(query, response);
        }
        return true;
    });
    options_.nameserver_port = server.port();

    BrowseRecorder recorder;
    DnssdServiceBrowser browser(SERVICE_TYPE, BROWSE_DOMAIN, options_);
    browser.start(recorder.state_handler(), recorder.results_handler());

    ASSERT_TRUE(recorder.wait_for([](const std::vector<BrowseState>&,
                                     const std::vector<std::vector<BrowseResult>>& results) {
        return has_complete_bridge(results);
    }));

    advertise.store(false);
    EXPECT_TRUE(recorder.wait_for([](const std::vector<BrowseState>&,
                                     const std::vector<std::vector<BrowseResult>>& results) {
        return !results.empty() && results.back().empty();
    }));
    browser.cancel();
}

TEST_F(DnssdBrowserTest, SilentNameserverMovesToWaiting) {
    FakeNameserver server([](const DnsMessage&, DnsMessage&) { return false; });
    options_.nameserver_port = server.port();
    options_.initial_query_interval_ms = 50;
    options_.max_query_interval_ms = 50;
    options_.unanswered_queries_before_waiting = 1;

    BrowseRecorder recorder;
    DnssdServiceBrowser browser(SERVICE_TYPE, BROWSE_DOMAIN, options_);
    browser.start(recorder.state_handler(), recorder.results_handler());

    EXPECT_TRUE(recorder.wait_for([](const std::vector<BrowseState>& states,
                                     const std::vector<std::vector<BrowseResult>>&) {
        return !states.empty() && states.back() == BrowseState::waiting("no response from nameserver 127.0.0.1");
    }));
    browser.cancel();
}

TEST_F(DnssdBrowserTest, NoCallbacksAfterCancel) {
    FakeNameserver server([](const DnsMessage& query, DnsMessage& response) {
        answer_with_bridge(query, response);
        return true;
    });
    options_.nameserver_port = server.port();

    BrowseRecorder recorder;
    DnssdServiceBrowser browser(SERVICE_TYPE, BROWSE_DOMAIN, options_);
    browser.start(recorder.state_handler(), recorder.results_handler());
    ASSERT_TRUE(recorder.wait_for([](const std::vector<BrowseState>& states,
                                     const std::vector<std::vector<BrowseResult>>&) {
        return !states.empty();
    }));

    browser.cancel();
    size_t count = recorder.callback_count();
    std::this_thread::sleep_for(std::chrono::milliseconds(300));
    EXPECT_EQ(recorder.callback_count(), count);

    // Cancelling twice is harmless
    browser.cancel();
}

TEST_F(DnssdBrowserTest, TxtResolverFindsRecord) {
    FakeNameserver server([](const DnsMessage& query, DnsMessage& response) {
        answer_with_bridge(query, response);
        return true;
    });
    options_.nameserver_port = server.port();

    BrowseResult service;
    service.name = "Studio\\032Bridge";
    service.service_type = SERVICE_TYPE;
    service.domain = BROWSE_DOMAIN;

    DnssdServiceBrowserFactory factory(options_);
    std::shared_ptr<TxtResolver> resolver = factory.create_txt_resolver(service, 2000);

    std::mutex mutex;
    std::condition_variable cv;
    int calls = 0;
    bool success = false;
    TxtRecord txt;
    TxtResolveError error = TxtResolveError::FAILED;
    resolver->start([&](bool ok, const TxtRecord& record, TxtResolveError err) {
        std::lock_guard<std::mutex> lock(mutex);
        ++calls;
        success = ok;
        txt = record;
        error = err;
        cv.notify_all();
    });

    std::unique_lock<std::mutex> lock(mutex);
    ASSERT_TRUE(cv.wait_for(lock, std::chrono::seconds(5), [&]() { return calls > 0; }));
    EXPECT_TRUE(success);
    EXPECT_EQ(error, TxtResolveError::NONE);
    EXPECT_EQ(txt["tailnetDns"], "studio.tailnet.example");
    lock.unlock();

    // Finishing is final
    resolver->cancel();
    EXPECT_EQ(calls, 1);
}

TEST_F(DnssdBrowserTest, TxtResolverTimesOut) {
    FakeNameserver server([](const DnsMessage&, DnsMessage&) { return false; });
    options_.nameserver_port = server.port();

    BrowseResult service;
    service.name = "Studio";
    service.service_type = SERVICE_TYPE;
    service.domain = BROWSE_DOMAIN;

    DnssdTxtResolver resolver(service, 300, options_);
    EXPECT_EQ(resolver.full_name(), "Studio._clawdis-bridge._tcp.tailnet.example");

    std::mutex mutex;
    std::condition_variable cv;
    int calls = 0;
    TxtResolveError error = TxtResolveError::NONE;
    resolver.start([&](bool, const TxtRecord&, TxtResolveError err) {
        std::lock_guard<std::mutex> lock(mutex);
        ++calls;
        error = err;
        cv.notify_all();
    });

    std::unique_lock<std::mutex> lock(mutex);
    ASSERT_TRUE(cv.wait_for(lock, std::chrono::seconds(5), [&]() { return calls > 0; }));
    EXPECT_EQ(error, TxtResolveError::TIMEOUT);
    EXPECT_GE(server.queries(), 1);
}

TEST_F(DnssdBrowserTest, TxtResolverCancelReportsOnce) {
    FakeNameserver server([](const DnsMessage&, DnsMessage&) { return false; });
    options_.nameserver_port = server.port();

    BrowseResult service;
    service.name = "Studio";
    service.service_type = SERVICE_TYPE;
    service.domain = BROWSE_DOMAIN;

    DnssdTxtResolver resolver(service, 5000, options_);
    std::atomic<int> calls(0);
    std::atomic<int> last_error(-1);
    resolver.start([&](bool success, const TxtRecord&, TxtResolveError err) {
        EXPECT_FALSE(success);
        last_error.store(static_cast<int>(err));
        ++calls;
    });

    resolver.cancel();
    resolver.cancel();
    EXPECT_EQ(calls.load(), 1);
    EXPECT_EQ(last_error.load(), static_cast<int>(TxtResolveError::CANCELLED));
}

TEST_F(DnssdBrowserTest, TxtResolverCancelledBeforeStartNeverRuns) {
    BrowseResult service;
    service.name = "Studio";
    service.service_type = SERVICE_TYPE;
    service.domain = BROWSE_DOMAIN;

    DnssdTxtResolver resolver(service, 1000, options_);
    resolver.cancel();

    bool called = false;
    resolver.start([&called](bool, const TxtRecord&, TxtResolveError) { called = true; });
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_FALSE(called);
}
