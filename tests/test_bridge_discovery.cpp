#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "bridge_discovery.h"
#include <map>
#include <memory>
#include <vector>

using namespace bridgelink;
using ::testing::ElementsAre;
using ::testing::HasSubstr;

namespace {

// Handlers a discovery run registered with one browser; outlives the browser itself
struct BrowserHandle {
    std::string domain;
    ServiceBrowser::StateHandler on_state;
    ServiceBrowser::ResultsHandler on_results;
    bool started = false;
    bool cancelled = false;
};

class FakeBrowser : public ServiceBrowser {
public:
    explicit FakeBrowser(std::shared_ptr<BrowserHandle> handle) : handle_(std::move(handle)) {}

    void start(StateHandler on_state, ResultsHandler on_results) override {
        handle_->on_state = std::move(on_state);
        handle_->on_results = std::move(on_results);
        handle_->started = true;
    }

    void cancel() override { handle_->cancelled = true; }

private:
    std::shared_ptr<BrowserHandle> handle_;
};

class FakeTxtResolver : public TxtResolver {
public:
    explicit FakeTxtResolver(const BrowseResult& service) : service_(service) {}

    void start(CompletionHandler on_complete) override {
        if (finished_) {
            return;
        }
        handler_ = std::move(on_complete);
    }

    void cancel() override { finish(false, TxtRecord(), TxtResolveError::CANCELLED); }

    void complete(const TxtRecord& txt) { finish(true, txt, TxtResolveError::NONE); }
    void fail(TxtResolveError error) { finish(false, TxtRecord(), error); }

    const BrowseResult& service() const { return service_; }
    bool finished() const { return finished_; }
    bool started() const { return static_cast<bool>(handler_) || finished_; }

private:
    void finish(bool success, const TxtRecord& txt, TxtResolveError error) {
        if (finished_) {
            return;
        }
        finished_ = true;
        CompletionHandler handler = std::move(handler_);
        handler_ = nullptr;
        if (handler) {
            handler(success, txt, error);
        }
    }

    BrowseResult service_;
    CompletionHandler handler_;
    bool finished_ = false;
};

class FakeBrowserFactory : public ServiceBrowserFactory {
public:
    std::unique_ptr<ServiceBrowser> create_browser(const std::string& service_type,
                                                   const std::string& domain) override {
        last_service_type = service_type;
        auto handle = std::make_shared<BrowserHandle>();
        handle->domain = domain;
        browsers[domain] = handle;
        all_browsers.push_back(handle);
        return std::unique_ptr<ServiceBrowser>(new FakeBrowser(handle));
    }

    std::shared_ptr<TxtResolver> create_txt_resolver(const BrowseResult& service, int) override {
        auto resolver = std::make_shared<FakeTxtResolver>(service);
        resolvers.push_back(resolver);
        return resolver;
    }

    void state(const std::string& domain, const BrowseState& state) {
        browsers.at(domain)->on_state(state);
    }

    void results(const std::string& domain, const std::vector<BrowseResult>& results) {
        browsers.at(domain)->on_results(results);
    }

    std::string last_service_type;
    std::map<std::string, std::shared_ptr<BrowserHandle>> browsers;
    std::vector<std::shared_ptr<BrowserHandle>> all_browsers;
    std::vector<std::shared_ptr<FakeTxtResolver>> resolvers;
};

BrowseResult make_result(const std::string& name, const std::string& domain, const TxtRecord& txt,
                         const std::string& host = "", int port = 0) {
    BrowseResult result;
    result.name = name;
    result.service_type = DEFAULT_BRIDGE_SERVICE_TYPE;
    result.domain = domain;
    result.txt = txt;
    result.host = host;
    result.port = port;
    return result;
}

// Inline TXT complete enough that no TXT resolution is needed
TxtRecord full_txt(const std::string& display_name, const std::string& lan_host) {
    return TxtRecord{{"displayName", display_name},
                     {"lanHost", lan_host},
                     {"tailnetDns", lan_host + ".tailnet.example"},
                     {"bridgePort", "18790"}};
}

std::vector<std::string> display_names(const std::vector<BridgeEndpoint>& bridges) {
    std::vector<std::string> names;
    for (const auto& bridge : bridges) {
        names.push_back(bridge.display_name);
    }
    return names;
}

} // namespace

class BridgeDiscoveryTest : public ::testing::Test {
protected:
    BridgeDiscoveryTest() {
        options_.domains = {"local.", "tailnet.example."};
        options_.detect_local_identity = false;
        options_.display_name = "Kitchen Tablet";
    }

    std::unique_ptr<BridgeDiscovery> make_discovery() {
        return std::unique_ptr<BridgeDiscovery>(new BridgeDiscovery(factory_, options_));
    }

    FakeBrowserFactory factory_;
    DiscoveryOptions options_;
};

TEST_F(BridgeDiscoveryTest, StartsOneBrowserPerDomain) {
    auto discovery = make_discovery();
    EXPECT_EQ(discovery->status_text(), "Idle");
    EXPECT_FALSE(discovery->is_running());

    discovery->start();
    EXPECT_TRUE(discovery->is_running());
    ASSERT_EQ(factory_.browsers.size(), 2u);
    EXPECT_TRUE(factory_.browsers["local."]->started);
    EXPECT_TRUE(factory_.browsers["tailnet.example."]->started);
    EXPECT_EQ(factory_.last_service_type, DEFAULT_BRIDGE_SERVICE_TYPE);
    EXPECT_EQ(discovery->status_text(), "Setup");

    // Already running
    discovery->start();
    EXPECT_EQ(factory_.all_browsers.size(), 2u);
}

TEST_F(BridgeDiscoveryTest, StatusPrecedence) {
    auto discovery = make_discovery();
    discovery->start();

    factory_.state("local.", BrowseState::setup());
    EXPECT_EQ(discovery->status_text(), "Setup");

    factory_.state("local.", BrowseState::ready());
    EXPECT_EQ(discovery->status_text(), "Searching…");

    factory_.state("tailnet.example.", BrowseState::waiting("no response from nameserver 100.100.100.100"));
    EXPECT_EQ(discovery->status_text(), "Waiting: no response from nameserver 100.100.100.100");

    factory_.state("local.", BrowseState::failed("cannot create UDP socket"));
    EXPECT_EQ(discovery->status_text(), "Failed: cannot create UDP socket");

    factory_.state("local.", BrowseState::cancelled());
    factory_.state("tailnet.example.", BrowseState::cancelled());
    EXPECT_EQ(discovery->status_text(), "Idle");

    std::map<std::string, BrowseState> states = discovery->domain_states();
    EXPECT_EQ(states.size(), 2u);
    EXPECT_EQ(states["local."], BrowseState::cancelled());
}

TEST_F(BridgeDiscoveryTest, BridgesAreSortedByDisplayName) {
    auto discovery = make_discovery();
    discovery->start();

    factory_.results("local.", {make_result("zeta", "local.", full_txt("Zeta", "zeta"), "192.168.1.30", 18790),
                                make_result("alpha", "local.", full_txt("alpha", "alpha"), "192.168.1.10", 18790)});
    factory_.results("tailnet.example.", {make_result("Mid", "tailnet.example.", full_txt("Mid", "mid"))});

    std::vector<BridgeEndpoint> bridges = discovery->bridges();
    EXPECT_THAT(display_names(bridges), ElementsAre("alpha", "Mid", "Zeta"));

    const BridgeEndpoint& alpha = bridges[0];
    EXPECT_EQ(alpha.stable_id, "alpha._clawdis-bridge._tcp.local");
    EXPECT_EQ(alpha.host, "192.168.1.10");
    EXPECT_EQ(alpha.port, 18790);
    EXPECT_EQ(alpha.lan_host, std::optional<std::string>("alpha"));
    EXPECT_EQ(alpha.debug_id, "alpha._clawdis-bridge._tcp.local");

    // No SRV data: host and port come from the TXT record
    const BridgeEndpoint& mid = bridges[1];
    EXPECT_EQ(mid.host, "mid");
    EXPECT_EQ(mid.port, 18790);
}

TEST_F(BridgeDiscoveryTest, DisplayNameFallsBackToServiceName) {
    auto discovery = make_discovery();
    discovery->start();

    TxtRecord txt{{"lanHost", "studio.local"}, {"tailnetDns", "studio.tailnet.example"}};
    factory_.results("local.", {make_result("Studio\\032Lab", "local.", txt),
                                make_result("garage-bridge", "local.", txt)});

    std::vector<BridgeEndpoint> bridges = discovery->bridges();
    ASSERT_EQ(bridges.size(), 2u);
    EXPECT_EQ(bridges[0].display_name, "Garage");
    EXPECT_EQ(bridges[0].stable_id, "garage-bridge._clawdis-bridge._tcp.local");
    EXPECT_EQ(bridges[1].display_name, "Studio Lab");
    EXPECT_EQ(bridges[1].stable_id, "Studio\\032Lab._clawdis-bridge._tcp.local");
}

TEST_F(BridgeDiscoveryTest, SameStableIdIsListedOnce) {
    options_.domains = {"local", "local."};
    auto discovery = make_discovery();
    discovery->start();

    factory_.results("local", {make_result("studio", "local", full_txt("Studio", "studio"), "10.0.0.1", 1)});
    factory_.results("local.", {make_result("studio", "local.", full_txt("Studio", "studio"), "10.0.0.2", 2)});

    std::vector<BridgeEndpoint> bridges = discovery->bridges();
    ASSERT_EQ(bridges.size(), 1u);
    EXPECT_EQ(bridges[0].stable_id, "studio._clawdis-bridge._tcp.local");
    EXPECT_EQ(bridges[0].port, 2);
}

TEST_F(BridgeDiscoveryTest, ResultsReplacePreviousDomainResults) {
    auto discovery = make_discovery();
    discovery->start();

    factory_.results("local.", {make_result("a", "local.", full_txt("A", "a")),
                                make_result("b", "local.", full_txt("B", "b"))});
    EXPECT_EQ(discovery->bridges().size(), 2u);

    factory_.results("local.", {make_result("b", "local.", full_txt("B", "b"))});
    EXPECT_THAT(display_names(discovery->bridges()), ElementsAre("B"));

    factory_.results("local.", {});
    EXPECT_TRUE(discovery->bridges().empty());
}

TEST_F(BridgeDiscoveryTest, OwnBridgeIsHidden) {
    auto discovery = make_discovery();
    discovery->start();

    factory_.results("local.", {make_result("kitchen", "local.", full_txt("Kitchen Tablet", "kitchen")),
                                make_result("studio", "local.", full_txt("Studio", "studio"))});

    EXPECT_THAT(display_names(discovery->bridges()), ElementsAre("Studio"));

    std::vector<DiscoveredRecord> records = discovery->records_for_domain("local.");
    ASSERT_EQ(records.size(), 2u);
    size_t local_count = 0;
    for (const auto& record : records) {
        if (record.is_local) {
            ++local_count;
            EXPECT_EQ(record.endpoint.display_name, "Kitchen Tablet");
        }
    }
    EXPECT_EQ(local_count, 1u);
}

TEST_F(BridgeDiscoveryTest, IdentityUpdateRefiltersCurrentResults) {
    auto discovery = make_discovery();
    discovery->start();

    factory_.results("local.", {make_result("Studio-Bridge", "local.",
                                            TxtRecord{{"lanHost", "other"}, {"tailnetDns", "other.ts"}}),
                                make_result("garage", "local.", full_txt("Garage", "garage"))});
    EXPECT_EQ(discovery->bridges().size(), 2u);

    LocalIdentity identity;
    identity.host_tokens.insert("studio");
    discovery->update_local_identity(identity);

    // Service name contains the host token
    EXPECT_THAT(display_names(discovery->bridges()), ElementsAre("Garage"));
    EXPECT_EQ(discovery->local_identity().host_tokens.count("studio"), 1u);
    EXPECT_EQ(discovery->local_identity().display_tokens.count("kitchen tablet"), 1u);
}

TEST_F(BridgeDiscoveryTest, TxtIsResolvedOncePerBridge) {
    auto discovery = make_discovery();
    discovery->start();

    BrowseResult partial = make_result("studio", "local.", TxtRecord{{"displayName", "Studio"}}, "10.0.0.5", 18790);
    factory_.results("local.", {partial});
    ASSERT_EQ(factory_.resolvers.size(), 1u);
    EXPECT_TRUE(factory_.resolvers[0]->started());
    EXPECT_EQ(discovery->pending_txt_resolutions(), 1u);

    // Still pending: no second resolver
    factory_.results("local.", {partial});
    EXPECT_EQ(factory_.resolvers.size(), 1u);

    factory_.resolvers[0]->complete(TxtRecord{{"lanHost", "studio.local"}, {"tailnetDns", "studio.ts.net"},
                                              {"displayName", "Studio Main"}});
    EXPECT_EQ(discovery->pending_txt_resolutions(), 0u);

    std::vector<BridgeEndpoint> bridges = discovery->bridges();
    ASSERT_EQ(bridges.size(), 1u);
    EXPECT_EQ(bridges[0].display_name, "Studio Main");
    EXPECT_EQ(bridges[0].lan_host, std::optional<std::string>("studio.local"));
    EXPECT_EQ(bridges[0].tailnet_dns, std::optional<std::string>("studio.ts.net"));

    // Already resolved
    factory_.results("local.", {partial});
    EXPECT_EQ(factory_.resolvers.size(), 1u);
    EXPECT_EQ(discovery->bridges()[0].display_name, "Studio Main");
}

TEST_F(BridgeDiscoveryTest, CompleteInlineTxtNeedsNoResolution) {
    auto discovery = make_discovery();
    discovery->start();

    factory_.results("local.", {make_result("studio", "local.", full_txt("Studio", "studio"))});
    EXPECT_TRUE(factory_.resolvers.empty());
}

TEST_F(BridgeDiscoveryTest, FailedResolutionKeepsBridge) {
    auto discovery = make_discovery();
    discovery->start();

    factory_.results("local.", {make_result("studio", "local.", TxtRecord(), "10.0.0.5", 18790)});
    ASSERT_EQ(factory_.resolvers.size(), 1u);
    factory_.resolvers[0]->fail(TxtResolveError::TIMEOUT);

    EXPECT_EQ(discovery->pending_txt_resolutions(), 0u);
    ASSERT_EQ(discovery->bridges().size(), 1u);
    EXPECT_FALSE(discovery->bridges()[0].lan_host.has_value());
}

TEST_F(BridgeDiscoveryTest, StopClearsEverythingAndIgnoresLateCallbacks) {
    auto discovery = make_discovery();
    discovery->start();

    std::shared_ptr<BrowserHandle> old_local = factory_.browsers["local."];
    factory_.state("local.", BrowseState::ready());
    factory_.results("local.", {make_result("studio", "local.", TxtRecord(), "10.0.0.5", 18790)});
    ASSERT_EQ(discovery->bridges().size(), 1u);
    ASSERT_EQ(factory_.resolvers.size(), 1u);

    discovery->stop();
    EXPECT_FALSE(discovery->is_running());
    EXPECT_EQ(discovery->status_text(), "Stopped");
    EXPECT_TRUE(discovery->bridges().empty());
    EXPECT_TRUE(discovery->domain_states().empty());
    EXPECT_TRUE(old_local->cancelled);
    EXPECT_TRUE(factory_.browsers["tailnet.example."]->cancelled);
    EXPECT_TRUE(factory_.resolvers[0]->finished());
    EXPECT_EQ(discovery->pending_txt_resolutions(), 0u);

    // Callbacks from the stopped run
    old_local->on_state(BrowseState::ready());
    old_local->on_results({make_result("ghost", "local.", full_txt("Ghost", "ghost"))});
    EXPECT_EQ(discovery->status_text(), "Stopped");
    EXPECT_TRUE(discovery->bridges().empty());

    // Still ignored after a restart
    discovery->start();
    old_local->on_results({make_result("ghost", "local.", full_txt("Ghost", "ghost"))});
    EXPECT_TRUE(discovery->bridges().empty());

    factory_.results("local.", {make_result("studio", "local.", full_txt("Studio", "studio"))});
    EXPECT_THAT(display_names(discovery->bridges()), ElementsAre("Studio"));
}

TEST_F(BridgeDiscoveryTest, SubscribersSeeSnapshots) {
    auto discovery = make_discovery();
    auto subscription = discovery->subscribe();

    DiscoverySnapshot snapshot;
    ASSERT_TRUE(subscription->try_next(snapshot));
    EXPECT_EQ(snapshot.status_text, "Idle");
    EXPECT_TRUE(snapshot.bridges.empty());

    discovery->start();
    factory_.state("local.", BrowseState::ready());
    factory_.results("local.", {make_result("studio", "local.", full_txt("Studio", "studio"))});

    ASSERT_TRUE(subscription->try_next(snapshot));
    EXPECT_EQ(snapshot.status_text, "Searching…");
    ASSERT_EQ(snapshot.bridges.size(), 1u);
    EXPECT_EQ(snapshot.bridges[0].display_name, "Studio");
    EXPECT_EQ(snapshot, discovery->snapshot());

    // Nothing changed: nothing new to deliver
    factory_.results("local.", {make_result("studio", "local.", full_txt("Studio", "studio"))});
    EXPECT_FALSE(subscription->try_next(snapshot));

    discovery->stop();
    ASSERT_TRUE(subscription->try_next(snapshot));
    EXPECT_EQ(snapshot.status_text, "Stopped");
}

TEST_F(BridgeDiscoveryTest, DebugLogRecordsLifecycleAndResults) {
    auto discovery = make_discovery();
    EXPECT_FALSE(discovery->is_debug_logging_enabled());
    discovery->start();
    EXPECT_TRUE(discovery->debug_log().empty());

    discovery->set_debug_logging_enabled(true);
    EXPECT_TRUE(discovery->is_debug_logging_enabled());
    factory_.state("local.", BrowseState::ready());
    factory_.results("local.", {make_result("studio", "local.", full_txt("Studio", "studio"))});
    discovery->stop();

    std::vector<std::string> messages;
    for (const auto& entry : discovery->debug_log()) {
        messages.push_back(entry.message);
    }
    ASSERT_GE(messages.size(), 5u);
    EXPECT_EQ(messages[0], "debug logging enabled");
    EXPECT_THAT(messages[1], HasSubstr("snapshot: status=Setup"));
    EXPECT_EQ(messages[2], "state[local.]: ready");
    EXPECT_EQ(messages[3], "results: total=1 added=1 removed=0");
    EXPECT_EQ(messages.back(), "stop()");

    discovery->set_debug_logging_enabled(false);
    EXPECT_TRUE(discovery->debug_log().empty());
}

TEST_F(BridgeDiscoveryTest, DebugLogIsBounded) {
    auto discovery = make_discovery();
    discovery->set_debug_logging_enabled(true);
    discovery->start();

    for (int i = 0; i < 300; ++i) {
        factory_.state("local.", i % 2 == 0 ? BrowseState::ready() : BrowseState::setup());
    }
    EXPECT_EQ(discovery->debug_log().size(), DISCOVERY_DEBUG_LOG_CAPACITY);
}
