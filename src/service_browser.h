#pragma once

#include "gateway_txt.h"
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace bridgelink {

enum class BrowseStateKind {
    SETUP,
    READY,
    WAITING,
    FAILED,
    CANCELLED
};

/**
 * State of one domain's browser. `error` is set for WAITING and FAILED.
 */
struct BrowseState {
    BrowseStateKind kind = BrowseStateKind::SETUP;
    std::string error;

    static BrowseState setup() { return BrowseState{BrowseStateKind::SETUP, ""}; }
    static BrowseState ready() { return BrowseState{BrowseStateKind::READY, ""}; }
    static BrowseState waiting(const std::string& err) { return BrowseState{BrowseStateKind::WAITING, err}; }
    static BrowseState failed(const std::string& err) { return BrowseState{BrowseStateKind::FAILED, err}; }
    static BrowseState cancelled() { return BrowseState{BrowseStateKind::CANCELLED, ""}; }

    bool operator==(const BrowseState& other) const { return kind == other.kind && error == other.error; }
    bool operator!=(const BrowseState& other) const { return !(*this == other); }
};

// "setup", "ready", "waiting (err)", "failed (err)", "cancelled"
std::string describe_browse_state(const BrowseState& state);

/**
 * One advertised service instance as reported by a browser.
 */
struct BrowseResult {
    std::string name;          // instance name as advertised, DNS-SD escapes intact
    std::string service_type;  // e.g. "_clawdis-bridge._tcp"
    std::string domain;        // e.g. "local."
    TxtRecord txt;             // inline TXT metadata, empty when the browser had none
    std::string host;          // SRV target (or its address when one was announced), empty until known
    int port = 0;              // SRV port, 0 until known

    bool operator==(const BrowseResult& other) const {
        return name == other.name && service_type == other.service_type && domain == other.domain &&
               txt == other.txt && host == other.host && port == other.port;
    }
};

enum class TxtResolveError {
    NONE,
    CANCELLED,
    TIMEOUT,
    FAILED
};

const char* txt_resolve_error_to_string(TxtResolveError error);

/**
 * Browses one service type in one domain.
 */
class ServiceBrowser {
public:
    using StateHandler = std::function<void(const BrowseState&)>;
    using ResultsHandler = std::function<void(const std::vector<BrowseResult>&)>;

    virtual ~ServiceBrowser() = default;

    /**
     * Begin browsing. Handlers may run on any thread, including the caller's.
     */
    virtual void start(StateHandler on_state, ResultsHandler on_results) = 0;

    /**
     * Stop browsing. Synchronous: no handler runs after this returns.
     */
    virtual void cancel() = 0;
};

/**
 * Resolves the TXT record of one service instance, once.
 */
class TxtResolver {
public:
    using CompletionHandler = std::function<void(bool success, const TxtRecord& txt, TxtResolveError error)>;

    virtual ~TxtResolver() = default;

    /**
     * Start resolving. The handler runs exactly once (success, timeout, failure or
     * cancellation), possibly on another thread. Starting after cancel() does nothing.
     */
    virtual void start(CompletionHandler on_complete) = 0;

    /**
     * Finish with TxtResolveError::CANCELLED unless already finished.
     */
    virtual void cancel() = 0;
};

class ServiceBrowserFactory {
public:
    virtual ~ServiceBrowserFactory() = default;

    virtual std::unique_ptr<ServiceBrowser> create_browser(const std::string& service_type,
                                                           const std::string& domain) = 0;

    virtual std::shared_ptr<TxtResolver> create_txt_resolver(const BrowseResult& service, int timeout_ms) = 0;
};

} // namespace bridgelink
