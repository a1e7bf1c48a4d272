#include "app_config.h"
#include "bridge_discovery.h"
#include "bridge_settings_store.h"
#include "dnssd_browser.h"
#include "endpoint_resolver.h"
#include "fs.h"
#include "key_value_store.h"
#include "logger.h"
#include "network_utils.h"
#include "os.h"
#include "pairing_client.h"
#include "ssh_tunnel.h"
#include "version.h"
#include <algorithm>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

// Main module logging macros
#define LOG_MAIN_DEBUG(message) LOG_DEBUG("main", message)
#define LOG_MAIN_INFO(message)  LOG_INFO("main", message)
#define LOG_MAIN_WARN(message)  LOG_WARN("main", message)
#define LOG_MAIN_ERROR(message) LOG_ERROR("main", message)

using namespace bridgelink;

namespace {

const int DEFAULT_DISCOVER_SECONDS = 5;
const int PAIR_DISCOVERY_TIMEOUT_SECONDS = 10;

struct CliOptions {
    std::string config_path;
    std::string state_dir;
    bool verbose = false;
    std::string command;
    std::vector<std::string> args;
};

// Everything a command needs: parsed config plus the two persistent stores
struct NodeContext {
    std::string config_path;
    AppConfig config;
    EnvironmentOverrides env;
    NodeStores stores;
};

void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [options] <command> [arguments]\n";
    std::cout << "\nCommands:\n";
    std::cout << "  discover [seconds]            Browse for bridges and print what was found\n";
    std::cout << "  pair <host> <port>            Pair with a bridge at a known address\n";
    std::cout << "  pair --id <stableId>          Discover a bridge by stable id and pair with it\n";
    std::cout << "  endpoint [local|remote|unconfigured]\n";
    std::cout << "                                Optionally save a connection mode, then print the gateway endpoint\n";
    std::cout << "  tunnel                        Bring up the remote control tunnel and keep it open\n";
    std::cout << "  bootstrap                     Reconcile the defaults and secure stores\n";
    std::cout << "\nOptions:\n";
    std::cout << "  --config <path>     Config file (default: ~/.clawdis/clawdis.json)\n";
    std::cout << "  --state-dir <path>  State directory (default: ~/.clawdis/node)\n";
    std::cout << "  --verbose, -v       Debug logging\n";
    std::cout << "  --version           Print version and exit\n";
    std::cout << "  --help, -h          Show this help message\n";
}

bool parse_int_arg(const std::string& text, int& value) {
    try {
        size_t consumed = 0;
        value = std::stoi(text, &consumed);
        return consumed == text.size();
    } catch (const std::exception&) {
        return false;
    }
}

/**
 * Hand-rolled argv parsing: global flags may appear anywhere, everything else is the
 * command followed by its arguments.
 * @return false on a malformed flag
 */
bool parse_command_line(int argc, char* argv[], CliOptions& options, bool& show_help, bool& show_version) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            show_help = true;
        } else if (arg == "--version") {
            show_version = true;
        } else if (arg == "--verbose" || arg == "-v") {
            options.verbose = true;
        } else if (arg == "--config" || arg == "--state-dir") {
            if (i + 1 >= argc) {
                std::cerr << "Missing value for " << arg << std::endl;
                return false;
            }
            std::string value = argv[++i];
            if (arg == "--config") {
                options.config_path = value;
            } else {
                options.state_dir = value;
            }
        } else if (options.command.empty()) {
            options.command = arg;
        } else {
            options.args.push_back(arg);
        }
    }
    return true;
}

void configure_logging(const AppConfig& config, bool verbose) {
    LogLevel level = LogLevel::INFO;
    std::string env_level = get_environment_variable(ENV_LOG_LEVEL);
    const std::string& requested = env_level.empty() ? config.log_level : env_level;
    if (!requested.empty() && !parse_log_level(requested, level)) {
        std::cerr << "Warning: unknown log level '" << requested << "', using INFO" << std::endl;
    }
    if (verbose) {
        level = LogLevel::DEBUG;
    }
    Logger::getInstance().set_log_level(level);
}

bool open_context(const CliOptions& options, NodeContext& context) {
    std::string config_path = options.config_path.empty() ? default_config_path() : options.config_path;
    context.config_path = config_path;
    std::string error;
    if (!load_app_config(config_path, context.config, &error)) {
        std::cerr << "Cannot load config " << config_path << ": " << error << std::endl;
        return false;
    }
    configure_logging(context.config, options.verbose);
    LOG_MAIN_DEBUG("Using config " << config_path);

    context.env = read_environment_overrides();

    std::string state_dir = options.state_dir.empty() ? default_state_directory() : options.state_dir;
    if (!open_node_stores(state_dir, context.stores, &error)) {
        LOG_MAIN_ERROR("Cannot open node state: " << error);
        return false;
    }
    return true;
}

std::string node_display_name(const AppConfig& config) {
    if (!config.display_name.empty()) {
        return config.display_name;
    }
    return get_hostname();
}

DiscoveryOptions make_discovery_options(const AppConfig& config) {
    DiscoveryOptions options;
    if (!config.service_type.empty()) {
        options.service_type = config.service_type;
    }
    if (!config.wide_area_domain.empty()) {
        options.domains.push_back(config.wide_area_domain);
    }
    options.display_name = node_display_name(config);
    return options;
}

DnssdOptions make_dnssd_options(const AppConfig& config) {
    DnssdOptions options;
    options.nameserver = config.nameserver;
    return options;
}

std::unique_ptr<SshTunnelProvider> make_tunnel_provider(const AppConfig& config) {
    if (config.remote.ssh_target.empty()) {
        return nullptr;
    }
    SshTunnelOptions options;
    options.target = config.remote.ssh_target;
    options.remote_port = config.remote.remote_port;
    options.local_port = config.remote.local_port;
    options.identity_file = config.remote.identity_file;
    return std::make_unique<SshTunnelProvider>(options);
}

void print_bridge(const BridgeEndpoint& bridge) {
    std::cout << "  " << bridge.display_name << "  " << bridge.host << ":" << bridge.port;
    if (bridge.lan_host) {
        std::cout << "  lan=" << *bridge.lan_host;
    }
    if (bridge.tailnet_dns) {
        std::cout << "  tailnet=" << *bridge.tailnet_dns;
    }
    if (bridge.gateway_port) {
        std::cout << "  gateway=" << *bridge.gateway_port;
    }
    std::cout << "\n    id: " << bridge.stable_id << std::endl;
}

/**
 * Run discovery until the deadline, or until stop_when returns true for a snapshot.
 */
template <typename Predicate>
DiscoverySnapshot run_discovery(const NodeContext& context, int seconds, Predicate stop_when) {
    DnssdServiceBrowserFactory factory(make_dnssd_options(context.config));
    BridgeDiscovery discovery(factory, make_discovery_options(context.config));
    auto subscription = discovery.subscribe();
    discovery.start();

    DiscoverySnapshot latest = discovery.snapshot();
    std::string last_status;
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(seconds);
    while (true) {
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            break;
        }
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        DiscoverySnapshot next;
        if (!subscription->next(next, remaining)) {
            continue;
        }
        latest = next;
        if (latest.status_text != last_status) {
            last_status = latest.status_text;
            LOG_MAIN_INFO("Discovery: " << last_status << " (" << latest.bridges.size() << " bridge(s))");
        }
        if (stop_when(latest)) {
            break;
        }
    }

    discovery.stop();
    return latest;
}

//=============================================================================
// Commands
//=============================================================================

int command_discover(NodeContext& context, const std::vector<std::string>& args) {
    int seconds = DEFAULT_DISCOVER_SECONDS;
    if (!args.empty() && (!parse_int_arg(args[0], seconds) || seconds <= 0)) {
        std::cerr << "Invalid duration: " << args[0] << std::endl;
        return 1;
    }

    DiscoverySnapshot snapshot = run_discovery(context, seconds, [](const DiscoverySnapshot&) { return false; });

    std::cout << "Status: " << snapshot.status_text << std::endl;
    if (snapshot.bridges.empty()) {
        std::cout << "No bridges found." << std::endl;
        return 0;
    }
    std::cout << "Bridges:" << std::endl;
    for (const auto& bridge : snapshot.bridges) {
        print_bridge(bridge);
    }
    if (!context.stores.settings->set_last_discovered_stable_id(snapshot.bridges.front().stable_id)) {
        LOG_MAIN_WARN("Could not remember the last discovered bridge");
    }
    return 0;
}

int command_pair(NodeContext& context, const std::vector<std::string>& args) {
    BridgeEndpoint endpoint;
    if (args.size() == 2 && args[0] == "--id") {
        const std::string& wanted = args[1];
        auto has_wanted = [&wanted](const DiscoverySnapshot& snapshot) {
            return std::any_of(snapshot.bridges.begin(), snapshot.bridges.end(),
                               [&wanted](const BridgeEndpoint& bridge) { return bridge.stable_id == wanted; });
        };
        LOG_MAIN_INFO("Looking for bridge " << wanted << "...");
        DiscoverySnapshot snapshot = run_discovery(context, PAIR_DISCOVERY_TIMEOUT_SECONDS, has_wanted);
        auto it = std::find_if(snapshot.bridges.begin(), snapshot.bridges.end(),
                               [&wanted](const BridgeEndpoint& bridge) { return bridge.stable_id == wanted; });
        if (it == snapshot.bridges.end()) {
            std::cerr << "Bridge " << wanted << " not found (" << snapshot.status_text << ")" << std::endl;
            return 1;
        }
        endpoint = *it;
        if (!context.stores.settings->set_last_discovered_stable_id(endpoint.stable_id)) {
            LOG_MAIN_WARN("Could not remember the last discovered bridge");
        }
    } else if (args.size() == 2) {
        int port = 0;
        if (!parse_int_arg(args[1], port) || port <= 0 || port > 65535) {
            std::cerr << "Invalid port: " << args[1] << std::endl;
            return 1;
        }
        if (!network_utils::is_valid_ipv4(args[0]) && !network_utils::is_valid_ipv6(args[0]) &&
            !network_utils::is_hostname(args[0])) {
            std::cerr << "Invalid host: " << args[0] << std::endl;
            return 1;
        }
        endpoint = BridgeEndpoint::manual(args[0], port);
    } else {
        std::cerr << "Usage: pair <host> <port> | pair --id <stableId>" << std::endl;
        return 1;
    }

    BridgeHello hello = build_node_hello(context.stores.settings->instance_id(),
                                         context.config.display_name,
                                         context.stores.settings->token_for(endpoint.stable_id),
                                         get_system_info());
    hello.version = version::STRING;

    LOG_MAIN_INFO("Pairing with " << endpoint.display_name << " (" << endpoint.host << ":" << endpoint.port << ")");
    BridgePairingClient client;
    PairResult result = client.pair_and_hello(endpoint, hello);
    if (!result.ok) {
        std::cerr << "Pairing failed [" << pair_failure_to_string(result.failure) << "]: "
                  << result.error.value_or("unknown error") << std::endl;
        return 1;
    }

    if (result.token && !context.stores.settings->save_token(endpoint.stable_id, *result.token)) {
        LOG_MAIN_ERROR("Paired, but the token could not be saved");
        return 1;
    }
    if (!context.stores.settings->set_preferred_stable_id(endpoint.stable_id)) {
        LOG_MAIN_WARN("Could not remember the preferred bridge");
    }
    std::cout << "Paired with " << endpoint.display_name << " [" << endpoint.stable_id << "]" << std::endl;
    return 0;
}

int command_endpoint(NodeContext& context, const std::vector<std::string>& args) {
    if (args.size() > 1) {
        std::cerr << "Usage: endpoint [local|remote|unconfigured]" << std::endl;
        return 1;
    }
    if (!args.empty()) {
        ConnectionMode mode;
        if (!parse_connection_mode(args[0], mode)) {
            std::cerr << "Unknown connection mode: " << args[0] << std::endl;
            return 1;
        }
        if (!context.stores.settings->set_connection_mode(connection_mode_to_string(mode)) ||
            !context.stores.settings->set_onboarding_seen(true)) {
            LOG_MAIN_ERROR("Could not save the connection mode");
            return 1;
        }
    }

    std::unique_ptr<SshTunnelProvider> tunnel = make_tunnel_provider(context.config);
    EndpointResolver resolver(make_endpoint_deps(*context.stores.settings, context.config, context.env, tunnel.get(),
                                                 context.config_path),
                              initial_connection_mode(context.stores.settings->connection_mode(),
                                                      context.stores.settings->onboarding_seen()));

    std::string error;
    std::optional<GatewayConfig> config = resolver.require_config(&error);
    if (!config) {
        std::cout << describe_endpoint_state(resolver.state()) << std::endl;
        return 1;
    }
    std::cout << "Gateway: " << config->url << std::endl;
    std::cout << "  mode:     " << connection_mode_to_string(resolver.state().mode) << std::endl;
    std::cout << "  token:    " << (config->token ? "set" : "none") << std::endl;
    std::cout << "  password: " << (config->password ? "set" : "none") << std::endl;
    return 0;
}

int command_tunnel(NodeContext& context) {
    std::unique_ptr<SshTunnelProvider> tunnel = make_tunnel_provider(context.config);
    EndpointResolver resolver(make_endpoint_deps(*context.stores.settings, context.config, context.env, tunnel.get(),
                                                 context.config_path),
                              initial_connection_mode(context.stores.settings->connection_mode(),
                                                      context.stores.settings->onboarding_seen()));

    std::string error;
    std::optional<int> port = resolver.ensure_remote_control_tunnel(&error);
    if (!port) {
        std::cerr << "Tunnel failed: " << error << std::endl;
        return 1;
    }
    std::cout << "Control tunnel listening on 127.0.0.1:" << *port << std::endl;
    std::cout << "Press Enter to close the tunnel." << std::endl;
    std::string line;
    std::getline(std::cin, line);
    return 0;
}

int command_bootstrap(NodeContext& context) {
    size_t copied = context.stores.reconciled_on_open + context.stores.settings->bootstrap_persistence();
    std::cout << "Reconciled " << copied << " value(s)" << std::endl;
    for (const auto& key : BridgeSettingsStore::bootstrap_keys()) {
        bool in_defaults = context.stores.defaults->get(key).has_value();
        bool in_secure = context.stores.secure->get(key).has_value();
        std::cout << "  " << key << ": defaults=" << (in_defaults ? "yes" : "no")
                  << " secure=" << (in_secure ? "yes" : "no") << std::endl;
    }
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    CliOptions options;
    bool show_help = false;
    bool show_version = false;
    if (!parse_command_line(argc, argv, options, show_help, show_version)) {
        print_usage(argv[0]);
        return 1;
    }
    if (show_version) {
        version::print_version_info();
        return 0;
    }
    if (show_help || options.command.empty()) {
        print_usage(argv[0]);
        return show_help ? 0 : 1;
    }

    NodeContext context;
    if (!open_context(options, context)) {
        return 1;
    }

    if (options.command == "discover") {
        return command_discover(context, options.args);
    } else if (options.command == "pair") {
        return command_pair(context, options.args);
    } else if (options.command == "endpoint") {
        return command_endpoint(context, options.args);
    } else if (options.command == "tunnel") {
        return command_tunnel(context);
    } else if (options.command == "bootstrap") {
        return command_bootstrap(context);
    }

    std::cerr << "Unknown command: " << options.command << std::endl;
    print_usage(argv[0]);
    return 1;
}
