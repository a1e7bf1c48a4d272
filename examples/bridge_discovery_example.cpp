/**
 * @file bridge_discovery_example.cpp
 * @brief Watch bridge advertisements until interrupted
 *
 * Browses "local." over mDNS, plus an optional wide-area DNS-SD domain through a
 * unicast nameserver, and prints the bridge list every time it changes.
 *
 * Usage:
 *   bridge_discovery_example [<wide_area_domain> [<nameserver>]]
 *
 * Examples:
 *   # LAN only
 *   bridge_discovery_example
 *
 *   # LAN plus a tailnet domain served by a specific nameserver
 *   bridge_discovery_example tailnet.example. 100.100.100.100
 */

#include "bridge_discovery.h"
#include "dnssd_browser.h"
#include "logger.h"
#include "socket.h"

#include <atomic>
#include <chrono>
#include <csignal>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>

using namespace bridgelink;

static std::atomic<bool> g_running{true};

static void signal_handler(int) {
    g_running = false;
}

static void print_usage(const char* program) {
    std::cerr << "Usage: " << program << " [<wide_area_domain> [<nameserver>]]\n"
              << "\n"
              << "  wide_area_domain  (optional) Extra DNS-SD domain to browse, e.g. tailnet.example.\n"
              << "  nameserver        (optional) Nameserver for that domain, default from /etc/resolv.conf\n";
}

static std::string timestamp_str() {
    auto now  = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    struct tm tm_buf;
#ifdef _WIN32
    localtime_s(&tm_buf, &time);
#else
    localtime_r(&time, &tm_buf);
#endif
    char buf[32];
    std::strftime(buf, sizeof(buf), "%H:%M:%S", &tm_buf);
    return buf;
}

static void print_snapshot(const DiscoverySnapshot& snapshot) {
    std::cout << "[" << timestamp_str() << "] " << snapshot.status_text
              << " - " << snapshot.bridges.size() << " bridge(s)\n";
    for (const auto& bridge : snapshot.bridges) {
        std::cout << "  " << std::left << std::setw(24) << bridge.display_name
                  << bridge.host << ":" << bridge.port;
        if (bridge.lan_host) {
            std::cout << "  lan=" << *bridge.lan_host;
        }
        if (bridge.tailnet_dns) {
            std::cout << "  tailnet=" << *bridge.tailnet_dns;
        }
        std::cout << "\n    id: " << bridge.stable_id << "\n";
    }
}

int main(int argc, char* argv[]) {
    if (argc > 3) {
        print_usage(argv[0]);
        return 1;
    }

    std::signal(SIGINT, signal_handler);
#ifndef _WIN32
    std::signal(SIGTERM, signal_handler);
#endif

    Logger::getInstance().set_log_level(LogLevel::INFO);
    if (!init_socket_library()) {
        std::cerr << "Error: failed to initialize sockets\n";
        return 1;
    }

    DnssdOptions dnssd_options;
    DiscoveryOptions discovery_options;
    if (argc >= 2) {
        discovery_options.domains.push_back(argv[1]);
    }
    if (argc == 3) {
        dnssd_options.nameserver = argv[2];
    }

    DnssdServiceBrowserFactory factory(dnssd_options);
    int exit_code = 0;
    {
        BridgeDiscovery discovery(factory, discovery_options);
        auto subscription = discovery.subscribe();
        discovery.start();

        std::cout << "=== bridgelink discovery ===\n"
                  << "Service type: " << discovery_options.service_type << "\n"
                  << "Domains:     ";
        for (const auto& domain : discovery_options.domains) {
            std::cout << " " << domain;
        }
        std::cout << "\n\nPress Ctrl+C to quit.\n\n";

        while (g_running) {
            DiscoverySnapshot snapshot;
            if (subscription->next(snapshot, std::chrono::milliseconds(200))) {
                print_snapshot(snapshot);
            }
        }

        std::cout << "\nShutting down...\n";
        discovery.stop();
        if (discovery.status_text() != "Stopped") {
            exit_code = 1;
        }
    }

    cleanup_socket_library();
    return exit_code;
}
