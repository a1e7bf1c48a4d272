#pragma once

#include "dns_message.h"
#include "socket.h"
#include <string>

namespace bridgelink {

enum class DnssdTransport {
    MULTICAST,  // mDNS on 224.0.0.251:5353
    UNICAST     // plain DNS to a nameserver
};

/**
 * UDP socket for DNS-SD queries.
 *
 * Multicast sockets either listen on the mDNS port (seeing announcements from every
 * responder) or, when that port is unavailable or not wanted, query from an ephemeral
 * port and receive legacy unicast replies. Unicast sockets talk to one nameserver and
 * drop datagrams from anyone else.
 */
class DnssdQuerySocket {
public:
    DnssdQuerySocket(DnssdTransport transport, const std::string& nameserver, int nameserver_port);
    ~DnssdQuerySocket();

    DnssdQuerySocket(const DnssdQuerySocket&) = delete;
    DnssdQuerySocket& operator=(const DnssdQuerySocket&) = delete;

    /**
     * @param listen_on_mdns_port Try to bind 5353 and join the group (multicast only)
     * @param error Failure reason
     */
    bool open(bool listen_on_mdns_port, std::string* error);
    void close();

    bool send_query(const DnsMessage& query);

    /**
     * Wait up to timeout_ms for one well-formed DNS response.
     * @return false on timeout or if the datagram was not a usable response
     */
    bool receive_response(DnsMessage& message, int timeout_ms);

    bool is_open() const { return is_valid_socket(socket_); }
    bool is_listener() const { return listening_; }
    DnssdTransport transport() const { return transport_; }
    const std::string& target_ip() const { return target_ip_; }
    int target_port() const { return target_port_; }

private:
    bool open_mdns_listener(std::string* error);
    bool join_multicast_group();

    DnssdTransport transport_;
    std::string nameserver_;
    int nameserver_port_;
    std::string target_ip_;
    int target_port_;
    socket_t socket_;
    bool listening_;
};

/**
 * First "nameserver" entry of /etc/resolv.conf, empty if there is none.
 */
std::string system_nameserver();

/**
 * Whether a browse domain is served by multicast DNS ("local" or "local.").
 */
bool is_multicast_domain(const std::string& domain);

} // namespace bridgelink
