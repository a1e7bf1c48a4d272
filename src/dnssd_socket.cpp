#include "dnssd_socket.h"
#include "network_utils.h"
#include "gateway_txt.h"
#include "logger.h"
#include <cstring>
#include <fstream>
#include <sstream>
#ifndef _WIN32
    #include <errno.h>
#endif

#define LOG_DNSSD_DEBUG(message) LOG_DEBUG("dnssd", message)
#define LOG_DNSSD_INFO(message)  LOG_INFO("dnssd", message)
#define LOG_DNSSD_WARN(message)  LOG_WARN("dnssd", message)
#define LOG_DNSSD_ERROR(message) LOG_ERROR("dnssd", message)

namespace bridgelink {

DnssdQuerySocket::DnssdQuerySocket(DnssdTransport transport, const std::string& nameserver, int nameserver_port)
    : transport_(transport),
      nameserver_(nameserver),
      nameserver_port_(nameserver_port),
      target_port_(0),
      socket_(INVALID_SOCKET_VALUE),
      listening_(false) {}

DnssdQuerySocket::~DnssdQuerySocket() {
    close();
}

bool DnssdQuerySocket::open(bool listen_on_mdns_port, std::string* error) {
    close();

    if (transport_ == DnssdTransport::MULTICAST) {
        target_ip_ = MDNS_MULTICAST_IPv4;
        target_port_ = MDNS_PORT;

        if (listen_on_mdns_port && open_mdns_listener(error)) {
            return true;
        }

        // Legacy unicast: responders answer an ephemeral source port directly
        socket_ = create_udp_socket_v4(0);
        if (!is_valid_socket(socket_)) {
            if (error) *error = "cannot create UDP socket";
            return false;
        }
        LOG_DNSSD_DEBUG("Querying mDNS from an ephemeral port (legacy unicast)");
        return true;
    }

    std::string server = nameserver_.empty() ? system_nameserver() : nameserver_;
    if (server.empty()) {
        if (error) *error = "no nameserver configured";
        return false;
    }

    target_ip_ = network_utils::resolve_hostname(server);
    if (target_ip_.empty()) {
        if (error) *error = "cannot resolve nameserver " + server;
        return false;
    }
    target_port_ = nameserver_port_;

    socket_ = create_udp_socket_v4(0);
    if (!is_valid_socket(socket_)) {
        if (error) *error = "cannot create UDP socket";
        return false;
    }

    LOG_DNSSD_DEBUG("Using nameserver " << target_ip_ << ":" << target_port_);
    return true;
}

bool DnssdQuerySocket::open_mdns_listener(std::string* error) {
    socket_ = socket(AF_INET, SOCK_DGRAM, IPPROTO_UDP);
    if (!is_valid_socket(socket_)) {
        if (error) *error = "cannot create UDP socket";
        return false;
    }

    int reuse = 1;
    if (setsockopt(socket_, SOL_SOCKET, SO_REUSEADDR,
                   reinterpret_cast<const char*>(&reuse), sizeof(reuse)) < 0) {
        LOG_DNSSD_WARN("Failed to set SO_REUSEADDR on multicast socket");
    }

#ifdef SO_REUSEPORT
    if (setsockopt(socket_, SOL_SOCKET, SO_REUSEPORT,
                   reinterpret_cast<const char*>(&reuse), sizeof(reuse)) < 0) {
        LOG_DNSSD_WARN("Failed to set SO_REUSEPORT on multicast socket");
    }
#endif

    sockaddr_in bind_addr{};
    bind_addr.sin_family = AF_INET;
    bind_addr.sin_addr.s_addr = INADDR_ANY;
    bind_addr.sin_port = htons(MDNS_PORT);

    if (bind(socket_, reinterpret_cast<sockaddr*>(&bind_addr), sizeof(bind_addr)) < 0) {
        LOG_DNSSD_DEBUG("Cannot bind mDNS port " << MDNS_PORT << ", falling back to legacy unicast");
        close();
        return false;
    }

    if (!join_multicast_group()) {
        close();
        return false;
    }

    listening_ = true;
    return true;
}

bool DnssdQuerySocket::join_multicast_group() {
    ip_mreq mreq{};
    inet_pton(AF_INET, MDNS_MULTICAST_IPv4.c_str(), &mreq.imr_multiaddr);
    mreq.imr_interface.s_addr = INADDR_ANY;

    if (setsockopt(socket_, IPPROTO_IP, IP_ADD_MEMBERSHIP,
                   reinterpret_cast<const char*>(&mreq), sizeof(mreq)) < 0) {
#ifdef _WIN32
        LOG_DNSSD_WARN("Failed to join IPv4 multicast group (error: " << WSAGetLastError() << ")");
#else
        LOG_DNSSD_WARN("Failed to join IPv4 multicast group (error: " << strerror(errno) << ")");
#endif
        return false;
    }

    int ttl = 255;
    if (setsockopt(socket_, IPPROTO_IP, IP_MULTICAST_TTL,
                   reinterpret_cast<const char*>(&ttl), sizeof(ttl)) < 0) {
        LOG_DNSSD_WARN("Failed to set multicast TTL");
    }

    LOG_DNSSD_DEBUG("Joined IPv4 multicast group " << MDNS_MULTICAST_IPv4);
    return true;
}

void DnssdQuerySocket::close() {
    if (!is_valid_socket(socket_)) {
        return;
    }

    if (listening_) {
        ip_mreq mreq{};
        inet_pton(AF_INET, MDNS_MULTICAST_IPv4.c_str(), &mreq.imr_multiaddr);
        mreq.imr_interface.s_addr = INADDR_ANY;
        if (setsockopt(socket_, IPPROTO_IP, IP_DROP_MEMBERSHIP,
                       reinterpret_cast<const char*>(&mreq), sizeof(mreq)) < 0) {
            LOG_DNSSD_DEBUG("Failed to leave IPv4 multicast group");
        }
    }

    close_socket(socket_);
    socket_ = INVALID_SOCKET_VALUE;
    listening_ = false;
}

bool DnssdQuerySocket::send_query(const DnsMessage& query) {
    if (!is_open()) {
        return false;
    }

    std::vector<uint8_t> packet = dns::serialize_message(query);
    return send_udp_data_to(socket_, packet, target_ip_, target_port_) == static_cast<int>(packet.size());
}

bool DnssdQuerySocket::receive_response(DnsMessage& message, int timeout_ms) {
    if (!is_open()) {
        return false;
    }

    std::string sender_ip;
    int sender_port = 0;
    std::vector<uint8_t> packet = receive_udp_data_with_timeout(socket_, 9000, timeout_ms, &sender_ip, &sender_port);
    if (packet.empty()) {
        return false;
    }

    if (transport_ == DnssdTransport::UNICAST && sender_ip != target_ip_) {
        LOG_DNSSD_DEBUG("Dropping datagram from unexpected sender " << sender_ip);
        return false;
    }

    if (!dns::deserialize_message(packet, message) || !message.is_response()) {
        return false;
    }
    return true;
}

std::string system_nameserver() {
    std::ifstream file("/etc/resolv.conf");
    std::string line;
    while (std::getline(file, line)) {
        std::istringstream iss(line);
        std::string keyword;
        std::string address;
        if (iss >> keyword >> address && keyword == "nameserver") {
            return address;
        }
    }
    return "";
}

bool is_multicast_domain(const std::string& domain) {
    std::string normalized = to_lower_ascii(trim_whitespace(domain));
    return normalized == "local" || normalized == "local.";
}

} // namespace bridgelink
