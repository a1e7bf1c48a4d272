#include "socket.h"
#include "logger.h"
#include <cstring>
#ifndef _WIN32
    #include <fcntl.h>    // for O_NONBLOCK
    #include <errno.h>    // for errno
    #include <netdb.h>
    #include <netinet/tcp.h>
    #include <sys/select.h>
#endif

// Socket module logging macros
#define LOG_SOCKET_DEBUG(message) LOG_DEBUG("socket", message)
#define LOG_SOCKET_INFO(message)  LOG_INFO("socket", message)
#define LOG_SOCKET_WARN(message)  LOG_WARN("socket", message)
#define LOG_SOCKET_ERROR(message) LOG_ERROR("socket", message)

namespace bridgelink {

namespace {

int last_socket_error() {
#ifdef _WIN32
    return WSAGetLastError();
#else
    return errno;
#endif
}

bool is_would_block(int error) {
#ifdef _WIN32
    return error == WSAEWOULDBLOCK || error == WSAEINPROGRESS;
#else
    return error == EAGAIN || error == EWOULDBLOCK || error == EINPROGRESS;
#endif
}

std::string format_address(const sockaddr* addr) {
    char ip[INET6_ADDRSTRLEN] = {0};
    if (addr->sa_family == AF_INET) {
        const sockaddr_in* in4 = reinterpret_cast<const sockaddr_in*>(addr);
        inet_ntop(AF_INET, &in4->sin_addr, ip, sizeof(ip));
        return std::string(ip) + ":" + std::to_string(ntohs(in4->sin_port));
    }
    if (addr->sa_family == AF_INET6) {
        const sockaddr_in6* in6 = reinterpret_cast<const sockaddr_in6*>(addr);
        inet_ntop(AF_INET6, &in6->sin6_addr, ip, sizeof(ip));
        return "[" + std::string(ip) + "]:" + std::to_string(ntohs(in6->sin6_port));
    }
    return "unknown";
}

} // namespace

// Socket Library Initialization
bool init_socket_library() {
#ifdef _WIN32
    WSADATA wsaData;
    int result = WSAStartup(MAKEWORD(2, 2), &wsaData);
    if (result != 0) {
        LOG_SOCKET_ERROR("WSAStartup failed: " << result);
        return false;
    }
#endif
    LOG_SOCKET_DEBUG("Socket library initialized");
    return true;
}

void cleanup_socket_library() {
#ifdef _WIN32
    WSACleanup();
#endif
    LOG_SOCKET_DEBUG("Socket library cleaned up");
}

// TCP Socket Functions
socket_t create_tcp_client(const std::string& host, int port, int timeout_ms, std::string* error) {
    LOG_SOCKET_DEBUG("Creating TCP client socket for " << host << ":" << port);

    if (port <= 0 || port > 65535) {
        LOG_SOCKET_ERROR("Invalid port number: " << port << " (must be 1-65535)");
        if (error) *error = "invalid port " + std::to_string(port);
        return INVALID_SOCKET_VALUE;
    }

    addrinfo hints;
    memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_protocol = IPPROTO_TCP;

    addrinfo* results = nullptr;
    std::string port_str = std::to_string(port);
    int rc = getaddrinfo(host.c_str(), port_str.c_str(), &hints, &results);
    if (rc != 0 || results == nullptr) {
        LOG_SOCKET_ERROR("Failed to resolve hostname: " << host);
        if (error) *error = "cannot resolve host " + host;
        return INVALID_SOCKET_VALUE;
    }

    socket_t client_socket = INVALID_SOCKET_VALUE;
    std::string last_error = "connection to " + host + ":" + port_str + " failed";

    for (addrinfo* ai = results; ai != nullptr; ai = ai->ai_next) {
        socket_t candidate = socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (candidate == INVALID_SOCKET_VALUE) {
            continue;
        }

        std::string address = format_address(ai->ai_addr);
        LOG_SOCKET_DEBUG("Connecting to " << address);

        bool connected;
        if (timeout_ms > 0) {
            connected = connect_with_timeout(candidate, ai->ai_addr, static_cast<socklen_t>(ai->ai_addrlen), timeout_ms);
        } else {
            connected = connect(candidate, ai->ai_addr, static_cast<socklen_t>(ai->ai_addrlen)) != SOCKET_ERROR_VALUE;
        }

        if (connected) {
            LOG_SOCKET_INFO("Connected to " << address);
            client_socket = candidate;
            break;
        }

        LOG_SOCKET_DEBUG("Connection to " << address << " failed");
        last_error = "connection to " + address + " failed";
        close_socket(candidate);
    }

    freeaddrinfo(results);

    if (client_socket == INVALID_SOCKET_VALUE) {
        LOG_SOCKET_WARN("Failed to connect to " << host << ":" << port);
        if (error) *error = last_error;
    }
    return client_socket;
}

socket_t create_tcp_server_v4(int port, int backlog, bool loopback_only) {
    LOG_SOCKET_DEBUG("Creating TCP server socket on port " << port);

    // Validate port number
    if (port < 0 || port > 65535) {
        LOG_SOCKET_ERROR("Invalid port number: " << port << " (must be 0-65535)");
        return INVALID_SOCKET_VALUE;
    }

    socket_t server_socket = socket(AF_INET, SOCK_STREAM, 0);
    if (server_socket == INVALID_SOCKET_VALUE) {
        LOG_SOCKET_ERROR("Failed to create server socket");
        return INVALID_SOCKET_VALUE;
    }

    // Set socket option to reuse address
    int opt = 1;
    if (setsockopt(server_socket, SOL_SOCKET, SO_REUSEADDR,
                   (char*)&opt, sizeof(opt)) == SOCKET_ERROR_VALUE) {
        LOG_SOCKET_ERROR("Failed to set socket options");
        close_socket(server_socket);
        return INVALID_SOCKET_VALUE;
    }

    sockaddr_in server_addr;
    memset(&server_addr, 0, sizeof(server_addr));
    server_addr.sin_family = AF_INET;
    server_addr.sin_addr.s_addr = loopback_only ? htonl(INADDR_LOOPBACK) : INADDR_ANY;
    server_addr.sin_port = htons(port);

    if (bind(server_socket, (struct sockaddr*)&server_addr, sizeof(server_addr)) == SOCKET_ERROR_VALUE) {
        LOG_SOCKET_ERROR("Failed to bind server socket to port " << port);
        close_socket(server_socket);
        return INVALID_SOCKET_VALUE;
    }

    if (listen(server_socket, backlog) == SOCKET_ERROR_VALUE) {
        LOG_SOCKET_ERROR("Failed to listen on server socket");
        close_socket(server_socket);
        return INVALID_SOCKET_VALUE;
    }

    LOG_SOCKET_DEBUG("Server listening on port " << get_bound_port(server_socket) << " (backlog: " << backlog << ")");
    return server_socket;
}

socket_t accept_client(socket_t server_socket) {
    sockaddr_storage client_addr;
    socklen_t client_addr_len = sizeof(client_addr);

    socket_t client_socket = accept(server_socket, (struct sockaddr*)&client_addr, &client_addr_len);
    if (client_socket == INVALID_SOCKET_VALUE) {
        LOG_SOCKET_ERROR("Failed to accept client connection");
        return INVALID_SOCKET_VALUE;
    }

    LOG_SOCKET_DEBUG("Client connected from " << format_address((struct sockaddr*)&client_addr));
    return client_socket;
}

int send_tcp_data(socket_t socket, const std::string& data) {
    LOG_SOCKET_DEBUG("Sending " << data.length() << " bytes to TCP socket " << socket);

    size_t total_sent = 0;
    while (total_sent < data.length()) {
#ifdef _WIN32
        int flags = 0;
#else
        int flags = MSG_NOSIGNAL;
#endif
        int bytes_sent = send(socket, data.c_str() + total_sent,
                              static_cast<int>(data.length() - total_sent), flags);
        if (bytes_sent == SOCKET_ERROR_VALUE) {
#ifndef _WIN32
            if (errno == EINTR) {
                continue;
            }
#endif
            LOG_SOCKET_ERROR("Failed to send TCP data to socket " << socket);
            return -1;
        }
        total_sent += static_cast<size_t>(bytes_sent);
    }

    return static_cast<int>(total_sent);
}

bool send_tcp_line(socket_t socket, const std::string& line) {
    std::string framed = line;
    framed.push_back('\n');
    return send_tcp_data(socket, framed) == static_cast<int>(framed.length());
}

std::string receive_tcp_data(socket_t socket, size_t buffer_size) {
    std::string buffer(buffer_size, '\0');

    int bytes_received = recv(socket, &buffer[0], static_cast<int>(buffer_size), 0);
    if (bytes_received == SOCKET_ERROR_VALUE) {
        int error = last_socket_error();
        if (is_would_block(error)) {
            LOG_SOCKET_DEBUG("Receive timed out on socket " << socket);
        } else {
            LOG_SOCKET_ERROR("Failed to receive TCP data from socket " << socket);
        }
        return "";
    }

    if (bytes_received == 0) {
        LOG_SOCKET_DEBUG("Connection closed by peer on socket " << socket);
        return "";
    }

    buffer.resize(static_cast<size_t>(bytes_received));
    return buffer;
}

// LineReader
LineReader::LineReader(socket_t socket, size_t max_line_length)
    : socket_(socket), max_line_length_(max_line_length), eof_(false) {}

bool LineReader::read_line(std::string& line) {
    while (true) {
        size_t newline = buffer_.find('\n');
        if (newline != std::string::npos) {
            line = buffer_.substr(0, newline);
            buffer_.erase(0, newline + 1);
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            return true;
        }

        if (eof_) {
            return false;
        }

        if (buffer_.size() > max_line_length_) {
            LOG_SOCKET_WARN("Line exceeds " << max_line_length_ << " bytes on socket " << socket_);
            eof_ = true;
            return false;
        }

        std::string chunk = receive_tcp_data(socket_, 4096);
        if (chunk.empty()) {
            eof_ = true;
            // A final unterminated line still counts
            if (!buffer_.empty()) {
                line.swap(buffer_);
                buffer_.clear();
                if (!line.empty() && line.back() == '\r') {
                    line.pop_back();
                }
                return true;
            }
            return false;
        }
        buffer_ += chunk;
    }
}

// UDP Socket Functions
socket_t create_udp_socket_v4(int port) {
    LOG_SOCKET_DEBUG("Creating UDP socket on port " << port);

    // Validate port number
    if (port < 0 || port > 65535) {
        LOG_SOCKET_ERROR("Invalid port number: " << port << " (must be 0-65535)");
        return INVALID_SOCKET_VALUE;
    }

    socket_t udp_socket = socket(AF_INET, SOCK_DGRAM, 0);
    if (udp_socket == INVALID_SOCKET_VALUE) {
        LOG_SOCKET_ERROR("Failed to create UDP socket");
        return INVALID_SOCKET_VALUE;
    }

    // Set socket option to reuse address
    int opt = 1;
    if (setsockopt(udp_socket, SOL_SOCKET, SO_REUSEADDR,
                   (char*)&opt, sizeof(opt)) == SOCKET_ERROR_VALUE) {
        LOG_SOCKET_ERROR("Failed to set UDP socket options");
        close_socket(udp_socket);
        return INVALID_SOCKET_VALUE;
    }

    if (port > 0) {
        sockaddr_in addr;
        memset(&addr, 0, sizeof(addr));
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = INADDR_ANY;
        addr.sin_port = htons(port);

        if (bind(udp_socket, (struct sockaddr*)&addr, sizeof(addr)) == SOCKET_ERROR_VALUE) {
            LOG_SOCKET_ERROR("Failed to bind UDP socket to port " << port);
            close_socket(udp_socket);
            return INVALID_SOCKET_VALUE;
        }

        LOG_SOCKET_DEBUG("UDP socket bound to port " << port);
    }

    return udp_socket;
}

int send_udp_data_to(socket_t socket, const std::vector<uint8_t>& data, const std::string& ip, int port) {
    sockaddr_in dest;
    memset(&dest, 0, sizeof(dest));
    dest.sin_family = AF_INET;
    dest.sin_port = htons(port);
    if (inet_pton(AF_INET, ip.c_str(), &dest.sin_addr) <= 0) {
        LOG_SOCKET_ERROR("Invalid IPv4 address: " << ip);
        return -1;
    }

    int bytes_sent = sendto(socket, (const char*)data.data(), static_cast<int>(data.size()), 0,
                            (struct sockaddr*)&dest, sizeof(dest));
    if (bytes_sent == SOCKET_ERROR_VALUE) {
        LOG_SOCKET_ERROR("Failed to send UDP data to " << ip << ":" << port);
        return -1;
    }

    LOG_SOCKET_DEBUG("Sent " << bytes_sent << " bytes to " << ip << ":" << port);
    return bytes_sent;
}

std::vector<uint8_t> receive_udp_data_with_timeout(socket_t socket, size_t buffer_size, int timeout_ms,
                                                   std::string* sender_ip, int* sender_port) {
    if (timeout_ms >= 0) {
        fd_set read_fds;
        FD_ZERO(&read_fds);
        FD_SET(socket, &read_fds);

        timeval tv;
        tv.tv_sec = timeout_ms / 1000;
        tv.tv_usec = (timeout_ms % 1000) * 1000;

        int ready = select(static_cast<int>(socket) + 1, &read_fds, nullptr, nullptr, &tv);
        if (ready <= 0) {
            return std::vector<uint8_t>();
        }
    }

    std::vector<uint8_t> buffer(buffer_size);
    sockaddr_storage sender_addr;
    socklen_t sender_addr_len = sizeof(sender_addr);

    int bytes_received = recvfrom(socket, (char*)buffer.data(), static_cast<int>(buffer_size), 0,
                                  (struct sockaddr*)&sender_addr, &sender_addr_len);
    if (bytes_received == SOCKET_ERROR_VALUE) {
        int error = last_socket_error();
        if (!is_would_block(error)) {
            LOG_SOCKET_ERROR("Failed to receive UDP data: " << error);
        }
        return std::vector<uint8_t>();
    }

    if (bytes_received == 0) {
        return std::vector<uint8_t>();
    }

    if (sender_addr.ss_family == AF_INET) {
        char ip[INET_ADDRSTRLEN];
        sockaddr_in* addr_in = (sockaddr_in*)&sender_addr;
        inet_ntop(AF_INET, &addr_in->sin_addr, ip, INET_ADDRSTRLEN);
        if (sender_ip) *sender_ip = ip;
        if (sender_port) *sender_port = ntohs(addr_in->sin_port);
    } else {
        if (sender_ip) sender_ip->clear();
        if (sender_port) *sender_port = 0;
    }

    buffer.resize(static_cast<size_t>(bytes_received));
    return buffer;
}

// Common Socket Functions
void close_socket(socket_t socket) {
    if (is_valid_socket(socket)) {
        LOG_SOCKET_DEBUG("Closing socket " << socket);
        closesocket(socket);
    }
}

bool is_valid_socket(socket_t socket) {
    return socket != INVALID_SOCKET_VALUE;
}

bool set_socket_nonblocking(socket_t socket, bool nonblocking) {
#ifdef _WIN32
    unsigned long mode = nonblocking ? 1 : 0;
    if (ioctlsocket(socket, FIONBIO, &mode) != 0) {
        LOG_SOCKET_ERROR("Failed to change socket blocking mode");
        return false;
    }
#else
    int flags = fcntl(socket, F_GETFL, 0);
    if (flags == -1) {
        LOG_SOCKET_ERROR("Failed to get socket flags");
        return false;
    }

    flags = nonblocking ? (flags | O_NONBLOCK) : (flags & ~O_NONBLOCK);
    if (fcntl(socket, F_SETFL, flags) == -1) {
        LOG_SOCKET_ERROR("Failed to change socket blocking mode");
        return false;
    }
#endif
    return true;
}

bool set_socket_timeouts(socket_t socket, int timeout_ms) {
#ifdef _WIN32
    DWORD tv = static_cast<DWORD>(timeout_ms);
#else
    timeval tv;
    tv.tv_sec = timeout_ms / 1000;
    tv.tv_usec = (timeout_ms % 1000) * 1000;
#endif
    if (setsockopt(socket, SOL_SOCKET, SO_RCVTIMEO, (const char*)&tv, sizeof(tv)) == SOCKET_ERROR_VALUE ||
        setsockopt(socket, SOL_SOCKET, SO_SNDTIMEO, (const char*)&tv, sizeof(tv)) == SOCKET_ERROR_VALUE) {
        LOG_SOCKET_ERROR("Failed to set timeouts on socket " << socket);
        return false;
    }
    return true;
}

bool set_tcp_nodelay(socket_t socket) {
    int opt = 1;
    if (setsockopt(socket, IPPROTO_TCP, TCP_NODELAY, (const char*)&opt, sizeof(opt)) == SOCKET_ERROR_VALUE) {
        LOG_SOCKET_WARN("Failed to set TCP_NODELAY on socket " << socket);
        return false;
    }
    return true;
}

bool connect_with_timeout(socket_t socket, struct sockaddr* addr, socklen_t addr_len, int timeout_ms) {
    if (!set_socket_nonblocking(socket, true)) {
        return false;
    }

    int rc = connect(socket, addr, addr_len);
    if (rc == SOCKET_ERROR_VALUE) {
        int error = last_socket_error();
        if (!is_would_block(error)) {
            set_socket_nonblocking(socket, false);
            return false;
        }

        fd_set write_fds;
        FD_ZERO(&write_fds);
        FD_SET(socket, &write_fds);
        timeval tv;
        tv.tv_sec = timeout_ms / 1000;
        tv.tv_usec = (timeout_ms % 1000) * 1000;

        int ready = select(static_cast<int>(socket) + 1, nullptr, &write_fds, nullptr, &tv);
        if (ready <= 0) {
            LOG_SOCKET_DEBUG("Connect timed out after " << timeout_ms << "ms");
            set_socket_nonblocking(socket, false);
            return false;
        }

        int so_error = 0;
        socklen_t len = sizeof(so_error);
        if (getsockopt(socket, SOL_SOCKET, SO_ERROR, (char*)&so_error, &len) == SOCKET_ERROR_VALUE || so_error != 0) {
            set_socket_nonblocking(socket, false);
            return false;
        }
    }

    return set_socket_nonblocking(socket, false);
}

int get_bound_port(socket_t socket) {
    sockaddr_storage addr;
    socklen_t len = sizeof(addr);
    if (getsockname(socket, (struct sockaddr*)&addr, &len) == SOCKET_ERROR_VALUE) {
        return 0;
    }
    if (addr.ss_family == AF_INET) {
        return ntohs(((sockaddr_in*)&addr)->sin_port);
    }
    if (addr.ss_family == AF_INET6) {
        return ntohs(((sockaddr_in6*)&addr)->sin6_port);
    }
    return 0;
}

} // namespace bridgelink
