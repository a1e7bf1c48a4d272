#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <cstddef>

#ifdef _WIN32
    #include <winsock2.h>
    #include <ws2tcpip.h>
    #pragma comment(lib, "ws2_32.lib")
    typedef SOCKET socket_t;
    #define INVALID_SOCKET_VALUE INVALID_SOCKET
    #define SOCKET_ERROR_VALUE SOCKET_ERROR
#else
    #include <sys/socket.h>
    #include <arpa/inet.h>
    #include <netinet/in.h>
    #include <unistd.h>
    typedef int socket_t;
    #define INVALID_SOCKET_VALUE -1
    #define SOCKET_ERROR_VALUE -1
    #define closesocket close
#endif

namespace bridgelink {

// Socket Library Initialization
/**
 * Initialize the socket library
 * @return true if successful, false otherwise
 */
bool init_socket_library();

/**
 * Cleanup the socket library
 */
void cleanup_socket_library();

// TCP Socket Functions
/**
 * Create a TCP client socket and connect to a server. Every address returned by the
 * resolver (IPv6 and IPv4) is tried in order until one connects.
 * @param host The hostname or IP address to connect to
 * @param port The port number to connect to
 * @param timeout_ms Connection timeout per address in milliseconds (0 for blocking)
 * @param error Optional output for a human readable failure reason
 * @return Socket handle, or INVALID_SOCKET_VALUE on error
 */
socket_t create_tcp_client(const std::string& host, int port, int timeout_ms = 0,
                           std::string* error = nullptr);

/**
 * Create a TCP server socket bound to a port using IPv4 only
 * @param port The port number to bind to (0 for an ephemeral port)
 * @param backlog The maximum number of pending connections
 * @param loopback_only Bind to 127.0.0.1 instead of INADDR_ANY
 * @return Socket handle, or INVALID_SOCKET_VALUE on error
 */
socket_t create_tcp_server_v4(int port, int backlog = 5, bool loopback_only = false);

/**
 * Accept a client connection on a server socket
 * @param server_socket The server socket handle
 * @return Client socket handle, or INVALID_SOCKET_VALUE on error
 */
socket_t accept_client(socket_t server_socket);

/**
 * Send all bytes of a string through a TCP socket, retrying short writes
 * @param socket The socket handle
 * @param data The data to send
 * @return Number of bytes sent, or -1 on error
 */
int send_tcp_data(socket_t socket, const std::string& data);

/**
 * Send one newline-terminated line through a TCP socket
 * @param socket The socket handle
 * @param line The line content without the terminating newline
 * @return true if the whole line was written
 */
bool send_tcp_line(socket_t socket, const std::string& line);

/**
 * Receive data from a TCP socket as string
 * @param socket The socket handle
 * @param buffer_size Maximum number of bytes to receive
 * @return Received data as string, empty string on error or connection close
 */
std::string receive_tcp_data(socket_t socket, size_t buffer_size = 1024);

/**
 * Buffered newline-delimited reader over a connected TCP socket.
 * Does not own the socket.
 */
class LineReader {
public:
    explicit LineReader(socket_t socket, size_t max_line_length = 1024 * 1024);

    /**
     * Read the next line (without the trailing "\n" or "\r\n")
     * @param line Output line
     * @return false on end of stream, timeout, error or an over-long line
     */
    bool read_line(std::string& line);

    bool at_end() const { return eof_; }

private:
    socket_t socket_;
    size_t max_line_length_;
    std::string buffer_;
    bool eof_;
};

// UDP Socket Functions
/**
 * Create a UDP socket with IPv4 support only
 * @param port The port to bind to (0 for any available port)
 * @return UDP socket handle, or INVALID_SOCKET_VALUE on error
 */
socket_t create_udp_socket_v4(int port = 0);

/**
 * Send UDP data to an IPv4 address and port
 * @param socket The UDP socket handle
 * @param data The data to send
 * @param ip The destination IPv4 address
 * @param port The destination port
 * @return Number of bytes sent, or -1 on error
 */
int send_udp_data_to(socket_t socket, const std::vector<uint8_t>& data, const std::string& ip, int port);

/**
 * Receive UDP data with timeout support
 * @param socket The UDP socket handle
 * @param buffer_size Maximum number of bytes to receive
 * @param timeout_ms Timeout in milliseconds (0 for non-blocking, -1 for blocking)
 * @param sender_ip Optional output parameter for sender IP address
 * @param sender_port Optional output parameter for sender port
 * @return Received data, empty vector on timeout or error
 */
std::vector<uint8_t> receive_udp_data_with_timeout(socket_t socket, size_t buffer_size, int timeout_ms,
                                                   std::string* sender_ip = nullptr, int* sender_port = nullptr);

// Common Socket Functions
/**
 * Close a socket
 * @param socket The socket handle to close
 */
void close_socket(socket_t socket);

/**
 * Check if a socket is valid
 * @param socket The socket handle to check
 * @return true if valid, false otherwise
 */
bool is_valid_socket(socket_t socket);

/**
 * Set socket to non-blocking or back to blocking mode
 */
bool set_socket_nonblocking(socket_t socket, bool nonblocking = true);

/**
 * Apply receive and send timeouts (SO_RCVTIMEO / SO_SNDTIMEO)
 * @param timeout_ms Timeout in milliseconds, 0 disables the timeout
 */
bool set_socket_timeouts(socket_t socket, int timeout_ms);

/**
 * Disable Nagle's algorithm on a TCP socket
 */
bool set_tcp_nodelay(socket_t socket);

/**
 * Connect to a socket address with timeout
 * @param socket The socket handle (switched to non-blocking for the attempt)
 * @param addr The socket address structure
 * @param addr_len Length of the address structure
 * @param timeout_ms Connection timeout in milliseconds
 * @return true if connected successfully, false on timeout or error
 */
bool connect_with_timeout(socket_t socket, struct sockaddr* addr, socklen_t addr_len, int timeout_ms);

/**
 * Get the local port a socket is bound to
 * @return The port, or 0 if it cannot be determined
 */
int get_bound_port(socket_t socket);

/**
 * Owns a socket handle and closes it on destruction.
 */
class ScopedSocket {
public:
    ScopedSocket() : socket_(INVALID_SOCKET_VALUE) {}
    explicit ScopedSocket(socket_t socket) : socket_(socket) {}
    ~ScopedSocket() { reset(); }

    ScopedSocket(const ScopedSocket&) = delete;
    ScopedSocket& operator=(const ScopedSocket&) = delete;

    ScopedSocket(ScopedSocket&& other) noexcept : socket_(other.release()) {}
    ScopedSocket& operator=(ScopedSocket&& other) noexcept {
        if (this != &other) {
            reset(other.release());
        }
        return *this;
    }

    socket_t get() const { return socket_; }
    bool valid() const { return is_valid_socket(socket_); }

    socket_t release() {
        socket_t s = socket_;
        socket_ = INVALID_SOCKET_VALUE;
        return s;
    }

    void reset(socket_t socket = INVALID_SOCKET_VALUE) {
        if (is_valid_socket(socket_)) {
            close_socket(socket_);
        }
        socket_ = socket;
    }

private:
    socket_t socket_;
};

} // namespace bridgelink
