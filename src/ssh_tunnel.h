#pragma once

#include "tunnel_provider.h"
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#ifndef _WIN32
    #include <sys/types.h>
#endif

namespace bridgelink {

struct SshTunnelOptions {
    std::string ssh_path = "ssh";
    std::string target;                 // "user@host" or "user@host:port"
    int remote_port = 18789;            // gateway port on the remote host
    int local_port = 0;                 // 0 picks a free loopback port
    std::string identity_file;
    int startup_timeout_ms = 10000;
};

/**
 * Split "user@host:port" into "user@host" and the port (22 when absent).
 * @return false for an empty target or a malformed port
 */
bool parse_ssh_target(const std::string& target, std::string& user_host, int& port);

/**
 * Command line for `ssh -N -L local:127.0.0.1:remote target`.
 */
std::vector<std::string> build_ssh_tunnel_command(const SshTunnelOptions& options, int local_port);

/**
 * Control tunnel backed by an `ssh -N -L` child process.
 */
class SshTunnelProvider : public TunnelProvider {
public:
    explicit SshTunnelProvider(const SshTunnelOptions& options);
    ~SshTunnelProvider() override;

    SshTunnelProvider(const SshTunnelProvider&) = delete;
    SshTunnelProvider& operator=(const SshTunnelProvider&) = delete;

    std::optional<int> control_tunnel_port_if_running() override;

    /**
     * Reuses a live child whose port answers; otherwise starts a new one and waits until
     * the forwarded port accepts connections.
     */
    std::optional<int> ensure_control_tunnel(std::string* error) override;

    /**
     * Terminate the ssh child, if any.
     */
    void stop();

private:
    bool child_alive_locked();
    void stop_locked();

    SshTunnelOptions options_;
    std::mutex mutex_;
#ifndef _WIN32
    pid_t pid_;
#endif
    int local_port_;
};

} // namespace bridgelink
