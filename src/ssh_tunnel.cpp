#include "ssh_tunnel.h"
#include "gateway_txt.h"
#include "logger.h"
#include "socket.h"
#include <chrono>
#include <thread>
#ifndef _WIN32
    #include <signal.h>
    #include <sys/wait.h>
    #include <unistd.h>
#endif

#define LOG_TUNNEL_DEBUG(message) LOG_DEBUG("tunnel", message)
#define LOG_TUNNEL_INFO(message)  LOG_INFO("tunnel", message)
#define LOG_TUNNEL_WARN(message)  LOG_WARN("tunnel", message)
#define LOG_TUNNEL_ERROR(message) LOG_ERROR("tunnel", message)

namespace bridgelink {

namespace {

const int PROBE_INTERVAL_MS = 100;
const int PROBE_CONNECT_TIMEOUT_MS = 500;

bool port_accepts_connections(int port) {
    ScopedSocket probe(create_tcp_client("127.0.0.1", port, PROBE_CONNECT_TIMEOUT_MS));
    return probe.valid();
}

int pick_free_loopback_port() {
    ScopedSocket listener(create_tcp_server_v4(0, 1, true));
    if (!listener.valid()) {
        return 0;
    }
    return get_bound_port(listener.get());
}

} // namespace

bool parse_ssh_target(const std::string& target, std::string& user_host, int& port) {
    std::string trimmed = trim_whitespace(target);
    if (trimmed.empty()) {
        return false;
    }

    size_t at = trimmed.find('@');
    size_t colon = trimmed.rfind(':');
    if (colon != std::string::npos && (at == std::string::npos || colon > at)) {
        int parsed = 0;
        if (!parse_int_strict(trimmed.substr(colon + 1), parsed) || parsed <= 0 || parsed > 65535) {
            return false;
        }
        user_host = trimmed.substr(0, colon);
        port = parsed;
    } else {
        user_host = trimmed;
        port = DEFAULT_SSH_PORT;
    }
    return !user_host.empty();
}

std::vector<std::string> build_ssh_tunnel_command(const SshTunnelOptions& options, int local_port) {
    std::string user_host;
    int ssh_port = DEFAULT_SSH_PORT;
    if (!parse_ssh_target(options.target, user_host, ssh_port)) {
        user_host = trim_whitespace(options.target);
    }

    std::vector<std::string> command = {
        options.ssh_path,
        "-N",
        "-o", "BatchMode=yes",
        "-o", "ExitOnForwardFailure=yes",
        "-o", "ServerAliveInterval=15",
    };
    if (!options.identity_file.empty()) {
        command.push_back("-i");
        command.push_back(options.identity_file);
    }
    if (ssh_port != DEFAULT_SSH_PORT) {
        command.push_back("-p");
        command.push_back(std::to_string(ssh_port));
    }
    command.push_back("-L");
    command.push_back(std::to_string(local_port) + ":127.0.0.1:" + std::to_string(options.remote_port));
    command.push_back(user_host);
    return command;
}

SshTunnelProvider::SshTunnelProvider(const SshTunnelOptions& options)
    : options_(options),
#ifndef _WIN32
      pid_(0),
#endif
      local_port_(0) {}

SshTunnelProvider::~SshTunnelProvider() {
    stop();
}

std::optional<int> SshTunnelProvider::control_tunnel_port_if_running() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!child_alive_locked() || !port_accepts_connections(local_port_)) {
        return std::nullopt;
    }
    return local_port_;
}

#ifdef _WIN32

std::optional<int> SshTunnelProvider::ensure_control_tunnel(std::string* error) {
    if (error) *error = "ssh tunnels are not supported on this platform";
    return std::nullopt;
}

void SshTunnelProvider::stop() {}

bool SshTunnelProvider::child_alive_locked() { return false; }

void SshTunnelProvider::stop_locked() {}

#else

std::optional<int> SshTunnelProvider::ensure_control_tunnel(std::string* error) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (child_alive_locked() && port_accepts_connections(local_port_)) {
        LOG_TUNNEL_DEBUG("Reusing control tunnel on port " << local_port_);
        return local_port_;
    }
    stop_locked();

    if (trim_whitespace(options_.target).empty()) {
        if (error) *error = "no SSH target configured";
        return std::nullopt;
    }

    int local_port = options_.local_port > 0 ? options_.local_port : pick_free_loopback_port();
    if (local_port <= 0) {
        if (error) *error = "cannot find a free local port";
        return std::nullopt;
    }

    std::vector<std::string> command = build_ssh_tunnel_command(options_, local_port);
    LOG_TUNNEL_INFO("Starting SSH tunnel 127.0.0.1:" << local_port << " -> " << options_.target
                    << " port " << options_.remote_port);

    pid_t pid = fork();
    if (pid == 0) {
        std::vector<char*> argv;
        for (auto& arg : command) argv.push_back(const_cast<char*>(arg.c_str()));
        argv.push_back(nullptr);
        execvp(argv[0], argv.data());
        _exit(127);
    }
    if (pid < 0) {
        if (error) *error = "failed to start ssh";
        LOG_TUNNEL_ERROR("fork() failed");
        return std::nullopt;
    }

    pid_ = pid;
    local_port_ = local_port;

    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(options_.startup_timeout_ms);
    while (std::chrono::steady_clock::now() < deadline) {
        int status = 0;
        pid_t result = waitpid(pid_, &status, WNOHANG);
        if (result == pid_) {
            pid_ = 0;
            int code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
            std::string message = "ssh exited with status " + std::to_string(code);
            LOG_TUNNEL_ERROR("SSH tunnel failed: " << message);
            if (error) *error = message;
            return std::nullopt;
        }

        if (port_accepts_connections(local_port_)) {
            LOG_TUNNEL_INFO("Control tunnel is up on port " << local_port_);
            return local_port_;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(PROBE_INTERVAL_MS));
    }

    stop_locked();
    std::string message = "tunnel did not come up within " + std::to_string(options_.startup_timeout_ms / 1000) + " s";
    LOG_TUNNEL_ERROR("SSH tunnel failed: " << message);
    if (error) *error = message;
    return std::nullopt;
}

void SshTunnelProvider::stop() {
    std::lock_guard<std::mutex> lock(mutex_);
    stop_locked();
}

bool SshTunnelProvider::child_alive_locked() {
    if (pid_ <= 0) {
        return false;
    }
    int status = 0;
    pid_t result = waitpid(pid_, &status, WNOHANG);
    if (result == 0) {
        return true;
    }
    LOG_TUNNEL_WARN("SSH tunnel process " << pid_ << " has exited");
    pid_ = 0;
    return false;
}

void SshTunnelProvider::stop_locked() {
    if (pid_ <= 0) {
        return;
    }
    LOG_TUNNEL_DEBUG("Stopping SSH tunnel process " << pid_);
    kill(pid_, SIGTERM);
    int status = 0;
    waitpid(pid_, &status, 0);
    pid_ = 0;
}

#endif

} // namespace bridgelink
