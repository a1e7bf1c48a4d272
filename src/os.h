#pragma once

#include <string>

namespace bridgelink {

struct SystemInfo {
    std::string os_name;
    std::string os_version;
    std::string architecture;
    std::string hostname;
    std::string device_family;
};

// Get the system information advertised in the node hello
SystemInfo get_system_info();

// Individual functions for specific info
std::string get_os_name();
std::string get_os_version();
std::string get_architecture();
std::string get_hostname();

// "Mac", "Windows" or "Linux"
std::string get_device_family();

// Home directory of the current user, empty if unknown
std::string get_home_directory();

// Value of an environment variable, empty string when unset
std::string get_environment_variable(const std::string& name);

} // namespace bridgelink
