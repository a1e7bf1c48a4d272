#include "os.h"
#include <fstream>
#include <cstdlib>

#ifdef _WIN32
    #include <windows.h>
#else
    #include <sys/utsname.h>
    #include <unistd.h>
    #include <pwd.h>
#endif

namespace bridgelink {

#ifdef _WIN32

std::string get_os_name() {
    return "Windows";
}

std::string get_os_version() {
    // GetVersionEx lies without a manifest; the kernel build is good enough here
    OSVERSIONINFOA osvi;
    ZeroMemory(&osvi, sizeof(osvi));
    osvi.dwOSVersionInfoSize = sizeof(osvi);
#pragma warning(suppress: 4996)
    if (GetVersionExA(&osvi)) {
        return std::to_string(osvi.dwMajorVersion) + "." + std::to_string(osvi.dwMinorVersion) +
               "." + std::to_string(osvi.dwBuildNumber);
    }
    return "Unknown";
}

std::string get_architecture() {
    SYSTEM_INFO si;
    GetNativeSystemInfo(&si);

    switch (si.wProcessorArchitecture) {
        case PROCESSOR_ARCHITECTURE_AMD64:
            return "x64";
        case PROCESSOR_ARCHITECTURE_INTEL:
            return "x86";
        case PROCESSOR_ARCHITECTURE_ARM64:
            return "ARM64";
        default:
            return "Unknown";
    }
}

std::string get_hostname() {
    char hostname[256];
    DWORD hostname_len = sizeof(hostname);
    if (GetComputerNameA(hostname, &hostname_len)) {
        return std::string(hostname);
    }
    return "";
}

std::string get_device_family() {
    return "Windows";
}

std::string get_home_directory() {
    return get_environment_variable("USERPROFILE");
}

#else // POSIX

std::string get_os_name() {
#ifdef __APPLE__
    return "macOS";
#else
    std::ifstream file("/etc/os-release");
    std::string line;
    while (std::getline(file, line)) {
        if (line.find("PRETTY_NAME=") == 0) {
            std::string name = line.substr(12);
            // Remove quotes if present
            if (name.size() >= 2 && name.front() == '"' && name.back() == '"') {
                name = name.substr(1, name.length() - 2);
            }
            return name;
        }
    }

    struct utsname unameData;
    if (uname(&unameData) != 0) {
        return "Linux";
    }
    return std::string(unameData.sysname);
#endif
}

std::string get_os_version() {
    struct utsname unameData;
    if (uname(&unameData) != 0) {
        return "Unknown";
    }
    return std::string(unameData.release);
}

std::string get_architecture() {
    struct utsname unameData;
    if (uname(&unameData) != 0) {
        return "Unknown";
    }
    return std::string(unameData.machine);
}

std::string get_hostname() {
    char buffer[256] = {0};
    if (gethostname(buffer, sizeof(buffer) - 1) == 0 && buffer[0] != '\0') {
        return std::string(buffer);
    }

    struct utsname unameData;
    if (uname(&unameData) != 0) {
        return "";
    }
    return std::string(unameData.nodename);
}

std::string get_device_family() {
#ifdef __APPLE__
    return "Mac";
#else
    return "Linux";
#endif
}

std::string get_home_directory() {
    std::string home = get_environment_variable("HOME");
    if (!home.empty()) {
        return home;
    }

    struct passwd* pw = getpwuid(getuid());
    if (pw != nullptr && pw->pw_dir != nullptr) {
        return std::string(pw->pw_dir);
    }
    return "";
}

#endif

SystemInfo get_system_info() {
    SystemInfo info;
    info.os_name = get_os_name();
    info.os_version = get_os_version();
    info.architecture = get_architecture();
    info.hostname = get_hostname();
    info.device_family = get_device_family();
    return info;
}

std::string get_environment_variable(const std::string& name) {
    const char* value = std::getenv(name.c_str());
    return value ? std::string(value) : std::string();
}

} // namespace bridgelink
