#include "gateway_txt.h"
#include <regex>
#include <sstream>
#include <cerrno>
#include <cstdlib>
#include <climits>

namespace bridgelink {

namespace {

bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

std::optional<std::string> txt_string(const TxtRecord& txt, const std::string& key) {
    auto it = txt.find(key);
    if (it == txt.end()) {
        return std::nullopt;
    }
    std::string trimmed = trim_whitespace(it->second);
    if (trimmed.empty()) {
        return std::nullopt;
    }
    return trimmed;
}

std::optional<int> txt_int(const TxtRecord& txt, const std::string& key) {
    std::optional<std::string> raw = txt_string(txt, key);
    int value = 0;
    if (!raw || !parse_int_strict(*raw, value)) {
        return std::nullopt;
    }
    return value;
}

std::string collapse_whitespace(const std::string& value) {
    std::istringstream iss(value);
    std::string word;
    std::string out;
    while (iss >> word) {
        if (!out.empty()) {
            out.push_back(' ');
        }
        out += word;
    }
    return out;
}

std::string replace_all(std::string value, const std::string& from, const std::string& to) {
    if (from.empty()) {
        return value;
    }
    size_t pos = 0;
    while ((pos = value.find(from, pos)) != std::string::npos) {
        value.replace(pos, from.length(), to);
        pos += to.length();
    }
    return value;
}

std::string title_case(const std::string& words) {
    std::istringstream iss(words);
    std::string word;
    std::string out;
    while (iss >> word) {
        word = to_lower_ascii(word);
        if (word[0] >= 'a' && word[0] <= 'z') {
            word[0] = static_cast<char>(word[0] - 'a' + 'A');
        }
        if (!out.empty()) {
            out.push_back(' ');
        }
        out += word;
    }
    return out;
}

} // namespace

std::string trim_whitespace(const std::string& value) {
    size_t start = 0;
    while (start < value.size() && is_space(value[start])) {
        ++start;
    }
    size_t end = value.size();
    while (end > start && is_space(value[end - 1])) {
        --end;
    }
    return value.substr(start, end - start);
}

std::string to_lower_ascii(const std::string& value) {
    std::string out = value;
    for (auto& c : out) {
        if (c >= 'A' && c <= 'Z') {
            c = static_cast<char>(c - 'A' + 'a');
        }
    }
    return out;
}

bool parse_int_strict(const std::string& value, int& out) {
    if (value.empty()) {
        return false;
    }
    size_t i = (value[0] == '-' || value[0] == '+') ? 1 : 0;
    if (i == value.size()) {
        return false;
    }
    for (size_t k = i; k < value.size(); ++k) {
        if (value[k] < '0' || value[k] > '9') {
            return false;
        }
    }

    errno = 0;
    long parsed = std::strtol(value.c_str(), nullptr, 10);
    if (errno == ERANGE || parsed > INT_MAX || parsed < INT_MIN) {
        return false;
    }
    out = static_cast<int>(parsed);
    return true;
}

GatewayTxt parse_gateway_txt(const TxtRecord& txt) {
    GatewayTxt parsed;
    parsed.display_name = txt_string(txt, TXT_DISPLAY_NAME);
    parsed.lan_host = txt_string(txt, TXT_LAN_HOST);
    parsed.tailnet_dns = txt_string(txt, TXT_TAILNET_DNS);
    parsed.cli_path = txt_string(txt, TXT_CLI_PATH);
    parsed.gateway_port = txt_int(txt, TXT_GATEWAY_PORT);
    parsed.bridge_port = txt_int(txt, TXT_BRIDGE_PORT);
    parsed.canvas_port = txt_int(txt, TXT_CANVAS_PORT);

    std::optional<int> ssh_port = txt_int(txt, TXT_SSH_PORT);
    if (ssh_port && *ssh_port > 0) {
        parsed.ssh_port = *ssh_port;
    }
    return parsed;
}

TxtRecord merge_txt(const TxtRecord& inline_txt, const TxtRecord& resolved_txt) {
    TxtRecord merged = inline_txt;
    for (const auto& entry : resolved_txt) {
        merged[entry.first] = entry.second;
    }
    return merged;
}

std::string prettify_instance_name(const std::string& decoded_name) {
    static const std::regex trailing_counter(R"(\s+\(\d+\)$)");

    std::string normalized = collapse_whitespace(decoded_name);
    std::string stripped = replace_all(normalized, " (Clawdis)", "");
    stripped = std::regex_replace(stripped, trailing_counter, "");
    return trim_whitespace(stripped);
}

std::string prettify_service_name(const std::string& decoded_name) {
    static const std::regex bridge_suffix(R"(\s*-?bridge$)");

    std::string normalized = prettify_instance_name(decoded_name);
    std::string cleaned = std::regex_replace(normalized, bridge_suffix, "");
    cleaned = replace_all(cleaned, "_", " ");
    cleaned = replace_all(cleaned, "-", " ");
    cleaned = trim_whitespace(collapse_whitespace(cleaned));
    if (cleaned.empty()) {
        cleaned = normalized;
    }

    std::string titled = title_case(cleaned);
    return titled.empty() ? normalized : titled;
}

std::string build_ssh_target(const std::string& user, const std::string& host, int port) {
    std::string target = user + "@" + host;
    if (port != DEFAULT_SSH_PORT) {
        target += ":" + std::to_string(port);
    }
    return target;
}

} // namespace bridgelink
