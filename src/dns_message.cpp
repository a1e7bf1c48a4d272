#include "dns_message.h"
#include "logger.h"
#include <stdexcept>
#include <cstring>
#include <cstdio>
#include <cctype>

#ifdef _WIN32
    #include <winsock2.h>
    #include <ws2tcpip.h>
#else
    #include <arpa/inet.h>
#endif

#define LOG_DNS_DEBUG(message) LOG_DEBUG("dns", message)
#define LOG_DNS_WARN(message)  LOG_WARN("dns", message)

namespace bridgelink {

std::string ServiceInstanceName::full_name() const {
    std::string name = instance + "." + service_type;
    if (!domain.empty()) {
        name += "." + domain;
    }
    return name;
}

namespace dns {

namespace {

void write_records(std::vector<uint8_t>& buffer, const std::vector<DnsResourceRecord>& records) {
    for (const auto& record : records) {
        write_name(buffer, record.name);
        write_uint16(buffer, static_cast<uint16_t>(record.type));
        write_uint16(buffer, record.record_class);
        write_uint32(buffer, record.ttl);
        write_uint16(buffer, static_cast<uint16_t>(record.data.size()));
        buffer.insert(buffer.end(), record.data.begin(), record.data.end());
    }
}

bool read_resource_records(const std::vector<uint8_t>& data, size_t& offset,
                           uint16_t count, std::vector<DnsResourceRecord>& records) {
    records.clear();
    records.reserve(count);

    for (uint16_t i = 0; i < count; ++i) {
        DnsResourceRecord record;
        record.name = read_name(data, offset);
        record.type = static_cast<DnsRecordType>(read_uint16(data, offset));
        record.record_class = read_uint16(data, offset);
        record.ttl = read_uint32(data, offset);
        uint16_t data_length = read_uint16(data, offset);

        if (offset + data_length > data.size()) {
            return false;
        }

        // Store offset for DNS compression resolution
        record.data_offset_in_packet = offset;
        record.data.assign(data.begin() + offset, data.begin() + offset + data_length);
        offset += data_length;

        records.push_back(std::move(record));
    }

    return true;
}

char ascii_lower(char c) {
    return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
}

} // namespace

std::vector<uint8_t> serialize_message(const DnsMessage& message) {
    std::vector<uint8_t> buffer;

    write_uint16(buffer, message.header.transaction_id);
    write_uint16(buffer, message.header.flags);
    write_uint16(buffer, static_cast<uint16_t>(message.questions.size()));
    write_uint16(buffer, static_cast<uint16_t>(message.answers.size()));
    write_uint16(buffer, static_cast<uint16_t>(message.authorities.size()));
    write_uint16(buffer, static_cast<uint16_t>(message.additionals.size()));

    for (const auto& question : message.questions) {
        write_name(buffer, question.name);
        write_uint16(buffer, static_cast<uint16_t>(question.type));
        write_uint16(buffer, static_cast<uint16_t>(question.record_class));
    }

    write_records(buffer, message.answers);
    write_records(buffer, message.authorities);
    write_records(buffer, message.additionals);

    return buffer;
}

bool deserialize_message(const std::vector<uint8_t>& data, DnsMessage& message) {
    if (data.size() < 12) { // Minimum DNS header size
        return false;
    }

    // Store raw packet for DNS compression resolution
    message.raw_packet = data;

    size_t offset = 0;

    try {
        message.header.transaction_id = read_uint16(data, offset);
        message.header.flags = read_uint16(data, offset);
        message.header.question_count = read_uint16(data, offset);
        message.header.answer_count = read_uint16(data, offset);
        message.header.authority_count = read_uint16(data, offset);
        message.header.additional_count = read_uint16(data, offset);

        message.questions.clear();
        message.questions.reserve(message.header.question_count);
        for (uint16_t i = 0; i < message.header.question_count; ++i) {
            DnsQuestion question;
            question.name = read_name(data, offset);
            question.type = static_cast<DnsRecordType>(read_uint16(data, offset));
            question.record_class = static_cast<DnsRecordClass>(read_uint16(data, offset));
            message.questions.push_back(std::move(question));
        }

        if (!read_resource_records(data, offset, message.header.answer_count, message.answers)) {
            return false;
        }
        if (!read_resource_records(data, offset, message.header.authority_count, message.authorities)) {
            return false;
        }
        if (!read_resource_records(data, offset, message.header.additional_count, message.additionals)) {
            return false;
        }

        return true;

    } catch (const std::out_of_range& e) {
        LOG_DNS_DEBUG("Truncated DNS message: " << e.what());
        return false;
    }
}

std::string escape_label(const std::string& raw_label) {
    std::string out;
    out.reserve(raw_label.size());
    for (unsigned char c : raw_label) {
        if (c == '.' || c == '\\') {
            out.push_back('\\');
            out.push_back(static_cast<char>(c));
        } else if (c <= 0x20 || c >= 0x7F) {
            char digits[5];
            snprintf(digits, sizeof(digits), "\\%03u", static_cast<unsigned>(c));
            out += digits;
        } else {
            out.push_back(static_cast<char>(c));
        }
    }
    return out;
}

std::vector<std::string> split_name(const std::string& name) {
    std::vector<std::string> labels;
    std::string current;

    for (size_t i = 0; i < name.size(); ++i) {
        char c = name[i];
        if (c == '\\' && i + 1 < name.size()) {
            if (i + 3 < name.size() &&
                isdigit(static_cast<unsigned char>(name[i + 1])) &&
                isdigit(static_cast<unsigned char>(name[i + 2])) &&
                isdigit(static_cast<unsigned char>(name[i + 3]))) {
                int value = (name[i + 1] - '0') * 100 + (name[i + 2] - '0') * 10 + (name[i + 3] - '0');
                if (value <= 255) {
                    current.push_back(static_cast<char>(value));
                    i += 3;
                    continue;
                }
            }
            current.push_back(name[i + 1]);
            ++i;
        } else if (c == '.') {
            if (!current.empty()) {
                labels.push_back(current);
            }
            current.clear();
        } else {
            current.push_back(c);
        }
    }
    if (!current.empty()) {
        labels.push_back(current);
    }
    return labels;
}

std::string join_labels(const std::vector<std::string>& raw_labels) {
    std::string name;
    for (const auto& label : raw_labels) {
        if (!name.empty()) {
            name += ".";
        }
        name += escape_label(label);
    }
    return name;
}

bool names_equal(const std::string& a, const std::string& b) {
    std::vector<std::string> la = split_name(a);
    std::vector<std::string> lb = split_name(b);
    if (la.size() != lb.size()) {
        return false;
    }
    for (size_t i = 0; i < la.size(); ++i) {
        if (la[i].size() != lb[i].size()) {
            return false;
        }
        for (size_t j = 0; j < la[i].size(); ++j) {
            if (ascii_lower(la[i][j]) != ascii_lower(lb[i][j])) {
                return false;
            }
        }
    }
    return true;
}

bool parse_service_instance_name(const std::string& name, ServiceInstanceName& out) {
    std::vector<std::string> labels = split_name(name);
    if (labels.size() < 3) {
        return false;
    }

    // The protocol label is the first "_tcp"/"_udp" after an "_service" label
    for (size_t i = 1; i + 1 < labels.size(); ++i) {
        if (labels[i].empty() || labels[i][0] != '_') {
            continue;
        }
        std::string proto = labels[i + 1];
        for (auto& ch : proto) ch = ascii_lower(ch);
        if (proto != "_tcp" && proto != "_udp") {
            continue;
        }

        std::vector<std::string> instance_labels(labels.begin(), labels.begin() + i);
        std::string instance_raw;
        for (size_t k = 0; k < instance_labels.size(); ++k) {
            if (k > 0) instance_raw += ".";
            instance_raw += instance_labels[k];
        }
        out.instance = escape_label(instance_raw);
        out.service_type = labels[i] + "." + labels[i + 1];
        out.domain = join_labels(std::vector<std::string>(labels.begin() + i + 2, labels.end()));
        return true;
    }
    return false;
}

void write_name(std::vector<uint8_t>& buffer, const std::string& name) {
    for (std::string label : split_name(name)) {
        if (label.length() > 63) {
            LOG_DNS_WARN("DNS label too long, truncating: " << label);
            label = label.substr(0, 63);
        }

        buffer.push_back(static_cast<uint8_t>(label.length()));
        buffer.insert(buffer.end(), label.begin(), label.end());
    }

    buffer.push_back(0); // Root label
}

bool read_labels(const std::vector<uint8_t>& buffer, size_t& offset, std::vector<std::string>& labels) {
    labels.clear();
    bool jumped = false;
    size_t original_offset = offset;
    int jumps = 0;
    const int max_jumps = 10;

    while (true) {
        if (offset >= buffer.size()) {
            LOG_DNS_DEBUG("DNS name runs past end of packet");
            return false;
        }

        uint8_t length = buffer[offset++];

        if (length == 0) {
            break; // End of name
        }

        if ((length & 0xC0) == 0xC0) {
            // Compression pointer - need one more byte
            if (offset >= buffer.size()) {
                LOG_DNS_DEBUG("Truncated DNS compression pointer");
                return false;
            }

            if (!jumped) {
                original_offset = offset + 1;
                jumped = true;
            }

            uint16_t pointer = static_cast<uint16_t>(((length & 0x3F) << 8) | buffer[offset++]);
            if (pointer >= buffer.size() || ++jumps > max_jumps) {
                LOG_DNS_DEBUG("Invalid DNS compression pointer: " << pointer);
                return false;
            }

            offset = pointer;
            continue;
        }

        // Check for invalid label length (> 63 bytes per RFC 1035)
        if (length > 63 || offset + length > buffer.size()) {
            LOG_DNS_DEBUG("Invalid DNS label length: " << static_cast<int>(length));
            return false;
        }

        labels.emplace_back(reinterpret_cast<const char*>(&buffer[offset]), length);
        offset += length;
    }

    if (jumped) {
        offset = original_offset;
    }

    return true;
}

std::string read_name(const std::vector<uint8_t>& buffer, size_t& offset) {
    std::vector<std::string> labels;
    if (!read_labels(buffer, offset, labels)) {
        throw std::out_of_range("Malformed DNS name");
    }
    return join_labels(labels);
}

void write_uint16(std::vector<uint8_t>& buffer, uint16_t value) {
    buffer.push_back(static_cast<uint8_t>(value >> 8));
    buffer.push_back(static_cast<uint8_t>(value & 0xFF));
}

void write_uint32(std::vector<uint8_t>& buffer, uint32_t value) {
    buffer.push_back(static_cast<uint8_t>(value >> 24));
    buffer.push_back(static_cast<uint8_t>((value >> 16) & 0xFF));
    buffer.push_back(static_cast<uint8_t>((value >> 8) & 0xFF));
    buffer.push_back(static_cast<uint8_t>(value & 0xFF));
}

uint16_t read_uint16(const std::vector<uint8_t>& buffer, size_t& offset) {
    if (offset + 2 > buffer.size()) {
        throw std::out_of_range("Buffer too small for uint16");
    }

    uint16_t value = static_cast<uint16_t>((static_cast<uint16_t>(buffer[offset]) << 8) | buffer[offset + 1]);
    offset += 2;
    return value;
}

uint32_t read_uint32(const std::vector<uint8_t>& buffer, size_t& offset) {
    if (offset + 4 > buffer.size()) {
        throw std::out_of_range("Buffer too small for uint32");
    }

    uint32_t value = (static_cast<uint32_t>(buffer[offset]) << 24) |
                     (static_cast<uint32_t>(buffer[offset + 1]) << 16) |
                     (static_cast<uint32_t>(buffer[offset + 2]) << 8) |
                     buffer[offset + 3];
    offset += 4;
    return value;
}

std::vector<uint8_t> encode_txt_record(const std::map<std::string, std::string>& txt_data) {
    std::vector<uint8_t> data;

    if (txt_data.empty()) {
        // Empty TXT record
        data.push_back(0);
        return data;
    }

    for (const auto& pair : txt_data) {
        std::string entry = pair.first + "=" + pair.second;

        if (entry.length() > 255) {
            LOG_DNS_WARN("TXT record entry too long, truncating key " << pair.first);
            entry = entry.substr(0, 255);
        }

        data.push_back(static_cast<uint8_t>(entry.length()));
        data.insert(data.end(), entry.begin(), entry.end());
    }

    return data;
}

std::map<std::string, std::string> decode_txt_record(const std::vector<uint8_t>& txt_data) {
    std::map<std::string, std::string> result;

    size_t offset = 0;
    while (offset < txt_data.size()) {
        uint8_t length = txt_data[offset++];

        if (length == 0) {
            continue;
        }
        if (offset + length > txt_data.size()) {
            break;
        }

        std::string entry(reinterpret_cast<const char*>(&txt_data[offset]), length);
        offset += length;

        // Parse key=value format; the first occurrence of a key wins (RFC 6763 6.4)
        size_t eq_pos = entry.find('=');
        std::string key = eq_pos != std::string::npos ? entry.substr(0, eq_pos) : entry;
        if (key.empty() || result.count(key) > 0) {
            continue;
        }
        result[key] = eq_pos != std::string::npos ? entry.substr(eq_pos + 1) : "";
    }

    return result;
}

std::vector<uint8_t> encode_srv_record(uint16_t priority, uint16_t weight, uint16_t port, const std::string& target) {
    std::vector<uint8_t> data;

    write_uint16(data, priority);
    write_uint16(data, weight);
    write_uint16(data, port);
    write_name(data, target);

    return data;
}

bool decode_srv_record(const std::vector<uint8_t>& full_packet, size_t data_offset,
                       uint16_t& priority, uint16_t& weight, uint16_t& port, std::string& target) {
    if (data_offset + 6 > full_packet.size()) {
        return false;
    }

    size_t offset = data_offset;

    try {
        priority = read_uint16(full_packet, offset);
        weight = read_uint16(full_packet, offset);
        port = read_uint16(full_packet, offset);
        // Use full packet for proper DNS compression resolution
        target = read_name(full_packet, offset);
        return true;
    } catch (const std::out_of_range&) {
        return false;
    }
}

std::string decode_address_record(const DnsResourceRecord& record) {
    if (record.type == DnsRecordType::A && record.data.size() == 4) {
        char ip_str[INET_ADDRSTRLEN];
        inet_ntop(AF_INET, record.data.data(), ip_str, INET_ADDRSTRLEN);
        return std::string(ip_str);
    }
    if (record.type == DnsRecordType::AAAA && record.data.size() == 16) {
        char ip_str[INET6_ADDRSTRLEN];
        inet_ntop(AF_INET6, record.data.data(), ip_str, INET6_ADDRSTRLEN);
        return std::string(ip_str);
    }
    return "";
}

DnsMessage create_query(const std::string& name, DnsRecordType type, uint16_t transaction_id,
                        bool unicast_response, bool recursion_desired) {
    DnsMessage query;

    query.header.transaction_id = transaction_id;
    query.header.flags = recursion_desired ? static_cast<uint16_t>(DnsFlags::RECURSION_DESIRED)
                                           : static_cast<uint16_t>(DnsFlags::QUERY);
    query.header.question_count = 1;

    query.questions.emplace_back(name, type,
                                 unicast_response ? DnsRecordClass::CLASS_IN_UNICAST : DnsRecordClass::CLASS_IN);
    return query;
}

} // namespace dns

} // namespace bridgelink
