#pragma once

#include <string>
#include <vector>
#include <map>
#include <cstdint>
#include <cstddef>

namespace bridgelink {

// mDNS / DNS protocol constants
const uint16_t MDNS_PORT = 5353;
const uint16_t DNS_PORT = 53;
const std::string MDNS_MULTICAST_IPv4 = "224.0.0.251";

// DNS record types
enum class DnsRecordType : uint16_t {
    A = 1,
    PTR = 12,
    TXT = 16,
    AAAA = 28,
    SRV = 33,
    ANY = 255
};

// DNS record classes
enum class DnsRecordClass : uint16_t {
    CLASS_IN = 1,
    CLASS_IN_UNICAST = 0x8001  // QU bit in questions, cache flush bit in answers
};

// DNS message flags
enum class DnsFlags : uint16_t {
    QUERY = 0x0000,
    RECURSION_DESIRED = 0x0100,
    RESPONSE = 0x8000
};

// DNS message header
struct DnsHeader {
    uint16_t transaction_id;
    uint16_t flags;
    uint16_t question_count;
    uint16_t answer_count;
    uint16_t authority_count;
    uint16_t additional_count;

    DnsHeader() : transaction_id(0), flags(0), question_count(0),
                  answer_count(0), authority_count(0), additional_count(0) {}
};

// DNS question structure
struct DnsQuestion {
    std::string name;
    DnsRecordType type;
    DnsRecordClass record_class;

    DnsQuestion() : type(DnsRecordType::PTR), record_class(DnsRecordClass::CLASS_IN) {}
    DnsQuestion(const std::string& n, DnsRecordType t, DnsRecordClass c)
        : name(n), type(t), record_class(c) {}
};

// DNS resource record structure
struct DnsResourceRecord {
    std::string name;
    DnsRecordType type;
    uint16_t record_class;
    uint32_t ttl;
    std::vector<uint8_t> data;
    size_t data_offset_in_packet;  // Offset of data in original packet for DNS compression

    DnsResourceRecord() : type(DnsRecordType::PTR), record_class(1), ttl(120), data_offset_in_packet(0) {}
};

// Complete DNS message structure
struct DnsMessage {
    DnsHeader header;
    std::vector<DnsQuestion> questions;
    std::vector<DnsResourceRecord> answers;
    std::vector<DnsResourceRecord> authorities;
    std::vector<DnsResourceRecord> additionals;
    std::vector<uint8_t> raw_packet;  // Original packet for DNS compression resolution

    bool is_response() const { return (header.flags & static_cast<uint16_t>(DnsFlags::RESPONSE)) != 0; }
    uint8_t rcode() const { return static_cast<uint8_t>(header.flags & 0x000F); }
};

/**
 * A DNS-SD service instance name split into its parts, e.g.
 * "Studio\032Bridge._clawdis-bridge._tcp.local" ->
 * { "Studio\032Bridge", "_clawdis-bridge._tcp", "local" }.
 * The instance part stays in escaped presentation form.
 */
struct ServiceInstanceName {
    std::string instance;
    std::string service_type;
    std::string domain;

    std::string full_name() const;
};

namespace dns {

// Names are handled in presentation format: labels joined by '.', with '.', '\\'
// and bytes outside printable ASCII inside a label written as "\." "\\" and "\DDD".

std::vector<uint8_t> serialize_message(const DnsMessage& message);
bool deserialize_message(const std::vector<uint8_t>& data, DnsMessage& message);

void write_name(std::vector<uint8_t>& buffer, const std::string& name);
std::string read_name(const std::vector<uint8_t>& buffer, size_t& offset);
bool read_labels(const std::vector<uint8_t>& buffer, size_t& offset, std::vector<std::string>& labels);

std::string escape_label(const std::string& raw_label);
std::vector<std::string> split_name(const std::string& name);
std::string join_labels(const std::vector<std::string>& raw_labels);

/**
 * Compare two names the way DNS does: case-insensitive for ASCII, ignoring a trailing dot.
 */
bool names_equal(const std::string& a, const std::string& b);

/**
 * Split a full service instance name. The service type is the two labels
 * starting with '_' that follow the instance label.
 * @return false if the name does not look like "<instance>._<svc>._<proto>.<domain>"
 */
bool parse_service_instance_name(const std::string& name, ServiceInstanceName& out);

void write_uint16(std::vector<uint8_t>& buffer, uint16_t value);
void write_uint32(std::vector<uint8_t>& buffer, uint32_t value);
uint16_t read_uint16(const std::vector<uint8_t>& buffer, size_t& offset);
uint32_t read_uint32(const std::vector<uint8_t>& buffer, size_t& offset);

// TXT record helpers
std::vector<uint8_t> encode_txt_record(const std::map<std::string, std::string>& txt_data);
std::map<std::string, std::string> decode_txt_record(const std::vector<uint8_t>& txt_data);

// SRV record helpers
std::vector<uint8_t> encode_srv_record(uint16_t priority, uint16_t weight, uint16_t port, const std::string& target);
bool decode_srv_record(const std::vector<uint8_t>& full_packet, size_t data_offset,
                       uint16_t& priority, uint16_t& weight, uint16_t& port, std::string& target);

// A / AAAA helpers
std::string decode_address_record(const DnsResourceRecord& record);

/**
 * Build a single-question query.
 * @param unicast_response Set the mDNS QU bit
 * @param recursion_desired Set RD (unicast DNS to a recursive nameserver)
 */
DnsMessage create_query(const std::string& name, DnsRecordType type, uint16_t transaction_id,
                        bool unicast_response = false, bool recursion_desired = false);

} // namespace dns

} // namespace bridgelink
