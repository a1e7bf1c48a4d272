#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "dns_message.h"

using namespace bridgelink;
using ::testing::ElementsAre;

TEST(DnsMessageTest, EscapeLabelUsesPresentationForm) {
    EXPECT_EQ(dns::escape_label("Studio Bridge"), "Studio\\032Bridge");
    EXPECT_EQ(dns::escape_label("a.b"), "a\\.b");
    EXPECT_EQ(dns::escape_label("back\\slash"), "back\\\\slash");
    EXPECT_EQ(dns::escape_label("plain"), "plain");
}

TEST(DnsMessageTest, SplitNameUnescapesLabels) {
    EXPECT_THAT(dns::split_name("Studio\\032Bridge._clawdis-bridge._tcp.local."),
                ElementsAre("Studio Bridge", "_clawdis-bridge", "_tcp", "local"));
    EXPECT_THAT(dns::split_name("a\\.b.example"), ElementsAre("a.b", "example"));
    EXPECT_TRUE(dns::split_name("").empty());
}

TEST(DnsMessageTest, JoinLabelsEscapesAgain) {
    std::vector<std::string> labels = {"Studio Bridge", "_clawdis-bridge", "_tcp", "local"};
    EXPECT_EQ(dns::join_labels(labels), "Studio\\032Bridge._clawdis-bridge._tcp.local");
}

TEST(DnsMessageTest, NamesEqualIgnoresCaseAndTrailingDot) {
    EXPECT_TRUE(dns::names_equal("Studio._clawdis-bridge._tcp.local.", "studio._CLAWDIS-bridge._tcp.local"));
    EXPECT_TRUE(dns::names_equal("Studio\\032Bridge.local", "studio bridge.local"));
    EXPECT_TRUE(dns::names_equal("Studio\\032Bridge.local", "STUDIO\\032BRIDGE.local."));
    EXPECT_FALSE(dns::names_equal("studio.local", "studio.lan"));
    EXPECT_FALSE(dns::names_equal("studio.local", "studio.local.extra"));
}

TEST(DnsMessageTest, ParseServiceInstanceName) {
    ServiceInstanceName name;
    ASSERT_TRUE(dns::parse_service_instance_name("Studio\\032Bridge._clawdis-bridge._tcp.local.", name));
    EXPECT_EQ(name.instance, "Studio\\032Bridge");
    EXPECT_EQ(name.service_type, "_clawdis-bridge._tcp");
    EXPECT_EQ(name.domain, "local");
    EXPECT_EQ(name.full_name(), "Studio\\032Bridge._clawdis-bridge._tcp.local");
}

TEST(DnsMessageTest, ParseServiceInstanceNameKeepsDotsInInstance) {
    ServiceInstanceName name;
    ASSERT_TRUE(dns::parse_service_instance_name("v1\\.2 Bridge._clawdis-bridge._tcp.tailnet.example.", name));
    EXPECT_EQ(name.instance, "v1\\.2\\032Bridge");
    EXPECT_EQ(name.domain, "tailnet.example");
}

TEST(DnsMessageTest, ParseServiceInstanceNameRejectsNonServiceNames) {
    ServiceInstanceName name;
    EXPECT_FALSE(dns::parse_service_instance_name("studio.local", name));
    EXPECT_FALSE(dns::parse_service_instance_name("_clawdis-bridge._tcp.local", name));
    EXPECT_FALSE(dns::parse_service_instance_name("Studio._clawdis-bridge._sctp.local", name));
}

TEST(DnsMessageTest, QueryRoundTrip) {
    DnsMessage query = dns::create_query("_clawdis-bridge._tcp.local", DnsRecordType::PTR, 0x1234, true, false);
    std::vector<uint8_t> wire = dns::serialize_message(query);

    DnsMessage parsed;
    ASSERT_TRUE(dns::deserialize_message(wire, parsed));
    EXPECT_EQ(parsed.header.transaction_id, 0x1234);
    EXPECT_FALSE(parsed.is_response());
    ASSERT_EQ(parsed.questions.size(), 1u);
    EXPECT_EQ(parsed.questions[0].name, "_clawdis-bridge._tcp.local");
    EXPECT_EQ(parsed.questions[0].type, DnsRecordType::PTR);
    EXPECT_EQ(parsed.questions[0].record_class, DnsRecordClass::CLASS_IN_UNICAST);
}

TEST(DnsMessageTest, RecursionDesiredQuery) {
    DnsMessage query = dns::create_query("example", DnsRecordType::TXT, 7, false, true);
    EXPECT_EQ(query.header.flags, static_cast<uint16_t>(DnsFlags::RECURSION_DESIRED));
    EXPECT_EQ(query.questions[0].record_class, DnsRecordClass::CLASS_IN);
}

TEST(DnsMessageTest, SrvTargetFollowsCompressionPointer) {
    DnsMessage response;
    response.header.flags = static_cast<uint16_t>(DnsFlags::RESPONSE);
    response.questions.emplace_back("studio.local", DnsRecordType::SRV, DnsRecordClass::CLASS_IN);

    DnsResourceRecord srv;
    srv.name = "Studio._clawdis-bridge._tcp.local";
    srv.type = DnsRecordType::SRV;
    srv.ttl = 120;
    // priority 0, weight 0, port 18790, target -> pointer to the question name at offset 12
    srv.data = {0x00, 0x00, 0x00, 0x00, 0x49, 0x66, 0xC0, 0x0C};
    response.answers.push_back(srv);

    DnsMessage parsed;
    ASSERT_TRUE(dns::deserialize_message(dns::serialize_message(response), parsed));
    ASSERT_TRUE(parsed.is_response());
    ASSERT_EQ(parsed.answers.size(), 1u);

    uint16_t priority = 1, weight = 1, port = 0;
    std::string target;
    ASSERT_TRUE(dns::decode_srv_record(parsed.raw_packet, parsed.answers[0].data_offset_in_packet,
                                       priority, weight, port, target));
    EXPECT_EQ(priority, 0);
    EXPECT_EQ(weight, 0);
    EXPECT_EQ(port, 18790);
    EXPECT_EQ(target, "studio.local");
}

TEST(DnsMessageTest, CompressionLoopIsRejected) {
    // Header with one question whose name is a pointer to itself
    std::vector<uint8_t> packet = {0x00, 0x01, 0x80, 0x00, 0x00, 0x01, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
                                   0xC0, 0x0C, 0x00, 0x0C, 0x00, 0x01};
    DnsMessage parsed;
    EXPECT_FALSE(dns::deserialize_message(packet, parsed));
}

TEST(DnsMessageTest, TruncatedMessageIsRejected) {
    DnsMessage query = dns::create_query("_clawdis-bridge._tcp.local", DnsRecordType::PTR, 1);
    std::vector<uint8_t> wire = dns::serialize_message(query);
    wire.resize(wire.size() - 3);

    DnsMessage parsed;
    EXPECT_FALSE(dns::deserialize_message(wire, parsed));
    EXPECT_FALSE(dns::deserialize_message(std::vector<uint8_t>(5, 0), parsed));
}

TEST(DnsMessageTest, TxtDecodingRules) {
    std::vector<uint8_t> data;
    auto add = [&data](const std::string& entry) {
        data.push_back(static_cast<uint8_t>(entry.size()));
        data.insert(data.end(), entry.begin(), entry.end());
    };
    add("lanHost=studio.local");
    add("lanHost=ignored.local");
    add("=novalue");
    add("flag");
    add("displayName=Studio=Main");

    std::map<std::string, std::string> txt = dns::decode_txt_record(data);
    EXPECT_EQ(txt.size(), 3u);
    EXPECT_EQ(txt["lanHost"], "studio.local");
    EXPECT_EQ(txt["flag"], "");
    EXPECT_EQ(txt["displayName"], "Studio=Main");
}

TEST(DnsMessageTest, TxtDecodingStopsAtTruncatedEntry) {
    std::vector<uint8_t> data = {5, 'a', '=', '1', '2', '3', 10, 'b', '='};
    std::map<std::string, std::string> txt = dns::decode_txt_record(data);
    EXPECT_EQ(txt.size(), 1u);
    EXPECT_EQ(txt["a"], "123");
}

TEST(DnsMessageTest, EmptyTxtRecordEncodesSingleZeroByte) {
    EXPECT_EQ(dns::encode_txt_record({}), std::vector<uint8_t>{0});
    EXPECT_TRUE(dns::decode_txt_record({0}).empty());
}

TEST(DnsMessageTest, AddressRecords) {
    DnsResourceRecord a;
    a.type = DnsRecordType::A;
    a.data = {192, 168, 1, 20};
    EXPECT_EQ(dns::decode_address_record(a), "192.168.1.20");

    DnsResourceRecord aaaa;
    aaaa.type = DnsRecordType::AAAA;
    aaaa.data.assign(16, 0);
    aaaa.data[15] = 1;
    EXPECT_EQ(dns::decode_address_record(aaaa), "::1");

    a.data.pop_back();
    EXPECT_EQ(dns::decode_address_record(a), "");
}
