#include <gtest/gtest.h>
#include "gateway_txt.h"

using namespace bridgelink;

TEST(GatewayTxtTest, ParsesAllKnownKeys) {
    TxtRecord txt = {
        {"displayName", "  Studio Bridge  "},
        {"lanHost", "studio.local"},
        {"tailnetDns", "studio.tailnet-1234.ts.net"},
        {"gatewayPort", "18789"},
        {"bridgePort", "18790"},
        {"canvasPort", "18793"},
        {"cliPath", "/usr/local/bin/clawdis"},
        {"sshPort", " 2222 "},
    };

    GatewayTxt parsed = parse_gateway_txt(txt);
    EXPECT_EQ(parsed.display_name, std::optional<std::string>("Studio Bridge"));
    EXPECT_EQ(parsed.lan_host, std::optional<std::string>("studio.local"));
    EXPECT_EQ(parsed.tailnet_dns, std::optional<std::string>("studio.tailnet-1234.ts.net"));
    EXPECT_EQ(parsed.gateway_port, std::optional<int>(18789));
    EXPECT_EQ(parsed.bridge_port, std::optional<int>(18790));
    EXPECT_EQ(parsed.canvas_port, std::optional<int>(18793));
    EXPECT_EQ(parsed.cli_path, std::optional<std::string>("/usr/local/bin/clawdis"));
    EXPECT_EQ(parsed.ssh_port, 2222);
}

TEST(GatewayTxtTest, BlankAndInvalidValuesAreAbsent) {
    TxtRecord txt = {
        {"displayName", "   "},
        {"lanHost", ""},
        {"gatewayPort", "abc"},
        {"bridgePort", "18790x"},
        {"sshPort", "0"},
    };

    GatewayTxt parsed = parse_gateway_txt(txt);
    EXPECT_FALSE(parsed.display_name.has_value());
    EXPECT_FALSE(parsed.lan_host.has_value());
    EXPECT_FALSE(parsed.tailnet_dns.has_value());
    EXPECT_FALSE(parsed.gateway_port.has_value());
    EXPECT_FALSE(parsed.bridge_port.has_value());
    EXPECT_EQ(parsed.ssh_port, DEFAULT_SSH_PORT);
}

TEST(GatewayTxtTest, ResolvedTxtWinsOnConflict) {
    TxtRecord inline_txt = {{"lanHost", "old.local"}, {"displayName", "Studio"}};
    TxtRecord resolved = {{"lanHost", "studio.local"}, {"bridgePort", "18790"}};

    TxtRecord merged = merge_txt(inline_txt, resolved);
    EXPECT_EQ(merged.size(), 3u);
    EXPECT_EQ(merged["lanHost"], "studio.local");
    EXPECT_EQ(merged["displayName"], "Studio");
    EXPECT_EQ(merged["bridgePort"], "18790");
}

TEST(GatewayTxtTest, PrettifyInstanceName) {
    EXPECT_EQ(prettify_instance_name("Studio   Bridge"), "Studio Bridge");
    EXPECT_EQ(prettify_instance_name("Peter's Mac (Clawdis)"), "Peter's Mac");
    EXPECT_EQ(prettify_instance_name("Peter's Mac (Clawdis) (2)"), "Peter's Mac");
    EXPECT_EQ(prettify_instance_name("  Office (3) "), "Office");
    EXPECT_EQ(prettify_instance_name("Build (2) Box"), "Build (2) Box");
}

TEST(GatewayTxtTest, PrettifyServiceName) {
    EXPECT_EQ(prettify_service_name("studio-bridge"), "Studio");
    EXPECT_EQ(prettify_service_name("my_home-gateway"), "My Home Gateway");
    EXPECT_EQ(prettify_service_name("Peter's Mac (Clawdis)"), "Peter's Mac");
    EXPECT_EQ(prettify_service_name("office bridge (2)"), "Office");
    EXPECT_EQ(prettify_service_name("bridge"), "Bridge");
}

TEST(GatewayTxtTest, BuildSshTarget) {
    EXPECT_EQ(build_ssh_target("peter", "studio.local", 22), "peter@studio.local");
    EXPECT_EQ(build_ssh_target("peter", "studio.local", 2222), "peter@studio.local:2222");
}

TEST(GatewayTxtTest, ParseIntStrict) {
    int value = 0;
    EXPECT_TRUE(parse_int_strict("18789", value));
    EXPECT_EQ(value, 18789);
    EXPECT_TRUE(parse_int_strict("+5", value));
    EXPECT_EQ(value, 5);
    EXPECT_TRUE(parse_int_strict("-1", value));
    EXPECT_EQ(value, -1);

    value = 7;
    EXPECT_FALSE(parse_int_strict("", value));
    EXPECT_FALSE(parse_int_strict("-", value));
    EXPECT_FALSE(parse_int_strict("12a", value));
    EXPECT_FALSE(parse_int_strict(" 12", value));
    EXPECT_FALSE(parse_int_strict("99999999999", value));
    EXPECT_EQ(value, 7);
}

TEST(GatewayTxtTest, WhitespaceHelpers) {
    EXPECT_EQ(trim_whitespace(" \t studio \r\n"), "studio");
    EXPECT_EQ(trim_whitespace("   "), "");
    EXPECT_EQ(to_lower_ascii("Studio.LOCAL"), "studio.local");
}
