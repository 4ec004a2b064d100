#include "rule.hpp"
#include "upstream.hpp"
#include "test_common.hpp"

using namespace upstream_mux;

namespace {

FlowView flow_to(std::optional<std::string> host, std::optional<uint16_t> port = 443) {
    FlowView flow;
    flow.target_host = std::move(host);
    flow.target_port = port;
    flow.client_address = "192.0.2.10";
    return flow;
}

} // namespace

int main() {
    auto test_host_pattern_wildcard = [] {
        Rule rule = make_host_pattern_rule("*.example.com");
        EXPECT_TRUE(rule_matches(rule, flow_to("www.example.com")));
        EXPECT_TRUE(rule_matches(rule, flow_to("api.example.com")));
        EXPECT_TRUE(rule_matches(rule, flow_to("a.b.example.com")));
        EXPECT_FALSE(rule_matches(rule, flow_to("other.com")));
        EXPECT_FALSE(rule_matches(rule, flow_to("example.com")));
    };

    auto test_host_pattern_is_unanchored = [] {
        Rule rule = make_host_pattern_rule("example.com");
        EXPECT_TRUE(rule_matches(rule, flow_to("example.com")));
        EXPECT_TRUE(rule_matches(rule, flow_to("evil-example.com.attacker.net")));
        EXPECT_FALSE(rule_matches(rule, flow_to("example.org")));
    };

    auto test_host_pattern_escapes_literals = [] {
        Rule rule = make_host_pattern_rule("a.b");
        EXPECT_TRUE(rule_matches(rule, flow_to("x.a.b.y")));
        EXPECT_FALSE(rule_matches(rule, flow_to("axb")));

        Rule special = make_host_pattern_rule("(api)+[1]");
        EXPECT_TRUE(rule_matches(special, flow_to("x(api)+[1]y")));
        EXPECT_FALSE(rule_matches(special, flow_to("apiapi1")));
    };

    auto test_host_pattern_middle_wildcard = [] {
        Rule rule = make_host_pattern_rule("api*.internal");
        EXPECT_TRUE(rule_matches(rule, flow_to("api-7.eu.internal")));
        EXPECT_TRUE(rule_matches(rule, flow_to("api.internal")));
        EXPECT_FALSE(rule_matches(rule, flow_to("internal.api")));
    };

    auto test_host_pattern_missing_host = [] {
        Rule rule = make_host_pattern_rule("*");
        EXPECT_TRUE(rule_matches(rule, flow_to("anything")));
        EXPECT_FALSE(rule_matches(rule, flow_to(std::nullopt)));
        Rule empty = make_host_pattern_rule("");
        EXPECT_FALSE(rule_matches(empty, flow_to("anything")));
    };

    auto test_port_rule = [] {
        Rule rule = PortRule{443};
        EXPECT_TRUE(rule_matches(rule, flow_to("h", 443)));
        EXPECT_FALSE(rule_matches(rule, flow_to("h", 80)));
        EXPECT_FALSE(rule_matches(rule, flow_to("h", std::nullopt)));
    };

    auto test_default_rule = [] {
        Rule rule = DefaultRule{};
        EXPECT_TRUE(rule_matches(rule, flow_to("h")));
        EXPECT_TRUE(rule_matches(rule, flow_to(std::nullopt, std::nullopt)));
        EXPECT_TRUE(is_default_rule(rule));
        EXPECT_FALSE(is_default_rule(Rule{PortRule{1}}));
    };

    auto test_proxy_matches_any_rule = [] {
        UpstreamProxy proxy;
        proxy.name = "p";
        proxy.rules = {make_host_pattern_rule("*.google.com"), PortRule{8443}};
        EXPECT_TRUE(proxy_matches(proxy, flow_to("www.google.com", 80)));
        EXPECT_TRUE(proxy_matches(proxy, flow_to("example.org", 8443)));
        EXPECT_FALSE(proxy_matches(proxy, flow_to("example.org", 443)));

        UpstreamProxy no_rules;
        no_rules.name = "empty";
        EXPECT_FALSE(proxy_matches(no_rules, flow_to("www.google.com")));
        EXPECT_FALSE(is_default_proxy(no_rules));
    };

    auto test_describe = [] {
        EXPECT_EQ(describe_rule(make_host_pattern_rule("*.x")), "host_pattern(*.x)");
        EXPECT_EQ(describe_rule(PortRule{80}), "port(80)");
        EXPECT_EQ(describe_rule(DefaultRule{}), "default");
    };

    return run_tests({
        {"host_pattern_wildcard", test_host_pattern_wildcard},
        {"host_pattern_is_unanchored", test_host_pattern_is_unanchored},
        {"host_pattern_escapes_literals", test_host_pattern_escapes_literals},
        {"host_pattern_middle_wildcard", test_host_pattern_middle_wildcard},
        {"host_pattern_missing_host", test_host_pattern_missing_host},
        {"port_rule", test_port_rule},
        {"default_rule", test_default_rule},
        {"proxy_matches_any_rule", test_proxy_matches_any_rule},
        {"describe", test_describe},
    });
}
