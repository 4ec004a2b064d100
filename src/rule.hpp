#pragma once

#include "flow.hpp"

#include <cstdint>
#include <string>
#include <variant>

#include <boost/regex.hpp>

namespace upstream_mux {

struct HostPatternRule {
    std::string pattern;
    boost::regex compiled;
};

struct PortRule {
    uint16_t port = 0;
};

// Unconditional match; marks the owning upstream as the fallback.
struct DefaultRule {};

using Rule = std::variant<HostPatternRule, PortRule, DefaultRule>;

// '*' becomes ".*", every other character is matched literally. The result
// is searched for anywhere in the host, it is not anchored.
HostPatternRule make_host_pattern_rule(std::string pattern);

bool rule_matches(const Rule& rule, const FlowView& flow);

bool is_default_rule(const Rule& rule);

// "host_pattern(*.example.com)", "port(443)", "default"
std::string describe_rule(const Rule& rule);

} // namespace upstream_mux
