#include "rule.hpp"

#include <string_view>

namespace upstream_mux {

namespace {

std::string wildcard_to_regex(std::string_view pattern) {
    static constexpr std::string_view kSpecial = R"(.^$|()[]{}+?\)";
    std::string out;
    out.reserve(pattern.size() * 2);
    for (char c : pattern) {
        if (c == '*') {
            out += ".*";
        } else {
            if (kSpecial.find(c) != std::string_view::npos) out += '\\';
            out += c;
        }
    }
    return out;
}

struct RuleMatcher {
    const FlowView& flow;

    bool operator()(const HostPatternRule& rule) const {
        if (rule.pattern.empty() || !flow.target_host) return false;
        return boost::regex_search(*flow.target_host, rule.compiled);
    }

    bool operator()(const PortRule& rule) const {
        if (rule.port == 0 || !flow.target_port) return false;
        return *flow.target_port == rule.port;
    }

    bool operator()(const DefaultRule&) const { return true; }
};

struct RuleDescriber {
    std::string operator()(const HostPatternRule& rule) const {
        return "host_pattern(" + rule.pattern + ")";
    }
    std::string operator()(const PortRule& rule) const {
        return "port(" + std::to_string(rule.port) + ")";
    }
    std::string operator()(const DefaultRule&) const { return "default"; }
};

} // namespace

HostPatternRule make_host_pattern_rule(std::string pattern) {
    HostPatternRule rule;
    if (!pattern.empty()) rule.compiled = boost::regex(wildcard_to_regex(pattern));
    rule.pattern = std::move(pattern);
    return rule;
}

bool rule_matches(const Rule& rule, const FlowView& flow) {
    return std::visit(RuleMatcher{flow}, rule);
}

bool is_default_rule(const Rule& rule) {
    return std::holds_alternative<DefaultRule>(rule);
}

std::string describe_rule(const Rule& rule) {
    return std::visit(RuleDescriber{}, rule);
}

} // namespace upstream_mux
