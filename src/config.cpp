#include "config.hpp"

#include <boost/property_tree/json_parser.hpp>
#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <fstream>
#include <string_view>

namespace pt = boost::property_tree;
namespace fs = std::filesystem;

namespace upstream_mux {

namespace {

constexpr std::string_view kPreferredFile = "proxies.yaml";

bool has_config_extension(const fs::path& path) {
    const auto ext = path.extension().string();
    return ext == ".yaml" || ext == ".yml" || ext == ".json";
}

pt::ptree yaml_to_ptree(const YAML::Node& node) {
    pt::ptree tree;
    switch (node.Type()) {
        case YAML::NodeType::Scalar:
            tree.put_value(node.Scalar());
            break;
        case YAML::NodeType::Sequence:
            for (const auto& item : node) {
                tree.push_back(pt::ptree::value_type("", yaml_to_ptree(item)));
            }
            break;
        case YAML::NodeType::Map:
            for (const auto& kv : node) {
                tree.push_back(pt::ptree::value_type(kv.first.as<std::string>(), yaml_to_ptree(kv.second)));
            }
            break;
        case YAML::NodeType::Null:
            // Same representation read_json gives a JSON null.
            tree.put_value("null");
            break;
        case YAML::NodeType::Undefined:
        default:
            break;
    }
    return tree;
}

// Absent and null fields both read as unset.
std::optional<std::string> optional_field(const pt::ptree& node, const std::string& key) {
    auto child = node.get_child_optional(key);
    if (!child || !child->empty() || child->data() == "null") return std::nullopt;
    return child->data();
}

std::optional<Rule> parse_rule(const pt::ptree& node, const std::string& proxy_name, std::ostream& log) {
    const auto type = optional_field(node, "type").value_or("");
    if (type == "host_pattern") {
        auto pattern = optional_field(node, "pattern").value_or("");
        if (pattern.empty()) {
            log << "[config] Proxy '" << proxy_name << "': skip host_pattern rule without pattern.\n";
            return std::nullopt;
        }
        try {
            return Rule{make_host_pattern_rule(std::move(pattern))};
        } catch (const boost::regex_error& ex) {
            log << "[config] Proxy '" << proxy_name << "': skip host_pattern rule: " << ex.what() << ".\n";
            return std::nullopt;
        }
    }
    if (type == "port") {
        const auto port = node.get_optional<int>("port");
        if (!port || *port < 1 || *port > 65535) {
            log << "[config] Proxy '" << proxy_name << "': skip port rule with invalid port.\n";
            return std::nullopt;
        }
        return Rule{PortRule{static_cast<uint16_t>(*port)}};
    }
    if (type == "default") {
        return Rule{DefaultRule{}};
    }
    log << "[config] Proxy '" << proxy_name << "': skip rule of unknown type '" << type << "'.\n";
    return std::nullopt;
}

} // namespace

std::optional<fs::path> find_config_file(const fs::path& dir) {
    std::error_code ec;
    const auto preferred = dir / kPreferredFile;
    if (fs::is_regular_file(preferred, ec)) return preferred;

    std::vector<fs::path> files;
    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        std::error_code type_ec;
        if (it->is_regular_file(type_ec) && has_config_extension(it->path())) {
            files.push_back(it->path());
        }
    }
    if (files.empty()) return std::nullopt;
    return *std::min_element(files.begin(), files.end(), [](const fs::path& a, const fs::path& b) {
        return a.filename().string() < b.filename().string();
    });
}

pt::ptree read_config_tree(const fs::path& file) {
    std::ifstream in(file);
    if (!in) {
        throw ConfigError("cannot open " + file.string());
    }
    pt::ptree tree;
    if (file.extension() == ".json") {
        pt::read_json(in, tree);
    } else {
        tree = yaml_to_ptree(YAML::Load(in));
    }
    return tree;
}

std::vector<UpstreamProxy> parse_proxies(const pt::ptree& tree, std::ostream& log) {
    auto proxies_node = tree.get_child_optional("proxies");
    if (!proxies_node) {
        throw ConfigError("no 'proxies' section found");
    }
    if (proxies_node->empty() && !proxies_node->data().empty()) {
        throw ConfigError("'proxies' must be a list, got '" + proxies_node->data() + "'");
    }

    std::vector<UpstreamProxy> proxies;
    std::size_t index = 0;
    for (const auto& entry : *proxies_node) {
        const auto& node = entry.second;
        ++index;
        auto name = optional_field(node, "name");
        auto url = optional_field(node, "url");
        if (!name || !url) {
            throw ConfigError("proxy entry #" + std::to_string(index) + " lacks 'name' or 'url'");
        }

        UpstreamProxy proxy;
        proxy.name = *name;
        proxy.url = *url;
        const int weight = node.get<int>("weight", 1);
        if (weight < 1) {
            log << "[config] Skip proxy '" << proxy.name << "' due to invalid weight " << weight << ".\n";
            continue;
        }
        proxy.weight = static_cast<unsigned>(weight);
        proxy.username = optional_field(node, "username");
        proxy.password = optional_field(node, "password");

        if (auto rules = node.get_child_optional("rules")) {
            for (const auto& rule_entry : *rules) {
                if (auto rule = parse_rule(rule_entry.second, proxy.name, log)) {
                    proxy.rules.push_back(std::move(*rule));
                }
            }
        }
        if (!parse_upstream_url(proxy.url)) {
            log << "[config] Proxy '" << proxy.name << "' has an unusable url '" << proxy.url
                << "'; flows routed to it will go direct.\n";
        }
        proxies.push_back(std::move(proxy));
    }
    return proxies;
}

LoadResult load_registry_file(const fs::path& file, std::ostream& log) {
    LoadResult result;
    result.source = file.string();
    log << "[config] Loading configuration from " << result.source << "\n";
    try {
        auto tree = read_config_tree(file);
        auto proxies = parse_proxies(tree, log);
        result.registry = build_registry(std::move(proxies), result.source, log);
        result.status = LoadStatus::Loaded;
    } catch (const std::exception& ex) {
        result.status = LoadStatus::Failed;
        result.error = ex.what();
        log << "[config] Error loading configuration from " << result.source << ": " << result.error << "\n";
        return result;
    }

    log << "[config] Loaded " << result.registry->candidates.size() << " proxy configurations from "
        << result.source << "\n";
    if (result.registry->default_proxy) {
        log << "[config] Default proxy: " << result.registry->default_proxy->name << "\n";
    }
    return result;
}

LoadResult load_registry(const std::string& config_dir, std::ostream& log) {
    LoadResult result;
    std::error_code ec;
    const fs::path dir(config_dir);
    if (!fs::exists(dir, ec)) {
        log << "[config] Configuration directory " << config_dir << " does not exist\n";
        return result;
    }
    if (!fs::is_directory(dir, ec)) {
        log << "[config] " << config_dir << " is not a directory\n";
        return result;
    }
    auto file = find_config_file(dir);
    if (!file) {
        log << "[config] No configuration files found in " << config_dir << "\n";
        return result;
    }
    return load_registry_file(*file, log);
}

} // namespace upstream_mux
