#pragma once

#include "registry.hpp"
#include "upstream.hpp"

#include <filesystem>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <vector>

#include <boost/property_tree/ptree.hpp>

namespace upstream_mux {

struct ConfigError : public std::runtime_error {
    using std::runtime_error::runtime_error;
};

enum class LoadStatus {
    Loaded,
    NoConfig, // directory missing, not a directory, or holds no config file
    Failed
};

struct LoadResult {
    LoadStatus status = LoadStatus::NoConfig;
    RegistryPtr registry;
    std::string source;
    std::string error;
};

// "proxies.yaml" when present, otherwise the alphabetically first
// *.yaml / *.yml / *.json file in the directory.
std::optional<std::filesystem::path> find_config_file(const std::filesystem::path& dir);

// Parses JSON (by .json extension) or YAML into a property tree. Throws on
// unreadable or malformed input.
boost::property_tree::ptree read_config_tree(const std::filesystem::path& file);

// Extracts the "proxies" list. Throws ConfigError when the key is absent or
// an entry lacks name/url; entries with invalid weights and invalid rules are
// skipped with a log line.
std::vector<UpstreamProxy> parse_proxies(const boost::property_tree::ptree& tree, std::ostream& log);

LoadResult load_registry_file(const std::filesystem::path& file, std::ostream& log);

LoadResult load_registry(const std::string& config_dir, std::ostream& log);

} // namespace upstream_mux
