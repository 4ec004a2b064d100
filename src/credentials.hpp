#pragma once

#include "upstream.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace upstream_mux {

struct Credentials {
    std::string username;
    std::string password;
};

// URL-embedded credentials win; the explicit username/password fields are the
// fallback. Yields nothing unless both a username and a password are known.
std::optional<Credentials> resolve_credentials(const UpstreamProxy& proxy);

std::string base64_encode(std::string_view input);

// Value for a Proxy-Authorization header: "Basic <base64(user:pass)>".
std::string basic_proxy_authorization(const Credentials& creds);

} // namespace upstream_mux
