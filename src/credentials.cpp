#include "credentials.hpp"

#include <boost/archive/iterators/base64_from_binary.hpp>
#include <boost/archive/iterators/transform_width.hpp>

namespace upstream_mux {

namespace {

namespace it = boost::archive::iterators;
using Base64Iterator = it::base64_from_binary<it::transform_width<std::string_view::const_iterator, 6, 8>>;

} // namespace

std::optional<Credentials> resolve_credentials(const UpstreamProxy& proxy) {
    Credentials creds;
    auto parsed = parse_upstream_url(proxy.url);
    if (parsed && !parsed->username.empty()) {
        creds.username = parsed->username;
        creds.password = parsed->password;
    } else {
        creds.username = proxy.username.value_or(std::string{});
        creds.password = proxy.password.value_or(std::string{});
    }
    if (creds.username.empty() || creds.password.empty()) return std::nullopt;
    return creds;
}

std::string base64_encode(std::string_view input) {
    std::string out(Base64Iterator(input.begin()), Base64Iterator(input.end()));
    out.append((3 - input.size() % 3) % 3, '=');
    return out;
}

std::string basic_proxy_authorization(const Credentials& creds) {
    return "Basic " + base64_encode(creds.username + ":" + creds.password);
}

} // namespace upstream_mux
