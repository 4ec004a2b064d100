#pragma once

#include "multi_upstream.hpp"
#include "socks5_handshake.hpp"

#include <array>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include <boost/asio.hpp>

namespace upstream_mux {

struct ConnectResult {
    bool ok = false;
    std::string error;
    boost::asio::ip::tcp::socket socket;
    // Bytes that arrived after the CONNECT reply; they belong to the upper layer.
    Bytes leftover;
};

// Opens the connection a RoutingDecision points at. For socks5 upstreams the
// tunnel to (target_host, target_port) is negotiated before completion.
class UpstreamConnector : public std::enable_shared_from_this<UpstreamConnector> {
public:
    using Handler = std::function<void(ConnectResult)>;

    UpstreamConnector(boost::asio::any_io_executor executor,
                      RoutingDecision decision,
                      std::string target_host,
                      std::uint16_t target_port);

    void start(Handler handler);

private:
    using tcp = boost::asio::ip::tcp;
    using Strand = boost::asio::strand<boost::asio::any_io_executor>;

    void on_resolve(const boost::system::error_code& ec, const tcp::resolver::results_type& endpoints);
    void on_connect(const boost::system::error_code& ec);
    void handle_outcome(HandshakeOutcome outcome);
    void do_write(Bytes bytes);
    void do_read();
    void finish(bool ok, std::string error, Bytes leftover = {});

    Strand strand_;
    tcp::resolver resolver_;
    tcp::socket socket_;
    RoutingDecision decision_;
    std::string target_host_;
    std::uint16_t target_port_;
    std::string label_;
    std::optional<Socks5Handshake> handshake_;
    std::array<char, 512> read_buffer_{};
    Bytes write_buffer_;
    Handler handler_;
    bool finished_ = false;
};

} // namespace upstream_mux
