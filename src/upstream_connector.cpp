#include "upstream_connector.hpp"

#include <iostream>
#include <string_view>
#include <utility>

namespace upstream_mux {

UpstreamConnector::UpstreamConnector(boost::asio::any_io_executor executor,
                                     RoutingDecision decision,
                                     std::string target_host,
                                     std::uint16_t target_port)
    : strand_(std::move(executor)),
      resolver_(strand_),
      socket_(strand_),
      decision_(std::move(decision)),
      target_host_(std::move(target_host)),
      target_port_(target_port) {
    label_ = decision_.via.scheme + "://" + decision_.via.host + ":" + std::to_string(decision_.via.port);
}

void UpstreamConnector::start(Handler handler) {
    handler_ = std::move(handler);
    resolver_.async_resolve(
        decision_.via.host,
        std::to_string(decision_.via.port),
        boost::asio::bind_executor(strand_, [self = shared_from_this()](auto ec, auto endpoints) {
            self->on_resolve(ec, endpoints);
        }));
}

void UpstreamConnector::on_resolve(const boost::system::error_code& ec,
                                   const tcp::resolver::results_type& endpoints) {
    if (ec) {
        finish(false, "resolve error for " + label_ + ": " + ec.message());
        return;
    }
    if (endpoints.empty()) {
        finish(false, "resolve returned no endpoints for " + label_);
        return;
    }
    boost::asio::async_connect(
        socket_,
        endpoints,
        boost::asio::bind_executor(strand_, [self = shared_from_this()](auto connect_ec, auto) {
            self->on_connect(connect_ec);
        }));
}

void UpstreamConnector::on_connect(const boost::system::error_code& ec) {
    if (ec) {
        finish(false, "connect error to " + label_ + ": " + ec.message());
        return;
    }
    if (!is_tunnel_scheme(decision_.via.scheme)) {
        finish(true, {});
        return;
    }
    handshake_.emplace(target_host_, target_port_, decision_.tunnel_credentials);
    handle_outcome(handshake_->start());
}

void UpstreamConnector::handle_outcome(HandshakeOutcome outcome) {
    switch (outcome.kind) {
        case HandshakeOutcome::Kind::Emit:
            do_write(std::move(outcome.bytes));
            break;
        case HandshakeOutcome::Kind::NeedMore:
            do_read();
            break;
        case HandshakeOutcome::Kind::Done:
            finish(true, {}, std::move(outcome.bytes));
            break;
        case HandshakeOutcome::Kind::Failed:
            finish(false, outcome.error);
            break;
    }
}

void UpstreamConnector::do_write(Bytes bytes) {
    write_buffer_ = std::move(bytes);
    boost::asio::async_write(
        socket_,
        boost::asio::buffer(write_buffer_),
        boost::asio::bind_executor(strand_, [self = shared_from_this()](auto ec, auto) {
            if (ec) {
                self->finish(false, "write to " + self->label_ + " failed: " + ec.message());
                return;
            }
            // The upstream may have sent more than one message in a single read.
            if (self->handshake_->buffered() > 0) {
                self->handle_outcome(self->handshake_->feed({}));
            } else {
                self->do_read();
            }
        }));
}

void UpstreamConnector::do_read() {
    socket_.async_read_some(
        boost::asio::buffer(read_buffer_),
        boost::asio::bind_executor(strand_, [self = shared_from_this()](auto ec, auto len) {
            if (ec) {
                if (ec == boost::asio::error::eof) {
                    self->finish(false, "upstream " + self->label_ + " closed the connection during the SOCKS5 handshake");
                } else {
                    self->finish(false, "read from " + self->label_ + " failed: " + ec.message());
                }
                return;
            }
            self->handle_outcome(self->handshake_->feed(std::string_view(self->read_buffer_.data(), len)));
        }));
}

void UpstreamConnector::finish(bool ok, std::string error, Bytes leftover) {
    if (finished_) return;
    finished_ = true;

    if (ok) {
        std::cout << "[connector] Connected to " << target_host_ << ":" << target_port_
                  << " via " << decision_.proxy->name << " (" << label_ << ")\n";
    } else {
        std::cerr << "[connector] " << target_host_ << ":" << target_port_ << " via "
                  << decision_.proxy->name << ": " << error << "\n";
        boost::system::error_code ignored;
        if (socket_.is_open()) {
            socket_.shutdown(tcp::socket::shutdown_both, ignored);
            socket_.close(ignored);
        }
    }

    auto handler = std::move(handler_);
    handler_ = nullptr;
    if (handler) {
        handler(ConnectResult{ok, std::move(error), std::move(socket_), std::move(leftover)});
    }
}

} // namespace upstream_mux
