#include "socks5_handshake.hpp"

#include <boost/asio/ip/address.hpp>

#include <utility>

namespace upstream_mux {

namespace socks5 {

std::string reply_message(std::uint8_t code) {
    switch (code) {
        case 0x00: return "Succeeded";
        case 0x01: return "General failure";
        case 0x02: return "Connection not allowed";
        case 0x03: return "Network unreachable";
        case 0x04: return "Host unreachable";
        case 0x05: return "Connection refused";
        case 0x06: return "TTL expired";
        case 0x07: return "Command not supported";
        case 0x08: return "Address type not supported";
        default: return "Unknown error code: " + std::to_string(code);
    }
}

} // namespace socks5

namespace {

void append_port(Bytes& out, std::uint16_t port) {
    out.push_back(static_cast<std::uint8_t>(port >> 8));
    out.push_back(static_cast<std::uint8_t>(port & 0xFF));
}

void append_field(Bytes& out, std::string_view value) {
    out.push_back(static_cast<std::uint8_t>(value.size()));
    out.insert(out.end(), value.begin(), value.end());
}

} // namespace

const char* to_string(HandshakeState state) {
    switch (state) {
        case HandshakeState::Idle: return "idle";
        case HandshakeState::Greeting: return "greeting";
        case HandshakeState::Authenticating: return "authenticating";
        case HandshakeState::Connecting: return "connecting";
        case HandshakeState::Established: return "established";
        case HandshakeState::Failed: return "failed";
    }
    return "unknown";
}

Bytes build_greeting(bool offer_user_password) {
    if (offer_user_password) {
        return {socks5::kVersion, 2, socks5::kMethodNoAuth, socks5::kMethodUserPassword};
    }
    return {socks5::kVersion, 1, socks5::kMethodNoAuth};
}

std::optional<Bytes> build_connect_request(std::string_view host, std::uint16_t port) {
    Bytes request{socks5::kVersion, socks5::kCmdConnect, 0x00};
    const std::string host_str(host);

    boost::system::error_code ec;
    const auto v4 = boost::asio::ip::make_address_v4(host_str, ec);
    if (!ec) {
        const auto bytes = v4.to_bytes();
        request.push_back(socks5::kAtypIpv4);
        request.insert(request.end(), bytes.begin(), bytes.end());
    } else {
        const auto v6 = boost::asio::ip::make_address_v6(host_str, ec);
        if (!ec) {
            const auto bytes = v6.to_bytes();
            request.push_back(socks5::kAtypIpv6);
            request.insert(request.end(), bytes.begin(), bytes.end());
        } else {
            if (host.empty() || host.size() > socks5::kMaxFieldLength) return std::nullopt;
            // Domain names go out as ASCII; IDNs must arrive punycode-encoded.
            for (unsigned char c : host) {
                if (c > 0x7F) return std::nullopt;
            }
            request.push_back(socks5::kAtypDomain);
            append_field(request, host);
        }
    }
    append_port(request, port);
    return request;
}

Socks5Handshake::Socks5Handshake(std::string target_host,
                                 std::uint16_t target_port,
                                 std::optional<Credentials> credentials)
    : target_host_(std::move(target_host)),
      target_port_(target_port),
      credentials_(std::move(credentials)) {}

HandshakeOutcome Socks5Handshake::start() {
    if (state_ != HandshakeState::Idle) {
        return fail("SOCKS5 handshake already started");
    }
    if (credentials_ && (credentials_->username.size() > socks5::kMaxFieldLength ||
                         credentials_->password.size() > socks5::kMaxFieldLength)) {
        return fail("SOCKS5 username and password must be at most 255 bytes each");
    }
    if (!build_connect_request(target_host_, target_port_)) {
        return fail("SOCKS5 target host '" + target_host_ + "' cannot be encoded");
    }
    return emit(build_greeting(credentials_.has_value()), HandshakeState::Greeting);
}

HandshakeOutcome Socks5Handshake::feed(std::string_view data) {
    if (state_ == HandshakeState::Established) {
        HandshakeOutcome outcome;
        outcome.kind = HandshakeOutcome::Kind::Failed;
        outcome.state = state_;
        outcome.error = "SOCKS5 handshake already established";
        return outcome;
    }
    if (state_ == HandshakeState::Failed) {
        HandshakeOutcome outcome;
        outcome.kind = HandshakeOutcome::Kind::Failed;
        outcome.state = state_;
        outcome.error = error_;
        return outcome;
    }
    if (state_ == HandshakeState::Idle) {
        return fail("SOCKS5 handshake received data before start");
    }

    buffer_.insert(buffer_.end(), data.begin(), data.end());

    switch (state_) {
        case HandshakeState::Greeting: return on_greeting_reply();
        case HandshakeState::Authenticating: return on_auth_reply();
        case HandshakeState::Connecting: return on_connect_reply();
        default: break;
    }
    return fail(std::string("Unknown SOCKS5 state: ") + to_string(state_));
}

HandshakeOutcome Socks5Handshake::on_greeting_reply() {
    if (buffer_.size() < 2) return need_more();

    if (buffer_[0] != socks5::kVersion) {
        return fail("Invalid SOCKS version. Expected " + std::to_string(socks5::kVersion) +
                    ", got " + std::to_string(buffer_[0]));
    }

    const auto method = buffer_[1];
    if (method == socks5::kMethodNoAcceptable) {
        return fail("SOCKS5 upstream accepted none of the offered authentication methods");
    }
    if (method == socks5::kMethodUserPassword) {
        if (!credentials_) {
            return fail("SOCKS5 upstream requires authentication, but no credentials are configured");
        }
        consume(2);
        return emit(build_auth_request(), HandshakeState::Authenticating);
    }
    if (method == socks5::kMethodNoAuth) {
        consume(2);
        return emit(*build_connect_request(target_host_, target_port_), HandshakeState::Connecting);
    }
    return fail("Unsupported SOCKS5 authentication method: " + std::to_string(method));
}

HandshakeOutcome Socks5Handshake::on_auth_reply() {
    if (buffer_.size() < 2) return need_more();

    if (buffer_[0] != socks5::kAuthVersion) {
        return fail("Invalid authentication subnegotiation version. Expected 1, got " +
                    std::to_string(buffer_[0]));
    }
    if (buffer_[1] != 0x00) {
        return fail("SOCKS5 authentication failed with status: " + std::to_string(buffer_[1]));
    }
    consume(2);
    return emit(*build_connect_request(target_host_, target_port_), HandshakeState::Connecting);
}

HandshakeOutcome Socks5Handshake::on_connect_reply() {
    // VER REP RSV ATYP
    if (buffer_.size() < 4) return need_more();

    if (buffer_[0] != socks5::kVersion) {
        return fail("Invalid SOCKS version in reply. Expected " + std::to_string(socks5::kVersion) +
                    ", got " + std::to_string(buffer_[0]));
    }
    const auto reply = buffer_[1];
    if (reply != socks5::kReplySucceeded) {
        return fail("SOCKS5 upstream refused CONNECT to " + target_host_ + ":" +
                    std::to_string(target_port_) + ": " + socks5::reply_message(reply));
    }
    if (buffer_[2] != 0x00) {
        return fail("Invalid reserved byte in SOCKS5 reply: " + std::to_string(buffer_[2]));
    }

    std::size_t total = 0;
    switch (buffer_[3]) {
        case socks5::kAtypIpv4:
            total = 4 + 4 + 2;
            break;
        case socks5::kAtypIpv6:
            total = 4 + 16 + 2;
            break;
        case socks5::kAtypDomain:
            if (buffer_.size() < 5) return need_more();
            total = 4 + 1 + buffer_[4] + 2;
            break;
        default:
            return fail("Unsupported address type in SOCKS5 reply: " + std::to_string(buffer_[3]));
    }
    if (buffer_.size() < total) return need_more();

    consume(total);
    state_ = HandshakeState::Established;

    HandshakeOutcome outcome;
    outcome.kind = HandshakeOutcome::Kind::Done;
    outcome.state = state_;
    outcome.bytes = std::move(buffer_);
    buffer_.clear();
    return outcome;
}

HandshakeOutcome Socks5Handshake::emit(Bytes bytes, HandshakeState next) {
    state_ = next;
    HandshakeOutcome outcome;
    outcome.kind = HandshakeOutcome::Kind::Emit;
    outcome.bytes = std::move(bytes);
    outcome.state = state_;
    return outcome;
}

HandshakeOutcome Socks5Handshake::need_more() const {
    HandshakeOutcome outcome;
    outcome.kind = HandshakeOutcome::Kind::NeedMore;
    outcome.state = state_;
    return outcome;
}

HandshakeOutcome Socks5Handshake::fail(std::string reason) {
    state_ = HandshakeState::Failed;
    error_ = std::move(reason);
    buffer_.clear();

    HandshakeOutcome outcome;
    outcome.kind = HandshakeOutcome::Kind::Failed;
    outcome.state = state_;
    outcome.error = error_;
    return outcome;
}

void Socks5Handshake::consume(std::size_t count) {
    buffer_.erase(buffer_.begin(), buffer_.begin() + static_cast<std::ptrdiff_t>(count));
}

Bytes Socks5Handshake::build_auth_request() const {
    Bytes request{socks5::kAuthVersion};
    append_field(request, credentials_->username);
    append_field(request, credentials_->password);
    return request;
}

} // namespace upstream_mux
