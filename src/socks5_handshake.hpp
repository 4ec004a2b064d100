#pragma once

#include "credentials.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace upstream_mux {

namespace socks5 {

inline constexpr std::uint8_t kVersion = 0x05;
inline constexpr std::uint8_t kAuthVersion = 0x01;

inline constexpr std::uint8_t kMethodNoAuth = 0x00;
inline constexpr std::uint8_t kMethodUserPassword = 0x02;
inline constexpr std::uint8_t kMethodNoAcceptable = 0xFF;

inline constexpr std::uint8_t kCmdConnect = 0x01;

inline constexpr std::uint8_t kAtypIpv4 = 0x01;
inline constexpr std::uint8_t kAtypDomain = 0x03;
inline constexpr std::uint8_t kAtypIpv6 = 0x04;

inline constexpr std::uint8_t kReplySucceeded = 0x00;

inline constexpr std::size_t kMaxFieldLength = 255;

// Human readable text for a CONNECT reply code.
std::string reply_message(std::uint8_t code);

} // namespace socks5

using Bytes = std::vector<std::uint8_t>;

enum class HandshakeState {
    Idle,
    Greeting,
    Authenticating,
    Connecting,
    Established,
    Failed
};

const char* to_string(HandshakeState state);

struct HandshakeOutcome {
    enum class Kind {
        NeedMore, // buffer holds less than the current message
        Emit,     // write `bytes` to the upstream, state advanced
        Done,     // tunnel open, `bytes` are leftovers for the upper layer
        Failed    // terminal, see `error`
    };

    Kind kind = Kind::NeedMore;
    Bytes bytes;
    HandshakeState state = HandshakeState::Idle;
    std::string error;

    bool done() const { return kind == Kind::Done; }
    bool failed() const { return kind == Kind::Failed; }
};

// SOCKS5 client negotiation over an externally owned connection. Performs no
// I/O: start() yields the greeting, feed() consumes whatever the upstream sent.
// After an Emit the buffer may still hold bytes; feed an empty chunk to go on.
class Socks5Handshake {
public:
    Socks5Handshake(std::string target_host,
                    std::uint16_t target_port,
                    std::optional<Credentials> credentials = std::nullopt);

    HandshakeOutcome start();
    HandshakeOutcome feed(std::string_view data);

    HandshakeState state() const { return state_; }
    const std::string& error() const { return error_; }
    std::size_t buffered() const { return buffer_.size(); }

private:
    HandshakeOutcome on_greeting_reply();
    HandshakeOutcome on_auth_reply();
    HandshakeOutcome on_connect_reply();

    HandshakeOutcome emit(Bytes bytes, HandshakeState next);
    HandshakeOutcome need_more() const;
    HandshakeOutcome fail(std::string reason);
    void consume(std::size_t count);

    Bytes build_auth_request() const;

    std::string target_host_;
    std::uint16_t target_port_;
    std::optional<Credentials> credentials_;
    HandshakeState state_ = HandshakeState::Idle;
    std::string error_;
    Bytes buffer_;
};

Bytes build_greeting(bool offer_user_password);

// VER CMD RSV ATYP ADDR PORT. IPv4 and IPv6 literals are sent as addresses,
// anything else as a domain name. Returns nothing for names over 255 bytes.
std::optional<Bytes> build_connect_request(std::string_view host, std::uint16_t port);

} // namespace upstream_mux
