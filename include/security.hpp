#pragma once

#include <string>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>

namespace security {

using TlsStream = boost::asio::ssl::stream<boost::asio::ip::tcp::socket>;

// All TLS material for one process, in one place.
// Policy is fixed: the client verifies the server's chain against
// trust_anchor_file only (usually the server's own self-signed certificate)
// and does NOT check the host name, since peers are addressed by IP.
struct SecureChannelConfig {
    std::string trust_anchor_file;   // client side, PEM
    std::string certificate_file;    // server side, PEM chain
    std::string private_key_file;    // server side, PEM
};

// Both throw protocol::TransferError(HANDSHAKE_FAILURE) if the PEM files
// cannot be loaded.
boost::asio::ssl::context make_client_context(const SecureChannelConfig& config);
boost::asio::ssl::context make_server_context(const SecureChannelConfig& config);

// Throw protocol::TransferError(HANDSHAKE_FAILURE) on negotiation failure.
void handshake_client(TlsStream& stream);
void handshake_server(TlsStream& stream);

// Sender side: writes close_notify, half-closes TCP and closes the socket
// without waiting for the peer's reply. Returns false with `error` set if
// any step failed. Never throws.
bool close_outbound(TlsStream& stream, std::string& error);

// Receiver side: full close_notify exchange, then socket close. Returns
// false if it did not complete cleanly. Never throws.
bool close(TlsStream& stream, std::string& error);

} // namespace security
