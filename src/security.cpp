#include "security.hpp"
#include "protocol/errors.hpp"
#include <boost/system/system_error.hpp>
#include <openssl/ssl.h>

namespace security {

namespace ssl = boost::asio::ssl;

boost::asio::ssl::context make_client_context(const SecureChannelConfig& config) {
    try {
        ssl::context ctx(ssl::context::tls_client);
        ctx.set_options(ssl::context::default_workarounds |
                        ssl::context::no_sslv2 |
                        ssl::context::no_sslv3);
        // The trust anchor is the only verify location; system CAs are not loaded.
        ctx.load_verify_file(config.trust_anchor_file);
        ctx.set_verify_mode(ssl::verify_peer);
        // No set_verify_callback(host_name_verification(...)): host names are not checked.
        return ctx;
    } catch (const boost::system::system_error& e) {
        throw protocol::TransferError(protocol::ErrorKind::HANDSHAKE_FAILURE,
                                      "Could not load trust anchor '" + config.trust_anchor_file +
                                      "': " + e.what());
    }
}

boost::asio::ssl::context make_server_context(const SecureChannelConfig& config) {
    try {
        ssl::context ctx(ssl::context::tls_server);
        ctx.set_options(ssl::context::default_workarounds |
                        ssl::context::no_sslv2 |
                        ssl::context::no_sslv3 |
                        ssl::context::single_dh_use);
        ctx.use_certificate_chain_file(config.certificate_file);
        ctx.use_private_key_file(config.private_key_file, ssl::context::pem);
        // No TLS 1.3 session tickets: the client never reads after the
        // handshake, and unread tickets would turn its close into a reset.
        if (SSL_CTX_set_num_tickets(ctx.native_handle(), 0) != 1) {
            throw protocol::TransferError(protocol::ErrorKind::HANDSHAKE_FAILURE,
                                          "Could not disable session tickets");
        }
        return ctx;
    } catch (const boost::system::system_error& e) {
        throw protocol::TransferError(protocol::ErrorKind::HANDSHAKE_FAILURE,
                                      "Could not load certificate '" + config.certificate_file +
                                      "' / key '" + config.private_key_file + "': " + e.what());
    }
}

void handshake_client(TlsStream& stream) {
    boost::system::error_code ec;
    stream.handshake(ssl::stream_base::client, ec);
    if (ec) {
        throw protocol::TransferError(protocol::ErrorKind::HANDSHAKE_FAILURE,
                                      "TLS handshake failed: " + ec.message());
    }
}

void handshake_server(TlsStream& stream) {
    boost::system::error_code ec;
    stream.handshake(ssl::stream_base::server, ec);
    if (ec) {
        throw protocol::TransferError(protocol::ErrorKind::HANDSHAKE_FAILURE,
                                      "TLS handshake failed: " + ec.message());
    }
}

bool close_outbound(TlsStream& stream, std::string& error) {
    // Marking the peer's close_notify as already seen makes SSL_shutdown
    // return as soon as ours is written, so nothing is read back.
    SSL_set_shutdown(stream.native_handle(), SSL_RECEIVED_SHUTDOWN);

    boost::system::error_code ec;
    stream.shutdown(ec);
    if (ec) {
        error = ec.message();
    }

    boost::system::error_code tcp_ec;
    stream.lowest_layer().shutdown(boost::asio::ip::tcp::socket::shutdown_send, tcp_ec);
    if (tcp_ec == boost::asio::error::not_connected) tcp_ec.clear();
    if (tcp_ec && !ec) ec = tcp_ec;

    boost::system::error_code close_ec;
    stream.lowest_layer().close(close_ec);
    if (close_ec && !ec) ec = close_ec;

    if (ec && error.empty()) {
        error = ec.message();
    }
    return !ec;
}

bool close(TlsStream& stream, std::string& error) {
    boost::system::error_code ec;
    stream.shutdown(ec);
    // A peer that closes TCP right after its own close_notify shows up as eof.
    bool clean = !ec || ec == boost::asio::error::eof;
    if (!clean) {
        error = ec.message();
    }

    boost::system::error_code close_ec;
    stream.lowest_layer().close(close_ec);
    if (close_ec && clean) {
        error = close_ec.message();
        clean = false;
    }
    return clean;
}

} // namespace security
