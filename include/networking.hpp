#pragma once

#include <functional>
#include <memory>
#include <string>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/context.hpp>
#include "config.hpp"
#include "metrics.hpp"
#include "transfer.hpp"

namespace networking {

using StatusCallback = std::function<void(const std::string&)>;

struct ServerCallbacks {
    std::function<void(const std::string& address, unsigned short port)> on_ready;
    StatusCallback on_status;
    std::function<void(const metrics::TransferRecord&)> on_complete;
    std::function<void(const std::string&)> on_error;
};

struct ClientCallbacks {
    StatusCallback on_status;
    std::function<void(const std::string&)> on_error;
};

// Outbound side: one connection per send(). settings.secure selects raw TCP
// or TLS. Nothing is read back after the handshake; a send is complete once
// every byte has been handed to the transport.
class Client {
public:
    explicit Client(config::Settings settings, ClientCallbacks callbacks = {});

    transfer::TransferResult send(const std::string& address, unsigned short port,
                                  const std::string& filepath);

    // Sends the file `repeat` times over independent connections and stops at
    // the first failure. Returns the process exit status (0 or 1).
    int run(const std::string& address, unsigned short port,
            const std::string& filepath, unsigned int repeat);

private:
    template <typename SyncWriteStream>
    uint64_t stream_file(SyncWriteStream& stream, const std::vector<uint8_t>& header,
                         const std::string& filepath, std::vector<char>& buffer);

    void status(const std::string& message) const;

    config::Settings settings_;
    ClientCallbacks callbacks_;
};

// Inbound side: sequential accept loop. Each accepted connection is
// handshaken (TLS mode), drained and recorded before the next accept.
// Per-connection failures are reported through on_error and never end the loop.
class Server {
public:
    // Binds and listens immediately; port 0 picks a free port. TLS material
    // is loaded here once. Throws on bind failure or unreadable PEM files.
    Server(const std::string& bind_address, unsigned short port,
           config::Settings settings, ServerCallbacks callbacks = {});

    unsigned short port() const;

    // Runs accept_one() forever.
    void run();

    // Accepts one connection and processes it to completion or failure.
    transfer::TransferResult accept_one();

private:
    // Fills `result` as it goes, so a failed transfer still names its file.
    template <typename SyncReadStream>
    void receive(SyncReadStream& stream, const boost::asio::ip::tcp::endpoint& peer,
                 transfer::TransferResult& result);

    void status(const std::string& message) const;

    config::Settings settings_;
    ServerCallbacks callbacks_;
    std::string tag_;
    boost::asio::io_context io_context_;
    boost::asio::ip::tcp::acceptor acceptor_;
    std::unique_ptr<boost::asio::ssl::context> tls_context_;
    metrics::Recorder recorder_;
};

} // namespace networking
