#include "networking.hpp"
#include "security.hpp"
#include "protocol/header.hpp"
#include <boost/asio/connect.hpp>
#include <chrono>
#include <cstdio>
#include <filesystem>
#include <iomanip>
#include <sstream>

using boost::asio::ip::tcp;

namespace networking {

namespace {

std::string format_size(uint64_t bytes) {
    double size = bytes;
    const char* units[] = {"B", "KB", "MB", "GB", "TB"};
    int i = 0;
    while (size >= 1024 && i < 4) {
        size /= 1024;
        i++;
    }
    char buf[32];
    snprintf(buf, sizeof(buf), "%.1f%s", size, units[i]);
    return std::string(buf);
}

std::string format_seconds(double seconds) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(6) << seconds;
    return oss.str();
}

double seconds_since(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
}

std::string describe(const transfer::TransferResult& result) {
    return std::string(protocol::to_string(result.error)) + ": " + result.message;
}

// Orderly TCP close; returns false with `error` set if the OS complained.
bool close_socket(tcp::socket& socket, std::string& error) {
    boost::system::error_code ec;
    socket.shutdown(tcp::socket::shutdown_both, ec);
    // Peer may already be gone once it has what it needs.
    if (ec == boost::asio::error::not_connected) ec.clear();

    boost::system::error_code close_ec;
    socket.close(close_ec);
    if (!ec) ec = close_ec;

    if (ec) {
        error = ec.message();
        return false;
    }
    return true;
}

} // namespace

// ─── Client ─────────────────────────────────────────────────────────────────

Client::Client(config::Settings settings, ClientCallbacks callbacks)
    : settings_(std::move(settings)), callbacks_(std::move(callbacks)) {}

void Client::status(const std::string& message) const {
    if (callbacks_.on_status) callbacks_.on_status(message);
}

template <typename SyncWriteStream>
uint64_t Client::stream_file(SyncWriteStream& stream, const std::vector<uint8_t>& header,
                             const std::string& filepath, std::vector<char>& buffer) {
    transfer::MessageSender::send_header(stream, header);
    return transfer::MessageSender::send_file(stream, filepath, buffer);
}

transfer::TransferResult Client::send(const std::string& address, unsigned short port,
                                      const std::string& filepath) {
    transfer::TransferResult result;
    auto start = std::chrono::steady_clock::now();
    const std::string tag = settings_.secure ? "(TLS) " : "";

    try {
        std::filesystem::path path(filepath);
        std::error_code fs_ec;
        if (!std::filesystem::is_regular_file(path, fs_ec)) {
            throw protocol::TransferError(protocol::ErrorKind::FILE_NOT_FOUND,
                                          "File not found: " + filepath);
        }
        uint64_t file_size = std::filesystem::file_size(path, fs_ec);
        if (fs_ec) {
            throw protocol::TransferError(protocol::ErrorKind::FILE_NOT_FOUND,
                                          "Could not stat " + filepath + ": " + fs_ec.message());
        }

        result.filename = path.filename().string();
        // Header and chunk buffer are built before connecting, so neither an
        // oversize name nor an unusable chunk size puts bytes on the wire.
        std::vector<uint8_t> header = protocol::encode_header(result.filename, file_size);
        std::vector<char> buffer(settings_.chunk_size);

        boost::asio::io_context io_context;
        tcp::resolver resolver(io_context);
        boost::system::error_code ec;
        auto endpoints = resolver.resolve(address, std::to_string(port), ec);
        if (ec) {
            throw protocol::TransferError(protocol::ErrorKind::IO_FAILURE,
                                          "Could not resolve " + address + ": " + ec.message());
        }

        status(tag + "Connecting to " + address + ":" + std::to_string(port) + " ...");

        if (settings_.secure) {
            boost::asio::ssl::context ctx = security::make_client_context(settings_.tls);
            security::TlsStream stream(io_context, ctx);
            boost::asio::connect(stream.lowest_layer(), endpoints, ec);
            if (ec) {
                throw protocol::TransferError(protocol::ErrorKind::IO_FAILURE,
                                              "Could not connect: " + ec.message());
            }
            security::handshake_client(stream);
            status(tag + "TLS connection established.");

            status(tag + "Sending '" + result.filename + "' (" + std::to_string(file_size) + " bytes)...");
            result.bytes = stream_file(stream, header, filepath, buffer);

            std::string close_error;
            if (!security::close_outbound(stream, close_error)) {
                status(tag + "TLS close did not complete cleanly: " + close_error);
            }
        } else {
            tcp::socket socket(io_context);
            boost::asio::connect(socket, endpoints, ec);
            if (ec) {
                throw protocol::TransferError(protocol::ErrorKind::IO_FAILURE,
                                              "Could not connect: " + ec.message());
            }
            status("Connection established.");

            status("Sending '" + result.filename + "' (" + std::to_string(file_size) + " bytes)...");
            result.bytes = stream_file(socket, header, filepath, buffer);

            std::string close_error;
            if (!close_socket(socket, close_error)) {
                status("Socket close reported: " + close_error);
            }
        }
        status(tag + "Send completed (" + format_size(result.bytes) + ").");
    } catch (const protocol::TransferError& e) {
        result.error = e.kind();
        result.message = e.what();
    } catch (const std::exception& e) {
        result.error = protocol::ErrorKind::IO_FAILURE;
        result.message = e.what();
    }

    result.duration_seconds = seconds_since(start);
    return result;
}

int Client::run(const std::string& address, unsigned short port,
                const std::string& filepath, unsigned int repeat) {
    const std::string tag = settings_.secure ? "(TLS) " : "";
    for (unsigned int i = 1; i <= repeat; ++i) {
        status("=== " + tag + "Transfer " + std::to_string(i) + "/" + std::to_string(repeat) + " ===");
        transfer::TransferResult result = send(address, port, filepath);
        if (!result.ok()) {
            if (callbacks_.on_error) {
                callbacks_.on_error(tag + "Transfer " + std::to_string(i) + " failed: " + describe(result));
            }
            return 1;
        }
        status(tag + "Client-side time: " + format_seconds(result.duration_seconds) + " s");
    }
    return 0;
}

// ─── Server ─────────────────────────────────────────────────────────────────

Server::Server(const std::string& bind_address, unsigned short port,
               config::Settings settings, ServerCallbacks callbacks)
    : settings_(std::move(settings)),
      callbacks_(std::move(callbacks)),
      tag_(settings_.secure ? "(TLS) " : ""),
      acceptor_(io_context_),
      recorder_(settings_.metrics_file) {
    if (settings_.secure) {
        tls_context_ = std::make_unique<boost::asio::ssl::context>(
            security::make_server_context(settings_.tls));
    }

    tcp::endpoint endpoint(boost::asio::ip::make_address(bind_address), port);
    acceptor_.open(endpoint.protocol());
    acceptor_.set_option(tcp::acceptor::reuse_address(true));
    acceptor_.bind(endpoint);
    acceptor_.listen(5);
}

unsigned short Server::port() const {
    return acceptor_.local_endpoint().port();
}

void Server::status(const std::string& message) const {
    if (callbacks_.on_status) callbacks_.on_status(message);
}

void Server::run() {
    if (callbacks_.on_ready) {
        callbacks_.on_ready(acceptor_.local_endpoint().address().to_string(), port());
    }
    for (;;) {
        status(tag_ + "Waiting for connection...");
        accept_one();
    }
}

template <typename SyncReadStream>
void Server::receive(SyncReadStream& stream, const tcp::endpoint& peer,
                     transfer::TransferResult& result) {
    auto start = std::chrono::steady_clock::now();
    std::string timestamp = metrics::current_timestamp();

    transfer::InboundTransfer inbound(
        settings_.receive_dir, settings_.chunk_size,
        [this](const protocol::TransferHeader& header) {
            status(tag_ + "Receiving '" + header.filename + "' (" +
                   std::to_string(header.file_size) + " bytes, " + format_size(header.file_size) + ")...");
        });

    protocol::TransferHeader header;
    try {
        header = inbound.run(stream);
    } catch (const std::exception&) {
        result.filename = inbound.header().filename;
        throw;
    }
    double duration = seconds_since(start);

    std::string stored_name = inbound.destination().filename().string();
    result.filename = stored_name;
    std::error_code fs_ec;
    std::filesystem::path saved = std::filesystem::absolute(inbound.destination(), fs_ec);
    status(tag_ + "Saved to " + (fs_ec ? inbound.destination() : saved).string());
    status(tag_ + "Duration: " + format_seconds(duration) + " s");

    metrics::TransferRecord record = metrics::make_record(
        timestamp, peer.address().to_string(), peer.port(),
        stored_name, header.file_size, duration);
    recorder_.append(record);
    if (callbacks_.on_complete) callbacks_.on_complete(record);

    result.bytes = header.file_size;
    result.duration_seconds = duration;
}

transfer::TransferResult Server::accept_one() {
    tcp::socket socket(io_context_);
    // Listener faults are not per-client failures; let them propagate.
    acceptor_.accept(socket);

    transfer::TransferResult result;
    boost::system::error_code ec;
    tcp::endpoint peer = socket.remote_endpoint(ec);
    if (ec) {
        result.error = protocol::ErrorKind::IO_FAILURE;
        result.message = "Peer vanished before processing: " + ec.message();
        if (callbacks_.on_error) callbacks_.on_error(tag_ + describe(result));
        return result;
    }

    std::string peer_name = peer.address().to_string() + ":" + std::to_string(peer.port());
    status(tag_ + "Connection from " + peer_name);

    try {
        if (settings_.secure) {
            security::TlsStream stream(std::move(socket), *tls_context_);
            security::handshake_server(stream);
            receive(stream, peer, result);

            std::string close_error;
            if (!security::close(stream, close_error)) {
                status(tag_ + "TLS close with " + peer_name + " did not complete cleanly: " + close_error);
            }
        } else {
            receive(socket, peer, result);

            std::string close_error;
            if (!close_socket(socket, close_error)) {
                status("Socket close with " + peer_name + " reported: " + close_error);
            }
        }
    } catch (const protocol::TransferError& e) {
        result.error = e.kind();
        result.message = e.what();
    } catch (const std::exception& e) {
        result.error = protocol::ErrorKind::IO_FAILURE;
        result.message = e.what();
    }

    if (!result.ok() && callbacks_.on_error) {
        std::string file = result.filename.empty() ? "" : " ('" + result.filename + "')";
        callbacks_.on_error(tag_ + "Transfer from " + peer_name + file + " failed: " + describe(result));
    }
    return result;
}

} // namespace networking
