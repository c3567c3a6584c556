/**
 * @file test_loopback.cpp
 * @brief End-to-end transfers over 127.0.0.1, plain TCP and TLS.
 */

#include <gtest/gtest.h>
#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/write.hpp>
#include <chrono>
#include <memory>
#include <thread>
#include "networking.hpp"
#include "protocol/header.hpp"
#include "security.hpp"
#include "test_support.hpp"

using testing_support::TempDir;
using testing_support::pattern_bytes;
using testing_support::read_file;
using testing_support::read_lines;
using testing_support::write_file;

class LoopbackTest : public ::testing::Test {
protected:
    void SetUp() override {
        settings_ = config::defaults(false);
        settings_.receive_dir = dir_.file("received");
        settings_.metrics_file = dir_.file("metrics.csv");
    }

    void start_server() {
        networking::ServerCallbacks callbacks;
        callbacks.on_complete = [this](const metrics::TransferRecord& record) {
            records_.push_back(record);
        };
        server_ = std::make_unique<networking::Server>("127.0.0.1", 0, settings_, callbacks);
    }

    // Serves `count` connections on a background thread.
    void serve(std::size_t count) {
        server_thread_ = std::thread([this, count]() {
            for (std::size_t i = 0; i < count; ++i) {
                server_results_.push_back(server_->accept_one());
            }
        });
    }

    void join() {
        if (server_thread_.joinable()) server_thread_.join();
    }

    void TearDown() override { join(); }

    std::string make_file(const std::string& name, const std::vector<uint8_t>& data) {
        std::string path = dir_.file(name);
        write_file(path, data);
        return path;
    }

    std::string received(const std::string& name) const {
        return (std::filesystem::path(settings_.receive_dir) / name).string();
    }

    TempDir dir_;
    config::Settings settings_;
    std::unique_ptr<networking::Server> server_;
    std::thread server_thread_;
    std::vector<transfer::TransferResult> server_results_;
    std::vector<metrics::TransferRecord> records_;
};

TEST_F(LoopbackTest, EmptyFileProducesEmptyDestinationAndZeroRecord) {
    start_server();
    serve(1);

    networking::Client client(settings_);
    transfer::TransferResult sent = client.send("127.0.0.1", server_->port(), make_file("empty.txt", {}));
    join();

    ASSERT_TRUE(sent.ok()) << sent.message;
    ASSERT_EQ(server_results_.size(), 1u);
    ASSERT_TRUE(server_results_[0].ok()) << server_results_[0].message;

    ASSERT_TRUE(std::filesystem::exists(received("empty.txt")));
    EXPECT_EQ(std::filesystem::file_size(received("empty.txt")), 0u);

    ASSERT_EQ(records_.size(), 1u);
    EXPECT_EQ(records_[0].filename, "empty.txt");
    EXPECT_EQ(records_[0].file_size_bytes, 0u);
    EXPECT_EQ(records_[0].throughput_bytes_per_second, 0.0);
    EXPECT_EQ(records_[0].client_address, "127.0.0.1");
}

TEST_F(LoopbackTest, PatternFileArrivesByteIdentical) {
    start_server();
    serve(1);

    std::vector<uint8_t> payload = pattern_bytes(4096);
    networking::Client client(settings_);
    transfer::TransferResult sent = client.send("127.0.0.1", server_->port(), make_file("pattern.bin", payload));
    join();

    ASSERT_TRUE(sent.ok()) << sent.message;
    EXPECT_EQ(sent.bytes, 4096u);
    ASSERT_TRUE(server_results_[0].ok()) << server_results_[0].message;
    EXPECT_EQ(read_file(received("pattern.bin")), payload);
}

TEST_F(LoopbackTest, MultiChunkFileIsDrainedExactly) {
    start_server();
    serve(1);

    std::vector<uint8_t> payload = pattern_bytes(10000);
    networking::Client client(settings_);
    transfer::TransferResult sent = client.send("127.0.0.1", server_->port(), make_file("big.bin", payload));
    join();

    ASSERT_TRUE(sent.ok()) << sent.message;
    ASSERT_TRUE(server_results_[0].ok()) << server_results_[0].message;
    EXPECT_EQ(server_results_[0].bytes, 10000u);
    EXPECT_EQ(read_file(received("big.bin")), payload);

    std::vector<std::string> lines = read_lines(settings_.metrics_file);
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0], metrics::CSV_HEADER);
    EXPECT_NE(lines[1].find(",big.bin,10000,"), std::string::npos);
}

TEST_F(LoopbackTest, RepeatRunUsesIndependentConnections) {
    start_server();
    serve(3);

    networking::Client client(settings_);
    int status = client.run("127.0.0.1", server_->port(), make_file("again.txt", pattern_bytes(100)), 3);
    join();

    EXPECT_EQ(status, 0);
    ASSERT_EQ(records_.size(), 3u);
    EXPECT_NE(records_[0].client_port, records_[1].client_port);
    EXPECT_EQ(read_lines(settings_.metrics_file).size(), 4u);
}

TEST_F(LoopbackTest, MissingFileFailsBeforeConnecting) {
    start_server();

    networking::Client client(settings_);
    transfer::TransferResult sent = client.send("127.0.0.1", server_->port(), dir_.file("nope.bin"));
    EXPECT_EQ(sent.error, protocol::ErrorKind::FILE_NOT_FOUND);

    EXPECT_EQ(client.run("127.0.0.1", server_->port(), dir_.file("nope.bin"), 2), 1);
}

TEST_F(LoopbackTest, ServerSurvivesTruncatedClientAndServesNext) {
    start_server();
    serve(2);

    {
        // Declares 10000 bytes, delivers 5000, then hangs up.
        boost::asio::io_context io;
        boost::asio::ip::tcp::socket raw(io);
        raw.connect({boost::asio::ip::make_address("127.0.0.1"), server_->port()});
        std::vector<uint8_t> header = protocol::encode_header("cut.bin", 10000);
        boost::asio::write(raw, boost::asio::buffer(header));
        boost::asio::write(raw, boost::asio::buffer(pattern_bytes(5000)));
    }

    networking::Client client(settings_);
    transfer::TransferResult sent = client.send("127.0.0.1", server_->port(), make_file("ok.bin", pattern_bytes(64)));
    join();

    ASSERT_EQ(server_results_.size(), 2u);
    EXPECT_EQ(server_results_[0].error, protocol::ErrorKind::INCOMPLETE_STREAM);
    EXPECT_EQ(server_results_[0].filename, "cut.bin");
    ASSERT_TRUE(sent.ok()) << sent.message;
    EXPECT_TRUE(server_results_[1].ok()) << server_results_[1].message;

    // No record for the cut transfer; its partial file stays behind (known gap).
    ASSERT_EQ(records_.size(), 1u);
    EXPECT_EQ(records_[0].filename, "ok.bin");
    EXPECT_TRUE(std::filesystem::exists(received("cut.bin")));
    EXPECT_LT(std::filesystem::file_size(received("cut.bin")), 10000u);
}

TEST_F(LoopbackTest, TraversalNameIsConfinedToReceiveDir) {
    start_server();
    serve(1);

    {
        boost::asio::io_context io;
        boost::asio::ip::tcp::socket raw(io);
        raw.connect({boost::asio::ip::make_address("127.0.0.1"), server_->port()});
        std::vector<uint8_t> payload = pattern_bytes(16);
        boost::asio::write(raw, boost::asio::buffer(protocol::encode_header("../escape.bin", payload.size())));
        boost::asio::write(raw, boost::asio::buffer(payload));
    }
    join();

    ASSERT_TRUE(server_results_[0].ok()) << server_results_[0].message;
    EXPECT_TRUE(std::filesystem::exists(received("escape.bin")));
    EXPECT_FALSE(std::filesystem::exists(dir_.path() / "escape.bin"));
}

TEST_F(LoopbackTest, InvalidUtf8NameIsStoredWithReplacementCharacter) {
    start_server();
    serve(1);

    {
        boost::asio::io_context io;
        boost::asio::ip::tcp::socket raw(io);
        raw.connect({boost::asio::ip::make_address("127.0.0.1"), server_->port()});
        std::vector<uint8_t> payload = pattern_bytes(8);
        boost::asio::write(raw, boost::asio::buffer(protocol::encode_header("bad\xFFname.bin", payload.size())));
        boost::asio::write(raw, boost::asio::buffer(payload));
    }
    join();

    ASSERT_TRUE(server_results_[0].ok()) << server_results_[0].message;
    EXPECT_EQ(server_results_[0].filename, "bad\xEF\xBF\xBDname.bin");
    EXPECT_TRUE(std::filesystem::exists(received("bad\xEF\xBF\xBDname.bin")));
    ASSERT_EQ(records_.size(), 1u);
    EXPECT_EQ(records_[0].filename, "bad\xEF\xBF\xBDname.bin");
}

class SecureLoopbackTest : public LoopbackTest {
protected:
    void SetUp() override {
        LoopbackTest::SetUp();
        settings_.secure = true;
        testing_support::generate_self_signed(dir_.file("cert.pem"), dir_.file("key.pem"), "wiredrop-server");
        settings_.tls.certificate_file = dir_.file("cert.pem");
        settings_.tls.private_key_file = dir_.file("key.pem");
        settings_.tls.trust_anchor_file = dir_.file("cert.pem");
    }
};

TEST_F(SecureLoopbackTest, TransferOverTlsMatchesPlain) {
    start_server();
    serve(1);

    std::vector<uint8_t> payload = pattern_bytes(10000);
    networking::Client client(settings_);
    transfer::TransferResult sent = client.send("127.0.0.1", server_->port(), make_file("secure.bin", payload));
    join();

    ASSERT_TRUE(sent.ok()) << sent.message;
    ASSERT_TRUE(server_results_[0].ok()) << server_results_[0].message;
    EXPECT_EQ(read_file(received("secure.bin")), payload);
    ASSERT_EQ(records_.size(), 1u);
    EXPECT_EQ(records_[0].file_size_bytes, 10000u);
}

TEST_F(SecureLoopbackTest, WrongTrustAnchorFailsHandshakeAndSendsNothing) {
    start_server();
    serve(1);

    config::Settings client_settings = settings_;
    testing_support::generate_self_signed(dir_.file("other.pem"), dir_.file("other-key.pem"), "someone-else");
    client_settings.tls.trust_anchor_file = dir_.file("other.pem");

    networking::Client client(client_settings);
    transfer::TransferResult sent = client.send("127.0.0.1", server_->port(), make_file("secret.bin", pattern_bytes(100)));
    join();

    EXPECT_EQ(sent.error, protocol::ErrorKind::HANDSHAKE_FAILURE);
    ASSERT_EQ(server_results_.size(), 1u);
    EXPECT_EQ(server_results_[0].error, protocol::ErrorKind::HANDSHAKE_FAILURE);

    EXPECT_TRUE(records_.empty());
    EXPECT_FALSE(std::filesystem::exists(settings_.receive_dir));
    EXPECT_FALSE(std::filesystem::exists(settings_.metrics_file));
}

TEST_F(SecureLoopbackTest, MissingServerKeyFailsAtStartup) {
    settings_.tls.private_key_file = dir_.file("absent-key.pem");
    try {
        networking::Server server("127.0.0.1", 0, settings_);
        FAIL() << "expected HANDSHAKE_FAILURE";
    } catch (const protocol::TransferError& e) {
        EXPECT_EQ(e.kind(), protocol::ErrorKind::HANDSHAKE_FAILURE);
    }
}

TEST_F(SecureLoopbackTest, SenderFinishesWithoutWaitingForSlowReceiver) {
    // Receiver that reads everything, then stalls before its own close.
    boost::asio::io_context io;
    boost::asio::ssl::context ctx = security::make_server_context(settings_.tls);
    boost::asio::ip::tcp::acceptor acceptor(io, {boost::asio::ip::make_address("127.0.0.1"), 0});
    unsigned short port = acceptor.local_endpoint().port();

    std::vector<uint8_t> payload = pattern_bytes(100);
    std::vector<uint8_t> received_payload;
    std::string receiver_error;
    std::thread receiver([&]() {
        try {
            boost::asio::ip::tcp::socket socket(io);
            acceptor.accept(socket);
            security::TlsStream stream(std::move(socket), ctx);
            security::handshake_server(stream);
            protocol::TransferHeader header = protocol::decode_header(stream);
            received_payload.resize(header.file_size);
            protocol::read_exact(stream, received_payload.data(), received_payload.size());
            std::this_thread::sleep_for(std::chrono::seconds(2));
            std::string close_error;
            security::close(stream, close_error);
        } catch (const std::exception& e) {
            receiver_error = e.what();
        }
    });

    networking::Client client(settings_);
    transfer::TransferResult sent = client.send("127.0.0.1", port, make_file("slow.bin", payload));
    receiver.join();

    ASSERT_TRUE(sent.ok()) << sent.message;
    EXPECT_LT(sent.duration_seconds, 1.0);
    EXPECT_TRUE(receiver_error.empty()) << receiver_error;
    EXPECT_EQ(received_payload, payload);
}
