#pragma once

#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <functional>
#include <string>
#include <vector>
#include <boost/asio/buffer.hpp>
#include <boost/asio/write.hpp>
#include "protocol/errors.hpp"
#include "protocol/header.hpp"

namespace transfer {

struct TransferResult {
    protocol::ErrorKind error = protocol::ErrorKind::NONE;
    std::string message;
    std::string filename;
    uint64_t bytes = 0;
    double duration_seconds = 0;

    bool ok() const { return error == protocol::ErrorKind::NONE; }
};

// Per-connection receiver states, in wire order.
enum class ReceiveState {
    IDLE,
    AWAITING_NAME_LEN,
    AWAITING_NAME,
    AWAITING_SIZE,
    RECEIVING_PAYLOAD,
    COMPLETE,
    FAILED
};

const char* to_string(ReceiveState state);

// Maps a client-supplied name into receive_dir. Only the final path
// component is kept, so "../x" and "/etc/x" both land on receive_dir/x.
// Throws TransferError(INVALID_FILENAME) for names with no usable component
// ("", ".", "..", "dir/") or an embedded NUL.
std::filesystem::path resolve_destination(const std::string& receive_dir, const std::string& filename);

class MessageSender {
public:
    template <typename SyncWriteStream>
    static void send_header(SyncWriteStream& stream, const std::vector<uint8_t>& header);

    // Streams the file in buffer.size() pieces until EOF. Returns bytes
    // written. The caller owns the chunk buffer so it can be sized up front.
    template <typename SyncWriteStream>
    static uint64_t send_file(SyncWriteStream& stream, const std::string& filepath,
                              std::vector<char>& buffer);
};

class MessageReceiver {
public:
    // Reads exactly expected_size bytes in reads of at most chunk_size and
    // appends them to filepath. Returns the number of chunk reads. On failure
    // the partially written file stays on disk.
    template <typename SyncReadStream>
    static std::size_t receive_file(SyncReadStream& stream, const std::filesystem::path& filepath,
                                    uint64_t expected_size, std::size_t chunk_size);
};

// One inbound transfer: header decode then payload drain.
// state() walks IDLE -> AWAITING_NAME_LEN -> AWAITING_NAME -> AWAITING_SIZE
// -> RECEIVING_PAYLOAD -> COMPLETE, or ends in FAILED when run() throws.
class InboundTransfer {
public:
    using HeaderCallback = std::function<void(const protocol::TransferHeader&)>;

    InboundTransfer(std::string receive_dir, std::size_t chunk_size,
                    HeaderCallback on_header = nullptr);

    template <typename SyncReadStream>
    protocol::TransferHeader run(SyncReadStream& stream);

    ReceiveState state() const { return state_; }
    // Header fields decoded so far; still readable after run() throws.
    const protocol::TransferHeader& header() const { return header_; }
    const std::filesystem::path& destination() const { return destination_; }
    std::size_t chunk_reads() const { return chunk_reads_; }

private:
    std::string receive_dir_;
    std::size_t chunk_size_;
    HeaderCallback on_header_;
    ReceiveState state_ = ReceiveState::IDLE;
    protocol::TransferHeader header_{};
    std::filesystem::path destination_;
    std::size_t chunk_reads_ = 0;
};

// ─── Template definitions ───────────────────────────────────────────────────

namespace detail {

template <typename SyncWriteStream>
void write_all(SyncWriteStream& stream, const void* data, std::size_t size) {
    boost::system::error_code ec;
    boost::asio::write(stream, boost::asio::buffer(data, size), ec);
    if (ec) {
        throw protocol::TransferError(protocol::ErrorKind::IO_FAILURE,
                                      "Write to peer failed: " + ec.message());
    }
}

} // namespace detail

template <typename SyncWriteStream>
void MessageSender::send_header(SyncWriteStream& stream, const std::vector<uint8_t>& header) {
    detail::write_all(stream, header.data(), header.size());
}

template <typename SyncWriteStream>
uint64_t MessageSender::send_file(SyncWriteStream& stream, const std::string& filepath,
                                  std::vector<char>& buffer) {
    std::ifstream file(filepath, std::ios::binary);
    if (!file.is_open()) {
        throw protocol::TransferError(protocol::ErrorKind::IO_FAILURE,
                                      "Could not open file for reading: " + filepath);
    }

    if (buffer.empty()) {
        throw protocol::TransferError(protocol::ErrorKind::IO_FAILURE, "Empty send buffer");
    }

    uint64_t total_sent = 0;
    while (file.read(buffer.data(), buffer.size()) || file.gcount() > 0) {
        std::size_t bytes_read = static_cast<std::size_t>(file.gcount());
        detail::write_all(stream, buffer.data(), bytes_read);
        total_sent += bytes_read;
    }
    if (file.bad()) {
        throw protocol::TransferError(protocol::ErrorKind::IO_FAILURE,
                                      "Read error on " + filepath);
    }
    return total_sent;
}

template <typename SyncReadStream>
std::size_t MessageReceiver::receive_file(SyncReadStream& stream, const std::filesystem::path& filepath,
                                          uint64_t expected_size, std::size_t chunk_size) {
    std::filesystem::path parent = filepath.parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            throw protocol::TransferError(protocol::ErrorKind::IO_FAILURE,
                                          "Could not create " + parent.string() + ": " + ec.message());
        }
    }

    std::ofstream file(filepath, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        throw protocol::TransferError(protocol::ErrorKind::IO_FAILURE,
                                      "Could not open file for writing: " + filepath.string());
    }

    std::size_t reads = 0;
    uint64_t remaining = expected_size;
    std::vector<char> buffer(static_cast<std::size_t>(
        std::min<uint64_t>(chunk_size, expected_size)));
    while (remaining > 0) {
        std::size_t to_read = static_cast<std::size_t>(std::min<uint64_t>(chunk_size, remaining));
        protocol::read_exact(stream, buffer.data(), to_read);
        file.write(buffer.data(), static_cast<std::streamsize>(to_read));
        if (!file) {
            throw protocol::TransferError(protocol::ErrorKind::IO_FAILURE,
                                          "Write failed on " + filepath.string());
        }
        remaining -= to_read;
        ++reads;
    }

    file.close();
    if (file.fail()) {
        throw protocol::TransferError(protocol::ErrorKind::IO_FAILURE,
                                      "Could not finalize " + filepath.string());
    }
    return reads;
}

template <typename SyncReadStream>
protocol::TransferHeader InboundTransfer::run(SyncReadStream& stream) {
    try {
        state_ = ReceiveState::AWAITING_NAME_LEN;
        uint16_t name_len = protocol::read_name_length(stream);

        state_ = ReceiveState::AWAITING_NAME;
        header_.filename = protocol::read_name(stream, name_len);

        state_ = ReceiveState::AWAITING_SIZE;
        header_.file_size = protocol::read_file_size(stream);

        destination_ = resolve_destination(receive_dir_, header_.filename);
        if (on_header_) on_header_(header_);

        state_ = ReceiveState::RECEIVING_PAYLOAD;
        chunk_reads_ = MessageReceiver::receive_file(stream, destination_, header_.file_size, chunk_size_);

        state_ = ReceiveState::COMPLETE;
    } catch (const std::exception&) {
        state_ = ReceiveState::FAILED;
        throw;
    }
    return header_;
}

} // namespace transfer
