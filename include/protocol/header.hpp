#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <vector>
#include <boost/asio/buffer.hpp>
#include <boost/asio/read.hpp>
#include "protocol/errors.hpp"

namespace protocol {

// Wire layout:
//   [2 bytes BE name_len][name_len bytes UTF-8 name][8 bytes BE file_size][payload]
constexpr std::size_t NAME_LENGTH_BYTES = 2;
constexpr std::size_t FILE_SIZE_BYTES = 8;
constexpr std::size_t MAX_NAME_LENGTH = 65535;

struct TransferHeader {
    std::string filename;
    uint64_t file_size;
};

std::vector<uint8_t> encode_header(const std::string& filename, uint64_t file_size);

uint16_t decode_name_length(const std::array<uint8_t, NAME_LENGTH_BYTES>& buffer);
uint64_t decode_file_size(const std::array<uint8_t, FILE_SIZE_BYTES>& buffer);

// Replaces each ill-formed UTF-8 sequence with U+FFFD (one per maximal
// invalid subpart). Well-formed input comes back unchanged.
std::string replace_invalid_utf8(const std::string& bytes);

// Fills exactly `size` bytes from any Asio SyncReadStream (tcp::socket,
// ssl::stream, test doubles). Throws TransferError(INCOMPLETE_STREAM) if the
// stream ends or errors first.
template <typename SyncReadStream>
void read_exact(SyncReadStream& stream, void* data, std::size_t size) {
    if (size == 0) return;
    boost::system::error_code ec;
    std::size_t got = boost::asio::read(stream, boost::asio::buffer(data, size), ec);
    if (ec || got != size) {
        throw TransferError(ErrorKind::INCOMPLETE_STREAM,
                            "Stream closed after " + std::to_string(got) + " of " +
                            std::to_string(size) + " bytes" +
                            (ec ? " (" + ec.message() + ")" : std::string()));
    }
}

template <typename SyncReadStream>
uint16_t read_name_length(SyncReadStream& stream) {
    std::array<uint8_t, NAME_LENGTH_BYTES> buf;
    read_exact(stream, buf.data(), buf.size());
    return decode_name_length(buf);
}

// Reads `length` name bytes; invalid UTF-8 is replaced, not rejected.
template <typename SyncReadStream>
std::string read_name(SyncReadStream& stream, uint16_t length) {
    std::string name(length, '\0');
    read_exact(stream, &name[0], name.size());
    return replace_invalid_utf8(name);
}

template <typename SyncReadStream>
uint64_t read_file_size(SyncReadStream& stream) {
    std::array<uint8_t, FILE_SIZE_BYTES> buf;
    read_exact(stream, buf.data(), buf.size());
    return decode_file_size(buf);
}

// Three sequential exact reads: 2 bytes, name_len bytes, 8 bytes.
template <typename SyncReadStream>
TransferHeader decode_header(SyncReadStream& stream) {
    TransferHeader header;
    uint16_t length = read_name_length(stream);
    header.filename = read_name(stream, length);
    header.file_size = read_file_size(stream);
    return header;
}

} // namespace protocol
