#pragma once

#include <stdexcept>
#include <string>

namespace protocol {

enum class ErrorKind {
    NONE,
    FILE_NOT_FOUND,     // sender pre-flight
    NAME_TOO_LONG,      // encoded name exceeds 65535 bytes
    INCOMPLETE_STREAM,  // peer closed before an exact read completed
    HANDSHAKE_FAILURE,  // TLS negotiation / certificate problem
    IO_FAILURE,         // disk or socket fault
    INVALID_FILENAME    // name has no usable final component
};

const char* to_string(ErrorKind kind);

class TransferError : public std::runtime_error {
public:
    TransferError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

} // namespace protocol
