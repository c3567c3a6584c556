#include "protocol/errors.hpp"

namespace protocol {

const char* to_string(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::NONE:              return "None";
    case ErrorKind::FILE_NOT_FOUND:    return "FileNotFound";
    case ErrorKind::NAME_TOO_LONG:     return "NameTooLong";
    case ErrorKind::INCOMPLETE_STREAM: return "IncompleteStream";
    case ErrorKind::HANDSHAKE_FAILURE: return "HandshakeFailure";
    case ErrorKind::IO_FAILURE:        return "IOFailure";
    case ErrorKind::INVALID_FILENAME:  return "InvalidFilename";
    }
    return "Unknown";
}

} // namespace protocol
