#include "transfer.hpp"

namespace transfer {

const char* to_string(ReceiveState state) {
    switch (state) {
    case ReceiveState::IDLE:              return "IDLE";
    case ReceiveState::AWAITING_NAME_LEN: return "AWAITING_NAME_LEN";
    case ReceiveState::AWAITING_NAME:     return "AWAITING_NAME";
    case ReceiveState::AWAITING_SIZE:     return "AWAITING_SIZE";
    case ReceiveState::RECEIVING_PAYLOAD: return "RECEIVING_PAYLOAD";
    case ReceiveState::COMPLETE:          return "COMPLETE";
    case ReceiveState::FAILED:            return "FAILED";
    }
    return "UNKNOWN";
}

std::filesystem::path resolve_destination(const std::string& receive_dir, const std::string& filename) {
    if (filename.find('\0') != std::string::npos) {
        throw protocol::TransferError(protocol::ErrorKind::INVALID_FILENAME,
                                      "File name contains a NUL byte");
    }

    std::filesystem::path leaf = std::filesystem::path(filename).filename();
    if (leaf.empty() || leaf == "." || leaf == "..") {
        throw protocol::TransferError(protocol::ErrorKind::INVALID_FILENAME,
                                      "Unusable file name: '" + filename + "'");
    }
    return std::filesystem::path(receive_dir) / leaf;
}

InboundTransfer::InboundTransfer(std::string receive_dir, std::size_t chunk_size,
                                 HeaderCallback on_header)
    : receive_dir_(std::move(receive_dir)),
      chunk_size_(chunk_size),
      on_header_(std::move(on_header)) {}

} // namespace transfer
