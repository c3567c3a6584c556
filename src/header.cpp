#include "protocol/header.hpp"
#include <arpa/inet.h>
#include <cstring>

namespace protocol {

std::vector<uint8_t> encode_header(const std::string& filename, uint64_t file_size) {
    if (filename.size() > MAX_NAME_LENGTH) {
        throw TransferError(ErrorKind::NAME_TOO_LONG,
                            "File name too long (" + std::to_string(filename.size()) +
                            " bytes, max 65535 in UTF-8)");
    }

    std::vector<uint8_t> buffer(NAME_LENGTH_BYTES + filename.size() + FILE_SIZE_BYTES);
    uint16_t name_len = htons(static_cast<uint16_t>(filename.size()));
    std::memcpy(buffer.data(), &name_len, NAME_LENGTH_BYTES);
    if (!filename.empty()) {
        std::memcpy(buffer.data() + NAME_LENGTH_BYTES, filename.data(), filename.size());
    }

    // No htonll on glibc; emit the 64-bit size most significant byte first.
    uint8_t* size_out = buffer.data() + NAME_LENGTH_BYTES + filename.size();
    for (std::size_t i = 0; i < FILE_SIZE_BYTES; ++i) {
        size_out[i] = static_cast<uint8_t>(file_size >> (8 * (FILE_SIZE_BYTES - 1 - i)));
    }
    return buffer;
}

uint16_t decode_name_length(const std::array<uint8_t, NAME_LENGTH_BYTES>& buffer) {
    uint16_t name_len;
    std::memcpy(&name_len, buffer.data(), NAME_LENGTH_BYTES);
    return ntohs(name_len);
}

uint64_t decode_file_size(const std::array<uint8_t, FILE_SIZE_BYTES>& buffer) {
    uint64_t size = 0;
    for (uint8_t byte : buffer) {
        size = (size << 8) | byte;
    }
    return size;
}

std::string replace_invalid_utf8(const std::string& bytes) {
    static const char REPLACEMENT[] = "\xEF\xBF\xBD";
    std::string out;
    out.reserve(bytes.size());

    const std::size_t n = bytes.size();
    std::size_t i = 0;
    while (i < n) {
        unsigned char lead = static_cast<unsigned char>(bytes[i]);
        if (lead < 0x80) {
            out += static_cast<char>(lead);
            ++i;
            continue;
        }

        // Well-formed sequences per Unicode table 3-7: the first continuation
        // byte has a narrower range after E0, ED, F0 and F4.
        std::size_t need = 0;
        unsigned char lo = 0x80, hi = 0xBF;
        if (lead >= 0xC2 && lead <= 0xDF) {
            need = 1;
        } else if (lead == 0xE0) {
            need = 2; lo = 0xA0;
        } else if ((lead >= 0xE1 && lead <= 0xEC) || lead == 0xEE || lead == 0xEF) {
            need = 2;
        } else if (lead == 0xED) {
            need = 2; hi = 0x9F;
        } else if (lead == 0xF0) {
            need = 3; lo = 0x90;
        } else if (lead >= 0xF1 && lead <= 0xF3) {
            need = 3;
        } else if (lead == 0xF4) {
            need = 3; hi = 0x8F;
        } else {
            out += REPLACEMENT;
            ++i;
            continue;
        }

        std::size_t j = 1;
        for (; j <= need && i + j < n; ++j) {
            unsigned char c = static_cast<unsigned char>(bytes[i + j]);
            if (c < lo || c > hi) break;
            lo = 0x80;
            hi = 0xBF;
        }
        if (j > need) {
            out.append(bytes, i, need + 1);
        } else {
            // Lead byte plus the continuations that were still valid.
            out += REPLACEMENT;
        }
        i += j;
    }
    return out;
}

} // namespace protocol
