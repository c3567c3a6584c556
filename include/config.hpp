#pragma once

#include <cstddef>
#include <string>
#include <nlohmann/json.hpp>
#include "security.hpp"

namespace config {

constexpr std::size_t DEFAULT_CHUNK_SIZE = 4096;
constexpr std::size_t MAX_CHUNK_SIZE = 16 * 1024 * 1024;

struct Settings {
    bool secure = false;
    std::size_t chunk_size = DEFAULT_CHUNK_SIZE;
    std::string receive_dir;
    std::string metrics_file;
    security::SecureChannelConfig tls;
};

// Plain: received/ + metrics_plain.csv. TLS: received_tls/ + metrics_tls.csv.
// Both point the TLS material at certs/cert.pem and certs/key.pem.
Settings defaults(bool secure);

// Overlays keys present in the JSON file; absent keys keep their value.
// Throws std::runtime_error if the file cannot be opened or parsed.
void load_file(const std::string& path, Settings& settings);

// Throws std::invalid_argument on unusable values, including a chunk_size
// outside 1..MAX_CHUNK_SIZE.
void validate(const Settings& settings);

// Strict decimal parse for command-line numbers: digits only, no sign, no
// trailing text, at most `max`. Throws std::invalid_argument naming `what`.
unsigned long long parse_unsigned(const std::string& text, unsigned long long max,
                                  const std::string& what);

void from_json(const nlohmann::json& j, Settings& settings);

} // namespace config
