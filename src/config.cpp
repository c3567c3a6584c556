#include "config.hpp"
#include <fstream>
#include <stdexcept>
#include <string>

namespace config {

Settings defaults(bool secure) {
    Settings s;
    s.secure = secure;
    s.chunk_size = DEFAULT_CHUNK_SIZE;
    s.receive_dir = secure ? "received_tls" : "received";
    s.metrics_file = secure ? "metrics_tls.csv" : "metrics_plain.csv";
    // Self-signed deployment: the server certificate doubles as the trust anchor.
    s.tls.certificate_file = "certs/cert.pem";
    s.tls.private_key_file = "certs/key.pem";
    s.tls.trust_anchor_file = "certs/cert.pem";
    return s;
}

void from_json(const nlohmann::json& j, Settings& settings) {
    if (j.contains("chunk_size")) {
        // A negative number would otherwise wrap through get<std::size_t>().
        const nlohmann::json& chunk = j.at("chunk_size");
        if (!chunk.is_number_unsigned()) {
            throw std::invalid_argument("chunk_size must be a non-negative integer, got " + chunk.dump());
        }
        settings.chunk_size = chunk.get<std::size_t>();
    }
    settings.receive_dir = j.value("receive_dir", settings.receive_dir);
    settings.metrics_file = j.value("metrics_file", settings.metrics_file);

    if (j.contains("tls")) {
        const nlohmann::json& tls = j.at("tls");
        settings.tls.trust_anchor_file = tls.value("trust_anchor", settings.tls.trust_anchor_file);
        settings.tls.certificate_file = tls.value("certificate", settings.tls.certificate_file);
        settings.tls.private_key_file = tls.value("private_key", settings.tls.private_key_file);
    }
}

void load_file(const std::string& path, Settings& settings) {
    std::ifstream in(path);
    if (!in.is_open()) {
        throw std::runtime_error("Could not open config file: " + path);
    }

    try {
        nlohmann::json j = nlohmann::json::parse(in);
        from_json(j, settings);
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error("Invalid config file " + path + ": " + e.what());
    } catch (const std::invalid_argument& e) {
        throw std::runtime_error("Invalid config file " + path + ": " + e.what());
    }
}

void validate(const Settings& settings) {
    if (settings.chunk_size == 0) {
        throw std::invalid_argument("chunk_size must be greater than zero");
    }
    if (settings.chunk_size > MAX_CHUNK_SIZE) {
        throw std::invalid_argument("chunk_size must be at most " + std::to_string(MAX_CHUNK_SIZE));
    }
    if (settings.receive_dir.empty()) {
        throw std::invalid_argument("receive_dir must not be empty");
    }
    if (settings.metrics_file.empty()) {
        throw std::invalid_argument("metrics_file must not be empty");
    }
}

unsigned long long parse_unsigned(const std::string& text, unsigned long long max,
                                  const std::string& what) {
    // stoull alone would accept "5x", " 5" and "-1" (wrapped).
    if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos) {
        throw std::invalid_argument("Invalid " + what + ": '" + text + "'");
    }
    std::size_t pos = 0;
    unsigned long long value = 0;
    try {
        value = std::stoull(text, &pos);
    } catch (const std::out_of_range&) {
        throw std::invalid_argument(what + " out of range: " + text);
    }
    if (pos != text.size()) {
        throw std::invalid_argument("Invalid " + what + ": '" + text + "'");
    }
    if (value > max) {
        throw std::invalid_argument(what + " out of range: " + text);
    }
    return value;
}

} // namespace config
