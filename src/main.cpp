#include <iostream>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>
#include "config.hpp"
#include "networking.hpp"

namespace {

void print_usage() {
    std::cerr << "Usage:\n"
              << "  wiredrop send <address> <port> <file> [--repeat N] [--tls] [--ca FILE]\n"
              << "                [--chunk-size N] [--config FILE]\n"
              << "  wiredrop serve <port> [--host ADDR] [--tls] [--cert FILE] [--key FILE]\n"
              << "                 [--dir DIR] [--metrics FILE] [--chunk-size N] [--config FILE]\n";
}

struct CommandLine {
    std::vector<std::string> positional;
    std::map<std::string, std::string> options;
    bool tls = false;
};

// Everything after the subcommand: "--tls" is a switch, other "--x" take a value.
bool parse(int argc, char* argv[], CommandLine& cmd) {
    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--tls") {
            cmd.tls = true;
        } else if (arg.rfind("--", 0) == 0) {
            if (i + 1 >= argc) {
                std::cerr << "Missing value for " << arg << "\n";
                return false;
            }
            cmd.options[arg] = argv[++i];
        } else {
            cmd.positional.push_back(arg);
        }
    }
    return true;
}

unsigned short parse_port(const std::string& text) {
    return static_cast<unsigned short>(config::parse_unsigned(text, 65535, "port"));
}

config::Settings build_settings(const CommandLine& cmd) {
    config::Settings settings = config::defaults(cmd.tls);

    auto it = cmd.options.find("--config");
    if (it != cmd.options.end()) {
        config::load_file(it->second, settings);
    }

    // Flags override the config file.
    for (const auto& [flag, value] : cmd.options) {
        if (flag == "--chunk-size") {
            settings.chunk_size = static_cast<std::size_t>(
                config::parse_unsigned(value, config::MAX_CHUNK_SIZE, "chunk size"));
        }
        else if (flag == "--dir") settings.receive_dir = value;
        else if (flag == "--metrics") settings.metrics_file = value;
        else if (flag == "--ca") settings.tls.trust_anchor_file = value;
        else if (flag == "--cert") settings.tls.certificate_file = value;
        else if (flag == "--key") settings.tls.private_key_file = value;
        else if (flag != "--config" && flag != "--repeat" && flag != "--host") {
            throw std::invalid_argument("Unknown option: " + flag);
        }
    }

    config::validate(settings);
    return settings;
}

int run_send(const CommandLine& cmd) {
    if (cmd.positional.size() != 3) {
        print_usage();
        return 1;
    }
    config::Settings settings = build_settings(cmd);

    unsigned int repeat = 1;
    auto it = cmd.options.find("--repeat");
    if (it != cmd.options.end()) {
        repeat = static_cast<unsigned int>(config::parse_unsigned(it->second, 1000000, "repeat count"));
        if (repeat < 1) {
            std::cerr << "--repeat must be at least 1\n";
            return 1;
        }
    }
    unsigned short port = parse_port(cmd.positional[1]);

    networking::ClientCallbacks callbacks;
    callbacks.on_status = [](const std::string& msg) { std::cout << "[send] " << msg << std::endl; };
    callbacks.on_error = [](const std::string& msg) { std::cerr << "[send] " << msg << std::endl; };

    networking::Client client(settings, callbacks);
    return client.run(cmd.positional[0], port, cmd.positional[2], repeat);
}

int run_serve(const CommandLine& cmd) {
    if (cmd.positional.size() != 1) {
        print_usage();
        return 1;
    }
    config::Settings settings = build_settings(cmd);
    unsigned short port = parse_port(cmd.positional[0]);

    std::string host = "0.0.0.0";
    auto it = cmd.options.find("--host");
    if (it != cmd.options.end()) host = it->second;

    const std::string tag = settings.secure ? "(TLS) " : "";
    networking::ServerCallbacks callbacks;
    callbacks.on_ready = [&settings, tag](const std::string& address, unsigned short port) {
        std::cout << "[serve] " << tag << "Listening on " << address << ":" << port << "\n"
                  << "[serve] Received files go to: " << settings.receive_dir << "/\n"
                  << "[serve] Metrics go to: " << settings.metrics_file << "\n" << std::endl;
    };
    callbacks.on_status = [](const std::string& msg) { std::cout << "[serve] " << msg << std::endl; };
    callbacks.on_complete = [](const metrics::TransferRecord& record) {
        std::cout << "[serve] Recorded " << record.filename << " from " << record.client_address
                  << " (" << record.throughput_bytes_per_second << " B/s)\n" << std::endl;
    };
    callbacks.on_error = [](const std::string& msg) { std::cerr << "[serve] " << msg << std::endl; };

    if (settings.secure) {
        std::cout << "[serve] Loading certificate " << settings.tls.certificate_file
                  << " and key " << settings.tls.private_key_file << std::endl;
    }
    networking::Server server(host, port, settings, callbacks);
    server.run();
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return 1;
    }

    std::string command = argv[1];
    CommandLine cmd;
    if (!parse(argc, argv, cmd)) {
        print_usage();
        return 1;
    }

    try {
        if (command == "send") return run_send(cmd);
        if (command == "serve") return run_serve(cmd);
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return 1;
    }

    print_usage();
    return 1;
}
