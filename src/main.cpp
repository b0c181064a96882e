#include <cctype>
#include <csignal>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <boost/asio/signal_set.hpp>
#include <nlohmann/json.hpp>
#include "networking.hpp"
#include "protocol/describe.hpp"
#include "protocol/payload.hpp"
#include "protocol/smb_message.hpp"
#include "registry.hpp"
#include "settings.hpp"

namespace {

protocol::Bytes read_hex_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Could not open file for reading: " + path);
    }
    std::string digits;
    char c;
    while (file.get(c)) {
        if (std::isxdigit(static_cast<unsigned char>(c))) {
            digits += c;
        } else if (!std::isspace(static_cast<unsigned char>(c))) {
            throw std::runtime_error(std::string("unexpected character '") + c + "' in hex dump");
        }
    }
    if (digits.size() % 2 != 0) {
        throw std::runtime_error("hex dump has an odd number of digits");
    }
    protocol::Bytes bytes;
    bytes.reserve(digits.size() / 2);
    for (std::size_t i = 0; i < digits.size(); i += 2) {
        bytes.push_back(static_cast<uint8_t>(std::stoul(digits.substr(i, 2), nullptr, 16)));
    }
    return bytes;
}

int inspect(const std::string& path) {
    protocol::SmbMessage message = protocol::decode_message(read_hex_file(path));
    protocol::TransactionHeader header =
        protocol::decode_transaction_header(message.context.command_params());

    nlohmann::json out;
    out["smb"] = message.header;
    out["transaction"] = header;
    try {
        out["payload"] = protocol::locate_payload(message.context, header);
    } catch (const protocol::MalformedOffset& e) {
        out["payload_error"] = e.what();
    }
    std::cout << out.dump(2) << "\n";
    return 0;
}

int layout(const std::string& params_length, const std::string& data_length,
           const std::string& setup_length) {
    protocol::ResponseLayout result = protocol::compute_response_layout(
        std::stoul(params_length), std::stoul(data_length), std::stoul(setup_length));
    nlohmann::json out = result;
    std::cout << out.dump(2) << "\n";
    return 0;
}

int serve(const settings::Settings& config) {
    // Subcommand implementations are linked in by embedding applications;
    // the stand-alone binary ships an empty catalog.
    nttrans::StaticHandlerSource catalog;
    nttrans::ConfiguredHandlerSource source(catalog, config.enabled_subcommands);
    nttrans::SubcommandRegistry registry(source);

    networking::SmbServer server(config, registry);
    server.start();

    boost::asio::io_context signals_context;
    boost::asio::signal_set signals(signals_context, SIGINT, SIGTERM);
    signals.async_wait([&server](const boost::system::error_code&, int) {
        std::cout << "Shutting down.\n";
        server.stop();
    });
    signals_context.run();
    return 0;
}

void usage() {
    std::cerr << "Usage:\n"
              << "  smbtx inspect <hexdump-file>\n"
              << "  smbtx layout <params_len> <data_len> [setup_len]\n"
              << "  smbtx serve [settings.json]\n";
}

} // namespace

int main(int argc, char* argv[]) {
    try {
        if (argc >= 3 && std::string(argv[1]) == "inspect") {
            return inspect(argv[2]);
        } else if (argc >= 4 && std::string(argv[1]) == "layout") {
            return layout(argv[2], argv[3], argc >= 5 ? argv[4] : "0");
        } else if (argc >= 2 && std::string(argv[1]) == "serve") {
            settings::Settings config = argc >= 3 ? settings::load(argv[2]) : settings::Settings{};
            return serve(config);
        }
        usage();
        return 1;
    } catch (std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
