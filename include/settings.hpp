#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace settings {

class SettingsError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

constexpr unsigned int MAX_WORKER_THREADS = 256;

struct Settings {
    bool trace = false;
    std::optional<std::vector<std::string>> enabled_subcommands; // unset = every discovered handler
    std::string listen_address = "127.0.0.1";
    unsigned short port = 1445;
    unsigned int worker_threads = 2; // 1..MAX_WORKER_THREADS
};

void from_json(const nlohmann::json& j, Settings& s);
void to_json(nlohmann::json& j, const Settings& s);

// Every key is optional; a missing key keeps its default.
// Throws SettingsError on malformed JSON or a value of the wrong type.
Settings parse(const std::string& text);
Settings load(const std::string& path);

} // namespace settings
