#include "settings.hpp"
#include <cstdint>
#include <fstream>
#include <sstream>

namespace settings {

namespace {

template <typename T>
void read_key(const nlohmann::json& j, const char* key, T& out) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return;
    }
    try {
        out = it->get<T>();
    } catch (const nlohmann::json::exception& e) {
        throw SettingsError(std::string("setting '") + key + "': " + e.what());
    }
}

// Non-negative integer no larger than max; get<unsigned>() alone would wrap -1.
template <typename T>
void read_unsigned(const nlohmann::json& j, const char* key, uint64_t max, T& out) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return;
    }
    if (!it->is_number_unsigned()) {
        throw SettingsError(std::string("setting '") + key + "': expected a non-negative integer, got " +
                            it->dump());
    }
    const uint64_t value = it->get<uint64_t>();
    if (value > max) {
        throw SettingsError(std::string("setting '") + key + "': " + std::to_string(value) +
                            " exceeds the maximum of " + std::to_string(max));
    }
    out = static_cast<T>(value);
}

} // namespace

void from_json(const nlohmann::json& j, Settings& s) {
    if (!j.is_object()) {
        throw SettingsError("settings must be a JSON object");
    }
    read_key(j, "trace", s.trace);
    read_key(j, "listen_address", s.listen_address);
    read_unsigned(j, "worker_threads", MAX_WORKER_THREADS, s.worker_threads);
    read_unsigned(j, "port", 0xFFFF, s.port);

    if (j.contains("enabled_subcommands") && !j.at("enabled_subcommands").is_null()) {
        std::vector<std::string> names;
        read_key(j, "enabled_subcommands", names);
        s.enabled_subcommands = std::move(names);
    }

    if (s.worker_threads == 0) {
        throw SettingsError("setting 'worker_threads': must be at least 1");
    }
}

void to_json(nlohmann::json& j, const Settings& s) {
    j = nlohmann::json{
        {"trace", s.trace},
        {"listen_address", s.listen_address},
        {"port", s.port},
        {"worker_threads", s.worker_threads}
    };
    if (s.enabled_subcommands) {
        j["enabled_subcommands"] = *s.enabled_subcommands;
    }
}

Settings parse(const std::string& text) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        throw SettingsError(std::string("settings are not valid JSON: ") + e.what());
    }
    Settings s;
    from_json(j, s);
    return s;
}

Settings load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw SettingsError("Could not open settings file: " + path);
    }
    std::ostringstream contents;
    contents << file.rdbuf();
    return parse(contents.str());
}

} // namespace settings
