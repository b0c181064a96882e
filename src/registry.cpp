#include "registry.hpp"
#include <algorithm>
#include <iterator>
#include <stdexcept>
#include "protocol/nt_transact.hpp"

namespace nttrans {

StaticHandlerSource& StaticHandlerSource::add(std::string name, SubcommandHandler handler) {
    handlers_.emplace_back(std::move(name), std::move(handler));
    return *this;
}

void StaticHandlerSource::enumerate(HandlerMap& out) const {
    for (const auto& entry : handlers_) {
        out[entry.first] = entry.second;
    }
}

ConfiguredHandlerSource::ConfiguredHandlerSource(const HandlerSource& catalog,
                                                 std::optional<std::vector<std::string>> enabled)
    : catalog_(catalog), enabled_(std::move(enabled)) {}

void ConfiguredHandlerSource::enumerate(HandlerMap& out) const {
    HandlerMap available;
    catalog_.enumerate(available);

    if (!enabled_) {
        for (auto& entry : available) {
            out[entry.first] = std::move(entry.second);
        }
        return;
    }

    for (const auto& name : *enabled_) {
        auto it = available.find(name);
        if (it == available.end()) {
            throw std::invalid_argument("enabled subcommand '" + name +
                                        "' has no handler in the catalog");
        }
        out[name] = it->second;
    }
}

SubcommandRegistry::SubcommandRegistry(const HandlerSource& source) {
    source.enumerate(handlers_);
    for (const auto& entry : handlers_) {
        if (!protocol::subcommand_code(entry.first)) {
            throw std::invalid_argument("'" + entry.first + "' is not an NT_TRANSACT subcommand");
        }
        if (!entry.second) {
            throw std::invalid_argument("empty handler registered for '" + entry.first + "'");
        }
    }
}

const SubcommandHandler* SubcommandRegistry::find(const std::string& name) const {
    auto it = handlers_.find(name);
    return it == handlers_.end() ? nullptr : &it->second;
}

std::vector<std::string> SubcommandRegistry::names() const {
    std::vector<std::string> out;
    out.reserve(handlers_.size());
    std::transform(handlers_.begin(), handlers_.end(), std::back_inserter(out),
                   [](const HandlerMap::value_type& entry) { return entry.first; });
    return out;
}

} // namespace nttrans
