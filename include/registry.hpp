#pragma once

#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "subcommand.hpp"

namespace nttrans {

using HandlerMap = std::map<std::string, SubcommandHandler>;

// Discovery strategy: somewhere that knows which subcommand handlers exist.
class HandlerSource {
public:
    virtual ~HandlerSource() = default;
    virtual void enumerate(HandlerMap& out) const = 0;
};

// Handlers listed explicitly at construction time
class StaticHandlerSource : public HandlerSource {
public:
    StaticHandlerSource& add(std::string name, SubcommandHandler handler);
    void enumerate(HandlerMap& out) const override;

private:
    std::vector<std::pair<std::string, SubcommandHandler>> handlers_;
};

// Narrows a catalog down to the names enabled by configuration.
// std::nullopt keeps the whole catalog.
class ConfiguredHandlerSource : public HandlerSource {
public:
    ConfiguredHandlerSource(const HandlerSource& catalog,
                            std::optional<std::vector<std::string>> enabled);
    void enumerate(HandlerMap& out) const override;

private:
    const HandlerSource& catalog_;
    std::optional<std::vector<std::string>> enabled_;
};

// Subcommand name -> handler. Filled once from a source, read-only afterwards,
// so concurrent lookups need no locking.
class SubcommandRegistry {
public:
    // Throws std::invalid_argument for names outside the NT_TRANSACT table.
    explicit SubcommandRegistry(const HandlerSource& source);

    const SubcommandHandler* find(const std::string& name) const;
    bool contains(const std::string& name) const { return find(name) != nullptr; }
    std::size_t size() const { return handlers_.size(); }
    std::vector<std::string> names() const;

private:
    HandlerMap handlers_;
};

} // namespace nttrans
