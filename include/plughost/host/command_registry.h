#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include <plughost/core/types.h>
#include <plughost/host/value.h>

namespace plughost::host {

/**
 * Invocation signature declared by a plugin for one command
 */
struct CommandSignature {
    std::vector<ValueKind> args;
    bool variadic{false}; // trailing extra tokens are passed as strings
    ValueKind returns{ValueKind::None};
    std::map<int32_t, std::string> errors; // declared error code -> name
};

/**
 * Live registration of a plugin command.
 *
 * Holds only the owning PluginId and the in-plugin command index, never a pointer into
 * the plugin, so that unloading invalidates registrations by removal.
 */
struct CommandSpec {
    std::string name;
    PluginId plugin{0};
    uint32_t entry{0};
    std::string usage;
    CommandSignature signature;
};

/**
 * Name -> CommandSpec map. First registration of a name wins.
 */
class CommandRegistry {
public:
    CommandRegistry() = default;

    /**
     * Insert `spec`.
     * @return NameCollision if the name is live or reserved by the host
     */
    Result<void> registerCommand(CommandSpec spec);

    /**
     * Read-only lookup; absence is not an error at this layer
     */
    std::optional<CommandSpec> resolve(const std::string& name) const;

    /**
     * Remove every command owned by `plugin`. Idempotent.
     * @return number of entries removed
     */
    std::size_t unregisterAll(PluginId plugin);

    // Host built-in names are never available to plugins
    void reserve(const std::string& name);
    bool isReserved(const std::string& name) const;

    // Sorted by name
    std::vector<CommandSpec> commands() const;
    std::vector<std::string> commandsOf(PluginId plugin) const;

    std::size_t size() const { return commands_.size(); }
    bool empty() const { return commands_.empty(); }

private:
    std::map<std::string, CommandSpec> commands_;
    std::set<std::string> reserved_;
};

} // namespace plughost::host
