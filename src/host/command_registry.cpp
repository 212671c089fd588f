#include <plughost/host/command_registry.h>

#include <spdlog/spdlog.h>

namespace plughost::host {

Result<void> CommandRegistry::registerCommand(CommandSpec spec) {
    if (reserved_.count(spec.name)) {
        return Error{ErrorCode::NameCollision,
                     "command '" + spec.name + "' is reserved by the host"};
    }
    auto it = commands_.find(spec.name);
    if (it != commands_.end()) {
        return Error{ErrorCode::NameCollision,
                     "command '" + spec.name + "' is already registered by plugin " +
                         std::to_string(it->second.plugin)};
    }
    spdlog::debug("Registered command '{}' -> plugin {} entry {}", spec.name, spec.plugin,
                  spec.entry);
    auto name = spec.name;
    commands_.emplace(std::move(name), std::move(spec));
    return Result<void>();
}

std::optional<CommandSpec> CommandRegistry::resolve(const std::string& name) const {
    auto it = commands_.find(name);
    if (it == commands_.end())
        return std::nullopt;
    return it->second;
}

std::size_t CommandRegistry::unregisterAll(PluginId plugin) {
    std::size_t removed = 0;
    for (auto it = commands_.begin(); it != commands_.end();) {
        if (it->second.plugin == plugin) {
            it = commands_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    if (removed)
        spdlog::debug("Unregistered {} command(s) of plugin {}", removed, plugin);
    return removed;
}

void CommandRegistry::reserve(const std::string& name) {
    reserved_.insert(name);
}

bool CommandRegistry::isReserved(const std::string& name) const {
    return reserved_.count(name) != 0;
}

std::vector<CommandSpec> CommandRegistry::commands() const {
    std::vector<CommandSpec> out;
    out.reserve(commands_.size());
    for (const auto& [name, spec] : commands_)
        out.push_back(spec);
    return out;
}

std::vector<std::string> CommandRegistry::commandsOf(PluginId plugin) const {
    std::vector<std::string> out;
    for (const auto& [name, spec] : commands_) {
        if (spec.plugin == plugin)
            out.push_back(name);
    }
    return out;
}

} // namespace plughost::host
