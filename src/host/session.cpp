#include <plughost/host/session.h>

#include <vector>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <plughost/version.hpp>

namespace plughost::host {

Session::InvocationGuard::InvocationGuard(Session& session, PluginId plugin)
    : session_(session), previous_(session.inFlight_) {
    session_.inFlight_ = plugin;
}

Session::InvocationGuard::~InvocationGuard() {
    session_.inFlight_ = previous_;
}

Session::Session() = default;

Session::Session(AbiPluginLoader loader) : loader_(std::move(loader)) {}

Session::~Session() {
    unloadAll();
}

Result<PluginId> Session::load(const std::filesystem::path& path) {
    spdlog::info("Loading plugin: {}", path.string());

    // A second dlopen of the same file shares the module image with the first handle.
    if (auto resolved = loader_.resolvePath(path)) {
        for (const auto& [loadedId, loaded] : plugins_) {
            if (loaded->descriptor().path == resolved.value()) {
                return Error{ErrorCode::BindFailed, "plugin " + resolved.value().string() +
                                                        " is already loaded as id " +
                                                        std::to_string(loadedId)};
            }
        }
    }

    auto bound = loader_.bind(path);
    if (!bound) {
        spdlog::warn("Failed to load plugin {}: {}", path.string(), bound.error().message);
        return bound.error();
    }
    auto handle = std::move(bound).value();

    // The id is only consumed once the plugin accepted initialization.
    const PluginId id = nextId_;
    nlohmann::json config = {{"host", "plughost"},
                             {"host_version", PLUGHOST_VERSION_STRING},
                             {"plugin_id", id},
                             {"abi_version", PLUGHOST_PLUGIN_ABI_VERSION}};
    if (auto init = handle->initialize(config.dump()); !init) {
        spdlog::warn("Failed to load plugin {}: {}", path.string(), init.error().message);
        return init.error();
    }
    ++nextId_;
    lastSkips_.clear();

    const auto& desc = handle->descriptor();
    for (uint32_t i = 0; i < desc.commands.size(); ++i) {
        const auto& cmd = desc.commands[i];
        CommandSpec spec;
        spec.name = cmd.name;
        spec.plugin = id;
        spec.entry = i;
        spec.usage = cmd.usage;
        spec.signature = cmd.signature;
        if (auto r = registry_.registerCommand(std::move(spec)); !r) {
            spdlog::warn("Plugin '{}': skipping command '{}': {}", desc.name, cmd.name,
                         r.error().message);
            lastSkips_.push_back(SkipInfo{cmd.name, r.error().message});
        }
    }

    spdlog::info("Loaded plugin '{}' {} as id {} ({} command(s), {} skipped)", desc.name,
                 desc.version, id, desc.commands.size() - lastSkips_.size(), lastSkips_.size());
    plugins_.emplace(id, std::move(handle));
    return id;
}

Result<void> Session::unload(PluginId id) {
    auto it = plugins_.find(id);
    if (it == plugins_.end())
        return Error{ErrorCode::NotFound, "no plugin with id " + std::to_string(id)};
    if (inFlight_ && *inFlight_ == id)
        return Error{ErrorCode::InUse,
                     "plugin " + std::to_string(id) + " has a command in flight"};

    // Unregister first so nothing can resolve to a plugin that is being unbound.
    registry_.unregisterAll(id);

    auto name = it->second->name();
    auto handle = std::move(it->second);
    plugins_.erase(it);
    handle.reset();
    spdlog::info("Unloaded plugin '{}' (id {})", name, id);
    return Result<void>();
}

std::size_t Session::unloadAll() {
    std::vector<PluginId> ids;
    ids.reserve(plugins_.size());
    for (const auto& [id, handle] : plugins_)
        ids.push_back(id);

    std::size_t unloaded = 0;
    for (auto id : ids) {
        if (auto r = unload(id); r) {
            ++unloaded;
        } else {
            spdlog::warn("Failed to unload plugin {}: {}", id, r.error().message);
        }
    }
    return unloaded;
}

Result<Value> Session::invoke(const CommandSpec& spec, const std::vector<Argument>& args) {
    auto it = plugins_.find(spec.plugin);
    if (it == plugins_.end()) {
        return Error{ErrorCode::UnknownCommand,
                     "command '" + spec.name + "' belongs to a plugin that is not loaded"};
    }
    const PluginHandle& handle = *it->second;

    auto abiArgs = toAbiValues(args);
    std::vector<char> buffer(outputBufferSize_);
    plughost_result_t out{};
    int32_t rc = PLUGHOST_PLUGIN_OK;
    {
        InvocationGuard guard(*this, spec.plugin);
        for (int attempt = 0; attempt < 2; ++attempt) {
            out = plughost_result_t{};
            out.buf = buffer.data();
            out.cap = buffer.size();
            rc = handle.invoke(spec.entry, abiArgs.data(), abiArgs.size(), &out);
            if (rc != PLUGHOST_PLUGIN_ERR_BUFFER_TOO_SMALL || out.len <= buffer.size())
                break;
            if (out.len > maxOutputBufferSize_) {
                spdlog::warn("Plugin '{}' asked for a {} byte result buffer for '{}' (limit {})",
                             handle.name(), out.len, spec.name, maxOutputBufferSize_);
                return Error{ErrorCode::PluginReported,
                             "result of '" + spec.name + "' exceeds the " +
                                 std::to_string(maxOutputBufferSize_) + " byte limit",
                             PLUGHOST_PLUGIN_ERR_BUFFER_TOO_SMALL};
            }
            spdlog::debug("Growing result buffer for '{}' to {} bytes", spec.name, out.len);
            buffer.resize(out.len);
        }
    }

    if (rc != PLUGHOST_PLUGIN_OK) {
        spdlog::warn("Plugin '{}' invoke of '{}' returned protocol code {}", handle.name(),
                     spec.name, rc);
        return Error{ErrorCode::PluginReported,
                     "plugin '" + handle.name() + "' failed to execute '" + spec.name + "'", rc};
    }

    if (out.status != PLUGHOST_RESULT_OK) {
        std::string message = "command '" + spec.name + "' failed with code " +
                              std::to_string(out.error_code);
        auto known = spec.signature.errors.find(out.error_code);
        if (known != spec.signature.errors.end()) {
            message += " (" + known->second + ")";
        } else {
            spdlog::debug("Plugin '{}' reported undeclared error code {} for '{}'", handle.name(),
                          out.error_code, spec.name);
        }
        return Error{ErrorCode::PluginReported, std::move(message), out.error_code};
    }

    Value v;
    v.kind = spec.signature.returns;
    switch (v.kind) {
        case ValueKind::None:
            break;
        case ValueKind::String:
            if (out.len > buffer.size()) {
                return Error{ErrorCode::PluginReported,
                             "plugin '" + handle.name() + "' overran the result buffer",
                             PLUGHOST_PLUGIN_ERR_BUFFER_TOO_SMALL};
            }
            v.text.assign(buffer.data(), out.len);
            break;
        case ValueKind::Int:
            v.i64 = out.as.i64;
            break;
        case ValueKind::Float:
            v.f64 = out.as.f64;
            break;
        case ValueKind::Bool:
            v.boolean = out.as.boolean != 0;
            break;
    }
    return v;
}

std::vector<LoadedPluginInfo> Session::list() const {
    std::vector<LoadedPluginInfo> out;
    out.reserve(plugins_.size());
    for (const auto& [id, handle] : plugins_) {
        const auto& d = handle->descriptor();
        LoadedPluginInfo info;
        info.id = id;
        info.name = d.name;
        info.version = d.version;
        info.abiVersion = d.abiVersion;
        info.path = d.path;
        info.commands = registry_.commandsOf(id);
        out.push_back(std::move(info));
    }
    return out;
}

const PluginHandle* Session::find(PluginId id) const {
    auto it = plugins_.find(id);
    return it == plugins_.end() ? nullptr : it->second.get();
}

std::optional<std::string> Session::prompt() const {
    // std::map iterates in id order, i.e. load order.
    for (const auto& [id, handle] : plugins_) {
        if (!handle->hasPrompt())
            continue;
        if (auto p = handle->prompt())
            return p;
    }
    return std::nullopt;
}

} // namespace plughost::host
