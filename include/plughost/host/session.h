#pragma once

#include <cstddef>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <plughost/core/types.h>
#include <plughost/host/abi_plugin_loader.h>
#include <plughost/host/command_registry.h>
#include <plughost/host/plugin_handle.h>
#include <plughost/host/value.h>

namespace plughost::host {

inline constexpr std::size_t kDefaultMaxOutputBuffer = 16 * 1024 * 1024;

/**
 * Summary of a loaded plugin for `list`
 */
struct LoadedPluginInfo {
    PluginId id{0};
    std::string name;
    std::string version;
    int32_t abiVersion{0};
    std::filesystem::path path;
    std::vector<std::string> commands; // registered (non-skipped) command names
};

/**
 * Process-wide plugin table and command registry.
 *
 * Created at host startup and torn down by unloading every remaining plugin. All mutation
 * happens on the dispatch thread between commands; nothing here is locked.
 */
class Session {
public:
    struct SkipInfo {
        std::string command;
        std::string reason;
    };

    // Marks one plugin as Invoking for the lifetime of the guard
    class InvocationGuard {
    public:
        InvocationGuard(Session& session, PluginId plugin);
        ~InvocationGuard();

        InvocationGuard(const InvocationGuard&) = delete;
        InvocationGuard& operator=(const InvocationGuard&) = delete;

    private:
        Session& session_;
        std::optional<PluginId> previous_;
    };

    Session();
    explicit Session(AbiPluginLoader loader);
    ~Session();

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    /**
     * Bind, validate and register the plugin at `path`.
     *
     * Command name collisions are skipped (see getLastSkips()) and do not fail the load.
     * No PluginId is consumed and getLastSkips() is unchanged when binding fails.
     * @return the new PluginId, or NotFound / BindFailed (also for an artifact that is
     *         already loaded) / AbiMismatch
     */
    Result<PluginId> load(const std::filesystem::path& path);

    /**
     * Unregister every command of `id`, then shut down and unbind the module.
     * @return NotFound if `id` is not loaded, InUse while one of its commands is invoking
     */
    Result<void> unload(PluginId id);

    // Unload everything; returns the number of plugins unloaded
    std::size_t unloadAll();

    /**
     * Call the plugin entry behind `spec` with already marshalled arguments.
     * @return the copied result value, or PluginReported carrying the plugin's code
     */
    Result<Value> invoke(const CommandSpec& spec, const std::vector<Argument>& args);

    std::vector<LoadedPluginInfo> list() const;
    bool isLoaded(PluginId id) const { return plugins_.count(id) != 0; }
    std::size_t pluginCount() const { return plugins_.size(); }
    const PluginHandle* find(PluginId id) const;

    CommandRegistry& registry() { return registry_; }
    const CommandRegistry& registry() const { return registry_; }

    const AbiPluginLoader& loader() const { return loader_; }
    AbiPluginLoader& loader() { return loader_; }

    // Commands skipped by the most recent load()
    std::vector<SkipInfo> getLastSkips() const { return lastSkips_; }

    std::optional<PluginId> inFlight() const { return inFlight_; }

    // Prompt from the earliest-loaded plugin whose prompt hook succeeds
    std::optional<std::string> prompt() const;

    // Initial capacity of the caller-owned result buffer handed to plugins
    void setOutputBufferSize(std::size_t bytes) { outputBufferSize_ = bytes ? bytes : 1; }
    std::size_t outputBufferSize() const { return outputBufferSize_; }

    // Largest result a plugin may ask the host to allocate on the retry
    void setMaxOutputBufferSize(std::size_t bytes) { maxOutputBufferSize_ = bytes; }
    std::size_t maxOutputBufferSize() const { return maxOutputBufferSize_; }

private:
    AbiPluginLoader loader_;
    std::map<PluginId, std::unique_ptr<PluginHandle>> plugins_;
    CommandRegistry registry_;
    PluginId nextId_{1};
    std::optional<PluginId> inFlight_;
    std::vector<SkipInfo> lastSkips_;
    std::size_t outputBufferSize_{4096};
    std::size_t maxOutputBufferSize_{kDefaultMaxOutputBuffer};
};

} // namespace plughost::host
