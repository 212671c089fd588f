#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include <plughost/core/types.h>
#include <plughost/host/command_registry.h>
#include <plughost/host/shared_library.h>
#include <plughost/plugins/abi.h>

namespace plughost::host {

/**
 * Host-owned deep copy of one command descriptor
 */
struct CommandDescriptor {
    std::string name;
    std::string usage;
    CommandSignature signature;
};

/**
 * Host-owned deep copy of the plugin descriptor taken at load time
 */
struct PluginDescriptor {
    std::string name;
    std::string version;
    int32_t abiVersion{0};
    std::filesystem::path path;
    std::vector<CommandDescriptor> commands;
};

/**
 * Entry points resolved from the module. Optional ones may be null.
 */
struct EntryPoints {
    plughost_get_abi_version_fn getAbiVersion{nullptr};
    plughost_get_info_fn getInfo{nullptr};
    plughost_invoke_fn invoke{nullptr};
    plughost_init_fn init{nullptr};
    plughost_shutdown_fn shutdown{nullptr};
    plughost_prompt_fn prompt{nullptr};
};

/**
 * A bound plugin module. Exclusively owned by the Session.
 *
 * Destruction calls the plugin's shutdown hook (when it was initialized) and then unbinds
 * the module, so the handle must not be moved once initialize() has handed out the host
 * services table.
 */
class PluginHandle {
public:
    PluginHandle(SharedLibrary library, EntryPoints entry, PluginDescriptor descriptor);
    ~PluginHandle();

    PluginHandle(const PluginHandle&) = delete;
    PluginHandle& operator=(const PluginHandle&) = delete;
    PluginHandle(PluginHandle&&) = delete;
    PluginHandle& operator=(PluginHandle&&) = delete;

    const PluginDescriptor& descriptor() const { return descriptor_; }
    const std::string& name() const { return descriptor_.name; }
    int32_t abiVersion() const { return descriptor_.abiVersion; }

    /**
     * Run the optional init hook with the host services table.
     * @return BindFailed when the plugin rejects initialization
     */
    Result<void> initialize(const std::string& configJson);

    /**
     * Call the plugin's invoke entry point. `out` is owned by the caller.
     */
    int32_t invoke(uint32_t commandIndex, const plughost_value_t* args, size_t argCount,
                   plughost_result_t* out) const;

    bool hasPrompt() const { return entry_.prompt != nullptr; }

    // Prompt text from the plugin hook, or nullopt when absent or failing
    std::optional<std::string> prompt() const;

private:
    static void logFromPlugin(void* impl, int32_t level, const char* message);

    SharedLibrary library_;
    EntryPoints entry_;
    PluginDescriptor descriptor_;
    plughost_host_services_v1 services_{};
    bool initialized_{false};
};

} // namespace plughost::host
