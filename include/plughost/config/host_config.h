#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace plughost::config {

/**
 * Host settings resolved from config file and environment.
 *
 * Precedence (lowest to highest): defaults, config.toml, environment, command line.
 * Command line overrides are applied by the console binary.
 */
struct HostConfig {
    std::vector<std::filesystem::path> pluginDirs;     // [plugins] dirs, PLUGHOST_PLUGIN_DIR
    std::vector<std::filesystem::path> autoload;       // [plugins] autoload
    std::string prompt{"> "};                          // [console] prompt
    std::size_t outputBufferSize{4096};                // [console] output_buffer
    std::size_t maxOutputBufferSize{16 * 1024 * 1024}; // [console] max_output_buffer
    std::string logLevel{"warn"};                      // [logging] level, PLUGHOST_LOG_LEVEL
    std::filesystem::path source;                      // file the values came from, if any
};

// Load config from `config_path` (missing file yields defaults) and apply env overrides.
HostConfig load_host_config(const std::filesystem::path& config_path);

} // namespace plughost::config
