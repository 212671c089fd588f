#include <plughost/config/host_config.h>

#include <charconv>
#include <spdlog/spdlog.h>
#include <plughost/config/config_helpers.h>

namespace plughost::config {

namespace {

// Positive byte count from [console] `key`; invalid values keep `out` unchanged.
void readSize(const std::filesystem::path& config_path, const char* key, std::size_t& out) {
    auto v = parse_config_value(config_path, "console", key);
    if (v.empty())
        return;
    std::size_t n = 0;
    auto [ptr, err] = std::from_chars(v.data(), v.data() + v.size(), n);
    if (err == std::errc() && ptr == v.data() + v.size() && n > 0) {
        out = n;
    } else {
        spdlog::warn("Ignoring invalid console.{} '{}' in {}", key, v, config_path.string());
    }
}

} // namespace

HostConfig load_host_config(const std::filesystem::path& config_path) {
    HostConfig cfg;

    std::error_code ec;
    if (!config_path.empty() && std::filesystem::exists(config_path, ec)) {
        cfg.source = config_path;
        spdlog::debug("Reading config: {}", config_path.string());

        if (auto v = parse_config_value(config_path, "plugins", "dirs"); !v.empty())
            cfg.pluginDirs = parse_path_list(v);
        if (auto v = parse_config_value(config_path, "plugins", "autoload"); !v.empty())
            cfg.autoload = parse_path_list(v);
        if (auto v = parse_config_value(config_path, "console", "prompt"); !v.empty())
            cfg.prompt = v;
        readSize(config_path, "output_buffer", cfg.outputBufferSize);
        readSize(config_path, "max_output_buffer", cfg.maxOutputBufferSize);
        if (cfg.maxOutputBufferSize < cfg.outputBufferSize) {
            spdlog::warn("console.max_output_buffer {} is below console.output_buffer; using {}",
                         cfg.maxOutputBufferSize, cfg.outputBufferSize);
            cfg.maxOutputBufferSize = cfg.outputBufferSize;
        }
        if (auto v = parse_config_value(config_path, "logging", "level"); !v.empty())
            cfg.logLevel = v;
    }

    // Environment overrides: additive for plugin dirs, replacing for the log level.
    if (const char* dir = std::getenv("PLUGHOST_PLUGIN_DIR"); dir && *dir) {
        for (auto& p : parse_path_list(dir))
            cfg.pluginDirs.push_back(std::move(p));
    }
    if (const char* lvl = std::getenv("PLUGHOST_LOG_LEVEL"); lvl && *lvl)
        cfg.logLevel = lvl;

    return cfg;
}

} // namespace plughost::config
