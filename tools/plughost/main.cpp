#include <iostream>
#include <new>
#include <string>
#include <vector>

#include <CLI/CLI.hpp>
#include <spdlog/sinks/stderr_color_sinks.h>
#include <spdlog/spdlog.h>
#include <plughost/config/config_helpers.h>
#include <plughost/config/host_config.h>
#include <plughost/host/console_io.h>
#include <plughost/host/dispatcher.h>
#include <plughost/host/session.h>
#include <plughost/version.hpp>

int main(int argc, char* argv[]) {
    // Console output owns stdout; diagnostics go to stderr.
    spdlog::set_default_logger(spdlog::stderr_color_mt("plughost"));
    spdlog::set_level(spdlog::level::warn);
    spdlog::set_pattern("[%H:%M:%S] [%l] %v");

    CLI::App app{"Interactive host for runtime-loaded plugin modules", "plughost"};
    app.set_version_flag("--version", PLUGHOST_VERSION_STRING);

    std::string configOverride;
    std::vector<std::string> pluginDirs;
    std::vector<std::string> loads;
    std::string logLevel;
    bool verbose = false;
    bool noPrompt = false;

    app.add_option("-c,--config", configOverride, "Config file (default: XDG config dir)");
    app.add_option("-p,--plugin-dir", pluginDirs, "Additional plugin search directory");
    app.add_option("-l,--load", loads, "Plugin to load at startup");
    app.add_option("--log-level", logLevel, "trace, debug, info, warn, error, critical, off");
    app.add_flag("-v,--verbose", verbose, "Enable debug logging");
    app.add_flag("--no-prompt", noPrompt, "Do not print a prompt (for piped input)");

    CLI11_PARSE(app, argc, argv);

    try {
        auto configPath = plughost::config::get_config_path(configOverride);
        auto cfg = plughost::config::load_host_config(configPath);

        if (!logLevel.empty())
            cfg.logLevel = logLevel;
        if (verbose)
            cfg.logLevel = "debug";
        spdlog::set_level(spdlog::level::from_str(cfg.logLevel));
        if (!cfg.source.empty())
            spdlog::debug("Using config {}", cfg.source.string());

        for (const auto& d : pluginDirs)
            cfg.pluginDirs.push_back(plughost::config::expand_tilde(d));
        for (const auto& l : loads)
            cfg.autoload.push_back(plughost::config::expand_tilde(l));

        plughost::host::Session session{plughost::host::AbiPluginLoader(cfg.pluginDirs)};
        session.setOutputBufferSize(cfg.outputBufferSize);
        session.setMaxOutputBufferSize(cfg.maxOutputBufferSize);

        plughost::host::StreamOutputSink out(std::cout);
        plughost::host::DispatchOptions options;
        options.prompt = cfg.prompt;
        options.showPrompt = !noPrompt;
        plughost::host::Dispatcher dispatcher(session, out, options);

        for (const auto& p : cfg.autoload) {
            if (auto r = dispatcher.loadPlugin(p); !r) {
                out.write(plughost::host::renderError(r.error()) + "\n");
            }
        }

        plughost::host::StreamLineSource in(std::cin);
        return dispatcher.run(in);

    } catch (const std::bad_alloc&) {
        spdlog::critical("Out of memory; host state is unsafe, terminating");
        return 70;
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
