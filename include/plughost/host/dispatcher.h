#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>
#include <plughost/core/types.h>
#include <plughost/host/console_io.h>
#include <plughost/host/dispatch_fsm.h>
#include <plughost/host/session.h>

namespace plughost::host {

struct DispatchOptions {
    std::string prompt{"> "};
    bool showPrompt{true};
};

/**
 * Built-in administrative command. Built-ins resolve before plugin commands.
 */
struct BuiltinCommand {
    std::string name;
    std::string usage;
    std::string description;
};

/**
 * Single-threaded read/parse/resolve/invoke loop over a Session.
 *
 * Every error is rendered as one "error: ..." line and the loop continues; only quit/exit
 * or end of input reach Shutdown.
 */
class Dispatcher {
public:
    Dispatcher(Session& session, IOutputSink& out, DispatchOptions options = {});

    /**
     * Process lines until Shutdown, then unload every plugin.
     * @return process exit code (0)
     */
    int run(ILineSource& in);

    /**
     * Process one line and render its output.
     * @return the error that was rendered, if any
     */
    Result<void> execute(std::string_view line);

    DispatchSnapshot snapshot() const { return fsm_.snapshot(); }
    bool shutdownRequested() const { return fsm_.isShutdown(); }

    /**
     * Load a plugin and render the outcome, including skipped commands.
     * Used by `load` and by startup autoload.
     */
    Result<PluginId> loadPlugin(const std::filesystem::path& path);

    static const std::vector<BuiltinCommand>& builtins();
    static bool isBuiltin(const std::string& name);

private:
    using BuiltinHandler = Result<void> (Dispatcher::*)(const std::vector<std::string>&);
    static BuiltinHandler handlerFor(const std::string& name);

    Result<void> runBuiltin(const std::string& name, const std::vector<std::string>& args);
    Result<void> invokePlugin(const CommandSpec& spec, const std::vector<std::string>& args);

    Result<void> doHelp(const std::vector<std::string>& args);
    Result<void> doList(const std::vector<std::string>& args);
    Result<void> doLoad(const std::vector<std::string>& args);
    Result<void> doUnload(const std::vector<std::string>& args);
    Result<void> doUnloadAll(const std::vector<std::string>& args);
    Result<void> doQuit(const std::vector<std::string>& args);

    Result<void> fail(Error error);
    void writeLine(std::string_view text);
    void renderPrompt();

    Session& session_;
    IOutputSink& out_;
    DispatchOptions options_;
    DispatchFsm fsm_;
};

// One-line diagnostic for an error, e.g. "error: unknown command `foo` (try `help`)"
std::string renderError(const Error& error);

} // namespace plughost::host
