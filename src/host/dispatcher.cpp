#include <plughost/host/dispatcher.h>

#include <charconv>
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>
#include <plughost/host/marshal.h>
#include <plughost/host/tokenizer.h>

namespace plughost::host {

namespace {

std::string usageOf(const CommandSpec& spec) {
    return spec.usage.empty() ? describeSignature(spec.signature) : spec.usage;
}

} // namespace

std::string renderError(const Error& error) {
    std::string line = fmt::format("error: {}: {}", error.code, error.message);
    if (error.code == ErrorCode::UnknownCommand)
        line += " (try `help`)";
    return line;
}

const std::vector<BuiltinCommand>& Dispatcher::builtins() {
    static const std::vector<BuiltinCommand> k = {
        {"help", "[command]", "list commands, or show usage of one command"},
        {"list", "", "list loaded plugins"},
        {"load", "<path>", "load a plugin module"},
        {"unload", "<id>", "unload a plugin by id"},
        {"unload-all", "", "unload every plugin"},
        {"quit", "", "unload all plugins and exit"},
        {"exit", "", "same as quit"},
    };
    return k;
}

bool Dispatcher::isBuiltin(const std::string& name) {
    return handlerFor(name) != nullptr;
}

Dispatcher::BuiltinHandler Dispatcher::handlerFor(const std::string& name) {
    if (name == "help")
        return &Dispatcher::doHelp;
    if (name == "list")
        return &Dispatcher::doList;
    if (name == "load")
        return &Dispatcher::doLoad;
    if (name == "unload")
        return &Dispatcher::doUnload;
    if (name == "unload-all")
        return &Dispatcher::doUnloadAll;
    if (name == "quit" || name == "exit")
        return &Dispatcher::doQuit;
    return nullptr;
}

Dispatcher::Dispatcher(Session& session, IOutputSink& out, DispatchOptions options)
    : session_(session), out_(out), options_(std::move(options)) {
    for (const auto& b : builtins())
        session_.registry().reserve(b.name);
}

int Dispatcher::run(ILineSource& in) {
    while (!fsm_.isShutdown()) {
        renderPrompt();
        auto line = in.readLine();
        if (!line) {
            if (options_.showPrompt)
                writeLine("");
            fsm_.dispatch(ShutdownRequestedEvent{});
            break;
        }
        if (auto r = execute(*line); !r) {
            spdlog::debug("Command failed: {}", r.error().message);
        }
    }

    auto unloaded = session_.unloadAll();
    spdlog::debug("Session shutdown: unloaded {} plugin(s)", unloaded);
    out_.flush();
    return 0;
}

Result<void> Dispatcher::execute(std::string_view line) {
    if (fsm_.isShutdown())
        return Error{ErrorCode::InvalidState, "session is shutting down"};

    fsm_.dispatch(LineReceivedEvent{});
    auto parsed = tokenize(line);
    if (!parsed)
        return fail(parsed.error());
    auto& tokens = parsed.value();
    if (tokens.empty()) {
        fsm_.dispatch(EmptyLineEvent{});
        return Result<void>();
    }

    std::string command = tokens.front();
    std::vector<std::string> args(tokens.begin() + 1, tokens.end());
    fsm_.dispatch(LineParsedEvent{command});

    // Host built-ins shadow any plugin command of the same name.
    if (isBuiltin(command)) {
        fsm_.dispatch(CommandResolvedEvent{std::nullopt});
        auto r = runBuiltin(command, args);
        if (!r)
            return fail(r.error());
        if (!fsm_.isShutdown())
            fsm_.dispatch(CommandCompletedEvent{});
        return Result<void>();
    }

    auto spec = session_.registry().resolve(command);
    if (!spec)
        return fail(Error{ErrorCode::UnknownCommand, "unknown command `" + command + "`"});

    fsm_.dispatch(CommandResolvedEvent{spec->plugin});
    auto r = invokePlugin(*spec, args);
    if (!r)
        return fail(r.error());
    fsm_.dispatch(CommandCompletedEvent{});
    return Result<void>();
}

Result<void> Dispatcher::runBuiltin(const std::string& name,
                                    const std::vector<std::string>& args) {
    auto handler = handlerFor(name);
    if (!handler)
        return Error{ErrorCode::UnknownCommand, "unknown command `" + name + "`"};
    return (this->*handler)(args);
}

Result<void> Dispatcher::invokePlugin(const CommandSpec& spec,
                                      const std::vector<std::string>& args) {
    auto marshalled = marshalArguments(spec.signature, args);
    if (!marshalled) {
        return Error{ErrorCode::BadArguments,
                     marshalled.error().message + "; usage: " + spec.name + " " + usageOf(spec)};
    }

    auto value = session_.invoke(spec, marshalled.value());
    if (!value)
        return value.error();
    if (value.value().kind != ValueKind::None)
        writeLine(renderValue(value.value()));
    return Result<void>();
}

Result<PluginId> Dispatcher::loadPlugin(const std::filesystem::path& path) {
    auto id = session_.load(path);
    if (!id)
        return id.error();
    for (const auto& skip : session_.getLastSkips())
        writeLine(fmt::format("warning: command `{}` skipped: {}", skip.command, skip.reason));
    const auto* handle = session_.find(id.value());
    writeLine(fmt::format("loaded plugin {} as {}", handle ? handle->name() : path.string(),
                          id.value()));
    return id;
}

Result<void> Dispatcher::doHelp(const std::vector<std::string>& args) {
    if (args.size() > 1)
        return Error{ErrorCode::BadArguments, "usage: help [command]"};

    if (args.size() == 1) {
        const auto& name = args.front();
        for (const auto& b : builtins()) {
            if (b.name == name) {
                writeLine(fmt::format("{} {} - {} (built-in)", b.name, b.usage, b.description));
                return Result<void>();
            }
        }
        auto spec = session_.registry().resolve(name);
        if (!spec)
            return Error{ErrorCode::UnknownCommand, "unknown command `" + name + "`"};
        const auto* handle = session_.find(spec->plugin);
        writeLine(fmt::format("{} {} (plugin {} '{}')", spec->name, usageOf(*spec), spec->plugin,
                              handle ? handle->name() : std::string("?")));
        for (const auto& [code, errName] : spec->signature.errors)
            writeLine(fmt::format("   error {}: {}", code, errName));
        return Result<void>();
    }

    writeLine("built-in commands:");
    for (const auto& b : builtins()) {
        auto head = b.usage.empty() ? b.name : b.name + " " + b.usage;
        writeLine(fmt::format("   {:<18} {}", head, b.description));
    }
    auto commands = session_.registry().commands();
    if (!commands.empty()) {
        writeLine("plugin commands:");
        for (const auto& spec : commands) {
            auto usage = usageOf(spec);
            auto head = usage.empty() ? spec.name : spec.name + " " + usage;
            writeLine(fmt::format("   {:<18} (plugin {})", head, spec.plugin));
        }
    }
    return Result<void>();
}

Result<void> Dispatcher::doList(const std::vector<std::string>& args) {
    if (!args.empty())
        return Error{ErrorCode::BadArguments, "usage: list"};
    auto plugins = session_.list();
    if (plugins.empty()) {
        writeLine("no plugins loaded");
        return Result<void>();
    }
    for (const auto& p : plugins) {
        writeLine(fmt::format("{:>4}  {} {}  abi {}  {} command(s)  {}", p.id, p.name,
                              p.version.empty() ? "-" : p.version, p.abiVersion,
                              p.commands.size(), p.path.string()));
    }
    return Result<void>();
}

Result<void> Dispatcher::doLoad(const std::vector<std::string>& args) {
    if (args.size() != 1)
        return Error{ErrorCode::BadArguments, "usage: load <path>"};
    auto id = loadPlugin(args.front());
    if (!id)
        return id.error();
    return Result<void>();
}

Result<void> Dispatcher::doUnload(const std::vector<std::string>& args) {
    if (args.size() != 1)
        return Error{ErrorCode::BadArguments, "usage: unload <id>"};
    const auto& text = args.front();
    PluginId id = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), id);
    if (ec != std::errc() || ptr != text.data() + text.size())
        return Error{ErrorCode::BadArguments, "invalid plugin id '" + text + "'"};

    auto r = session_.unload(id);
    if (!r)
        return r;
    writeLine(fmt::format("unloaded plugin {}", id));
    return Result<void>();
}

Result<void> Dispatcher::doUnloadAll(const std::vector<std::string>& args) {
    if (!args.empty())
        return Error{ErrorCode::BadArguments, "usage: unload-all"};
    if (session_.pluginCount() == 0) {
        writeLine("no plugins loaded");
        return Result<void>();
    }
    auto n = session_.unloadAll();
    writeLine(fmt::format("unloaded {} plugin(s)", n));
    return Result<void>();
}

Result<void> Dispatcher::doQuit(const std::vector<std::string>& args) {
    if (!args.empty())
        spdlog::debug("quit: ignoring {} argument(s)", args.size());
    fsm_.dispatch(ShutdownRequestedEvent{});
    return Result<void>();
}

Result<void> Dispatcher::fail(Error error) {
    fsm_.dispatch(CommandFailedEvent{error.message});
    writeLine(renderError(error));
    return error;
}

void Dispatcher::writeLine(std::string_view text) {
    out_.write(text);
    out_.write("\n");
}

void Dispatcher::renderPrompt() {
    if (!options_.showPrompt)
        return;
    auto custom = session_.prompt();
    out_.write(custom ? *custom : options_.prompt);
    out_.flush();
}

} // namespace plughost::host
