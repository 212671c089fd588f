#include <plughost/host/abi_plugin_loader.h>

#include <new>
#include <set>
#include <spdlog/spdlog.h>
#include <plughost/plugins/abi.h>

namespace plughost::host {

namespace fs = std::filesystem;

namespace {

#if defined(__APPLE__)
constexpr const char* kLibrarySuffix = ".dylib";
#else
constexpr const char* kLibrarySuffix = ".so";
#endif

bool isResourceExhaustion(const std::string& loaderMessage) {
    return loaderMessage.find("Cannot allocate memory") != std::string::npos ||
           loaderMessage.find("cannot allocate memory") != std::string::npos;
}

std::string copyCString(const char* s) {
    return s ? std::string(s) : std::string();
}

// Deep-copies and validates the plugin-owned descriptor.
Result<PluginDescriptor> copyDescriptor(const plughost_plugin_info_t* info,
                                        const fs::path& path) {
    if (!info)
        return Error{ErrorCode::BindFailed, "plugin returned no descriptor"};
    if (!info->name || !*info->name)
        return Error{ErrorCode::BindFailed, "plugin descriptor has no name"};
    if (info->command_count > 0 && !info->commands)
        return Error{ErrorCode::BindFailed, "plugin descriptor command table is null"};

    PluginDescriptor d;
    d.name = info->name;
    d.version = copyCString(info->version);
    d.abiVersion = info->abi_version;
    d.path = path;
    d.commands.reserve(info->command_count);

    std::set<std::string> seen;
    for (size_t i = 0; i < info->command_count; ++i) {
        const auto& c = info->commands[i];
        if (!c.name || !*c.name)
            return Error{ErrorCode::BindFailed, "command " + std::to_string(i) + " has no name"};
        if (c.arg_count > PLUGHOST_MAX_COMMAND_ARGS)
            return Error{ErrorCode::BindFailed,
                         "command '" + std::string(c.name) + "' declares too many arguments"};
        if (c.arg_count > 0 && !c.arg_kinds)
            return Error{ErrorCode::BindFailed,
                         "command '" + std::string(c.name) + "' has a null argument table"};
        if (c.error_count > 0 && !c.errors)
            return Error{ErrorCode::BindFailed,
                         "command '" + std::string(c.name) + "' has a null error table"};
        if (!seen.insert(c.name).second)
            return Error{ErrorCode::BindFailed,
                         "command '" + std::string(c.name) + "' declared twice"};

        CommandDescriptor cd;
        cd.name = c.name;
        cd.usage = copyCString(c.usage);
        cd.signature.variadic = c.variadic != 0;
        for (size_t a = 0; a < c.arg_count; ++a) {
            auto kind = kindFromAbi(c.arg_kinds[a]);
            if (!kind || *kind == ValueKind::None)
                return Error{ErrorCode::BindFailed, "command '" + cd.name +
                                                        "' declares an invalid argument kind"};
            cd.signature.args.push_back(*kind);
        }
        auto ret = kindFromAbi(c.return_kind);
        if (!ret)
            return Error{ErrorCode::BindFailed,
                         "command '" + cd.name + "' declares an invalid return kind"};
        cd.signature.returns = *ret;
        for (size_t e = 0; e < c.error_count; ++e) {
            cd.signature.errors[c.errors[e].code] = copyCString(c.errors[e].name);
        }
        d.commands.push_back(std::move(cd));
    }
    return Result<PluginDescriptor>(std::move(d));
}

} // namespace

std::string AbiPluginLoader::libraryFileName(const std::string& stem) {
    return "lib" + stem + kLibrarySuffix;
}

Result<fs::path> AbiPluginLoader::resolvePath(const fs::path& file) const {
    std::error_code ec;
    if (fs::is_regular_file(file, ec))
        return fs::weakly_canonical(file, ec);

    // Bare names and relative paths are looked up in the configured plugin directories.
    if (!file.is_absolute()) {
        std::vector<fs::path> candidates;
        candidates.push_back(file);
        if (!file.has_extension())
            candidates.push_back(fs::path(file.string() + kLibrarySuffix));
        if (!file.has_parent_path()) {
            auto stem = file.has_extension() ? file.stem().string() : file.string();
            if (stem.rfind("lib", 0) != 0)
                candidates.push_back(libraryFileName(stem));
        }
        for (const auto& dir : searchDirs_) {
            for (const auto& c : candidates) {
                auto p = dir / c;
                if (fs::is_regular_file(p, ec)) {
                    spdlog::debug("Resolved plugin '{}' to {}", file.string(), p.string());
                    return fs::weakly_canonical(p, ec);
                }
            }
        }
    }
    return Error{ErrorCode::NotFound, "plugin not found: " + file.string()};
}

Result<std::unique_ptr<PluginHandle>> AbiPluginLoader::bind(const fs::path& file) const {
    auto resolved = resolvePath(file);
    if (!resolved)
        return resolved.error();
    const fs::path& path = resolved.value();

    auto lib = SharedLibrary::open(path);
    if (!lib) {
        if (isResourceExhaustion(lib.error().message)) {
            spdlog::critical("Out of memory binding {}: {}", path.string(), lib.error().message);
            throw std::bad_alloc();
        }
        return lib.error();
    }
    SharedLibrary library = std::move(lib).value();

    EntryPoints entry;
    entry.getAbiVersion =
        library.symbol<plughost_get_abi_version_fn>("plughost_plugin_get_abi_version");
    entry.getInfo = library.symbol<plughost_get_info_fn>("plughost_plugin_get_info");
    entry.invoke = library.symbol<plughost_invoke_fn>("plughost_plugin_invoke");
    entry.init = library.symbol<plughost_init_fn>("plughost_plugin_init");
    entry.shutdown = library.symbol<plughost_shutdown_fn>("plughost_plugin_shutdown");
    entry.prompt = library.symbol<plughost_prompt_fn>("plughost_plugin_prompt");

    if (!entry.getAbiVersion) {
        return Error{ErrorCode::BindFailed,
                     "missing export plughost_plugin_get_abi_version in " + path.string()};
    }

    int32_t abi = entry.getAbiVersion();
    if (abi != PLUGHOST_PLUGIN_ABI_VERSION) {
        spdlog::warn("Refusing {}: ABI version {} (host {})", path.string(), abi,
                     PLUGHOST_PLUGIN_ABI_VERSION);
        return Error{ErrorCode::AbiMismatch,
                     "plugin ABI version " + std::to_string(abi) + " does not match host " +
                         std::to_string(PLUGHOST_PLUGIN_ABI_VERSION)};
    }

    if (!entry.getInfo)
        return Error{ErrorCode::BindFailed,
                     "missing export plughost_plugin_get_info in " + path.string()};
    if (!entry.invoke)
        return Error{ErrorCode::BindFailed,
                     "missing export plughost_plugin_invoke in " + path.string()};

    auto descriptor = copyDescriptor(entry.getInfo(), path);
    if (!descriptor)
        return descriptor.error();
    if (descriptor.value().abiVersion != abi) {
        return Error{ErrorCode::AbiMismatch, "descriptor ABI version " +
                                                 std::to_string(descriptor.value().abiVersion) +
                                                 " disagrees with exported version"};
    }

    auto handle = std::make_unique<PluginHandle>(std::move(library), entry,
                                                 std::move(descriptor).value());
    return Result<std::unique_ptr<PluginHandle>>(std::move(handle));
}

} // namespace plughost::host
