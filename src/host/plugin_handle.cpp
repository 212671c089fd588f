#include <plughost/host/plugin_handle.h>

#include <vector>
#include <spdlog/spdlog.h>

namespace plughost::host {

namespace {

constexpr size_t kMaxPromptBytes = 4096;

} // namespace

PluginHandle::PluginHandle(SharedLibrary library, EntryPoints entry, PluginDescriptor descriptor)
    : library_(std::move(library)), entry_(entry), descriptor_(std::move(descriptor)) {
    services_.version = PLUGHOST_HOST_SERVICES_API_VERSION;
    services_.impl = this;
    services_.log = &PluginHandle::logFromPlugin;
}

PluginHandle::~PluginHandle() {
    if (initialized_ && entry_.shutdown) {
        // The plugin must have quiesced its own background work when this returns.
        entry_.shutdown();
    }
    initialized_ = false;
    if (auto r = library_.close(); !r) {
        spdlog::warn("Unbinding plugin '{}' failed: {}", descriptor_.name, r.error().message);
    }
}

Result<void> PluginHandle::initialize(const std::string& configJson) {
    if (initialized_)
        return Error{ErrorCode::InvalidState, "plugin already initialized"};
    if (entry_.init) {
        int32_t rc = entry_.init(configJson.c_str(), &services_);
        if (rc != PLUGHOST_PLUGIN_OK) {
            return Error{ErrorCode::BindFailed,
                         "plugin '" + descriptor_.name + "' init failed (rc=" +
                             std::to_string(rc) + ")"};
        }
    }
    initialized_ = true;
    return Result<void>();
}

int32_t PluginHandle::invoke(uint32_t commandIndex, const plughost_value_t* args, size_t argCount,
                             plughost_result_t* out) const {
    return entry_.invoke(commandIndex, args, argCount, out);
}

std::optional<std::string> PluginHandle::prompt() const {
    if (!entry_.prompt)
        return std::nullopt;
    std::vector<char> buf(128);
    size_t len = 0;
    int32_t rc = entry_.prompt(buf.data(), buf.size(), &len);
    if (rc == PLUGHOST_PLUGIN_ERR_BUFFER_TOO_SMALL && len > buf.size() &&
        len <= kMaxPromptBytes) {
        buf.resize(len);
        rc = entry_.prompt(buf.data(), buf.size(), &len);
    }
    if (rc != PLUGHOST_PLUGIN_OK || len > buf.size()) {
        spdlog::debug("Prompt hook of plugin '{}' failed (rc={})", descriptor_.name, rc);
        return std::nullopt;
    }
    return std::string(buf.data(), len);
}

void PluginHandle::logFromPlugin(void* impl, int32_t level, const char* message) {
    auto* self = static_cast<PluginHandle*>(impl);
    if (!self || !message)
        return;
    const auto& name = self->descriptor_.name;
    switch (level) {
        case PLUGHOST_LOG_TRACE:
            spdlog::trace("[{}] {}", name, message);
            break;
        case PLUGHOST_LOG_DEBUG:
            spdlog::debug("[{}] {}", name, message);
            break;
        case PLUGHOST_LOG_INFO:
            spdlog::info("[{}] {}", name, message);
            break;
        case PLUGHOST_LOG_WARN:
            spdlog::warn("[{}] {}", name, message);
            break;
        default:
            spdlog::error("[{}] {}", name, message);
            break;
    }
}

} // namespace plughost::host
