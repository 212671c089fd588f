#pragma once

// Header-only helper for writing plughost plugins in C++.
//
// A plugin describes its commands with plughost::sdk::Plugin and exports the C ABI with
// PLUGHOST_DEFINE_PLUGIN(factory). Exceptions thrown by handlers never cross the ABI; they
// are reported to the host as kUnhandledException.

#include <cstdint>
#include <cstring>
#include <exception>
#include <functional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include <plughost/plugins/abi.h>

namespace plughost::sdk {

// Error code attached to every command for exceptions escaping a handler
inline constexpr int32_t kUnhandledException = 9999;

/**
 * Read-only view of the invocation arguments. Valid only during the handler call.
 */
class Args {
public:
    Args(const plughost_value_t* values, size_t count) : values_(values), count_(count) {}

    size_t size() const { return count_; }
    bool empty() const { return count_ == 0; }

    std::string_view str(size_t i) const {
        const auto& v = values_[i];
        return std::string_view(v.as.str.data, v.as.str.len);
    }
    int64_t integer(size_t i) const { return values_[i].as.i64; }
    double real(size_t i) const { return values_[i].as.f64; }
    bool boolean(size_t i) const { return values_[i].as.boolean != 0; }

private:
    const plughost_value_t* values_;
    size_t count_;
};

/**
 * Writes the tagged result into the host-owned plughost_result_t.
 */
class Reply {
public:
    explicit Reply(plughost_result_t* out) : out_(out) {
        out_->status = PLUGHOST_RESULT_OK;
        out_->error_code = 0;
        out_->kind = PLUGHOST_KIND_NONE;
        out_->len = 0;
    }

    void string(std::string_view s) {
        out_->kind = PLUGHOST_KIND_STRING;
        out_->len = s.size();
        if (s.size() <= out_->cap) {
            if (!s.empty())
                std::memcpy(out_->buf, s.data(), s.size());
        } else {
            tooSmall_ = true;
        }
    }
    void integer(int64_t v) {
        out_->kind = PLUGHOST_KIND_INT;
        out_->as.i64 = v;
    }
    void real(double v) {
        out_->kind = PLUGHOST_KIND_FLOAT;
        out_->as.f64 = v;
    }
    void boolean(bool v) {
        out_->kind = PLUGHOST_KIND_BOOL;
        out_->as.boolean = v ? 1 : 0;
    }
    void error(int32_t code) {
        out_->status = PLUGHOST_RESULT_ERROR;
        out_->error_code = code;
    }

    bool bufferTooSmall() const { return tooSmall_; }

private:
    plughost_result_t* out_;
    bool tooSmall_{false};
};

using Handler = std::function<void(const Args&, Reply&)>;

struct Command {
    std::string name;
    std::string usage;
    std::vector<uint32_t> args;
    bool variadic{false};
    uint32_t returns{PLUGHOST_KIND_NONE};
    std::vector<std::pair<int32_t, std::string>> errors;
    Handler handler;
};

/**
 * Plugin definition plus the storage backing the C descriptor tables.
 */
class Plugin {
public:
    Plugin(std::string name, std::string version)
        : name_(std::move(name)), version_(std::move(version)) {}

    Plugin& command(Command c) {
        commands_.push_back(std::move(c));
        return *this;
    }
    Plugin& onInit(std::function<bool(const char* configJson)> f) {
        init_ = std::move(f);
        return *this;
    }
    Plugin& onShutdown(std::function<void()> f) {
        shutdown_ = std::move(f);
        return *this;
    }
    Plugin& prompt(std::function<std::string()> f) {
        prompt_ = std::move(f);
        return *this;
    }

    const plughost_plugin_info_t* info() {
        if (!built_)
            build();
        return &info_;
    }

    int32_t init(const char* configJson, const plughost_host_services_v1* host) {
        host_ = host;
        if (!init_)
            return PLUGHOST_PLUGIN_OK;
        try {
            return init_(configJson) ? PLUGHOST_PLUGIN_OK : PLUGHOST_PLUGIN_ERR_INIT_FAILED;
        } catch (const std::exception& e) {
            log(PLUGHOST_LOG_ERROR, std::string("init threw: ") + e.what());
            return PLUGHOST_PLUGIN_ERR_INIT_FAILED;
        }
    }

    void shutdown() {
        if (shutdown_) {
            try {
                shutdown_();
            } catch (const std::exception& e) {
                log(PLUGHOST_LOG_ERROR, std::string("shutdown threw: ") + e.what());
            }
        }
        host_ = nullptr;
    }

    int32_t invoke(uint32_t index, const plughost_value_t* args, size_t count,
                   plughost_result_t* out) {
        if (!out || index >= commands_.size() || (count > 0 && !args))
            return PLUGHOST_PLUGIN_ERR_INVALID;
        Reply reply(out);
        try {
            commands_[index].handler(Args(args, count), reply);
        } catch (const std::exception& e) {
            log(PLUGHOST_LOG_ERROR, commands_[index].name + " threw: " + e.what());
            reply.error(kUnhandledException);
        } catch (...) {
            log(PLUGHOST_LOG_ERROR, commands_[index].name + " threw a non-standard exception");
            reply.error(kUnhandledException);
        }
        return reply.bufferTooSmall() ? PLUGHOST_PLUGIN_ERR_BUFFER_TOO_SMALL : PLUGHOST_PLUGIN_OK;
    }

    int32_t renderPrompt(char* buf, size_t cap, size_t* outLen) {
        if (!prompt_ || !outLen)
            return PLUGHOST_PLUGIN_ERR_NOT_FOUND;
        std::string p;
        try {
            p = prompt_();
        } catch (const std::exception& e) {
            log(PLUGHOST_LOG_ERROR, std::string("prompt threw: ") + e.what());
            return PLUGHOST_PLUGIN_ERR_INVALID;
        }
        *outLen = p.size();
        if (p.size() > cap)
            return PLUGHOST_PLUGIN_ERR_BUFFER_TOO_SMALL;
        if (!p.empty())
            std::memcpy(buf, p.data(), p.size());
        return PLUGHOST_PLUGIN_OK;
    }

    void log(int32_t level, const std::string& message) const {
        if (host_ && host_->log)
            host_->log(host_->impl, level, message.c_str());
    }

private:
    void build() {
        errorTables_.resize(commands_.size());
        descs_.resize(commands_.size());
        for (size_t i = 0; i < commands_.size(); ++i) {
            auto& c = commands_[i];
            auto& errs = errorTables_[i];
            for (const auto& [code, errName] : c.errors)
                errs.push_back(plughost_error_desc_t{code, errName.c_str()});
            errs.push_back(plughost_error_desc_t{kUnhandledException, "unhandled exception"});

            auto& d = descs_[i];
            d.name = c.name.c_str();
            d.usage = c.usage.c_str();
            d.arg_kinds = c.args.empty() ? nullptr : c.args.data();
            d.arg_count = c.args.size();
            d.variadic = c.variadic ? 1 : 0;
            d.return_kind = c.returns;
            d.errors = errs.data();
            d.error_count = errs.size();
        }
        info_.abi_version = PLUGHOST_PLUGIN_ABI_VERSION;
        info_.name = name_.c_str();
        info_.version = version_.c_str();
        info_.commands = descs_.empty() ? nullptr : descs_.data();
        info_.command_count = descs_.size();
        built_ = true;
    }

    std::string name_;
    std::string version_;
    std::vector<Command> commands_;
    std::function<bool(const char*)> init_;
    std::function<void()> shutdown_;
    std::function<std::string()> prompt_;
    const plughost_host_services_v1* host_{nullptr};

    bool built_{false};
    std::vector<std::vector<plughost_error_desc_t>> errorTables_;
    std::vector<plughost_command_desc_t> descs_;
    plughost_plugin_info_t info_{};
};

} // namespace plughost::sdk

// Exports the plugin ABI for the Plugin returned by `factory` (a function returning
// plughost::sdk::Plugin). Use once per plugin module.
#define PLUGHOST_DEFINE_PLUGIN(factory)                                                            \
    static ::plughost::sdk::Plugin& plughost_sdk_instance() {                                      \
        static ::plughost::sdk::Plugin instance = factory();                                       \
        return instance;                                                                           \
    }                                                                                              \
    extern "C" {                                                                                   \
    PLUGHOST_PLUGIN_API int32_t plughost_plugin_get_abi_version(void) {                            \
        return PLUGHOST_PLUGIN_ABI_VERSION;                                                        \
    }                                                                                              \
    PLUGHOST_PLUGIN_API const plughost_plugin_info_t* plughost_plugin_get_info(void) {             \
        return plughost_sdk_instance().info();                                                     \
    }                                                                                              \
    PLUGHOST_PLUGIN_API int32_t plughost_plugin_invoke(uint32_t index,                             \
                                                       const plughost_value_t* args,               \
                                                       size_t count, plughost_result_t* out) {     \
        return plughost_sdk_instance().invoke(index, args, count, out);                            \
    }                                                                                              \
    PLUGHOST_PLUGIN_API int32_t plughost_plugin_init(const char* config_json,                      \
                                                     const plughost_host_services_v1* host) {      \
        return plughost_sdk_instance().init(config_json, host);                                    \
    }                                                                                              \
    PLUGHOST_PLUGIN_API void plughost_plugin_shutdown(void) {                                      \
        plughost_sdk_instance().shutdown();                                                        \
    }                                                                                              \
    PLUGHOST_PLUGIN_API int32_t plughost_plugin_prompt(char* buf, size_t cap, size_t* out_len) {   \
        return plughost_sdk_instance().renderPrompt(buf, cap, out_len);                            \
    }                                                                                              \
    }
