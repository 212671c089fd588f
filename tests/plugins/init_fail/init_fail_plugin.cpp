// Rejects initialization; the host must not keep it resident.
#include <plughost/plugins/abi.h>

extern "C" {

static const plughost_command_desc_t k_commands[] = {
    {"never", "", nullptr, 0, 0, PLUGHOST_KIND_NONE, nullptr, 0},
};
static const plughost_plugin_info_t k_info = {PLUGHOST_PLUGIN_ABI_VERSION, "init_fail", "0.0.1",
                                              k_commands, 1};

int32_t plughost_plugin_get_abi_version(void) {
    return PLUGHOST_PLUGIN_ABI_VERSION;
}

const plughost_plugin_info_t* plughost_plugin_get_info(void) {
    return &k_info;
}

int32_t plughost_plugin_invoke(uint32_t, const plughost_value_t*, size_t, plughost_result_t* out) {
    if (out)
        out->status = PLUGHOST_RESULT_OK;
    return PLUGHOST_PLUGIN_OK;
}

int32_t plughost_plugin_init(const char* config_json, const plughost_host_services_v1* host) {
    if (host && host->log)
        host->log(host->impl, PLUGHOST_LOG_WARN, "refusing to initialize");
    (void)config_json;
    return PLUGHOST_PLUGIN_ERR_INIT_FAILED;
}
}
