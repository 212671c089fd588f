// Raw C-ABI plugin for tests: echo, add, fail, big, sleep
#include <chrono>
#include <cstring>
#include <string>
#include <thread>
#include <plughost/plugins/abi.h>

extern "C" {

static const uint32_t k_echo_args[] = {PLUGHOST_KIND_STRING};
static const uint32_t k_add_args[] = {PLUGHOST_KIND_INT, PLUGHOST_KIND_INT};
static const uint32_t k_sleep_args[] = {PLUGHOST_KIND_INT};
static const plughost_error_desc_t k_fail_errors[] = {{7, "boom"}};

static const plughost_command_desc_t k_commands[] = {
    {"echo", "<text>", k_echo_args, 1, 0, PLUGHOST_KIND_STRING, nullptr, 0},
    {"add", "<a> <b>", k_add_args, 2, 0, PLUGHOST_KIND_INT, nullptr, 0},
    {"fail", "", nullptr, 0, 0, PLUGHOST_KIND_NONE, k_fail_errors, 1},
    {"big", "", nullptr, 0, 0, PLUGHOST_KIND_STRING, nullptr, 0},
    {"sleep", "<ms>", k_sleep_args, 1, 0, PLUGHOST_KIND_STRING, nullptr, 0},
    {"undeclared", "", nullptr, 0, 0, PLUGHOST_KIND_NONE, nullptr, 0},
};

static const plughost_plugin_info_t k_info = {PLUGHOST_PLUGIN_ABI_VERSION, "echo", "1.0.0",
                                              k_commands,
                                              sizeof(k_commands) / sizeof(k_commands[0])};

int32_t plughost_plugin_get_abi_version(void) {
    return PLUGHOST_PLUGIN_ABI_VERSION;
}

const plughost_plugin_info_t* plughost_plugin_get_info(void) {
    return &k_info;
}

static int32_t put_string(plughost_result_t* out, const char* data, size_t len) {
    out->kind = PLUGHOST_KIND_STRING;
    out->len = len;
    if (len > out->cap)
        return PLUGHOST_PLUGIN_ERR_BUFFER_TOO_SMALL;
    std::memcpy(out->buf, data, len);
    return PLUGHOST_PLUGIN_OK;
}

int32_t plughost_plugin_invoke(uint32_t command_index, const plughost_value_t* args,
                               size_t arg_count, plughost_result_t* out) {
    if (!out)
        return PLUGHOST_PLUGIN_ERR_INVALID;
    out->status = PLUGHOST_RESULT_OK;
    switch (command_index) {
        case 0: // echo
            if (arg_count != 1 || args[0].kind != PLUGHOST_KIND_STRING)
                return PLUGHOST_PLUGIN_ERR_INVALID;
            return put_string(out, args[0].as.str.data, args[0].as.str.len);
        case 1: // add
            if (arg_count != 2)
                return PLUGHOST_PLUGIN_ERR_INVALID;
            out->kind = PLUGHOST_KIND_INT;
            out->as.i64 = args[0].as.i64 + args[1].as.i64;
            return PLUGHOST_PLUGIN_OK;
        case 2: // fail
            out->status = PLUGHOST_RESULT_ERROR;
            out->error_code = 7;
            return PLUGHOST_PLUGIN_OK;
        case 3: { // big
            std::string s(10000, 'x');
            return put_string(out, s.data(), s.size());
        }
        case 4: { // sleep
            std::this_thread::sleep_for(std::chrono::milliseconds(args[0].as.i64));
            return put_string(out, "done", 4);
        }
        case 5: // undeclared
            out->status = PLUGHOST_RESULT_ERROR;
            out->error_code = 42;
            return PLUGHOST_PLUGIN_OK;
        default:
            return PLUGHOST_PLUGIN_ERR_NOT_FOUND;
    }
}
}
