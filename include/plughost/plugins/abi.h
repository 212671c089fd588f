#pragma once

#include <stddef.h>
#include <stdint.h>

#include <plughost/plugins/host_services_v1.h>

#if defined(_WIN32) || defined(_WIN64)
#define PLUGHOST_PLUGIN_API __declspec(dllexport)
#elif defined(__GNUC__) || defined(__clang__)
#define PLUGHOST_PLUGIN_API __attribute__((visibility("default")))
#else
#define PLUGHOST_PLUGIN_API
#endif

#ifdef __cplusplus
extern "C" {
#endif

// Host and plugin must agree exactly; there is no negotiation.
#define PLUGHOST_PLUGIN_ABI_VERSION 1

// Entry point return codes
#define PLUGHOST_PLUGIN_OK 0
#define PLUGHOST_PLUGIN_ERR_INVALID -1
#define PLUGHOST_PLUGIN_ERR_NOT_FOUND -2
#define PLUGHOST_PLUGIN_ERR_INIT_FAILED -3
#define PLUGHOST_PLUGIN_ERR_BUFFER_TOO_SMALL -4

// Upper bound on declared arguments per command
#define PLUGHOST_MAX_COMMAND_ARGS 64

typedef enum plughost_value_kind {
    PLUGHOST_KIND_NONE = 0,
    PLUGHOST_KIND_STRING = 1,
    PLUGHOST_KIND_INT = 2,
    PLUGHOST_KIND_FLOAT = 3,
    PLUGHOST_KIND_BOOL = 4
} plughost_value_kind;

// Read-only view into host memory; valid only for the duration of the call it is passed to.
typedef struct plughost_str_view_t {
    const char* data;
    size_t len;
} plughost_str_view_t;

typedef struct plughost_value_t {
    uint32_t kind; // plughost_value_kind
    union {
        plughost_str_view_t str;
        int64_t i64;
        double f64;
        int32_t boolean;
    } as;
} plughost_value_t;

typedef struct plughost_error_desc_t {
    int32_t code;
    const char* name;
} plughost_error_desc_t;

typedef struct plughost_command_desc_t {
    const char* name;
    const char* usage;
    const uint32_t* arg_kinds; // plughost_value_kind[arg_count]
    size_t arg_count;
    int32_t variadic; // non-zero: extra trailing arguments are passed as strings
    uint32_t return_kind;
    const plughost_error_desc_t* errors;
    size_t error_count;
} plughost_command_desc_t;

// Owned by the plugin; must stay valid until plughost_plugin_shutdown returns.
// The host deep-copies everything it needs during load.
typedef struct plughost_plugin_info_t {
    int32_t abi_version;
    const char* name;
    const char* version;
    const plughost_command_desc_t* commands;
    size_t command_count;
} plughost_plugin_info_t;

#define PLUGHOST_RESULT_OK 0
#define PLUGHOST_RESULT_ERROR 1

// Filled by the plugin. `buf`/`cap` are caller-owned; string results are copied into `buf`
// with `len` set to the full length. When len > cap the plugin returns
// PLUGHOST_PLUGIN_ERR_BUFFER_TOO_SMALL and the host retries with a larger buffer.
typedef struct plughost_result_t {
    int32_t status;     // PLUGHOST_RESULT_OK / PLUGHOST_RESULT_ERROR
    int32_t error_code; // plugin-declared code when status == PLUGHOST_RESULT_ERROR
    uint32_t kind;      // plughost_value_kind of the payload
    union {
        int64_t i64;
        double f64;
        int32_t boolean;
    } as;
    char* buf;
    size_t cap;
    size_t len;
} plughost_result_t;

// Required exports
PLUGHOST_PLUGIN_API int32_t plughost_plugin_get_abi_version(void);
PLUGHOST_PLUGIN_API const plughost_plugin_info_t* plughost_plugin_get_info(void);
PLUGHOST_PLUGIN_API int32_t plughost_plugin_invoke(uint32_t command_index,
                                                   const plughost_value_t* args, size_t arg_count,
                                                   plughost_result_t* out);

// Optional exports
PLUGHOST_PLUGIN_API int32_t plughost_plugin_init(const char* config_json,
                                                 const plughost_host_services_v1* host);
PLUGHOST_PLUGIN_API void plughost_plugin_shutdown(void);
PLUGHOST_PLUGIN_API int32_t plughost_plugin_prompt(char* buf, size_t cap, size_t* out_len);

typedef int32_t (*plughost_get_abi_version_fn)(void);
typedef const plughost_plugin_info_t* (*plughost_get_info_fn)(void);
typedef int32_t (*plughost_invoke_fn)(uint32_t, const plughost_value_t*, size_t,
                                      plughost_result_t*);
typedef int32_t (*plughost_init_fn)(const char*, const plughost_host_services_v1*);
typedef void (*plughost_shutdown_fn)(void);
typedef int32_t (*plughost_prompt_fn)(char*, size_t, size_t*);

#ifdef __cplusplus
}
#endif
