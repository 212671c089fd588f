#pragma once

#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

#define PLUGHOST_HOST_SERVICES_API_VERSION 1

#define PLUGHOST_LOG_TRACE 0
#define PLUGHOST_LOG_DEBUG 1
#define PLUGHOST_LOG_INFO 2
#define PLUGHOST_LOG_WARN 3
#define PLUGHOST_LOG_ERROR 4

// Passed to plughost_plugin_init; valid until plughost_plugin_shutdown returns.
typedef struct plughost_host_services_v1 {
    uint32_t version;
    void* impl; // Opaque pointer to host-side implementation
    void (*log)(void* impl, int32_t level, const char* message);
} plughost_host_services_v1;

#ifdef __cplusplus
}
#endif
