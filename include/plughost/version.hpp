/*
 * Version macros for plughost.
 *
 * The build system passes PLUGHOST_VERSION_* as compile definitions from the CMake project
 * version; the fallbacks below keep standalone builds (e.g. out-of-tree plugins) compiling.
 */

#pragma once

#ifndef PLUGHOST_VERSION_MAJOR
#define PLUGHOST_VERSION_MAJOR 0
#endif

#ifndef PLUGHOST_VERSION_MINOR
#define PLUGHOST_VERSION_MINOR 0
#endif

#ifndef PLUGHOST_VERSION_PATCH
#define PLUGHOST_VERSION_PATCH 0
#endif

#ifndef PLUGHOST_VERSION_STRING
#define PLUGHOST_VERSION_STRING "0.0.0+dev"
#endif
