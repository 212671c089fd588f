#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <plughost/plugins/abi.h>

namespace plughost::host {

enum class ValueKind : uint32_t {
    None = PLUGHOST_KIND_NONE,
    String = PLUGHOST_KIND_STRING,
    Int = PLUGHOST_KIND_INT,
    Float = PLUGHOST_KIND_FLOAT,
    Bool = PLUGHOST_KIND_BOOL
};

const char* kindName(ValueKind kind);

// Maps a raw ABI kind tag; nullopt for values outside the enum.
std::optional<ValueKind> kindFromAbi(uint32_t raw);

/**
 * Host-owned argument after marshalling from a console token
 */
struct Argument {
    ValueKind kind{ValueKind::String};
    std::string text;
    int64_t i64{0};
    double f64{0.0};
    bool boolean{false};
};

/**
 * Host-owned copy of a plugin return value
 */
struct Value {
    ValueKind kind{ValueKind::None};
    std::string text;
    int64_t i64{0};
    double f64{0.0};
    bool boolean{false};
};

// Builds ABI views over `args`; the views are valid only while `args` is alive and unmodified.
std::vector<plughost_value_t> toAbiValues(const std::vector<Argument>& args);

// Console rendering; Value of kind None renders as an empty string.
std::string renderValue(const Value& value);

} // namespace plughost::host
