#include <plughost/host/value.h>

#include <spdlog/fmt/fmt.h>

namespace plughost::host {

const char* kindName(ValueKind kind) {
    switch (kind) {
        case ValueKind::None: return "none";
        case ValueKind::String: return "string";
        case ValueKind::Int: return "int";
        case ValueKind::Float: return "float";
        case ValueKind::Bool: return "bool";
    }
    return "unknown";
}

std::optional<ValueKind> kindFromAbi(uint32_t raw) {
    switch (raw) {
        case PLUGHOST_KIND_NONE: return ValueKind::None;
        case PLUGHOST_KIND_STRING: return ValueKind::String;
        case PLUGHOST_KIND_INT: return ValueKind::Int;
        case PLUGHOST_KIND_FLOAT: return ValueKind::Float;
        case PLUGHOST_KIND_BOOL: return ValueKind::Bool;
        default: return std::nullopt;
    }
}

std::vector<plughost_value_t> toAbiValues(const std::vector<Argument>& args) {
    std::vector<plughost_value_t> out;
    out.reserve(args.size());
    for (const auto& a : args) {
        plughost_value_t v{};
        v.kind = static_cast<uint32_t>(a.kind);
        switch (a.kind) {
            case ValueKind::String:
                v.as.str.data = a.text.data();
                v.as.str.len = a.text.size();
                break;
            case ValueKind::Int:
                v.as.i64 = a.i64;
                break;
            case ValueKind::Float:
                v.as.f64 = a.f64;
                break;
            case ValueKind::Bool:
                v.as.boolean = a.boolean ? 1 : 0;
                break;
            case ValueKind::None:
                break;
        }
        out.push_back(v);
    }
    return out;
}

std::string renderValue(const Value& value) {
    switch (value.kind) {
        case ValueKind::None: return {};
        case ValueKind::String: return value.text;
        case ValueKind::Int: return fmt::format("{}", value.i64);
        case ValueKind::Float: return fmt::format("{}", value.f64);
        case ValueKind::Bool: return value.boolean ? "true" : "false";
    }
    return {};
}

} // namespace plughost::host
