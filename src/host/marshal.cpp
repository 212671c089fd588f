#include <plughost/host/marshal.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <charconv>
#include <cmath>
#include <cstdlib>
#include <spdlog/fmt/fmt.h>

namespace plughost::host {

namespace {

bool parseInt(const std::string& s, int64_t& out) {
    if (s.empty())
        return false;
    const char* first = s.data();
    const char* last = s.data() + s.size();
    if (*first == '+') {
        ++first;
        if (first == last || *first == '-')
            return false;
    }
    auto [ptr, ec] = std::from_chars(first, last, out);
    return ec == std::errc() && ptr == last;
}

bool parseFloat(const std::string& s, double& out) {
    if (s.empty() || std::isspace(static_cast<unsigned char>(s.front())))
        return false;
    errno = 0;
    char* end = nullptr;
    out = std::strtod(s.c_str(), &end);
    return errno == 0 && end == s.c_str() + s.size() && std::isfinite(out);
}

bool parseBool(std::string s, bool& out) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (s == "true" || s == "1" || s == "yes" || s == "on") {
        out = true;
        return true;
    }
    if (s == "false" || s == "0" || s == "no" || s == "off") {
        out = false;
        return true;
    }
    return false;
}

} // namespace

Result<std::vector<Argument>> marshalArguments(const CommandSignature& signature,
                                               const std::vector<std::string>& tokens) {
    const auto declared = signature.args.size();
    if (tokens.size() < declared || (!signature.variadic && tokens.size() > declared)) {
        return Error{ErrorCode::BadArguments,
                     fmt::format("expected {}{} argument(s), got {}",
                                 signature.variadic ? "at least " : "", declared, tokens.size())};
    }

    std::vector<Argument> out;
    out.reserve(tokens.size());
    for (size_t i = 0; i < tokens.size(); ++i) {
        Argument a;
        a.kind = i < declared ? signature.args[i] : ValueKind::String;
        a.text = tokens[i];
        bool ok = true;
        switch (a.kind) {
            case ValueKind::String:
            case ValueKind::None:
                a.kind = ValueKind::String;
                break;
            case ValueKind::Int:
                ok = parseInt(a.text, a.i64);
                break;
            case ValueKind::Float:
                ok = parseFloat(a.text, a.f64);
                break;
            case ValueKind::Bool:
                ok = parseBool(a.text, a.boolean);
                break;
        }
        if (!ok) {
            return Error{ErrorCode::BadArguments,
                         fmt::format("argument {} ('{}') is not a valid {}", i + 1, a.text,
                                     kindName(a.kind))};
        }
        out.push_back(std::move(a));
    }
    return Result<std::vector<Argument>>(std::move(out));
}

std::string describeSignature(const CommandSignature& signature) {
    std::string out;
    for (auto kind : signature.args) {
        if (!out.empty())
            out += ' ';
        out += fmt::format("<{}>", kindName(kind));
    }
    if (signature.variadic) {
        if (!out.empty())
            out += ' ';
        out += "[args...]";
    }
    return out;
}

} // namespace plughost::host
