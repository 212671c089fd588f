#include <plughost/host/tokenizer.h>

namespace plughost::host {

namespace {

bool isSpace(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

} // namespace

Result<std::vector<std::string>> tokenize(std::string_view line) {
    enum class Mode { Plain, Single, Double };

    std::vector<std::string> tokens;
    std::string current;
    bool inToken = false; // distinguishes "" (an empty token) from no token
    Mode mode = Mode::Plain;

    for (size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        switch (mode) {
            case Mode::Plain:
                if (isSpace(c)) {
                    if (inToken) {
                        tokens.push_back(std::move(current));
                        current.clear();
                        inToken = false;
                    }
                } else if (c == '\'') {
                    mode = Mode::Single;
                    inToken = true;
                } else if (c == '"') {
                    mode = Mode::Double;
                    inToken = true;
                } else if (c == '\\') {
                    if (i + 1 >= line.size())
                        return Error{ErrorCode::BadArguments, "trailing backslash"};
                    current.push_back(line[++i]);
                    inToken = true;
                } else {
                    current.push_back(c);
                    inToken = true;
                }
                break;
            case Mode::Single:
                if (c == '\'')
                    mode = Mode::Plain;
                else
                    current.push_back(c);
                break;
            case Mode::Double:
                if (c == '"') {
                    mode = Mode::Plain;
                } else if (c == '\\' && i + 1 < line.size() &&
                           (line[i + 1] == '"' || line[i + 1] == '\\')) {
                    current.push_back(line[++i]);
                } else {
                    current.push_back(c);
                }
                break;
        }
    }

    if (mode != Mode::Plain)
        return Error{ErrorCode::BadArguments, "unterminated quote"};
    if (inToken)
        tokens.push_back(std::move(current));
    return Result<std::vector<std::string>>(std::move(tokens));
}

} // namespace plughost::host
