#include <plughost/host/console_io.h>

#include <istream>
#include <ostream>

namespace plughost::host {

std::optional<std::string> StreamLineSource::readLine() {
    std::string line;
    if (!std::getline(in_, line))
        return std::nullopt;
    if (!line.empty() && line.back() == '\r')
        line.pop_back();
    return line;
}

void StreamOutputSink::write(std::string_view text) {
    out_.write(text.data(), static_cast<std::streamsize>(text.size()));
}

void StreamOutputSink::flush() {
    out_.flush();
}

std::optional<std::string> ScriptedLineSource::readLine() {
    if (lines_.empty())
        return std::nullopt;
    auto line = std::move(lines_.front());
    lines_.pop_front();
    return line;
}

} // namespace plughost::host
