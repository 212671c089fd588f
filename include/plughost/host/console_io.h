#pragma once

#include <deque>
#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace plughost::host {

/**
 * Line-input front end. Blocks until a line is available; nullopt means end of input.
 */
class ILineSource {
public:
    virtual ~ILineSource() = default;
    virtual std::optional<std::string> readLine() = 0;
};

/**
 * Plain text output sink. The core never depends on terminal capabilities.
 */
class IOutputSink {
public:
    virtual ~IOutputSink() = default;
    virtual void write(std::string_view text) = 0;
    virtual void flush() {}
};

// Reads lines from a std::istream (stdin in the console binary)
class StreamLineSource : public ILineSource {
public:
    explicit StreamLineSource(std::istream& in) : in_(in) {}
    std::optional<std::string> readLine() override;

private:
    std::istream& in_;
};

class StreamOutputSink : public IOutputSink {
public:
    explicit StreamOutputSink(std::ostream& out) : out_(out) {}
    void write(std::string_view text) override;
    void flush() override;

private:
    std::ostream& out_;
};

// Fixed script of lines, mostly for tests
class ScriptedLineSource : public ILineSource {
public:
    ScriptedLineSource() = default;
    explicit ScriptedLineSource(std::vector<std::string> lines)
        : lines_(lines.begin(), lines.end()) {}
    void push(std::string line) { lines_.push_back(std::move(line)); }
    std::optional<std::string> readLine() override;

private:
    std::deque<std::string> lines_;
};

class StringOutputSink : public IOutputSink {
public:
    void write(std::string_view text) override { buffer_.append(text); }
    const std::string& str() const { return buffer_; }
    void clear() { buffer_.clear(); }

private:
    std::string buffer_;
};

} // namespace plughost::host
