#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <plughost/core/types.h>

namespace plughost::host {

enum class DispatchState { Idle, Parsing, Resolving, Invoking, Shutdown };

const char* dispatchStateName(DispatchState state);

struct DispatchSnapshot {
    DispatchState state{DispatchState::Idle};
    std::string command;
    std::optional<PluginId> invokingPlugin;
    std::string lastError;
    std::size_t dispatched{0};
    std::size_t failed{0};
};

struct LineReceivedEvent {};
struct EmptyLineEvent {};
struct LineParsedEvent {
    std::string command;
};
// plugin is empty for host built-ins
struct CommandResolvedEvent {
    std::optional<PluginId> plugin;
};
struct CommandCompletedEvent {};
struct CommandFailedEvent {
    std::string error;
};
struct ShutdownRequestedEvent {};

/**
 * Idle -> Parsing -> Resolving -> Invoking -> Idle, with Shutdown terminal.
 *
 * Failures in any stage return to Idle. Once in Shutdown every event is ignored.
 */
class DispatchFsm {
public:
    DispatchSnapshot snapshot() const { return snap_; }

    bool isShutdown() const { return snap_.state == DispatchState::Shutdown; }

    void dispatch(const LineReceivedEvent&) {
        if (isShutdown())
            return;
        snap_.command.clear();
        snap_.invokingPlugin.reset();
        transitionTo(DispatchState::Parsing);
    }
    void dispatch(const EmptyLineEvent&) {
        if (isShutdown())
            return;
        transitionTo(DispatchState::Idle);
    }
    void dispatch(const LineParsedEvent& ev) {
        if (isShutdown())
            return;
        snap_.command = ev.command;
        transitionTo(DispatchState::Resolving);
    }
    void dispatch(const CommandResolvedEvent& ev) {
        if (isShutdown())
            return;
        snap_.invokingPlugin = ev.plugin;
        transitionTo(DispatchState::Invoking);
    }
    void dispatch(const CommandCompletedEvent&) {
        if (isShutdown())
            return;
        ++snap_.dispatched;
        snap_.invokingPlugin.reset();
        transitionTo(DispatchState::Idle);
    }
    void dispatch(const CommandFailedEvent& ev) {
        if (isShutdown())
            return;
        ++snap_.failed;
        snap_.lastError = ev.error;
        snap_.invokingPlugin.reset();
        transitionTo(DispatchState::Idle);
    }
    void dispatch(const ShutdownRequestedEvent&) {
        snap_.invokingPlugin.reset();
        transitionTo(DispatchState::Shutdown);
    }

private:
    void transitionTo(DispatchState next) { snap_.state = next; }

    DispatchSnapshot snap_{};
};

} // namespace plughost::host
