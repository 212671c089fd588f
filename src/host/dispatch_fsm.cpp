#include <plughost/host/dispatch_fsm.h>

namespace plughost::host {

const char* dispatchStateName(DispatchState state) {
    switch (state) {
        case DispatchState::Idle:
            return "Idle";
        case DispatchState::Parsing:
            return "Parsing";
        case DispatchState::Resolving:
            return "Resolving";
        case DispatchState::Invoking:
            return "Invoking";
        case DispatchState::Shutdown:
            return "Shutdown";
    }
    return "Unknown";
}

} // namespace plughost::host
