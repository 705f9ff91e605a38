#pragma once
// Task status state machine
//
//   todo -> in_progress -> done
//   todo | in_progress -> blocked
//   blocked -> todo
//
// done is terminal for automation. A person may reopen it
// (done -> in_progress) through a manual update.

#include "types.hpp"

namespace tether {

enum class TransitionOrigin {
    Automatic,
    Manual
};

inline bool is_legal_transition(Status from, Status to,
                                TransitionOrigin origin = TransitionOrigin::Automatic) {
    if (from == to) return false;
    switch (from) {
        case Status::Todo:
            return to == Status::InProgress || to == Status::Blocked;
        case Status::InProgress:
            return to == Status::Done || to == Status::Blocked;
        case Status::Blocked:
            return to == Status::Todo;
        case Status::Done:
            return origin == TransitionOrigin::Manual && to == Status::InProgress;
    }
    return false;
}

constexpr Status ALL_STATUSES[] = {Status::Todo, Status::InProgress, Status::Done, Status::Blocked};

} // namespace tether
