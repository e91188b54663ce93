#include "planning/goal.hpp"

#include <chrono>

namespace rp::planning {

const char* goal_status_name(GoalStatus status) {
    switch (status) {
    case GoalStatus::Pending: return "pending";
    case GoalStatus::Active: return "active";
    case GoalStatus::InProgress: return "in_progress";
    case GoalStatus::Completed: return "completed";
    case GoalStatus::Failed: return "failed";
    case GoalStatus::Blocked: return "blocked";
    }
    return "unknown";
}

const char* goal_status_glyph(GoalStatus status) {
    switch (status) {
    case GoalStatus::Pending: return "[ ]";
    case GoalStatus::Active: return "[>]";
    case GoalStatus::InProgress: return "[~]";
    case GoalStatus::Completed: return "[x]";
    case GoalStatus::Failed: return "[!]";
    case GoalStatus::Blocked: return "[-]";
    }
    return "[?]";
}

const char* goal_transition_name(GoalTransition transition) {
    switch (transition) {
    case GoalTransition::Activate: return "activate";
    case GoalTransition::Start: return "start";
    case GoalTransition::Complete: return "complete";
    case GoalTransition::Fail: return "fail";
    case GoalTransition::Block: return "block";
    case GoalTransition::Unblock: return "unblock";
    }
    return "unknown";
}

std::optional<GoalStatus> parse_goal_status(std::string_view name) {
    if (name == "pending") return GoalStatus::Pending;
    if (name == "active") return GoalStatus::Active;
    if (name == "in_progress") return GoalStatus::InProgress;
    if (name == "completed") return GoalStatus::Completed;
    if (name == "failed") return GoalStatus::Failed;
    if (name == "blocked") return GoalStatus::Blocked;
    return std::nullopt;
}

bool can_transition(GoalStatus from, GoalTransition transition) {
    if (is_terminal(from)) return false;

    switch (transition) {
    case GoalTransition::Activate:
        return from == GoalStatus::Pending;
    case GoalTransition::Start:
        return from == GoalStatus::Active;
    case GoalTransition::Complete:
        return true;
    case GoalTransition::Fail:
    case GoalTransition::Block:
        return from != GoalStatus::Blocked;
    case GoalTransition::Unblock:
        return from == GoalStatus::Blocked;
    }
    return false;
}

f64 now_seconds() {
    using namespace std::chrono;
    return duration_cast<duration<f64>>(
               system_clock::now().time_since_epoch()).count();
}

} // namespace rp::planning
