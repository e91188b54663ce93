#pragma once

#include <string>

namespace rp::planning {

class GoalTree;

/// Populate `tree` with the FireRed main-story milestones: one root goal
/// ("Beat the Elite Four") and 22 sequential subgoals. Returns the root id.
std::string setup_progression(GoalTree& tree);

} // namespace rp::planning
