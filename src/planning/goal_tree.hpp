#pragma once

#include "core/types.hpp"
#include "planning/goal.hpp"
#include "planning/goal_store.hpp"

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace rp::planning {

/// One step passed to GoalTree::add_subgoals().
struct SubgoalSpec {
    std::string name;
    std::string description;
    i32 priority = 5;
    std::vector<std::string> prerequisites;
    bool sequential = false; ///< Depend on the step before this one
};

/// Flat view of one goal for dashboards.
struct GoalSummary {
    std::string id;
    std::string name;
    GoalStatus status = GoalStatus::Pending;
    std::optional<std::string> parent_id;
};

/// Hierarchical goal forest with prerequisite gating and bounded retries.
///
/// Goals live in an arena (vector, creation order) indexed by id; parents
/// and children refer to each other by id only. Goals are never removed.
/// Every successful mutation rewrites the whole document through the
/// attached GoalStore, if any.
///
/// Goal pointers returned by find()/current_goal() stay valid until the
/// next add_goal()/add_subgoals()/restore() call.
class GoalTree {
public:
    explicit GoalTree(GoalStore* store = nullptr, u32 default_max_attempts = 10);

    /// Replace the forest with the store's document. A missing or unreadable
    /// document leaves the tree empty; this never fails.
    void load();

    /// Replace the forest with `doc`, repairing what cannot be trusted
    /// (parent cycles, active goals with unmet prerequisites).
    void restore(GoalDocument doc);
    GoalDocument to_document() const;

    // --- Mutation ---

    /// Add a goal and return its id. An unknown parent is ignored (the goal
    /// becomes a root). Prerequisites are not validated.
    std::string add_goal(const std::string& name, const std::string& description,
                         i32 priority = 5,
                         const std::optional<std::string>& parent_id = std::nullopt,
                         std::vector<std::string> prerequisites = {});

    /// Add ordered children under `parent_id`. Sequential steps depend on
    /// the step before them. Returns the new ids in order.
    std::vector<std::string> add_subgoals(const std::string& parent_id,
                                          const std::vector<SubgoalSpec>& steps);

    /// Mark completed. Ancestors whose children are now all completed are
    /// completed too, walking upward.
    bool complete_goal(const std::string& id, const std::string& note = {});

    /// Count a failed attempt. Back to pending while attempts remain,
    /// failed for good once attempts reaches max_attempts.
    bool fail_goal(const std::string& id, const std::string& reason = {});

    bool block_goal(const std::string& id, const std::string& reason);
    bool unblock_goal(const std::string& id, const std::string& reason = {});

    /// active -> in_progress
    bool start_goal(const std::string& id);

    /// Append a free-text progress note.
    bool add_note(const std::string& id, const std::string& text);

    // --- Selection ---

    /// The goal the caller should pursue now, or nullptr. May promote a
    /// pending goal to active (and persist) as a side effect.
    const Goal* current_goal();

    bool prerequisites_met(const Goal& goal) const;

    // --- Queries ---

    const Goal* find(const std::string& id) const;
    size_t size() const { return goals_.size(); }
    bool empty() const { return goals_.empty(); }
    u64 counter() const { return counter_; }
    const std::vector<Goal>& goals() const { return goals_; }

    /// Depth-first dump of the forest, roots ordered by priority.
    std::string render() const;

    /// Multi-line description of current_goal() for the decision-maker.
    std::string active_goal_context();

    std::vector<GoalSummary> snapshot() const;

private:
    Goal* find_mut(const std::string& id);

    /// Apply `transition` if allowed; logs and returns false otherwise.
    bool check_transition(const Goal& goal, GoalTransition transition) const;

    /// Walk down from an underway goal to the next actionable descendant.
    Goal* next_child(Goal& parent);

    void mark_completed(Goal& goal, const std::string& note);
    void persist();

    std::vector<Goal> goals_;
    std::unordered_map<std::string, size_t> index_;
    u64 counter_ = 0;
    GoalStore* store_ = nullptr;
    u32 default_max_attempts_ = 10;
};

} // namespace rp::planning
