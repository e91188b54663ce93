#include "planning/goal_tree.hpp"

#include <algorithm>
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

namespace rp::planning {

namespace {

/// Numeric suffix of a "goal_<n>" id, or 0.
u64 id_number(const std::string& id) {
    constexpr std::string_view prefix = "goal_";
    if (id.size() <= prefix.size() || id.compare(0, prefix.size(), prefix) != 0) {
        return 0;
    }
    u64 n = 0;
    for (size_t i = prefix.size(); i < id.size(); i++) {
        if (id[i] < '0' || id[i] > '9') return 0;
        n = n * 10 + static_cast<u64>(id[i] - '0');
    }
    return n;
}

} // namespace

GoalTree::GoalTree(GoalStore* store, u32 default_max_attempts)
    : store_(store), default_max_attempts_(default_max_attempts) {}

// ---------------------------------------------------------------------------
// Persistence
// ---------------------------------------------------------------------------

void GoalTree::load() {
    restore({});
    if (!store_) return;

    if (!store_->exists()) {
        spdlog::info("No goal document at {}, starting empty",
                     store_->path().string());
        return;
    }

    auto doc = store_->load();
    if (!doc) {
        spdlog::warn("Failed to load goals: {}", doc.error().message);
        return;
    }

    restore(std::move(doc.value()));
    spdlog::info("Loaded {} goals from {}", goals_.size(), store_->path().string());
}

void GoalTree::restore(GoalDocument doc) {
    goals_.clear();
    index_.clear();
    counter_ = doc.counter;

    for (auto& goal : doc.goals) {
        if (index_.count(goal.id)) {
            spdlog::warn("Duplicate goal id {} in document, keeping the first",
                         goal.id);
            continue;
        }
        counter_ = std::max(counter_, id_number(goal.id));
        index_[goal.id] = goals_.size();
        goals_.push_back(std::move(goal));
    }

    for (auto& goal : goals_) {
        if (goal.parent_id && !index_.count(*goal.parent_id)) {
            spdlog::warn("Goal {} references missing parent {}, promoting to root",
                         goal.id, *goal.parent_id);
            goal.parent_id.reset();
        }

        // Detach only a goal whose parent chain leads back to itself. A goal
        // hanging below someone else's cycle keeps its parent; that cycle is
        // broken when its own member comes up.
        auto pid = goal.parent_id;
        for (size_t steps = 0; pid && steps <= goals_.size(); ++steps) {
            if (*pid == goal.id) {
                spdlog::warn("Goal {} is part of a parent cycle, detaching it",
                             goal.id);
                goal.parent_id.reset();
                break;
            }
            const auto* p = find(*pid);
            pid = p ? p->parent_id : std::nullopt;
        }
    }

    // Child lists follow parent_id: stale, unknown and repeated entries go,
    // children missing from their parent's list are appended in order.
    for (auto& goal : goals_) {
        std::vector<std::string> children;
        for (const auto& cid : goal.children_ids) {
            const auto* child = find(cid);
            if (!child || child->parent_id != goal.id) continue;
            if (std::find(children.begin(), children.end(), cid) != children.end()) {
                continue;
            }
            children.push_back(cid);
        }
        for (const auto& other : goals_) {
            if (other.parent_id == goal.id &&
                std::find(children.begin(), children.end(), other.id) == children.end()) {
                children.push_back(other.id);
            }
        }
        if (children != goal.children_ids) {
            spdlog::warn("Goal {} child list repaired ({} -> {} entries)", goal.id,
                         goal.children_ids.size(), children.size());
            goal.children_ids = std::move(children);
        }
    }

    for (auto& goal : goals_) {
        if (is_underway(goal.status) && !prerequisites_met(goal)) {
            spdlog::warn("Goal {} was {} with unmet prerequisites, reset to pending",
                         goal.id, goal_status_name(goal.status));
            goal.status = GoalStatus::Pending;
        }
    }
}

GoalDocument GoalTree::to_document() const {
    GoalDocument doc;
    doc.counter = counter_;
    doc.goals = goals_;
    return doc;
}

void GoalTree::persist() {
    if (!store_) return;
    auto result = store_->save(to_document());
    if (!result) {
        spdlog::error("Failed to save goals: {}", result.error().message);
    }
}

// ---------------------------------------------------------------------------
// Mutation
// ---------------------------------------------------------------------------

std::string GoalTree::add_goal(const std::string& name,
                               const std::string& description, i32 priority,
                               const std::optional<std::string>& parent_id,
                               std::vector<std::string> prerequisites) {
    Goal goal;
    goal.id = fmt::format("goal_{}", ++counter_);
    goal.name = name;
    goal.description = description;
    goal.priority = priority;
    goal.prerequisites = std::move(prerequisites);
    goal.max_attempts = default_max_attempts_;
    goal.created_at = now_seconds();

    if (parent_id) {
        if (auto* parent = find_mut(*parent_id)) {
            parent->children_ids.push_back(goal.id);
            goal.parent_id = parent_id;
        } else {
            spdlog::warn("add_goal: parent {} not found, adding '{}' as a root",
                         *parent_id, name);
        }
    }

    std::string id = goal.id;
    index_[id] = goals_.size();
    goals_.push_back(std::move(goal));

    persist();
    spdlog::debug("Added goal {}: {}", id, name);
    return id;
}

std::vector<std::string> GoalTree::add_subgoals(
    const std::string& parent_id, const std::vector<SubgoalSpec>& steps) {
    std::vector<std::string> ids;
    ids.reserve(steps.size());

    for (const auto& step : steps) {
        auto prereqs = step.prerequisites;
        if (step.sequential && !ids.empty()) {
            prereqs.push_back(ids.back());
        }
        ids.push_back(add_goal(step.name, step.description, step.priority,
                               parent_id, std::move(prereqs)));
    }
    return ids;
}

bool GoalTree::check_transition(const Goal& goal,
                                GoalTransition transition) const {
    if (can_transition(goal.status, transition)) return true;
    spdlog::warn("Rejected {} on goal {} ({}): not allowed from {}",
                 goal_transition_name(transition), goal.id, goal.name,
                 goal_status_name(goal.status));
    return false;
}

void GoalTree::mark_completed(Goal& goal, const std::string& note) {
    goal.status = GoalStatus::Completed;
    goal.completed_at = now_seconds();
    if (!note.empty()) {
        goal.notes.push_back("Completed: " + note);
    }
    spdlog::info("Completed goal: {}", goal.name);
}

bool GoalTree::complete_goal(const std::string& id, const std::string& note) {
    auto* goal = find_mut(id);
    if (!goal) {
        spdlog::warn("complete_goal: unknown goal {}", id);
        return false;
    }
    if (!check_transition(*goal, GoalTransition::Complete)) return false;

    mark_completed(*goal, note);

    // Cascade upward while every sibling is done. The walk is bounded by the
    // number of goals so a corrupted chain cannot loop.
    auto parent_id = goal->parent_id;
    for (size_t depth = 0; parent_id && depth < goals_.size(); depth++) {
        auto* parent = find_mut(*parent_id);
        if (!parent || is_terminal(parent->status)) break;

        bool all_done = std::all_of(
            parent->children_ids.begin(), parent->children_ids.end(),
            [this](const std::string& cid) {
                const auto* child = find(cid);
                return !child || child->status == GoalStatus::Completed;
            });
        if (!all_done) break;

        mark_completed(*parent, "All sub-goals completed");
        parent_id = parent->parent_id;
    }

    persist();
    return true;
}

bool GoalTree::fail_goal(const std::string& id, const std::string& reason) {
    auto* goal = find_mut(id);
    if (!goal) {
        spdlog::warn("fail_goal: unknown goal {}", id);
        return false;
    }
    if (!check_transition(*goal, GoalTransition::Fail)) return false;

    goal->attempts++;
    if (goal->attempts >= goal->max_attempts) {
        goal->status = GoalStatus::Failed;
        goal->notes.push_back("Failed permanently: " + reason);
        spdlog::warn("Goal permanently failed: {} ({} attempts)", goal->name,
                     goal->attempts);
    } else {
        goal->status = GoalStatus::Pending;
        goal->notes.push_back(fmt::format("Attempt {} failed: {}", goal->attempts, reason));
        spdlog::info("Goal attempt {}/{} failed, will retry: {}", goal->attempts,
                     goal->max_attempts, goal->name);
    }

    persist();
    return true;
}

bool GoalTree::block_goal(const std::string& id, const std::string& reason) {
    auto* goal = find_mut(id);
    if (!goal) {
        spdlog::warn("block_goal: unknown goal {}", id);
        return false;
    }
    if (!check_transition(*goal, GoalTransition::Block)) return false;

    goal->status = GoalStatus::Blocked;
    goal->notes.push_back("Blocked: " + reason);
    spdlog::info("Goal blocked: {} ({})", goal->name, reason);
    persist();
    return true;
}

bool GoalTree::unblock_goal(const std::string& id, const std::string& reason) {
    auto* goal = find_mut(id);
    if (!goal) {
        spdlog::warn("unblock_goal: unknown goal {}", id);
        return false;
    }
    if (!check_transition(*goal, GoalTransition::Unblock)) return false;

    goal->status = GoalStatus::Pending;
    goal->notes.push_back(reason.empty() ? std::string("Unblocked")
                                         : "Unblocked: " + reason);
    spdlog::info("Goal unblocked: {}", goal->name);
    persist();
    return true;
}

bool GoalTree::start_goal(const std::string& id) {
    auto* goal = find_mut(id);
    if (!goal) {
        spdlog::warn("start_goal: unknown goal {}", id);
        return false;
    }
    if (!check_transition(*goal, GoalTransition::Start)) return false;

    goal->status = GoalStatus::InProgress;
    persist();
    return true;
}

bool GoalTree::add_note(const std::string& id, const std::string& text) {
    auto* goal = find_mut(id);
    if (!goal || text.empty()) return false;
    goal->notes.push_back(text);
    persist();
    return true;
}

// ---------------------------------------------------------------------------
// Selection
// ---------------------------------------------------------------------------

bool GoalTree::prerequisites_met(const Goal& goal) const {
    for (const auto& pid : goal.prerequisites) {
        const auto* prereq = find(pid);
        if (!prereq || prereq->status != GoalStatus::Completed) return false;
    }
    return true;
}

Goal* GoalTree::next_child(Goal& parent) {
    Goal* node = &parent;
    Goal* deepest = nullptr;

    for (size_t depth = 0; depth < goals_.size(); depth++) {
        Goal* underway = nullptr;
        for (const auto& cid : node->children_ids) {
            auto* child = find_mut(cid);
            if (!child) continue;
            if (is_underway(child->status)) {
                underway = child;
                break;
            }
            if (child->status == GoalStatus::Pending && prerequisites_met(*child)) {
                child->status = GoalStatus::Active;
                spdlog::info("Activated goal: {}", child->name);
                persist();
                return child;
            }
        }

        if (!underway) return deepest;
        if (underway->children_ids.empty()) return underway;

        // Descend; if nothing below is actionable the underway child
        // itself is the answer.
        deepest = underway;
        node = underway;
    }
    return deepest;
}

const Goal* GoalTree::current_goal() {
    for (auto& goal : goals_) {
        if (!is_underway(goal.status)) continue;
        if (!goal.children_ids.empty()) {
            if (auto* child = next_child(goal)) return child;
        }
        return &goal;
    }

    // Nothing underway: pick the most urgent eligible root. Ties keep
    // creation order.
    Goal* best = nullptr;
    for (auto& goal : goals_) {
        if (goal.parent_id || goal.status != GoalStatus::Pending) continue;
        if (!prerequisites_met(goal)) continue;
        if (!best || goal.priority < best->priority) best = &goal;
    }
    if (!best) return nullptr;

    best->status = GoalStatus::Active;
    spdlog::info("Activated goal: {}", best->name);
    persist();
    return best;
}

// ---------------------------------------------------------------------------
// Queries
// ---------------------------------------------------------------------------

const Goal* GoalTree::find(const std::string& id) const {
    auto it = index_.find(id);
    return (it != index_.end()) ? &goals_[it->second] : nullptr;
}

Goal* GoalTree::find_mut(const std::string& id) {
    auto it = index_.find(id);
    return (it != index_.end()) ? &goals_[it->second] : nullptr;
}

std::string GoalTree::render() const {
    std::vector<const Goal*> roots;
    for (const auto& goal : goals_) {
        if (!goal.parent_id) roots.push_back(&goal);
    }
    if (roots.empty()) return "No goals set.";

    std::stable_sort(roots.begin(), roots.end(),
                     [](const Goal* a, const Goal* b) {
                         return a->priority < b->priority;
                     });

    std::string out;
    std::vector<std::pair<const Goal*, size_t>> stack;
    for (auto it = roots.rbegin(); it != roots.rend(); ++it) {
        stack.emplace_back(*it, 0);
    }

    size_t emitted = 0;
    while (!stack.empty() && emitted <= goals_.size()) {
        auto [goal, depth] = stack.back();
        stack.pop_back();
        ++emitted;

        if (!out.empty()) out += '\n';
        out += std::string(depth * 2, ' ');
        out += fmt::format("{} {} ({})", goal_status_glyph(goal->status),
                           goal->name, goal_status_name(goal->status));

        for (auto it = goal->children_ids.rbegin(); it != goal->children_ids.rend(); ++it) {
            if (const auto* child = find(*it)) {
                stack.emplace_back(child, depth + 1);
            }
        }
    }
    return out;
}

std::string GoalTree::active_goal_context() {
    const Goal* current = current_goal();
    if (!current) {
        return "No active goal. All goals completed or none set.";
    }

    std::string out;
    out += fmt::format("Current goal: {}\n", current->name);
    out += fmt::format("Description: {}\n", current->description);
    out += fmt::format("Status: {}\n", goal_status_name(current->status));
    out += fmt::format("Attempts: {}/{}", current->attempts, current->max_attempts);

    if (!current->notes.empty()) {
        size_t first = current->notes.size() > 3 ? current->notes.size() - 3 : 0;
        out += "\nNotes: ";
        for (size_t i = first; i < current->notes.size(); i++) {
            if (i > first) out += "; ";
            out += current->notes[i];
        }
    }

    std::vector<std::string> chain;
    auto pid = current->parent_id;
    while (pid && chain.size() < goals_.size()) {
        const auto* parent = find(*pid);
        if (!parent) break;
        chain.push_back(parent->name);
        pid = parent->parent_id;
    }
    if (!chain.empty()) {
        out += "\nPart of: ";
        for (auto it = chain.rbegin(); it != chain.rend(); ++it) {
            if (it != chain.rbegin()) out += " > ";
            out += *it;
        }
    }
    return out;
}

std::vector<GoalSummary> GoalTree::snapshot() const {
    std::vector<GoalSummary> out;
    out.reserve(goals_.size());
    for (const auto& goal : goals_) {
        out.push_back({goal.id, goal.name, goal.status, goal.parent_id});
    }
    return out;
}

} // namespace rp::planning
