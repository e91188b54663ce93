#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "planning/goal.hpp"

#include <string>
#include <vector>

namespace rp::lua {
class LuaState;
}

namespace rp::planning {

/// Everything needed to rebuild a goal forest: the id counter plus every
/// goal record, in creation order.
struct GoalDocument {
    u64 counter = 0;
    std::vector<Goal> goals;
};

/// Reads and writes the goal document as a Lua table file:
///
///     GoalDocument = {
///         counter = 3,
///         goals = { { id = "goal_1", name = "...", ... }, ... },
///     }
///
/// Writes go to a sibling temp file that is then renamed over the target,
/// so a crash mid-write leaves the previous document intact.
class GoalStore {
public:
    explicit GoalStore(fs::path path);

    const fs::path& path() const { return path_; }
    bool exists() const;

    Result<GoalDocument> load() const;
    Result<void> save(const GoalDocument& doc) const;

    /// Render a document as Lua source.
    static std::string serialize(const GoalDocument& doc);

    /// Read the `GoalDocument` global of an already-executed state.
    static Result<GoalDocument> parse(lua::LuaState& state);

private:
    fs::path path_;
};

} // namespace rp::planning
