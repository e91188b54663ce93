#pragma once

#include "core/types.hpp"
#include "world/world_snapshot.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace rp::data {
class Dex;
class TypeChart;
}

namespace rp::battle {

enum class BattleOutcome : u8 { Won, Whiteout };

const char* battle_outcome_name(BattleOutcome outcome);

/// What, if anything, changed on the last update().
struct BattleEvent {
    std::optional<world::BattleKind> started;
    std::optional<BattleOutcome> ended;

    bool any() const { return started.has_value() || ended.has_value(); }
};

struct BattleStats {
    bool in_battle = false;
    world::BattleKind kind = world::BattleKind::None;
    u32 turns = 0;
    u32 won = 0;
    u32 fled = 0;
    u32 whiteouts = 0;
};

struct MoveSuggestion {
    std::string move;
    f64 multiplier = 1.0;

    /// "Use <move> (super effective x<multiplier>!)"
    std::string text() const;
};

struct BattleConfig {
    u32 drag_on_turns = 25; ///< Turns after which the context warns
};

/// Follows battle start/end from consecutive snapshots and scores moves
/// against the opponent with the type chart.
///
/// update() must see every tick exactly once and in order: the turn count
/// is a count of update() calls while in battle.
class BattleTracker {
public:
    BattleTracker(const data::TypeChart& chart, const data::Dex& dex,
                  BattleConfig config = {});

    BattleEvent update(const world::WorldSnapshot& snap);

    /// Header, party lines and the drag-on warning. Empty outside battle.
    std::string battle_context(const world::WorldSnapshot& snap) const;

    f64 type_effectiveness(std::string_view attack_type,
                           const std::vector<std::string>& defend_types) const;

    /// Best super-effective move against `opponent`, or nullopt when no
    /// move beats neutral. Ties keep the earlier slot.
    std::optional<MoveSuggestion> recommend_move(
        const std::vector<std::string>& moves, std::string_view opponent) const;

    BattleStats stats() const;
    bool in_battle() const { return in_battle_; }
    world::BattleKind kind() const { return kind_; }
    u32 turns() const { return turns_; }

    /// Party (current, max) HP and money recorded when the battle began.
    const std::vector<std::pair<u32, u32>>& baseline_party_hp() const {
        return start_party_hp_;
    }
    u32 baseline_money() const { return start_money_; }

private:
    BattleOutcome classify_end(const world::WorldSnapshot& snap) const;

    const data::TypeChart& chart_;
    const data::Dex& dex_;
    BattleConfig config_;

    bool in_battle_ = false;
    world::BattleKind kind_ = world::BattleKind::None;
    u32 turns_ = 0;
    u32 won_ = 0;
    u32 fled_ = 0;
    u32 whiteouts_ = 0;

    // Baseline captured when the battle started
    std::vector<std::pair<u32, u32>> start_party_hp_;
    u32 start_money_ = 0;
};

} // namespace rp::battle
