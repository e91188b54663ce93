#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <string>
#include <vector>

namespace rp::lua {
class LuaState;
}

namespace rp::world {

enum class BattleKind : u8 { None = 0, Wild = 1, Trainer = 2 };

const char* battle_kind_name(BattleKind kind);

/// Map the emulator's raw battle flag (0/1/2) to a kind. Unknown codes
/// count as no battle.
BattleKind battle_kind_from_code(i64 code);

struct PartyMember {
    std::string species;
    u32 level = 0;
    u32 hp_current = 0;
    u32 hp_max = 0;
    std::vector<std::string> moves; ///< Empty slots already dropped

    bool fainted() const { return hp_current == 0; }

    /// Integer percentage of max HP, 0 when max is 0.
    u32 hp_percent() const {
        return hp_max > 0 ? static_cast<u32>(100ull * hp_current / hp_max) : 0;
    }
};

/// One tick's worth of game state as read from emulator memory.
struct WorldSnapshot {
    TilePos player;
    MapId map_id = 0;
    u32 money = 0;
    BattleKind battle = BattleKind::None;
    std::string opponent; ///< Opposing species in battle, empty if unknown
    std::vector<PartyMember> party;

    bool in_battle() const { return battle != BattleKind::None; }
};

/// Read the `GameState` table from an executed state.
Result<WorldSnapshot> parse_snapshot(lua::LuaState& state);

/// Read a state file written by the emulator script. On a missing file or
/// a half-written one, `previous` (the caller's last good snapshot) is
/// returned unchanged.
WorldSnapshot read_snapshot(const fs::path& path, const WorldSnapshot& previous);

/// Load a recorded sequence of snapshots from a `Trace = { {...}, ... }` file.
Result<std::vector<WorldSnapshot>> load_trace(const fs::path& path);

/// Read the `Trace` table from an executed state.
Result<std::vector<WorldSnapshot>> parse_trace(lua::LuaState& state);

} // namespace rp::world
