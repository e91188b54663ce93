#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace rp::lua {
class LuaState;
}

namespace rp::data {

struct Landmark {
    std::string key;   ///< Lookup key used by GOTO commands (e.g. "oak_lab")
    TilePos pos;
    std::string label; ///< Human-readable name; defaults to key
};

struct MapEntry {
    MapId id = 0;
    std::string name;
    std::string hint;                ///< Free-text navigation hint
    std::vector<Landmark> landmarks; ///< File order is enumeration order
};

/// Read-only registry of navigation landmarks keyed by map.
/// Populated once from the `Landmarks` table of a Lua data file.
class LandmarkRegistry {
public:
    /// Load from a data file. On failure the registry is left empty and the
    /// error is returned for the caller to log.
    Result<void> load_file(const fs::path& path);

    /// Read the `Landmarks` global of an already-executed state.
    Result<void> load_from_state(lua::LuaState& state);

    const MapEntry* find_map(MapId map) const;
    const Landmark* find(MapId map, std::string_view key) const;

    size_t map_count() const { return maps_.size(); }
    size_t landmark_count() const;
    bool empty() const { return maps_.empty(); }

private:
    std::unordered_map<MapId, MapEntry> maps_;
};

} // namespace rp::data
