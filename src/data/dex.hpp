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

/// Species -> type(s) and move -> type lookups.
/// Read from the `Species` and `Moves` globals of a Lua data file.
class Dex {
public:
    Result<void> load_file(const fs::path& path);
    Result<void> load_from_state(lua::LuaState& state);

    void add_species(const std::string& name, std::vector<std::string> types);
    void add_move(const std::string& name, const std::string& type);

    /// One or two type names, or an empty list for an unknown species.
    const std::vector<std::string>& species_types(std::string_view species) const;

    /// Move type, or nullopt for an unknown move.
    std::optional<std::string> move_type(std::string_view move) const;

    size_t species_count() const { return species_.size(); }
    size_t move_count() const { return moves_.size(); }

private:
    std::unordered_map<std::string, std::vector<std::string>> species_;
    std::unordered_map<std::string, std::string> moves_;
};

} // namespace rp::data
