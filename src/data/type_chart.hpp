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

/// Attacking type -> defending type -> damage multiplier.
/// Pairs absent from the table are neutral (1.0).
class TypeChart {
public:
    Result<void> load_file(const fs::path& path);
    Result<void> load_from_state(lua::LuaState& state);

    /// Set a single pairwise factor. Used by loaders and tests.
    void set(const std::string& attack, const std::string& defend, f64 factor);

    /// Pairwise factor, or nullopt if the chart has no entry.
    std::optional<f64> factor(std::string_view attack,
                              std::string_view defend) const;

    /// Product of the pairwise factors against every defending type.
    /// Starts at 1.0; unknown attack or defend types contribute nothing.
    f64 effectiveness(std::string_view attack,
                      const std::vector<std::string>& defend_types) const;

    bool empty() const { return rows_.empty(); }
    size_t row_count() const { return rows_.size(); }

private:
    std::unordered_map<std::string, std::unordered_map<std::string, f64>> rows_;
};

} // namespace rp::data
