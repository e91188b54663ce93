#include "nav/navigator.hpp"
#include "data/landmark_registry.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

namespace rp::nav {

const char* direction_name(Direction dir) {
    switch (dir) {
    case Direction::Up: return "UP";
    case Direction::Down: return "DOWN";
    case Direction::Left: return "LEFT";
    case Direction::Right: return "RIGHT";
    }
    return "?";
}

std::optional<Direction> parse_direction(std::string_view name) {
    if (name == "UP") return Direction::Up;
    if (name == "DOWN") return Direction::Down;
    if (name == "LEFT") return Direction::Left;
    if (name == "RIGHT") return Direction::Right;
    return std::nullopt;
}

Navigator::Navigator(const data::LandmarkRegistry& landmarks,
                     NavigatorConfig config)
    : landmarks_(landmarks), config_(config) {}

bool Navigator::set_target(MapId map, std::string_view landmark_key) {
    const auto* entry = landmarks_.find_map(map);
    if (!entry) {
        spdlog::warn("Navigator: no landmark data for map {}", map);
        return false;
    }

    const auto* landmark = landmarks_.find(map, landmark_key);
    if (!landmark) {
        spdlog::warn("Navigator: no landmark '{}' on map {} ({})", landmark_key,
                     map, entry->name.empty() ? "?" : entry->name);
        return false;
    }

    target_ = landmark->pos;
    target_label_ = landmark->label;
    target_map_ = map;
    active_ = true;
    prev_pos_.reset();
    stuck_ticks_ = 0;
    total_stuck_ = 0;
    detour_side_ = 0;
    detour_dir_.reset();
    detour_ticks_ = 0;

    spdlog::info("Navigator: target set to {} at ({}, {}) on map {}",
                 target_label_, target_->x, target_->y, map);
    return true;
}

std::optional<Direction> Navigator::next_direction(TilePos pos, MapId map) {
    if (!active_ || !target_) return std::nullopt;

    // A different map means a door or warp was taken; the walk is moot.
    if (map != target_map_) {
        spdlog::info("Navigator: map changed ({} -> {}), cancelling navigation",
                     target_map_, map);
        cancel();
        return std::nullopt;
    }

    i32 dx = target_->x - pos.x;
    i32 dy = target_->y - pos.y;

    if (std::abs(dx) <= config_.arrival_radius &&
        std::abs(dy) <= config_.arrival_radius) {
        spdlog::info("Navigator: arrived at {}", target_label_);
        active_ = false;
        total_stuck_ = 0;
        stuck_ticks_ = 0;
        detour_dir_.reset();
        detour_ticks_ = 0;
        return std::nullopt;
    }

    bool moved = !prev_pos_ || *prev_pos_ != pos;

    if (detour_ticks_ > 0) {
        if (!moved) {
            // The detour itself is blocked: switch to the other side now.
            detour_ticks_ = 0;
            detour_side_++;
            prev_pos_ = pos;
            return start_detour(dx, dy);
        }

        detour_ticks_--;
        if (detour_ticks_ > 0) {
            prev_pos_ = pos;
            return detour_dir_;
        }
        detour_dir_.reset();
        spdlog::debug("Navigator: detour finished, resuming direct walk");
    }

    if (moved) {
        stuck_ticks_ = 0;
    } else {
        stuck_ticks_++;
    }
    prev_pos_ = pos;

    if (stuck_ticks_ >= config_.stuck_ticks) {
        total_stuck_++;
        return start_detour(dx, dy);
    }

    if (total_stuck_ >= config_.give_up_events) {
        spdlog::info("Navigator: giving up after {} stuck events, cancelling "
                     "navigation to {}", total_stuck_, target_label_);
        cancel();
        return std::nullopt;
    }

    return greedy_step(dx, dy);
}

Direction Navigator::greedy_step(i32 dx, i32 dy) {
    // Close the larger gap first. Equal gaps go vertical unless dy is 0.
    if (std::abs(dx) > std::abs(dy)) {
        return dx > 0 ? Direction::Right : Direction::Left;
    }
    if (dy != 0) {
        return dy > 0 ? Direction::Down : Direction::Up;
    }
    return dx > 0 ? Direction::Right : Direction::Left;
}

u32 Navigator::detour_length(u32 total_stuck, const NavigatorConfig& config) {
    u32 len = config.detour_base + config.detour_step * total_stuck;
    return std::min(len, config.detour_max);
}

Direction Navigator::start_detour(i32 dx, i32 dy) {
    static constexpr Direction kVertical[2] = {Direction::Up, Direction::Down};
    static constexpr Direction kHorizontal[2] = {Direction::Left, Direction::Right};

    u32 len = detour_length(total_stuck_, config_);
    const Direction* options =
        (std::abs(dx) >= std::abs(dy)) ? kVertical : kHorizontal;

    detour_dir_ = options[detour_side_ % 2];
    detour_ticks_ = len;
    stuck_ticks_ = 0;

    spdlog::info("Navigator: stuck! Detouring {} for {} ticks (stuck count: {})",
                 direction_name(*detour_dir_), len, total_stuck_);
    return *detour_dir_;
}

void Navigator::cancel() {
    if (active_) {
        spdlog::info("Navigator: cancelled (was heading to {})", target_label_);
    }
    active_ = false;
    target_.reset();
    target_label_.clear();
    target_map_ = -1;
    prev_pos_.reset();
    stuck_ticks_ = 0;
    total_stuck_ = 0;
    detour_side_ = 0;
    detour_dir_.reset();
    detour_ticks_ = 0;
}

i32 Navigator::distance_remaining(TilePos pos) const {
    if (!target_) return 0;
    return std::abs(target_->x - pos.x) + std::abs(target_->y - pos.y);
}

std::vector<std::string> Navigator::available_targets(MapId map) const {
    std::vector<std::string> keys;
    if (const auto* entry = landmarks_.find_map(map)) {
        for (const auto& lm : entry->landmarks) {
            keys.push_back(lm.key);
        }
    }
    return keys;
}

std::string Navigator::targets_text(MapId map) const {
    const auto* entry = landmarks_.find_map(map);
    if (!entry) return {};

    std::string out;
    for (const auto& lm : entry->landmarks) {
        std::string key = lm.key;
        std::transform(key.begin(), key.end(), key.begin(),
                       [](unsigned char c) { return std::toupper(c); });
        if (!out.empty()) out += '\n';
        out += fmt::format("  GOTO_{} = walk to {}", key, lm.label);
    }
    return out;
}

std::string Navigator::map_hint(MapId map) const {
    const auto* entry = landmarks_.find_map(map);
    return entry ? entry->hint : std::string{};
}

} // namespace rp::nav
