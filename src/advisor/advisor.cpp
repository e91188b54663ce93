#include "advisor/advisor.hpp"
#include "planning/goal_tree.hpp"

#include <algorithm>
#include <cctype>
#include <vector>
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

namespace rp::advisor {

namespace {

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return s;
}

} // namespace

Advisor::Advisor(planning::GoalTree& goals, nav::Navigator& navigator,
                 battle::BattleTracker& battle, AdvisorConfig config)
    : goals_(goals), navigator_(navigator), battle_(battle), config_(config) {}

TickAdvice Advisor::tick(const world::WorldSnapshot& snap) {
    TickAdvice advice;
    advice.tick = ++tick_;

    advice.battle_event = battle_.update(snap);

    // Walking hints are meaningless inside a battle menu.
    if (!battle_.in_battle()) {
        advice.direction = navigator_.next_direction(snap.player, snap.map_id);
    }

    advice.goal_context = goals_.active_goal_context();
    advice.extra_context = extra_context(snap);

    spdlog::debug("[Tick {}] map {} ({}, {}) battle={} dir={}", advice.tick,
                  snap.map_id, snap.player.x, snap.player.y,
                  world::battle_kind_name(snap.battle),
                  advice.direction ? nav::direction_name(*advice.direction) : "-");
    return advice;
}

std::string Advisor::extra_context(const world::WorldSnapshot& snap) const {
    std::vector<std::string> parts;

    if (battle_.in_battle()) {
        parts.push_back(battle_.battle_context(snap));
        if (!snap.opponent.empty() && !snap.party.empty()) {
            auto pick = battle_.recommend_move(snap.party.front().moves, snap.opponent);
            if (pick) {
                parts.push_back(fmt::format("\nVs {}: {}", snap.opponent, pick->text()));
            }
        }
    }

    if (!snap.party.empty()) {
        const auto& lead = snap.party.front();
        u32 pct = lead.hp_percent();

        if (lead.fainted() && !battle_.in_battle()) {
            parts.push_back(fmt::format(
                "\nCRITICAL: {} has FAINTED! Open menu (START) and switch to a "
                "healthy Pokemon, then go to the nearest Pokemon Center!",
                lead.species));
        } else if (!lead.fainted() && pct < config_.low_hp_percent) {
            parts.push_back(fmt::format(
                "\nCRITICAL HP WARNING: {} is at {}/{} HP ({}%)! STOP fighting "
                "and go to a Pokemon Center NOW! Avoid tall grass and trainers!",
                lead.species, lead.hp_current, lead.hp_max, pct));
        }

        bool all_low = std::all_of(
            snap.party.begin(), snap.party.end(),
            [this](const world::PartyMember& m) {
                return m.hp_percent() < config_.low_hp_percent;
            });
        if (all_low) {
            parts.push_back(
                "\nEMERGENCY: ALL POKEMON ARE LOW HP! GO TO POKEMON CENTER "
                "IMMEDIATELY! Do NOT enter grass or fight anyone!");
        }
    }

    if (!battle_.in_battle()) {
        auto hint = navigator_.map_hint(snap.map_id);
        if (!hint.empty()) {
            parts.push_back("\nNAVIGATION: " + hint);
        }
        auto targets = navigator_.targets_text(snap.map_id);
        if (!targets.empty()) {
            parts.push_back("\nWalk targets:\n" + targets);
        }
        if (navigator_.active()) {
            parts.push_back(fmt::format("\nWalking to {} ({} tiles away)",
                                        navigator_.target_label(),
                                        navigator_.distance_remaining(snap.player)));
        }
    }

    if (config_.review_interval > 0 && tick_ % config_.review_interval == 0) {
        parts.push_back("\nGoal Tree:\n" + goals_.render());
    }

    std::string out;
    for (size_t i = 0; i < parts.size(); i++) {
        if (i > 0) out += '\n';
        out += parts[i];
    }
    return out;
}

bool Advisor::apply_goal_update(const std::string& update) {
    if (update.empty() || update == "null") return false;

    const auto* current = goals_.current_goal();
    if (!current) return false;
    std::string id = current->id;

    auto lower = to_lower(update);
    if (lower.find("complete") != std::string::npos) {
        return goals_.complete_goal(id, update);
    }
    if (lower.find("fail") != std::string::npos) {
        return goals_.fail_goal(id, update);
    }
    if (lower.find("progress") != std::string::npos) {
        return goals_.add_note(id, update);
    }
    return false;
}

bool Advisor::handle_goto(const std::string& command, MapId map) {
    constexpr std::string_view prefix = "GOTO_";
    if (command.size() <= prefix.size() ||
        command.compare(0, prefix.size(), prefix) != 0) {
        return false;
    }
    return navigator_.set_target(map, to_lower(command.substr(prefix.size())));
}

} // namespace rp::advisor
