#include "battle/battle_tracker.hpp"
#include "data/dex.hpp"
#include "data/type_chart.hpp"

#include <algorithm>
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

namespace rp::battle {

const char* battle_outcome_name(BattleOutcome outcome) {
    switch (outcome) {
    case BattleOutcome::Won: return "won";
    case BattleOutcome::Whiteout: return "whiteout";
    }
    return "unknown";
}

std::string MoveSuggestion::text() const {
    return fmt::format("Use {} (super effective x{:g}!)", move, multiplier);
}

BattleTracker::BattleTracker(const data::TypeChart& chart, const data::Dex& dex,
                             BattleConfig config)
    : chart_(chart), dex_(dex), config_(config) {}

BattleEvent BattleTracker::update(const world::WorldSnapshot& snap) {
    BattleEvent event;

    if (!in_battle_ && snap.in_battle()) {
        in_battle_ = true;
        kind_ = snap.battle;
        turns_ = 0;
        start_party_hp_.clear();
        for (const auto& mon : snap.party) {
            start_party_hp_.emplace_back(mon.hp_current, mon.hp_max);
        }
        start_money_ = snap.money;
        event.started = kind_;
        spdlog::info("Battle started: {}", world::battle_kind_name(kind_));
    } else if (in_battle_ && !snap.in_battle()) {
        in_battle_ = false;
        auto outcome = classify_end(snap);
        if (outcome == BattleOutcome::Whiteout) {
            whiteouts_++;
            spdlog::info("Battle ended: WHITEOUT after {} turns", turns_);
        } else {
            won_++;
            spdlog::info("Battle ended: WON after {} turns (total: {})", turns_, won_);
        }
        kind_ = world::BattleKind::None;
        event.ended = outcome;
    } else if (in_battle_) {
        turns_++;
    }

    return event;
}

BattleOutcome BattleTracker::classify_end(const world::WorldSnapshot& snap) const {
    // Losing a battle sends the player home and costs money; any drop in
    // money across the battle is read as a whiteout.
    bool all_fainted = !snap.party.empty() &&
        std::all_of(snap.party.begin(), snap.party.end(),
                    [](const world::PartyMember& m) { return m.fainted(); });

    if (all_fainted || snap.money < start_money_) {
        return BattleOutcome::Whiteout;
    }
    return BattleOutcome::Won;
}

std::string BattleTracker::battle_context(const world::WorldSnapshot& snap) const {
    if (!in_battle_) return {};

    std::string out = fmt::format(
        "IN BATTLE ({}) - Turn {}",
        kind_ == world::BattleKind::Wild ? "WILD" : "TRAINER", turns_);

    if (!snap.party.empty()) {
        out += "\n\nYour team:";
        for (size_t i = 0; i < snap.party.size(); i++) {
            const auto& mon = snap.party[i];
            std::string moves;
            for (size_t m = 0; m < mon.moves.size(); m++) {
                if (m > 0) moves += ", ";
                moves += mon.moves[m];
            }
            out += fmt::format("\n  {}. {} HP:{}/{} ({}%) Moves: {}", i + 1,
                               mon.species, mon.hp_current, mon.hp_max,
                               mon.hp_percent(), moves);
        }
    }

    if (turns_ > config_.drag_on_turns) {
        out += "\n\nWARNING: This battle is dragging on. Consider using "
               "stronger moves or running.";
    }
    return out;
}

f64 BattleTracker::type_effectiveness(
    std::string_view attack_type,
    const std::vector<std::string>& defend_types) const {
    return chart_.effectiveness(attack_type, defend_types);
}

std::optional<MoveSuggestion> BattleTracker::recommend_move(
    const std::vector<std::string>& moves, std::string_view opponent) const {
    const auto& opponent_types = dex_.species_types(opponent);
    if (opponent_types.empty()) return std::nullopt;

    std::optional<MoveSuggestion> best;
    for (const auto& move : moves) {
        if (move.empty() || move == "---") continue;
        auto move_type = dex_.move_type(move);
        if (!move_type) continue;

        f64 eff = type_effectiveness(*move_type, opponent_types);
        if (!best || eff > best->multiplier) {
            best = MoveSuggestion{move, eff};
        }
    }

    if (best && best->multiplier > 1.0) {
        spdlog::debug("Recommending {} against {} (x{})", best->move, opponent,
                      best->multiplier);
        return best;
    }
    return std::nullopt;
}

BattleStats BattleTracker::stats() const {
    BattleStats s;
    s.in_battle = in_battle_;
    s.kind = kind_;
    s.turns = turns_;
    s.won = won_;
    s.fled = fled_;
    s.whiteouts = whiteouts_;
    return s;
}

} // namespace rp::battle
