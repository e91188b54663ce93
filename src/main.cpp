#include "advisor/advisor.hpp"
#include "battle/battle_tracker.hpp"
#include "core/log.hpp"
#include "core/types.hpp"
#include "data/dex.hpp"
#include "data/landmark_registry.hpp"
#include "data/type_chart.hpp"
#include "lua/config_loader.hpp"
#include "nav/navigator.hpp"
#include "planning/goal_store.hpp"
#include "planning/goal_tree.hpp"
#include "planning/progression.hpp"
#include "world/world_snapshot.hpp"

#include <algorithm>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <optional>
#include <string>
#include <spdlog/spdlog.h>

static void print_usage() {
    std::cout << "redplan v0.1.0\n"
              << "Rule-based goal, navigation and battle advisor for an "
                 "emulated RPG\n\n"
              << "Usage:\n"
              << "  redplan [options]\n\n"
              << "Options:\n"
              << "  --config <path>  Lua config file (Config = { ... })\n"
              << "  --data <dir>     Directory holding landmarks/type_chart/dex.lua\n"
              << "  --plans <path>   Goal document to load and rewrite\n"
              << "  --trace <path>   Snapshot trace to replay (Trace = { ... })\n"
              << "  --log <path>     Log file (default: redplan.log)\n"
              << "  --ticks <n>      Replay at most n ticks (default: whole trace)\n"
              << "  --goto <KEY>     Walk to landmark KEY on the first tick's map\n"
              << "  --help           Show this help message\n";
}

static const char* find_arg(int argc, char* argv[], const char* flag) {
    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], flag) == 0 && i + 1 < argc) {
            return argv[i + 1];
        }
    }
    return nullptr;
}

static bool parse_flag(int argc, char* argv[], const char* flag) {
    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], flag) == 0) return true;
    }
    return false;
}

/// Build the config: compiled defaults, then the config file, then flags.
static bool parse_args(int argc, char* argv[], rp::lua::Config& config) {
    if (const char* path = find_arg(argc, argv, "--config")) {
        auto result = rp::lua::load_config(path, config);
        if (!result) {
            std::cerr << result.error().message << "\n";
            return false;
        }
    }

    if (const char* v = find_arg(argc, argv, "--data")) config.data_dir = v;
    if (const char* v = find_arg(argc, argv, "--plans")) config.plans_file = v;
    if (const char* v = find_arg(argc, argv, "--trace")) config.trace_file = v;
    if (const char* v = find_arg(argc, argv, "--log")) config.log_file = v;
    return true;
}

static std::optional<rp::u64> parse_ticks_arg(int argc, char* argv[]) {
    const char* arg = find_arg(argc, argv, "--ticks");
    if (!arg) return std::nullopt;

    char* end = nullptr;
    long long val = std::strtoll(arg, &end, 10);
    if (end == arg || *end != '\0' || val < 0) {
        spdlog::error("Invalid --ticks value: {}", arg);
        return 0;
    }
    return static_cast<rp::u64>(val);
}

int main(int argc, char* argv[]) {
    if (parse_flag(argc, argv, "--help")) {
        print_usage();
        return 0;
    }

    rp::lua::Config config;
    if (!parse_args(argc, argv, config)) {
        return 1;
    }

    auto level = rp::log::parse_level(config.log_level);
    rp::log::init(config.log_file, level.value_or(spdlog::level::debug));
    if (!level) {
        spdlog::warn("Unknown log_level '{}', using debug", config.log_level);
    }

    if (config.trace_file.empty()) {
        spdlog::error("No trace to replay. Use --trace or set trace_file in the config.");
        print_usage();
        return 1;
    }

    // Static data: a missing file degrades to an empty registry.
    rp::data::LandmarkRegistry landmarks;
    if (auto r = landmarks.load_file(config.landmarks_path()); !r) {
        spdlog::warn("{}", r.error().message);
    }
    rp::data::TypeChart chart;
    if (auto r = chart.load_file(config.type_chart_path()); !r) {
        spdlog::warn("{} (all matchups neutral)", r.error().message);
    }
    rp::data::Dex dex;
    if (auto r = dex.load_file(config.dex_path()); !r) {
        spdlog::warn("{}", r.error().message);
    }

    rp::planning::GoalStore store(config.plans_file);
    rp::planning::GoalTree goals(&store, config.goal_max_attempts);
    goals.load();
    if (goals.empty()) {
        spdlog::info("No existing goals, setting up progression");
        rp::planning::setup_progression(goals);
    }
    spdlog::info("Active goals: {}", goals.size());

    rp::nav::Navigator navigator(landmarks, config.navigator);
    rp::battle::BattleTracker battle(chart, dex, config.battle);

    rp::advisor::AdvisorConfig advisor_config;
    advisor_config.review_interval = config.review_interval;
    rp::advisor::Advisor advisor(goals, navigator, battle, advisor_config);

    auto trace = rp::world::load_trace(config.trace_file);
    if (!trace) {
        spdlog::error("{}", trace.error().message);
        return 1;
    }

    auto limit = parse_ticks_arg(argc, argv);
    const auto& ticks = trace.value();
    rp::u64 count = limit ? std::min<rp::u64>(*limit, ticks.size()) : ticks.size();
    spdlog::info("Replaying {} of {} ticks from {}", count, ticks.size(),
                 config.trace_file.string());

    const char* goto_key = find_arg(argc, argv, "--goto");

    for (rp::u64 i = 0; i < count; i++) {
        const auto& snap = ticks[i];

        if (i == 0 && goto_key) {
            std::string command = std::string("GOTO_") + goto_key;
            if (!advisor.handle_goto(command, snap.map_id)) {
                spdlog::warn("Cannot walk to {} on map {}", goto_key, snap.map_id);
            }
        }

        auto advice = advisor.tick(snap);

        if (advice.battle_event.started) {
            spdlog::info("[Tick {}] battle started ({})", advice.tick,
                         rp::world::battle_kind_name(*advice.battle_event.started));
        }
        if (advice.battle_event.ended) {
            spdlog::info("[Tick {}] battle ended: {}", advice.tick,
                         rp::battle::battle_outcome_name(*advice.battle_event.ended));
        }
        spdlog::info("[Tick {}] move hint: {}", advice.tick,
                     advice.direction ? rp::nav::direction_name(*advice.direction)
                                      : "none");
        spdlog::debug("[Tick {}] goal:\n{}", advice.tick, advice.goal_context);
        if (!advice.extra_context.empty()) {
            spdlog::debug("[Tick {}] context:\n{}", advice.tick, advice.extra_context);
        }
    }

    auto stats = battle.stats();
    spdlog::info("Replay done: {} ticks, {} battles won, {} whiteouts",
                 advisor.tick_count(), stats.won, stats.whiteouts);
    spdlog::info("Goal tree:\n{}", goals.render());

    rp::log::shutdown();
    return 0;
}
