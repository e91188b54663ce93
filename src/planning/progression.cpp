#include "planning/progression.hpp"
#include "planning/goal_tree.hpp"

#include <spdlog/spdlog.h>

namespace rp::planning {

namespace {

struct Milestone {
    const char* name;
    const char* description;
};

constexpr Milestone kMilestones[] = {
    {"Pallet Town - Get starter Pokemon",
     "Go downstairs, try to leave town, go to Oak's lab, pick a starter "
     "(Charmander/Squirtle/Bulbasaur), win rival battle"},
    {"Route 1 - Reach Viridian City",
     "Walk north through Route 1 to Viridian City. Battle wild Pokemon to "
     "gain XP along the way"},
    {"Viridian City - Deliver Oak's Parcel",
     "Get Oak's Parcel from the Poke Mart, deliver it to Prof. Oak in Pallet "
     "Town, return to Viridian City"},
    {"Route 2 + Viridian Forest - Reach Pewter City",
     "Go north through Route 2 and Viridian Forest. Train Pokemon to Lv.12+ "
     "for Brock. Catch a Pikachu if possible"},
    {"Pewter City - Beat Brock (Gym 1, Rock)",
     "Challenge Brock's Rock-type gym. Use Water/Grass moves. His ace is "
     "Onix Lv.14. Need Lv.12+ to win"},
    {"Route 3 + Mt. Moon - Reach Cerulean City",
     "Travel through Route 3, Mt. Moon (get fossils), Route 4 to Cerulean "
     "City. Train along the way"},
    {"Cerulean City - Beat Misty (Gym 2, Water)",
     "Challenge Misty's Water-type gym. Use Grass/Electric moves. Her ace is "
     "Starmie Lv.21. Need Lv.18+"},
    {"Route 24/25 - Nugget Bridge + Bill's House",
     "Cross Nugget Bridge (5 trainers + Rocket Grunt), visit Bill's house to "
     "get the SS Anne ticket"},
    {"Routes 5/6 - Reach Vermilion City",
     "Go south through Routes 5 and 6, through the underground path, to "
     "Vermilion City"},
    {"SS Anne - Get HM01 Cut",
     "Board the SS Anne, battle trainers, defeat rival, get HM01 Cut from the "
     "captain"},
    {"Vermilion City - Beat Lt. Surge (Gym 3, Electric)",
     "Use Cut on the tree blocking the gym. Solve the trash can switch "
     "puzzle. Beat Lt. Surge's Electric types. Use Ground moves. His ace is "
     "Raichu Lv.24"},
    {"Routes 9/10 + Rock Tunnel - Reach Lavender Town",
     "Travel east through Route 9, Rock Tunnel (need Flash), Route 10 to "
     "Lavender Town"},
    {"Celadon City - Beat Erika (Gym 4, Grass)",
     "Go west to Celadon City. Challenge Erika's Grass-type gym. Use "
     "Fire/Flying/Ice moves. Her ace is Vileplume Lv.29"},
    {"Celadon City - Rocket Game Corner + Silph Scope",
     "Infiltrate the Rocket Game Corner hideout, defeat Giovanni, get the "
     "Silph Scope"},
    {"Lavender Town - Clear Pokemon Tower",
     "Use Silph Scope in Pokemon Tower. Battle Ghost Marowak. Rescue Mr. "
     "Fuji. Get the Poke Flute"},
    {"Saffron City - Clear Silph Co.",
     "Enter Silph Co., navigate floors, defeat Rocket Grunts, battle rival, "
     "defeat Giovanni. Get Master Ball"},
    {"Saffron City - Beat Sabrina (Gym 5, Psychic)",
     "Navigate the teleporter maze gym. Beat Sabrina's Psychic types. Use "
     "Bug/Ghost/Dark moves. Her ace is Alakazam Lv.43"},
    {"Fuchsia City - Beat Koga (Gym 6, Poison)",
     "Travel to Fuchsia City. Beat Koga's Poison-type gym. Use Ground/Psychic "
     "moves. His ace is Weezing Lv.43. Get HM03 Surf from Safari Zone"},
    {"Cinnabar Island - Beat Blaine (Gym 7, Fire)",
     "Surf south to Cinnabar Island. Get Secret Key from Pokemon Mansion. "
     "Beat Blaine's Fire types. Use Water/Ground/Rock moves. His ace is "
     "Arcanine Lv.47"},
    {"Viridian City - Beat Giovanni (Gym 8, Ground)",
     "Return to Viridian City gym. Beat Giovanni's Ground types. Use "
     "Water/Grass/Ice moves. His ace is Rhyhorn Lv.50"},
    {"Route 23 + Victory Road",
     "Show all 8 badges at the gate. Navigate Victory Road (strength "
     "puzzles). Train team to Lv.50+"},
    {"Indigo Plateau - Elite Four + Champion",
     "Beat Lorelei (Ice), Bruno (Fighting), Agatha (Ghost), Lance (Dragon), "
     "then Champion (rival). Need Lv.55+ team with good type coverage"},
};

} // namespace

std::string setup_progression(GoalTree& tree) {
    auto root = tree.add_goal(
        "Beat the Elite Four",
        "Complete Pokemon FireRed by defeating all 8 gym leaders and the "
        "Elite Four + Champion",
        1);

    std::vector<SubgoalSpec> steps;
    for (const auto& m : kMilestones) {
        SubgoalSpec step;
        step.name = m.name;
        step.description = m.description;
        step.sequential = true;
        steps.push_back(std::move(step));
    }

    tree.add_subgoals(root, steps);
    spdlog::info("FireRed progression goals initialized ({} milestones)",
                 steps.size());
    return root;
}

} // namespace rp::planning
