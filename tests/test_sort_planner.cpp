#include "CellarSort/Cellar/layout_executor.hpp"
#include "CellarSort/Cellar/move_plan_validator.hpp"
#include "CellarSort/Cellar/sort_planner.hpp"
#include "test_helpers.hpp"

#include <catch2/catch.hpp>

#include <algorithm>
#include <map>
#include <random>
#include <set>
#include <string>
#include <vector>

using namespace cellar;
using cellar::test::bottle;
using cellar::test::wine;

namespace
{
    const Move *find_by_wine(const SortPlan &plan, WineId wine_id)
    {
        for (const auto &move : plan.m_moves)
        {
            if (move.m_wine_id == wine_id)
                return &move;
        }
        return nullptr;
    }

    bool all_of_type(const SortPlan &plan, MoveType type)
    {
        return std::all_of(plan.m_moves.begin(), plan.m_moves.end(),
                           [type](const Move &m)
                           { return m.m_type == type; });
    }
} // namespace

TEST_CASE("compute_sort_plan returns no moves when current matches target", "[sort_planner]")
{
    CurrentLayout current{{"R1C1", bottle(1)}, {"R1C2", bottle(2)}};
    TargetLayout target{{"R1C1", wine(1)}, {"R1C2", wine(2)}};

    SortPlan plan = compute_sort_plan(current, target);

    REQUIRE(plan.m_moves.empty());
    REQUIRE(plan.m_stats.m_stay_in_place == 2);
    REQUIRE(plan.m_stats.m_total_moves == 0);
}

TEST_CASE("compute_sort_plan handles empty layouts", "[sort_planner]")
{
    SortPlan plan = compute_sort_plan(CurrentLayout(), TargetLayout());

    REQUIRE(plan.m_moves.empty());
    REQUIRE(plan.m_stats.m_stay_in_place == 0);
    REQUIRE(plan.m_stats.m_total_moves == 0);
}

TEST_CASE("compute_sort_plan emits a direct move into an empty slot", "[sort_planner]")
{
    CurrentLayout current{{"R1C1", bottle(1)}};
    TargetLayout target{{"R1C2", wine(1)}};

    SortPlan plan = compute_sort_plan(current, target);

    REQUIRE(plan.m_moves.size() == 1);
    REQUIRE(plan.m_moves[0].m_wine_id == 1);
    REQUIRE(plan.m_moves[0].m_from == "R1C1");
    REQUIRE(plan.m_moves[0].m_to == "R1C2");
    REQUIRE(plan.m_moves[0].m_type == MoveType::DIRECT);
    REQUIRE(plan.m_stats.m_direct_moves == 1);
    REQUIRE(plan.m_stats.m_stay_in_place == 0);
}

TEST_CASE("compute_sort_plan detects a two-way swap", "[sort_planner]")
{
    CurrentLayout current{{"A", bottle(1)}, {"B", bottle(2)}};
    TargetLayout target{{"A", wine(2)}, {"B", wine(1)}};

    SortPlan plan = compute_sort_plan(current, target);

    REQUIRE(plan.m_moves.size() == 2);
    REQUIRE(all_of_type(plan, MoveType::SWAP));

    const Move *first = find_by_wine(plan, 1);
    const Move *second = find_by_wine(plan, 2);
    REQUIRE(first != nullptr);
    REQUIRE(second != nullptr);
    REQUIRE(first->m_from == "A");
    REQUIRE(first->m_to == "B");
    REQUIRE(second->m_from == "B");
    REQUIRE(second->m_to == "A");

    REQUIRE(plan.m_stats.m_stay_in_place == 0);
    REQUIRE(plan.m_stats.m_direct_moves == 0);
    REQUIRE(plan.m_stats.m_swaps == 1);
    REQUIRE(plan.m_stats.m_cycles == 0);
    REQUIRE(plan.m_stats.m_total_moves == 2);
}

TEST_CASE("compute_sort_plan detects a three-way cycle", "[sort_planner]")
{
    CurrentLayout current{{"A", bottle(1)}, {"B", bottle(2)}, {"C", bottle(3)}};
    TargetLayout target{{"A", wine(2)}, {"B", wine(3)}, {"C", wine(1)}};

    SortPlan plan = compute_sort_plan(current, target);

    REQUIRE(plan.m_moves.size() == 3);
    REQUIRE(all_of_type(plan, MoveType::CYCLE));
    REQUIRE(plan.m_stats.m_cycles == 1);
    REQUIRE(plan.m_stats.m_swaps == 0);
    REQUIRE(plan.m_stats.m_total_moves == 3);

    REQUIRE(find_by_wine(plan, 2)->m_from == "B");
    REQUIRE(find_by_wine(plan, 3)->m_from == "C");
    REQUIRE(find_by_wine(plan, 1)->m_from == "A");
}

TEST_CASE("compute_sort_plan keeps cycle members contiguous", "[sort_planner]")
{
    // Un swap (R1C1 <-> R1C2) et un cycle R2C1 -> R2C2 -> R2C3, entrelaces dans le layout cible
    CurrentLayout current{{"R1C1", bottle(1)}, {"R1C2", bottle(2)},
                          {"R2C1", bottle(3)}, {"R2C2", bottle(4)}, {"R2C3", bottle(5)}};
    TargetLayout target{{"R2C1", wine(4)}, {"R1C1", wine(2)}, {"R2C2", wine(5)},
                        {"R1C2", wine(1)}, {"R2C3", wine(3)}};

    SortPlan plan = compute_sort_plan(current, target);

    REQUIRE(plan.m_moves.size() == 5);
    REQUIRE(plan.m_stats.m_cycles == 1);
    REQUIRE(plan.m_stats.m_swaps == 1);
    REQUIRE(plan.m_moves[0].m_type == MoveType::CYCLE);
    REQUIRE(plan.m_moves[1].m_type == MoveType::CYCLE);
    REQUIRE(plan.m_moves[2].m_type == MoveType::CYCLE);
    REQUIRE(plan.m_moves[3].m_type == MoveType::SWAP);
    REQUIRE(plan.m_moves[4].m_type == MoveType::SWAP);
}

TEST_CASE("compute_sort_plan handles a mix of stays, swaps and direct moves", "[sort_planner]")
{
    CurrentLayout current{{"R1C1", bottle(1)}, {"R1C2", bottle(2)},
                          {"R1C3", bottle(3)}, {"R2C1", bottle(4)}};
    TargetLayout target{{"R1C1", wine(1)}, {"R1C2", wine(3)},
                        {"R1C3", wine(2)}, {"R2C2", wine(4)}};

    SortPlan plan = compute_sort_plan(current, target);

    REQUIRE(plan.m_stats.m_stay_in_place == 1);
    REQUIRE(plan.m_stats.m_swaps == 1);
    REQUIRE(plan.m_stats.m_direct_moves == 1);
    REQUIRE(plan.m_stats.m_total_moves == 3);
}

TEST_CASE("compute_sort_plan emits open chains as direct moves", "[sort_planner]")
{
    // Wine 1 : A -> B, wine 2 : B -> C. Jamais de retour vers A.
    CurrentLayout current{{"A", bottle(1)}, {"B", bottle(2)}};

    SECTION("chain discovered from its head")
    {
        TargetLayout target{{"B", wine(1)}, {"C", wine(2)}};
        SortPlan plan = compute_sort_plan(current, target);

        REQUIRE(plan.m_moves.size() == 2);
        REQUIRE(all_of_type(plan, MoveType::DIRECT));
        REQUIRE(plan.m_stats.m_direct_moves == 2);
        REQUIRE(plan.m_stats.m_swaps == 0);
    }

    SECTION("chain discovered from its tail")
    {
        TargetLayout target{{"C", wine(2)}, {"B", wine(1)}};
        SortPlan plan = compute_sort_plan(current, target);

        REQUIRE(plan.m_moves.size() == 2);
        REQUIRE(all_of_type(plan, MoveType::DIRECT));
        REQUIRE(plan.m_stats.m_direct_moves == 2);
        REQUIRE(plan.m_stats.m_swaps == 0);
        REQUIRE(plan.m_moves[0].m_to == "C");
        REQUIRE(plan.m_moves[1].m_to == "B");
    }
}

TEST_CASE("compute_sort_plan handles several bottles of the same wine", "[sort_planner]")
{
    CurrentLayout current{{"R1C1", bottle(1, "Cab 2020")}, {"R1C2", bottle(1, "Cab 2020")}};
    TargetLayout target{{"R2C1", wine(1, "Cab 2020")}, {"R2C2", wine(1, "Cab 2020")}};

    SortPlan plan = compute_sort_plan(current, target);

    REQUIRE(plan.m_moves.size() == 2);

    std::set<SlotId> froms;
    std::set<SlotId> tos;
    for (const auto &move : plan.m_moves)
    {
        REQUIRE(move.m_wine_id == 1);
        froms.insert(move.m_from);
        tos.insert(move.m_to);
    }
    REQUIRE(froms == std::set<SlotId>{"R1C1", "R1C2"});
    REQUIRE(tos == std::set<SlotId>{"R2C1", "R2C2"});

    SECTION("first unclaimed bottle wins")
    {
        REQUIRE(plan.m_moves[0].m_from == "R1C1");
        REQUIRE(plan.m_moves[0].m_to == "R2C1");
    }
}

TEST_CASE("compute_sort_plan never takes a bottle that is already in place", "[sort_planner]")
{
    CurrentLayout current{{"A", bottle(1)}, {"C", bottle(1)}};
    TargetLayout target{{"A", wine(1)}, {"B", wine(1)}};

    SortPlan plan = compute_sort_plan(current, target);

    REQUIRE(plan.m_stats.m_stay_in_place == 1);
    REQUIRE(plan.m_moves.size() == 1);
    REQUIRE(plan.m_moves[0].m_from == "C");
    REQUIRE(plan.m_moves[0].m_to == "B");
}

TEST_CASE("compute_sort_plan copies zone, name and confidence from the target", "[sort_planner]")
{
    CurrentLayout current{{"R1C1", bottle(1, "W1")}};
    TargetLayout target{{"R2C1", wine(1, "W1", "shiraz", Confidence::MEDIUM)}};

    SortPlan plan = compute_sort_plan(current, target);

    REQUIRE(plan.m_moves.size() == 1);
    REQUIRE(plan.m_moves[0].m_zone_id == "shiraz");
    REQUIRE(plan.m_moves[0].m_wine_name == "W1");
    REQUIRE(plan.m_moves[0].m_confidence == Confidence::MEDIUM);
}

TEST_CASE("compute_sort_plan drops targets whose wine is not in the cellar", "[sort_planner]")
{
    SECTION("wine missing from the current layout")
    {
        CurrentLayout current{{"R1C1", bottle(1)}};
        TargetLayout target{{"R1C1", wine(1)}, {"R1C2", wine(99)}};

        SortPlan plan = compute_sort_plan(current, target);

        REQUIRE(plan.m_moves.empty());
        REQUIRE(plan.m_stats.m_stay_in_place == 1);
        REQUIRE(find_unresolved_targets(current, target, plan) == std::vector<SlotId>{"R1C2"});
    }

    SECTION("empty current layout")
    {
        CurrentLayout current;
        TargetLayout target{{"R1C1", wine(1)}};

        SortPlan plan = compute_sort_plan(current, target);

        REQUIRE(plan.m_moves.empty());
        REQUIRE(find_unresolved_targets(current, target, plan).size() == 1);
    }

    SECTION("more target slots than bottles")
    {
        CurrentLayout current{{"A", bottle(7)}};
        TargetLayout target{{"B", wine(7)}, {"C", wine(7)}};

        SortPlan plan = compute_sort_plan(current, target);

        REQUIRE(plan.m_moves.size() == 1);
        REQUIRE(plan.m_moves[0].m_to == "B");

        std::vector<SlotId> unresolved = find_unresolved_targets(current, target, plan);
        REQUIRE(unresolved == std::vector<SlotId>{"C"});
        REQUIRE(target.size() == static_cast<size_t>(plan.m_stats.m_stay_in_place +
                                                     plan.m_stats.m_total_moves) +
                                     unresolved.size());
    }
}

TEST_CASE("compute_sort_plan ignores bottles absent from the target", "[sort_planner]")
{
    CurrentLayout current{{"R1C1", bottle(1)}, {"R1C2", bottle(2)}};
    TargetLayout target{{"R1C2", wine(2)}};

    SortPlan plan = compute_sort_plan(current, target);

    REQUIRE(plan.m_moves.empty());
    REQUIRE(plan.m_stats.m_stay_in_place == 1);
}

TEST_CASE("compute_sort_plan handles many independent moves", "[sort_planner]")
{
    CurrentLayout current{{"R1C1", bottle(1)}, {"R1C2", bottle(2)}, {"R1C3", bottle(3)},
                          {"R2C1", bottle(4)}, {"R2C2", bottle(5)}, {"R2C3", bottle(6)}};
    TargetLayout target{{"R3C1", wine(1)}, {"R3C2", wine(2)}, {"R3C3", wine(3)},
                        {"R4C1", wine(4)}, {"R4C2", wine(5)}, {"R4C3", wine(6)}};

    SortPlan plan = compute_sort_plan(current, target);

    REQUIRE(plan.m_moves.size() == 6);
    REQUIRE(plan.m_stats.m_direct_moves == 6);
    REQUIRE(plan.m_stats.m_stay_in_place == 0);
}

TEST_CASE("compute_sort_plan properties on shuffled cellars", "[sort_planner][property]")
{
    std::mt19937 rng(20261019);

    std::vector<SlotId> grid;
    for (int row = 1; row <= 4; ++row)
    {
        for (int col = 1; col <= 6; ++col)
            grid.push_back("R" + std::to_string(row) + "C" + std::to_string(col));
    }

    for (int round = 0; round < 25; ++round)
    {
        // 16 bouteilles sur 24 slots, certaines references en double
        std::vector<SlotId> slots = grid;
        std::shuffle(slots.begin(), slots.end(), rng);

        CurrentLayout current;
        std::vector<WineId> bottles;
        for (int i = 0; i < 16; ++i)
        {
            WineId wine_id = 100 + static_cast<int>(rng() % 10);
            current.set(slots[i], bottle(wine_id));
            bottles.push_back(wine_id);
        }

        std::shuffle(slots.begin(), slots.end(), rng);
        TargetLayout target;
        for (int i = 0; i < 16; ++i)
            target.set(slots[i], wine(bottles[i]));

        SortPlan plan = compute_sort_plan(current, target);

        // Disjonction des sources et des cibles
        std::set<SlotId> froms;
        std::set<SlotId> tos;
        for (const auto &move : plan.m_moves)
        {
            REQUIRE(froms.insert(move.m_from).second);
            REQUIRE(tos.insert(move.m_to).second);
        }

        // Conservation : chaque slot deplace recoit exactement son vin
        std::multiset<WineId> moved;
        for (const auto &move : plan.m_moves)
        {
            moved.insert(move.m_wine_id);
            REQUIRE(target.find(move.m_to)->m_wine_id == move.m_wine_id);
        }
        std::multiset<WineId> displaced;
        for (const auto &entry : target)
        {
            const Occupant *occupant = current.find(entry.first);
            if (occupant == nullptr || occupant->m_wine_id != entry.second.m_wine_id)
                displaced.insert(entry.second.m_wine_id);
        }
        REQUIRE(moved == displaced);

        REQUIRE(plan.m_stats.m_total_moves == static_cast<int>(plan.m_moves.size()));
        REQUIRE(plan.m_stats.m_stay_in_place + plan.m_stats.m_total_moves == 16);
        REQUIRE(validate_move_plan(plan.m_moves, current).m_valid);

        // Idempotence : apres execution, plus rien a deplacer
        if (plan.m_moves.empty())
            continue;

        CurrentLayout after;
        std::string error;
        REQUIRE(apply_moves(current, plan.m_moves, after, error));

        SortPlan again = compute_sort_plan(after, target);
        REQUIRE(again.m_moves.empty());
        REQUIRE(again.m_stats.m_stay_in_place == 16);
    }
}

TEST_CASE("compute_sort_plan on the target itself yields nothing", "[sort_planner][property]")
{
    TargetLayout target{{"R1C1", wine(3)}, {"R1C2", wine(1)}, {"R1C3", wine(3)}, {"R2C1", wine(8)}};

    CurrentLayout as_current;
    for (const auto &entry : target)
        as_current.set(entry.first, bottle(entry.second.m_wine_id));

    SortPlan plan = compute_sort_plan(as_current, target);

    REQUIRE(plan.m_moves.empty());
    REQUIRE(plan.m_stats.m_stay_in_place == static_cast<int>(target.size()));
}
