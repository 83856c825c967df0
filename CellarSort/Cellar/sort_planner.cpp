#include "sort_planner.hpp"
#include "cellar_constants.hpp"

#include <spdlog/spdlog.h>

#include <unordered_map>
#include <unordered_set>

namespace cellar
{
    SortPlanner::SortPlanner(const CurrentLayout &current, const TargetLayout &target)
        : m_current(current), m_target(target)
    {
        for (const auto &entry : m_target)
            m_slots.intern(entry.first);
        for (const auto &entry : m_current)
            m_slots.intern(entry.first);
    }

    // Slots cibles dont l'occupant actuel n'est pas le bon vin
    void SortPlanner::find_displacements()
    {
        for (const auto &entry : m_target)
        {
            int slot = m_slots.find(entry.first);
            const Occupant *occupant = m_current.find(entry.first);

            if (occupant != nullptr && occupant->m_wine_id == entry.second.m_wine_id)
            {
                // Deja en place : la bouteille est reservee a ce slot
                ++m_plan.m_stats.m_stay_in_place;
                m_claimed[slot] = 1;
                continue;
            }

            m_is_displaced[slot] = 1;
            m_wanted[slot] = &entry.second;
            m_displaced.push_back(slot);
        }
    }

    // Glouton : premiere source libre dans l'ordre du layout courant.
    // Pas de notion de distance ni de zone.
    void SortPlanner::match_sources()
    {
        // wine_id -> slots qui le contiennent actuellement
        std::unordered_map<WineId, std::vector<int>> wine_slots;
        for (const auto &entry : m_current)
            wine_slots[entry.second.m_wine_id].push_back(m_slots.find(entry.first));

        // Curseur par vin : les candidats avant le curseur sont tous pris
        std::unordered_map<WineId, size_t> cursors;

        for (int target_slot : m_displaced)
        {
            WineId wine_id = m_wanted[target_slot]->m_wine_id;
            auto it = wine_slots.find(wine_id);
            if (it == wine_slots.end())
                continue; // Vin absent de la cave

            const std::vector<int> &candidates = it->second;
            size_t &cursor = cursors[wine_id];
            while (cursor < candidates.size() && m_claimed[candidates[cursor]])
                ++cursor;

            if (cursor == candidates.size())
                continue; // Toutes les bouteilles sont deja attribuees

            int source_slot = candidates[cursor];
            m_claimed[source_slot] = 1;
            m_source_of[target_slot] = source_slot;
        }
    }

    // Parcourt target -> source tant que la source est elle-meme un slot
    // deplace non visite
    void SortPlanner::decompose_chains()
    {
        std::vector<bool> visited(m_source_of.size(), false);
        std::vector<int> chain;

        for (int start : m_displaced)
        {
            if (visited[start] || m_source_of[start] == constants::NO_SLOT)
                continue;

            chain.clear();
            bool closed = false;
            int current = start;

            while (!visited[current])
            {
                visited[current] = true;
                int source = m_source_of[current];
                if (source == constants::NO_SLOT)
                    break;

                chain.push_back(current);

                if (m_is_displaced[source] && !visited[source])
                {
                    current = source;
                    continue;
                }

                // La chaine se referme sur son depart : swap ou cycle
                closed = (source == start);
                break;
            }

            if (!chain.empty())
                emit_chain(chain, closed);
        }
    }

    void SortPlanner::emit_chain(const std::vector<int> &chain, bool closed)
    {
        SortStats &stats = m_plan.m_stats;

        // Chaine ouverte : chaque etape libere un slot sans retour
        if (!closed || chain.size() == 1)
        {
            for (int target_slot : chain)
                m_plan.m_moves.push_back(make_move(target_slot, MoveType::DIRECT));
            stats.m_direct_moves += static_cast<int>(chain.size());
            return;
        }

        MoveType type = MoveType::CYCLE;
        if (chain.size() == 2)
        {
            type = MoveType::SWAP;
            ++stats.m_swaps;
        }
        else
        {
            ++stats.m_cycles;
        }

        for (int target_slot : chain)
            m_plan.m_moves.push_back(make_move(target_slot, type));
    }

    Move SortPlanner::make_move(int target_slot, MoveType type) const
    {
        const TargetPlacement &wanted = *m_wanted[target_slot];
        return Move{wanted.m_wine_id,
                    wanted.m_wine_name,
                    m_slots.slot_at(m_source_of[target_slot]),
                    m_slots.slot_at(target_slot),
                    wanted.m_zone_id,
                    wanted.m_confidence,
                    type};
    }

    SortPlan SortPlanner::compute()
    {
        const size_t count = static_cast<size_t>(m_slots.size());
        m_displaced.clear();
        m_displaced.reserve(m_target.size());
        m_is_displaced.assign(count, 0);
        m_wanted.assign(count, nullptr);
        m_claimed.assign(count, 0);
        m_source_of.assign(count, constants::NO_SLOT);
        m_plan = SortPlan();

        find_displacements();
        match_sources();
        decompose_chains();
        m_plan.m_stats.m_total_moves = static_cast<int>(m_plan.m_moves.size());

        spdlog::debug("sort plan: {} moves ({} direct, {} swaps, {} cycles), {} in place",
                      m_plan.m_stats.m_total_moves, m_plan.m_stats.m_direct_moves,
                      m_plan.m_stats.m_swaps, m_plan.m_stats.m_cycles,
                      m_plan.m_stats.m_stay_in_place);
        return m_plan;
    }

    SortPlan compute_sort_plan(const CurrentLayout &current, const TargetLayout &target)
    {
        SortPlanner planner(current, target);
        return planner.compute();
    }

    std::vector<SlotId> find_unresolved_targets(const CurrentLayout &current,
                                                const TargetLayout &target,
                                                const SortPlan &plan)
    {
        std::unordered_set<SlotId> filled;
        for (const auto &move : plan.m_moves)
            filled.insert(move.m_to);

        std::vector<SlotId> unresolved;
        for (const auto &entry : target)
        {
            const Occupant *occupant = current.find(entry.first);
            if (occupant != nullptr && occupant->m_wine_id == entry.second.m_wine_id)
                continue;
            if (filled.count(entry.first))
                continue;
            unresolved.push_back(entry.first);
        }
        return unresolved;
    }
} // namespace cellar
