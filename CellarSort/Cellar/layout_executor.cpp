#include "layout_executor.hpp"

#include "move_plan_validator.hpp"

#include <spdlog/spdlog.h>

namespace cellar
{
    bool apply_moves(const CurrentLayout &layout,
                     const std::vector<Move> &moves,
                     CurrentLayout &out_layout,
                     std::string &out_error)
    {
        if (moves.empty())
        {
            out_error = "Moves array required";
            return false;
        }

        const ValidationResult validation = validate_move_plan(moves, layout);
        if (!validation.m_valid)
        {
            out_error = "Move plan validation failed: " + validation.m_errors.front().m_message;
            return false;
        }

        CurrentLayout staged = layout;
        const size_t before_count = staged.size();

        // Phase 1 : on garde la bouteille sortie pour conserver sa couleur
        std::vector<Occupant> lifted;
        lifted.reserve(moves.size());
        for (const auto &move : moves)
        {
            const Occupant *occupant = staged.find(move.m_from);
            if (occupant != nullptr)
                lifted.push_back(*occupant);
            else
                lifted.push_back(Occupant{move.m_wine_id, move.m_wine_name, "", ""});
            staged.erase(move.m_from);
        }

        // Phase 2
        for (size_t i = 0; i < moves.size(); ++i)
        {
            const Move &move = moves[i];
            Occupant placed = lifted[i];
            placed.m_wine_id = move.m_wine_id;
            if (!move.m_wine_name.empty())
                placed.m_wine_name = move.m_wine_name;
            if (!move.m_zone_id.empty())
                placed.m_zone_id = move.m_zone_id;
            staged.set(move.m_to, placed);
        }

        const size_t after_count = staged.size();
        if (after_count != before_count)
        {
            out_error = "Invariant violation: bottle count changed from " +
                        std::to_string(before_count) + " to " + std::to_string(after_count);
            spdlog::warn("apply_moves: {}", out_error);
            return false;
        }

        out_layout = staged;
        spdlog::debug("apply_moves: {} move(s) applied, {} bottle(s)", moves.size(), after_count);
        return true;
    }
} // namespace cellar
