#pragma once

/// Structures de moves et resultats du planner.
/// Reutilisable par tout executeur qui applique des moves
/// slot -> slot en deux phases (vider les sources, puis remplir les cibles).

#include "types.hpp"

#include <vector>

namespace cellar
{
    /// Nature d'un move dans la permutation. Purement descriptif :
    /// tous les moves s'executent avec la meme discipline en deux phases.
    enum class MoveType
    {
        DIRECT, // Chaine ouverte : le slot cible se libere sans retour
        SWAP,   // Echange A <-> B
        CYCLE   // Cycle de longueur >= 3
    };

    /// Move atomique emis par le planner
    struct Move
    {
        WineId m_wine_id;
        std::string m_wine_name;  // Vide si inconnu
        SlotId m_from;            // Slot vide en phase 1
        SlotId m_to;              // Slot rempli en phase 2
        std::string m_zone_id;    // Vide si inconnu
        Confidence m_confidence;
        MoveType m_type;
    };

    /// Statistiques du plan
    struct SortStats
    {
        int m_stay_in_place = 0; // Slots deja corrects
        int m_direct_moves = 0;  // Moves DIRECT
        int m_swaps = 0;         // Paires echangees (pas le nombre de moves)
        int m_cycles = 0;        // Cycles >= 3 distincts (pas le nombre de moves)
        int m_total_moves = 0;
    };

    struct SortPlan
    {
        std::vector<Move> m_moves; // Membres d'un meme cycle contigus
        SortStats m_stats;
    };

    /// Type d'une proposition venant d'une autre source que le planner
    enum class ProposalKind
    {
        MOVE,       // Deplacement reel
        SUGGESTION, // Conseil non actionnable
        INFO        // Annotation
    };

    /// Move propose (suggestions, audit, guide). Seuls les MOVE deplacent
    /// une bouteille.
    struct ProposedMove
    {
        ProposalKind m_kind;
        WineId m_wine_id;
        std::string m_wine_name;
        SlotId m_from;
        SlotId m_to;
        std::string m_zone_id;
        Confidence m_confidence;
    };

    inline const char *to_string(MoveType type)
    {
        switch (type)
        {
        case MoveType::DIRECT:
            return "direct";
        case MoveType::SWAP:
            return "swap";
        case MoveType::CYCLE:
            return "cycle";
        }
        return "direct";
    }

    inline const char *to_string(ProposalKind kind)
    {
        switch (kind)
        {
        case ProposalKind::MOVE:
            return "move";
        case ProposalKind::SUGGESTION:
            return "suggestion";
        case ProposalKind::INFO:
            return "info";
        }
        return "info";
    }

    // Un move du planner est toujours un deplacement reel
    inline ProposedMove to_proposal(const Move &move)
    {
        return ProposedMove{ProposalKind::MOVE, move.m_wine_id, move.m_wine_name,
                            move.m_from, move.m_to, move.m_zone_id, move.m_confidence};
    }

    std::vector<ProposedMove> to_proposals(const std::vector<Move> &moves);

} // namespace cellar
