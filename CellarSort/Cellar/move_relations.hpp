#pragma once

#include "move.hpp"

#include <cstddef>
#include <map>
#include <vector>

namespace cellar
{
    /// Index d'un move -> index de son partenaire de swap
    typedef std::map<size_t, size_t> SwapPartners;

    struct SwapPairOptions
    {
        SwapPairOptions() : m_has_type_filter(false), m_type_filter(ProposalKind::MOVE) {}
        explicit SwapPairOptions(ProposalKind type_filter)
            : m_has_type_filter(true), m_type_filter(type_filter) {}

        bool m_has_type_filter;     // false : toutes les propositions comptent
        ProposalKind m_type_filter; // Les deux moves d'une paire doivent avoir ce type
    };

    /// Detecte les paires A -> B + B -> A.
    /// Premier partenaire libre par index croissant, chaque index dans
    /// au plus une paire. Un move A -> A ne se couple jamais avec lui-meme.
    SwapPartners detect_swap_pairs(const std::vector<ProposedMove> &moves,
                                   const SwapPairOptions &options = SwapPairOptions());
    SwapPartners detect_swap_pairs(const std::vector<Move> &moves);

    /// true si la source d'un deplacement est la destination d'un autre :
    /// l'execution doit alors vider toutes les sources avant de remplir
    /// les cibles. Seuls les ProposalKind::MOVE sont consideres.
    bool has_move_dependencies(const std::vector<ProposedMove> &moves);
    bool has_move_dependencies(const std::vector<Move> &moves);

} // namespace cellar
