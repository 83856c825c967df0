#pragma once

#include "move.hpp"
#include "move_relations.hpp"

#include <cstddef>
#include <set>
#include <vector>

namespace cellar
{
    /// Guide pas a pas des moves actionnables.
    ///
    /// Etapes :
    /// - open() garde uniquement les ProposalKind::MOVE et detecte les swaps
    /// - current_group() : move courant + son partenaire de swap
    /// - complete_current() / skip_current() traitent le groupe entier
    ///   puis avancent au premier move ni fait ni ignore
    class MoveGuide
    {
    public:
        MoveGuide() = default;

        /// false si aucun move actionnable (le guide reste ferme)
        bool open(const std::vector<ProposedMove> &all_moves);
        void close();

        bool is_active() const { return m_active; }

        const std::vector<ProposedMove> &moves() const { return m_moves; }
        const SwapPartners &swap_partners() const { return m_swap_partners; }

        size_t current_index() const { return m_current_index; }
        /// nullptr quand le guide est ferme
        const ProposedMove *current() const;
        bool current_is_swap() const { return m_swap_partners.count(m_current_index) != 0; }

        /// Indices a executer ensemble (un swap s'execute en une fois)
        std::vector<size_t> current_group() const;

        /// Retourne false quand tout est traite (le guide se desactive)
        bool complete_current();
        bool skip_current();

        size_t completed_count() const { return m_completed.size(); }
        size_t dismissed_count() const { return m_dismissed.size(); }

    private:
        bool advance_to_next();

        bool m_active = false;
        std::vector<ProposedMove> m_moves;
        SwapPartners m_swap_partners;
        size_t m_current_index = 0;
        std::set<size_t> m_completed; // Executes
        std::set<size_t> m_dismissed; // Ignores
    };

} // namespace cellar
