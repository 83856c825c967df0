#pragma once

#include "move.hpp"
#include "slot_index.hpp"
#include "slot_layout.hpp"

#include <vector>

namespace cellar
{
    /// Calcule le plan minimum de moves pour passer du layout courant
    /// au layout cible.
    ///
    /// Etapes :
    /// - Compare chaque slot cible a son occupant actuel (stay in place)
    /// - Associe a chaque slot deplace la premiere source libre du meme vin
    /// - Decompose l'association target -> source en chaines
    /// - Classe chaque chaine : DIRECT, SWAP (2) ou CYCLE (>= 3)
    ///
    /// Aucun etat partage : une instance par calcul, sans I/O.
    class SortPlanner
    {
    public:
        SortPlanner(const CurrentLayout &current, const TargetLayout &target);

        // Non-copiable
        SortPlanner(const SortPlanner &) = delete;
        SortPlanner &operator=(const SortPlanner &) = delete;

        SortPlan compute();

    private:
        void find_displacements();
        void match_sources();
        void decompose_chains();
        void emit_chain(const std::vector<int> &chain, bool closed);

        Move make_move(int target_slot, MoveType type) const;

        const CurrentLayout &m_current;
        const TargetLayout &m_target;

        SlotIndex m_slots;
        std::vector<int> m_displaced;                  // Slots cibles a remplir, ordre du layout cible
        std::vector<char> m_is_displaced;              // Par slot
        std::vector<const TargetPlacement *> m_wanted; // Par slot, nullptr si rien a recevoir
        std::vector<char> m_claimed;                   // Par slot, bouteille deja attribuee
        std::vector<int> m_source_of;                  // Slot cible -> slot source (NO_SLOT si aucun)

        SortPlan m_plan;
    };

    /// Point d'entree : plan complet (moves + stats)
    SortPlan compute_sort_plan(const CurrentLayout &current, const TargetLayout &target);

    /// Slots cibles ni en place ni remplis par un move du plan
    /// (vin absent de la cave), dans l'ordre du layout cible
    std::vector<SlotId> find_unresolved_targets(const CurrentLayout &current,
                                                const TargetLayout &target,
                                                const SortPlan &plan);

} // namespace cellar
