#pragma once

#include "move.hpp"
#include "slot_layout.hpp"

#include <string>
#include <vector>

namespace cellar
{
    /// Applique un plan a une copie du layout en deux phases :
    /// - Validation : validate_move_plan doit accepter le plan
    /// - Phase 1 : vider toutes les sources
    /// - Phase 2 : remplir toutes les cibles
    /// Le nombre de bouteilles doit etre identique avant et apres.
    ///
    /// Tout ou rien : en cas d'echec, out_layout n'est pas modifie et
    /// out_error decrit la cause.
    bool apply_moves(const CurrentLayout &layout,
                     const std::vector<Move> &moves,
                     CurrentLayout &out_layout,
                     std::string &out_error);

} // namespace cellar
