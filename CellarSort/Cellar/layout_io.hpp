#pragma once

#include "move.hpp"
#include "slot_layout.hpp"

#include <istream>
#include <ostream>
#include <string>

namespace cellar
{
    namespace layout_io
    {
        /// Lit les deux layouts depuis un flux texte, une ligne par slot :
        ///   current<TAB>slot<TAB>wine_id[<TAB>name<TAB>colour<TAB>zone]
        ///   target<TAB>slot<TAB>wine_id[<TAB>name<TAB>zone<TAB>confidence]
        /// Lignes vides et commentaires (#) ignores.
        /// Retourne false a la premiere ligne invalide (numero dans out_error).
        bool read_layouts(std::istream &in,
                          CurrentLayout &out_current,
                          TargetLayout &out_target,
                          std::string &out_error);

        /// Une ligne par move : type, vin, from -> to, zone, confiance
        void write_plan(std::ostream &out, const SortPlan &plan);

    } // namespace layout_io
} // namespace cellar
