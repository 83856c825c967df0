#pragma once

#include "types.hpp"

#include <unordered_map>
#include <vector>

namespace cellar
{
    /// Table slot -> index dense.
    /// Le planner travaille ensuite sur des tableaux d'entiers
    /// indexes par slot au lieu de maps de strings.
    class SlotIndex
    {
    public:
        /// Retourne l'index du slot, en l'ajoutant si besoin
        int intern(const SlotId &slot);

        /// constants::NO_SLOT si le slot n'a jamais ete ajoute
        int find(const SlotId &slot) const;

        const SlotId &slot_at(int index) const { return m_slots[index]; }
        int size() const { return static_cast<int>(m_slots.size()); }

    private:
        std::vector<SlotId> m_slots;
        std::unordered_map<SlotId, int> m_indices;
    };

} // namespace cellar
