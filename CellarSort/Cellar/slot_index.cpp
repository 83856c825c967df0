#include "slot_index.hpp"
#include "cellar_constants.hpp"

namespace cellar
{
    int SlotIndex::intern(const SlotId &slot)
    {
        auto it = m_indices.find(slot);
        if (it != m_indices.end())
            return it->second;

        int index = static_cast<int>(m_slots.size());
        m_slots.push_back(slot);
        m_indices[slot] = index;
        return index;
    }

    int SlotIndex::find(const SlotId &slot) const
    {
        auto it = m_indices.find(slot);
        if (it == m_indices.end())
            return constants::NO_SLOT;
        return it->second;
    }
} // namespace cellar
