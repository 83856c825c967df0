#pragma once

#include "types.hpp"

#include <cstddef>
#include <initializer_list>
#include <unordered_map>
#include <utility>
#include <vector>

namespace cellar
{
    /// Mapping slot -> record, iteration dans l'ordre d'insertion.
    /// L'ordre compte : le planner choisit toujours le premier candidat
    /// libre dans cet ordre.
    template <typename Record>
    class SlotLayout
    {
    public:
        typedef std::pair<SlotId, Record> Entry;
        typedef typename std::vector<Entry>::const_iterator const_iterator;

        SlotLayout() = default;

        SlotLayout(std::initializer_list<Entry> entries)
        {
            for (const auto &entry : entries)
                set(entry.first, entry.second);
        }

        /// Insere ou remplace sur place (la position d'origine est gardee)
        void set(const SlotId &slot, const Record &record)
        {
            auto it = m_index.find(slot);
            if (it != m_index.end())
            {
                m_entries[it->second].second = record;
                return;
            }
            m_index[slot] = m_entries.size();
            m_entries.push_back(Entry(slot, record));
        }

        /// nullptr si le slot est vide / absent
        const Record *find(const SlotId &slot) const
        {
            auto it = m_index.find(slot);
            if (it == m_index.end())
                return nullptr;
            return &m_entries[it->second].second;
        }

        bool contains(const SlotId &slot) const
        {
            return m_index.find(slot) != m_index.end();
        }

        /// Vide le slot, retourne false s'il l'etait deja
        bool erase(const SlotId &slot)
        {
            auto it = m_index.find(slot);
            if (it == m_index.end())
                return false;

            size_t pos = it->second;
            m_index.erase(it);
            m_entries.erase(m_entries.begin() + pos);

            // Reindexer les entrees decalees
            for (size_t i = pos; i < m_entries.size(); ++i)
                m_index[m_entries[i].first] = i;
            return true;
        }

        size_t size() const { return m_entries.size(); }
        bool empty() const { return m_entries.empty(); }

        const_iterator begin() const { return m_entries.begin(); }
        const_iterator end() const { return m_entries.end(); }

    private:
        std::vector<Entry> m_entries;                  // Ordre d'insertion
        std::unordered_map<SlotId, size_t> m_index;    // slot -> position dans m_entries
    };

    typedef SlotLayout<Occupant> CurrentLayout;
    typedef SlotLayout<TargetPlacement> TargetLayout;

} // namespace cellar
