#include "move_guide.hpp"

#include <spdlog/spdlog.h>

namespace cellar
{
    bool MoveGuide::open(const std::vector<ProposedMove> &all_moves)
    {
        close();

        for (const auto &move : all_moves)
        {
            if (move.m_kind == ProposalKind::MOVE)
                m_moves.push_back(move);
        }

        if (m_moves.empty())
        {
            spdlog::debug("move guide: no moves to guide");
            return false;
        }

        m_swap_partners = detect_swap_pairs(m_moves);
        m_active = true;
        spdlog::debug("move guide: {} move(s), {} in swap pairs", m_moves.size(), m_swap_partners.size());
        return true;
    }

    void MoveGuide::close()
    {
        m_active = false;
        m_moves.clear();
        m_swap_partners.clear();
        m_current_index = 0;
        m_completed.clear();
        m_dismissed.clear();
    }

    const ProposedMove *MoveGuide::current() const
    {
        if (!m_active || m_current_index >= m_moves.size())
            return nullptr;
        return &m_moves[m_current_index];
    }

    std::vector<size_t> MoveGuide::current_group() const
    {
        std::vector<size_t> group;
        if (!m_active)
            return group;

        group.push_back(m_current_index);
        auto it = m_swap_partners.find(m_current_index);
        if (it != m_swap_partners.end())
            group.push_back(it->second);
        return group;
    }

    bool MoveGuide::complete_current()
    {
        if (!m_active)
            return false;

        for (size_t idx : current_group())
            m_completed.insert(idx);
        return advance_to_next();
    }

    bool MoveGuide::skip_current()
    {
        if (!m_active)
            return false;

        // Le partenaire de swap est ignore avec lui
        for (size_t idx : current_group())
            m_dismissed.insert(idx);
        return advance_to_next();
    }

    bool MoveGuide::advance_to_next()
    {
        for (size_t i = 0; i < m_moves.size(); ++i)
        {
            if (!m_completed.count(i) && !m_dismissed.count(i))
            {
                m_current_index = i;
                return true;
            }
        }

        spdlog::debug("move guide: done ({} completed, {} skipped)", m_completed.size(), m_dismissed.size());
        m_active = false;
        return false;
    }
} // namespace cellar
