#include "move_relations.hpp"

#include <unordered_set>
#include <utility>

namespace cellar
{
    namespace
    {
        typedef std::pair<SlotId, SlotId> SlotPair;

        bool is_relocation(const ProposedMove &move) { return move.m_kind == ProposalKind::MOVE; }
        bool is_relocation(const Move &) { return true; }

        // Meme algorithme pour les moves du planner et les propositions
        template <typename MoveT, typename Filter>
        SwapPartners pair_swaps(const std::vector<MoveT> &moves, Filter accepts)
        {
            SwapPartners partners;

            // (from, to) -> indices croissants des moves acceptes
            std::map<SlotPair, std::vector<size_t>> by_route;
            for (size_t i = 0; i < moves.size(); ++i)
            {
                if (accepts(moves[i]))
                    by_route[SlotPair(moves[i].m_from, moves[i].m_to)].push_back(i);
            }

            // Curseur par route : tout ce qui est avant est deja pris ou trop tot
            std::map<SlotPair, size_t> cursors;

            for (size_t i = 0; i < moves.size(); ++i)
            {
                if (partners.count(i) || !accepts(moves[i]))
                    continue;

                SlotPair reverse(moves[i].m_to, moves[i].m_from);
                auto it = by_route.find(reverse);
                if (it == by_route.end())
                    continue;

                const std::vector<size_t> &candidates = it->second;
                size_t &cursor = cursors[reverse];
                while (cursor < candidates.size() &&
                       (candidates[cursor] <= i || partners.count(candidates[cursor])))
                    ++cursor;

                if (cursor == candidates.size())
                    continue;

                size_t j = candidates[cursor++];
                partners[i] = j;
                partners[j] = i;
            }

            return partners;
        }

        template <typename MoveT>
        bool any_dependency(const std::vector<MoveT> &moves)
        {
            std::unordered_set<SlotId> sources;
            for (const auto &move : moves)
            {
                if (is_relocation(move))
                    sources.insert(move.m_from);
            }

            for (const auto &move : moves)
            {
                if (is_relocation(move) && sources.count(move.m_to))
                    return true;
            }
            return false;
        }
    } // namespace

    std::vector<ProposedMove> to_proposals(const std::vector<Move> &moves)
    {
        std::vector<ProposedMove> proposals;
        proposals.reserve(moves.size());
        for (const auto &move : moves)
            proposals.push_back(to_proposal(move));
        return proposals;
    }

    SwapPartners detect_swap_pairs(const std::vector<ProposedMove> &moves,
                                   const SwapPairOptions &options)
    {
        return pair_swaps(moves, [&options](const ProposedMove &move)
                          { return !options.m_has_type_filter || move.m_kind == options.m_type_filter; });
    }

    SwapPartners detect_swap_pairs(const std::vector<Move> &moves)
    {
        return pair_swaps(moves, [](const Move &)
                          { return true; });
    }

    bool has_move_dependencies(const std::vector<ProposedMove> &moves)
    {
        return any_dependency(moves);
    }

    bool has_move_dependencies(const std::vector<Move> &moves)
    {
        return any_dependency(moves);
    }
} // namespace cellar
