#include "move_plan_validator.hpp"

#include <spdlog/spdlog.h>

#include <unordered_map>
#include <unordered_set>

namespace cellar
{
    const char *to_string(ValidationErrorType type)
    {
        switch (type)
        {
        case ValidationErrorType::SOURCE_MISMATCH:
            return "source_mismatch";
        case ValidationErrorType::DUPLICATE_TARGET:
            return "duplicate_target";
        case ValidationErrorType::OCCUPIED_TARGET:
            return "occupied_target";
        case ValidationErrorType::DUPLICATE_INSTANCE:
            return "duplicate_instance";
        case ValidationErrorType::NOOP_MOVE:
            return "noop_move";
        }
        return "unknown";
    }

    namespace
    {
        void add_error(ValidationResult &result, ValidationErrorType type, size_t index,
                       const std::string &message)
        {
            result.m_errors.push_back(ValidationError{type, index, message});

            ValidationSummary &summary = result.m_summary;
            switch (type)
            {
            case ValidationErrorType::SOURCE_MISMATCH:
                ++summary.m_source_mismatches;
                break;
            case ValidationErrorType::DUPLICATE_TARGET:
                ++summary.m_duplicate_targets;
                break;
            case ValidationErrorType::OCCUPIED_TARGET:
                ++summary.m_occupied_targets;
                break;
            case ValidationErrorType::DUPLICATE_INSTANCE:
                ++summary.m_duplicate_instances;
                break;
            case ValidationErrorType::NOOP_MOVE:
                ++summary.m_noop_moves;
                break;
            }
        }
    } // namespace

    ValidationResult validate_move_plan(const std::vector<Move> &moves, const CurrentLayout &current)
    {
        ValidationResult result;
        result.m_summary.m_total_moves = static_cast<int>(moves.size());

        // Slots liberes en phase 1
        std::unordered_set<SlotId> vacated;
        for (const auto &move : moves)
            vacated.insert(move.m_from);

        std::unordered_map<SlotId, size_t> first_source; // slot -> premier move qui le vide
        std::unordered_map<SlotId, size_t> first_target; // slot -> premier move qui le remplit

        for (size_t i = 0; i < moves.size(); ++i)
        {
            const Move &move = moves[i];
            const std::string wine = std::to_string(move.m_wine_id);

            if (move.m_from == move.m_to)
            {
                add_error(result, ValidationErrorType::NOOP_MOVE, i,
                          "Wine " + wine + " is already at " + move.m_to);
                continue;
            }

            const Occupant *occupant = current.find(move.m_from);
            if (occupant == nullptr)
            {
                add_error(result, ValidationErrorType::SOURCE_MISMATCH, i,
                          "Wine " + wine + " not found at " + move.m_from + " (slot is empty)");
            }
            else if (occupant->m_wine_id != move.m_wine_id)
            {
                add_error(result, ValidationErrorType::SOURCE_MISMATCH, i,
                          "Wine " + wine + " not found at " + move.m_from + " (holds wine " +
                              std::to_string(occupant->m_wine_id) + ")");
            }

            auto source_it = first_source.find(move.m_from);
            if (source_it != first_source.end())
            {
                add_error(result, ValidationErrorType::DUPLICATE_INSTANCE, i,
                          "Slot " + move.m_from + " is already emptied by move " +
                              std::to_string(source_it->second));
            }
            else
            {
                first_source[move.m_from] = i;
            }

            auto target_it = first_target.find(move.m_to);
            if (target_it != first_target.end())
            {
                add_error(result, ValidationErrorType::DUPLICATE_TARGET, i,
                          "Slot " + move.m_to + " is already filled by move " +
                              std::to_string(target_it->second));
            }
            else
            {
                first_target[move.m_to] = i;
            }

            if (current.contains(move.m_to) && !vacated.count(move.m_to))
            {
                add_error(result, ValidationErrorType::OCCUPIED_TARGET, i,
                          "Slot " + move.m_to + " is occupied by wine " +
                              std::to_string(current.find(move.m_to)->m_wine_id) +
                              " which does not move");
            }
        }

        result.m_summary.m_error_count = static_cast<int>(result.m_errors.size());
        result.m_valid = result.m_errors.empty();

        if (!result.m_valid)
            spdlog::warn("move plan rejected: {} error(s) over {} move(s)",
                         result.m_summary.m_error_count, result.m_summary.m_total_moves);
        return result;
    }
} // namespace cellar
