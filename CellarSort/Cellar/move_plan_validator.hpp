#pragma once

#include "move.hpp"
#include "slot_layout.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace cellar
{
    enum class ValidationErrorType
    {
        SOURCE_MISMATCH,    // Le vin n'est pas dans le slot source
        DUPLICATE_TARGET,   // Deux moves remplissent le meme slot
        OCCUPIED_TARGET,    // Slot cible occupe et jamais libere par le plan
        DUPLICATE_INSTANCE, // Deux moves vident le meme slot
        NOOP_MOVE           // from == to
    };

    struct ValidationError
    {
        ValidationErrorType m_type;
        size_t m_move_index;
        std::string m_message;
    };

    struct ValidationSummary
    {
        int m_total_moves = 0;
        int m_error_count = 0;
        int m_source_mismatches = 0;
        int m_duplicate_targets = 0;
        int m_occupied_targets = 0;
        int m_duplicate_instances = 0;
        int m_noop_moves = 0;
    };

    struct ValidationResult
    {
        bool m_valid = true;
        std::vector<ValidationError> m_errors;
        ValidationSummary m_summary;
    };

    const char *to_string(ValidationErrorType type);

    /// Verifie un plan contre le layout courant avant execution.
    /// Aucune regle de zone ou de couleur : uniquement la coherence
    /// slot par slot.
    ValidationResult validate_move_plan(const std::vector<Move> &moves, const CurrentLayout &current);

} // namespace cellar
