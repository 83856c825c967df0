#pragma once

/// Valeurs par defaut et format texte partages par la lib et le driver.

#include "types.hpp"

namespace cellar
{
    namespace constants
    {
        // ── Planner ───────────────────────────────────────────────
        /// Index "pas de slot" dans les tables du planner
        constexpr int NO_SLOT = -1;
        /// Confiance d'une cible qui n'en precise pas
        constexpr Confidence DEFAULT_CONFIDENCE = Confidence::HIGH;

        // ── Layout texte ──────────────────────────────────────────
        /// Separateur de champs des fichiers de layout
        constexpr char LAYOUT_FIELD_SEPARATOR = '\t';
        /// Debut d'une ligne de commentaire
        constexpr char LAYOUT_COMMENT_CHAR = '#';
        /// Prefixe des lignes du layout courant
        constexpr const char *CURRENT_SIDE = "current";
        /// Prefixe des lignes du layout cible
        constexpr const char *TARGET_SIDE = "target";

        // ── Logging ───────────────────────────────────────────────
        /// Nom du logger partage
        constexpr const char *LOGGER_NAME = "cellar";
        /// Fichier de log par defaut du driver
        constexpr const char *DEFAULT_LOG_FILE = "cellar-sort.log";
        /// Pattern des lignes de log
        constexpr const char *LOG_PATTERN = "[%H:%M:%S.%e] [%^%l%$] %v";

    } // namespace constants
} // namespace cellar
