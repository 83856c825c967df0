#pragma once

#include <spdlog/spdlog.h>

#include <string>

namespace cellar
{
    namespace logging
    {
        /// Installe le logger par defaut : console si file est vide,
        /// sinon un fichier par run (ecrase a chaque lancement).
        /// Retourne false si le fichier ne peut pas etre ouvert
        /// (le logger console est alors garde).
        bool init(spdlog::level::level_enum level, const std::string &file = std::string());

    } // namespace logging
} // namespace cellar
