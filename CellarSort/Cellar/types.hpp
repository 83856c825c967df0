#pragma once

#include <string>

namespace cellar
{
    /// Identifiant d'un vin (une meme reference peut occuper plusieurs slots)
    typedef int WineId;

    /// Identifiant opaque d'un emplacement physique (ex : "R3C5")
    typedef std::string SlotId;

    enum class Confidence
    {
        HIGH,
        MEDIUM,
        LOW
    };

    /// Ce qui occupe physiquement un slot en ce moment
    struct Occupant
    {
        WineId m_wine_id;
        std::string m_wine_name; // Vide si inconnu
        std::string m_colour;    // Vide si inconnu
        std::string m_zone_id;   // Vide si inconnu
    };

    /// Ce qui devrait occuper un slot apres reorganisation
    struct TargetPlacement
    {
        WineId m_wine_id;
        std::string m_wine_name;
        std::string m_zone_id;
        Confidence m_confidence; // HIGH quand la recommandation n'en donne pas
    };

    inline const char *to_string(Confidence confidence)
    {
        switch (confidence)
        {
        case Confidence::HIGH:
            return "high";
        case Confidence::MEDIUM:
            return "medium";
        case Confidence::LOW:
            return "low";
        }
        return "high";
    }

    // Retourne false si le texte n'est pas une confiance connue
    inline bool parse_confidence(const std::string &text, Confidence &out_confidence)
    {
        if (text == "high")
            out_confidence = Confidence::HIGH;
        else if (text == "medium")
            out_confidence = Confidence::MEDIUM;
        else if (text == "low")
            out_confidence = Confidence::LOW;
        else
            return false;
        return true;
    }

} // namespace cellar
