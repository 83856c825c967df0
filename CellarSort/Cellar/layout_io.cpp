#include "layout_io.hpp"
#include "cellar_constants.hpp"

#include <cctype>
#include <cerrno>
#include <climits>
#include <cstdlib>
#include <sstream>
#include <vector>

namespace cellar
{
    namespace layout_io
    {
        namespace
        {
            std::vector<std::string> split_fields(const std::string &line)
            {
                std::vector<std::string> fields;
                std::string field;
                std::istringstream stream(line);
                while (std::getline(stream, field, constants::LAYOUT_FIELD_SEPARATOR))
                    fields.push_back(field);

                // Supporte les fins de ligne CRLF
                if (!fields.empty() && !fields.back().empty() && fields.back().back() == '\r')
                    fields.back().pop_back();
                return fields;
            }

            bool parse_wine_id(const std::string &text, WineId &out_wine_id)
            {
                // strtol accepterait " 5" et "+5"
                if (text.empty() || !(std::isdigit(static_cast<unsigned char>(text[0])) || text[0] == '-'))
                    return false;

                char *end = nullptr;
                errno = 0;
                long value = std::strtol(text.c_str(), &end, 10);
                if (errno != 0 || *end != '\0' || value < INT_MIN || value > INT_MAX)
                    return false;

                out_wine_id = static_cast<WineId>(value);
                return true;
            }

            std::string field_or_empty(const std::vector<std::string> &fields, size_t index)
            {
                return index < fields.size() ? fields[index] : std::string();
            }
        } // namespace

        bool read_layouts(std::istream &in,
                          CurrentLayout &out_current,
                          TargetLayout &out_target,
                          std::string &out_error)
        {
            std::string line;
            int line_number = 0;

            while (std::getline(in, line))
            {
                ++line_number;
                const std::string where = "line " + std::to_string(line_number) + ": ";

                std::vector<std::string> fields = split_fields(line);
                if (fields.empty() || fields[0].empty() || fields[0][0] == constants::LAYOUT_COMMENT_CHAR)
                    continue;

                if (fields.size() < 3 || fields.size() > 6)
                {
                    out_error = where + "expected 3 to 6 tab-separated fields, got " +
                                std::to_string(fields.size());
                    return false;
                }

                const std::string &side = fields[0];
                const SlotId &slot = fields[1];
                if (slot.empty())
                {
                    out_error = where + "empty slot identifier";
                    return false;
                }

                WineId wine_id = 0;
                if (!parse_wine_id(fields[2], wine_id))
                {
                    out_error = where + "invalid wine id '" + fields[2] + "'";
                    return false;
                }

                if (side == constants::CURRENT_SIDE)
                {
                    out_current.set(slot, Occupant{wine_id, field_or_empty(fields, 3),
                                                   field_or_empty(fields, 4), field_or_empty(fields, 5)});
                }
                else if (side == constants::TARGET_SIDE)
                {
                    Confidence confidence = constants::DEFAULT_CONFIDENCE;
                    const std::string confidence_text = field_or_empty(fields, 5);
                    if (!confidence_text.empty() && !parse_confidence(confidence_text, confidence))
                    {
                        out_error = where + "invalid confidence '" + confidence_text + "'";
                        return false;
                    }
                    out_target.set(slot, TargetPlacement{wine_id, field_or_empty(fields, 3),
                                                         field_or_empty(fields, 4), confidence});
                }
                else
                {
                    out_error = where + "unknown layout side '" + side + "'";
                    return false;
                }
            }

            return true;
        }

        void write_plan(std::ostream &out, const SortPlan &plan)
        {
            for (const auto &move : plan.m_moves)
            {
                out << to_string(move.m_type) << '\t'
                    << move.m_wine_id << '\t'
                    << (move.m_wine_name.empty() ? "-" : move.m_wine_name) << '\t'
                    << move.m_from << " -> " << move.m_to << '\t'
                    << (move.m_zone_id.empty() ? "-" : move.m_zone_id) << '\t'
                    << to_string(move.m_confidence) << '\n';
            }

            const SortStats &stats = plan.m_stats;
            out << "stay_in_place=" << stats.m_stay_in_place
                << " direct=" << stats.m_direct_moves
                << " swaps=" << stats.m_swaps
                << " cycles=" << stats.m_cycles
                << " total=" << stats.m_total_moves << '\n';
        }
    } // namespace layout_io
} // namespace cellar
