#include "CellarSort/Cellar/cellar_constants.hpp"
#include "CellarSort/Cellar/layout_io.hpp"
#include "CellarSort/Cellar/log.hpp"
#include "CellarSort/Cellar/move_plan_validator.hpp"
#include "CellarSort/Cellar/move_relations.hpp"
#include "CellarSort/Cellar/sort_planner.hpp"

#include <spdlog/spdlog.h>

#include <cstring>
#include <fstream>
#include <iostream>
#include <string>

namespace
{
    void print_usage(const char *program)
    {
        std::cerr << "usage: " << program << " [-v] [-l [log_file]] [-i layout_file]\n"
                  << "  -v  debug logging\n"
                  << "  -l  log to a file (default " << cellar::constants::DEFAULT_LOG_FILE << ")\n"
                  << "  -i  read layouts from a file instead of stdin\n";
    }
} // namespace

int main(int argc, char *argv[])
{
    spdlog::level::level_enum level = spdlog::level::info;
    std::string log_file;
    std::string input_file;

    for (int i = 1; i < argc; ++i)
    {
        if (std::strcmp(argv[i], "-v") == 0)
        {
            level = spdlog::level::debug;
        }
        else if (std::strcmp(argv[i], "-l") == 0)
        {
            // Fichier optionnel
            if (i + 1 < argc && argv[i + 1][0] != '-')
                log_file = argv[++i];
            else
                log_file = cellar::constants::DEFAULT_LOG_FILE;
        }
        else if (std::strcmp(argv[i], "-i") == 0 && i + 1 < argc)
        {
            input_file = argv[++i];
        }
        else
        {
            print_usage(argv[0]);
            return 2;
        }
    }

    if (!cellar::logging::init(level, log_file))
        spdlog::warn("logging to stderr instead");

    // Lecture des deux layouts
    cellar::CurrentLayout current;
    cellar::TargetLayout target;
    std::string error;
    bool read_ok = false;

    if (input_file.empty())
    {
        read_ok = cellar::layout_io::read_layouts(std::cin, current, target, error);
    }
    else
    {
        std::ifstream in(input_file);
        if (!in)
        {
            spdlog::error("cannot open {}", input_file);
            return 1;
        }
        read_ok = cellar::layout_io::read_layouts(in, current, target, error);
    }

    if (!read_ok)
    {
        spdlog::error("{}: {}", input_file.empty() ? "stdin" : input_file, error);
        return 1;
    }

    spdlog::info("{} occupied slot(s), {} target slot(s)", current.size(), target.size());

    // Plan
    cellar::SortPlan plan = cellar::compute_sort_plan(current, target);
    cellar::layout_io::write_plan(std::cout, plan);

    // Slots sans source : le vin doit d'abord entrer en cave
    for (const auto &slot : cellar::find_unresolved_targets(current, target, plan))
    {
        const cellar::TargetPlacement *wanted = target.find(slot);
        spdlog::warn("no bottle of wine {} available for slot {}", wanted->m_wine_id, slot);
    }

    // Relations entre moves
    cellar::SwapPartners partners = cellar::detect_swap_pairs(plan.m_moves);
    for (const auto &pair : partners)
    {
        if (pair.first < pair.second)
            std::cout << "swap pair: " << pair.first << " <-> " << pair.second << '\n';
    }

    bool staged = cellar::has_move_dependencies(plan.m_moves);
    std::cout << "execution: " << (staged ? "two-phase required" : "independent moves") << '\n';

    // Verification avant transmission a l'executeur
    cellar::ValidationResult validation = cellar::validate_move_plan(plan.m_moves, current);
    for (const auto &e : validation.m_errors)
    {
        spdlog::error("move {}: [{}] {}", e.m_move_index, cellar::to_string(e.m_type), e.m_message);
    }

    spdlog::shutdown();
    return validation.m_valid ? 0 : 3;
}
