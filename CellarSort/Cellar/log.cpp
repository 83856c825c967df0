#include "log.hpp"
#include "cellar_constants.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace cellar
{
    namespace logging
    {
        bool init(spdlog::level::level_enum level, const std::string &file)
        {
            // Re-init : on remplace le logger precedent (drop vide aussi le logger par defaut)
            spdlog::drop(constants::LOGGER_NAME);

            std::shared_ptr<spdlog::logger> logger;
            std::string open_error;

            if (!file.empty())
            {
                try
                {
                    logger = spdlog::basic_logger_mt(constants::LOGGER_NAME, file, true);
                }
                catch (const spdlog::spdlog_ex &e)
                {
                    open_error = e.what();
                }
            }

            if (!logger)
                logger = spdlog::stderr_color_mt(constants::LOGGER_NAME);

            logger->set_pattern(constants::LOG_PATTERN);
            logger->set_level(level);
            spdlog::set_default_logger(logger);

            if (!open_error.empty())
            {
                spdlog::error("cannot open log file {}: {}", file, open_error);
                return false;
            }
            return true;
        }
    } // namespace logging
} // namespace cellar
