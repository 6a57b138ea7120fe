// Copyright (c) 2025, Artifetch Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <concepts>
#include <functional>
#include <memory>
#include <stdexcept>

#include <spdlog/pattern_formatter.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "artifetch/core/logging_spdlog.hpp"

namespace artifetch::logging::spdlogimpl
{
    namespace
    {
        auto make_logger(std::string_view name, const std::string& pattern)
            -> std::shared_ptr<spdlog::logger>
        {
            auto logger = std::make_shared<spdlog::logger>(
                std::string(name),
                std::make_shared<spdlog::sinks::stderr_color_sink_mt>()
            );
            logger->set_formatter(std::make_unique<spdlog::pattern_formatter>(
                pattern,
                spdlog::pattern_time_type::local,
                std::string("\n")
            ));
            return logger;
        }

        template <std::invocable<std::shared_ptr<spdlog::logger>> Func>
        auto apply_to_logger(log_source source, Func&& func) -> void
        {
            if (auto logger = spdlog::get(name_of(source)))
            {
                std::invoke(std::forward<Func>(func), std::move(logger));
            }
            else if (auto default_logger = spdlog::default_logger())
            {
                std::invoke(std::forward<Func>(func), std::move(default_logger));
            }
        }
    }

    LogHandler_spdlog::~LogHandler_spdlog()
    {
        if (m_is_active)
        {
            stop_log_handling();
        }
    }

    void LogHandler_spdlog::start_log_handling(LoggingParams params, std::vector<log_source> sources)
    {
        if (sources.empty())
        {
            throw std::invalid_argument("LogHandler_spdlog must be started with at least one log source"
            );
        }

        spdlog::drop_all();

        const auto main_source = sources.front();
        auto main_logger = make_logger(name_of(main_source), params.log_pattern);
        spdlog::register_logger(main_logger);
        spdlog::set_default_logger(main_logger);

        for (auto it = sources.cbegin() + 1; it != sources.cend(); ++it)
        {
            spdlog::register_logger(make_logger(name_of(*it), params.log_pattern));
        }

        spdlog::set_level(to_spdlog(params.logging_level));
        m_is_active = true;
    }

    void LogHandler_spdlog::stop_log_handling()
    {
        if (auto default_logger = spdlog::default_logger())
        {
            default_logger->flush();
        }
        spdlog::drop_all();
        m_is_active = false;
    }

    void LogHandler_spdlog::set_params(LoggingParams params)
    {
        spdlog::set_level(to_spdlog(params.logging_level));
        spdlog::set_pattern(params.log_pattern);
    }

    void LogHandler_spdlog::log(LogRecord record)
    {
        apply_to_logger(
            record.source,
            [&](auto logger)
            {
                logger->log(
                    spdlog::source_loc{
                        record.location.file_name(),
                        static_cast<int>(record.location.line()),
                        record.location.function_name(),
                    },
                    to_spdlog(record.level),
                    record.message
                );
            }
        );
    }

    void LogHandler_spdlog::flush(std::optional<log_source> source)
    {
        if (source)
        {
            apply_to_logger(*source, [](auto logger) { logger->flush(); });
        }
        else
        {
            spdlog::apply_all([](std::shared_ptr<spdlog::logger> l) { l->flush(); });
        }
    }

    bool LogHandler_spdlog::is_started() const
    {
        return m_is_active;
    }
}
