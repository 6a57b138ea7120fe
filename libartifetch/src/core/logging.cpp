// Copyright (c) 2025, Artifetch Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <iostream>
#include <mutex>
#include <utility>

#include <fmt/format.h>

#include "artifetch/core/logging.hpp"
#include "artifetch/util/string.hpp"
#include "artifetch/util/url.hpp"

namespace artifetch
{
    auto log_level_from_name(std::string_view name) -> std::optional<log_level>
    {
        const std::string lname = util::to_lower(util::strip(name));
        for (auto level :
             { log_level::trace,
               log_level::debug,
               log_level::info,
               log_level::warn,
               log_level::err,
               log_level::critical,
               log_level::off })
        {
            if (lname == name_of(level))
            {
                return level;
            }
        }
        if (lname == "warn")
        {
            return log_level::warn;
        }
        if (lname == "err")
        {
            return log_level::err;
        }
        return std::nullopt;
    }
}

namespace artifetch::logging
{
    namespace
    {
        struct LoggingState
        {
            std::mutex mutex;
            LoggingParams params;
            std::unique_ptr<LogHandler> handler;
        };

        auto logging_state() -> LoggingState&
        {
            static LoggingState state;
            return state;
        }
    }

    auto set_log_handler(
        std::unique_ptr<LogHandler> new_handler,
        std::optional<LoggingParams> maybe_new_params
    ) -> std::unique_ptr<LogHandler>
    {
        auto& state = logging_state();
        std::scoped_lock lock{ state.mutex };

        if (state.handler)
        {
            state.handler->stop_log_handling();
        }

        auto previous_handler = std::exchange(state.handler, std::move(new_handler));

        if (maybe_new_params)
        {
            state.params = std::move(*maybe_new_params);
        }

        if (state.handler)
        {
            state.handler->start_log_handling(state.params, all_log_sources());
        }

        return previous_handler;
    }

    auto get_log_handler() -> LogHandler*
    {
        auto& state = logging_state();
        std::scoped_lock lock{ state.mutex };
        return state.handler.get();
    }

    auto set_log_level(log_level new_level) -> log_level
    {
        auto& state = logging_state();
        std::scoped_lock lock{ state.mutex };
        const auto previous_level = std::exchange(state.params.logging_level, new_level);
        if (state.handler)
        {
            state.handler->set_params(state.params);
        }
        return previous_level;
    }

    auto get_log_level() -> log_level
    {
        auto& state = logging_state();
        std::scoped_lock lock{ state.mutex };
        return state.params.logging_level;
    }

    auto set_logging_params(LoggingParams new_params) -> LoggingParams
    {
        auto& state = logging_state();
        std::scoped_lock lock{ state.mutex };
        auto previous_params = std::exchange(state.params, std::move(new_params));
        if (state.handler)
        {
            state.handler->set_params(state.params);
        }
        return previous_params;
    }

    auto get_logging_params() -> LoggingParams
    {
        auto& state = logging_state();
        std::scoped_lock lock{ state.mutex };
        return state.params;
    }

    auto log(LogRecord record) -> void
    {
        auto& state = logging_state();
        std::scoped_lock lock{ state.mutex };
        if (state.handler && state.params.logging_level != log_level::off
            && record.level >= state.params.logging_level)
        {
            state.handler->log(std::move(record));
        }
    }

    auto flush_logs(std::optional<log_source> source) -> void
    {
        auto& state = logging_state();
        std::scoped_lock lock{ state.mutex };
        if (state.handler)
        {
            state.handler->flush(std::move(source));
        }
    }

    ///////////////////////////////////////////////////////////////////
    // MessageLogger

    MessageLogger::MessageLogger(log_level level, std::source_location location)
        : m_level(level)
        , m_location(std::move(location))
    {
    }

    MessageLogger::~MessageLogger()
    {
        try
        {
            logging::log(LogRecord{
                .message = util::hide_secrets(m_stream.str()),
                .level = m_level,
                .source = log_source::libartifetch,
                .location = std::move(m_location),
            });
        }
        catch (const std::exception& ex)
        {
            // Logging must never throw from a destructor, report through the standard error.
            std::cerr << fmt::format("artifetch::logging failure (caught, skipped): {}", ex.what())
                      << std::endl;
        }
    }
}
