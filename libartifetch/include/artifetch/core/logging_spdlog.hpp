// Copyright (c) 2025, Artifetch Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef ARTIFETCH_CORE_LOGGING_SPDLOG_HPP
#define ARTIFETCH_CORE_LOGGING_SPDLOG_HPP

#include <atomic>

#include <spdlog/common.h>

#include "artifetch/core/logging.hpp"

namespace artifetch::logging::spdlogimpl
{
    /// @returns The provided `log_level` value converted to the equivalent value for `spdlog`.
    inline constexpr auto to_spdlog(log_level level) -> spdlog::level::level_enum
    {
        static_assert(static_cast<int>(log_level::off) == static_cast<int>(spdlog::level::off));
        return static_cast<spdlog::level::level_enum>(level);
    }

    /** `LogHandler` implementation using `spdlog` library.

        One `spdlog` logger is registered per log source, all writing to the standard error.
        The logger of the first source is the default `spdlog` logger.
    */
    class LogHandler_spdlog : public LogHandler
    {
    public:

        LogHandler_spdlog() = default;
        ~LogHandler_spdlog() override;

        void start_log_handling(LoggingParams params, std::vector<log_source> sources) override;
        void stop_log_handling() override;

        void set_params(LoggingParams params) override;

        void log(LogRecord record) override;
        void flush(std::optional<log_source> source = {}) override;

        bool is_started() const;

    private:

        std::atomic_bool m_is_active{ false };
    };
}

#endif
