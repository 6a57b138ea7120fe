// Copyright (c) 2025, Artifetch Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef ARTIFETCH_CORE_LOGGING_HPP
#define ARTIFETCH_CORE_LOGGING_HPP

#include <array>
#include <memory>
#include <optional>
#include <source_location>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

#undef LOG
#undef LOG_TRACE
#undef LOG_DEBUG
#undef LOG_INFO
#undef LOG_WARNING
#undef LOG_ERROR
#undef LOG_CRITICAL

// clang-format off
#define LOG(severity)   artifetch::logging::MessageLogger(severity).stream()
#define LOG_TRACE       LOG(artifetch::log_level::trace)
#define LOG_DEBUG       LOG(artifetch::log_level::debug)
#define LOG_INFO        LOG(artifetch::log_level::info)
#define LOG_WARNING     LOG(artifetch::log_level::warn)
#define LOG_ERROR       LOG(artifetch::log_level::err)
#define LOG_CRITICAL    LOG(artifetch::log_level::critical)
// clang-format on

namespace artifetch
{
    /** Level of logging, used to filter out logs which are at a lower level than the current one.
        @see `artifetch::LoggingParams`
     */
    enum class log_level
    {
        trace,
        debug,
        info,
        warn,
        err,
        critical,
        off
    };

    /// @returns The name of the specified log level as a null-terminated string.
    inline constexpr auto name_of(log_level level) noexcept -> const char*
    {
        constexpr std::array names{ "trace", "debug", "info", "warning", "error", "critical", "off" };
        return names[static_cast<std::size_t>(level)];
    }

    /** Parse a log level name, as produced by `name_of`. Also accepts "warn" and "err". */
    auto log_level_from_name(std::string_view name) -> std::optional<log_level>;

    /** Parameters for the logging system.
     */
    struct LoggingParams
    {
        /// Minimum level a log record must have to not be filtered out.
        log_level logging_level{ log_level::warn };

        /// Formatting pattern to use in formatted logs (spdlog syntax).
        std::string log_pattern{ "%^%-9!l%-8n%$ %v" };

        auto operator==(const LoggingParams& other) const noexcept -> bool = default;
    };

    /** Specifies the source a `LogRecord` is originating from.
     */
    enum class log_source
    {
        libartifetch,  // default
        libcurl,

        tests,  // only used for testing
    };

    inline constexpr auto name_of(log_source source) noexcept -> const char*
    {
        constexpr std::array names{ "libartifetch", "libcurl", "tests" };
        return names[static_cast<std::size_t>(source)];
    }

    inline auto all_log_sources() -> std::vector<log_source>
    {
        return { log_source::libartifetch, log_source::libcurl };
    }

    namespace logging
    {
        /** All the information about a log. */
        struct LogRecord
        {
            std::string message;
            log_level level = log_level::off;
            log_source source = log_source::libartifetch;
            std::source_location location = {};
        };

        /** Interface of a log handler, receiving the records emitted by the library.

            Implementations must be thread-safe for `log` and `flush`.
            @see `artifetch::logging::spdlogimpl::LogHandler_spdlog`
        */
        class LogHandler
        {
        public:

            virtual ~LogHandler() = default;

            LogHandler(const LogHandler&) = delete;
            LogHandler& operator=(const LogHandler&) = delete;
            LogHandler(LogHandler&&) = delete;
            LogHandler& operator=(LogHandler&&) = delete;

            virtual void start_log_handling(LoggingParams params, std::vector<log_source> sources) = 0;
            virtual void stop_log_handling() = 0;

            virtual void set_params(LoggingParams params) = 0;

            virtual void log(LogRecord record) = 0;
            virtual void flush(std::optional<log_source> source = {}) = 0;

        protected:

            LogHandler() = default;
        };

        /** Install a new log handler, stopping the previous one which is returned.

            If @p maybe_new_params is set, the logging parameters are replaced before
            the new handler is started.
        */
        auto set_log_handler(
            std::unique_ptr<LogHandler> new_handler,
            std::optional<LoggingParams> maybe_new_params = {}
        ) -> std::unique_ptr<LogHandler>;

        /** @returns The currently installed log handler, or null. */
        auto get_log_handler() -> LogHandler*;

        auto set_log_level(log_level new_level) -> log_level;
        auto get_log_level() -> log_level;

        auto set_logging_params(LoggingParams new_params) -> LoggingParams;
        auto get_logging_params() -> LoggingParams;

        /// Send a record to the current log handler if its level is not filtered out.
        auto log(LogRecord record) -> void;

        auto flush_logs(std::optional<log_source> source = {}) -> void;

        /** Stream based logger used by the `LOG_*` macros.

            The message is emitted on destruction, with secrets found in URLs hidden.
        */
        class MessageLogger
        {
        public:

            explicit MessageLogger(
                log_level level,
                std::source_location location = std::source_location::current()
            );
            ~MessageLogger();

            MessageLogger(const MessageLogger&) = delete;
            MessageLogger& operator=(const MessageLogger&) = delete;

            std::stringstream& stream()
            {
                return m_stream;
            }

        private:

            log_level m_level;
            std::stringstream m_stream;
            std::source_location m_location;
        };
    }
}

#endif
