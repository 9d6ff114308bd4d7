/**
 * @file Logger.h
 * @brief Logging interface and process-wide default logger access.
 */

#ifndef EMBER_UTILS_LOGGER_H_
#define EMBER_UTILS_LOGGER_H_

#include <source_location>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include <fmt/format.h>

namespace Ember::Utils
{
    enum class LogLevel {
        Trace,    // Very detailed information, useful for debugging
        Debug,    // Detailed information on the flow through the system
        Info,     // Informational messages highlighting normal progress
        Warning,  // Potential issues that aren't errors
        Error,    // Error events that might allow the application to continue
        Critical  // Critical errors that may cause the application to terminate
    };

    /**
     * @brief Abstract logger with a process-wide default instance.
     *
     * The static helpers forward to the default logger when one has been
     * installed with setDefaultLogger() and are no-ops otherwise, so library
     * code may log unconditionally.
     */
    class Logger {
    private:
        inline static Logger* defaultLogger_{ nullptr };

    public:
        virtual ~Logger() = default;

        static void setDefaultLogger( Logger* logger ) {
            defaultLogger_ = logger;
        }

        static bool hasDefaultLogger() {
            return defaultLogger_ != nullptr;
        }

        static Logger& defaultLogger() {
            if ( !defaultLogger_ ) {
                throw std::runtime_error( "No default logger has been set" );
            }
            return *defaultLogger_;
        }

        // Static convenience methods for direct logging
        static void trace( std::string_view message,
            const std::source_location& location = std::source_location::current() ) {
            if ( defaultLogger_ ) defaultLogger_->log( message, LogLevel::Trace, location );
        }

        static void debug( std::string_view message,
            const std::source_location& location = std::source_location::current() ) {
            if ( defaultLogger_ ) defaultLogger_->log( message, LogLevel::Debug, location );
        }

        static void info( std::string_view message,
            const std::source_location& location = std::source_location::current() ) {
            if ( defaultLogger_ ) defaultLogger_->log( message, LogLevel::Info, location );
        }

        static void warning( std::string_view message,
            const std::source_location& location = std::source_location::current() ) {
            if ( defaultLogger_ ) defaultLogger_->log( message, LogLevel::Warning, location );
        }

        static void error( std::string_view message,
            const std::source_location& location = std::source_location::current() ) {
            if ( defaultLogger_ ) defaultLogger_->log( message, LogLevel::Error, location );
        }

        static void critical( std::string_view message,
            const std::source_location& location = std::source_location::current() ) {
            if ( defaultLogger_ ) defaultLogger_->log( message, LogLevel::Critical, location );
        }

        // Static format methods. Arguments are only formatted when the level is enabled.
        template<typename... Args>
        static void trace_fmt( fmt::format_string<Args...> fmt, Args&&... args ) {
            logFormatted( LogLevel::Trace, fmt, std::forward<Args>( args )... );
        }

        template<typename... Args>
        static void debug_fmt( fmt::format_string<Args...> fmt, Args&&... args ) {
            logFormatted( LogLevel::Debug, fmt, std::forward<Args>( args )... );
        }

        template<typename... Args>
        static void info_fmt( fmt::format_string<Args...> fmt, Args&&... args ) {
            logFormatted( LogLevel::Info, fmt, std::forward<Args>( args )... );
        }

        template<typename... Args>
        static void warning_fmt( fmt::format_string<Args...> fmt, Args&&... args ) {
            logFormatted( LogLevel::Warning, fmt, std::forward<Args>( args )... );
        }

        template<typename... Args>
        static void error_fmt( fmt::format_string<Args...> fmt, Args&&... args ) {
            logFormatted( LogLevel::Error, fmt, std::forward<Args>( args )... );
        }

        template<typename... Args>
        static void critical_fmt( fmt::format_string<Args...> fmt, Args&&... args ) {
            logFormatted( LogLevel::Critical, fmt, std::forward<Args>( args )... );
        }

        // Virtual logging methods with log_ prefix to avoid name conflicts with static methods
        virtual void log_trace( std::string_view message,
            const std::source_location& location = std::source_location::current() ) = 0;
        virtual void log_debug( std::string_view message,
            const std::source_location& location = std::source_location::current() ) = 0;
        virtual void log_info( std::string_view message,
            const std::source_location& location = std::source_location::current() ) = 0;
        virtual void log_warning( std::string_view message,
            const std::source_location& location = std::source_location::current() ) = 0;
        virtual void log_error( std::string_view message,
            const std::source_location& location = std::source_location::current() ) = 0;
        virtual void log_critical( std::string_view message,
            const std::source_location& location = std::source_location::current() ) = 0;

        // Generic log method
        virtual void log( std::string_view message, LogLevel level,
            const std::source_location& location = std::source_location::current() ) = 0;

        // Control methods
        virtual void setLevel( LogLevel level ) = 0;
        virtual LogLevel getLevel() const = 0;
        virtual bool isEnabled( LogLevel level ) const = 0;

    private:
        template<typename... Args>
        static void logFormatted( LogLevel level, fmt::format_string<Args...> fmt, Args&&... args ) {
            if ( !defaultLogger_ || !defaultLogger_->isEnabled( level ) ) {
                return;
            }

            // The call site is not available through a variadic template, so the
            // location recorded is the formatting helper itself.
            defaultLogger_->log( fmt::format( fmt, std::forward<Args>( args )... ), level );
        }
    };

    /**
     * @brief Converts a LogLevel to its fixed-width display string.
     */
    constexpr const char* logLevelToString( LogLevel level ) {
        switch ( level ) {
            case LogLevel::Trace:    return "TRACE";
            case LogLevel::Debug:    return "DEBUG";
            case LogLevel::Info:     return "INFO ";
            case LogLevel::Warning:  return "WARN ";
            case LogLevel::Error:    return "ERROR";
            case LogLevel::Critical: return "CRIT ";
            default:                 return "UNKN ";
        }
    }
}

#endif
