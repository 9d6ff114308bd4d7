/**
 * @file DefaultLogger.h
 * @brief Console logger used as the default Logger implementation.
 */

#ifndef EMBER_UTILS_DEFAULT_LOGGER_H_
#define EMBER_UTILS_DEFAULT_LOGGER_H_

#include <mutex>
#include <source_location>
#include <string>
#include <string_view>

#include "Logger.h"

namespace Ember::Utils
{
    class DefaultLogger : public Logger {
    public:
        // Constructor allows setting the initial log level
        explicit DefaultLogger( LogLevel initialLevel = LogLevel::Info )
            : currentLevel_( initialLevel ) {}

        void setLevel( LogLevel level ) override {
            currentLevel_ = level;
        }

        LogLevel getLevel() const override {
            return currentLevel_;
        }

        bool isEnabled( LogLevel level ) const override {
            return level >= currentLevel_;
        }

        void setIncludeTimestamp( bool include ) {
            includeTimestamp_ = include;
        }

        void setIncludeSourceLocation( bool include ) {
            includeSourceLocation_ = include;
        }

        void log_trace( std::string_view message,
            const std::source_location& location = std::source_location::current() ) override {
            logImpl( message, LogLevel::Trace, location );
        }

        void log_debug( std::string_view message,
            const std::source_location& location = std::source_location::current() ) override {
            logImpl( message, LogLevel::Debug, location );
        }

        void log_info( std::string_view message,
            const std::source_location& location = std::source_location::current() ) override {
            logImpl( message, LogLevel::Info, location );
        }

        void log_warning( std::string_view message,
            const std::source_location& location = std::source_location::current() ) override {
            logImpl( message, LogLevel::Warning, location );
        }

        void log_error( std::string_view message,
            const std::source_location& location = std::source_location::current() ) override {
            logImpl( message, LogLevel::Error, location );
        }

        void log_critical( std::string_view message,
            const std::source_location& location = std::source_location::current() ) override {
            logImpl( message, LogLevel::Critical, location );
        }

        void log( std::string_view message, LogLevel level,
            const std::source_location& location = std::source_location::current() ) override {
            logImpl( message, level, location );
        }

        /**
         * @brief Builds the complete output line without writing it.
         *
         * Exposed so the line layout can be checked without capturing the console.
         */
        std::string formatLine( std::string_view message, LogLevel level, const std::source_location& location ) const;

    private:
        LogLevel currentLevel_ = LogLevel::Info;
        mutable std::mutex logMutex_;
        bool includeTimestamp_ = true;
        bool includeSourceLocation_ = true;

        std::string getCurrentTimestamp() const;
        std::string getLocationInfo( const std::source_location& location ) const;

        void logImpl( std::string_view message, LogLevel level, const std::source_location& location );
    };
}

#endif
