#include <gtest/gtest.h>

#include <source_location>
#include <string>
#include <string_view>
#include <vector>

#include "Utils/DefaultLogger.h"
#include "Utils/Logger.h"

namespace Utils::Tests
{
    using namespace Ember::Utils;

    /**
     * @brief Logger that records every enabled message.
     */
    class RecordingLogger : public Logger {
    public:
        struct Entry {
            std::string message;
            LogLevel level;
        };

        std::vector<Entry> entries;

        void log_trace( std::string_view message, const std::source_location& location ) override { log( message, LogLevel::Trace, location ); }
        void log_debug( std::string_view message, const std::source_location& location ) override { log( message, LogLevel::Debug, location ); }
        void log_info( std::string_view message, const std::source_location& location ) override { log( message, LogLevel::Info, location ); }
        void log_warning( std::string_view message, const std::source_location& location ) override { log( message, LogLevel::Warning, location ); }
        void log_error( std::string_view message, const std::source_location& location ) override { log( message, LogLevel::Error, location ); }
        void log_critical( std::string_view message, const std::source_location& location ) override { log( message, LogLevel::Critical, location ); }

        void log( std::string_view message, LogLevel level, const std::source_location& ) override {
            if ( isEnabled( level ) ) {
                entries.push_back( { std::string( message ), level } );
            }
        }

        void setLevel( LogLevel level ) override { level_ = level; }
        LogLevel getLevel() const override { return level_; }
        bool isEnabled( LogLevel level ) const override { return level >= level_; }

    private:
        LogLevel level_ = LogLevel::Trace;
    };

    class LoggerTests : public ::testing::Test {
    protected:
        void SetUp() override {
            previous_ = Logger::hasDefaultLogger() ? &Logger::defaultLogger() : nullptr;
            Logger::setDefaultLogger( &recorder_ );
        }

        void TearDown() override {
            Logger::setDefaultLogger( previous_ );
        }

        RecordingLogger recorder_;
        Logger* previous_{ nullptr };
    };

    TEST_F( LoggerTests, StaticHelpers_ForwardToDefaultLogger ) {
        Logger::info( "hello" );
        Logger::error( "failure" );

        ASSERT_EQ( recorder_.entries.size(), 2u );
        EXPECT_EQ( recorder_.entries[ 0 ].message, "hello" );
        EXPECT_EQ( recorder_.entries[ 0 ].level, LogLevel::Info );
        EXPECT_EQ( recorder_.entries[ 1 ].level, LogLevel::Error );
    }

    TEST_F( LoggerTests, FormatHelpers_FormatArguments ) {
        Logger::warning_fmt( "{} of {} steps", 3, 8 );

        ASSERT_EQ( recorder_.entries.size(), 1u );
        EXPECT_EQ( recorder_.entries[ 0 ].message, "3 of 8 steps" );
    }

    TEST_F( LoggerTests, FormatHelpers_SkipDisabledLevels ) {
        recorder_.setLevel( LogLevel::Warning );

        Logger::debug_fmt( "hidden {}", 1 );
        Logger::info( "hidden" );
        Logger::critical_fmt( "shown {}", 2 );

        ASSERT_EQ( recorder_.entries.size(), 1u );
        EXPECT_EQ( recorder_.entries[ 0 ].message, "shown 2" );
    }

    TEST_F( LoggerTests, NoDefaultLogger_IsSilent ) {
        Logger::setDefaultLogger( nullptr );

        EXPECT_FALSE( Logger::hasDefaultLogger() );
        EXPECT_NO_THROW( Logger::info( "dropped" ) );
        EXPECT_NO_THROW( Logger::error_fmt( "dropped {}", 1 ) );
        EXPECT_THROW( Logger::defaultLogger(), std::runtime_error );
    }

    TEST( DefaultLoggerTests, FormatLine_WithoutTimestampOrLocation ) {
        DefaultLogger logger( LogLevel::Debug );
        logger.setIncludeTimestamp( false );
        logger.setIncludeSourceLocation( false );

        EXPECT_EQ( logger.formatLine( "ready", LogLevel::Info, std::source_location::current() ), "[INFO ] ready" );
        EXPECT_EQ( logger.formatLine( "bad", LogLevel::Error, std::source_location::current() ), "[ERROR] bad" );
    }

    TEST( DefaultLoggerTests, FormatLine_IncludesFileName ) {
        DefaultLogger logger;
        logger.setIncludeTimestamp( false );

        std::string line = logger.formatLine( "x", LogLevel::Warning, std::source_location::current() );

        EXPECT_NE( line.find( "[WARN ] Logger.cpp:" ), std::string::npos );
        EXPECT_TRUE( line.ends_with( ": x" ) );
    }

    TEST( DefaultLoggerTests, LevelThreshold ) {
        DefaultLogger logger( LogLevel::Warning );

        EXPECT_FALSE( logger.isEnabled( LogLevel::Info ) );
        EXPECT_TRUE( logger.isEnabled( LogLevel::Warning ) );
        EXPECT_TRUE( logger.isEnabled( LogLevel::Critical ) );

        logger.setLevel( LogLevel::Trace );
        EXPECT_EQ( logger.getLevel(), LogLevel::Trace );
        EXPECT_TRUE( logger.isEnabled( LogLevel::Trace ) );
    }
}
