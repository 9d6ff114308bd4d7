#include "DefaultLogger.h"

#include <chrono>
#include <ctime>
#include <iostream>

#include <fmt/format.h>

namespace Ember::Utils
{
    std::string DefaultLogger::getCurrentTimestamp() const {
        if ( !includeTimestamp_ ) return "";

        auto now = std::chrono::system_clock::now();
        auto time_t_now = std::chrono::system_clock::to_time_t( now );
        auto now_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch() ) % 1000;

        std::tm tm_buf{};
        localtime_r( &time_t_now, &tm_buf );

        // HH:MM:SS.mmm
        return fmt::format( "{:02}:{:02}:{:02}.{:03} ",
            tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec, static_cast<int>( now_ms.count() ) );
    }

    std::string DefaultLogger::getLocationInfo( const std::source_location& location ) const {
        if ( !includeSourceLocation_ ) return "";

        std::string_view full_path( location.file_name() );
        size_t last_slash = full_path.find_last_of( "/\\" );
        std::string_view filename = (last_slash == std::string_view::npos) ?
            full_path : full_path.substr( last_slash + 1 );

        std::string_view func_name( location.function_name() );
        size_t paren = func_name.find( '(' );
        if ( paren != std::string_view::npos ) {
            func_name = func_name.substr( 0, paren );
        }
        size_t last_colon = func_name.find_last_of( ": " );
        std::string_view short_func = (last_colon == std::string_view::npos) ?
            func_name : func_name.substr( last_colon + 1 );

        // filename:line:function
        return fmt::format( "{}:{}:{}: ", filename, location.line(), short_func );
    }

    std::string DefaultLogger::formatLine( std::string_view message, LogLevel level, const std::source_location& location ) const {
        return fmt::format( "{}[{}] {}{}",
            getCurrentTimestamp(), logLevelToString( level ), getLocationInfo( location ), message );
    }

    void DefaultLogger::logImpl( std::string_view message, LogLevel level, const std::source_location& location ) {
        if ( !isEnabled( level ) ) return;

        std::string line = formatLine( message, level, location );

        // Lock to prevent interleaved output from multiple threads
        std::lock_guard<std::mutex> lock( logMutex_ );

        std::ostream& outStream = (level >= LogLevel::Error) ? std::cerr : std::cout;
        outStream << line << std::endl;
    }
}
