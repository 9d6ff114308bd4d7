#include "Ember.h"

#include <exception>
#include <iostream>
#include <memory>

namespace Ember
{
    namespace detail
    {
        std::shared_ptr<Utils::DefaultLogger> g_defaultLogger;
    }

    namespace
    {
        void initializeLogger( Utils::LogLevel level )
        {
            detail::g_defaultLogger = std::make_shared<Utils::DefaultLogger>( level );
            Utils::Logger::setDefaultLogger( detail::g_defaultLogger.get() );
        }
    }

    Version getAPIVersion()
    {
        return Version{
            EMBER_VERSION_MAJOR,
            EMBER_VERSION_MINOR,
            EMBER_VERSION_PATCH,
            EMBER_VERSION_PRERELEASE_TAG,
            EMBER_VERSION_PRERELEASE
        };
    }

    bool initialize( unsigned int randomSeed, Utils::LogLevel logLevel )
    {
        try
        {
            initializeLogger( logLevel );

            Utils::RandomGenerator::getInstance().setSeed( randomSeed );
            if (randomSeed != 0)
            {
                Utils::Logger::info_fmt( "Initialized random generator with seed: {}", randomSeed );
            }
            else
            {
                Utils::Logger::info( "Initialized random generator with non-deterministic seed." );
            }

            Dnn::Compute::OperationsRegistrar::instance();

            Utils::Logger::info_fmt( "Ember {} initialized successfully", getAPIVersion().toString() );
            return true;
        }
        catch (const std::exception& e)
        {
            // The logger may not be installed yet.
            std::cerr << "Ember initialization failed: " << e.what() << std::endl;
            return false;
        }
    }

    void shutdown()
    {
        Utils::Logger::info( "Shutting down Ember" );

        Utils::Logger::setDefaultLogger( nullptr );
        detail::g_defaultLogger.reset();
    }
}
