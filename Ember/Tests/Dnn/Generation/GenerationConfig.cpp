#include <gtest/gtest.h>

#include <limits>
#include <stdexcept>
#include <string>

#include "Dnn/Common/Errors.h"
#include "Dnn/Generation/GenerationConfig.h"

namespace Dnn::Generation::Tests
{
    using namespace Ember::Dnn;

    TEST( GenerationConfigTests, Defaults )
    {
        GenerationConfig config;

        EXPECT_EQ( config.getMaxNewTokens(), 100 );
        EXPECT_FLOAT_EQ( config.getTemperature(), 1.0f );
        EXPECT_TRUE( config.doSample() );
        EXPECT_FALSE( config.getTopK().has_value() );
        EXPECT_FALSE( config.getTopP().has_value() );
        EXPECT_FALSE( config.getEosTokenId().has_value() );
        EXPECT_FALSE( config.getSeed().has_value() );
        EXPECT_FALSE( config.isGreedy() );
        EXPECT_NO_THROW( config.validate() );
    }

    TEST( GenerationConfigTests, FluentSetters )
    {
        GenerationConfig config;
        config.withMaxNewTokens( 8 ).withTemperature( 0.7f ).withTopK( 5 ).withTopP( 0.9f ).withEosTokenId( 2 ).withSeed( 13 );

        EXPECT_EQ( config.getMaxNewTokens(), 8 );
        EXPECT_FLOAT_EQ( config.getTemperature(), 0.7f );
        EXPECT_EQ( *config.getTopK(), 5 );
        EXPECT_FLOAT_EQ( *config.getTopP(), 0.9f );
        EXPECT_EQ( *config.getEosTokenId(), 2 );
        EXPECT_EQ( *config.getSeed(), 13u );
    }

    TEST( GenerationConfigTests, Greedy_WhenSamplingOffOrZeroTemperature )
    {
        GenerationConfig no_sampling;
        no_sampling.withSampling( false );
        EXPECT_TRUE( no_sampling.isGreedy() );

        GenerationConfig cold;
        cold.withTemperature( 0.0f );
        EXPECT_TRUE( cold.isGreedy() );
        EXPECT_NO_THROW( cold.validate() );
    }

    TEST( GenerationConfigTests, Validate_RejectsOutOfRangeFields )
    {
        EXPECT_THROW( GenerationConfig().withMaxNewTokens( -1 ).validate(), ConfigError );
        EXPECT_THROW( GenerationConfig().withTemperature( -0.5f ).validate(), ConfigError );
        EXPECT_THROW( GenerationConfig().withTemperature( std::numeric_limits<float>::quiet_NaN() ).validate(), ConfigError );
        EXPECT_THROW( GenerationConfig().withTemperature( std::numeric_limits<float>::infinity() ).validate(), ConfigError );
        EXPECT_THROW( GenerationConfig().withTopK( 0 ).validate(), ConfigError );
        EXPECT_THROW( GenerationConfig().withTopP( 0.0f ).validate(), ConfigError );
        EXPECT_THROW( GenerationConfig().withTopP( 1.01f ).validate(), ConfigError );
    }

    TEST( GenerationConfigTests, Validate_ZeroNewTokensAndFullNucleus_Accepted )
    {
        EXPECT_NO_THROW( GenerationConfig().withMaxNewTokens( 0 ).validate() );
        EXPECT_NO_THROW( GenerationConfig().withTopP( 1.0f ).validate() );
        EXPECT_NO_THROW( GenerationConfig().withTopK( 1 ).validate() );
    }

    TEST( GenerationConfigTests, ToString )
    {
        GenerationConfig config;
        config.withTopK( 40 );

        std::string str = config.toString();
        EXPECT_NE( str.find( "max_new_tokens=100" ), std::string::npos );
        EXPECT_NE( str.find( "top_k=40" ), std::string::npos );
        EXPECT_NE( str.find( "top_p=none" ), std::string::npos );
        EXPECT_NE( str.find( "eos_token_id=none" ), std::string::npos );
    }
}
