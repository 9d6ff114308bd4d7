#include <gtest/gtest.h>

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "Dnn/Common/ActivationType.h"
#include "Dnn/Common/Errors.h"
#include "Dnn/Common/PositionEncoding.h"
#include "Dnn/Models/ModelConfig.h"

namespace Dnn::Models::Tests
{
    using namespace Ember::Dnn;

    class ModelConfigTests : public ::testing::Test
    {
    protected:
        ModelConfig tiny() const
        {
            return ModelConfig( 100, 16, 32, 2, 4 );
        }
    };

    TEST_F( ModelConfigTests, Defaults )
    {
        auto config = tiny();

        EXPECT_EQ( config.getVocabSize(), 100 );
        EXPECT_EQ( config.getMaxSeqLen(), 16 );
        EXPECT_EQ( config.getEmbedDim(), 32 );
        EXPECT_EQ( config.getNumLayers(), 2 );
        EXPECT_EQ( config.getNumHeads(), 4 );
        EXPECT_EQ( config.getHeadDim(), 8 );
        EXPECT_EQ( config.getFfDim(), 4 * 32 );
        EXPECT_FLOAT_EQ( config.getDropout(), 0.1f );
        EXPECT_FLOAT_EQ( config.getAttentionDropout(), 0.1f );
        EXPECT_EQ( config.getActivation(), ActivationType::Gelu );
        EXPECT_FLOAT_EQ( config.getLayerNormEpsilon(), 1e-5f );
        EXPECT_FLOAT_EQ( config.getInitStd(), 0.02f );
        EXPECT_EQ( config.getPositionEncoding(), PositionEncoding::Learned );
    }

    TEST_F( ModelConfigTests, Construction_InvalidSizes_Throw )
    {
        EXPECT_THROW( ModelConfig( 0, 16, 32, 2, 4 ), ConfigError );
        EXPECT_THROW( ModelConfig( 100, 0, 32, 2, 4 ), ConfigError );
        EXPECT_THROW( ModelConfig( 100, 16, 32, 0, 4 ), ConfigError );
        EXPECT_THROW( ModelConfig( 100, 16, 30, 2, 4 ), ConfigError );
        EXPECT_THROW( ModelConfig( 100, 16, 32, 2, -1 ), ConfigError );
    }

    TEST_F( ModelConfigTests, With_ReturnsValidatedCopy )
    {
        auto base = tiny();
        auto changed = base.withDropout( 0.0f ).withFfDim( 48 ).withActivation( ActivationType::Swish );

        EXPECT_FLOAT_EQ( base.getDropout(), 0.1f );
        EXPECT_EQ( base.getFfDim(), 128 );
        EXPECT_FLOAT_EQ( changed.getDropout(), 0.0f );
        EXPECT_EQ( changed.getFfDim(), 48 );
        EXPECT_EQ( changed.getActivation(), ActivationType::Swish );

        EXPECT_THROW( base.withDropout( 1.0f ), ConfigError );
        EXPECT_THROW( base.withDropout( -0.5f ), ConfigError );
        EXPECT_THROW( base.withAttentionDropout( 1.5f ), ConfigError );
        EXPECT_THROW( base.withFfDim( 0 ), ConfigError );
        EXPECT_THROW( base.withLayerNormEpsilon( 0.0f ), ConfigError );
        EXPECT_THROW( base.withInitStd( -0.01f ), ConfigError );
        EXPECT_NO_THROW( base.withInitStd( 0.0f ) );
    }

    TEST_F( ModelConfigTests, Activation_ByName )
    {
        EXPECT_EQ( tiny().withActivation( "relu" ).getActivation(), ActivationType::Relu );
        EXPECT_EQ( tiny().withActivation( "GELU" ).getActivation(), ActivationType::Gelu );
        EXPECT_EQ( tiny().withActivation( "Swish" ).getActivation(), ActivationType::Swish );
        EXPECT_THROW( tiny().withActivation( "tanh" ), ConfigError );
    }

    TEST_F( ModelConfigTests, ConfigError_IsInvalidArgument )
    {
        EXPECT_THROW( ModelConfig( 100, 16, 30, 2, 4 ), std::invalid_argument );
    }

    TEST_F( ModelConfigTests, Presets )
    {
        auto small = getConfig( "small" );
        EXPECT_EQ( small.getVocabSize(), 50257 );
        EXPECT_EQ( small.getMaxSeqLen(), 512 );
        EXPECT_EQ( small.getEmbedDim(), 384 );
        EXPECT_EQ( small.getNumLayers(), 6 );
        EXPECT_EQ( small.getNumHeads(), 6 );
        EXPECT_FLOAT_EQ( small.getDropout(), 0.1f );

        auto medium = getConfig( "medium" );
        EXPECT_EQ( medium.getEmbedDim(), 768 );
        EXPECT_EQ( medium.getNumLayers(), 12 );
        EXPECT_EQ( medium.getNumHeads(), 12 );
        EXPECT_EQ( medium.getMaxSeqLen(), 1024 );

        auto large = getConfig( "large" );
        EXPECT_EQ( large.getEmbedDim(), 1536 );
        EXPECT_EQ( large.getNumLayers(), 24 );
        EXPECT_EQ( large.getNumHeads(), 16 );
        EXPECT_EQ( large.getMaxSeqLen(), 2048 );

        auto xl = getConfig( "xl" );
        EXPECT_EQ( xl.getEmbedDim(), 2048 );
        EXPECT_EQ( xl.getNumLayers(), 32 );
        EXPECT_EQ( xl.getNumHeads(), 32 );
    }

    TEST_F( ModelConfigTests, Presets_CaseInsensitive )
    {
        EXPECT_EQ( getConfig( "SMALL" ), getConfig( "small" ) );
        EXPECT_EQ( getConfig( "Xl" ), getConfig( "xl" ) );
    }

    TEST_F( ModelConfigTests, Presets_UnknownNameListsAvailable )
    {
        try
        {
            getConfig( "huge" );
            FAIL() << "Expected ConfigError";
        }
        catch (const ConfigError& e)
        {
            const std::string message = e.what();
            EXPECT_NE( message.find( "huge" ), std::string::npos );
            EXPECT_NE( message.find( "small, medium, large, xl" ), std::string::npos );
        }

        EXPECT_EQ( availableConfigs(), (std::vector<std::string>{ "small", "medium", "large", "xl" }) );
    }

    TEST_F( ModelConfigTests, NumParameters_CountsTiedHeadOnce )
    {
        auto config = tiny();
        const size_t V = 100, S = 16, C = 32, L = 2, F = 128;
        const size_t per_layer = 4 * C + (3 * C * C + 3 * C) + (C * C + C) + (C * F + F) + (F * C + C);

        EXPECT_EQ( config.numParameters(), V * C + S * C + L * per_layer + 2 * C );
        EXPECT_EQ( config.numParameters( true ), config.numParameters() - S * C );
    }

    TEST_F( ModelConfigTests, Json_RoundTrip )
    {
        auto config = tiny()
            .withFfDim( 100 )
            .withDropout( 0.25f )
            .withAttentionDropout( 0.0f )
            .withActivation( ActivationType::Relu )
            .withLayerNormEpsilon( 1e-6f )
            .withInitStd( 0.05f );

        auto j = config.toJson();
        EXPECT_EQ( j.at( "activation" ).get<std::string>(), "relu" );
        EXPECT_EQ( j.at( "ff_dim" ).get<int64_t>(), 100 );

        auto restored = ModelConfig::fromJson( j );
        EXPECT_EQ( restored, config );

        auto from_text = ModelConfig::fromJson( nlohmann::json::parse( j.dump() ) );
        EXPECT_EQ( from_text, config );
    }

    TEST_F( ModelConfigTests, Json_OptionalKeysUseDefaults )
    {
        auto j = nlohmann::json::parse( R"({
            "vocab_size": 100, "max_seq_len": 16, "embed_dim": 32, "num_layers": 2, "num_heads": 4,
            "ff_dim": null
        })" );

        EXPECT_EQ( ModelConfig::fromJson( j ), tiny() );
    }

    TEST_F( ModelConfigTests, Json_Invalid_Throws )
    {
        auto missing = tiny().toJson();
        missing.erase( "num_heads" );
        EXPECT_THROW( ModelConfig::fromJson( missing ), ConfigError );

        auto wrong_type = tiny().toJson();
        wrong_type[ "embed_dim" ] = "thirty-two";
        EXPECT_THROW( ModelConfig::fromJson( wrong_type ), ConfigError );

        auto bad_value = tiny().toJson();
        bad_value[ "dropout" ] = 2.0;
        EXPECT_THROW( ModelConfig::fromJson( bad_value ), ConfigError );

        auto bad_activation = tiny().toJson();
        bad_activation[ "activation" ] = "sigmoid";
        EXPECT_THROW( ModelConfig::fromJson( bad_activation ), ConfigError );
    }

    TEST_F( ModelConfigTests, ToString_ListsFields )
    {
        const std::string text = tiny().toString();
        EXPECT_NE( text.find( "vocab_size=100" ), std::string::npos );
        EXPECT_NE( text.find( "activation=gelu" ), std::string::npos );
    }

    TEST_F( ModelConfigTests, PositionEncoding_ByNameAndValidation )
    {
        EXPECT_EQ( tiny().withPositionEncoding( "Sinusoidal" ).getPositionEncoding(), PositionEncoding::Sinusoidal );
        EXPECT_EQ( tiny().withPositionEncoding( "rotary" ).getPositionEncoding(), PositionEncoding::Rotary );
        EXPECT_THROW( tiny().withPositionEncoding( "alibi" ), ConfigError );

        // head_dim 3 cannot be split into rotation pairs
        auto odd_heads = ModelConfig( 100, 16, 12, 1, 4 );
        EXPECT_THROW( odd_heads.withPositionEncoding( PositionEncoding::Rotary ), ConfigError );
        EXPECT_NO_THROW( odd_heads.withPositionEncoding( PositionEncoding::Sinusoidal ) );
    }

    TEST_F( ModelConfigTests, PositionEncoding_FixedTablesAddNoParameters )
    {
        const size_t S = 16, C = 32;

        for (auto encoding : { PositionEncoding::Sinusoidal, PositionEncoding::Rotary })
        {
            auto config = tiny().withPositionEncoding( encoding );
            EXPECT_EQ( config.numParameters(), tiny().numParameters() - S * C );
            EXPECT_EQ( config.numParameters( true ), config.numParameters() );
        }
    }

    TEST_F( ModelConfigTests, PositionEncoding_Json )
    {
        auto config = tiny().withPositionEncoding( PositionEncoding::Rotary );

        auto j = config.toJson();
        EXPECT_EQ( j.at( "position_encoding" ).get<std::string>(), "rotary" );
        EXPECT_EQ( ModelConfig::fromJson( j ), config );
        EXPECT_NE( config.toString().find( "position_encoding=rotary" ), std::string::npos );

        auto unknown = tiny().toJson();
        unknown[ "position_encoding" ] = "relative";
        EXPECT_THROW( ModelConfig::fromJson( unknown ), ConfigError );
    }
}
