#include <gtest/gtest.h>

#include <algorithm>
#include <cstdint>
#include <iterator>
#include <memory>
#include <set>
#include <stdexcept>
#include <vector>

#include "Dnn/Common/Errors.h"
#include "Dnn/Compute/ExecutionContext.h"
#include "Dnn/Generation/Generator.h"
#include "Dnn/Models/GptModel.h"
#include "Dnn/Models/ModelConfig.h"
#include "Utils/RandomGenerator.h"

namespace Dnn::Generation::Tests
{
    using namespace Ember::Dnn;
    using namespace Ember::Dnn::Compute;

    class GeneratorTests : public ::testing::Test
    {
    protected:
        using Rows = std::vector<std::vector<int32_t>>;

        void SetUp() override
        {
            exec_context_ = std::make_shared<CpuExecutionContext>();

            auto config = ModelConfig( vocab_, max_seq_len_, 32, 2, 4 )
                .withDropout( 0.0f )
                .withAttentionDropout( 0.0f );

            model_ = std::make_shared<const GptModel>( exec_context_, config, 1234u );
        }

        GenerationConfig greedy( int64_t max_new_tokens ) const
        {
            GenerationConfig config;
            config.withMaxNewTokens( max_new_tokens ).withSampling( false );
            return config;
        }

        Rows run( const GenerationConfig& config, const Rows& prompt ) const
        {
            return Generator( model_, config ).generate( prompt );
        }

        const int64_t vocab_ = 100;
        const int64_t max_seq_len_ = 16;

        std::shared_ptr<CpuExecutionContext> exec_context_;
        std::shared_ptr<const GptModel> model_;
    };

    TEST_F( GeneratorTests, Constructor_RejectsNullModelAndInvalidConfig )
    {
        EXPECT_THROW( Generator( nullptr, GenerationConfig() ), std::invalid_argument );
        EXPECT_THROW( Generator( model_, GenerationConfig().withTopK( 0 ) ), ConfigError );
    }

    TEST_F( GeneratorTests, Greedy_AppendsTokensAndKeepsPrompt )
    {
        const Rows prompt = { { 5, 7, 2 } };

        Rows output = run( greedy( 4 ), prompt );

        ASSERT_EQ( output.size(), 1u );
        ASSERT_EQ( output[ 0 ].size(), 7u );
        EXPECT_EQ( output[ 0 ][ 0 ], 5 );
        EXPECT_EQ( output[ 0 ][ 1 ], 7 );
        EXPECT_EQ( output[ 0 ][ 2 ], 2 );

        for (int32_t id : output[ 0 ])
        {
            EXPECT_GE( id, 0 );
            EXPECT_LT( id, vocab_ );
        }
    }

    TEST_F( GeneratorTests, Greedy_IsDeterministic )
    {
        const Rows prompt = { { 5, 7, 2 }, { 11, 3, 90 } };

        EXPECT_EQ( run( greedy( 6 ), prompt ), run( greedy( 6 ), prompt ) );
    }

    TEST_F( GeneratorTests, ZeroNewTokens_ReturnsPrompt )
    {
        const Rows prompt = { { 1, 2, 3 } };

        EXPECT_EQ( run( greedy( 0 ), prompt ), prompt );
    }

    TEST_F( GeneratorTests, FullContextPrompt_IsCropped )
    {
        Rows prompt( 1 );
        for (int32_t i = 0; i < max_seq_len_; ++i)
        {
            prompt[ 0 ].push_back( (i * 7) % static_cast<int32_t>(vocab_) );
        }

        Rows output;
        ASSERT_NO_THROW( output = run( greedy( 3 ), prompt ) );
        EXPECT_EQ( output[ 0 ].size(), static_cast<size_t>(max_seq_len_ + 3) );
    }

    TEST_F( GeneratorTests, LongPrompt_UsesTrailingWindow )
    {
        Rows long_prompt( 1 );
        for (int32_t i = 0; i < max_seq_len_ + 4; ++i)
        {
            long_prompt[ 0 ].push_back( (i * 13 + 1) % static_cast<int32_t>(vocab_) );
        }

        Rows window = { std::vector<int32_t>( long_prompt[ 0 ].end() - max_seq_len_, long_prompt[ 0 ].end() ) };

        Rows from_long = run( greedy( 1 ), long_prompt );
        Rows from_window = run( greedy( 1 ), window );

        EXPECT_EQ( from_long[ 0 ].back(), from_window[ 0 ].back() );
        EXPECT_EQ( from_long[ 0 ].size(), long_prompt[ 0 ].size() + 1 );
    }

    TEST_F( GeneratorTests, TopKOne_MatchesGreedy )
    {
        const Rows prompt = { { 4, 8, 15 } };

        GenerationConfig top1;
        top1.withMaxNewTokens( 5 ).withTopK( 1 ).withTemperature( 0.8f ).withSeed( 99 );

        EXPECT_EQ( run( top1, prompt ), run( greedy( 5 ), prompt ) );
    }

    TEST_F( GeneratorTests, TopKOne_WithNucleus_MatchesGreedy )
    {
        const Rows prompt = { { 4, 8, 15 } };
        const Rows expected = run( greedy( 5 ), prompt );

        for (float top_p : { 0.05f, 1.0f })
        {
            GenerationConfig config;
            config.withMaxNewTokens( 5 ).withTopK( 1 ).withTopP( top_p ).withTemperature( 1.3f ).withSeed( 5 );

            EXPECT_EQ( run( config, prompt ), expected ) << "top_p=" << top_p;
        }
    }

    TEST_F( GeneratorTests, DenormalTemperatureWithoutSampling_MatchesGreedy )
    {
        const Rows prompt = { { 16, 23, 42 } };

        GenerationConfig config = greedy( 5 );
        config.withTemperature( 1e-39f );

        Rows output;
        ASSERT_NO_THROW( output = run( config, prompt ) );
        EXPECT_EQ( output, run( greedy( 5 ), prompt ) );
    }

    TEST_F( GeneratorTests, ZeroTemperature_MatchesGreedy )
    {
        const Rows prompt = { { 16, 23, 42 } };

        GenerationConfig cold;
        cold.withMaxNewTokens( 5 ).withTemperature( 0.0f );

        EXPECT_EQ( run( cold, prompt ), run( greedy( 5 ), prompt ) );
    }

    TEST_F( GeneratorTests, SeededSampling_IsReproducible )
    {
        const Rows prompt = { { 3, 1, 4 }, { 1, 5, 9 } };

        GenerationConfig config;
        config.withMaxNewTokens( 8 ).withTemperature( 1.5f ).withTopP( 0.95f ).withSeed( 2024 );

        Rows first = run( config, prompt );
        Rows second = run( config, prompt );

        EXPECT_EQ( first, second );
        EXPECT_EQ( first[ 0 ].size(), 11u );
    }

    TEST_F( GeneratorTests, UnseededSampling_DiffersAcrossRequests )
    {
        auto config = ModelConfig( vocab_, max_seq_len_, 32, 2, 4 )
            .withDropout( 0.0f )
            .withAttentionDropout( 0.0f )
            .withInitStd( 0.5f );
        auto model = std::make_shared<const GptModel>( exec_context_, config, 1234u );

        GenerationConfig sampling;
        sampling.withMaxNewTokens( 12 ).withTemperature( 2.0f );
        Generator generator( model, sampling );

        std::set<Rows> outputs;
        for (int i = 0; i < 11; ++i)
        {
            outputs.insert( generator.generate( Rows{ { 5, 7, 2 } } ) );
        }

        EXPECT_GT( outputs.size(), 1u );
    }

    TEST_F( GeneratorTests, UnseededSampling_FollowsGlobalSeed )
    {
        auto& rng = Ember::Utils::RandomGenerator::getInstance();
        const unsigned int saved_seed = rng.getSeed();

        GenerationConfig sampling;
        sampling.withMaxNewTokens( 8 ).withTemperature( 1.5f );
        Generator generator( model_, sampling );
        const Rows prompt = { { 3, 1, 4 } };

        rng.setSeed( 77 );
        Rows a1 = generator.generate( prompt );
        Rows a2 = generator.generate( prompt );

        rng.setSeed( 77 );
        Rows b1 = generator.generate( prompt );
        Rows b2 = generator.generate( prompt );

        rng.setSeed( saved_seed );

        EXPECT_EQ( a1, b1 );
        EXPECT_EQ( a2, b2 );
    }

    TEST_F( GeneratorTests, SeparateModelsWithSameSeed_GenerateSameTokens )
    {
        auto config = ModelConfig( vocab_, max_seq_len_, 32, 2, 4 )
            .withDropout( 0.0f )
            .withAttentionDropout( 0.0f );

        auto first = std::make_shared<const GptModel>( exec_context_, config, 31u );
        auto second = std::make_shared<const GptModel>( exec_context_, config, 31u );
        const Rows prompt = { { 5, 7, 2 } };

        Rows a = Generator( first, greedy( 4 ) ).generate( prompt );
        Rows b = Generator( second, greedy( 4 ) ).generate( prompt );

        EXPECT_EQ( a, b );
        EXPECT_EQ( a[ 0 ].size(), 7u );
    }

    TEST_F( GeneratorTests, Eos_StopsSingleRowEarly )
    {
        const Rows prompt = { { 5, 7, 2 } };
        const int32_t first_token = run( greedy( 1 ), prompt )[ 0 ].back();

        GenerationConfig config = greedy( 6 );
        config.withEosTokenId( first_token );

        Rows output = run( config, prompt );

        ASSERT_EQ( output[ 0 ].size(), 4u );
        EXPECT_EQ( output[ 0 ].back(), first_token );
    }

    TEST_F( GeneratorTests, Eos_FinishedRowsArePadded )
    {
        const Rows prompt = { { 5, 7, 2 }, { 60, 61, 62 } };

        Generator one_step( model_, greedy( 1 ) );
        GenerationState first_state = one_step.begin( prompt );
        StepResult first = one_step.step( first_state );
        const int32_t eos = first.tokens[ 0 ];

        GenerationConfig config = greedy( 5 );
        config.withEosTokenId( eos );

        Rows output = run( config, prompt );

        ASSERT_EQ( output[ 0 ].size(), output[ 1 ].size() );
        for (size_t t = 3; t < output[ 0 ].size(); ++t)
        {
            EXPECT_EQ( output[ 0 ][ t ], eos ) << "position " << t;
        }

        if (first.tokens[ 1 ] == eos)
        {
            EXPECT_EQ( output[ 0 ].size(), 4u );
        }
        else
        {
            EXPECT_GT( output[ 0 ].size(), 4u );
        }
    }

    TEST_F( GeneratorTests, Step_AdvancesStateUntilFinished )
    {
        Generator generator( model_, greedy( 3 ) );
        GenerationState state = generator.begin( Rows{ { 9, 8 }, { 7, 6 } } );

        EXPECT_EQ( state.prompt_length, 2 );
        EXPECT_FALSE( state.isFinished() );

        for (int64_t i = 1; i <= 3; ++i)
        {
            StepResult result = generator.step( state );

            ASSERT_EQ( result.tokens.size(), 2u );
            EXPECT_EQ( state.steps, i );
            EXPECT_EQ( result.finished, i == 3 );
            EXPECT_EQ( state.sequences[ 0 ].back(), result.tokens[ 0 ] );
            EXPECT_EQ( state.sequences[ 1 ].back(), result.tokens[ 1 ] );
        }

        EXPECT_TRUE( state.isFinished() );
        EXPECT_THROW( generator.step( state ), std::runtime_error );
    }

    TEST_F( GeneratorTests, Step_MatchesGenerate )
    {
        const Rows prompt = { { 21, 22, 23 } };
        Generator generator( model_, greedy( 4 ) );

        GenerationState state = generator.begin( prompt );
        while (!state.isFinished())
        {
            generator.step( state );
        }

        EXPECT_EQ( state.sequences, generator.generate( prompt ) );
    }

    TEST_F( GeneratorTests, TensorPrompt_ReturnsExtendedTensor )
    {
        Generator::TokenTensor prompt( exec_context_->getDevice(), shape_t{ 2, 3 } );
        const int32_t ids[] = { 5, 7, 2, 11, 3, 90 };
        std::copy( std::begin( ids ), std::end( ids ), prompt.data() );

        Generator generator( model_, greedy( 4 ) );
        auto output = generator.generate( prompt );
        Rows expected = generator.generate( Rows{ { 5, 7, 2 }, { 11, 3, 90 } } );

        ASSERT_EQ( output.shape(), (shape_t{ 2, 7 }) );
        for (int64_t b = 0; b < 2; ++b)
        {
            for (int64_t t = 0; t < 7; ++t)
            {
                EXPECT_EQ( (output[ b, t ]), expected[ b ][ t ] );
            }
        }
    }

    TEST_F( GeneratorTests, Begin_RejectsBadPrompts )
    {
        Generator generator( model_, greedy( 1 ) );

        EXPECT_THROW( generator.begin( Rows{} ), std::invalid_argument );
        EXPECT_THROW( generator.begin( Rows{ {} } ), std::invalid_argument );
        EXPECT_THROW( generator.begin( Rows{ { 1, 2 }, { 3 } } ), std::invalid_argument );
        EXPECT_THROW( generator.begin( Rows{ { 1, static_cast<int32_t>(vocab_) } } ), std::out_of_range );
        EXPECT_THROW( generator.begin( Rows{ { -1 } } ), std::out_of_range );
    }
}
