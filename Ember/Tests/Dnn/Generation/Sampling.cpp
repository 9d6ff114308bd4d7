#include <gtest/gtest.h>

#include <cmath>
#include <cstdint>
#include <limits>
#include <random>
#include <stdexcept>
#include <vector>

#include "Dnn/Common/Errors.h"
#include "Dnn/Generation/Sampling.h"

namespace Dnn::Generation::Tests
{
    using namespace Ember::Dnn;

    class SamplingTests : public ::testing::Test
    {
    protected:
        static constexpr float kNegInf = -std::numeric_limits<float>::infinity();

        static std::vector<float> logitsOf( const std::vector<double>& probabilities )
        {
            std::vector<float> logits;
            for (double p : probabilities)
            {
                logits.push_back( static_cast<float>(std::log( p )) );
            }
            return logits;
        }
    };

    TEST_F( SamplingTests, Temperature_DividesLogits )
    {
        std::vector<float> logits = { 2.0f, -1.0f, 0.5f };

        applyTemperature( logits, 0.5f );

        EXPECT_FLOAT_EQ( logits[ 0 ], 4.0f );
        EXPECT_FLOAT_EQ( logits[ 1 ], -2.0f );
        EXPECT_FLOAT_EQ( logits[ 2 ], 1.0f );
    }

    TEST_F( SamplingTests, Temperature_NonPositive_Throws )
    {
        std::vector<float> logits = { 1.0f, 2.0f };

        EXPECT_THROW( applyTemperature( logits, 0.0f ), std::invalid_argument );
        EXPECT_THROW( applyTemperature( logits, -1.0f ), std::invalid_argument );
        EXPECT_THROW( applyTemperature( logits, std::numeric_limits<float>::infinity() ), std::invalid_argument );
    }

    TEST_F( SamplingTests, TopK_KeepsLargestAndTies )
    {
        std::vector<float> logits = { 1.0f, 3.0f, 2.0f, 2.0f, 0.0f };

        applyTopK( logits, 2 );

        EXPECT_EQ( logits[ 0 ], kNegInf );
        EXPECT_FLOAT_EQ( logits[ 1 ], 3.0f );
        EXPECT_FLOAT_EQ( logits[ 2 ], 2.0f );
        EXPECT_FLOAT_EQ( logits[ 3 ], 2.0f );
        EXPECT_EQ( logits[ 4 ], kNegInf );
    }

    TEST_F( SamplingTests, TopK_LargerThanRow_IsNoOp )
    {
        std::vector<float> logits = { 0.3f, -0.2f, 1.5f };
        const std::vector<float> original = logits;

        applyTopK( logits, 10 );

        EXPECT_EQ( logits, original );
    }

    TEST_F( SamplingTests, TopK_BelowOne_Throws )
    {
        std::vector<float> logits = { 1.0f };
        EXPECT_THROW( applyTopK( logits, 0 ), std::invalid_argument );
    }

    TEST_F( SamplingTests, TopP_RemovesTailBeyondMass )
    {
        auto logits = logitsOf( { 0.2, 0.5, 0.3 } );

        applyTopP( logits, 0.6f );

        EXPECT_EQ( logits[ 0 ], kNegInf );
        EXPECT_TRUE( std::isfinite( logits[ 1 ] ) );
        EXPECT_TRUE( std::isfinite( logits[ 2 ] ) );
    }

    TEST_F( SamplingTests, TopP_TinyMass_KeepsTopToken )
    {
        auto logits = logitsOf( { 0.25, 0.4, 0.35 } );

        applyTopP( logits, 1e-6f );

        EXPECT_EQ( logits[ 0 ], kNegInf );
        EXPECT_TRUE( std::isfinite( logits[ 1 ] ) );
        EXPECT_EQ( logits[ 2 ], kNegInf );
    }

    TEST_F( SamplingTests, TopP_One_KeepsEverything )
    {
        auto logits = logitsOf( { 0.7, 0.2, 0.1 } );
        const auto original = logits;

        applyTopP( logits, 1.0f );

        EXPECT_EQ( logits, original );
    }

    TEST_F( SamplingTests, TopP_OutOfRange_Throws )
    {
        std::vector<float> logits = { 1.0f, 2.0f };

        EXPECT_THROW( applyTopP( logits, 0.0f ), std::invalid_argument );
        EXPECT_THROW( applyTopP( logits, 1.5f ), std::invalid_argument );
    }

    TEST_F( SamplingTests, Softmax_SumsToOne )
    {
        std::vector<float> logits = { 1.0f, 2.0f, kNegInf, 0.5f };

        auto probs = softmax( logits );

        ASSERT_EQ( probs.size(), 4u );
        EXPECT_EQ( probs[ 2 ], 0.0f );
        EXPECT_NEAR( probs[ 0 ] + probs[ 1 ] + probs[ 2 ] + probs[ 3 ], 1.0f, 1e-6f );
        EXPECT_NEAR( probs[ 1 ] / probs[ 0 ], std::exp( 1.0f ), 1e-4f );
    }

    TEST_F( SamplingTests, Softmax_LargeLogits_StayFinite )
    {
        std::vector<float> logits = { 1000.0f, 999.0f };

        auto probs = softmax( logits );

        EXPECT_TRUE( std::isfinite( probs[ 0 ] ) );
        EXPECT_NEAR( probs[ 0 ] + probs[ 1 ], 1.0f, 1e-6f );
    }

    TEST_F( SamplingTests, Softmax_InvalidRows_Throw )
    {
        std::vector<float> with_nan = { 1.0f, std::numeric_limits<float>::quiet_NaN() };
        std::vector<float> with_inf = { 1.0f, std::numeric_limits<float>::infinity() };
        std::vector<float> all_filtered = { kNegInf, kNegInf };

        EXPECT_THROW( softmax( with_nan ), NumericalError );
        EXPECT_THROW( softmax( with_inf ), NumericalError );
        EXPECT_THROW( softmax( all_filtered ), NumericalError );
    }

    TEST_F( SamplingTests, Argmax_LowestIndexWinsTies )
    {
        std::vector<float> values = { 0.1f, 0.7f, 0.2f, 0.7f };
        EXPECT_EQ( argmax( values ), 1 );

        std::vector<float> empty;
        EXPECT_THROW( argmax( empty ), std::invalid_argument );
    }

    TEST_F( SamplingTests, Sample_SeededIsReproducible )
    {
        std::vector<float> probs = { 0.1f, 0.2f, 0.3f, 0.4f };
        std::mt19937 first( 7 );
        std::mt19937 second( 7 );

        for (int i = 0; i < 50; ++i)
        {
            EXPECT_EQ( sample( probs, first ), sample( probs, second ) );
        }
    }

    TEST_F( SamplingTests, Sample_NeverDrawsZeroProbability )
    {
        std::vector<float> probs = { 0.0f, 2.0f, 0.0f, 1.0f };
        std::mt19937 generator( 11 );

        int counts[ 4 ] = {};
        for (int i = 0; i < 3000; ++i)
        {
            ++counts[ sample( probs, generator ) ];
        }

        EXPECT_EQ( counts[ 0 ], 0 );
        EXPECT_EQ( counts[ 2 ], 0 );
        // Unnormalized weights 2:1
        EXPECT_NEAR( counts[ 1 ] / 3000.0, 2.0 / 3.0, 0.05 );
    }

    TEST_F( SamplingTests, Sample_InvalidDistribution_Throws )
    {
        std::mt19937 generator( 1 );
        std::vector<float> zero_mass = { 0.0f, 0.0f };
        std::vector<float> negative = { 0.5f, -0.1f };
        std::vector<float> non_finite = { 0.5f, std::numeric_limits<float>::quiet_NaN() };

        EXPECT_THROW( sample( zero_mass, generator ), NumericalError );
        EXPECT_THROW( sample( negative, generator ), NumericalError );
        EXPECT_THROW( sample( non_finite, generator ), NumericalError );
    }
}
