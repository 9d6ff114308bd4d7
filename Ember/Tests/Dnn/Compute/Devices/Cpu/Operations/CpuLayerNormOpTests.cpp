/**
 * @file CpuLayerNormOpTests.cpp
 * @brief Test suite for the CPU LayerNorm operation.
 */

#include <gtest/gtest.h>

#include <cmath>
#include <cstdint>
#include <memory>
#include <stdexcept>

#include "../../../../Common.h"
#include "Dnn/Compute/Devices/Cpu/Operations/CpuLayerNormOp.h"
#include "Dnn/Compute/ExecutionContext.h"

namespace Compute::Cpu::Operations::Tests
{
    using namespace Ember::Dnn;
    using namespace Ember::Dnn::Compute;
    using ::Dnn::Tests::fillUniform;
    using ::Dnn::Tests::hasNaNorInf;

    class CpuLayerNormOpTests : public ::testing::Test {
    protected:
        using TensorType = CpuTensor<TensorDataType::FP32>;

        void SetUp() override {
            cpu_context_ = std::make_shared<CpuExecutionContext>();

            small_shape_ = { 2, 3, 4 };
            medium_shape_ = { 8, 16, 32 };
        }

        std::shared_ptr<CpuLayerNormOp> createLayerNormOp( int64_t feature_dim, float epsilon = 1e-5f ) {
            LayerNormConfig config( feature_dim );
            config.withEpsilon( epsilon ).withName( "ln_test" );
            return std::make_shared<CpuLayerNormOp>( cpu_context_, config );
        }

        void layerNormReference( const TensorType& input, const TensorType& weight, const TensorType& bias,
            float epsilon, TensorType& output ) {
            const int64_t C = input.shape().back();
            const int64_t rows = static_cast<int64_t>(input.size()) / C;

            for ( int64_t r = 0; r < rows; ++r ) {
                const float* x = input.data() + r * C;

                double mean = 0.0;
                for ( int64_t i = 0; i < C; ++i ) mean += x[ i ];
                mean /= C;

                double variance = 0.0;
                for ( int64_t i = 0; i < C; ++i ) variance += (x[ i ] - mean) * (x[ i ] - mean);
                variance /= C;

                const double rstd = 1.0 / std::sqrt( variance + epsilon );
                for ( int64_t i = 0; i < C; ++i ) {
                    output.data()[ r * C + i ] = static_cast<float>(
                        (x[ i ] - mean) * rstd * weight.data()[ i ] + bias.data()[ i ] );
                }
            }
        }

        void runAndCompare( const shape_t& shape ) {
            auto device = cpu_context_->getDevice();
            const int64_t C = shape.back();

            TensorType input( device, shape );
            TensorType weight( device, { C } );
            TensorType bias( device, { C } );
            TensorType output( device, shape );
            TensorType expected( device, shape );

            fillUniform( input, -2.0f, 2.0f, 10 );
            fillUniform( weight, 0.5f, 1.5f, 11 );
            fillUniform( bias, -0.2f, 0.2f, 12 );

            auto op = createLayerNormOp( C );
            op->setParameters( &weight, &bias );
            op->build( shape );
            op->forward( input, output );

            layerNormReference( input, weight, bias, 1e-5f, expected );

            EXPECT_FALSE( hasNaNorInf( output ) );
            for ( size_t i = 0; i < output.size(); ++i ) {
                EXPECT_NEAR( output.data()[ i ], expected.data()[ i ], 1e-4f ) << "at index " << i;
            }
        }

        std::shared_ptr<CpuExecutionContext> cpu_context_;
        shape_t small_shape_;
        shape_t medium_shape_;
    };

    TEST_F( CpuLayerNormOpTests, Forward_Small_MatchesReference ) {
        runAndCompare( small_shape_ );
    }

    TEST_F( CpuLayerNormOpTests, Forward_Medium_MatchesReference ) {
        runAndCompare( medium_shape_ );
    }

    TEST_F( CpuLayerNormOpTests, Forward_UnitWeightZeroBias_NormalizesRows ) {
        auto device = cpu_context_->getDevice();
        TensorType input( device, small_shape_ );
        TensorType weight( device, { 4 } );
        TensorType bias( device, { 4 } );
        TensorType output( device, small_shape_ );
        weight.fill( 1.0f );
        fillUniform( input, -3.0f, 3.0f, 21 );

        auto op = createLayerNormOp( 4 );
        op->setParameters( &weight, &bias );
        op->build( small_shape_ );
        op->forward( input, output );

        for ( int64_t r = 0; r < 6; ++r ) {
            double mean = 0.0;
            double sq = 0.0;
            for ( int64_t i = 0; i < 4; ++i ) {
                mean += output.data()[ r * 4 + i ];
                sq += output.data()[ r * 4 + i ] * output.data()[ r * 4 + i ];
            }
            EXPECT_NEAR( mean / 4.0, 0.0, 1e-5 );
            EXPECT_NEAR( sq / 4.0, 1.0, 1e-3 );
        }
    }

    TEST_F( CpuLayerNormOpTests, Forward_ConstantRow_IsFinite ) {
        auto device = cpu_context_->getDevice();
        TensorType input( device, { 1, 1, 8 } );
        TensorType weight( device, { 8 } );
        TensorType bias( device, { 8 } );
        TensorType output( device, { 1, 1, 8 } );
        input.fill( 3.0f );
        weight.fill( 1.0f );

        auto op = createLayerNormOp( 8 );
        op->setParameters( &weight, &bias );
        op->build( { 1, 1, 8 } );
        op->forward( input, output );

        EXPECT_FALSE( hasNaNorInf( output ) );
        for ( size_t i = 0; i < output.size(); ++i ) {
            EXPECT_NEAR( output.data()[ i ], 0.0f, 1e-6f );
        }
    }

    TEST_F( CpuLayerNormOpTests, SetParameters_WrongWeightSize_Throws ) {
        auto device = cpu_context_->getDevice();
        TensorType weight( device, { 5 } );
        TensorType bias( device, { 4 } );

        auto op = createLayerNormOp( 4 );
        EXPECT_THROW( op->setParameters( &weight, &bias ), std::invalid_argument );
    }

    TEST_F( CpuLayerNormOpTests, Build_TrailingDimensionMismatch_Throws ) {
        auto device = cpu_context_->getDevice();
        TensorType weight( device, { 4 } );
        TensorType bias( device, { 4 } );

        auto op = createLayerNormOp( 4 );
        op->setParameters( &weight, &bias );
        EXPECT_THROW( op->build( { 2, 3, 5 } ), std::invalid_argument );
    }

    TEST_F( CpuLayerNormOpTests, Config_RejectsNonPositiveEpsilon ) {
        EXPECT_THROW( createLayerNormOp( 4, 0.0f ), std::invalid_argument );
    }
}
