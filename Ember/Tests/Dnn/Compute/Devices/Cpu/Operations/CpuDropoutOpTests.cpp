/**
 * @file CpuDropoutOpTests.cpp
 * @brief Test suite for the CPU inverted dropout operation.
 */

#include <gtest/gtest.h>

#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>

#include "../../../../Common.h"
#include "Dnn/Compute/Devices/Cpu/Operations/CpuDropoutOp.h"
#include "Dnn/Compute/ExecutionContext.h"

namespace Compute::Cpu::Operations::Tests
{
    using namespace Ember::Dnn;
    using namespace Ember::Dnn::Compute;
    using ::Dnn::Tests::fillUniform;

    class CpuDropoutOpTests : public ::testing::Test {
    protected:
        using TensorType = CpuTensor<TensorDataType::FP32>;

        void SetUp() override {
            context_ = std::make_shared<CpuExecutionContext>();
        }

        std::shared_ptr<CpuDropoutOp> createOp( float p, const std::string& name = "dropout_test" ) {
            DropoutConfig config( p );
            config.withName( name );
            return std::make_shared<CpuDropoutOp>( context_, config );
        }

        std::shared_ptr<CpuExecutionContext> context_;
    };

    TEST_F( CpuDropoutOpTests, Inference_IsIdentity ) {
        auto device = context_->getDevice();
        TensorType input( device, { 4, 64 } );
        TensorType output( device, { 4, 64 } );
        fillUniform( input, -1.0f, 1.0f, 51 );

        auto op = createOp( 0.5f );
        op->forward( input, output );

        for ( size_t i = 0; i < input.size(); ++i ) {
            EXPECT_EQ( output.data()[ i ], input.data()[ i ] );
        }
    }

    TEST_F( CpuDropoutOpTests, Training_ZeroProbability_IsIdentity ) {
        auto device = context_->getDevice();
        TensorType input( device, { 128 } );
        TensorType output( device, { 128 } );
        fillUniform( input, -1.0f, 1.0f, 52 );

        auto op = createOp( 0.0f );
        op->setTraining( true );
        op->forward( input, output );

        for ( size_t i = 0; i < input.size(); ++i ) {
            EXPECT_EQ( output.data()[ i ], input.data()[ i ] );
        }
    }

    TEST_F( CpuDropoutOpTests, Training_ZeroesOrScalesEachElement ) {
        auto device = context_->getDevice();
        TensorType input( device, { 4096 } );
        TensorType output( device, { 4096 } );
        input.fill( 1.0f );

        const float p = 0.25f;
        auto op = createOp( p );
        op->setTraining( true );
        op->forward( input, output );

        int64_t dropped = 0;
        for ( size_t i = 0; i < output.size(); ++i ) {
            const float v = output.data()[ i ];
            if ( v == 0.0f ) {
                ++dropped;
            }
            else {
                EXPECT_FLOAT_EQ( v, 1.0f / (1.0f - p) );
            }
        }

        const double rate = static_cast<double>(dropped) / static_cast<double>(output.size());
        EXPECT_NEAR( rate, p, 0.05 );
    }

    TEST_F( CpuDropoutOpTests, Training_DifferentNames_UseDifferentMasks ) {
        auto device = context_->getDevice();
        TensorType input( device, { 256 } );
        TensorType first( device, { 256 } );
        TensorType second( device, { 256 } );
        input.fill( 1.0f );

        auto a = createOp( 0.5f, "blocks.0.drop" );
        auto b = createOp( 0.5f, "blocks.1.drop" );
        a->setTraining( true );
        b->setTraining( true );
        a->forward( input, first );
        b->forward( input, second );

        int64_t differing = 0;
        for ( size_t i = 0; i < input.size(); ++i ) {
            if ( first.data()[ i ] != second.data()[ i ] ) ++differing;
        }
        EXPECT_GT( differing, 0 );
    }

    TEST_F( CpuDropoutOpTests, Config_ProbabilityOutOfRange_Throws ) {
        EXPECT_THROW( createOp( 1.0f ), std::invalid_argument );
        EXPECT_THROW( createOp( -0.1f ), std::invalid_argument );
    }
}
