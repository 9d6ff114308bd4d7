#include <gtest/gtest.h>

#include <cmath>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>

#include "../../Common.h"
#include "Dnn/Components/Losses/SoftmaxCrossEntropy.h"

namespace Components::Losses::Tests
{
    using namespace Ember::Dnn;
    using namespace Ember::Dnn::Compute;
    using ::Dnn::Tests::fillUniform;

    class SoftmaxCrossEntropyCpuTests : public ::testing::Test
    {
    protected:
        using TensorType = CpuTensor<TensorDataType::FP32>;
        using TokenTensor = CpuTensor<TensorDataType::INT32>;
        using LossType = SoftmaxCrossEntropy<DeviceType::Cpu, TensorDataType::FP32>;

        void SetUp() override
        {
            exec_context_ = std::make_shared<CpuExecutionContext>();
            loss_ = std::make_shared<LossType>( exec_context_, CrossEntropyConfig( vocab_ ) );
            loss_->build( { 2, 4, vocab_ } );
        }

        const int64_t vocab_ = 6;

        std::shared_ptr<CpuExecutionContext> exec_context_;
        std::shared_ptr<LossType> loss_;
    };

    TEST_F( SoftmaxCrossEntropyCpuTests, HasNoParameters )
    {
        EXPECT_TRUE( loss_->getNamedParameters().empty() );
        EXPECT_NE( loss_->toString().find( "ignore_index=-100" ), std::string::npos );
    }

    TEST_F( SoftmaxCrossEntropyCpuTests, Forward_ConfidentCorrectPrediction_IsNearZero )
    {
        auto device = exec_context_->getDevice();
        TensorType logits( device, { 1, 2, vocab_ } );
        TokenTensor targets( device, { 1, 2 } );
        logits.fill( -10.0f );
        logits[ 0, 0, 2 ] = 10.0f;
        logits[ 0, 1, 4 ] = 10.0f;
        targets.data()[ 0 ] = 2;
        targets.data()[ 1 ] = 4;

        const float loss = loss_->forward( logits, targets );

        EXPECT_GE( loss, 0.0f );
        EXPECT_LT( loss, 1e-6f );
    }

    TEST_F( SoftmaxCrossEntropyCpuTests, Forward_IgnoredPositionsDoNotCount )
    {
        auto device = exec_context_->getDevice();
        TensorType logits( device, { 1, 3, vocab_ } );
        TokenTensor targets( device, { 1, 3 } );
        fillUniform( logits, -1.0f, 1.0f, 701 );
        targets.data()[ 0 ] = 1;
        targets.data()[ 1 ] = kIgnoreIndex;
        targets.data()[ 2 ] = kIgnoreIndex;

        const float with_ignored = loss_->forward( logits, targets );

        double sum = 0.0;
        for (int64_t v = 0; v < vocab_; ++v) sum += std::exp( static_cast<double>(logits.data()[ v ]) );
        const double expected = std::log( sum ) - logits.data()[ 1 ];

        EXPECT_NEAR( with_ignored, expected, 1e-5 );
    }

    TEST_F( SoftmaxCrossEntropyCpuTests, Forward_NothingToScore_IsNaN )
    {
        auto device = exec_context_->getDevice();
        TensorType logits( device, { 1, 1, vocab_ } );
        TokenTensor targets( device, { 1, 1 } );
        targets.fill( kIgnoreIndex );

        EXPECT_TRUE( std::isnan( loss_->forward( logits, targets ) ) );
    }

    TEST_F( SoftmaxCrossEntropyCpuTests, Forward_CustomIgnoreIndex )
    {
        CrossEntropyConfig config( vocab_ );
        config.withIgnoreIndex( 0 );
        LossType loss( exec_context_, config );
        loss.build( { 1, 2, vocab_ } );

        auto device = exec_context_->getDevice();
        TensorType logits( device, { 1, 2, vocab_ } );
        TokenTensor targets( device, { 1, 2 } );
        targets.fill( 0 );

        EXPECT_TRUE( std::isnan( loss.forward( logits, targets ) ) );
    }

    TEST_F( SoftmaxCrossEntropyCpuTests, Forward_BeforeBuild_Throws )
    {
        LossType unbuilt( exec_context_, CrossEntropyConfig( vocab_ ) );
        auto device = exec_context_->getDevice();
        TensorType logits( device, { 1, 1, vocab_ } );
        TokenTensor targets( device, { 1, 1 } );

        EXPECT_THROW( unbuilt.forward( logits, targets ), std::runtime_error );
    }
}
