#include <gtest/gtest.h>

#include <memory>
#include <stdexcept>
#include <utility>

#include "Dnn/Compute/ComputeDevice.h"
#include "Dnn/Tensors/Tensor.h"
#include "Dnn/Tensors/TensorInitializers.h"

namespace Dnn::Tensors::Tests
{
    using namespace Ember::Dnn;
    using namespace Ember::Dnn::Compute;

    class TensorTests : public ::testing::Test {
    protected:
        void SetUp() override {
            device_ = std::make_shared<CpuDevice>();
        }

        std::shared_ptr<ComputeDevice> device_;
    };

    TEST_F( TensorTests, Constructor_ZeroInitializes ) {
        CpuTensor<TensorDataType::FP32> tensor( device_, { 2, 3, 4 } );

        EXPECT_EQ( tensor.rank(), 3u );
        EXPECT_EQ( tensor.size(), 24u );
        EXPECT_EQ( tensor.shape(), ( shape_t{ 2, 3, 4 } ) );
        EXPECT_EQ( tensor.getDataTypeName(), "FP32" );

        for ( size_t i = 0; i < tensor.size(); ++i ) {
            EXPECT_EQ( tensor.data()[ i ], 0.0f );
        }
    }

    TEST_F( TensorTests, Constructor_ScalarShape ) {
        CpuTensor<TensorDataType::FP32> scalar( device_, shape_t{} );

        EXPECT_TRUE( scalar.isScalar() );
        EXPECT_EQ( scalar.size(), 1u );
        EXPECT_EQ( scalar.rank(), 0u );
    }

    TEST_F( TensorTests, Constructor_RejectsNegativeExtentAndNullDevice ) {
        EXPECT_THROW( ( CpuTensor<TensorDataType::FP32>( device_, { 2, -1 } ) ), std::invalid_argument );
        EXPECT_THROW( ( CpuTensor<TensorDataType::FP32>( nullptr, { 2 } ) ), std::invalid_argument );
    }

    TEST_F( TensorTests, Indexing_RowMajorAndBoundsChecked ) {
        CpuTensor<TensorDataType::INT32> tensor( device_, { 2, 3 } );
        tensor[ 1, 2 ] = 7;

        EXPECT_EQ( tensor.data()[ 5 ], 7 );
        EXPECT_THROW( ( tensor[ 2, 0 ] ), std::out_of_range );
        EXPECT_THROW( ( tensor[ 0 ] ), std::out_of_range );
    }

    TEST_F( TensorTests, Move_TransfersStorage ) {
        CpuTensor<TensorDataType::FP32> source( device_, { 4 } );
        source.fill( 2.5f );
        const float* storage = source.data();

        CpuTensor<TensorDataType::FP32> target( std::move( source ) );

        EXPECT_EQ( target.data(), storage );
        EXPECT_EQ( target.size(), 4u );
        EXPECT_EQ( source.size(), 0u );
    }

    TEST_F( TensorTests, Clone_IsDeepCopy ) {
        CpuTensor<TensorDataType::FP32> original( device_, { 3 } );
        original.fill( 1.0f );
        original.setName( "weights" );

        auto copy = original.clone();
        copy.data()[ 0 ] = 5.0f;

        EXPECT_EQ( original.data()[ 0 ], 1.0f );
        EXPECT_EQ( copy.getName(), "weights" );
        EXPECT_NE( copy.getUId(), original.getUId() );
    }

    TEST_F( TensorTests, Reshape_PreservesElementCount ) {
        CpuTensor<TensorDataType::FP32> tensor( device_, { 2, 6 } );

        tensor.reshape( { 3, 4 } );
        EXPECT_EQ( tensor.shape(), ( shape_t{ 3, 4 } ) );
        EXPECT_THROW( tensor.reshape( { 5 } ), std::invalid_argument );
    }

    TEST_F( TensorTests, Normal_ReproducibleForSameGenerator ) {
        CpuTensor<TensorDataType::FP32> a( device_, { 64 } );
        CpuTensor<TensorDataType::FP32> b( device_, { 64 } );

        std::mt19937 gen_a( 11 );
        std::mt19937 gen_b( 11 );
        normal( a, 0.0f, 0.02f, gen_a );
        normal( b, 0.0f, 0.02f, gen_b );

        for ( size_t i = 0; i < a.size(); ++i ) {
            EXPECT_EQ( a.data()[ i ], b.data()[ i ] );
        }
    }

    TEST_F( TensorTests, Normal_ZeroStddevFillsMean ) {
        CpuTensor<TensorDataType::FP32> tensor( device_, { 8 } );
        std::mt19937 gen( 1 );

        normal( tensor, 0.5f, 0.0f, gen );

        for ( size_t i = 0; i < tensor.size(); ++i ) {
            EXPECT_EQ( tensor.data()[ i ], 0.5f );
        }
        EXPECT_THROW( normal( tensor, 0.0f, -1.0f, gen ), std::invalid_argument );
    }
}
