#include <gtest/gtest.h>

#include <stdexcept>

#include "Dnn/Common/CausalMask.h"

namespace Dnn::Common::Tests
{
    using namespace Ember::Dnn;

    TEST( CausalMaskTests, LowerTriangular ) {
        CausalMask mask( 5 );

        EXPECT_EQ( mask.maxSequenceLength(), 5 );
        for ( int64_t i = 0; i < 5; ++i ) {
            for ( int64_t j = 0; j < 5; ++j ) {
                EXPECT_EQ( mask.isAllowed( i, j ), j <= i ) << "i=" << i << " j=" << j;
            }
        }
    }

    TEST( CausalMaskTests, RowMatchesIsAllowed ) {
        CausalMask mask( 4 );
        const uint8_t* row = mask.row( 2 );

        EXPECT_EQ( row[ 0 ], 1 );
        EXPECT_EQ( row[ 2 ], 1 );
        EXPECT_EQ( row[ 3 ], 0 );
    }

    TEST( CausalMaskTests, RejectsNonPositiveLength ) {
        EXPECT_THROW( CausalMask( 0 ), std::invalid_argument );
        EXPECT_THROW( CausalMask( -3 ), std::invalid_argument );
    }
}
