/**
 * @file CausalMask.h
 * @brief Immutable lower-triangular attention mask.
 */

#ifndef EMBER_DNN_CAUSAL_MASK_H_
#define EMBER_DNN_CAUSAL_MASK_H_

#include <cstdint>
#include <stdexcept>
#include <vector>

namespace Ember::Dnn
{
    /**
     * @brief Lower-triangular indicator of size max_seq_len x max_seq_len.
     *
     * Position i may attend to position j iff j <= i. The buffer is filled once
     * in the constructor and never modified, so a single instance is shared
     * read-only by every attention layer of a model. A forward pass over T
     * tokens reads the leading T x T block.
     */
    class CausalMask
    {
    public:
        explicit CausalMask( int64_t max_seq_len )
            : max_seq_len_( max_seq_len )
        {
            if (max_seq_len <= 0)
            {
                throw std::invalid_argument( "CausalMask: maximum sequence length must be greater than zero" );
            }

            mask_.assign( static_cast<size_t>(max_seq_len * max_seq_len), 0 );
            for (int64_t i = 0; i < max_seq_len; ++i)
            {
                for (int64_t j = 0; j <= i; ++j)
                {
                    mask_[ static_cast<size_t>(i * max_seq_len + j) ] = 1;
                }
            }
        }

        int64_t maxSequenceLength() const noexcept
        {
            return max_seq_len_;
        }

        bool isAllowed( int64_t i, int64_t j ) const
        {
            return mask_[ static_cast<size_t>(i * max_seq_len_ + j) ] != 0;
        }

        /**
         * @brief Row i of the mask, max_seq_len entries.
         */
        const uint8_t* row( int64_t i ) const
        {
            return mask_.data() + i * max_seq_len_;
        }

    private:
        int64_t max_seq_len_;
        std::vector<uint8_t> mask_;
    };
}

#endif
