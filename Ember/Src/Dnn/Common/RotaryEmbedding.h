/**
 * @file RotaryEmbedding.h
 * @brief Immutable cos/sin cache for rotary position embeddings.
 */

#ifndef EMBER_DNN_ROTARY_EMBEDDING_H_
#define EMBER_DNN_ROTARY_EMBEDDING_H_

#include <cmath>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <vector>

namespace Ember::Dnn
{
    /**
     * @brief Rotary position embedding tables for one head width.
     *
     * For position t and frequency index i < head_dim / 2 the angle is
     * t * base^(-2i / head_dim). Rows hold cos and sin of the angles repeated
     * over both halves of the head, so rotating a head vector x is
     *
     *   x' = x * cos + rotate_half(x) * sin,  rotate_half(x) = [-x2, x1]
     *
     * The tables are filled once in the constructor and never modified. A
     * longer sequence is served by a new instance from extend(), so callers
     * holding the old one keep a consistent view.
     */
    class RotaryEmbedding
    {
    public:
        RotaryEmbedding( int64_t head_dim, int64_t max_seq_len, double base = 10000.0 )
            : head_dim_( head_dim ), max_seq_len_( max_seq_len ), base_( base )
        {
            if (head_dim <= 0 || head_dim % 2 != 0)
            {
                throw std::invalid_argument( "RotaryEmbedding: head dimension must be a positive even number" );
            }

            if (max_seq_len <= 0)
            {
                throw std::invalid_argument( "RotaryEmbedding: maximum sequence length must be greater than zero" );
            }

            if (!(base > 1.0) || !std::isfinite( base ))
            {
                throw std::invalid_argument( "RotaryEmbedding: base must be finite and greater than one" );
            }

            const int64_t half = head_dim / 2;
            cos_.resize( static_cast<size_t>(max_seq_len * head_dim) );
            sin_.resize( cos_.size() );

            for (int64_t t = 0; t < max_seq_len; ++t)
            {
                for (int64_t i = 0; i < half; ++i)
                {
                    const double inv_freq = 1.0 / std::pow( base, static_cast<double>(2 * i) / static_cast<double>(head_dim) );
                    const double angle = static_cast<double>(t) * inv_freq;
                    const auto c = static_cast<float>(std::cos( angle ));
                    const auto s = static_cast<float>(std::sin( angle ));

                    cos_[ static_cast<size_t>(t * head_dim + i) ] = c;
                    cos_[ static_cast<size_t>(t * head_dim + i + half) ] = c;
                    sin_[ static_cast<size_t>(t * head_dim + i) ] = s;
                    sin_[ static_cast<size_t>(t * head_dim + i + half) ] = s;
                }
            }
        }

        /**
         * @brief A cache covering at least seq_len positions.
         *
         * Returns the given cache when it is long enough, otherwise a new one
         * built for seq_len with the same head width and base.
         */
        static std::shared_ptr<const RotaryEmbedding> extend( std::shared_ptr<const RotaryEmbedding> cache, int64_t seq_len )
        {
            if (!cache)
            {
                throw std::invalid_argument( "RotaryEmbedding::extend - cache cannot be null" );
            }

            if (seq_len <= cache->maxSequenceLength())
            {
                return cache;
            }

            return std::make_shared<const RotaryEmbedding>( cache->headDim(), seq_len, cache->base() );
        }

        int64_t headDim() const noexcept { return head_dim_; }
        int64_t maxSequenceLength() const noexcept { return max_seq_len_; }
        double base() const noexcept { return base_; }

        const float* cosRow( int64_t position ) const
        {
            return cos_.data() + position * head_dim_;
        }

        const float* sinRow( int64_t position ) const
        {
            return sin_.data() + position * head_dim_;
        }

        /**
         * @brief Rotate one head vector of head_dim values in place.
         */
        void rotate( float* x, int64_t position ) const
        {
            if (position < 0 || position >= max_seq_len_)
            {
                throw std::out_of_range( "RotaryEmbedding::rotate - position outside the cache" );
            }

            const int64_t half = head_dim_ / 2;
            const float* c = cosRow( position );
            const float* s = sinRow( position );

            for (int64_t i = 0; i < half; ++i)
            {
                const float x1 = x[ i ];
                const float x2 = x[ i + half ];
                x[ i ] = x1 * c[ i ] - x2 * s[ i ];
                x[ i + half ] = x2 * c[ i + half ] + x1 * s[ i + half ];
            }
        }

    private:
        int64_t head_dim_;
        int64_t max_seq_len_;
        double base_;
        std::vector<float> cos_;
        std::vector<float> sin_;
    };
}

#endif
