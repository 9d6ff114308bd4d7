/**
 * @file AttentionConfig.h
 * @brief Configuration for causal multi-head self-attention.
 */

#ifndef EMBER_DNN_ATTENTION_CONFIG_H_
#define EMBER_DNN_ATTENTION_CONFIG_H_

#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

#include "../../Common/CausalMask.h"
#include "../../Common/ComponentConfig.h"
#include "../../Common/RotaryEmbedding.h"
#include "../../Tensors/TensorDataType.h"

namespace Ember::Dnn
{
    /**
     * @brief Configuration for the CausalSelfAttention component and CpuAttentionOp.
     *
     * The attention operation consumes the concatenated [Q | K | V] projection
     * of shape (B, T, 3 * embedding_dim) and produces (B, T, embedding_dim).
     * Its causal mask is sized for max_sequence_length once, at construction.
     * A rotary embedding, when set, rotates Q and K by position before scoring.
     */
    class AttentionConfig : public ComponentConfigBase<AttentionConfig>
    {
    public:
        AttentionConfig( dim_t embedding_dim, dim_t num_heads )
            : embedding_dim_( embedding_dim ), num_heads_( num_heads )
        {
            name_ = "attn";
        }

        AttentionConfig& withMaxSequenceLength( dim_t max_seq_len )
        {
            max_seq_len_ = max_seq_len;
            return *this;
        }

        /**
         * @brief Dropout rate applied to attention weights and to the projected output in training mode.
         */
        AttentionConfig& withDropout( float dropout )
        {
            dropout_ = dropout;
            return *this;
        }

        /**
         * @brief Share an existing mask instead of building one per layer.
         *
         * The mask must cover at least the configured maximum sequence length.
         */
        AttentionConfig& withCausalMask( std::shared_ptr<const CausalMask> mask )
        {
            causal_mask_ = std::move( mask );
            return *this;
        }

        /**
         * @brief Rotate queries and keys with a shared cos/sin cache.
         *
         * The cache head width must equal embedding_dim / num_heads.
         */
        AttentionConfig& withRotaryEmbedding( std::shared_ptr<const RotaryEmbedding> rotary )
        {
            rotary_ = std::move( rotary );
            return *this;
        }

        dim_t getEmbeddingDim() const { return embedding_dim_; }
        dim_t getNumHeads() const { return num_heads_; }
        dim_t getHeadDim() const { return embedding_dim_ / num_heads_; }
        dim_t getMaxSequenceLength() const { return max_seq_len_; }
        float getDropout() const { return dropout_; }
        const std::shared_ptr<const CausalMask>& getCausalMask() const { return causal_mask_; }
        const std::shared_ptr<const RotaryEmbedding>& getRotaryEmbedding() const { return rotary_; }

        void validate() const override
        {
            ComponentConfig::validate();

            if (embedding_dim_ <= 0)
            {
                throw std::invalid_argument( "AttentionConfig: embedding dimension must be greater than zero" );
            }

            if (num_heads_ <= 0)
            {
                throw std::invalid_argument( "AttentionConfig: number of heads must be greater than zero" );
            }

            if (embedding_dim_ % num_heads_ != 0)
            {
                throw std::invalid_argument( "AttentionConfig: embedding dimension must be divisible by number of heads" );
            }

            if (max_seq_len_ <= 0)
            {
                throw std::invalid_argument( "AttentionConfig: maximum sequence length must be greater than zero" );
            }

            if (!(dropout_ >= 0.0f && dropout_ < 1.0f))
            {
                throw std::invalid_argument( "AttentionConfig: dropout must be in [0, 1)" );
            }

            if (causal_mask_ && causal_mask_->maxSequenceLength() < max_seq_len_)
            {
                throw std::invalid_argument( "AttentionConfig: causal mask is shorter than the maximum sequence length" );
            }

            if (rotary_ && rotary_->headDim() != getHeadDim())
            {
                throw std::invalid_argument( "AttentionConfig: rotary embedding head dimension does not match the attention head dimension" );
            }
        }

        std::string toString() const override
        {
            std::ostringstream oss;
            oss << "AttentionConfig(embedding_dim=" << embedding_dim_
                << ", num_heads=" << num_heads_
                << ", max_sequence_length=" << max_seq_len_
                << ", dropout=" << dropout_
                << ", rotary=" << (rotary_ ? "true" : "false") << ")";
            return oss.str();
        }

    private:
        dim_t embedding_dim_;
        dim_t num_heads_;
        dim_t max_seq_len_{ 1024 };
        float dropout_{ 0.0f };
        std::shared_ptr<const CausalMask> causal_mask_;
        std::shared_ptr<const RotaryEmbedding> rotary_;
    };
}

#endif
