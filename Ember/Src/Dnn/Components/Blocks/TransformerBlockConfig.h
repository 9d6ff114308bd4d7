/**
 * @file TransformerBlockConfig.h
 * @brief Configuration for a pre-normalization transformer block.
 */

#ifndef EMBER_DNN_TRANSFORMER_BLOCK_CONFIG_H_
#define EMBER_DNN_TRANSFORMER_BLOCK_CONFIG_H_

#include <cmath>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

#include "../../Common/ActivationType.h"
#include "../../Common/CausalMask.h"
#include "../../Common/ComponentConfig.h"
#include "../../Common/RotaryEmbedding.h"
#include "../../Tensors/TensorDataType.h"

namespace Ember::Dnn
{
    /**
     * @brief Configuration for TransformerBlock.
     *
     * The block computes
     *   x = x + Attn( LN1( x ) )
     *   x = x + FF( LN2( x ) )
     * where the attention path uses the attention dropout rate and the
     * feed-forward path uses the residual dropout rate.
     */
    class TransformerBlockConfig : public ComponentConfigBase<TransformerBlockConfig>
    {
    public:
        TransformerBlockConfig( dim_t embedding_dim, dim_t num_heads )
            : embedding_dim_( embedding_dim ), num_heads_( num_heads ), hidden_dim_( 4 * embedding_dim )
        {
            name_ = "block";
        }

        TransformerBlockConfig& withHiddenDimension( dim_t hidden_dim )
        {
            hidden_dim_ = hidden_dim;
            return *this;
        }

        TransformerBlockConfig& withMaxSequenceLength( dim_t max_seq_len )
        {
            max_seq_len_ = max_seq_len;
            return *this;
        }

        TransformerBlockConfig& withDropout( float dropout )
        {
            dropout_ = dropout;
            return *this;
        }

        TransformerBlockConfig& withAttentionDropout( float dropout )
        {
            attention_dropout_ = dropout;
            return *this;
        }

        TransformerBlockConfig& withActivation( ActivationType activation )
        {
            activation_ = activation;
            return *this;
        }

        TransformerBlockConfig& withLayerNormEpsilon( float epsilon )
        {
            layer_norm_eps_ = epsilon;
            return *this;
        }

        /**
         * @brief Causal mask shared by every block of a model.
         */
        TransformerBlockConfig& withCausalMask( std::shared_ptr<const CausalMask> mask )
        {
            causal_mask_ = std::move( mask );
            return *this;
        }

        TransformerBlockConfig& withRotaryEmbedding( std::shared_ptr<const RotaryEmbedding> rotary )
        {
            rotary_ = std::move( rotary );
            return *this;
        }

        dim_t getEmbeddingDim() const { return embedding_dim_; }
        dim_t getNumHeads() const { return num_heads_; }
        dim_t getHiddenDimension() const { return hidden_dim_; }
        dim_t getMaxSequenceLength() const { return max_seq_len_; }
        float getDropout() const { return dropout_; }
        float getAttentionDropout() const { return attention_dropout_; }
        ActivationType getActivation() const { return activation_; }
        float getLayerNormEpsilon() const { return layer_norm_eps_; }
        const std::shared_ptr<const CausalMask>& getCausalMask() const { return causal_mask_; }
        const std::shared_ptr<const RotaryEmbedding>& getRotaryEmbedding() const { return rotary_; }

        void validate() const override
        {
            ComponentConfig::validate();

            if (embedding_dim_ <= 0 || num_heads_ <= 0 || hidden_dim_ <= 0 || max_seq_len_ <= 0)
            {
                throw std::invalid_argument( "TransformerBlockConfig: dimensions must be greater than zero" );
            }

            if (embedding_dim_ % num_heads_ != 0)
            {
                throw std::invalid_argument( "TransformerBlockConfig: embedding dimension must be divisible by number of heads" );
            }

            if (!(dropout_ >= 0.0f && dropout_ < 1.0f) || !(attention_dropout_ >= 0.0f && attention_dropout_ < 1.0f))
            {
                throw std::invalid_argument( "TransformerBlockConfig: dropout rates must be in [0, 1)" );
            }

            if (!(layer_norm_eps_ > 0.0f) || !std::isfinite( layer_norm_eps_ ))
            {
                throw std::invalid_argument( "TransformerBlockConfig: layer norm epsilon must be positive" );
            }
        }

        std::string toString() const override
        {
            std::ostringstream oss;
            oss << "TransformerBlockConfig(embedding_dim=" << embedding_dim_
                << ", num_heads=" << num_heads_
                << ", hidden_dim=" << hidden_dim_
                << ", max_sequence_length=" << max_seq_len_
                << ", dropout=" << dropout_
                << ", attention_dropout=" << attention_dropout_
                << ", activation=" << activationTypeToString( activation_ )
                << ", layer_norm_eps=" << layer_norm_eps_ << ")";
            return oss.str();
        }

    private:
        dim_t embedding_dim_;
        dim_t num_heads_;
        dim_t hidden_dim_;
        dim_t max_seq_len_{ 1024 };
        float dropout_{ 0.0f };
        float attention_dropout_{ 0.0f };
        ActivationType activation_{ ActivationType::Gelu };
        float layer_norm_eps_{ 1e-5f };
        std::shared_ptr<const CausalMask> causal_mask_;
        std::shared_ptr<const RotaryEmbedding> rotary_;
    };
}

#endif
