/**
 * @file TransformerBlock.h
 * @brief Pre-normalization transformer decoder block.
 */

#ifndef EMBER_DNN_TRANSFORMER_BLOCK_H_
#define EMBER_DNN_TRANSFORMER_BLOCK_H_

#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "../../Compute/DeviceType.h"
#include "../../Compute/ExecutionContext.h"
#include "../../Compute/MemoryResource.h"
#include "../../Tensors/ITensor.h"
#include "../../Tensors/Tensor.h"
#include "../../Tensors/TensorDataType.h"
#include "../Component.h"
#include "../Connections/Residual.h"
#include "../Layers/CausalSelfAttention.h"
#include "../Normalization/LayerNorm.h"
#include "FeedForward.h"
#include "TransformerBlockConfig.h"

namespace Ember::Dnn
{
    /**
     * @brief TransformerBlock implements a pre-LN transformer decoder block.
     *
     * The block computes
     * 1. h = x + Attn( LN1( x ) )
     * 2. y = h + FF( LN2( h ) )
     *
     * Input and output are (B, T, C). The attention sub-layer optionally reports
     * its (B, NH, T, T) weights.
     */
    template<DeviceType TDeviceType, TensorDataType TPrecision>
        requires PrecisionSupportedOnDevice<TPrecision, TDeviceType>
    class TransformerBlock final : public Component<TDeviceType, TPrecision>
    {
    public:
        using MR = CpuMemoryResource;
        using ExecutionContextType = ExecutionContext<TDeviceType>;
        using TensorType = Tensor<TPrecision, MR>;
        using ComponentBase = Component<TDeviceType, TPrecision>;

        explicit TransformerBlock( std::shared_ptr<ExecutionContextType> exec_context, const TransformerBlockConfig& config )
            : exec_context_( std::move( exec_context ) ), config_( config )
        {
            if (!exec_context_)
            {
                throw std::invalid_argument( "ExecutionContext cannot be null." );
            }

            config_.validate();

            initializeComponents();
        }

        /**
         * @brief Performs the forward pass of the block.
         *
         * @param input Tensor of shape (B, T, C).
         * @param output Tensor of shape (B, T, C). Must not alias the input.
         * @param attention_weights Optional (B, NH, T, T) tensor receiving the attention weights.
         */
        void forward( const ITensor& input, ITensor& output, ITensor* attention_weights = nullptr ) const
        {
            this->ensureBuilt( "TransformerBlock::forward" );

            const auto& shape = input.shape();
            auto device = exec_context_->getDevice();

            TensorType ln_1_output( device, shape );
            TensorType attn_output( device, shape );
            TensorType res_1_output( device, shape );
            TensorType ln_2_output( device, shape );
            TensorType mlp_output( device, shape );

            ln_1_->forward( input, ln_1_output );
            attn_->forward( ln_1_output, attn_output, attention_weights );
            res_1_->forward( input, attn_output, res_1_output );

            ln_2_->forward( res_1_output, ln_2_output );
            mlp_->forward( ln_2_output, mlp_output );
            res_2_->forward( res_1_output, mlp_output, output );
        }

        std::vector<typename ComponentBase::NamedParameter> getNamedParameters() const override
        {
            std::vector<typename ComponentBase::NamedParameter> params;

            auto append = [&params]( std::vector<typename ComponentBase::NamedParameter> child ) {
                params.insert( params.end(), child.begin(), child.end() );
            };

            append( this->prefixed( "ln_1", ln_1_->getNamedParameters() ) );
            append( this->prefixed( "attn", attn_->getNamedParameters() ) );
            append( this->prefixed( "ln_2", ln_2_->getNamedParameters() ) );
            append( this->prefixed( "mlp", mlp_->getNamedParameters() ) );

            return params;
        }

        std::string getName() const override
        {
            return config_.getName();
        }

        std::shared_ptr<ComputeDevice> getDevice() const override
        {
            return exec_context_->getDevice();
        }

        std::string toString() const override
        {
            std::ostringstream oss;
            oss << "====================" << std::endl;
            oss << "TransformerBlock: " << getName() << std::endl;
            oss << "Embedding dimension: " << config_.getEmbeddingDim() << std::endl;
            oss << "Number of heads: " << config_.getNumHeads() << std::endl;
            oss << "MLP hidden dimension: " << config_.getHiddenDimension() << std::endl;

            if (config_.getDropout() > 0.0f)
            {
                oss << "Dropout: " << config_.getDropout() << std::endl;
            }

            if (config_.getAttentionDropout() > 0.0f)
            {
                oss << "Attention dropout: " << config_.getAttentionDropout() << std::endl;
            }

            oss << "Architecture: Pre-LN" << std::endl;
            oss << "Device: " << deviceTypeToString( this->getDeviceType() ) << std::endl;
            oss << "Parameter count: " << this->parameterCount() << std::endl;
            oss << "Sub-Components..." << std::endl;
            oss << ln_1_->toString();
            oss << attn_->toString();
            oss << ln_2_->toString();
            oss << mlp_->toString();

            return oss.str();
        }

        std::shared_ptr<CausalSelfAttention<TDeviceType, TPrecision>> getAttention() const noexcept
        {
            return attn_;
        }

        const TransformerBlockConfig& getConfig() const noexcept
        {
            return config_;
        }

    protected:
        void onBuilding( const shape_t& input_shape ) override
        {
            if (input_shape.size() != 3 || input_shape[ 2 ] != config_.getEmbeddingDim())
            {
                throw std::invalid_argument( "TransformerBlock: input must have shape (B, T, C)" );
            }

            ln_1_->build( input_shape );
            attn_->build( input_shape );
            res_1_->build( input_shape );
            ln_2_->build( input_shape );
            mlp_->build( input_shape );
            res_2_->build( input_shape );
        }

        void onTrainingChanging( bool is_training ) override
        {
            ln_1_->setTraining( is_training );
            attn_->setTraining( is_training );
            res_1_->setTraining( is_training );
            ln_2_->setTraining( is_training );
            mlp_->setTraining( is_training );
            res_2_->setTraining( is_training );
        }

    private:
        std::shared_ptr<ExecutionContextType> exec_context_;
        TransformerBlockConfig config_;

        std::shared_ptr<LayerNorm<TDeviceType, TPrecision>> ln_1_{ nullptr };
        std::shared_ptr<CausalSelfAttention<TDeviceType, TPrecision>> attn_{ nullptr };
        std::shared_ptr<Residual<TDeviceType, TPrecision>> res_1_{ nullptr };
        std::shared_ptr<LayerNorm<TDeviceType, TPrecision>> ln_2_{ nullptr };
        std::shared_ptr<FeedForward<TDeviceType, TPrecision>> mlp_{ nullptr };
        std::shared_ptr<Residual<TDeviceType, TPrecision>> res_2_{ nullptr };

        void initializeComponents()
        {
            const dim_t C = config_.getEmbeddingDim();

            auto ln_1_config = LayerNormConfig( C );
            ln_1_config.withEpsilon( config_.getLayerNormEpsilon() ).withName( getName() + ".ln_1" );
            ln_1_ = std::make_shared<LayerNorm<TDeviceType, TPrecision>>( exec_context_, ln_1_config );

            auto attn_config = AttentionConfig( C, config_.getNumHeads() );
            attn_config.withMaxSequenceLength( config_.getMaxSequenceLength() )
                .withDropout( config_.getAttentionDropout() )
                .withCausalMask( config_.getCausalMask() )
                .withRotaryEmbedding( config_.getRotaryEmbedding() )
                .withName( getName() + ".attn" );
            attn_ = std::make_shared<CausalSelfAttention<TDeviceType, TPrecision>>( exec_context_, attn_config );

            auto res_1_config = ResidualConfig();
            res_1_config.withName( getName() + ".res_1" );
            res_1_ = std::make_shared<Residual<TDeviceType, TPrecision>>( exec_context_, res_1_config );

            auto ln_2_config = LayerNormConfig( C );
            ln_2_config.withEpsilon( config_.getLayerNormEpsilon() ).withName( getName() + ".ln_2" );
            ln_2_ = std::make_shared<LayerNorm<TDeviceType, TPrecision>>( exec_context_, ln_2_config );

            auto mlp_config = FeedForwardConfig( C, config_.getHiddenDimension() );
            mlp_config.withActivation( config_.getActivation() )
                .withDropout( config_.getDropout() )
                .withName( getName() + ".mlp" );
            mlp_ = std::make_shared<FeedForward<TDeviceType, TPrecision>>( exec_context_, mlp_config );

            auto res_2_config = ResidualConfig();
            res_2_config.withName( getName() + ".res_2" );
            res_2_ = std::make_shared<Residual<TDeviceType, TPrecision>>( exec_context_, res_2_config );
        }
    };
}

#endif
