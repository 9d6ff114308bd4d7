/**
 * @file CausalSelfAttention.h
 * @brief Causal multi-head self-attention with fused QKV and output projections.
 */

#ifndef EMBER_DNN_CAUSAL_SELF_ATTENTION_H_
#define EMBER_DNN_CAUSAL_SELF_ATTENTION_H_

#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "../../Compute/DeviceType.h"
#include "../../Compute/ExecutionContext.h"
#include "../../Compute/MemoryResource.h"
#include "../../Compute/Operations/AttentionOperation.h"
#include "../../Compute/Operations/OperationRegistry.h"
#include "../../Compute/OperationsRegistrar.h"
#include "../../Tensors/ITensor.h"
#include "../../Tensors/Tensor.h"
#include "../../Tensors/TensorDataType.h"
#include "../Component.h"
#include "../Regularization/Dropout.h"
#include "AttentionConfig.h"
#include "Linear.h"

namespace Ember::Dnn
{
    /**
     * @brief Causal self-attention: qkv = Linear(C, 3C), masked attention, Linear(C, C), dropout.
     *
     * Attention-weight dropout and the residual dropout after the output
     * projection both use the configured attention dropout rate and are active
     * in training mode only.
     */
    template<DeviceType TDeviceType, TensorDataType TPrecision>
        requires PrecisionSupportedOnDevice<TPrecision, TDeviceType>
    class CausalSelfAttention final : public Component<TDeviceType, TPrecision>
    {
    public:
        using MR = CpuMemoryResource;
        using ExecutionContextType = ExecutionContext<TDeviceType>;
        using TensorType = Tensor<TPrecision, MR>;
        using ComponentBase = Component<TDeviceType, TPrecision>;

        explicit CausalSelfAttention( std::shared_ptr<ExecutionContextType> exec_context, const AttentionConfig& config )
            : exec_context_( std::move( exec_context ) ), config_( config )
        {
            if (!exec_context_)
            {
                throw std::invalid_argument( "ExecutionContext cannot be null." );
            }

            config_.validate();

            createComponents();
            createOperation();
        }

        /**
         * @brief Forward pass over (B, T, C).
         *
         * @param attention_weights Optional (B, NH, T, T) tensor receiving the attention weights.
         */
        void forward( const ITensor& input, ITensor& output, ITensor* attention_weights = nullptr ) const
        {
            this->ensureBuilt( "CausalSelfAttention::forward" );

            const auto& shape = input.shape();
            if (shape.size() != 3 || shape[ 2 ] != config_.getEmbeddingDim())
            {
                throw std::invalid_argument( "CausalSelfAttention: input must have shape (B, T, C)" );
            }

            const int64_t B = shape[ 0 ];
            const int64_t T = shape[ 1 ];
            const int64_t C = config_.getEmbeddingDim();
            auto device = exec_context_->getDevice();

            TensorType qkv( device, shape_t{ B, T, 3 * C } );
            TensorType attn_out( device, shape_t{ B, T, C } );

            qkv_->forward( input, qkv );
            operation_->forward( qkv, attn_out, attention_weights );
            out_proj_->forward( attn_out, output );
            resid_dropout_->forward( output, output );
        }

        std::vector<typename ComponentBase::NamedParameter> getNamedParameters() const override
        {
            auto params = this->prefixed( "qkv", qkv_->getNamedParameters() );
            auto out = this->prefixed( "out_proj", out_proj_->getNamedParameters() );
            params.insert( params.end(), out.begin(), out.end() );
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
            oss << "--------------------" << std::endl;
            oss << "CausalSelfAttention: " << getName() << std::endl;
            oss << "Embedding dimension: " << config_.getEmbeddingDim() << std::endl;
            oss << "Number of heads: " << config_.getNumHeads() << std::endl;
            oss << "Head dimension: " << config_.getHeadDim() << std::endl;
            oss << "Max sequence length: " << config_.getMaxSequenceLength() << std::endl;
            if (config_.getDropout() > 0.0f)
            {
                oss << "Dropout: " << config_.getDropout() << std::endl;
            }
            oss << "Parameter count: " << this->parameterCount() << std::endl;
            oss << qkv_->toString();
            oss << out_proj_->toString();
            return oss.str();
        }

        std::shared_ptr<Linear<TDeviceType, TPrecision>> getQkvProjection() const noexcept
        {
            return qkv_;
        }

        std::shared_ptr<Linear<TDeviceType, TPrecision>> getOutputProjection() const noexcept
        {
            return out_proj_;
        }

        const AttentionConfig& getConfig() const noexcept
        {
            return config_;
        }

    protected:
        void onBuilding( const shape_t& input_shape ) override
        {
            if (input_shape.size() != 3 || input_shape[ 2 ] != config_.getEmbeddingDim())
            {
                throw std::invalid_argument( "CausalSelfAttention: input must have shape (B, T, C)" );
            }

            shape_t qkv_shape{ input_shape[ 0 ], input_shape[ 1 ], 3 * config_.getEmbeddingDim() };

            qkv_->build( input_shape );
            operation_->setTraining( this->isTraining() );
            operation_->build( qkv_shape );
            out_proj_->build( input_shape );
            resid_dropout_->build( input_shape );
        }

        void onTrainingChanging( bool is_training ) override
        {
            qkv_->setTraining( is_training );
            operation_->setTraining( is_training );
            out_proj_->setTraining( is_training );
            resid_dropout_->setTraining( is_training );
        }

    private:
        std::shared_ptr<ExecutionContextType> exec_context_;
        AttentionConfig config_;

        std::shared_ptr<Linear<TDeviceType, TPrecision>> qkv_;
        std::shared_ptr<Linear<TDeviceType, TPrecision>> out_proj_;
        std::shared_ptr<Dropout<TDeviceType, TPrecision>> resid_dropout_;
        std::shared_ptr<AttentionOperation<TDeviceType, TPrecision>> operation_{ nullptr };

        void createComponents()
        {
            const int64_t C = config_.getEmbeddingDim();

            auto qkv_config = LinearConfig( C, 3 * C );
            qkv_config.withName( getName() + ".qkv" );
            qkv_ = std::make_shared<Linear<TDeviceType, TPrecision>>( exec_context_, qkv_config );

            auto out_config = LinearConfig( C, C );
            out_config.withName( getName() + ".out_proj" );
            out_proj_ = std::make_shared<Linear<TDeviceType, TPrecision>>( exec_context_, out_config );

            auto dropout_config = DropoutConfig( config_.getDropout() );
            dropout_config.withName( getName() + ".resid_dropout" );
            resid_dropout_ = std::make_shared<Dropout<TDeviceType, TPrecision>>( exec_context_, dropout_config );
        }

        void createOperation()
        {
            OperationsRegistrar::instance();

            auto op = OperationRegistry::instance()
                .createUnaryOperation<TDeviceType, TPrecision>( "AttentionOp", exec_context_, config_ );

            operation_ = std::dynamic_pointer_cast<AttentionOperation<TDeviceType, TPrecision>>( op );

            if (!operation_)
            {
                throw std::runtime_error( "Failed to create CausalSelfAttention compute backend operation." );
            }
        }
    };
}

#endif
