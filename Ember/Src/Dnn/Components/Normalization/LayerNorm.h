/**
 * @file LayerNorm.h
 * @brief Layer normalization component.
 */

#ifndef EMBER_DNN_LAYER_NORM_H_
#define EMBER_DNN_LAYER_NORM_H_

#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "../../Compute/DeviceType.h"
#include "../../Compute/ExecutionContext.h"
#include "../../Compute/MemoryResource.h"
#include "../../Compute/Operations/OperationRegistry.h"
#include "../../Compute/Operations/UnaryOperation.h"
#include "../../Compute/OperationsRegistrar.h"
#include "../../Tensors/ITensor.h"
#include "../../Tensors/Tensor.h"
#include "../../Tensors/TensorDataType.h"
#include "../../Tensors/TensorInitializers.h"
#include "../Component.h"
#include "LayerNormConfig.h"

namespace Ember::Dnn
{
    /**
     * @brief LayerNorm over the trailing dimension with learned weight (init 1) and bias (init 0).
     */
    template<DeviceType TDeviceType, TensorDataType TPrecision>
        requires PrecisionSupportedOnDevice<TPrecision, TDeviceType>
    class LayerNorm final : public Component<TDeviceType, TPrecision>
    {
    public:
        using MR = CpuMemoryResource;
        using ExecutionContextType = ExecutionContext<TDeviceType>;
        using TensorType = Tensor<TPrecision, MR>;
        using ComponentBase = Component<TDeviceType, TPrecision>;

        explicit LayerNorm( std::shared_ptr<ExecutionContextType> exec_context, const LayerNormConfig& config )
            : exec_context_( std::move( exec_context ) ), config_( config )
        {
            if (!exec_context_)
            {
                throw std::invalid_argument( "ExecutionContext cannot be null." );
            }

            config_.validate();

            initializeParameters();
            createOperation();
        }

        void forward( const ITensor& input, ITensor& output ) const
        {
            this->ensureBuilt( "LayerNorm::forward" );
            operation_->forward( input, output );
        }

        std::vector<typename ComponentBase::NamedParameter> getNamedParameters() const override
        {
            std::vector<typename ComponentBase::NamedParameter> params{ { "weight", weight_.get() } };
            if (bias_)
                params.emplace_back( "bias", bias_.get() );
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
            oss << "LayerNorm: " << getName() << std::endl;
            oss << "Normalized dimension: " << config_.getNormalizedDim() << std::endl;
            oss << "Epsilon: " << config_.getEpsilon() << std::endl;
            oss << "Has Bias: " << (config_.hasBias() ? "Yes" : "No") << std::endl;
            oss << "Parameter count: " << this->parameterCount() << std::endl;
            return oss.str();
        }

        std::shared_ptr<TensorType> getWeight() const noexcept
        {
            return weight_;
        }

        std::shared_ptr<TensorType> getBias() const noexcept
        {
            return bias_;
        }

    protected:
        void onBuilding( const shape_t& input_shape ) override
        {
            operation_->setParameters( weight_.get(), bias_.get() );
            operation_->build( input_shape );
        }

    private:
        std::shared_ptr<ExecutionContextType> exec_context_;
        LayerNormConfig config_;

        std::shared_ptr<TensorType> weight_{ nullptr };
        std::shared_ptr<TensorType> bias_{ nullptr };

        std::shared_ptr<UnaryOperation<TDeviceType, TPrecision>> operation_{ nullptr };

        void initializeParameters()
        {
            auto device = exec_context_->getDevice();

            weight_ = std::make_shared<TensorType>( device, shape_t{ config_.getNormalizedDim() } );
            weight_->setName( this->getName() + ".weight" );
            ones( *weight_ );

            if (config_.hasBias())
            {
                bias_ = std::make_shared<TensorType>( device, shape_t{ config_.getNormalizedDim() } );
                bias_->setName( this->getName() + ".bias" );
                zeros( *bias_ );
            }
        }

        void createOperation()
        {
            OperationsRegistrar::instance();

            operation_ = OperationRegistry::instance()
                .createUnaryOperation<TDeviceType, TPrecision>( "LayerNormOp", exec_context_, config_ );

            if (!operation_)
            {
                throw std::runtime_error( "Failed to create LayerNorm compute backend operation." );
            }
        }
    };
}

#endif
