/**
 * @file Activation.h
 * @brief Elementwise activation component (GELU, ReLU, Swish).
 */

#ifndef EMBER_DNN_ACTIVATION_H_
#define EMBER_DNN_ACTIVATION_H_

#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "../../Common/ActivationType.h"
#include "../../Compute/DeviceType.h"
#include "../../Compute/ExecutionContext.h"
#include "../../Compute/Operations/OperationRegistry.h"
#include "../../Compute/Operations/UnaryOperation.h"
#include "../../Compute/OperationsRegistrar.h"
#include "../../Tensors/ITensor.h"
#include "../../Tensors/TensorDataType.h"
#include "../Component.h"
#include "ActivationConfig.h"

namespace Ember::Dnn
{
    template<DeviceType TDeviceType, TensorDataType TPrecision>
        requires PrecisionSupportedOnDevice<TPrecision, TDeviceType>
    class Activation final : public Component<TDeviceType, TPrecision>
    {
    public:
        using ExecutionContextType = ExecutionContext<TDeviceType>;
        using ComponentBase = Component<TDeviceType, TPrecision>;

        explicit Activation( std::shared_ptr<ExecutionContextType> exec_context, const ActivationConfig& config )
            : exec_context_( std::move( exec_context ) ), config_( config )
        {
            if (!exec_context_)
            {
                throw std::invalid_argument( "ExecutionContext cannot be null." );
            }

            config_.validate();

            OperationsRegistrar::instance();
            operation_ = OperationRegistry::instance()
                .createUnaryOperation<TDeviceType, TPrecision>( "ActivationOp", exec_context_, config_ );
        }

        void forward( const ITensor& input, ITensor& output ) const
        {
            this->ensureBuilt( "Activation::forward" );
            operation_->forward( input, output );
        }

        ActivationType getActivationType() const
        {
            return config_.getActivationType();
        }

        std::vector<typename ComponentBase::NamedParameter> getNamedParameters() const override
        {
            return {};
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
            return "Activation: " + getName() + " (" + activationTypeToString( config_.getActivationType() ) + ")\n";
        }

    protected:
        void onBuilding( const shape_t& input_shape ) override
        {
            operation_->build( input_shape );
        }

    private:
        std::shared_ptr<ExecutionContextType> exec_context_;
        ActivationConfig config_;
        std::shared_ptr<UnaryOperation<TDeviceType, TPrecision>> operation_{ nullptr };
    };
}

#endif
