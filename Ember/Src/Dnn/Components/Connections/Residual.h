#ifndef EMBER_DNN_RESIDUAL_H_
#define EMBER_DNN_RESIDUAL_H_

#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "../../Compute/DeviceType.h"
#include "../../Compute/ExecutionContext.h"
#include "../../Compute/Operations/BinaryOperation.h"
#include "../../Compute/Operations/OperationRegistry.h"
#include "../../Compute/OperationsRegistrar.h"
#include "../../Tensors/ITensor.h"
#include "../../Tensors/TensorDataType.h"
#include "../Component.h"
#include "ResidualConfig.h"

namespace Ember::Dnn
{
    /**
     * @brief Residual connection y = a + b.
     */
    template<DeviceType TDeviceType, TensorDataType TPrecision>
        requires PrecisionSupportedOnDevice<TPrecision, TDeviceType>
    class Residual final : public Component<TDeviceType, TPrecision>
    {
    public:
        using ExecutionContextType = ExecutionContext<TDeviceType>;
        using ComponentBase = Component<TDeviceType, TPrecision>;

        explicit Residual( std::shared_ptr<ExecutionContextType> exec_context, const ResidualConfig& config )
            : exec_context_( std::move( exec_context ) ), config_( config )
        {
            if (!exec_context_)
            {
                throw std::invalid_argument( "ExecutionContext cannot be null." );
            }

            config_.validate();

            OperationsRegistrar::instance();
            operation_ = OperationRegistry::instance()
                .createBinaryOperation<TDeviceType, TPrecision>( "ResidualOp", exec_context_, config_ );
        }

        void forward( const ITensor& input_a, const ITensor& input_b, ITensor& output ) const
        {
            this->ensureBuilt( "Residual::forward" );
            operation_->forward( input_a, input_b, output );
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
            return "Residual: " + getName() + "\n";
        }

    protected:
        void onBuilding( const shape_t& input_shape ) override
        {
            operation_->build( input_shape );
        }

    private:
        std::shared_ptr<ExecutionContextType> exec_context_;
        ResidualConfig config_;
        std::shared_ptr<BinaryOperation<TDeviceType, TPrecision>> operation_{ nullptr };
    };
}

#endif
