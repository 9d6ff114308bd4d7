/**
 * @file Dropout.h
 * @brief Dropout component, active in training mode only.
 */

#ifndef EMBER_DNN_DROPOUT_H_
#define EMBER_DNN_DROPOUT_H_

#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "../../Compute/DeviceType.h"
#include "../../Compute/ExecutionContext.h"
#include "../../Compute/Operations/OperationRegistry.h"
#include "../../Compute/Operations/UnaryOperation.h"
#include "../../Compute/OperationsRegistrar.h"
#include "../../Tensors/ITensor.h"
#include "../../Tensors/TensorDataType.h"
#include "../Component.h"
#include "DropoutConfig.h"

namespace Ember::Dnn
{
    template<DeviceType TDeviceType, TensorDataType TPrecision>
        requires PrecisionSupportedOnDevice<TPrecision, TDeviceType>
    class Dropout final : public Component<TDeviceType, TPrecision>
    {
    public:
        using ExecutionContextType = ExecutionContext<TDeviceType>;
        using ComponentBase = Component<TDeviceType, TPrecision>;

        explicit Dropout( std::shared_ptr<ExecutionContextType> exec_context, const DropoutConfig& config )
            : exec_context_( std::move( exec_context ) ), config_( config )
        {
            if (!exec_context_)
            {
                throw std::invalid_argument( "ExecutionContext cannot be null." );
            }

            config_.validate();

            OperationsRegistrar::instance();
            operation_ = OperationRegistry::instance()
                .createUnaryOperation<TDeviceType, TPrecision>( "DropoutOp", exec_context_, config_ );
        }

        /**
         * @brief Output may alias the input.
         */
        void forward( const ITensor& input, ITensor& output ) const
        {
            this->ensureBuilt( "Dropout::forward" );
            operation_->forward( input, output );
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
            std::ostringstream oss;
            oss << "Dropout: " << getName() << " (p=" << config_.getProbability() << ")" << std::endl;
            return oss.str();
        }

        float getProbability() const
        {
            return config_.getProbability();
        }

    protected:
        void onBuilding( const shape_t& input_shape ) override
        {
            operation_->setTraining( this->isTraining() );
            operation_->build( input_shape );
        }

        void onTrainingChanging( bool is_training ) override
        {
            operation_->setTraining( is_training );
        }

    private:
        std::shared_ptr<ExecutionContextType> exec_context_;
        DropoutConfig config_;
        std::shared_ptr<UnaryOperation<TDeviceType, TPrecision>> operation_{ nullptr };
    };
}

#endif
