/**
 * @file SoftmaxCrossEntropy.h
 * @brief Mean cross-entropy loss over logits with an ignore index.
 */

#ifndef EMBER_DNN_SOFTMAX_CROSS_ENTROPY_H_
#define EMBER_DNN_SOFTMAX_CROSS_ENTROPY_H_

#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "../../Compute/DeviceType.h"
#include "../../Compute/ExecutionContext.h"
#include "../../Compute/MemoryResource.h"
#include "../../Compute/Operations/BinaryOperation.h"
#include "../../Compute/Operations/OperationRegistry.h"
#include "../../Compute/OperationsRegistrar.h"
#include "../../Tensors/ITensor.h"
#include "../../Tensors/Tensor.h"
#include "../../Tensors/TensorDataType.h"
#include "../Component.h"
#include "CrossEntropyConfig.h"

namespace Ember::Dnn
{
    /**
     * @brief Cross-entropy of softmax(logits) against INT32 targets, averaged over non-ignored targets.
     *
     * The result is NaN when every target equals the ignore index.
     */
    template<DeviceType TDeviceType, TensorDataType TPrecision>
        requires PrecisionSupportedOnDevice<TPrecision, TDeviceType>
    class SoftmaxCrossEntropy final : public Component<TDeviceType, TPrecision>
    {
    public:
        using MR = CpuMemoryResource;
        using ExecutionContextType = ExecutionContext<TDeviceType>;
        using TensorType = Tensor<TPrecision, MR>;
        using ComponentBase = Component<TDeviceType, TPrecision>;

        explicit SoftmaxCrossEntropy( std::shared_ptr<ExecutionContextType> exec_context, const CrossEntropyConfig& config )
            : exec_context_( std::move( exec_context ) ), config_( config )
        {
            if (!exec_context_)
            {
                throw std::invalid_argument( "ExecutionContext cannot be null." );
            }

            config_.validate();

            OperationsRegistrar::instance();
            operation_ = OperationRegistry::instance()
                .createBinaryOperation<TDeviceType, TPrecision, TensorDataType::INT32, TPrecision>(
                    "SoftmaxCrossEntropyOp", exec_context_, config_ );
        }

        /**
         * @param logits (..., V) tensor.
         * @param targets INT32 tensor with the leading shape of logits.
         * @param loss Scalar output.
         */
        void forward( const ITensor& logits, const ITensor& targets, ITensor& loss ) const
        {
            this->ensureBuilt( "SoftmaxCrossEntropy::forward" );
            operation_->forward( logits, targets, loss );
        }

        /**
         * @brief Convenience overload returning the loss value.
         */
        float forward( const ITensor& logits, const ITensor& targets ) const
        {
            TensorType loss( exec_context_->getDevice(), shape_t{} );
            forward( logits, targets, loss );
            return loss.data()[ 0 ];
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
            oss << "SoftmaxCrossEntropy: " << getName()
                << " (vocab=" << config_.getVocabSize()
                << ", ignore_index=" << config_.getIgnoreIndex() << ")" << std::endl;
            return oss.str();
        }

    protected:
        void onBuilding( const shape_t& input_shape ) override
        {
            operation_->build( input_shape );
        }

    private:
        std::shared_ptr<ExecutionContextType> exec_context_;
        CrossEntropyConfig config_;
        std::shared_ptr<BinaryOperation<TDeviceType, TPrecision, TensorDataType::INT32, TPrecision>> operation_{ nullptr };
    };
}

#endif
