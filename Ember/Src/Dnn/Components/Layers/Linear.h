/**
 * @file Linear.h
 * @brief Fully connected layer y = x * W^T + b.
 */

#ifndef EMBER_DNN_LINEAR_H_
#define EMBER_DNN_LINEAR_H_

#include <functional>
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
#include "../../../Utils/RandomGenerator.h"
#include "../Component.h"
#include "LinearConfig.h"

namespace Ember::Dnn
{
    /**
     * @brief Linear (fully connected) layer.
     *
     * Owns a weight of shape (output_features, input_features) and, when the
     * config enables it, a bias of shape (output_features). The weight may
     * instead be supplied by the caller, in which case the Linear shares it
     * with its other holders (used for the weight-tied language model head).
     */
    template<DeviceType TDeviceType, TensorDataType TPrecision>
        requires PrecisionSupportedOnDevice<TPrecision, TDeviceType>
    class Linear final : public Component<TDeviceType, TPrecision>
    {
    public:
        using MR = CpuMemoryResource;
        using ExecutionContextType = ExecutionContext<TDeviceType>;
        using TensorType = Tensor<TPrecision, MR>;
        using ComponentBase = Component<TDeviceType, TPrecision>;

        explicit Linear( std::shared_ptr<ExecutionContextType> exec_context, const LinearConfig& config )
            : Linear( std::move( exec_context ), config, nullptr )
        {
        }

        /**
         * @brief Construct a Linear whose weight is an existing tensor.
         *
         * @throws std::invalid_argument If the shared weight's shape is not (output_features, input_features)
         */
        Linear( std::shared_ptr<ExecutionContextType> exec_context, const LinearConfig& config,
            std::shared_ptr<TensorType> shared_weight )
            : exec_context_( std::move( exec_context ) ), config_( config )
        {
            if (!exec_context_)
            {
                throw std::invalid_argument( "ExecutionContext cannot be null." );
            }

            config_.validate();

            initializeParameters( std::move( shared_weight ) );
            createOperation();
        }

        ~Linear() override = default;

        void forward( const ITensor& input, ITensor& output ) const
        {
            this->ensureBuilt( "Linear::forward" );
            validateInputShape( input.shape() );
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
            oss << "Linear: " << getName() << std::endl;
            oss << "Input features: " << config_.getInputFeatures();
            oss << ", Output features: " << config_.getOutputFeatures() << std::endl;
            oss << "Device: " << deviceTypeToString( this->getDeviceType() ) << std::endl;
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

        bool hasBias() const noexcept
        {
            return config_.hasBias();
        }

        const LinearConfig& getConfig() const noexcept
        {
            return config_;
        }

    protected:
        void onBuilding( const shape_t& input_shape ) override
        {
            validateInputShape( input_shape );

            operation_->setParameters( weight_.get(), bias_.get() );
            operation_->setTraining( this->isTraining() );
            operation_->build( input_shape );
        }

        void onTrainingChanging( bool is_training ) override
        {
            operation_->setTraining( is_training );
        }

    private:
        std::shared_ptr<ExecutionContextType> exec_context_;
        LinearConfig config_;

        std::shared_ptr<TensorType> weight_{ nullptr };
        std::shared_ptr<TensorType> bias_{ nullptr };

        std::shared_ptr<UnaryOperation<TDeviceType, TPrecision>> operation_{ nullptr };

        void validateInputShape( const shape_t& input_shape ) const
        {
            if (input_shape.empty())
            {
                throw std::invalid_argument( "Linear: input must have rank >= 1" );
            }

            int64_t input_features = input_shape.back();

            if (input_features != config_.getInputFeatures())
            {
                std::ostringstream oss;
                oss << "Linear: input feature dimension mismatch. Expected "
                    << config_.getInputFeatures() << ", got " << input_features;
                throw std::invalid_argument( oss.str() );
            }
        }

        void initializeParameters( std::shared_ptr<TensorType> shared_weight )
        {
            int64_t input_features = config_.getInputFeatures();
            int64_t output_features = config_.getOutputFeatures();
            auto device = exec_context_->getDevice();

            if (shared_weight)
            {
                const auto& shape = shared_weight->shape();
                if (shape.size() != 2 || shape[ 0 ] != output_features || shape[ 1 ] != input_features)
                {
                    throw std::invalid_argument( "Linear: shared weight must have shape (output_features, input_features)" );
                }

                weight_ = std::move( shared_weight );
            }
            else
            {
                weight_ = std::make_shared<TensorType>( device, shape_t{ output_features, input_features } );
                weight_->setName( this->getName() + ".weight" );

                auto gen = Utils::RandomGenerator::getInstance().deriveGenerator(
                    static_cast<unsigned int>(std::hash<std::string>{}(weight_->getName())) );
                normal( *weight_, 0.0f, 0.02f, gen );
            }

            if (config_.hasBias())
            {
                bias_ = std::make_shared<TensorType>( device, shape_t{ output_features } );
                bias_->setName( this->getName() + ".bias" );
                zeros( *bias_ );
            }
        }

        void createOperation()
        {
            OperationsRegistrar::instance();

            operation_ = OperationRegistry::instance()
                .createUnaryOperation<TDeviceType, TPrecision>(
                    "LinearOp",
                    exec_context_,
                    config_ );

            if (!operation_)
            {
                throw std::runtime_error( "Failed to create Linear compute backend operation." );
            }
        }
    };

    template<TensorDataType TPrecision>
    using CpuLinear = Linear<DeviceType::Cpu, TPrecision>;
}

#endif
