/**
 * @file CpuDropoutOp.h
 * @brief CPU implementation of inverted dropout.
 */

#ifndef EMBER_DNN_COMPUTE_CPU_DROPOUT_OP_H_
#define EMBER_DNN_COMPUTE_CPU_DROPOUT_OP_H_

#include <cstdint>
#include <cstring>
#include <functional>
#include <memory>
#include <mutex>
#include <random>
#include <stdexcept>
#include <string>

#include "../../../../Components/Regularization/DropoutConfig.h"
#include "../../../../Tensors/ITensor.h"
#include "../../../../Tensors/TensorDataType.h"
#include "../../../../../Utils/Logger.h"
#include "../../../../../Utils/RandomGenerator.h"
#include "../../../DeviceType.h"
#include "../../../ExecutionContext.h"
#include "../../../Operations/OperationRegistry.h"
#include "../../../Operations/OperationType.h"
#include "../../../Operations/UnaryOperation.h"

namespace Ember::Dnn::Compute
{
    /**
     * @brief Inverted dropout.
     *
     * In training mode each element is zeroed with probability p and survivors
     * are scaled by 1 / (1 - p). In inference mode, or with p == 0, the output
     * is a copy of the input.
     *
     * The mask stream is derived from the global RandomGenerator seed and the
     * component name, so two dropout layers never share a stream. Drawing from
     * it is serialized, which makes training-mode forward calls on one
     * operation mutually exclusive.
     */
    class CpuDropoutOp : public UnaryOperation<DeviceType::Cpu, TensorDataType::FP32>
    {
    public:
        using CpuExecutionContext = ExecutionContext<DeviceType::Cpu>;

        CpuDropoutOp( std::shared_ptr<CpuExecutionContext> context, const DropoutConfig& config )
            : context_( context ), config_( config ),
            generator_( Utils::RandomGenerator::getInstance().deriveGenerator(
                static_cast<unsigned int>(std::hash<std::string>{}(config.getName())) ) )
        {
            if (!context_)
            {
                throw std::invalid_argument( "ExecutionContext cannot be null." );
            }

            config_.validate();
            is_training_ = config_.isTraining();
        }

        void forward( const ITensor& input, ITensor& output ) const override
        {
            if (input.size() != output.size())
            {
                throw std::invalid_argument( "CpuDropoutOp::forward - input and output sizes differ" );
            }

            const float* X = static_cast<const float*>(input.rawData());
            float* Y = static_cast<float*>(output.rawData());
            const size_t N = input.size();
            const float p = config_.getProbability();

            if (!is_training_ || p == 0.0f)
            {
                if (X != Y && N > 0)
                {
                    std::memcpy( Y, X, N * sizeof( float ) );
                }
                return;
            }

            const float keep_scale = 1.0f / (1.0f - p);
            std::bernoulli_distribution drop( p );

            std::lock_guard<std::mutex> lock( mutex_ );
            for (size_t i = 0; i < N; ++i)
            {
                Y[ i ] = drop( generator_ ) ? 0.0f : X[ i ] * keep_scale;
            }
        }

        float getProbability() const
        {
            return config_.getProbability();
        }

        OperationType getOperationType() const override
        {
            return OperationType::DropoutOp;
        }

        std::string getName() const override
        {
            return "Cpu::DropoutOp";
        }

    private:
        std::shared_ptr<CpuExecutionContext> context_;
        DropoutConfig config_;

        mutable std::mt19937 generator_;
        mutable std::mutex mutex_;
    };

    class CpuDropoutOpRegistrar
    {
    public:
        static void registerOperations()
        {
            OperationRegistry::instance().registerUnaryOperation<DeviceType::Cpu, TensorDataType::FP32, TensorDataType::FP32>(
                "DropoutOp",
                []( std::shared_ptr<ExecutionContext<DeviceType::Cpu>> context,
                    const ComponentConfig& config ) -> std::shared_ptr<UnaryOperation<DeviceType::Cpu, TensorDataType::FP32>>
                {
                    const auto& dropout_config = static_cast<const DropoutConfig&>(config);
                    return std::make_shared<CpuDropoutOp>( context, dropout_config );
                }
            );

            Utils::Logger::trace( "Registered Cpu::DropoutOp" );
        }
    };
}

#endif
