/**
 * @file CpuSoftmaxCrossEntropyOp.h
 * @brief CPU implementation of the fused softmax and cross-entropy loss.
 */

#ifndef EMBER_DNN_COMPUTE_CPU_SOFTMAX_CROSS_ENTROPY_OP_H_
#define EMBER_DNN_COMPUTE_CPU_SOFTMAX_CROSS_ENTROPY_OP_H_

#include <cmath>
#include <cstdint>
#include <limits>
#include <memory>
#include <stdexcept>
#include <string>
#ifdef USE_OMP
#include <omp.h>
#endif

#include <fmt/format.h>

#include "../../../../Components/Losses/CrossEntropyConfig.h"
#include "../../../../Tensors/ITensor.h"
#include "../../../../Tensors/TensorDataType.h"
#include "../../../../../Utils/Logger.h"
#include "../../../DeviceType.h"
#include "../../../ExecutionContext.h"
#include "../../../Operations/BinaryOperation.h"
#include "../../../Operations/OperationRegistry.h"
#include "../../../Operations/OperationType.h"

namespace Ember::Dnn::Compute
{
    /**
     * @brief Mean cross-entropy of softmax(logits) against integer targets.
     *
     * Logits are (..., V) FP32, targets are the matching leading shape in INT32,
     * output is a scalar FP32 tensor. Targets equal to the ignore index are
     * excluded from both the sum and the count. When no target remains the
     * result is NaN. Any other target outside [0, V) raises std::out_of_range.
     */
    class CpuSoftmaxCrossEntropyOp : public BinaryOperation<DeviceType::Cpu, TensorDataType::FP32, TensorDataType::INT32, TensorDataType::FP32>
    {
    public:
        using CpuExecutionContext = ExecutionContext<DeviceType::Cpu>;

        CpuSoftmaxCrossEntropyOp( std::shared_ptr<CpuExecutionContext> context, const CrossEntropyConfig& config )
            : context_( context ), config_( config )
        {
            if (!context_)
            {
                throw std::invalid_argument( "ExecutionContext cannot be null." );
            }

            config_.validate();
        }

        void build( const shape_t& input_shape ) override
        {
            if (input_shape.empty() || input_shape.back() != config_.getVocabSize())
            {
                throw std::invalid_argument( "CpuSoftmaxCrossEntropyOp::build - logits trailing dimension must equal vocabulary size" );
            }

            BinaryOperation::build( input_shape );
        }

        void forward( const ITensor& inputA, const ITensor& inputB, ITensor& output ) const override
        {
            const int64_t vocab_size = config_.getVocabSize();
            const int32_t ignore_index = config_.getIgnoreIndex();

            if (inputA.shape().empty() || inputA.shape().back() != vocab_size)
            {
                throw std::invalid_argument( "CpuSoftmaxCrossEntropyOp::forward - logits trailing dimension must equal vocabulary size" );
            }

            const int64_t outer_size = static_cast<int64_t>(inputA.size()) / vocab_size;

            if (static_cast<int64_t>(inputB.size()) != outer_size)
            {
                throw std::invalid_argument( "CpuSoftmaxCrossEntropyOp::forward - one target is required per logits row" );
            }

            if (output.size() != 1)
            {
                throw std::invalid_argument( "CpuSoftmaxCrossEntropyOp::forward - output must hold a single value" );
            }

            const float* logits_data = static_cast<const float*>(inputA.rawData());
            const int32_t* targets_data = static_cast<const int32_t*>(inputB.rawData());
            float* output_data = static_cast<float*>(output.rawData());

            for (int64_t i = 0; i < outer_size; ++i)
            {
                const int32_t target = targets_data[ i ];
                if (target != ignore_index && (target < 0 || target >= vocab_size))
                {
                    throw std::out_of_range( fmt::format(
                        "CpuSoftmaxCrossEntropyOp::forward - target {} at row {} outside vocabulary [0, {})", target, i, vocab_size ) );
                }
            }

            long double total_loss = 0.0L;
            int64_t valid_samples = 0;

#pragma omp parallel for reduction(+:total_loss,valid_samples) if( outer_size > 100 )
            for (int64_t i = 0; i < outer_size; ++i)
            {
                const float* logits_i = logits_data + i * vocab_size;
                const int32_t target = targets_data[ i ];

                if (target == ignore_index)
                {
                    continue;
                }

                float max_logit = -std::numeric_limits<float>::infinity();
                for (int64_t v = 0; v < vocab_size; ++v)
                {
                    if (logits_i[ v ] > max_logit)
                        max_logit = logits_i[ v ];
                }

                long double sum_exp = 0.0L;
                for (int64_t v = 0; v < vocab_size; ++v)
                {
                    sum_exp += std::exp( static_cast<long double>(logits_i[ v ]) - static_cast<long double>(max_logit) );
                }

                const long double log_sum_exp = std::log( sum_exp );
                const long double target_logit = static_cast<long double>(logits_i[ target ]);

                total_loss += -(target_logit - static_cast<long double>(max_logit) - log_sum_exp);
                valid_samples++;
            }

            output_data[ 0 ] = valid_samples > 0
                ? static_cast<float>(total_loss / static_cast<long double>(valid_samples))
                : std::numeric_limits<float>::quiet_NaN();
        }

        OperationType getOperationType() const override
        {
            return OperationType::SoftmaxCrossEntropyOp;
        }

        std::string getName() const override
        {
            return "Cpu::SoftmaxCrossEntropyOp";
        }

    private:
        std::shared_ptr<CpuExecutionContext> context_;
        CrossEntropyConfig config_;
    };

    class CpuSoftmaxCrossEntropyOpRegistrar
    {
    public:
        static void registerOperations()
        {
            OperationRegistry::instance().registerBinaryOperation<DeviceType::Cpu, TensorDataType::FP32, TensorDataType::INT32, TensorDataType::FP32>(
                "SoftmaxCrossEntropyOp",
                []( std::shared_ptr<ExecutionContext<DeviceType::Cpu>> context,
                    const ComponentConfig& config ) -> std::shared_ptr<BinaryOperation<DeviceType::Cpu, TensorDataType::FP32, TensorDataType::INT32, TensorDataType::FP32>>
                {
                    const auto& ce_config = static_cast<const CrossEntropyConfig&>(config);
                    return std::make_shared<CpuSoftmaxCrossEntropyOp>( context, ce_config );
                }
            );

            Utils::Logger::trace( "Registered Cpu::SoftmaxCrossEntropyOp" );
        }
    };
}

#endif
