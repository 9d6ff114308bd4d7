/**
 * @file CpuLayerNormOp.h
 * @brief CPU implementation of layer normalization over the trailing dimension.
 */

#ifndef EMBER_DNN_COMPUTE_CPU_LAYER_NORM_OP_H_
#define EMBER_DNN_COMPUTE_CPU_LAYER_NORM_OP_H_

#include <cmath>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#ifdef USE_OMP
#include <omp.h>
#endif

#include "../../../../Components/Normalization/LayerNormConfig.h"
#include "../../../../Tensors/ITensor.h"
#include "../../../../Tensors/TensorDataType.h"
#include "../../../../../Utils/Logger.h"
#include "../../../DeviceType.h"
#include "../../../ExecutionContext.h"
#include "../../../Operations/OperationRegistry.h"
#include "../../../Operations/OperationType.h"
#include "../../../Operations/UnaryOperation.h"

namespace Ember::Dnn::Compute
{
    /**
     * @brief y = (x - mean) / sqrt(var + eps) * weight + bias, per row of the last dimension.
     *
     * Variance is the biased (population) estimate. Statistics are accumulated
     * in long double.
     */
    class CpuLayerNormOp : public UnaryOperation<DeviceType::Cpu, TensorDataType::FP32>
    {
    public:
        using UnaryOperationBase = UnaryOperation<DeviceType::Cpu, TensorDataType::FP32>;
        using CpuExecutionContext = ExecutionContext<DeviceType::Cpu>;

        CpuLayerNormOp( std::shared_ptr<CpuExecutionContext> context, const LayerNormConfig& config )
            : context_( context ), config_( config )
        {
            if (!context_)
            {
                throw std::runtime_error( "CpuLayerNormOp requires a CPU execution context" );
            }

            config_.validate();
        }

        void setParameters( ITensor* weight, ITensor* bias ) override
        {
            if (!weight)
            {
                throw std::invalid_argument( "CpuLayerNormOp::setParameters - weight parameter is required" );
            }

            if (weight->size() != static_cast<size_t>(config_.getNormalizedDim()))
            {
                throw std::invalid_argument( "CpuLayerNormOp::setParameters - weight size does not match normalized dimension" );
            }

            weight_ = static_cast<const float*>(weight->rawData());

            if (config_.hasBias())
            {
                if (!bias)
                {
                    throw std::invalid_argument( "CpuLayerNormOp::setParameters - bias parameter expected but null was provided" );
                }

                bias_ = static_cast<const float*>(bias->rawData());
            }
            else
            {
                bias_ = nullptr;
            }
        }

        void build( const shape_t& input_shape ) override
        {
            if (weight_ == nullptr)
            {
                throw std::runtime_error( "CpuLayerNormOp::build requires parameters bound via setParameters() before build()." );
            }

            if (config_.hasBias() && bias_ == nullptr)
            {
                throw std::runtime_error( "CpuLayerNormOp::build - bias expected by config but not bound via setParameters()." );
            }

            if (input_shape.empty() || input_shape.back() != config_.getNormalizedDim())
            {
                throw std::invalid_argument( "CpuLayerNormOp::build - input trailing dimension doesn't match normalized dimension" );
            }

            UnaryOperationBase::build( input_shape );
        }

        void forward( const ITensor& input, ITensor& output ) const override
        {
            if (!is_built_)
            {
                throw std::runtime_error( "CpuLayerNormOp: forward called before build()" );
            }

            const auto& shape = input.shape();
            const int64_t dim_size = config_.getNormalizedDim();

            if (shape.empty() || shape.back() != dim_size)
            {
                throw std::invalid_argument( "CpuLayerNormOp::forward - input trailing dimension doesn't match normalized dimension" );
            }

            if (output.size() != input.size())
            {
                throw std::invalid_argument( "CpuLayerNormOp::forward - output size must equal input size" );
            }

            const float* X = static_cast<const float*>(input.rawData());
            float* Y = static_cast<float*>(output.rawData());

            const float* weight = weight_;
            const float* bias = bias_;
            const long double eps = static_cast<long double>(config_.getEpsilon());

            const int64_t outer_size = static_cast<int64_t>(input.size()) / dim_size;

#pragma omp parallel for if( outer_size > 100 )
            for (int64_t outer = 0; outer < outer_size; ++outer)
            {
                const float* slice_in = X + outer * dim_size;
                float* slice_out = Y + outer * dim_size;

                long double m = 0.0L;
                for (int64_t i = 0; i < dim_size; ++i)
                {
                    m += static_cast<long double>(slice_in[ i ]);
                }
                m /= static_cast<long double>(dim_size);

                long double v = 0.0L;
                for (int64_t i = 0; i < dim_size; ++i)
                {
                    long double diff = static_cast<long double>(slice_in[ i ]) - m;
                    v += diff * diff;
                }
                v /= static_cast<long double>(dim_size);

                long double s = 1.0L / std::sqrt( v + eps );

                for (int64_t i = 0; i < dim_size; ++i)
                {
                    long double n = (static_cast<long double>(slice_in[ i ]) - m) * s;
                    long double o = n * static_cast<long double>(weight[ i ]);
                    if (bias)
                        o += static_cast<long double>(bias[ i ]);
                    slice_out[ i ] = static_cast<float>(o);
                }
            }
        }

        OperationType getOperationType() const override
        {
            return OperationType::LayerNormOp;
        }

        std::string getName() const override
        {
            return "Cpu::LayerNormOp";
        }

    private:
        std::shared_ptr<CpuExecutionContext> context_;
        LayerNormConfig config_;

        const float* weight_{ nullptr };
        const float* bias_{ nullptr };
    };

    class CpuLayerNormOpRegistrar
    {
    public:
        static void registerOperations()
        {
            OperationRegistry::instance().registerUnaryOperation<DeviceType::Cpu, TensorDataType::FP32, TensorDataType::FP32>(
                "LayerNormOp",
                []( std::shared_ptr<ExecutionContext<DeviceType::Cpu>> context,
                    const ComponentConfig& config ) -> std::shared_ptr<UnaryOperation<DeviceType::Cpu, TensorDataType::FP32>>
                {
                    const auto& ln_config = static_cast<const LayerNormConfig&>(config);
                    return std::make_shared<CpuLayerNormOp>( context, ln_config );
                }
            );

            Utils::Logger::trace( "Registered Cpu::LayerNormOp" );
        }
    };
}

#endif
