/**
 * @file CpuActivationOp.h
 * @brief CPU implementation of elementwise activation functions.
 */

#ifndef EMBER_DNN_COMPUTE_CPU_ACTIVATION_OP_H_
#define EMBER_DNN_COMPUTE_CPU_ACTIVATION_OP_H_

#include <cmath>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#ifdef USE_OMP
#include <omp.h>
#endif

#include "../../../../Common/ActivationType.h"
#include "../../../../Components/Activations/ActivationConfig.h"
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
     * @brief 1 / sqrt(2), used by the exact GELU: 0.5 * x * (1 + erf(x / sqrt(2))).
     */
    constexpr float GELU_INV_SQRT2 = 0.70710678118654752f;

    namespace Detail
    {
        inline float gelu( float x )
        {
            return 0.5f * x * (1.0f + std::erf( x * GELU_INV_SQRT2 ));
        }

        inline float relu( float x )
        {
            return x > 0.0f ? x : 0.0f;
        }

        inline float swish( float x )
        {
            return x / (1.0f + std::exp( -x ));
        }
    }

    /**
     * @brief Elementwise activation. The function is chosen once at construction.
     */
    class CpuActivationOp : public UnaryOperation<DeviceType::Cpu, TensorDataType::FP32>
    {
    public:
        using CpuExecutionContext = ExecutionContext<DeviceType::Cpu>;
        using ActivationFn = float (*)(float);

        CpuActivationOp( std::shared_ptr<CpuExecutionContext> context, const ActivationConfig& config )
            : context_( context ), config_( config ), fn_( selectFunction( config.getActivationType() ) )
        {
            if (!context_)
            {
                throw std::invalid_argument( "ExecutionContext cannot be null." );
            }

            config_.validate();
        }

        void forward( const ITensor& input, ITensor& output ) const override
        {
            if (input.size() != output.size())
            {
                throw std::invalid_argument( "CpuActivationOp::forward - input and output sizes differ" );
            }

            const float* X = static_cast<const float*>(input.rawData());
            float* Y = static_cast<float*>(output.rawData());
            const int64_t N = static_cast<int64_t>(input.size());
            const ActivationFn fn = fn_;

#pragma omp parallel for if( N > 4096 )
            for (int64_t i = 0; i < N; ++i)
            {
                Y[ i ] = fn( X[ i ] );
            }
        }

        ActivationType getActivationType() const
        {
            return config_.getActivationType();
        }

        OperationType getOperationType() const override
        {
            return OperationType::ActivationOp;
        }

        std::string getName() const override
        {
            return "Cpu::ActivationOp";
        }

    private:
        std::shared_ptr<CpuExecutionContext> context_;
        ActivationConfig config_;
        ActivationFn fn_;

        static ActivationFn selectFunction( ActivationType type )
        {
            switch (type)
            {
                case ActivationType::Gelu:  return &Detail::gelu;
                case ActivationType::Relu:  return &Detail::relu;
                case ActivationType::Swish: return &Detail::swish;
                default:
                    throw std::invalid_argument( "CpuActivationOp: unsupported activation type" );
            }
        }
    };

    class CpuActivationOpRegistrar
    {
    public:
        static void registerOperations()
        {
            OperationRegistry::instance().registerUnaryOperation<DeviceType::Cpu, TensorDataType::FP32, TensorDataType::FP32>(
                "ActivationOp",
                []( std::shared_ptr<ExecutionContext<DeviceType::Cpu>> context,
                    const ComponentConfig& config ) -> std::shared_ptr<UnaryOperation<DeviceType::Cpu, TensorDataType::FP32>>
                {
                    const auto& act_config = static_cast<const ActivationConfig&>(config);
                    return std::make_shared<CpuActivationOp>( context, act_config );
                }
            );

            Utils::Logger::trace( "Registered Cpu::ActivationOp" );
        }
    };
}

#endif
