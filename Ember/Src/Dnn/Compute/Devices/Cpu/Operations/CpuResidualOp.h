/**
 * @file CpuResidualOp.h
 * @brief CPU implementation of the residual (y = a + b) binary operation.
 */

#ifndef EMBER_DNN_COMPUTE_CPU_RESIDUAL_OP_H_
#define EMBER_DNN_COMPUTE_CPU_RESIDUAL_OP_H_

#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#ifdef USE_OMP
#include <omp.h>
#endif

#include "../../../../Components/Connections/ResidualConfig.h"
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
    class CpuResidualOp : public BinaryOperation<DeviceType::Cpu, TensorDataType::FP32>
    {
    public:
        using CpuExecutionContext = ExecutionContext<DeviceType::Cpu>;

        CpuResidualOp( std::shared_ptr<CpuExecutionContext> context, const ResidualConfig& config )
            : context_( context ), config_( config )
        {
            if (!context_)
            {
                throw std::invalid_argument( "ExecutionContext cannot be null." );
            }

            config_.validate();
        }

        /**
         * @brief Elementwise a + b. Output may alias either input.
         */
        void forward( const ITensor& inputA, const ITensor& inputB, ITensor& output ) const override
        {
            if (inputA.size() != inputB.size() || inputA.size() != output.size())
            {
                throw std::invalid_argument( "CpuResidualOp::forward - input and output sizes must match" );
            }

            const float* A = static_cast<const float*>(inputA.rawData());
            const float* B = static_cast<const float*>(inputB.rawData());
            float* Y = static_cast<float*>(output.rawData());
            const int64_t N = static_cast<int64_t>(output.size());

#pragma omp parallel for if( N > 4096 )
            for (int64_t i = 0; i < N; ++i)
            {
                Y[ i ] = A[ i ] + B[ i ];
            }
        }

        OperationType getOperationType() const override
        {
            return OperationType::ResidualOp;
        }

        std::string getName() const override
        {
            return "Cpu::ResidualOp";
        }

    private:
        std::shared_ptr<CpuExecutionContext> context_;
        ResidualConfig config_;
    };

    class CpuResidualOpRegistrar
    {
    public:
        static void registerOperations()
        {
            OperationRegistry::instance().registerBinaryOperation<DeviceType::Cpu, TensorDataType::FP32, TensorDataType::FP32, TensorDataType::FP32>(
                "ResidualOp",
                []( std::shared_ptr<ExecutionContext<DeviceType::Cpu>> context,
                    const ComponentConfig& config ) -> std::shared_ptr<BinaryOperation<DeviceType::Cpu, TensorDataType::FP32>>
                {
                    const auto& residual_config = static_cast<const ResidualConfig&>(config);
                    return std::make_shared<CpuResidualOp>( context, residual_config );
                }
            );

            Utils::Logger::trace( "Registered Cpu::ResidualOp" );
        }
    };
}

#endif
