/**
 * @file CpuLinearOp.h
 * @brief CPU implementation of the Linear (fully connected) operation.
 */

#ifndef EMBER_DNN_COMPUTE_CPU_LINEAR_OP_H_
#define EMBER_DNN_COMPUTE_CPU_LINEAR_OP_H_

#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#ifdef USE_OMP
#include <omp.h>
#endif

#include <fmt/format.h>

#include "../../../../Components/Layers/LinearConfig.h"
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
     * @brief CPU implementation of Y = X * W^T + b where W is (out_features, in_features).
     *
     * The owning component binds weight and bias with setParameters(). The input
     * may have any rank; all leading dimensions are flattened into rows.
     */
    class CpuLinearOp : public UnaryOperation<DeviceType::Cpu, TensorDataType::FP32>
    {
    public:
        using UnaryOperationBase = UnaryOperation<DeviceType::Cpu, TensorDataType::FP32>;
        using CpuExecutionContext = ExecutionContext<DeviceType::Cpu>;

        CpuLinearOp( std::shared_ptr<CpuExecutionContext> context, const LinearConfig& config )
            : context_( context ), config_( config )
        {
            if (!context_)
            {
                throw std::runtime_error( "CpuLinearOp requires a CPU execution context" );
            }

            config_.validate();
        }

        // ====================================================================
        // Parameters
        // ====================================================================

        /**
         * @brief Set parameter tensor references (component remains owner).
         *
         * The weight is required; bias is bound only when the config has a bias.
         */
        void setParameters( ITensor* weight, ITensor* bias ) override
        {
            if (!weight)
            {
                throw std::invalid_argument( "CpuLinearOp::setParameters - weight parameter is required" );
            }

            const auto& weight_shape = weight->shape();
            if (weight_shape.size() != 2)
            {
                throw std::invalid_argument( "CpuLinearOp::setParameters - weight must be 2D tensor" );
            }

            weight_ = static_cast<const float*>(weight->rawData());
            weight_out_features_ = weight_shape[ 0 ];
            weight_in_features_ = weight_shape[ 1 ];

            if (config_.hasBias())
            {
                if (!bias)
                {
                    throw std::invalid_argument( "CpuLinearOp::setParameters - bias parameter expected but null was provided" );
                }

                bias_ = static_cast<const float*>(bias->rawData());
            }
            else
            {
                bias_ = nullptr;
            }
        }

        // ====================================================================
        // Lifecycle
        // ====================================================================

        /**
         * @brief Validate bound parameters against the input feature dimension.
         */
        void build( const shape_t& input_shape ) override
        {
            if (weight_ == nullptr)
            {
                throw std::runtime_error( "CpuLinearOp::build requires parameters bound via setParameters() before build()." );
            }

            if (config_.hasBias() && bias_ == nullptr)
            {
                throw std::runtime_error( "CpuLinearOp::build - bias expected by config but not bound via setParameters()." );
            }

            if (input_shape.empty())
            {
                throw std::invalid_argument( "CpuLinearOp::build - input shape cannot be empty" );
            }

            if (weight_out_features_ != config_.getOutputFeatures())
            {
                throw std::invalid_argument( fmt::format(
                    "CpuLinearOp::build - weight output features mismatch. Expected {}, got {}",
                    config_.getOutputFeatures(), weight_out_features_ ) );
            }

            if (weight_in_features_ != input_shape.back() || weight_in_features_ != config_.getInputFeatures())
            {
                throw std::invalid_argument( fmt::format(
                    "CpuLinearOp::build - weight input features mismatch. Expected {}, got {}",
                    input_shape.back(), weight_in_features_ ) );
            }

            in_features_ = weight_in_features_;
            out_features_ = weight_out_features_;

            UnaryOperationBase::build( input_shape );
        }

        // ====================================================================
        // Computation
        // ====================================================================

        void forward( const ITensor& input, ITensor& output ) const override
        {
            if (!is_built_)
            {
                throw std::runtime_error( "CpuLinearOp: forward called before build()" );
            }

            const auto& in_shape = input.shape();
            const auto& out_shape = output.shape();

            if (in_shape.empty() || in_shape.back() != in_features_)
            {
                throw std::invalid_argument( "CpuLinearOp::forward - input trailing dimension does not match in_features" );
            }

            const int64_t rows = static_cast<int64_t>(input.size()) / in_features_;

            if (out_shape.empty() || out_shape.back() != out_features_ ||
                static_cast<int64_t>(output.size()) != rows * out_features_)
            {
                throw std::invalid_argument( "CpuLinearOp::forward - output shape does not match (..., out_features)" );
            }

            const float* X = static_cast<const float*>(input.rawData());
            float* Y = static_cast<float*>(output.rawData());

            const bool enable_omp = rows > 100;

            if (rows % LOOP_UNROLL == 0)
            {
                forwardUnrolled( X, Y, weight_, bias_, rows, enable_omp );
            }
            else
            {
                forwardNaive( X, Y, weight_, bias_, rows, enable_omp );
            }
        }

        OperationType getOperationType() const override
        {
            return OperationType::LinearOp;
        }

        std::string getName() const override
        {
            return "Cpu::LinearOp";
        }

        const LinearConfig& getConfig() const
        {
            return config_;
        }

    private:
        static constexpr int LOOP_UNROLL = 8;

        std::shared_ptr<CpuExecutionContext> context_;
        LinearConfig config_;

        const float* weight_{ nullptr };
        const float* bias_{ nullptr };

        int64_t weight_out_features_{ 0 };
        int64_t weight_in_features_{ 0 };

        int64_t in_features_{ 0 };
        int64_t out_features_{ 0 };

        void forwardNaive( const float* X, float* Y, const float* W, const float* B,
            int64_t rows, bool enable_omp ) const
        {
            const int64_t in_features = in_features_;
            const int64_t out_features = out_features_;

#pragma omp parallel for if(enable_omp)
            for (int64_t idx = 0; idx < rows; ++idx)
            {
                const int64_t in_base = idx * in_features;
                const int64_t out_base = idx * out_features;

                for (int64_t o = 0; o < out_features; ++o)
                {
                    long double acc = 0.0L;

                    for (int64_t i = 0; i < in_features; ++i)
                    {
                        acc += static_cast<long double>(X[ in_base + i ]) *
                            static_cast<long double>(W[ o * in_features + i ]);
                    }

                    if (B)
                        acc += static_cast<long double>(B[ o ]);

                    Y[ out_base + o ] = static_cast<float>(acc);
                }
            }
        }

        /**
         * @brief Processes LOOP_UNROLL rows per weight row for better cache reuse.
         */
        void forwardUnrolled( const float* X, float* Y, const float* W, const float* B,
            int64_t rows, bool enable_omp ) const
        {
            const int64_t in_features = in_features_;
            const int64_t out_features = out_features_;

#pragma omp parallel for if(enable_omp)
            for (int64_t row = 0; row < rows; row += LOOP_UNROLL)
            {
                for (int64_t o = 0; o < out_features; ++o)
                {
                    double result[ LOOP_UNROLL ];

                    for (int u = 0; u < LOOP_UNROLL; ++u)
                    {
                        result[ u ] = B ? static_cast<double>(B[ o ]) : 0.0;
                    }

                    for (int64_t i = 0; i < in_features; ++i)
                    {
                        const double w = W[ o * in_features + i ];

                        for (int u = 0; u < LOOP_UNROLL; ++u)
                        {
                            result[ u ] += static_cast<double>(X[ (row + u) * in_features + i ]) * w;
                        }
                    }

                    for (int u = 0; u < LOOP_UNROLL; ++u)
                    {
                        Y[ (row + u) * out_features + o ] = static_cast<float>(result[ u ]);
                    }
                }
            }
        }
    };

    class CpuLinearOpRegistrar
    {
    public:
        static void registerOperations()
        {
            OperationRegistry::instance().registerUnaryOperation<DeviceType::Cpu, TensorDataType::FP32, TensorDataType::FP32>(
                "LinearOp",
                []( std::shared_ptr<ExecutionContext<DeviceType::Cpu>> context,
                    const ComponentConfig& config ) -> std::shared_ptr<UnaryOperation<DeviceType::Cpu, TensorDataType::FP32>>
                {
                    const auto& linear_config = static_cast<const LinearConfig&>(config);
                    return std::make_shared<CpuLinearOp>( context, linear_config );
                }
            );

            Utils::Logger::trace( "Registered Cpu::LinearOp" );
        }
    };
}

#endif
