/**
 * @file CpuEncoderOp.h
 * @brief CPU implementation of token and position embedding lookup.
 */

#ifndef EMBER_DNN_COMPUTE_CPU_ENCODER_OP_H_
#define EMBER_DNN_COMPUTE_CPU_ENCODER_OP_H_

#include <cmath>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>
#ifdef USE_OMP
#include <omp.h>
#endif

#include <fmt/format.h>

#include "../../../../Common/Errors.h"
#include "../../../../Common/PositionEncoding.h"
#include "../../../../Components/Layers/EncoderConfig.h"
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
     * @brief CPU encoder: out[b, t, :] = wte[ids[b, t], :] * scale + pe[t, :].
     *
     * Input is an INT32 tensor (B, T); output is FP32 (B, T, C). The scale is
     * sqrt(C) when the configuration enables embedding scaling and 1 otherwise.
     *
     * pe is the bound wpe table for learned encodings, the fixed table
     * pe[t, 2i] = sin(t / 10000^(2i/C)), pe[t, 2i+1] = cos(t / 10000^(2i/C))
     * for sinusoidal encodings, and zero for rotary encodings.
     *
     * - `setParameters(wte, wpe)` binds the token table (V, C) and, for learned
     *   encodings only, the position table (S, C). The component keeps ownership.
     * - Token ids outside [0, V) raise std::out_of_range.
     * - T greater than S raises SequenceTooLongError.
     */
    class CpuEncoderOp : public UnaryOperation<DeviceType::Cpu, TensorDataType::INT32, TensorDataType::FP32>
    {
    public:
        using OperationBase = UnaryOperation<DeviceType::Cpu, TensorDataType::INT32, TensorDataType::FP32>;
        using CpuExecutionContext = ExecutionContext<DeviceType::Cpu>;

        explicit CpuEncoderOp( std::shared_ptr<CpuExecutionContext> context, const EncoderConfig& config )
            : context_( context ), config_( config )
        {
            if (!context)
            {
                throw std::invalid_argument( "ExecutionContext cannot be null." );
            }

            config_.validate();

            scale_ = config_.scaleEmbeddings()
                ? std::sqrt( static_cast<float>(config_.getChannels()) )
                : 1.0f;

            if (config_.getPositionEncoding() == PositionEncoding::Sinusoidal)
            {
                buildSinusoidTable();
            }
        }

        void setParameters( ITensor* wte, ITensor* wpe ) override
        {
            if (!wte)
            {
                throw std::invalid_argument( "CpuEncoderOp::setParameters - wte parameter is required" );
            }

            if (wte->getDeviceType() != DeviceType::Cpu)
            {
                throw std::invalid_argument( "CpuEncoderOp::setParameters - parameters must be CPU tensors" );
            }

            const auto& wte_shape = wte->shape();
            if (wte_shape.size() != 2 ||
                wte_shape[ 0 ] != config_.getVocabularyLength() ||
                wte_shape[ 1 ] != config_.getChannels())
            {
                throw std::invalid_argument( "CpuEncoderOp::setParameters - wte shape mismatch" );
            }

            wte_ = static_cast<const float*>(wte->rawData());

            if (!config_.hasPositionTable())
            {
                if (wpe)
                {
                    throw std::invalid_argument( fmt::format(
                        "CpuEncoderOp::setParameters - {} position encoding takes no wpe parameter",
                        positionEncodingToString( config_.getPositionEncoding() ) ) );
                }

                return;
            }

            if (!wpe)
            {
                throw std::invalid_argument( "CpuEncoderOp::setParameters - wpe parameter is required" );
            }

            if (wpe->getDeviceType() != DeviceType::Cpu)
            {
                throw std::invalid_argument( "CpuEncoderOp::setParameters - parameters must be CPU tensors" );
            }

            const auto& wpe_shape = wpe->shape();
            if (wpe_shape.size() != 2 ||
                wpe_shape[ 0 ] != config_.getMaxSequenceLength() ||
                wpe_shape[ 1 ] != config_.getChannels())
            {
                throw std::invalid_argument( "CpuEncoderOp::setParameters - wpe shape mismatch" );
            }

            wpe_ = static_cast<const float*>(wpe->rawData());
        }

        void build( const shape_t& input_shape ) override
        {
            if (wte_ == nullptr || (config_.hasPositionTable() && wpe_ == nullptr))
            {
                throw std::runtime_error( "CpuEncoderOp::build requires parameters bound via setParameters() before build()." );
            }

            if (input_shape.size() != 2)
            {
                throw std::invalid_argument( "CpuEncoderOp::build - input must have shape (B, T)" );
            }

            if (input_shape[ 1 ] > config_.getMaxSequenceLength())
            {
                throw SequenceTooLongError( input_shape[ 1 ], config_.getMaxSequenceLength() );
            }

            OperationBase::build( input_shape );
        }

        void forward( const ITensor& input, ITensor& output ) const override
        {
            if (!is_built_)
            {
                throw std::runtime_error( "CpuEncoderOp: forward called before build()" );
            }

            const auto& in_shape = input.shape();
            if (in_shape.size() != 2)
            {
                throw std::invalid_argument( "CpuEncoderOp::forward - input must have shape (B, T)" );
            }

            const int64_t B = in_shape[ 0 ];
            const int64_t T = in_shape[ 1 ];
            const int64_t C = config_.getChannels();
            const int64_t V = config_.getVocabularyLength();

            if (T > config_.getMaxSequenceLength())
            {
                throw SequenceTooLongError( T, config_.getMaxSequenceLength() );
            }

            const auto& out_shape = output.shape();
            if (out_shape.size() != 3 || out_shape[ 0 ] != B || out_shape[ 1 ] != T || out_shape[ 2 ] != C)
            {
                throw std::invalid_argument( "CpuEncoderOp::forward - output must have shape (B, T, C)" );
            }

            const int32_t* X = static_cast<const int32_t*>(input.rawData());
            float* Y = static_cast<float*>(output.rawData());

            // Validate every id up front so no exception escapes the parallel region.
            for (int64_t i = 0; i < B * T; ++i)
            {
                if (X[ i ] < 0 || X[ i ] >= V)
                {
                    throw std::out_of_range( fmt::format(
                        "CpuEncoderOp::forward - token id {} at position {} outside vocabulary [0, {})", X[ i ], i, V ) );
                }
            }

            const float scale = scale_;
            const float* wte = wte_;
            // Null for rotary encodings.
            const float* pe = config_.hasPositionTable() ? wpe_ : (sinusoid_.empty() ? nullptr : sinusoid_.data());

#pragma omp parallel for collapse(2) if( B * T > 100 )
            for (int64_t b = 0; b < B; ++b)
            {
                for (int64_t t = 0; t < T; ++t)
                {
                    float* out_bt = Y + (b * T + t) * C;
                    const float* wte_ix = wte + static_cast<int64_t>(X[ b * T + t ]) * C;

                    if (pe == nullptr)
                    {
                        for (int64_t c = 0; c < C; ++c)
                        {
                            out_bt[ c ] = wte_ix[ c ] * scale;
                        }
                        continue;
                    }

                    const float* pe_t = pe + t * C;
                    for (int64_t c = 0; c < C; ++c)
                    {
                        out_bt[ c ] = wte_ix[ c ] * scale + pe_t[ c ];
                    }
                }
            }
        }

        OperationType getOperationType() const override
        {
            return OperationType::EncoderOp;
        }

        std::string getName() const override
        {
            return "Cpu::EncoderOp";
        }

        /**
         * @brief The fixed position table, empty unless the encoding is sinusoidal.
         */
        const std::vector<float>& getSinusoidTable() const noexcept
        {
            return sinusoid_;
        }

    private:
        std::shared_ptr<CpuExecutionContext> context_;
        EncoderConfig config_;
        float scale_{ 1.0f };

        const float* wte_{ nullptr };
        const float* wpe_{ nullptr };

        std::vector<float> sinusoid_;

        void buildSinusoidTable()
        {
            const int64_t S = config_.getMaxSequenceLength();
            const int64_t C = config_.getChannels();
            const double log_base = std::log( 10000.0 );

            sinusoid_.assign( static_cast<size_t>(S * C), 0.0f );

            for (int64_t t = 0; t < S; ++t)
            {
                float* row = sinusoid_.data() + t * C;
                for (int64_t c = 0; c < C; c += 2)
                {
                    const double angle = static_cast<double>(t) * std::exp( -static_cast<double>(c) * log_base / static_cast<double>(C) );
                    row[ c ] = static_cast<float>(std::sin( angle ));
                    if (c + 1 < C)
                    {
                        row[ c + 1 ] = static_cast<float>(std::cos( angle ));
                    }
                }
            }
        }
    };

    class CpuEncoderOpRegistrar
    {
    public:
        static void registerOperations()
        {
            OperationRegistry::instance().registerUnaryOperation<DeviceType::Cpu, TensorDataType::INT32, TensorDataType::FP32>(
                "EncoderOp",
                []( std::shared_ptr<ExecutionContext<DeviceType::Cpu>> context,
                    const ComponentConfig& config ) -> std::shared_ptr<UnaryOperation<DeviceType::Cpu, TensorDataType::INT32, TensorDataType::FP32>>
                {
                    const auto& encoder_config = static_cast<const EncoderConfig&>(config);
                    return std::make_shared<CpuEncoderOp>( context, encoder_config );
                }
            );

            Utils::Logger::trace( "Registered Cpu::EncoderOp" );
        }
    };
}

#endif
