/**
 * @file CpuAttentionOp.h
 * @brief CPU implementation of causal multi-head scaled dot-product attention.
 */

#ifndef EMBER_DNN_COMPUTE_CPU_ATTENTION_OP_H_
#define EMBER_DNN_COMPUTE_CPU_ATTENTION_OP_H_

#include <cmath>
#include <algorithm>
#include <cstdint>
#include <functional>
#include <limits>
#include <memory>
#include <mutex>
#include <random>
#include <stdexcept>
#include <string>
#include <vector>
#ifdef USE_OMP
#include <omp.h>
#endif

#include <fmt/format.h>

#include "../../../../Common/CausalMask.h"
#include "../../../../Common/RotaryEmbedding.h"
#include "../../../../Components/Layers/AttentionConfig.h"
#include "../../../../Tensors/ITensor.h"
#include "../../../../Tensors/TensorDataType.h"
#include "../../../../../Utils/Logger.h"
#include "../../../../../Utils/RandomGenerator.h"
#include "../../../DeviceType.h"
#include "../../../ExecutionContext.h"
#include "../../../Operations/AttentionOperation.h"
#include "../../../Operations/OperationRegistry.h"
#include "../../../Operations/OperationType.h"

namespace Ember::Dnn::Compute
{
    /**
     * @brief Causal multi-head attention over a fused QKV projection.
     *
     * Input layout is [B, T, 3C] with Q in channels [0, C), K in [C, 2C) and
     * V in [2C, 3C); head h uses the hs = C / NH channels starting at h * hs
     * inside each section. For every (b, h):
     *
     *   scores[i, j] = (Q[i] . K[j]) * hs^-0.5, set to -inf where mask(i, j) == 0
     *   att[i, :]    = softmax(scores[i, :]) (max-subtracted)
     *   out[i]       = sum_j att[i, j] * V[j]
     *
     * Heads are concatenated back into [B, T, C]. The output projection is a
     * separate Linear owned by the component.
     *
     * With a rotary embedding configured, each Q and K head vector at
     * position t is rotated by the cached angles for t before scoring. V is
     * left unrotated.
     */
    class CpuAttentionOp : public AttentionOperation<DeviceType::Cpu, TensorDataType::FP32>
    {
    public:
        using CpuExecutionContext = ExecutionContext<DeviceType::Cpu>;
        using AttentionOperation<DeviceType::Cpu, TensorDataType::FP32>::forward;

        explicit CpuAttentionOp( std::shared_ptr<CpuExecutionContext> context, const AttentionConfig& config )
            : context_( context ), config_( config ),
            generator_( Utils::RandomGenerator::getInstance().deriveGenerator(
                static_cast<unsigned int>(std::hash<std::string>{}(config.getName() + ".attn_dropout")) ) )
        {
            if (!context_)
            {
                throw std::invalid_argument( "ExecutionContext cannot be null." );
            }

            config_.validate();

            mask_ = config_.getCausalMask()
                ? config_.getCausalMask()
                : std::make_shared<const CausalMask>( config_.getMaxSequenceLength() );

            if (config_.getRotaryEmbedding())
            {
                rotary_ = RotaryEmbedding::extend( config_.getRotaryEmbedding(), config_.getMaxSequenceLength() );
            }

            is_training_ = config_.isTraining();
        }

        ~CpuAttentionOp() override = default;

        /**
         * @brief Validate the maximum model-layout input shape [B, T, 3C].
         */
        void build( const shape_t& input_shape ) override
        {
            validateInputShape( input_shape, "CpuAttentionOp::build" );
            AttentionOperation<DeviceType::Cpu, TensorDataType::FP32>::build( input_shape );
        }

        void forward( const ITensor& input_qkv, ITensor& output, ITensor* attention_weights ) const override
        {
            if (!is_built_)
            {
                throw std::runtime_error( "CpuAttentionOp: forward called before build()" );
            }

            const auto& in_shape = input_qkv.shape();
            validateInputShape( in_shape, "CpuAttentionOp::forward" );

            const int64_t B = in_shape[ 0 ];
            const int64_t T = in_shape[ 1 ];
            const int64_t C = config_.getEmbeddingDim();
            const int64_t NH = config_.getNumHeads();
            const int64_t hs = config_.getHeadDim();

            const auto& out_shape = output.shape();
            if (out_shape.size() != 3 || out_shape[ 0 ] != B || out_shape[ 1 ] != T || out_shape[ 2 ] != C)
            {
                throw std::invalid_argument( "CpuAttentionOp::forward - output must have shape [B, T, C]" );
            }

            std::vector<float> scratch;
            float* att_data = nullptr;

            if (attention_weights)
            {
                const auto& w_shape = attention_weights->shape();
                if (w_shape.size() != 4 || w_shape[ 0 ] != B || w_shape[ 1 ] != NH || w_shape[ 2 ] != T || w_shape[ 3 ] != T)
                {
                    throw std::invalid_argument( "CpuAttentionOp::forward - attention weights must have shape [B, NH, T, T]" );
                }
                att_data = static_cast<float*>(attention_weights->rawData());
            }
            else
            {
                scratch.resize( static_cast<size_t>(B * NH * T * T) );
                att_data = scratch.data();
            }

            const float* in_data = static_cast<const float*>(input_qkv.rawData());
            float* out_data = static_cast<float*>(output.rawData());

            const float scale = 1.0f / std::sqrt( static_cast<float>(hs) );
            const int64_t last_stride = 3 * C;

            // Q and K are read from the input, or from a rotated [B, T, 2C] copy.
            std::vector<float> rotated;
            const float* q_base = in_data;
            const float* k_base = in_data + C;
            int64_t qk_stride = last_stride;

            if (rotary_)
            {
                rotated.resize( static_cast<size_t>(B * T * 2 * C) );
                const RotaryEmbedding& rope = *rotary_;

#pragma omp parallel for collapse(2) if( B * T > 16 )
                for (int64_t b = 0; b < B; b++)
                {
                    for (int64_t t = 0; t < T; t++)
                    {
                        const float* src = in_data + (b * T + t) * last_stride;
                        float* dst = rotated.data() + (b * T + t) * 2 * C;
                        std::copy( src, src + 2 * C, dst );

                        for (int64_t h = 0; h < 2 * NH; h++)
                        {
                            rope.rotate( dst + h * hs, t );
                        }
                    }
                }

                q_base = rotated.data();
                k_base = rotated.data() + C;
                qk_stride = 2 * C;
            }
            const CausalMask& mask = *mask_;
            const float neg_inf = -std::numeric_limits<float>::infinity();

            // Step 1: masked scores and softmax per (b, h, i)
#pragma omp parallel for collapse(3) if( B * NH * T > 16 )
            for (int64_t b = 0; b < B; b++)
            {
                for (int64_t h = 0; h < NH; h++)
                {
                    for (int64_t i = 0; i < T; i++)
                    {
                        float* att_row = att_data + ((b * NH + h) * T + i) * T;
                        const float* q = q_base + (b * T + i) * qk_stride + h * hs;
                        const uint8_t* mask_row = mask.row( i );

                        float maxval = neg_inf;
                        for (int64_t j = 0; j < T; j++)
                        {
                            if (!mask_row[ j ])
                            {
                                att_row[ j ] = neg_inf;
                                continue;
                            }

                            const float* k = k_base + (b * T + j) * qk_stride + h * hs;
                            double dot = 0.0;
                            for (int64_t d = 0; d < hs; d++)
                            {
                                dot += static_cast<double>(q[ d ]) * static_cast<double>(k[ d ]);
                            }

                            att_row[ j ] = static_cast<float>(dot) * scale;
                            if (att_row[ j ] > maxval) maxval = att_row[ j ];
                        }

                        double expsum = 0.0;
                        for (int64_t j = 0; j < T; j++)
                        {
                            const float e = mask_row[ j ] ? std::exp( att_row[ j ] - maxval ) : 0.0f;
                            att_row[ j ] = e;
                            expsum += e;
                        }

                        const float expsum_inv = (expsum > 0.0) ? static_cast<float>(1.0 / expsum) : 0.0f;
                        for (int64_t j = 0; j < T; j++)
                        {
                            att_row[ j ] *= expsum_inv;
                        }
                    }
                }
            }

            // Step 2: dropout on attention weights, training mode only
            if (is_training_ && config_.getDropout() > 0.0f)
            {
                applyDropout( att_data, static_cast<size_t>(B * NH * T * T) );
            }

            // Step 3: out = att x V, written into model layout [B, T, C]
#pragma omp parallel for collapse(3) if( B * NH * T > 16 )
            for (int64_t b = 0; b < B; b++)
            {
                for (int64_t h = 0; h < NH; h++)
                {
                    for (int64_t i = 0; i < T; i++)
                    {
                        const float* att_row = att_data + ((b * NH + h) * T + i) * T;
                        float* out = out_data + (b * T + i) * C + h * hs;

                        for (int64_t d = 0; d < hs; d++)
                        {
                            double acc = 0.0;
                            for (int64_t j = 0; j <= i; j++)
                            {
                                const float* v = in_data + (b * T + j) * last_stride + 2 * C + h * hs;
                                acc += static_cast<double>(att_row[ j ]) * static_cast<double>(v[ d ]);
                            }
                            out[ d ] = static_cast<float>(acc);
                        }
                    }
                }
            }
        }

        const CausalMask& getCausalMask() const
        {
            return *mask_;
        }

        /**
         * @brief The rotary cache in use, or nullptr when positions are not rotated.
         */
        const std::shared_ptr<const RotaryEmbedding>& getRotaryEmbedding() const
        {
            return rotary_;
        }

        OperationType getOperationType() const override
        {
            return OperationType::AttentionOp;
        }

        std::string getName() const override
        {
            return "Cpu::AttentionOp";
        }

    private:
        std::shared_ptr<CpuExecutionContext> context_;
        AttentionConfig config_;
        std::shared_ptr<const CausalMask> mask_;
        std::shared_ptr<const RotaryEmbedding> rotary_;

        mutable std::mt19937 generator_;
        mutable std::mutex mutex_;

        void validateInputShape( const shape_t& shape, const char* caller ) const
        {
            if (shape.size() != 3 || shape[ 2 ] != 3 * config_.getEmbeddingDim())
            {
                throw std::invalid_argument( fmt::format(
                    "{} - input must have shape [B, T, 3 * {}]", caller, config_.getEmbeddingDim() ) );
            }

            if (shape[ 1 ] > mask_->maxSequenceLength() || shape[ 1 ] > config_.getMaxSequenceLength())
            {
                throw std::invalid_argument( fmt::format(
                    "{} - sequence length {} exceeds maximum {}", caller, shape[ 1 ], config_.getMaxSequenceLength() ) );
            }
        }

        void applyDropout( float* data, size_t n ) const
        {
            const float p = config_.getDropout();
            const float keep_scale = 1.0f / (1.0f - p);
            std::bernoulli_distribution drop( p );

            std::lock_guard<std::mutex> lock( mutex_ );
            for (size_t i = 0; i < n; ++i)
            {
                data[ i ] = drop( generator_ ) ? 0.0f : data[ i ] * keep_scale;
            }
        }
    };

    class CpuAttentionOpRegistrar
    {
    public:
        static void registerOperations()
        {
            OperationRegistry::instance().registerUnaryOperation<DeviceType::Cpu, TensorDataType::FP32, TensorDataType::FP32>(
                "AttentionOp",
                []( std::shared_ptr<ExecutionContext<DeviceType::Cpu>> context,
                    const ComponentConfig& config ) -> std::shared_ptr<UnaryOperation<DeviceType::Cpu, TensorDataType::FP32>>
                {
                    const auto& attention_config = static_cast<const AttentionConfig&>(config);
                    return std::make_shared<CpuAttentionOp>( context, attention_config );
                }
            );

            Utils::Logger::trace( "Registered Cpu::AttentionOp" );
        }
    };
}

#endif
