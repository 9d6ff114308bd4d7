/**
 * @file Generator.h
 * @brief Autoregressive decoding over a GptModel, one step at a time or all at once.
 */

#ifndef EMBER_DNN_GENERATOR_H_
#define EMBER_DNN_GENERATOR_H_

#include <cstdint>
#include <memory>
#include <random>
#include <vector>

#include "../Models/GptModel.h"
#include "../Tensors/Tensor.h"
#include "../Tensors/TensorDataType.h"
#include "GenerationConfig.h"

namespace Ember::Dnn
{
    /**
     * @brief Mutable state of one generation request.
     *
     * Owned by a single caller. The sequences keep the full prompt; the model
     * only ever sees the trailing max_seq_len tokens of each row.
     */
    struct GenerationState
    {
        std::vector<std::vector<int32_t>> sequences;
        std::vector<bool> finished;
        int64_t prompt_length{ 0 };
        int64_t steps{ 0 };
        int64_t max_new_tokens{ 0 };
        std::mt19937 generator;

        /**
         * @brief True once max_new_tokens were produced or every row emitted the end-of-sequence id.
         */
        bool isFinished() const
        {
            if (steps >= max_new_tokens)
                return true;

            for (bool row_finished : finished)
            {
                if (!row_finished)
                    return false;
            }
            return !finished.empty();
        }
    };

    /**
     * @brief Tokens appended by one step, one per batch row.
     */
    struct StepResult
    {
        std::vector<int32_t> tokens;
        bool finished{ false };
    };

    /**
     * @brief Decoding loop: crop, forward, temperature, top-k, top-p, softmax, select.
     *
     * The Generator holds only its configuration and the model, so one instance
     * may serve concurrent requests as long as each owns its GenerationState.
     * Every step recomputes the full forward pass over the cropped context.
     */
    class Generator
    {
    public:
        using TokenTensor = CpuTensor<TensorDataType::INT32>;

        /**
         * @throws ConfigError If the configuration is invalid
         * @throws std::invalid_argument If the model is null
         */
        Generator( std::shared_ptr<const GptModel> model, const GenerationConfig& config );

        /**
         * @brief Start a request from a rectangular (B, T0) prompt.
         *
         * @throws std::invalid_argument If the prompt is empty or ragged
         * @throws std::out_of_range If a prompt id is outside the vocabulary
         */
        GenerationState begin( const std::vector<std::vector<int32_t>>& prompt ) const;

        GenerationState begin( const TokenTensor& prompt ) const;

        /**
         * @brief Produce and append one token per row.
         *
         * @throws std::runtime_error If the state is already finished
         * @throws NumericalError If a row's filtered distribution is not usable
         */
        StepResult step( GenerationState& state ) const;

        /**
         * @brief Run a request to completion and return every row, prompt included.
         */
        std::vector<std::vector<int32_t>> generate( const std::vector<std::vector<int32_t>>& prompt ) const;

        /**
         * @brief Tensor form of generate(), returning (B, T0 + n).
         */
        TokenTensor generate( const TokenTensor& prompt ) const;

        const GenerationConfig& getConfig() const noexcept
        {
            return config_;
        }

    private:
        std::shared_ptr<const GptModel> model_;
        GenerationConfig config_;

        TokenTensor contextOf( const GenerationState& state ) const;
        int32_t selectToken( std::vector<float>& logits, std::mt19937& generator ) const;
    };
}

#endif
