/**
 * @file GptModel.h
 * @brief Decoder-only transformer language model with a weight-tied head.
 */

#ifndef EMBER_DNN_GPT_MODEL_H_
#define EMBER_DNN_GPT_MODEL_H_

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "../Common/CausalMask.h"
#include "../Common/RotaryEmbedding.h"
#include "../Components/Blocks/TransformerBlock.h"
#include "../Components/Component.h"
#include "../Components/Layers/Encoder.h"
#include "../Components/Layers/Linear.h"
#include "../Components/Losses/SoftmaxCrossEntropy.h"
#include "../Components/Normalization/LayerNorm.h"
#include "../Components/Regularization/Dropout.h"
#include "../Compute/DeviceType.h"
#include "../Compute/ExecutionContext.h"
#include "../Tensors/Tensor.h"
#include "../Tensors/TensorDataType.h"
#include "ModelConfig.h"

namespace Ember::Dnn
{
    /**
     * @brief Result of GptModel::forward.
     */
    struct ModelOutput
    {
        /// (B, T, V) next-token logits.
        CpuTensor<TensorDataType::FP32> logits;

        /// Shifted next-token cross-entropy, present when labels were supplied.
        std::optional<float> loss;

        /// One (B, NH, T, T) tensor per layer when attention was requested, empty otherwise.
        std::vector<CpuTensor<TensorDataType::FP32>> attention;
    };

    /**
     * @brief GPT-style language model: embeddings, pre-LN blocks, final LayerNorm, tied head.
     *
     * The model is built for (1, max_seq_len) at construction and accepts any
     * batch size and any sequence length up to max_seq_len afterwards. forward()
     * is const and keeps every intermediate tensor local to the call, so
     * concurrent inference calls against one model are safe.
     *
     * Parameters are enumerated with stable dotted names (wte, wpe,
     * blocks.<i>.ln_1.weight, blocks.<i>.attn.qkv.weight, ..., ln_f.bias). The
     * head is not listed separately because its weight is the wte tensor. wpe
     * exists only for learned position encodings; rotary models share one
     * cos/sin cache across all blocks.
     */
    class GptModel final : public Component<DeviceType::Cpu, TensorDataType::FP32>
    {
    public:
        using TensorType = CpuTensor<TensorDataType::FP32>;
        using TokenTensor = CpuTensor<TensorDataType::INT32>;
        using ComponentBase = Component<DeviceType::Cpu, TensorDataType::FP32>;

        /**
         * @brief Construct and initialize a model.
         *
         * Rank-2 weights and both embedding tables are drawn from
         * Normal(0, init_std), biases are zero, LayerNorm weights are one. With a
         * seed the draw is a pure function of it; otherwise it starts from the
         * generator installed on Utils::RandomGenerator.
         */
        GptModel( std::shared_ptr<CpuExecutionContext> exec_context, const ModelConfig& config,
            std::optional<unsigned int> seed = std::nullopt );

        /**
         * @brief Forward pass.
         *
         * @param input_ids (B, T) token ids in [0, vocab_size).
         * @param labels Optional (B, T) ids. Position t of the logits is scored
         *        against labels[t + 1]; labels equal to kIgnoreIndex are skipped.
         *        The loss is NaN when no position is scored.
         * @param return_attention Collect per-layer attention weights.
         *
         * @throws SequenceTooLongError If T exceeds max_seq_len
         * @throws std::out_of_range If an id or label is outside the vocabulary
         * @throws std::invalid_argument If a tensor has the wrong rank or shape
         */
        ModelOutput forward( const TokenTensor& input_ids, const TokenTensor* labels = nullptr,
            bool return_attention = false ) const;

        std::vector<NamedParameter> getNamedParameters() const override;

        /**
         * @brief Alias of getNamedParameters() for checkpoint layers.
         */
        std::vector<NamedParameter> namedParameters() const
        {
            return getNamedParameters();
        }

        /**
         * @brief Number of scalar parameters, optionally without the position table.
         */
        size_t parameterCount( bool non_embedding ) const;

        size_t parameterCount() const override
        {
            return parameterCount( false );
        }

        std::string getName() const override
        {
            return "gpt";
        }

        std::shared_ptr<ComputeDevice> getDevice() const override;

        std::string toString() const override;

        const ModelConfig& getConfig() const noexcept
        {
            return config_;
        }

        std::shared_ptr<TensorType> getTokenEmbedding() const noexcept
        {
            return encoder_->getTokenEmbedding();
        }

        /**
         * @brief The learned position table, or nullptr for sinusoidal and rotary encodings.
         */
        std::shared_ptr<TensorType> getPositionEmbedding() const noexcept
        {
            return encoder_->getPositionEmbedding();
        }

        /**
         * @brief Weight of the output projection; the same tensor as getTokenEmbedding().
         */
        std::shared_ptr<TensorType> getOutputWeight() const noexcept
        {
            return lm_head_->getWeight();
        }

        std::shared_ptr<const CausalMask> getCausalMask() const noexcept
        {
            return causal_mask_;
        }

        std::shared_ptr<const RotaryEmbedding> getRotaryEmbedding() const noexcept
        {
            return rotary_;
        }

        size_t numLayers() const noexcept
        {
            return blocks_.size();
        }

    protected:
        void onBuilding( const shape_t& input_shape ) override;

        void onTrainingChanging( bool is_training ) override;

    private:
        std::shared_ptr<CpuExecutionContext> exec_context_;
        ModelConfig config_;
        std::shared_ptr<const CausalMask> causal_mask_;
        std::shared_ptr<const RotaryEmbedding> rotary_;

        std::shared_ptr<Encoder<DeviceType::Cpu, TensorDataType::FP32>> encoder_;
        std::shared_ptr<Dropout<DeviceType::Cpu, TensorDataType::FP32>> embedding_dropout_;
        std::vector<std::shared_ptr<TransformerBlock<DeviceType::Cpu, TensorDataType::FP32>>> blocks_;
        std::shared_ptr<LayerNorm<DeviceType::Cpu, TensorDataType::FP32>> ln_f_;
        std::shared_ptr<Linear<DeviceType::Cpu, TensorDataType::FP32>> lm_head_;
        std::shared_ptr<SoftmaxCrossEntropy<DeviceType::Cpu, TensorDataType::FP32>> loss_;

        void createComponents();
        void initializeWeights( std::optional<unsigned int> seed );
        TokenTensor shiftLabels( const TokenTensor& labels, int64_t B, int64_t T ) const;
    };
}

#endif
