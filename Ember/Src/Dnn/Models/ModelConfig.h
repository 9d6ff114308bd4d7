/**
 * @file ModelConfig.h
 * @brief Hyperparameters of a GPT-style language model.
 */

#ifndef EMBER_DNN_MODEL_CONFIG_H_
#define EMBER_DNN_MODEL_CONFIG_H_

#include <cstddef>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "../Common/ActivationType.h"
#include "../Common/Errors.h"
#include "../Common/PositionEncoding.h"
#include "../Tensors/TensorDataType.h"

namespace Ember::Dnn
{
    using json = nlohmann::json;

    /**
     * @brief Immutable hyperparameter set for GptModel.
     *
     * A ModelConfig is always valid: the constructor and every with* method
     * validate the complete value and throw ConfigError on failure. The with*
     * methods return a modified copy and leave the receiver unchanged.
     *
     * @code
     * auto config = ModelConfig( 100, 16, 32, 2, 4 ).withDropout( 0.0f ).withActivation( "relu" );
     * @endcode
     */
    class ModelConfig
    {
    public:
        /**
         * @throws ConfigError If a size is not positive or embed_dim is not divisible by num_heads
         */
        ModelConfig( dim_t vocab_size, dim_t max_seq_len, dim_t embed_dim, dim_t num_layers, dim_t num_heads );

        ModelConfig withFfDim( dim_t ff_dim ) const;
        ModelConfig withDropout( float dropout ) const;
        ModelConfig withAttentionDropout( float attention_dropout ) const;
        ModelConfig withActivation( ActivationType activation ) const;
        ModelConfig withActivation( const std::string& activation ) const;
        ModelConfig withLayerNormEpsilon( float layer_norm_eps ) const;
        ModelConfig withInitStd( float init_std ) const;

        /**
         * @throws ConfigError For rotary encoding when the head width is odd
         */
        ModelConfig withPositionEncoding( PositionEncoding encoding ) const;
        ModelConfig withPositionEncoding( const std::string& encoding ) const;

        dim_t getVocabSize() const { return vocab_size_; }
        dim_t getMaxSeqLen() const { return max_seq_len_; }
        dim_t getEmbedDim() const { return embed_dim_; }
        dim_t getNumLayers() const { return num_layers_; }
        dim_t getNumHeads() const { return num_heads_; }
        float getDropout() const { return dropout_; }
        float getAttentionDropout() const { return attention_dropout_; }
        ActivationType getActivation() const { return activation_; }
        float getLayerNormEpsilon() const { return layer_norm_eps_; }
        float getInitStd() const { return init_std_; }
        PositionEncoding getPositionEncoding() const { return position_encoding_; }

        /**
         * @brief Width of one attention head, embed_dim / num_heads.
         */
        dim_t getHeadDim() const { return embed_dim_ / num_heads_; }

        /**
         * @brief Feed-forward hidden width; 4 * embed_dim unless set explicitly.
         */
        dim_t getFfDim() const { return ff_dim_; }

        /**
         * @brief Exact number of distinct scalar parameters of a GptModel built from this config.
         *
         * The tied output head adds nothing. The position table counts only for
         * learned encodings, and non_embedding excludes it.
         */
        size_t numParameters( bool non_embedding = false ) const;

        json toJson() const;

        /**
         * @brief Builds a validated config from its JSON form.
         *
         * The five sizes are required; other keys fall back to their defaults.
         *
         * @throws ConfigError If a key is missing, mistyped or out of range
         */
        static ModelConfig fromJson( const json& j );

        std::string toString() const;

        bool operator==( const ModelConfig& other ) const = default;

    private:
        dim_t vocab_size_;
        dim_t max_seq_len_;
        dim_t embed_dim_;
        dim_t num_layers_;
        dim_t num_heads_;
        dim_t ff_dim_;
        float dropout_{ 0.1f };
        float attention_dropout_{ 0.1f };
        ActivationType activation_{ ActivationType::Gelu };
        float layer_norm_eps_{ 1e-5f };
        float init_std_{ 0.02f };
        PositionEncoding position_encoding_{ PositionEncoding::Learned };

        void validate() const;
    };

    /**
     * @brief Named preset lookup, case-insensitive.
     *
     * @throws ConfigError If the name is not one of availableConfigs()
     */
    ModelConfig getConfig( const std::string& name );

    /**
     * @brief Preset names in ascending size order.
     */
    std::vector<std::string> availableConfigs();
}

#endif
