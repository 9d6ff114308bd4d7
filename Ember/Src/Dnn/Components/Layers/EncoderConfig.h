/**
 * @file EncoderConfig.h
 * @brief Configuration for the token and position embedding component.
 */

#ifndef EMBER_DNN_ENCODER_CONFIG_H_
#define EMBER_DNN_ENCODER_CONFIG_H_

#include <sstream>
#include <stdexcept>
#include <string>

#include "../../Common/ComponentConfig.h"
#include "../../Common/PositionEncoding.h"
#include "../../Tensors/TensorDataType.h"

namespace Ember::Dnn
{
    /**
     * @brief Configuration for the Encoder component.
     *
     * The encoder owns a token table (vocabulary_length x channels). With learned
     * position encoding it also owns a position table (max_sequence_length x
     * channels); sinusoidal encoding adds a fixed table instead and rotary
     * encoding adds nothing here, leaving positions to the attention layers.
     */
    class EncoderConfig : public ComponentConfigBase<EncoderConfig> {
    public:
        EncoderConfig() {
            name_ = "encoder";
        }

        EncoderConfig& withChannels( dim_t channels ) {
            channels_ = channels;
            return *this;
        }

        EncoderConfig& withMaxSequenceLength( dim_t max_seq_len ) {
            max_seq_len_ = max_seq_len;
            return *this;
        }

        EncoderConfig& withVocabularyLength( dim_t vocab_len ) {
            vocab_len_ = vocab_len;
            return *this;
        }

        /**
         * @brief Multiply token embeddings by sqrt(channels) before adding positions.
         */
        EncoderConfig& withEmbeddingScale( bool scale ) {
            scale_embeddings_ = scale;
            return *this;
        }

        EncoderConfig& withPositionEncoding( PositionEncoding encoding ) {
            position_encoding_ = encoding;
            return *this;
        }

        dim_t getChannels() const { return channels_; }
        dim_t getMaxSequenceLength() const { return max_seq_len_; }
        dim_t getVocabularyLength() const { return vocab_len_; }
        bool scaleEmbeddings() const { return scale_embeddings_; }
        PositionEncoding getPositionEncoding() const { return position_encoding_; }

        bool hasPositionTable() const { return position_encoding_ == PositionEncoding::Learned; }

        void validate() const override {
            ComponentConfig::validate();

            if ( channels_ <= 0 ) {
                throw std::invalid_argument( "Embedding dimension (channels) must be greater than zero" );
            }

            if ( max_seq_len_ <= 0 ) {
                throw std::invalid_argument( "Maximum sequence length must be greater than zero" );
            }

            if ( vocab_len_ <= 0 ) {
                throw std::invalid_argument( "Vocabulary length must be greater than zero" );
            }
        }

        std::string toString() const override {
            std::ostringstream oss;
            oss << "EncoderConfig(channels=" << channels_
                << ", max_sequence_length=" << max_seq_len_
                << ", vocabulary_length=" << vocab_len_
                << ", position_encoding=" << positionEncodingToString( position_encoding_ ) << ")";
            return oss.str();
        }

    private:
        dim_t channels_{ 0 };
        dim_t max_seq_len_{ 0 };
        dim_t vocab_len_{ 0 };
        bool scale_embeddings_{ true };
        PositionEncoding position_encoding_{ PositionEncoding::Learned };
    };
}

#endif
