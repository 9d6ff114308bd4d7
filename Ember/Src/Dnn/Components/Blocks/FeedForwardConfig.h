/**
 * @file FeedForwardConfig.h
 * @brief Configuration for the position-wise feed-forward block.
 */

#ifndef EMBER_DNN_FEED_FORWARD_CONFIG_H_
#define EMBER_DNN_FEED_FORWARD_CONFIG_H_

#include <ios>
#include <sstream>
#include <stdexcept>
#include <string>

#include "../../Common/ActivationType.h"
#include "../../Common/ComponentConfig.h"
#include "../../Tensors/TensorDataType.h"

namespace Ember::Dnn
{
    /**
     * @brief Configuration for FeedForward: fc(C, F) -> activation -> dropout -> proj(F, C) -> dropout.
     */
    class FeedForwardConfig : public ComponentConfigBase<FeedForwardConfig>
    {
    public:
        FeedForwardConfig( dim_t input_features, dim_t hidden_size )
            : input_features_( input_features ), hidden_size_( hidden_size )
        {
            name_ = "mlp";
        }

        FeedForwardConfig& withActivation( ActivationType activation )
        {
            activation_ = activation;
            return *this;
        }

        FeedForwardConfig& withDropout( float dropout )
        {
            dropout_ = dropout;
            return *this;
        }

        FeedForwardConfig& withBias( bool has_bias )
        {
            has_bias_ = has_bias;
            return *this;
        }

        dim_t getInputFeatures() const { return input_features_; }
        dim_t getHiddenSize() const { return hidden_size_; }
        ActivationType getActivation() const { return activation_; }
        float getDropout() const { return dropout_; }
        bool hasBias() const { return has_bias_; }

        void validate() const override
        {
            ComponentConfig::validate();

            if (input_features_ <= 0 || hidden_size_ <= 0)
            {
                throw std::invalid_argument( "FeedForwardConfig: input features and hidden size must be greater than zero" );
            }

            if (!(dropout_ >= 0.0f && dropout_ < 1.0f))
            {
                throw std::invalid_argument( "FeedForwardConfig: dropout must be in [0, 1)" );
            }
        }

        std::string toString() const override
        {
            std::ostringstream oss;
            oss << "FeedForwardConfig(input_features=" << input_features_
                << ", hidden_size=" << hidden_size_
                << ", activation=" << activationTypeToString( activation_ )
                << ", dropout=" << dropout_
                << ", has_bias=" << std::boolalpha << has_bias_ << ")";
            return oss.str();
        }

    private:
        dim_t input_features_;
        dim_t hidden_size_;
        ActivationType activation_{ ActivationType::Gelu };
        float dropout_{ 0.0f };
        bool has_bias_{ true };
    };
}

#endif
