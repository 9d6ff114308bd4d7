/**
 * @file LayerNormConfig.h
 * @brief Configuration for the LayerNorm component.
 */

#ifndef EMBER_DNN_LAYER_NORM_CONFIG_H_
#define EMBER_DNN_LAYER_NORM_CONFIG_H_

#include <cmath>
#include <ios>
#include <sstream>
#include <stdexcept>
#include <string>

#include "../../Common/ComponentConfig.h"
#include "../../Tensors/TensorDataType.h"

namespace Ember::Dnn
{
    /**
     * @brief Configuration for layer normalization over the trailing dimension.
     */
    class LayerNormConfig : public ComponentConfigBase<LayerNormConfig>
    {
    public:
        explicit LayerNormConfig( dim_t normalized_dim )
            : normalized_dim_( normalized_dim )
        {
            name_ = "layernorm";
        }

        LayerNormConfig& withEpsilon( float epsilon )
        {
            epsilon_ = epsilon;
            return *this;
        }

        LayerNormConfig& withBias( bool has_bias )
        {
            has_bias_ = has_bias;
            return *this;
        }

        dim_t getNormalizedDim() const { return normalized_dim_; }
        float getEpsilon() const { return epsilon_; }
        bool hasBias() const { return has_bias_; }

        void validate() const override
        {
            ComponentConfig::validate();

            if (normalized_dim_ <= 0)
            {
                throw std::invalid_argument( "LayerNormConfig: normalized dimension must be greater than zero" );
            }

            if (!(epsilon_ > 0.0f) || !std::isfinite( epsilon_ ))
            {
                throw std::invalid_argument( "LayerNormConfig: epsilon must be a positive finite value" );
            }
        }

        std::string toString() const override
        {
            std::ostringstream oss;
            oss << "LayerNormConfig(normalized_dim=" << normalized_dim_
                << ", epsilon=" << epsilon_
                << ", has_bias=" << std::boolalpha << has_bias_ << ")";
            return oss.str();
        }

    private:
        dim_t normalized_dim_;
        float epsilon_{ 1e-5f };
        bool has_bias_{ true };
    };
}

#endif
