/**
 * @file LinearConfig.h
 * @brief Configuration for the Linear (fully connected) component.
 */

#ifndef EMBER_DNN_LINEAR_CONFIG_H_
#define EMBER_DNN_LINEAR_CONFIG_H_

#include <cstdint>
#include <ios>
#include <sstream>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

#include "../../Common/ComponentConfig.h"
#include "../../Tensors/TensorDataType.h"

namespace Ember::Dnn
{
    using json = nlohmann::json;

    /**
     * @class LinearConfig
     * @brief Configuration object for a Linear (fully connected) layer.
     *
     * Describes the parameters required to construct a Linear layer: the number
     * of input features, the number of output features, and whether the layer
     * carries a bias term.
     *
     * @code
     * LinearConfig cfg{ 128, 64 };
     * cfg.withBias( false ).withName( "lm_head" );
     * @endcode
     */
    class LinearConfig : public ComponentConfigBase<LinearConfig>
    {
    public:
        /**
         * @param input_features Number of input features. Must be > 0.
         * @param output_features Number of output features. Must be > 0.
         */
        LinearConfig( dim_t input_features, dim_t output_features )
            : input_features_( input_features ), output_features_( output_features )
        {
            name_ = "linear";
        }

        LinearConfig& withBias( bool has_bias )
        {
            has_bias_ = has_bias;
            return *this;
        }

        dim_t getInputFeatures() const noexcept
        {
            return input_features_;
        }

        dim_t getOutputFeatures() const noexcept
        {
            return output_features_;
        }

        bool hasBias() const noexcept
        {
            return has_bias_;
        }

        /**
         * @throws std::invalid_argument If either feature count is not positive.
         */
        void validate() const override
        {
            ComponentConfig::validate();

            if (input_features_ <= 0 || output_features_ <= 0)
            {
                throw std::invalid_argument( "LinearConfig: Input and output features must be greater than zero" );
            }
        }

        /**
         * @brief Serialize this configuration to JSON.
         *
         * Produces keys "name", "input_features", "output_features", "has_bias".
         */
        json toJson() const
        {
            json j;
            j[ "name" ] = name_;
            j[ "input_features" ] = static_cast<int64_t>(input_features_);
            j[ "output_features" ] = static_cast<int64_t>(output_features_);
            j[ "has_bias" ] = has_bias_;

            return j;
        }

        /**
         * @brief Deserialize configuration from JSON.
         *
         * Missing keys leave fields at their current values. Type errors are
         * propagated from nlohmann::json getters.
         */
        void fromJson( const json& j )
        {
            if (j.contains( "name" ))
            {
                name_ = j.at( "name" ).get<std::string>();
            }

            if (j.contains( "input_features" ))
            {
                input_features_ = static_cast<dim_t>(j.at( "input_features" ).get<int64_t>());
            }

            if (j.contains( "output_features" ))
            {
                output_features_ = static_cast<dim_t>(j.at( "output_features" ).get<int64_t>());
            }

            if (j.contains( "has_bias" ))
            {
                has_bias_ = j.at( "has_bias" ).get<bool>();
            }
        }

        std::string toString() const override
        {
            std::ostringstream oss;
            oss << "LinearConfig(input_features=" << input_features_
                << ", output_features=" << output_features_
                << ", has_bias=" << std::boolalpha << has_bias_ << ")";
            return oss.str();
        }

    private:
        dim_t input_features_;
        dim_t output_features_;
        bool has_bias_{ true };
    };
}

#endif
