/**
 * @file DropoutConfig.h
 * @brief Configuration for the Dropout component.
 */

#ifndef EMBER_DNN_DROPOUT_CONFIG_H_
#define EMBER_DNN_DROPOUT_CONFIG_H_

#include <sstream>
#include <stdexcept>
#include <string>

#include "../../Common/ComponentConfig.h"

namespace Ember::Dnn
{
    /**
     * @brief Inverted dropout: in training mode each element is zeroed with
     * probability p and survivors are scaled by 1 / (1 - p). Identity otherwise.
     */
    class DropoutConfig : public ComponentConfigBase<DropoutConfig>
    {
    public:
        explicit DropoutConfig( float probability = 0.0f )
            : probability_( probability )
        {
            name_ = "dropout";
        }

        DropoutConfig& withProbability( float probability )
        {
            probability_ = probability;
            return *this;
        }

        float getProbability() const { return probability_; }

        void validate() const override
        {
            ComponentConfig::validate();

            if (!(probability_ >= 0.0f && probability_ < 1.0f))
            {
                throw std::invalid_argument( "DropoutConfig: probability must be in [0, 1)" );
            }
        }

        std::string toString() const override
        {
            std::ostringstream oss;
            oss << "DropoutConfig(probability=" << probability_ << ")";
            return oss.str();
        }

    private:
        float probability_;
    };
}

#endif
