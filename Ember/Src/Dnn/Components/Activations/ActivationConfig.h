/**
 * @file ActivationConfig.h
 * @brief Configuration for elementwise activation components.
 */

#ifndef EMBER_DNN_ACTIVATION_CONFIG_H_
#define EMBER_DNN_ACTIVATION_CONFIG_H_

#include <string>

#include "../../Common/ActivationType.h"
#include "../../Common/ComponentConfig.h"

namespace Ember::Dnn
{
    class ActivationConfig : public ComponentConfigBase<ActivationConfig> {
    public:
        explicit ActivationConfig( ActivationType type = ActivationType::Gelu )
            : type_( type ) {
            name_ = "act";
        }

        ActivationConfig& withActivationType( ActivationType type ) {
            type_ = type;
            return *this;
        }

        ActivationType getActivationType() const { return type_; }

        std::string toString() const override {
            return "ActivationConfig(type=" + activationTypeToString( type_ ) + ")";
        }

    private:
        ActivationType type_;
    };
}

#endif
