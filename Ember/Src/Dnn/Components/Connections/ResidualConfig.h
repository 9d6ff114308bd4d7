#ifndef EMBER_DNN_RESIDUAL_CONFIG_H_
#define EMBER_DNN_RESIDUAL_CONFIG_H_

#include "../../Common/ComponentConfig.h"

namespace Ember::Dnn
{
    /**
     * @brief Configuration for the elementwise residual add y = a + b.
     */
    class ResidualConfig : public ComponentConfigBase<ResidualConfig> {
    public:
        ResidualConfig() {
            name_ = "residual";
        }
    };
}

#endif
