#ifndef EMBER_DNN_COMPUTE_ATTENTION_OPERATION_H_
#define EMBER_DNN_COMPUTE_ATTENTION_OPERATION_H_

#include "../../Tensors/ITensor.h"
#include "../../Tensors/TensorDataType.h"
#include "../DeviceType.h"
#include "UnaryOperation.h"

namespace Ember::Dnn::Compute
{
    /**
     * @brief Unary attention operation that can also report its attention weights.
     *
     * Input is the concatenated [Q | K | V] projection (B, T, 3C), output is (B, T, C).
     * When attention_weights is non-null it receives the weights (B, NH, T, T)
     * exactly as used for the weighted sum of values, i.e. after attention
     * dropout when the operation is in training mode.
     */
    template <DeviceType TDeviceType, TensorDataType TPrecision>
    class AttentionOperation : public UnaryOperation<TDeviceType, TPrecision>
    {
    public:
        virtual ~AttentionOperation() = default;

        virtual void forward( const ITensor& input_qkv, ITensor& output, ITensor* attention_weights ) const = 0;

        void forward( const ITensor& input_qkv, ITensor& output ) const override
        {
            forward( input_qkv, output, nullptr );
        }
    };
}

#endif
