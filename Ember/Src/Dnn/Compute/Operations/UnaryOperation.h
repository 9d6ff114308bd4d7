#ifndef EMBER_DNN_COMPUTE_UNARY_OPERATION_H_
#define EMBER_DNN_COMPUTE_UNARY_OPERATION_H_

#include <type_traits>

#include "../../Tensors/ITensor.h"
#include "../../Tensors/Tensor.h"
#include "../../Tensors/TensorDataType.h"
#include "../DeviceType.h"
#include "../MemoryResource.h"
#include "OperationBase.h"

namespace Ember::Dnn::Compute
{
    /**
     * @brief Operation with one input tensor and one output tensor.
     */
    template <DeviceType TDeviceType, TensorDataType TInput, TensorDataType TPrecision = TInput>
        requires PrecisionSupportedOnDevice<TPrecision, TDeviceType>
    class UnaryOperation : public Operation<TDeviceType, TPrecision>
    {
    public:
        using MR = CpuMemoryResource;

        // Concrete tensor aliases for implementers to use (typed, device-aware)
        using TensorOutputType = Tensor<TPrecision, MR>;
        using TensorInputType = Tensor<TInput, MR>;

        virtual ~UnaryOperation() = default;

        virtual void forward( const ITensor& input, ITensor& output ) const = 0;

    protected:
        static const TensorInputType& asInputTensor( const ITensor& t )
        {
            return dynamic_cast<const TensorInputType&>(t);
        }

        static TensorOutputType& asOutputTensor( ITensor& t )
        {
            return dynamic_cast<TensorOutputType&>(t);
        }
    };
}

#endif
