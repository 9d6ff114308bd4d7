#ifndef EMBER_DNN_COMPUTE_BINARY_OPERATION_H_
#define EMBER_DNN_COMPUTE_BINARY_OPERATION_H_

#include "../../Tensors/ITensor.h"
#include "../../Tensors/Tensor.h"
#include "../../Tensors/TensorDataType.h"
#include "../DeviceType.h"
#include "../MemoryResource.h"
#include "OperationBase.h"

namespace Ember::Dnn::Compute
{
    /**
     * @brief Operation combining two input tensors into one output tensor.
     */
    template <DeviceType TDeviceType, TensorDataType TInputA, TensorDataType TInputB = TInputA,
        TensorDataType TPrecision = TInputA>
        requires PrecisionSupportedOnDevice<TPrecision, TDeviceType>
    class BinaryOperation : public Operation<TDeviceType, TPrecision>
    {
    public:
        using MR = CpuMemoryResource;

        using TensorInputAType = Tensor<TInputA, MR>;
        using TensorInputBType = Tensor<TInputB, MR>;
        using TensorOutputType = Tensor<TPrecision, MR>;

        virtual ~BinaryOperation() = default;

        virtual void forward( const ITensor& inputA, const ITensor& inputB, ITensor& output ) const = 0;
    };
}

#endif
