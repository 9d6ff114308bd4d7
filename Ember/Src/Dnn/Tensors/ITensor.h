/**
 * @file ITensor.h
 * @brief Type-erased tensor interface used at operation boundaries.
 */

#ifndef EMBER_DNN_ITENSOR_H_
#define EMBER_DNN_ITENSOR_H_

#include <cstddef>
#include <memory>
#include <string>

#include "../Compute/ComputeDevice.h"
#include "../Compute/DeviceType.h"
#include "TensorDataType.h"

namespace Ember::Dnn
{
    class ITensor {
    public:
        virtual ~ITensor() = default;

        virtual const shape_t& shape() const = 0;
        virtual size_t size() const = 0;
        virtual size_t elementSize() const = 0;
        virtual TensorDataType getDataType() const = 0;
        virtual std::string getDataTypeName() const = 0;

        virtual std::shared_ptr<Compute::ComputeDevice> getDevice() const = 0;
        virtual Compute::DeviceType getDeviceType() const = 0;

        virtual std::string getUId() const = 0;
        virtual std::string getName() const = 0;

        virtual void* rawData() = 0;
        virtual const void* rawData() const = 0;
    };
}

#endif
