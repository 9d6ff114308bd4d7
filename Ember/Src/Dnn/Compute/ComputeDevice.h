/**
 * @file ComputeDevice.h
 * @brief Abstract compute device and the CPU device.
 */

#ifndef EMBER_DNN_COMPUTE_COMPUTE_DEVICE_H_
#define EMBER_DNN_COMPUTE_COMPUTE_DEVICE_H_

#include <string>

#include "DeviceType.h"

namespace Ember::Dnn::Compute
{
    class ComputeDevice {
    public:
        virtual ~ComputeDevice() = default;

        virtual DeviceType getDeviceType() const = 0;
        virtual std::string getDeviceName() const = 0;
        virtual int getDeviceId() const = 0;
    };

    class CpuDevice : public ComputeDevice {
    public:
        DeviceType getDeviceType() const override {
            return DeviceType::Cpu;
        }

        std::string getDeviceName() const override {
            return "CPU";
        }

        int getDeviceId() const override {
            return -1;
        }
    };
}

#endif
