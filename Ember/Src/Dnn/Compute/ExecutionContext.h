/**
 * @file ExecutionContext.h
 * @brief Device execution contexts shared by components and operations.
 */

#ifndef EMBER_DNN_COMPUTE_EXECUTION_CONTEXT_H_
#define EMBER_DNN_COMPUTE_EXECUTION_CONTEXT_H_

#include <memory>
#include <string>
#ifdef USE_OMP
#include <omp.h>
#endif

#include "ComputeDevice.h"
#include "DeviceType.h"

namespace Ember::Dnn::Compute
{
    /**
     * @brief Type-erased execution context held by the operation registry.
     */
    class IExecutionContext {
    public:
        explicit IExecutionContext( DeviceType device_type )
            : device_type_( device_type ) {}

        virtual ~IExecutionContext() = default;

        DeviceType getDeviceType() const {
            return device_type_;
        }

        virtual void synchronize() = 0;
        virtual std::shared_ptr<ComputeDevice> getDevice() const = 0;

    private:
        DeviceType device_type_;
    };

    template<DeviceType TDeviceType>
    class ExecutionContext;

    /**
     * @brief CPU execution context.
     *
     * CPU operations are synchronous; the context carries the device and the
     * OpenMP thread count used by the kernels.
     */
    template<>
    class ExecutionContext<DeviceType::Cpu> : public IExecutionContext
    {
    public:
        explicit ExecutionContext( [[maybe_unused]] int device_id = -1 )
            : IExecutionContext( DeviceType::Cpu ), device_( std::make_shared<CpuDevice>() ) {
        }

        ExecutionContext( const ExecutionContext& ) = delete;
        ExecutionContext& operator=( const ExecutionContext& ) = delete;
        ExecutionContext( ExecutionContext&& ) = delete;
        ExecutionContext& operator=( ExecutionContext&& ) = delete;

        void synchronize() override {
            // CPU operations are synchronous
        }

        std::shared_ptr<ComputeDevice> getDevice() const override {
            return device_;
        }

        std::string getDeviceName() const {
            return device_->getDeviceName();
        }

        int getDeviceId() const {
            return -1;
        }

        /**
         * @brief Number of threads available to parallel kernels.
         */
        int getMaxThreads() const {
#ifdef USE_OMP
            return omp_get_max_threads();
#else
            return 1;
#endif
        }

    private:
        std::shared_ptr<ComputeDevice> device_;
    };

    using CpuExecutionContext = ExecutionContext<DeviceType::Cpu>;
}

#endif
