/**
 * @file OperationBase.h
 * @brief Base class for all compute operations.
 */

#ifndef EMBER_DNN_COMPUTE_OPERATION_BASE_H_
#define EMBER_DNN_COMPUTE_OPERATION_BASE_H_

#include <string>

#include "../../Tensors/ITensor.h"
#include "../../Tensors/TensorDataType.h"
#include "../DeviceType.h"
#include "OperationType.h"

namespace Ember::Dnn::Compute
{
    /**
     * @brief Base class for all compute operations.
     *
     * Operations follow a two-phase lifecycle. Parameters are bound with
     * setParameters() and the operation is validated against the largest input
     * shape it will see with build(). After build() the forward entry points are
     * const and derive the active extents from each input, so one built operation
     * may serve concurrent callers and any sequence length up to the built one.
     *
     * @tparam TDeviceType Device the operation runs on
     * @tparam TPrecision Compute precision of the operation
     */
    template <DeviceType TDeviceType, TensorDataType TPrecision>
    class Operation
    {
    public:
        static constexpr DeviceType device_type = TDeviceType;
        static constexpr TensorDataType data_type = TPrecision;

        using DataTypeTraits = TensorDataTypeTraits<TPrecision>;

        virtual ~Operation() = default;

        virtual bool isBuilt() const
        {
            return is_built_;
        }

        /**
         * @brief Validate bound parameters against the maximum input shape.
         */
        virtual void build( [[maybe_unused]] const shape_t& input_shape )
        {
            // Default: no build required by stateless operations
            is_built_ = true;
        }

        /**
         * @brief Bind non-owning parameter tensors.
         *
         * The owning component keeps the tensors alive for the lifetime of the operation.
         */
        virtual void setParameters( ITensor* weight, ITensor* bias )
        {
            (void)weight;
            (void)bias;
        }

        virtual void setTraining( bool is_training )
        {
            is_training_ = is_training;
        }

        virtual bool isTraining() const
        {
            return is_training_;
        }

        virtual OperationType getOperationType() const = 0;

        virtual DeviceType getDeviceType() const
        {
            return TDeviceType;
        }

        virtual TensorDataType getDataType() const
        {
            return TPrecision;
        }

        virtual std::string getName() const = 0;

    protected:
        bool is_built_{ false };
        bool is_training_{ false };
    };
}

#endif
