/**
 * @file TensorDataType.h
 * @brief Abstract tensor element types and their compile-time traits.
 */

#ifndef EMBER_DNN_TENSOR_DATA_TYPE_H_
#define EMBER_DNN_TENSOR_DATA_TYPE_H_

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

#include "../Compute/DeviceType.h"

namespace Ember::Dnn
{
    /**
     * @brief Tensor shape, one extent per dimension in row-major order.
     */
    using shape_t = std::vector<int64_t>;

    /**
     * @brief Extent of a single tensor dimension.
     */
    using dim_t = int64_t;

    /**
     * @brief Element types a tensor may hold.
     *
     * FP32 carries activations and weights; INT32 carries token ids and labels.
     */
    enum class TensorDataType {
        FP32,
        INT32,
    };

    using dtype_t = TensorDataType;

    template<TensorDataType TDataType>
    struct TensorDataTypeTraits;

    template<>
    struct TensorDataTypeTraits<TensorDataType::FP32> {
        using host_type = float;
        static constexpr bool is_float_type = true;
        static constexpr bool is_integer_type = false;
        static constexpr size_t size_in_bytes = 4;
        static constexpr size_t alignment = 64;
        static constexpr const char* type_name = "FP32";
    };

    template<>
    struct TensorDataTypeTraits<TensorDataType::INT32> {
        using host_type = int32_t;
        static constexpr bool is_float_type = false;
        static constexpr bool is_integer_type = true;
        static constexpr size_t size_in_bytes = 4;
        static constexpr size_t alignment = 64;
        static constexpr const char* type_name = "INT32";
    };

    inline std::string tensorDataTypeToString( TensorDataType type ) {
        switch ( type ) {
            case TensorDataType::FP32:  return "FP32";
            case TensorDataType::INT32: return "INT32";
            default:
                throw std::invalid_argument( "Unknown TensorDataType" );
        }
    }

    /**
     * @brief Compute precisions each device implements kernels for.
     */
    template<TensorDataType TPrecision, Compute::DeviceType TDeviceType>
    concept PrecisionSupportedOnDevice =
        (TDeviceType == Compute::DeviceType::Cpu) && (TPrecision == TensorDataType::FP32);
}

#endif
