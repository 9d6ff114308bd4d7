/**
 * @file TensorInitializers.h
 * @brief Random and constant initialization of host tensors.
 */

#ifndef EMBER_DNN_TENSOR_INITIALIZERS_H_
#define EMBER_DNN_TENSOR_INITIALIZERS_H_

#include <cmath>
#include <cstdint>
#include <random>
#include <stdexcept>

#include "../../Utils/RandomGenerator.h"
#include "Tensor.h"
#include "TensorDataType.h"

namespace Ember::Dnn
{
    /**
     * @brief Fills a floating tensor with samples of Normal(mean, stddev).
     *
     * The generator is advanced, so a sequence of calls sharing one generator
     * produces a reproducible sequence of distinct tensors.
     */
    template<TensorDataType TDataType, typename TMemoryResource>
        requires TensorDataTypeTraits<TDataType>::is_float_type
    void normal( Tensor<TDataType, TMemoryResource>& tensor, float mean, float stddev, std::mt19937& generator )
    {
        if (!(stddev >= 0.0f) || !std::isfinite( stddev ))
        {
            throw std::invalid_argument( "normal: standard deviation must be finite and non-negative" );
        }

        if (stddev == 0.0f)
        {
            tensor.fill( mean );
            return;
        }

        std::normal_distribution<float> dist( mean, stddev );
        auto* data = tensor.data();
        for (size_t i = 0; i < tensor.size(); ++i)
        {
            data[ i ] = dist( generator );
        }
    }

    /**
     * @brief Normal initialization from the global RandomGenerator.
     */
    template<TensorDataType TDataType, typename TMemoryResource>
        requires TensorDataTypeTraits<TDataType>::is_float_type
    void normal( Tensor<TDataType, TMemoryResource>& tensor, float mean, float stddev )
    {
        auto gen = Utils::RandomGenerator::getInstance().getGenerator();
        normal( tensor, mean, stddev, gen );
    }

    /**
     * @brief Fills a tensor with uniform samples in [min_val, max_val].
     */
    template<TensorDataType TDataType, typename TMemoryResource>
    void random( Tensor<TDataType, TMemoryResource>& tensor,
        typename TensorDataTypeTraits<TDataType>::host_type min_val,
        typename TensorDataTypeTraits<TDataType>::host_type max_val,
        std::mt19937& generator )
    {
        if (min_val > max_val)
        {
            throw std::invalid_argument( "min_val must be <= max_val" );
        }

        auto* data = tensor.data();
        if constexpr (TensorDataTypeTraits<TDataType>::is_integer_type)
        {
            std::uniform_int_distribution<int32_t> dis( min_val, max_val );
            for (size_t i = 0; i < tensor.size(); ++i)
            {
                data[ i ] = dis( generator );
            }
        }
        else
        {
            std::uniform_real_distribution<float> dis( min_val, max_val );
            for (size_t i = 0; i < tensor.size(); ++i)
            {
                data[ i ] = dis( generator );
            }
        }
    }

    template<TensorDataType TDataType, typename TMemoryResource>
    void zeros( Tensor<TDataType, TMemoryResource>& tensor )
    {
        tensor.fill( 0 );
    }

    template<TensorDataType TDataType, typename TMemoryResource>
    void ones( Tensor<TDataType, TMemoryResource>& tensor )
    {
        tensor.fill( 1 );
    }
}

#endif
