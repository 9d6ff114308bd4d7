/**
 * @file Common.h
 * @brief Helpers shared by the Dnn test suites.
 */

#ifndef EMBER_TESTS_DNN_COMMON_H_
#define EMBER_TESTS_DNN_COMMON_H_

#include <cmath>
#include <cstdint>
#include <random>
#include <vector>

#include "Dnn/Tensors/Tensor.h"
#include "Dnn/Tensors/TensorDataType.h"
#include "Dnn/Tensors/TensorInitializers.h"

namespace Dnn::Tests
{
    using Ember::Dnn::CpuTensor;
    using Ember::Dnn::TensorDataType;

    inline void fillUniform( CpuTensor<TensorDataType::FP32>& tensor, float min_val, float max_val, unsigned int seed )
    {
        std::mt19937 gen( seed );
        Ember::Dnn::random( tensor, min_val, max_val, gen );
    }

    inline void fillTokens( CpuTensor<TensorDataType::INT32>& tensor, int32_t vocab_size, unsigned int seed )
    {
        std::mt19937 gen( seed );
        Ember::Dnn::random( tensor, 0, vocab_size - 1, gen );
    }

    inline bool hasNaNorInf( const CpuTensor<TensorDataType::FP32>& tensor )
    {
        for (size_t i = 0; i < tensor.size(); ++i)
        {
            if (!std::isfinite( tensor.data()[ i ] ))
                return true;
        }
        return false;
    }

    inline std::vector<float> toVector( const CpuTensor<TensorDataType::FP32>& tensor )
    {
        return std::vector<float>( tensor.data(), tensor.data() + tensor.size() );
    }
}

#endif
