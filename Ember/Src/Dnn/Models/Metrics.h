/**
 * @file Metrics.h
 * @brief Evaluation metrics over model logits.
 */

#ifndef EMBER_DNN_METRICS_H_
#define EMBER_DNN_METRICS_H_

#include <cmath>
#include <cstdint>
#include <limits>
#include <stdexcept>

#include "../Components/Losses/CrossEntropyConfig.h"
#include "../Tensors/Tensor.h"
#include "../Tensors/TensorDataType.h"

namespace Ember::Dnn
{
    /**
     * @brief Perplexity of a mean cross-entropy loss, exp( loss ).
     */
    inline float perplexity( float loss )
    {
        return std::exp( loss );
    }

    namespace Detail
    {
        inline int64_t checkedRows( const CpuTensor<TensorDataType::FP32>& logits,
            const CpuTensor<TensorDataType::INT32>& labels )
        {
            if (logits.rank() < 1)
            {
                throw std::invalid_argument( "metrics: logits must have rank >= 1" );
            }

            const int64_t V = logits.shape().back();
            const int64_t rows = V > 0 ? static_cast<int64_t>(logits.size()) / V : 0;

            if (static_cast<int64_t>(labels.size()) != rows)
            {
                throw std::invalid_argument( "metrics: one label is required per logits row" );
            }

            return rows;
        }

        /**
         * @brief Number of entries in row strictly greater than row[ target ].
         */
        inline int64_t rankOf( const float* row, int64_t V, int32_t target )
        {
            int64_t rank = 0;
            for (int64_t v = 0; v < V; ++v)
            {
                if (row[ v ] > row[ target ])
                    ++rank;
            }
            return rank;
        }
    }

    /**
     * @brief Fraction of non-ignored positions whose label is within the k highest logits.
     *
     * Logits (..., V) and labels (...) are aligned position for position. Labels
     * tied with the k-th logit count as hits. NaN when every label is ignored.
     *
     * @throws std::out_of_range If a non-ignored label is outside [0, V)
     */
    inline float topKAccuracy( const CpuTensor<TensorDataType::FP32>& logits,
        const CpuTensor<TensorDataType::INT32>& labels, int64_t k, int32_t ignore_index = kIgnoreIndex )
    {
        if (k < 1)
        {
            throw std::invalid_argument( "topKAccuracy: k must be at least 1" );
        }

        const int64_t rows = Detail::checkedRows( logits, labels );
        const int64_t V = logits.shape().back();
        const float* data = logits.data();
        const int32_t* targets = labels.data();

        int64_t correct = 0;
        int64_t total = 0;

        for (int64_t i = 0; i < rows; ++i)
        {
            const int32_t target = targets[ i ];
            if (target == ignore_index)
                continue;

            if (target < 0 || target >= V)
            {
                throw std::out_of_range( "topKAccuracy: label outside vocabulary" );
            }

            if (Detail::rankOf( data + i * V, V, target ) < k)
                ++correct;
            ++total;
        }

        return total > 0
            ? static_cast<float>(correct) / static_cast<float>(total)
            : std::numeric_limits<float>::quiet_NaN();
    }

    /**
     * @brief Fraction of non-ignored positions where the arg-max logit equals the label.
     */
    inline float tokenAccuracy( const CpuTensor<TensorDataType::FP32>& logits,
        const CpuTensor<TensorDataType::INT32>& labels, int32_t ignore_index = kIgnoreIndex )
    {
        const int64_t rows = Detail::checkedRows( logits, labels );
        const int64_t V = logits.shape().back();
        const float* data = logits.data();
        const int32_t* targets = labels.data();

        int64_t correct = 0;
        int64_t total = 0;

        for (int64_t i = 0; i < rows; ++i)
        {
            const int32_t target = targets[ i ];
            if (target == ignore_index)
                continue;

            if (target < 0 || target >= V)
            {
                throw std::out_of_range( "tokenAccuracy: label outside vocabulary" );
            }

            const float* row = data + i * V;
            int64_t best = 0;
            for (int64_t v = 1; v < V; ++v)
            {
                if (row[ v ] > row[ best ])
                    best = v;
            }

            if (best == target)
                ++correct;
            ++total;
        }

        return total > 0
            ? static_cast<float>(correct) / static_cast<float>(total)
            : std::numeric_limits<float>::quiet_NaN();
    }
}

#endif
