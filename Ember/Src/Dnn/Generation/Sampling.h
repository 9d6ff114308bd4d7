/**
 * @file Sampling.h
 * @brief Logit filtering and token selection policies for autoregressive decoding.
 *
 * Every function operates on one vocabulary row. Filters write -inf into the
 * logits they remove so that a following softmax assigns them zero mass.
 */

#ifndef EMBER_DNN_SAMPLING_H_
#define EMBER_DNN_SAMPLING_H_

#include <cstdint>
#include <random>
#include <span>
#include <vector>

namespace Ember::Dnn
{
    /**
     * @brief Divide every logit by temperature.
     *
     * @throws std::invalid_argument If temperature is not positive and finite
     */
    void applyTemperature( std::span<float> logits, float temperature );

    /**
     * @brief Keep logits greater than or equal to the k-th largest, set the rest to -inf.
     *
     * Ties at the k-th value are kept. k larger than the row is clamped.
     *
     * @throws std::invalid_argument If k < 1
     */
    void applyTopK( std::span<float> logits, int64_t k );

    /**
     * @brief Nucleus filtering.
     *
     * Sorts the row in descending order (stable), accumulates softmax
     * probabilities and removes every token whose cumulative probability
     * before it already exceeds p. The highest-scoring token always survives.
     *
     * @throws std::invalid_argument If p is not in (0, 1]
     */
    void applyTopP( std::span<float> logits, float p );

    /**
     * @brief Max-subtracted softmax.
     *
     * @throws NumericalError If the row holds NaN or +inf, or every entry is -inf
     */
    std::vector<float> softmax( std::span<const float> logits );

    /**
     * @brief Index of the largest value, lowest index on ties.
     */
    int32_t argmax( std::span<const float> values );

    /**
     * @brief Draw one index from a probability row.
     *
     * The row need not be normalized.
     *
     * @throws NumericalError If a probability is negative or non-finite, or the total mass is zero
     */
    int32_t sample( std::span<const float> probabilities, std::mt19937& generator );
}

#endif
