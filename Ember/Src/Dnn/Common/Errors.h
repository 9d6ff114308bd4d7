/**
 * @file Errors.h
 * @brief Exception types raised by the Ember language model core.
 *
 * Configuration and input errors derive from std::invalid_argument and
 * numerical failures from std::runtime_error, so callers catching the
 * standard types continue to see them.
 */

#ifndef EMBER_DNN_ERRORS_H_
#define EMBER_DNN_ERRORS_H_

#include <cstdint>
#include <stdexcept>
#include <string>

#include <fmt/format.h>

namespace Ember::Dnn
{
    /**
     * @brief Invalid hyperparameters discovered while constructing a configuration.
     */
    class ConfigError : public std::invalid_argument
    {
    public:
        explicit ConfigError( const std::string& message )
            : std::invalid_argument( message )
        {
        }
    };

    /**
     * @brief Input sequence is longer than the model's maximum sequence length.
     */
    class SequenceTooLongError : public std::invalid_argument
    {
    public:
        SequenceTooLongError( int64_t sequence_length, int64_t max_sequence_length )
            : std::invalid_argument( fmt::format(
                "Sequence length {} exceeds maximum {}", sequence_length, max_sequence_length ) ),
            sequence_length_( sequence_length ), max_sequence_length_( max_sequence_length )
        {
        }

        int64_t sequenceLength() const noexcept
        {
            return sequence_length_;
        }

        int64_t maxSequenceLength() const noexcept
        {
            return max_sequence_length_;
        }

    private:
        int64_t sequence_length_;
        int64_t max_sequence_length_;
    };

    /**
     * @brief Non-finite values or an empty probability distribution.
     */
    class NumericalError : public std::runtime_error
    {
    public:
        explicit NumericalError( const std::string& message )
            : std::runtime_error( message )
        {
        }
    };
}

#endif
