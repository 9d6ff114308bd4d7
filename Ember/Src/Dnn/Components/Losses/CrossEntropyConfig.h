/**
 * @file CrossEntropyConfig.h
 * @brief Configuration for the fused softmax cross-entropy loss.
 */

#ifndef EMBER_DNN_CROSS_ENTROPY_CONFIG_H_
#define EMBER_DNN_CROSS_ENTROPY_CONFIG_H_

#include <cstdint>
#include <sstream>
#include <stdexcept>
#include <string>

#include "../../Common/ComponentConfig.h"
#include "../../Tensors/TensorDataType.h"

namespace Ember::Dnn
{
    /**
     * @brief Target value excluded from the loss and from accuracy metrics.
     */
    inline constexpr int32_t kIgnoreIndex = -100;

    class CrossEntropyConfig : public ComponentConfigBase<CrossEntropyConfig>
    {
    public:
        explicit CrossEntropyConfig( dim_t vocab_size )
            : vocab_size_( vocab_size )
        {
            name_ = "loss";
        }

        CrossEntropyConfig& withIgnoreIndex( int32_t ignore_index )
        {
            ignore_index_ = ignore_index;
            return *this;
        }

        dim_t getVocabSize() const { return vocab_size_; }
        int32_t getIgnoreIndex() const { return ignore_index_; }

        void validate() const override
        {
            ComponentConfig::validate();

            if (vocab_size_ <= 0)
            {
                throw std::invalid_argument( "CrossEntropyConfig: vocabulary size must be greater than zero" );
            }
        }

        std::string toString() const override
        {
            std::ostringstream oss;
            oss << "CrossEntropyConfig(vocab_size=" << vocab_size_
                << ", ignore_index=" << ignore_index_ << ")";
            return oss.str();
        }

    private:
        dim_t vocab_size_;
        int32_t ignore_index_{ kIgnoreIndex };
    };
}

#endif
