/**
 * @file Encoder.h
 * @brief Token and position embedding component.
 */

#ifndef EMBER_DNN_ENCODER_H_
#define EMBER_DNN_ENCODER_H_

#include <functional>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "../../Common/Errors.h"
#include "../../Compute/DeviceType.h"
#include "../../Compute/ExecutionContext.h"
#include "../../Compute/MemoryResource.h"
#include "../../Compute/Operations/OperationRegistry.h"
#include "../../Compute/Operations/UnaryOperation.h"
#include "../../Compute/OperationsRegistrar.h"
#include "../../Tensors/ITensor.h"
#include "../../Tensors/Tensor.h"
#include "../../Tensors/TensorDataType.h"
#include "../../Tensors/TensorInitializers.h"
#include "../../../Utils/RandomGenerator.h"
#include "../Component.h"
#include "EncoderConfig.h"

namespace Ember::Dnn
{
    /**
     * @brief Encoder component: token embedding (wte) plus position embedding.
     *
     * The position term is the learned wpe table, a fixed sinusoidal table held
     * by the operation, or nothing when positions are encoded by rotary
     * attention. Only the learned table is a parameter.
     *
     * Input is an INT32 tensor of token ids with shape (B, T); output is (B, T, C).
     * The token table is exposed through getTokenEmbedding() so a language model
     * head can share it.
     */
    template<DeviceType TDeviceType, TensorDataType TPrecision>
        requires PrecisionSupportedOnDevice<TPrecision, TDeviceType>
    class Encoder final : public Component<TDeviceType, TPrecision>
    {
    public:
        using MR = CpuMemoryResource;
        using ExecutionContextType = ExecutionContext<TDeviceType>;
        using TensorType = Tensor<TPrecision, MR>;
        using ComponentBase = Component<TDeviceType, TPrecision>;

        explicit Encoder( std::shared_ptr<ExecutionContextType> exec_context, const EncoderConfig& config )
            : exec_context_( std::move( exec_context ) ), config_( config )
        {
            if (!exec_context_)
            {
                throw std::invalid_argument( "ExecutionContext cannot be null." );
            }

            config_.validate();

            initializeParameters();
            createOperation();
        }

        ~Encoder() override = default;

        /**
         * @throws SequenceTooLongError If T exceeds the maximum sequence length
         * @throws std::out_of_range If a token id is outside the vocabulary
         */
        void forward( const ITensor& input, ITensor& output ) const
        {
            this->ensureBuilt( "Encoder::forward" );
            validateInputShape( input.shape() );
            operation_->forward( input, output );
        }

        std::vector<typename ComponentBase::NamedParameter> getNamedParameters() const override
        {
            if (!wpe_)
            {
                return { { "wte", wte_.get() } };
            }

            return { { "wte", wte_.get() }, { "wpe", wpe_.get() } };
        }

        std::string getName() const override
        {
            return config_.getName();
        }

        std::shared_ptr<ComputeDevice> getDevice() const override
        {
            return exec_context_->getDevice();
        }

        std::string toString() const override
        {
            std::ostringstream oss;
            oss << "--------------------" << std::endl;
            oss << "Encoder: " << getName() << std::endl;
            oss << "Embedding channels: " << config_.getChannels() << std::endl;
            oss << "Max sequence length: " << config_.getMaxSequenceLength() << std::endl;
            oss << "Vocabulary tokens: " << config_.getVocabularyLength() << std::endl;
            oss << "Position encoding: " << positionEncodingToString( config_.getPositionEncoding() ) << std::endl;
            oss << "Device: " << deviceTypeToString( this->getDeviceType() ) << std::endl;
            oss << "Parameter count: " << this->parameterCount() << std::endl;
            return oss.str();
        }

        std::shared_ptr<TensorType> getTokenEmbedding() const noexcept
        {
            return wte_;
        }

        /**
         * @brief The learned position table, or nullptr for fixed encodings.
         */
        std::shared_ptr<TensorType> getPositionEmbedding() const noexcept
        {
            return wpe_;
        }

        const EncoderConfig& getConfig() const noexcept
        {
            return config_;
        }

    protected:
        void onBuilding( const shape_t& input_shape ) override
        {
            validateInputShape( input_shape );

            operation_->setParameters( wte_.get(), wpe_.get() );
            operation_->build( input_shape );
        }

    private:
        std::shared_ptr<ExecutionContextType> exec_context_;
        EncoderConfig config_;

        std::shared_ptr<TensorType> wte_{ nullptr };
        std::shared_ptr<TensorType> wpe_{ nullptr };

        std::shared_ptr<UnaryOperation<TDeviceType, TensorDataType::INT32, TPrecision>> operation_{ nullptr };

        void validateInputShape( const shape_t& input_shape ) const
        {
            if (input_shape.size() != 2)
            {
                throw std::invalid_argument( "Encoder: input must have shape (batch, sequence)" );
            }

            if (input_shape[ 1 ] > config_.getMaxSequenceLength())
            {
                throw SequenceTooLongError( input_shape[ 1 ], config_.getMaxSequenceLength() );
            }
        }

        void initializeParameters()
        {
            auto device = exec_context_->getDevice();
            auto& rng = Utils::RandomGenerator::getInstance();

            wte_ = std::make_shared<TensorType>( device,
                shape_t{ config_.getVocabularyLength(), config_.getChannels() } );
            wte_->setName( this->getName() + ".wte" );

            auto wte_gen = rng.deriveGenerator( static_cast<unsigned int>(std::hash<std::string>{}(wte_->getName())) );
            normal( *wte_, 0.0f, 0.02f, wte_gen );

            if (!config_.hasPositionTable())
            {
                return;
            }

            wpe_ = std::make_shared<TensorType>( device,
                shape_t{ config_.getMaxSequenceLength(), config_.getChannels() } );
            wpe_->setName( this->getName() + ".wpe" );

            auto wpe_gen = rng.deriveGenerator( static_cast<unsigned int>(std::hash<std::string>{}(wpe_->getName())) );
            normal( *wpe_, 0.0f, 0.02f, wpe_gen );
        }

        void createOperation()
        {
            OperationsRegistrar::instance();

            operation_ = OperationRegistry::instance()
                .createUnaryOperation<TDeviceType, TensorDataType::INT32, TPrecision>(
                    "EncoderOp",
                    exec_context_,
                    config_ );

            if (!operation_)
            {
                throw std::runtime_error( "Failed to create Encoder compute backend operation." );
            }
        }
    };

    template<TensorDataType TPrecision>
    using CpuEncoder = Encoder<DeviceType::Cpu, TPrecision>;
}

#endif
