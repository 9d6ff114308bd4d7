/**
 * @file FeedForward.h
 * @brief Position-wise feed-forward block.
 */

#ifndef EMBER_DNN_FEED_FORWARD_H_
#define EMBER_DNN_FEED_FORWARD_H_

#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "../../Compute/DeviceType.h"
#include "../../Compute/ExecutionContext.h"
#include "../../Compute/MemoryResource.h"
#include "../../Tensors/ITensor.h"
#include "../../Tensors/Tensor.h"
#include "../../Tensors/TensorDataType.h"
#include "../Activations/Activation.h"
#include "../Component.h"
#include "../Layers/Linear.h"
#include "../Regularization/Dropout.h"
#include "FeedForwardConfig.h"

namespace Ember::Dnn
{
    /**
     * @brief FeedForward: fc(C, F) -> activation -> dropout -> proj(F, C) -> dropout.
     */
    template<DeviceType TDeviceType, TensorDataType TPrecision>
        requires PrecisionSupportedOnDevice<TPrecision, TDeviceType>
    class FeedForward final : public Component<TDeviceType, TPrecision>
    {
    public:
        using MR = CpuMemoryResource;
        using ExecutionContextType = ExecutionContext<TDeviceType>;
        using TensorType = Tensor<TPrecision, MR>;
        using ComponentBase = Component<TDeviceType, TPrecision>;

        explicit FeedForward( std::shared_ptr<ExecutionContextType> exec_context, const FeedForwardConfig& config )
            : exec_context_( std::move( exec_context ) ), config_( config )
        {
            if (!exec_context_)
            {
                throw std::invalid_argument( "ExecutionContext cannot be null." );
            }

            config_.validate();

            createComponents();
        }

        void forward( const ITensor& input, ITensor& output ) const
        {
            this->ensureBuilt( "FeedForward::forward" );

            shape_t hidden_shape = input.shape();
            if (hidden_shape.empty() || hidden_shape.back() != config_.getInputFeatures())
            {
                throw std::invalid_argument( "FeedForward: input trailing dimension does not match input features" );
            }
            hidden_shape.back() = config_.getHiddenSize();

            TensorType hidden( exec_context_->getDevice(), hidden_shape );

            fc_->forward( input, hidden );
            activation_->forward( hidden, hidden );
            hidden_dropout_->forward( hidden, hidden );
            proj_->forward( hidden, output );
            output_dropout_->forward( output, output );
        }

        std::vector<typename ComponentBase::NamedParameter> getNamedParameters() const override
        {
            auto params = this->prefixed( "fc", fc_->getNamedParameters() );
            auto proj = this->prefixed( "proj", proj_->getNamedParameters() );
            params.insert( params.end(), proj.begin(), proj.end() );
            return params;
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
            oss << "FeedForward: " << getName() << std::endl;
            oss << "Input features: " << config_.getInputFeatures() << std::endl;
            oss << "Hidden size: " << config_.getHiddenSize() << std::endl;
            oss << "Activation: " << activationTypeToString( config_.getActivation() ) << std::endl;
            oss << "Dropout: " << config_.getDropout() << std::endl;
            oss << "Parameter count: " << this->parameterCount() << std::endl;
            oss << fc_->toString();
            oss << proj_->toString();
            return oss.str();
        }

        const FeedForwardConfig& getConfig() const noexcept
        {
            return config_;
        }

    protected:
        void onBuilding( const shape_t& input_shape ) override
        {
            if (input_shape.empty() || input_shape.back() != config_.getInputFeatures())
            {
                throw std::invalid_argument( "FeedForward: input trailing dimension does not match input features" );
            }

            shape_t hidden_shape = input_shape;
            hidden_shape.back() = config_.getHiddenSize();

            fc_->build( input_shape );
            activation_->build( hidden_shape );
            hidden_dropout_->build( hidden_shape );
            proj_->build( hidden_shape );
            output_dropout_->build( input_shape );
        }

        void onTrainingChanging( bool is_training ) override
        {
            fc_->setTraining( is_training );
            activation_->setTraining( is_training );
            hidden_dropout_->setTraining( is_training );
            proj_->setTraining( is_training );
            output_dropout_->setTraining( is_training );
        }

    private:
        std::shared_ptr<ExecutionContextType> exec_context_;
        FeedForwardConfig config_;

        std::shared_ptr<Linear<TDeviceType, TPrecision>> fc_;
        std::shared_ptr<Activation<TDeviceType, TPrecision>> activation_;
        std::shared_ptr<Dropout<TDeviceType, TPrecision>> hidden_dropout_;
        std::shared_ptr<Linear<TDeviceType, TPrecision>> proj_;
        std::shared_ptr<Dropout<TDeviceType, TPrecision>> output_dropout_;

        void createComponents()
        {
            auto fc_config = LinearConfig( config_.getInputFeatures(), config_.getHiddenSize() );
            fc_config.withName( getName() + ".fc" ).withBias( config_.hasBias() );
            fc_ = std::make_shared<Linear<TDeviceType, TPrecision>>( exec_context_, fc_config );

            auto act_config = ActivationConfig( config_.getActivation() );
            act_config.withName( getName() + ".act" );
            activation_ = std::make_shared<Activation<TDeviceType, TPrecision>>( exec_context_, act_config );

            auto hidden_dropout_config = DropoutConfig( config_.getDropout() );
            hidden_dropout_config.withName( getName() + ".hidden_dropout" );
            hidden_dropout_ = std::make_shared<Dropout<TDeviceType, TPrecision>>( exec_context_, hidden_dropout_config );

            auto proj_config = LinearConfig( config_.getHiddenSize(), config_.getInputFeatures() );
            proj_config.withName( getName() + ".proj" ).withBias( config_.hasBias() );
            proj_ = std::make_shared<Linear<TDeviceType, TPrecision>>( exec_context_, proj_config );

            auto output_dropout_config = DropoutConfig( config_.getDropout() );
            output_dropout_config.withName( getName() + ".output_dropout" );
            output_dropout_ = std::make_shared<Dropout<TDeviceType, TPrecision>>( exec_context_, output_dropout_config );
        }
    };
}

#endif
