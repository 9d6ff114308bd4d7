#include "GptModel.h"

#include <algorithm>
#include <random>
#include <sstream>
#include <stdexcept>
#include <utility>

#include <fmt/format.h>

#include "../../Utils/Logger.h"
#include "../../Utils/RandomGenerator.h"
#include "../Tensors/TensorInitializers.h"

namespace Ember::Dnn
{
    GptModel::GptModel( std::shared_ptr<CpuExecutionContext> exec_context, const ModelConfig& config,
        std::optional<unsigned int> seed )
        : exec_context_( std::move( exec_context ) ), config_( config )
    {
        if (!exec_context_)
        {
            throw std::invalid_argument( "ExecutionContext cannot be null." );
        }

        causal_mask_ = std::make_shared<const CausalMask>( config_.getMaxSeqLen() );

        if (config_.getPositionEncoding() == PositionEncoding::Rotary)
        {
            rotary_ = std::make_shared<const RotaryEmbedding>( config_.getHeadDim(), config_.getMaxSeqLen() );
        }

        createComponents();
        initializeWeights( seed );

        build( shape_t{ 1, config_.getMaxSeqLen() } );

        Utils::Logger::debug_fmt( "GptModel constructed: {} layers, {} parameters ({} non-embedding)",
            config_.getNumLayers(), parameterCount( false ), parameterCount( true ) );
    }

    void GptModel::createComponents()
    {
        constexpr auto Cpu = DeviceType::Cpu;
        constexpr auto FP32 = TensorDataType::FP32;

        const dim_t C = config_.getEmbedDim();

        auto encoder_config = EncoderConfig();
        encoder_config.withChannels( C )
            .withMaxSequenceLength( config_.getMaxSeqLen() )
            .withVocabularyLength( config_.getVocabSize() )
            .withEmbeddingScale( true )
            .withPositionEncoding( config_.getPositionEncoding() )
            .withName( "encoder" );
        encoder_ = std::make_shared<Encoder<Cpu, FP32>>( exec_context_, encoder_config );

        auto drop_config = DropoutConfig( config_.getDropout() );
        drop_config.withName( "drop" );
        embedding_dropout_ = std::make_shared<Dropout<Cpu, FP32>>( exec_context_, drop_config );

        blocks_.reserve( static_cast<size_t>(config_.getNumLayers()) );
        for (dim_t i = 0; i < config_.getNumLayers(); ++i)
        {
            auto block_config = TransformerBlockConfig( C, config_.getNumHeads() );
            block_config.withHiddenDimension( config_.getFfDim() )
                .withMaxSequenceLength( config_.getMaxSeqLen() )
                .withDropout( config_.getDropout() )
                .withAttentionDropout( config_.getAttentionDropout() )
                .withActivation( config_.getActivation() )
                .withLayerNormEpsilon( config_.getLayerNormEpsilon() )
                .withCausalMask( causal_mask_ )
                .withRotaryEmbedding( rotary_ )
                .withName( fmt::format( "blocks.{}", i ) );

            blocks_.push_back( std::make_shared<TransformerBlock<Cpu, FP32>>( exec_context_, block_config ) );
        }

        auto ln_f_config = LayerNormConfig( C );
        ln_f_config.withEpsilon( config_.getLayerNormEpsilon() ).withName( "ln_f" );
        ln_f_ = std::make_shared<LayerNorm<Cpu, FP32>>( exec_context_, ln_f_config );

        auto head_config = LinearConfig( C, config_.getVocabSize() );
        head_config.withBias( false ).withName( "lm_head" );
        lm_head_ = std::make_shared<Linear<Cpu, FP32>>( exec_context_, head_config, encoder_->getTokenEmbedding() );

        auto loss_config = CrossEntropyConfig( config_.getVocabSize() );
        loss_config.withIgnoreIndex( kIgnoreIndex ).withName( "loss" );
        loss_ = std::make_shared<SoftmaxCrossEntropy<Cpu, FP32>>( exec_context_, loss_config );
    }

    void GptModel::initializeWeights( std::optional<unsigned int> seed )
    {
        std::mt19937 gen = seed
            ? std::mt19937( *seed )
            : Utils::RandomGenerator::getInstance().getGenerator();

        const float init_std = config_.getInitStd();

        for (const auto& [name, param] : getNamedParameters())
        {
            auto* tensor = static_cast<TensorType*>(param);

            if (tensor->rank() == 2)
            {
                normal( *tensor, 0.0f, init_std, gen );
            }
            else if (name.ends_with( "bias" ))
            {
                zeros( *tensor );
            }
            else
            {
                ones( *tensor );
            }
        }
    }

    void GptModel::onBuilding( const shape_t& input_shape )
    {
        if (input_shape.size() != 2)
        {
            throw std::invalid_argument( "GptModel: input must have shape (B, T)" );
        }

        shape_t hidden_shape{ input_shape[ 0 ], input_shape[ 1 ], config_.getEmbedDim() };
        shape_t logits_shape{ input_shape[ 0 ], input_shape[ 1 ], config_.getVocabSize() };

        encoder_->build( input_shape );
        embedding_dropout_->build( hidden_shape );
        for (auto& block : blocks_)
        {
            block->build( hidden_shape );
        }
        ln_f_->build( hidden_shape );
        lm_head_->build( hidden_shape );
        loss_->build( logits_shape );
    }

    void GptModel::onTrainingChanging( bool is_training )
    {
        encoder_->setTraining( is_training );
        embedding_dropout_->setTraining( is_training );
        for (auto& block : blocks_)
        {
            block->setTraining( is_training );
        }
        ln_f_->setTraining( is_training );
        lm_head_->setTraining( is_training );
        loss_->setTraining( is_training );
    }

    ModelOutput GptModel::forward( const TokenTensor& input_ids, const TokenTensor* labels, bool return_attention ) const
    {
        ensureBuilt( "GptModel::forward" );

        const auto& shape = input_ids.shape();
        if (shape.size() != 2)
        {
            throw std::invalid_argument( "GptModel::forward - input_ids must have shape (B, T)" );
        }

        const int64_t B = shape[ 0 ];
        const int64_t T = shape[ 1 ];
        const int64_t C = config_.getEmbedDim();
        const int64_t V = config_.getVocabSize();

        if (T > config_.getMaxSeqLen())
        {
            throw SequenceTooLongError( T, config_.getMaxSeqLen() );
        }

        if (B <= 0 || T <= 0)
        {
            throw std::invalid_argument( "GptModel::forward - input_ids must not be empty" );
        }

        if (labels && labels->shape() != shape)
        {
            throw std::invalid_argument( "GptModel::forward - labels must have the same shape as input_ids" );
        }

        auto device = exec_context_->getDevice();

        ModelOutput result{ TensorType( device, shape_t{ B, T, V } ), std::nullopt, {} };

        TensorType x( device, shape_t{ B, T, C } );
        TensorType y( device, shape_t{ B, T, C } );

        encoder_->forward( input_ids, x );
        embedding_dropout_->forward( x, x );

        if (return_attention)
        {
            result.attention.reserve( blocks_.size() );
        }

        for (const auto& block : blocks_)
        {
            ITensor* attention = nullptr;
            if (return_attention)
            {
                result.attention.emplace_back( device, shape_t{ B, config_.getNumHeads(), T, T } );
                attention = &result.attention.back();
            }

            block->forward( x, y, attention );
            std::swap( x, y );
        }

        ln_f_->forward( x, y );
        lm_head_->forward( y, result.logits );

        if (labels)
        {
            TokenTensor targets = shiftLabels( *labels, B, T );
            result.loss = loss_->forward( result.logits, targets );
        }

        return result;
    }

    GptModel::TokenTensor GptModel::shiftLabels( const TokenTensor& labels, int64_t B, int64_t T ) const
    {
        TokenTensor targets( exec_context_->getDevice(), shape_t{ B, T } );
        targets.fill( kIgnoreIndex );

        const int32_t* src = labels.data();
        int32_t* dst = targets.data();

        for (int64_t b = 0; b < B; ++b)
        {
            std::copy( src + b * T + 1, src + (b + 1) * T, dst + b * T );
        }

        return targets;
    }

    std::vector<GptModel::NamedParameter> GptModel::getNamedParameters() const
    {
        auto params = encoder_->getNamedParameters();

        for (const auto& block : blocks_)
        {
            auto block_params = prefixed( block->getName(), block->getNamedParameters() );
            params.insert( params.end(), block_params.begin(), block_params.end() );
        }

        auto ln_f_params = prefixed( "ln_f", ln_f_->getNamedParameters() );
        params.insert( params.end(), ln_f_params.begin(), ln_f_params.end() );

        return params;
    }

    size_t GptModel::parameterCount( bool non_embedding ) const
    {
        size_t count = ComponentBase::parameterCount();
        if (non_embedding && encoder_->getPositionEmbedding())
        {
            count -= encoder_->getPositionEmbedding()->size();
        }
        return count;
    }

    std::shared_ptr<ComputeDevice> GptModel::getDevice() const
    {
        return exec_context_->getDevice();
    }

    std::string GptModel::toString() const
    {
        std::ostringstream oss;
        oss << "====================" << std::endl;
        oss << "GptModel: " << getName() << std::endl;
        oss << config_.toString() << std::endl;
        oss << "Head dimension: " << config_.getHeadDim() << std::endl;
        oss << "Weight tying: " << (getOutputWeight() == getTokenEmbedding() ? "Yes" : "No") << std::endl;
        oss << "Device: " << deviceTypeToString( getDeviceType() ) << std::endl;
        oss << "Parameter count: " << parameterCount( false ) << std::endl;
        oss << "Sub-Components..." << std::endl;
        oss << encoder_->toString();
        for (const auto& block : blocks_)
        {
            oss << block->toString();
        }
        oss << ln_f_->toString();
        oss << lm_head_->toString();
        return oss.str();
    }
}
