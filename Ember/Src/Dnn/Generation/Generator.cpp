#include "Generator.h"

#include <algorithm>
#include <stdexcept>
#include <utility>

#include <fmt/format.h>

#include "../../Utils/Logger.h"
#include "../../Utils/RandomGenerator.h"
#include "Sampling.h"

namespace Ember::Dnn
{
    Generator::Generator( std::shared_ptr<const GptModel> model, const GenerationConfig& config )
        : model_( std::move( model ) ), config_( config )
    {
        if (!model_)
        {
            throw std::invalid_argument( "Generator: model cannot be null." );
        }

        config_.validate();
    }

    GenerationState Generator::begin( const std::vector<std::vector<int32_t>>& prompt ) const
    {
        if (prompt.empty() || prompt.front().empty())
        {
            throw std::invalid_argument( "Generator::begin - prompt must have at least one row and one token" );
        }

        const size_t T0 = prompt.front().size();
        const int64_t V = model_->getConfig().getVocabSize();

        for (const auto& row : prompt)
        {
            if (row.size() != T0)
            {
                throw std::invalid_argument( "Generator::begin - prompt rows must have equal length" );
            }

            for (int32_t id : row)
            {
                if (id < 0 || id >= V)
                {
                    throw std::out_of_range( fmt::format(
                        "Generator::begin - token id {} outside vocabulary [0, {})", id, V ) );
                }
            }
        }

        GenerationState state;
        state.sequences = prompt;
        state.finished.assign( prompt.size(), false );
        state.prompt_length = static_cast<int64_t>(T0);
        state.max_new_tokens = config_.getMaxNewTokens();
        state.generator = config_.getSeed()
            ? std::mt19937( *config_.getSeed() )
            : std::mt19937( Utils::RandomGenerator::getInstance().nextSeed() );

        for (auto& row : state.sequences)
        {
            row.reserve( T0 + static_cast<size_t>(state.max_new_tokens) );
        }

        Utils::Logger::debug_fmt( "Generation started: batch {}, prompt length {}, {}",
            prompt.size(), T0, config_.toString() );

        return state;
    }

    GenerationState Generator::begin( const TokenTensor& prompt ) const
    {
        if (prompt.rank() != 2)
        {
            throw std::invalid_argument( "Generator::begin - prompt must have shape (B, T0)" );
        }

        const int64_t B = prompt.shape()[ 0 ];
        const int64_t T0 = prompt.shape()[ 1 ];
        const int32_t* data = prompt.data();

        std::vector<std::vector<int32_t>> rows;
        rows.reserve( static_cast<size_t>(B) );
        for (int64_t b = 0; b < B; ++b)
        {
            rows.emplace_back( data + b * T0, data + (b + 1) * T0 );
        }

        return begin( rows );
    }

    StepResult Generator::step( GenerationState& state ) const
    {
        if (state.isFinished())
        {
            throw std::runtime_error( "Generator::step - generation is already finished" );
        }

        TokenTensor context = contextOf( state );
        ModelOutput output = model_->forward( context );

        const int64_t B = context.shape()[ 0 ];
        const int64_t T = context.shape()[ 1 ];
        const int64_t V = model_->getConfig().getVocabSize();
        const float* logits = output.logits.data();
        const auto& eos = config_.getEosTokenId();

        StepResult result;
        result.tokens.reserve( static_cast<size_t>(B) );

        for (int64_t b = 0; b < B; ++b)
        {
            int32_t token;

            if (state.finished[ b ])
            {
                token = *eos;
            }
            else
            {
                const float* last = logits + (b * T + (T - 1)) * V;
                std::vector<float> row( last, last + V );

                token = selectToken( row, state.generator );

                if (eos && token == *eos)
                {
                    state.finished[ b ] = true;
                }
            }

            state.sequences[ b ].push_back( token );
            result.tokens.push_back( token );
        }

        ++state.steps;
        result.finished = state.isFinished();

        if (result.finished)
        {
            if (state.steps < state.max_new_tokens)
            {
                Utils::Logger::debug_fmt( "Generation stopped early after {} of {} steps: every row emitted EOS",
                    state.steps, state.max_new_tokens );
            }
            else
            {
                Utils::Logger::debug_fmt( "Generation finished after {} steps", state.steps );
            }
        }

        return result;
    }

    std::vector<std::vector<int32_t>> Generator::generate( const std::vector<std::vector<int32_t>>& prompt ) const
    {
        GenerationState state = begin( prompt );

        while (!state.isFinished())
        {
            step( state );
        }

        return std::move( state.sequences );
    }

    Generator::TokenTensor Generator::generate( const TokenTensor& prompt ) const
    {
        GenerationState state = begin( prompt );

        while (!state.isFinished())
        {
            step( state );
        }

        const auto B = static_cast<int64_t>(state.sequences.size());
        const auto T = static_cast<int64_t>(state.sequences.front().size());

        TokenTensor result( model_->getDevice(), shape_t{ B, T } );
        for (int64_t b = 0; b < B; ++b)
        {
            std::copy( state.sequences[ b ].begin(), state.sequences[ b ].end(), result.data() + b * T );
        }

        return result;
    }

    Generator::TokenTensor Generator::contextOf( const GenerationState& state ) const
    {
        const auto B = static_cast<int64_t>(state.sequences.size());
        const auto length = static_cast<int64_t>(state.sequences.front().size());
        const int64_t T = std::min( length, model_->getConfig().getMaxSeqLen() );

        TokenTensor context( model_->getDevice(), shape_t{ B, T } );
        for (int64_t b = 0; b < B; ++b)
        {
            const auto& row = state.sequences[ b ];
            std::copy( row.end() - T, row.end(), context.data() + b * T );
        }

        return context;
    }

    int32_t Generator::selectToken( std::vector<float>& logits, std::mt19937& generator ) const
    {
        // Temperature, top-k and top-p never change the arg-max
        if (config_.isGreedy())
        {
            return argmax( logits );
        }

        const float temperature = config_.getTemperature();

        if (temperature > 0.0f)
        {
            applyTemperature( logits, temperature );
        }

        if (config_.getTopK())
        {
            applyTopK( logits, *config_.getTopK() );
        }

        if (config_.getTopP())
        {
            applyTopP( logits, *config_.getTopP() );
        }

        return sample( softmax( logits ), generator );
    }
}
