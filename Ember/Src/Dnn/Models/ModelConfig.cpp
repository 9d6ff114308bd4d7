#include "ModelConfig.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <sstream>

#include <fmt/format.h>
#include <fmt/ranges.h>

namespace Ember::Dnn
{
    namespace
    {
        std::string toLower( const std::string& value )
        {
            std::string lowered( value );
            std::transform( lowered.begin(), lowered.end(), lowered.begin(),
                []( unsigned char c ) { return static_cast<char>( std::tolower( c ) ); } );
            return lowered;
        }

        bool isRate( float value )
        {
            return value >= 0.0f && value < 1.0f;
        }
    }

    ModelConfig::ModelConfig( dim_t vocab_size, dim_t max_seq_len, dim_t embed_dim, dim_t num_layers, dim_t num_heads )
        : vocab_size_( vocab_size ), max_seq_len_( max_seq_len ), embed_dim_( embed_dim ),
        num_layers_( num_layers ), num_heads_( num_heads ), ff_dim_( 4 * embed_dim )
    {
        validate();
    }

    ModelConfig ModelConfig::withFfDim( dim_t ff_dim ) const
    {
        ModelConfig copy( *this );
        copy.ff_dim_ = ff_dim;
        copy.validate();
        return copy;
    }

    ModelConfig ModelConfig::withDropout( float dropout ) const
    {
        ModelConfig copy( *this );
        copy.dropout_ = dropout;
        copy.validate();
        return copy;
    }

    ModelConfig ModelConfig::withAttentionDropout( float attention_dropout ) const
    {
        ModelConfig copy( *this );
        copy.attention_dropout_ = attention_dropout;
        copy.validate();
        return copy;
    }

    ModelConfig ModelConfig::withActivation( ActivationType activation ) const
    {
        ModelConfig copy( *this );
        copy.activation_ = activation;
        copy.validate();
        return copy;
    }

    ModelConfig ModelConfig::withActivation( const std::string& activation ) const
    {
        return withActivation( stringToActivationType( activation ) );
    }

    ModelConfig ModelConfig::withLayerNormEpsilon( float layer_norm_eps ) const
    {
        ModelConfig copy( *this );
        copy.layer_norm_eps_ = layer_norm_eps;
        copy.validate();
        return copy;
    }

    ModelConfig ModelConfig::withInitStd( float init_std ) const
    {
        ModelConfig copy( *this );
        copy.init_std_ = init_std;
        copy.validate();
        return copy;
    }

    ModelConfig ModelConfig::withPositionEncoding( PositionEncoding encoding ) const
    {
        ModelConfig copy( *this );
        copy.position_encoding_ = encoding;
        copy.validate();
        return copy;
    }

    ModelConfig ModelConfig::withPositionEncoding( const std::string& encoding ) const
    {
        return withPositionEncoding( stringToPositionEncoding( encoding ) );
    }

    void ModelConfig::validate() const
    {
        if (vocab_size_ <= 0 || max_seq_len_ <= 0 || embed_dim_ <= 0 || num_layers_ <= 0 || num_heads_ <= 0)
        {
            throw ConfigError( fmt::format(
                "ModelConfig: sizes must be positive (vocab_size={}, max_seq_len={}, embed_dim={}, num_layers={}, num_heads={})",
                vocab_size_, max_seq_len_, embed_dim_, num_layers_, num_heads_ ) );
        }

        if (embed_dim_ % num_heads_ != 0)
        {
            throw ConfigError( fmt::format(
                "ModelConfig: embed_dim ({}) must be divisible by num_heads ({})", embed_dim_, num_heads_ ) );
        }

        if (ff_dim_ <= 0)
        {
            throw ConfigError( fmt::format( "ModelConfig: ff_dim must be positive, got {}", ff_dim_ ) );
        }

        if (!isRate( dropout_ ))
        {
            throw ConfigError( fmt::format( "ModelConfig: dropout must be in [0, 1), got {}", dropout_ ) );
        }

        if (!isRate( attention_dropout_ ))
        {
            throw ConfigError( fmt::format( "ModelConfig: attention_dropout must be in [0, 1), got {}", attention_dropout_ ) );
        }

        if (!(layer_norm_eps_ > 0.0f) || !std::isfinite( layer_norm_eps_ ))
        {
            throw ConfigError( fmt::format( "ModelConfig: layer_norm_eps must be positive, got {}", layer_norm_eps_ ) );
        }

        if (!(init_std_ >= 0.0f) || !std::isfinite( init_std_ ))
        {
            throw ConfigError( fmt::format( "ModelConfig: init_std must be non-negative, got {}", init_std_ ) );
        }

        if (position_encoding_ == PositionEncoding::Rotary && getHeadDim() % 2 != 0)
        {
            throw ConfigError( fmt::format(
                "ModelConfig: rotary position encoding needs an even head dimension, got {}", getHeadDim() ) );
        }
    }

    size_t ModelConfig::numParameters( bool non_embedding ) const
    {
        const auto V = static_cast<size_t>(vocab_size_);
        const auto S = static_cast<size_t>(max_seq_len_);
        const auto C = static_cast<size_t>(embed_dim_);
        const auto L = static_cast<size_t>(num_layers_);
        const auto F = static_cast<size_t>(ff_dim_);

        // qkv (3C^2 + 3C), out_proj (C^2 + C), fc (CF + F), proj (FC + C), ln_1 and ln_2 (4C)
        const size_t per_layer = 4 * C * C + 2 * C * F + 9 * C + F;

        size_t total = V * C + L * per_layer + 2 * C;
        if (!non_embedding && position_encoding_ == PositionEncoding::Learned)
        {
            total += S * C;
        }
        return total;
    }

    json ModelConfig::toJson() const
    {
        json j;
        j[ "vocab_size" ] = vocab_size_;
        j[ "max_seq_len" ] = max_seq_len_;
        j[ "embed_dim" ] = embed_dim_;
        j[ "num_layers" ] = num_layers_;
        j[ "num_heads" ] = num_heads_;
        j[ "ff_dim" ] = ff_dim_;
        j[ "dropout" ] = dropout_;
        j[ "attention_dropout" ] = attention_dropout_;
        j[ "activation" ] = activationTypeToString( activation_ );
        j[ "layer_norm_eps" ] = layer_norm_eps_;
        j[ "init_std" ] = init_std_;
        j[ "position_encoding" ] = positionEncodingToString( position_encoding_ );
        return j;
    }

    ModelConfig ModelConfig::fromJson( const json& j )
    {
        try
        {
            ModelConfig config(
                j.at( "vocab_size" ).get<dim_t>(),
                j.at( "max_seq_len" ).get<dim_t>(),
                j.at( "embed_dim" ).get<dim_t>(),
                j.at( "num_layers" ).get<dim_t>(),
                j.at( "num_heads" ).get<dim_t>() );

            if (j.contains( "ff_dim" ) && !j.at( "ff_dim" ).is_null())
            {
                config.ff_dim_ = j.at( "ff_dim" ).get<dim_t>();
            }

            config.dropout_ = j.value( "dropout", config.dropout_ );
            config.attention_dropout_ = j.value( "attention_dropout", config.attention_dropout_ );
            config.layer_norm_eps_ = j.value( "layer_norm_eps", config.layer_norm_eps_ );
            config.init_std_ = j.value( "init_std", config.init_std_ );

            if (j.contains( "activation" ))
            {
                config.activation_ = stringToActivationType( j.at( "activation" ).get<std::string>() );
            }

            if (j.contains( "position_encoding" ))
            {
                config.position_encoding_ = stringToPositionEncoding( j.at( "position_encoding" ).get<std::string>() );
            }

            config.validate();
            return config;
        }
        catch (const json::exception& e)
        {
            throw ConfigError( fmt::format( "ModelConfig::fromJson: {}", e.what() ) );
        }
    }

    std::string ModelConfig::toString() const
    {
        std::ostringstream oss;
        oss << "ModelConfig(vocab_size=" << vocab_size_
            << ", max_seq_len=" << max_seq_len_
            << ", embed_dim=" << embed_dim_
            << ", num_layers=" << num_layers_
            << ", num_heads=" << num_heads_
            << ", ff_dim=" << ff_dim_
            << ", dropout=" << dropout_
            << ", attention_dropout=" << attention_dropout_
            << ", activation=" << activationTypeToString( activation_ )
            << ", layer_norm_eps=" << layer_norm_eps_
            << ", init_std=" << init_std_
            << ", position_encoding=" << positionEncodingToString( position_encoding_ ) << ")";
        return oss.str();
    }

    ModelConfig getConfig( const std::string& name )
    {
        const std::string key = toLower( name );

        if (key == "small")
            return ModelConfig( 50257, 512, 384, 6, 6 ).withDropout( 0.1f );
        if (key == "medium")
            return ModelConfig( 50257, 1024, 768, 12, 12 ).withDropout( 0.1f );
        if (key == "large")
            return ModelConfig( 50257, 2048, 1536, 24, 16 ).withDropout( 0.1f );
        if (key == "xl")
            return ModelConfig( 50257, 2048, 2048, 32, 32 ).withDropout( 0.1f );

        throw ConfigError( fmt::format( "Unknown config: {}. Available: {}", name, fmt::join( availableConfigs(), ", " ) ) );
    }

    std::vector<std::string> availableConfigs()
    {
        return { "small", "medium", "large", "xl" };
    }
}
