/**
 * @file GenerationConfig.h
 * @brief Decoding parameters for the Generator.
 */

#ifndef EMBER_DNN_GENERATION_CONFIG_H_
#define EMBER_DNN_GENERATION_CONFIG_H_

#include <cmath>
#include <cstdint>
#include <ios>
#include <optional>
#include <sstream>
#include <string>

#include <fmt/format.h>

#include "../Common/Errors.h"

namespace Ember::Dnn
{
    /**
     * @brief Runtime configuration of one generation request.
     *
     * Fluent setters do not validate; Generator calls validate() before use.
     *
     * A temperature of 0 selects greedy decoding regardless of do_sample.
     * With an end-of-sequence id set, a row that emits it is finished and
     * padded with that id until every row is finished.
     */
    class GenerationConfig
    {
    public:
        GenerationConfig() = default;

        auto& withMaxNewTokens( int64_t max_new_tokens )
        {
            max_new_tokens_ = max_new_tokens;
            return *this;
        }

        auto& withTemperature( float temperature )
        {
            temperature_ = temperature;
            return *this;
        }

        auto& withTopK( int64_t top_k )
        {
            top_k_ = top_k;
            return *this;
        }

        auto& withTopP( float top_p )
        {
            top_p_ = top_p;
            return *this;
        }

        auto& withSampling( bool do_sample )
        {
            do_sample_ = do_sample;
            return *this;
        }

        auto& withEosTokenId( int32_t eos_token_id )
        {
            eos_token_id_ = eos_token_id;
            return *this;
        }

        /**
         * @brief Seed of the request's own random engine.
         *
         * Without a seed each request draws a fresh one from the global RandomGenerator.
         */
        auto& withSeed( unsigned int seed )
        {
            seed_ = seed;
            return *this;
        }

        int64_t getMaxNewTokens() const { return max_new_tokens_; }
        float getTemperature() const { return temperature_; }
        const std::optional<int64_t>& getTopK() const { return top_k_; }
        const std::optional<float>& getTopP() const { return top_p_; }
        bool doSample() const { return do_sample_; }
        const std::optional<int32_t>& getEosTokenId() const { return eos_token_id_; }
        const std::optional<unsigned int>& getSeed() const { return seed_; }

        bool isGreedy() const
        {
            return !do_sample_ || temperature_ == 0.0f;
        }

        /**
         * @throws ConfigError If a field is out of range
         */
        void validate() const
        {
            if (max_new_tokens_ < 0)
            {
                throw ConfigError( fmt::format( "GenerationConfig: max_new_tokens must be non-negative, got {}", max_new_tokens_ ) );
            }

            if (!(temperature_ >= 0.0f) || !std::isfinite( temperature_ ))
            {
                throw ConfigError( fmt::format( "GenerationConfig: temperature must be finite and non-negative, got {}", temperature_ ) );
            }

            if (top_k_ && *top_k_ < 1)
            {
                throw ConfigError( fmt::format( "GenerationConfig: top_k must be at least 1, got {}", *top_k_ ) );
            }

            if (top_p_ && !(*top_p_ > 0.0f && *top_p_ <= 1.0f))
            {
                throw ConfigError( fmt::format( "GenerationConfig: top_p must be in (0, 1], got {}", *top_p_ ) );
            }
        }

        std::string toString() const
        {
            std::ostringstream oss;
            oss << "GenerationConfig(max_new_tokens=" << max_new_tokens_
                << ", temperature=" << temperature_
                << ", top_k=" << (top_k_ ? std::to_string( *top_k_ ) : "none")
                << ", top_p=" << (top_p_ ? std::to_string( *top_p_ ) : "none")
                << ", do_sample=" << std::boolalpha << do_sample_
                << ", eos_token_id=" << (eos_token_id_ ? std::to_string( *eos_token_id_ ) : "none") << ")";
            return oss.str();
        }

    private:
        int64_t max_new_tokens_{ 100 };
        float temperature_{ 1.0f };
        std::optional<int64_t> top_k_;
        std::optional<float> top_p_;
        bool do_sample_{ true };
        std::optional<int32_t> eos_token_id_;
        std::optional<unsigned int> seed_;
    };
}

#endif
