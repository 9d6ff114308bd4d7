#include "Sampling.h"

#include <algorithm>
#include <cmath>
#include <functional>
#include <limits>
#include <numeric>
#include <stdexcept>
#include <string>

#include <fmt/format.h>

#include "../../Utils/Logger.h"
#include "../Common/Errors.h"

namespace Ember::Dnn
{
    namespace
    {
        constexpr float kNegInf = -std::numeric_limits<float>::infinity();

        [[noreturn]] void numericalFailure( const std::string& message )
        {
            Utils::Logger::error( message );
            throw NumericalError( message );
        }
    }

    void applyTemperature( std::span<float> logits, float temperature )
    {
        if (!(temperature > 0.0f) || !std::isfinite( temperature ))
        {
            throw std::invalid_argument( fmt::format( "applyTemperature: temperature must be positive, got {}", temperature ) );
        }

        for (float& logit : logits)
        {
            logit /= temperature;
        }
    }

    void applyTopK( std::span<float> logits, int64_t k )
    {
        if (k < 1)
        {
            throw std::invalid_argument( fmt::format( "applyTopK: k must be at least 1, got {}", k ) );
        }

        const auto V = static_cast<int64_t>(logits.size());
        if (k >= V)
        {
            return;
        }

        std::vector<float> sorted( logits.begin(), logits.end() );
        std::nth_element( sorted.begin(), sorted.begin() + (k - 1), sorted.end(), std::greater<float>() );
        const float threshold = sorted[ static_cast<size_t>(k - 1) ];

        for (float& logit : logits)
        {
            if (logit < threshold)
                logit = kNegInf;
        }
    }

    void applyTopP( std::span<float> logits, float p )
    {
        if (!(p > 0.0f && p <= 1.0f))
        {
            throw std::invalid_argument( fmt::format( "applyTopP: p must be in (0, 1], got {}", p ) );
        }

        if (logits.empty())
        {
            return;
        }

        std::vector<size_t> order( logits.size() );
        std::iota( order.begin(), order.end(), size_t{ 0 } );
        std::stable_sort( order.begin(), order.end(),
            [&logits]( size_t a, size_t b ) { return logits[ a ] > logits[ b ]; } );

        const float max_logit = logits[ order.front() ];
        if (!std::isfinite( max_logit ))
        {
            numericalFailure( "applyTopP: row has no finite maximum logit" );
        }

        std::vector<double> probs( order.size() );
        double sum = 0.0;
        for (size_t i = 0; i < order.size(); ++i)
        {
            probs[ i ] = std::exp( static_cast<double>(logits[ order[ i ] ]) - static_cast<double>(max_logit) );
            sum += probs[ i ];
        }

        // The first sorted token is never removed; token i is removed when the mass before it exceeds p.
        double cumulative = probs[ 0 ] / sum;
        for (size_t i = 1; i < order.size(); ++i)
        {
            const bool remove = cumulative > static_cast<double>(p);
            cumulative += probs[ i ] / sum;

            if (remove)
                logits[ order[ i ] ] = kNegInf;
        }
    }

    std::vector<float> softmax( std::span<const float> logits )
    {
        float max_logit = kNegInf;
        for (float logit : logits)
        {
            if (std::isnan( logit ) || logit == std::numeric_limits<float>::infinity())
            {
                numericalFailure( "softmax: logits contain NaN or +inf" );
            }
            max_logit = std::max( max_logit, logit );
        }

        if (max_logit == kNegInf)
        {
            numericalFailure( "softmax: every logit was filtered, the distribution has zero mass" );
        }

        std::vector<float> probs( logits.size() );
        double sum = 0.0;
        for (size_t i = 0; i < logits.size(); ++i)
        {
            const double e = std::exp( static_cast<double>(logits[ i ]) - static_cast<double>(max_logit) );
            probs[ i ] = static_cast<float>(e);
            sum += e;
        }

        const double inv = 1.0 / sum;
        for (float& prob : probs)
        {
            prob = static_cast<float>(prob * inv);
        }

        return probs;
    }

    int32_t argmax( std::span<const float> values )
    {
        if (values.empty())
        {
            throw std::invalid_argument( "argmax: empty row" );
        }

        size_t best = 0;
        for (size_t i = 1; i < values.size(); ++i)
        {
            if (values[ i ] > values[ best ])
                best = i;
        }
        return static_cast<int32_t>(best);
    }

    int32_t sample( std::span<const float> probabilities, std::mt19937& generator )
    {
        double total = 0.0;
        for (float prob : probabilities)
        {
            if (!std::isfinite( prob ) || prob < 0.0f)
            {
                numericalFailure( "sample: probabilities must be finite and non-negative" );
            }
            total += prob;
        }

        if (!(total > 0.0))
        {
            numericalFailure( "sample: probability distribution has zero total mass" );
        }

        std::uniform_real_distribution<double> uniform( 0.0, total );
        const double u = uniform( generator );

        double cumulative = 0.0;
        size_t last_nonzero = 0;
        for (size_t i = 0; i < probabilities.size(); ++i)
        {
            if (probabilities[ i ] <= 0.0f)
                continue;

            cumulative += probabilities[ i ];
            last_nonzero = i;
            if (u < cumulative)
                return static_cast<int32_t>(i);
        }

        // Rounding left u at the top of the range.
        return static_cast<int32_t>(last_nonzero);
    }
}
